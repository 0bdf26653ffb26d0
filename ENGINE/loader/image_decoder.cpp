#include "loader/image_decoder.hpp"

#include <SDL_image.h>

#include <algorithm>
#include <chrono>
#include <memory>

#include "core/constants.hpp"
#include "utils/surface_ptr.hpp"

namespace mablocks {

namespace {

struct AnimationDeleter {
    void operator()(IMG_Animation* anim) const { if (anim) IMG_FreeAnimation(anim); }
};
using AnimationPtr = std::unique_ptr<IMG_Animation, AnimationDeleter>;

std::chrono::milliseconds sanitize_delay(int delay_ms) {
    if (delay_ms <= 0) {
        return std::chrono::milliseconds(kMinFrameDurationMs);
    }
    return std::chrono::milliseconds(delay_ms);
}

SurfacePtr to_display_surface(SDL_Surface* source, std::string& error) {
    SurfacePtr converted = make_surface_ptr(SDL_ConvertSurfaceFormat(source, SDL_PIXELFORMAT_RGBA32, 0));
    if (!converted) {
        error = std::string("failed to convert frame to RGBA32: ") + SDL_GetError();
        return nullptr;
    }

    const int max_dim = static_cast<int>(kMaxBlockDimension);
    const int w = converted->w;
    const int h = converted->h;
    if (w <= max_dim && h <= max_dim) {
        return converted;
    }

    const float scale = static_cast<float>(max_dim) / static_cast<float>(std::max(w, h));
    const int new_w = std::max(1, static_cast<int>(static_cast<float>(w) * scale));
    const int new_h = std::max(1, static_cast<int>(static_cast<float>(h) * scale));

    SurfacePtr scaled = make_surface_ptr(SDL_CreateRGBSurfaceWithFormat(0, new_w, new_h, 32, SDL_PIXELFORMAT_RGBA32));
    if (!scaled) {
        error = std::string("failed to allocate scaled frame: ") + SDL_GetError();
        return nullptr;
    }
    SDL_SetSurfaceBlendMode(converted.get(), SDL_BLENDMODE_NONE);
    if (SDL_BlitScaled(converted.get(), nullptr, scaled.get(), nullptr) != 0) {
        error = std::string("failed to scale frame: ") + SDL_GetError();
        return nullptr;
    }
    return scaled;
}

bool decode_animation(const std::string& path, bool full, DecodeResult& result) {
    AnimationPtr anim(IMG_LoadAnimation(path.c_str()));
    if (!anim || anim->count <= 0) {
        return false;
    }

    result.original_size = SDL_FPoint{static_cast<float>(anim->w), static_cast<float>(anim->h)};
    result.has_animation = anim->count > 1;

    const std::size_t available = static_cast<std::size_t>(anim->count);
    const std::size_t limit = full ? std::min(available, kMaxAnimationFrames) : std::size_t{1};
    result.frames.reserve(limit);
    for (std::size_t i = 0; i < limit; ++i) {
        SurfacePtr frame = to_display_surface(anim->frames[i], result.error);
        if (!frame) {
            result.frames.clear();
            return true;
        }
        const int delay = anim->delays ? anim->delays[i] : 0;
        result.frames.push_back(AnimationFrame{share_surface(std::move(frame)),
                                               result.has_animation ? sanitize_delay(delay)
                                                                    : std::chrono::milliseconds(kDefaultFrameDurationMs)});
    }
    return true;
}

}

DecodeResult decode_image(const std::string& path, bool full) {
    DecodeResult result;
    result.path = path;
    result.full = full;

    if (decode_animation(path, full, result)) {
        if (result.frames.empty() && result.error.empty()) {
            result.error = "no renderable frames";
        }
        if (!result.error.empty()) {
            result.error = "Failed to decode " + path + ": " + result.error;
        }
        return result;
    }

    SurfacePtr loaded = make_surface_ptr(IMG_Load(path.c_str()));
    if (!loaded) {
        result.error = "Failed to decode " + path + ": " + IMG_GetError();
        return result;
    }
    result.original_size = SDL_FPoint{static_cast<float>(loaded->w), static_cast<float>(loaded->h)};
    result.has_animation = false;

    std::string error;
    SurfacePtr frame = to_display_surface(loaded.get(), error);
    if (!frame) {
        result.error = "Failed to decode " + path + ": " + error;
        return result;
    }
    result.frames.push_back(AnimationFrame{share_surface(std::move(frame)),
                                           std::chrono::milliseconds(kDefaultFrameDurationMs)});
    return result;
}

SDL_FPoint scaled_size(SDL_FPoint original) {
    const float scale = std::min({kMaxBlockDimension / std::max(original.x, 1.0f),
                                  kMaxBlockDimension / std::max(original.y, 1.0f),
                                  1.0f});
    return SDL_FPoint{original.x * scale, original.y * scale};
}

}
