#pragma once

#include <chrono>
#include <vector>

#include <SDL.h>

#include "core/constants.hpp"
#include "utils/surface_ptr.hpp"

namespace mablocks {

// One decoded frame. Pixel buffers are shared between blocks that show the
// same source file.
struct AnimationFrame {
    SharedSurface image;
    std::chrono::milliseconds duration{kDefaultFrameDurationMs};

    SDL_FPoint size() const {
        if (!image) return SDL_FPoint{0.0f, 0.0f};
        return SDL_FPoint{static_cast<float>(image->w), static_cast<float>(image->h)};
    }
};

using FrameList = std::vector<AnimationFrame>;

}
