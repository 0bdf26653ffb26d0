#pragma once

#include <string>

#include <SDL.h>

#include "blocks/animation_frame.hpp"

namespace mablocks {

// Outcome of one decode request. Exactly one of `frames` / `error` is
// meaningful: a failed decode carries an error message and no frames.
struct DecodeResult {
    std::string path;
    bool        full = false;
    FrameList   frames;
    SDL_FPoint  original_size{1.0f, 1.0f};
    bool        has_animation = false;
    std::string error;

    bool ok() const { return error.empty() && !frames.empty(); }
};

// Decodes `path` with SDL_image. Animated sources keep every frame (up to
// kMaxAnimationFrames) when `full` is set and only the first frame otherwise.
// Frames are converted to RGBA32 and scaled down to fit kMaxBlockDimension.
// Safe to call from a worker thread.
DecodeResult decode_image(const std::string& path, bool full);

// Display size for a decoded image: fits inside kMaxBlockDimension, never
// upscales.
SDL_FPoint scaled_size(SDL_FPoint original);

}
