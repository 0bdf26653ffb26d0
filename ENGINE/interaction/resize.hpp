#pragma once

#include <SDL.h>

#include "blocks/block_id.hpp"

namespace mablocks {

class BlockManager;

enum class ResizeHandle {
    TopLeft,
    TopRight,
    BottomLeft,
    BottomRight,
};

// Captured when the secondary button goes down on a block. Pointer positions
// are in screen pixels; the rect is in world coordinates.
struct ResizeState {
    BlockId      id;
    ResizeHandle handle = ResizeHandle::BottomRight;
    SDL_FPoint   initial_pointer{0.0f, 0.0f};
    SDL_FRect    initial_rect{0.0f, 0.0f, 0.0f, 0.0f};
};

// Quadrant of the rect the point falls in, relative to the rect center.
ResizeHandle handle_for_point(const SDL_FRect& rect, SDL_FPoint world_point);

ResizeState begin_resize(const BlockManager& manager, BlockId id, SDL_FPoint screen_pointer, SDL_FPoint world_pointer);

// Resizes the gesture's block around the center it had when the gesture
// started. The dominant pointer axis picks the width; the result never drops
// below kMinBlockSize. When the block is chained, every other chained block
// is resized in place to the same image height. Returns false if the block
// no longer exists.
bool apply_resize(BlockManager& manager, const ResizeState& state, SDL_FPoint screen_pointer, float zoom);

}
