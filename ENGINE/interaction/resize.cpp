#include "interaction/resize.hpp"

#include <algorithm>
#include <cmath>

#include "blocks/block_manager.hpp"
#include "core/constants.hpp"

namespace mablocks {

namespace {

SDL_FPoint rect_center(const SDL_FRect& r) {
    return SDL_FPoint{r.x + r.w * 0.5f, r.y + r.h * 0.5f};
}

void place_centered(Block& block, SDL_FPoint center, SDL_FPoint image_size) {
    const float outer_w = image_size.x + kBlockPadding * 2.0f;
    const float outer_h = image_size.y + kBlockPadding * 2.0f;
    block.pos.position = SDL_FPoint{center.x - outer_w * 0.5f, center.y - outer_h * 0.5f};
    block.set_preferred_size(image_size);
}

}

ResizeHandle handle_for_point(const SDL_FRect& rect, SDL_FPoint world_point) {
    const SDL_FPoint center = rect_center(rect);
    const bool left = world_point.x < center.x;
    const bool top = world_point.y < center.y;
    if (top) {
        return left ? ResizeHandle::TopLeft : ResizeHandle::TopRight;
    }
    return left ? ResizeHandle::BottomLeft : ResizeHandle::BottomRight;
}

ResizeState begin_resize(const BlockManager& manager, BlockId id, SDL_FPoint screen_pointer, SDL_FPoint world_pointer) {
    ResizeState state;
    state.id = id;
    state.initial_pointer = screen_pointer;
    if (const Block* block = manager.find(id)) {
        state.initial_rect = block->rect();
        state.handle = handle_for_point(state.initial_rect, world_pointer);
    }
    return state;
}

bool apply_resize(BlockManager& manager, const ResizeState& state, SDL_FPoint screen_pointer, float zoom) {
    Block* block = manager.find(state.id);
    if (!block) {
        return false;
    }

    const float safe_zoom = (zoom > 0.0f && std::isfinite(zoom)) ? zoom : 1.0f;
    const SDL_FPoint delta{(screen_pointer.x - state.initial_pointer.x) / safe_zoom,
                           (screen_pointer.y - state.initial_pointer.y) / safe_zoom};
    const SDL_FPoint center = rect_center(state.initial_rect);

    const float half_width = (state.initial_rect.w - kBlockPadding * 2.0f) * 0.5f;
    const float half_height = (state.initial_rect.h - kBlockPadding * 2.0f) * 0.5f;

    const bool left = state.handle == ResizeHandle::TopLeft || state.handle == ResizeHandle::BottomLeft;
    const bool top = state.handle == ResizeHandle::TopLeft || state.handle == ResizeHandle::TopRight;
    const float x_sign = left ? -1.0f : 1.0f;
    const float y_sign = top ? -1.0f : 1.0f;

    const float width_from_x = std::max(2.0f * std::fabs(half_width * x_sign + delta.x), kMinBlockSize);
    const float height_from_y = 2.0f * std::fabs(half_height * y_sign + delta.y);
    const float width_from_y = std::max(height_from_y * block->aspect_ratio(), kMinBlockSize);

    float new_width = std::fabs(delta.x) >= std::fabs(delta.y) ? width_from_x : width_from_y;
    if (!std::isfinite(new_width)) {
        new_width = kMinBlockSize;
    }
    new_width = std::max(new_width, kMinBlockSize);

    const float new_height = new_width / block->aspect_ratio();
    place_centered(*block, center, SDL_FPoint{new_width, new_height});

    if (!block->chained || manager.chained_count() < 2) {
        return true;
    }
    for (auto& other : manager.blocks()) {
        if (!other->chained || other->id() == state.id) {
            continue;
        }
        const float chained_width = std::max(new_height * other->aspect_ratio(), kMinBlockSize);
        place_centered(*other, other->center(), SDL_FPoint{chained_width, new_height});
    }
    return true;
}

}
