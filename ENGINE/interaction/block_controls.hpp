#pragma once

#include <SDL.h>

namespace mablocks {

// Hit rects of the three per-block buttons, laid out right to left from the
// block's top-right corner. All rects are in screen pixels.
struct ControlRects {
    SDL_FRect close{};
    SDL_FRect chain{};
    SDL_FRect counter{};
};

struct ControlHover {
    bool close = false;
    bool chain = false;
    bool counter = false;

    bool any() const { return close || chain || counter; }
};

ControlRects control_rects(const SDL_FRect& block_screen_rect, float zoom);

// Groups have no counter button.
ControlHover control_hover(const ControlRects& rects, SDL_FPoint pointer, bool has_pointer, bool is_group);

bool rect_contains(const SDL_FRect& rect, SDL_FPoint point);

}
