#include "interaction/block_controls.hpp"

#include "core/constants.hpp"

namespace mablocks {

namespace {

SDL_FRect centered(SDL_FPoint center, float size) {
    return SDL_FRect{center.x - size * 0.5f, center.y - size * 0.5f, size, size};
}

}

bool rect_contains(const SDL_FRect& rect, SDL_FPoint point) {
    return point.x >= rect.x && point.x <= rect.x + rect.w && point.y >= rect.y && point.y <= rect.y + rect.h;
}

ControlRects control_rects(const SDL_FRect& block, float zoom) {
    const float spacing = kButtonSpacing * zoom;
    const float hit = kButtonBaseSize * zoom * kButtonHitAreaMultiplier;

    ControlRects rects;
    const SDL_FPoint close_center{block.x + block.w - hit * 0.5f - spacing, block.y + hit * 0.5f + spacing};
    rects.close = centered(close_center, hit);
    const SDL_FPoint chain_center{close_center.x - (hit + spacing), close_center.y};
    rects.chain = centered(chain_center, hit);
    const SDL_FPoint counter_center{chain_center.x - (hit + spacing), chain_center.y};
    rects.counter = centered(counter_center, hit);
    return rects;
}

ControlHover control_hover(const ControlRects& rects, SDL_FPoint pointer, bool has_pointer, bool is_group) {
    ControlHover hover;
    if (!has_pointer) {
        return hover;
    }
    hover.close = rect_contains(rects.close, pointer);
    hover.chain = rect_contains(rects.chain, pointer);
    hover.counter = !is_group && rect_contains(rects.counter, pointer);
    return hover;
}

}
