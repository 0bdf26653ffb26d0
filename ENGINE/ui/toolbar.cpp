#include "ui/toolbar.hpp"

#include <algorithm>

#include "core/constants.hpp"
#include "ui/styles.hpp"

namespace mablocks {

namespace {

constexpr int kFallbackButtonWidth = 96;
constexpr int kButtonTextPadding   = 12;

bool point_in(const SDL_Rect& r, SDL_Point p) {
    return p.x >= r.x && p.x < r.x + r.w && p.y >= r.y && p.y < r.y + r.h;
}

}

Toolbar::Toolbar()
    : font_(open_font(Styles::ToolbarLabel())) {
    buttons_ = {
        {ToolbarAction::Save, "Save"},
        {ToolbarAction::Load, "Load"},
        {ToolbarAction::ResetCounters, "Reset Counters"},
        {ToolbarAction::BoxUnbox, "Box / Unbox"},
        {ToolbarAction::ToggleFileNames, "File Names"},
    };
    layout(kInitialWindowWidth);
}

void Toolbar::layout(int width) {
    width_ = width;
    const int y = (kToolbarHeight - kToolbarButtonSize) / 2;
    int x = kToolbarStartSpacing;
    for (auto& button : buttons_) {
        int w = kFallbackButtonWidth;
        if (font_) {
            w = measure_text(font_.get(), button.label).x + kButtonTextPadding * 2;
        }
        button.rect = SDL_Rect{x, y, std::max(w, kToolbarButtonSize), kToolbarButtonSize};
        x += button.rect.w + kToolbarStartSpacing;
    }
}

ToolbarAction Toolbar::handle_pointer(SDL_Point pointer, bool has_pointer, bool clicked) {
    ToolbarAction result = ToolbarAction::None;
    for (auto& button : buttons_) {
        button.hovered = has_pointer && point_in(button.rect, pointer);
        if (button.hovered && clicked) {
            result = button.action;
        }
    }
    return result;
}

bool Toolbar::contains(SDL_Point pointer) const {
    return pointer.y >= 0 && pointer.y < kToolbarHeight && pointer.x >= 0 && pointer.x < width_;
}

void Toolbar::render(SDL_Renderer* renderer) const {
    const SDL_Color& bg = Styles::ToolbarBackground();
    SDL_SetRenderDrawColor(renderer, bg.r, bg.g, bg.b, bg.a);
    const SDL_Rect strip{0, 0, width_, kToolbarHeight};
    SDL_RenderFillRect(renderer, &strip);

    for (const auto& button : buttons_) {
        const bool lit = button.hovered ||
                         (button.action == ToolbarAction::ToggleFileNames && file_names_shown_);
        if (lit) {
            const SDL_Color& hover = Styles::ToolbarButtonHover();
            SDL_SetRenderDrawColor(renderer, hover.r, hover.g, hover.b, hover.a);
            SDL_RenderFillRect(renderer, &button.rect);
        }
        const SDL_Point center{button.rect.x + button.rect.w / 2, button.rect.y + button.rect.h / 2};
        draw_text(renderer, font_.get(), button.label, Styles::ToolbarLabel().color, center, true);
    }
}

}
