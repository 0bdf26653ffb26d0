#pragma once

#include <string>
#include <vector>

#include <SDL.h>

#include "render/text.hpp"

namespace mablocks {

enum class ToolbarAction {
    None,
    Save,
    Load,
    ResetCounters,
    BoxUnbox,
    ToggleFileNames,
};

// Strip of text buttons along the top of the window.
class Toolbar {
public:
    Toolbar();

    // Recomputes button rects for a window `width` pixels wide. Uses the label
    // font for sizing when it could be opened, a fixed width otherwise.
    void layout(int width);

    // Hover tracking and click dispatch. Returns the action under the pointer
    // when `clicked` is set.
    ToolbarAction handle_pointer(SDL_Point pointer, bool has_pointer, bool clicked);

    bool contains(SDL_Point pointer) const;
    void set_file_names_shown(bool shown) { file_names_shown_ = shown; }

    void render(SDL_Renderer* renderer) const;

    struct Button {
        ToolbarAction action = ToolbarAction::None;
        std::string   label;
        SDL_Rect      rect{0, 0, 0, 0};
        bool          hovered = false;
    };
    const std::vector<Button>& buttons() const { return buttons_; }

private:
    std::vector<Button> buttons_;
    FontPtr             font_;
    int                 width_ = 0;
    bool                file_names_shown_ = false;
};

}
