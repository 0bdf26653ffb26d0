#include "input.hpp"

#include <cmath>
#include <cstdlib>
#include <utility>

namespace mablocks {

namespace {
Input::Button to_button(Uint8 sdl_button) {
    switch (sdl_button) {
    case SDL_BUTTON_LEFT:   return Input::LEFT;
    case SDL_BUTTON_RIGHT:  return Input::RIGHT;
    case SDL_BUTTON_MIDDLE: return Input::MIDDLE;
    default:                return Input::COUNT;
    }
}

bool within_slop(SDL_Point a, int x, int y) {
    return std::abs(a.x - x) <= Input::kClickSlopPx && std::abs(a.y - y) <= Input::kClickSlopPx;
}
}

void Input::handleEvent(const SDL_Event& e) {
    switch (e.type) {
    case SDL_MOUSEMOTION:
        dx_ += e.motion.xrel;
        dy_ += e.motion.yrel;
        x_ = e.motion.x;
        y_ = e.motion.y;
        has_pointer_ = true;
        for (int i = 0; i < COUNT; ++i) {
            if (click_candidate_[i] && !within_slop(press_pos_[i], x_, y_)) {
                click_candidate_[i] = false;
            }
        }
        break;

    case SDL_MOUSEBUTTONDOWN:
    case SDL_MOUSEBUTTONUP: {
        const bool down = (e.type == SDL_MOUSEBUTTONDOWN);
        const Button button = to_button(e.button.button);
        x_ = e.button.x;
        y_ = e.button.y;
        has_pointer_ = true;
        if (button == COUNT) break;
        buttons_[button] = down;
        if (down) {
            pressed_this_step_[button] = true;
            click_candidate_[button] = true;
            press_pos_[button] = SDL_Point{x_, y_};
        } else {
            released_this_step_[button] = true;
            if (click_candidate_[button] && within_slop(press_pos_[button], x_, y_)) {
                clicked_this_step_[button] = true;
            }
            click_candidate_[button] = false;
        }
        break;
    }

    case SDL_MOUSEWHEEL:
        scrollX_ += e.wheel.preciseX;
        scrollY_ += e.wheel.preciseY;
        break;

    case SDL_WINDOWEVENT:
        if (e.window.event == SDL_WINDOWEVENT_LEAVE) {
            has_pointer_ = false;
        }
        break;

    case SDL_KEYDOWN:
    case SDL_KEYUP: {
        const SDL_Scancode sc = e.key.keysym.scancode;
        keys_down_[sc] = (e.type == SDL_KEYDOWN);
        modifiers_ = e.key.keysym.mod;
        dirty_scancodes_.push_back(sc);
        break;
    }

    case SDL_DROPFILE:
        if (e.drop.file) {
            dropped_files_.emplace_back(e.drop.file);
            SDL_free(e.drop.file);
        }
        break;

    default:
        break;
    }
}

void Input::update() {
    for (SDL_Scancode sc : pressed_scancode_buffer_) {
        keys_pressed_[sc] = false;
    }
    pressed_scancode_buffer_.clear();
    for (SDL_Scancode sc : dirty_scancodes_) {
        const bool is_down = keys_down_[sc];
        if (!prev_keys_down_[sc] && is_down) {
            keys_pressed_[sc] = true;
            pressed_scancode_buffer_.push_back(sc);
        }
        prev_keys_down_[sc] = is_down;
    }
    dirty_scancodes_.clear();

    const bool ctrl = keys_down_[SDL_SCANCODE_LCTRL] || keys_down_[SDL_SCANCODE_RCTRL] ||
                      keys_down_[SDL_SCANCODE_LGUI] || keys_down_[SDL_SCANCODE_RGUI] ||
                      (modifiers_ & (KMOD_CTRL | KMOD_GUI)) != 0;
    const bool shift = keys_down_[SDL_SCANCODE_LSHIFT] || keys_down_[SDL_SCANCODE_RSHIFT] ||
                       (modifiers_ & KMOD_SHIFT) != 0;

    InputSnapshot snap;
    snap.pointer = SDL_FPoint{static_cast<float>(x_), static_cast<float>(y_)};
    snap.has_pointer = has_pointer_;
    snap.pointer_delta = SDL_FPoint{static_cast<float>(dx_), static_cast<float>(dy_)};
    snap.primary_down = buttons_[LEFT];
    snap.primary_pressed = pressed_this_step_[LEFT];
    snap.primary_released = released_this_step_[LEFT];
    snap.primary_clicked = clicked_this_step_[LEFT];
    snap.secondary_pressed = pressed_this_step_[RIGHT];
    snap.secondary_released = released_this_step_[RIGHT];
    snap.secondary_clicked = clicked_this_step_[RIGHT];
    snap.middle_down = buttons_[MIDDLE];
    snap.ctrl = ctrl;
    snap.shift = shift;
    if (ctrl && scrollY_ != 0.0f) {
        snap.zoom_delta = std::pow(kZoomStep, scrollY_);
    } else {
        snap.scroll_x = scrollX_;
        snap.scroll_y = scrollY_;
    }
    snap.toggle_file_names = ctrl && keys_pressed_[SDL_SCANCODE_N];
    snap.dropped_files = std::move(dropped_files_);
    snapshot_ = std::move(snap);

    for (int i = 0; i < COUNT; ++i) {
        pressed_this_step_[i] = false;
        released_this_step_[i] = false;
        clicked_this_step_[i] = false;
    }
    dx_ = dy_ = 0;
    scrollX_ = scrollY_ = 0.0f;
    dropped_files_.clear();
}

void Input::consumeAllMouseButtons() {
    for (int i = 0; i < COUNT; ++i) {
        click_candidate_[i] = false;
    }
    snapshot_.primary_pressed = snapshot_.primary_released = snapshot_.primary_clicked = false;
    snapshot_.secondary_pressed = snapshot_.secondary_released = snapshot_.secondary_clicked = false;
}

}
