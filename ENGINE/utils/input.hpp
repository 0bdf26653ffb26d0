#pragma once

#include <SDL.h>
#include <array>
#include <string>
#include <vector>

namespace mablocks {

// Immutable view of one update step's input. Positions are window pixels.
struct InputSnapshot {
    SDL_FPoint pointer{0.0f, 0.0f};
    bool has_pointer = false;
    SDL_FPoint pointer_delta{0.0f, 0.0f};

    bool primary_down = false;
    bool primary_pressed = false;
    bool primary_released = false;
    bool primary_clicked = false;
    bool secondary_pressed = false;
    bool secondary_released = false;
    bool secondary_clicked = false;
    bool middle_down = false;

    float scroll_x = 0.0f;
    float scroll_y = 0.0f;
    float zoom_delta = 1.0f;

    bool ctrl = false;
    bool shift = false;
    bool toggle_file_names = false;

    std::vector<std::string> dropped_files;
};

// Folds SDL events into per-step state. Call handleEvent for every event of
// the step, then update() once, then read snapshot().
class Input {
public:
    enum Button { LEFT, RIGHT, MIDDLE, COUNT };

    static constexpr int kClickSlopPx = 6;
    static constexpr float kZoomStep = 1.1f;

    void handleEvent(const SDL_Event& e);
    void update();

    const InputSnapshot& snapshot() const { return snapshot_; }

    bool isDown(Button b) const { return buttons_[b]; }
    bool isScancodeDown(SDL_Scancode sc) const { return keys_down_[sc]; }
    bool wasScancodePressed(SDL_Scancode sc) const { return keys_pressed_[sc]; }

    int getX() const { return x_; }
    int getY() const { return y_; }

    void consumeAllMouseButtons();

private:
    bool buttons_[COUNT] = {false};
    bool pressed_this_step_[COUNT] = {false};
    bool released_this_step_[COUNT] = {false};
    bool click_candidate_[COUNT] = {false};
    SDL_Point press_pos_[COUNT] = {};
    bool clicked_this_step_[COUNT] = {false};

    int x_ = 0, y_ = 0;
    int dx_ = 0, dy_ = 0;
    bool has_pointer_ = false;
    float scrollX_ = 0.0f, scrollY_ = 0.0f;

    std::array<bool, SDL_NUM_SCANCODES> keys_down_{};
    std::array<bool, SDL_NUM_SCANCODES> prev_keys_down_{};
    std::array<bool, SDL_NUM_SCANCODES> keys_pressed_{};
    std::vector<SDL_Scancode> dirty_scancodes_;
    std::vector<SDL_Scancode> pressed_scancode_buffer_;
    Uint16 modifiers_ = KMOD_NONE;

    std::vector<std::string> dropped_files_;
    InputSnapshot snapshot_;
};

}
