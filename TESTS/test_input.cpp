#include "doctest/doctest.h"

#include <cstring>

#include <SDL.h>

#include "utils/input.hpp"

using namespace mablocks;

namespace {

SDL_Event button_event(Uint32 type, Uint8 button, int x, int y) {
    SDL_Event e;
    std::memset(&e, 0, sizeof(e));
    e.type = type;
    e.button.button = button;
    e.button.x = x;
    e.button.y = y;
    return e;
}

SDL_Event motion_event(int x, int y, int dx, int dy) {
    SDL_Event e;
    std::memset(&e, 0, sizeof(e));
    e.type = SDL_MOUSEMOTION;
    e.motion.x = x;
    e.motion.y = y;
    e.motion.xrel = dx;
    e.motion.yrel = dy;
    return e;
}

SDL_Event key_event(Uint32 type, SDL_Scancode sc, Uint16 mod) {
    SDL_Event e;
    std::memset(&e, 0, sizeof(e));
    e.type = type;
    e.key.keysym.scancode = sc;
    e.key.keysym.mod = mod;
    return e;
}

SDL_Event wheel_event(float y) {
    SDL_Event e;
    std::memset(&e, 0, sizeof(e));
    e.type = SDL_MOUSEWHEEL;
    e.wheel.preciseY = y;
    e.wheel.y = static_cast<Sint32>(y);
    return e;
}

}

TEST_CASE("Press and release within the slop is a click") {
    Input input;
    input.handleEvent(button_event(SDL_MOUSEBUTTONDOWN, SDL_BUTTON_LEFT, 10, 10));
    input.update();
    CHECK(input.snapshot().primary_pressed);
    CHECK(input.snapshot().primary_down);
    CHECK_FALSE(input.snapshot().primary_clicked);

    input.handleEvent(button_event(SDL_MOUSEBUTTONUP, SDL_BUTTON_LEFT, 13, 12));
    input.update();
    CHECK(input.snapshot().primary_released);
    CHECK(input.snapshot().primary_clicked);
    CHECK_FALSE(input.snapshot().primary_down);

    input.update();
    CHECK_FALSE(input.snapshot().primary_clicked);
    CHECK_FALSE(input.snapshot().primary_released);
}

TEST_CASE("Moving past the slop turns a press into a drag") {
    Input input;
    input.handleEvent(button_event(SDL_MOUSEBUTTONDOWN, SDL_BUTTON_LEFT, 10, 10));
    input.handleEvent(motion_event(40, 10, 30, 0));
    input.handleEvent(motion_event(11, 10, -29, 0));
    input.handleEvent(button_event(SDL_MOUSEBUTTONUP, SDL_BUTTON_LEFT, 11, 10));
    input.update();
    CHECK(input.snapshot().primary_released);
    CHECK_FALSE(input.snapshot().primary_clicked);
    CHECK(input.snapshot().pointer_delta.x == doctest::Approx(1.0f));
}

TEST_CASE("Secondary button reports its own edges") {
    Input input;
    input.handleEvent(button_event(SDL_MOUSEBUTTONDOWN, SDL_BUTTON_RIGHT, 5, 5));
    input.update();
    CHECK(input.snapshot().secondary_pressed);
    CHECK_FALSE(input.snapshot().primary_pressed);
    input.handleEvent(button_event(SDL_MOUSEBUTTONUP, SDL_BUTTON_RIGHT, 5, 5));
    input.update();
    CHECK(input.snapshot().secondary_released);
    CHECK(input.snapshot().secondary_clicked);
}

TEST_CASE("Wheel scrolls, ctrl-wheel zooms") {
    Input input;
    input.handleEvent(wheel_event(2.0f));
    input.update();
    CHECK(input.snapshot().scroll_y == doctest::Approx(2.0f));
    CHECK(input.snapshot().zoom_delta == doctest::Approx(1.0f));

    input.handleEvent(key_event(SDL_KEYDOWN, SDL_SCANCODE_LCTRL, KMOD_LCTRL));
    input.handleEvent(wheel_event(1.0f));
    input.update();
    CHECK(input.snapshot().ctrl);
    CHECK(input.snapshot().scroll_y == doctest::Approx(0.0f));
    CHECK(input.snapshot().zoom_delta == doctest::Approx(Input::kZoomStep));
}

TEST_CASE("Ctrl+N toggles file names once per press") {
    Input input;
    input.handleEvent(key_event(SDL_KEYDOWN, SDL_SCANCODE_LCTRL, KMOD_LCTRL));
    input.handleEvent(key_event(SDL_KEYDOWN, SDL_SCANCODE_N, KMOD_LCTRL));
    input.update();
    CHECK(input.snapshot().toggle_file_names);
    CHECK(input.wasScancodePressed(SDL_SCANCODE_N));

    input.update();
    CHECK_FALSE(input.snapshot().toggle_file_names);
    CHECK(input.isScancodeDown(SDL_SCANCODE_N));
}

TEST_CASE("Dropped files are handed over once") {
    Input input;
    SDL_Event e;
    std::memset(&e, 0, sizeof(e));
    e.type = SDL_DROPFILE;
    e.drop.file = SDL_strdup("/tmp/photo.png");
    input.handleEvent(e);
    input.update();
    REQUIRE(input.snapshot().dropped_files.size() == 1);
    CHECK(input.snapshot().dropped_files.front() == "/tmp/photo.png");

    input.update();
    CHECK(input.snapshot().dropped_files.empty());
}

TEST_CASE("Leaving the window drops the pointer") {
    Input input;
    input.handleEvent(motion_event(20, 30, 0, 0));
    input.update();
    CHECK(input.snapshot().has_pointer);

    SDL_Event leave;
    std::memset(&leave, 0, sizeof(leave));
    leave.type = SDL_WINDOWEVENT;
    leave.window.event = SDL_WINDOWEVENT_LEAVE;
    input.handleEvent(leave);
    input.update();
    CHECK_FALSE(input.snapshot().has_pointer);
}
