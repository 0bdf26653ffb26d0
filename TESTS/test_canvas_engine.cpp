#include "doctest/doctest.h"

#include <string>
#include <vector>

#include "core/canvas_engine.hpp"
#include "interaction/block_controls.hpp"
#include "test_support.hpp"

using namespace mablocks;

namespace {

// Stills decode to one frame; anything ending in .gif is a 3-frame animation.
DecodeResult fake_decode(const std::string& path, bool full) {
    DecodeResult result;
    const bool animated = path.size() > 4 && path.compare(path.size() - 4, 4, ".gif") == 0;
    result.has_animation = animated;
    result.frames = mablocks::test::blank_frames(animated && full ? 3 : 1);
    result.original_size = path.find("wide") != std::string::npos ? SDL_FPoint{200.0f, 100.0f}
                                                                   : SDL_FPoint{50.0f, 50.0f};
    return result;
}

DecodeResult decoded(const std::string& path, bool full = false) {
    DecodeResult result = fake_decode(path, full);
    result.path = path;
    result.full = full;
    return result;
}

std::vector<DecodeResult> batch(std::initializer_list<std::string> paths) {
    std::vector<DecodeResult> out;
    for (const auto& path : paths) {
        out.push_back(decoded(path));
    }
    return out;
}

InputSnapshot pointer_at(SDL_FPoint screen) {
    InputSnapshot input;
    input.pointer = screen;
    input.has_pointer = true;
    return input;
}

SDL_FPoint rect_center(const SDL_FRect& r) {
    return SDL_FPoint{r.x + r.w * 0.5f, r.y + r.h * 0.5f};
}

}

TEST_CASE("Decoded images become blocks laid out from the canvas origin") {
    CanvasEngine engine(AppConfig::defaults(), fake_decode);
    engine.request_image("wide.png");
    engine.request_image("small.png");
    engine.wait_for_decodes();
    CHECK(engine.poll_decoded() == 2);

    REQUIRE(engine.manager().size() == 2);
    for (const auto& block : engine.manager().blocks()) {
        CHECK(block->pos.position.y == doctest::Approx(kCanvasPadding));
        CHECK(block->anim.frames.size() == 1);
    }
}

TEST_CASE("New images adopt the tallest existing block height") {
    CanvasEngine engine(AppConfig::defaults(), fake_decode);
    engine.ingest(batch({"wide.png"}));
    engine.ingest(batch({"small.png"}));

    REQUIRE(engine.manager().size() == 2);
    const Block& small = *engine.manager().blocks().back();
    CHECK(small.preferred_image_size.y == doctest::Approx(100.0f));
    CHECK(small.preferred_image_size.x == doctest::Approx(100.0f));
}

TEST_CASE("Failed decodes do not create blocks") {
    CanvasEngine engine(AppConfig::defaults(), fake_decode);
    DecodeResult failed;
    failed.path = "broken.png";
    failed.error = "Failed to decode broken.png";
    std::vector<DecodeResult> results;
    results.push_back(std::move(failed));
    engine.ingest(std::move(results));
    CHECK(engine.manager().empty());
}

TEST_CASE("Clicking an animated still loads the full sequence and starts it") {
    CanvasEngine engine(AppConfig::defaults(), fake_decode);
    engine.ingest(batch({"spin.gif"}));
    const BlockId id = engine.manager().blocks().front()->id();
    CHECK_FALSE(engine.manager().find(id)->is_full_sequence);

    engine.handle_block_click(id, false);
    engine.wait_for_decodes();
    engine.poll_decoded();

    const Block* block = engine.manager().find(id);
    REQUIRE(block != nullptr);
    CHECK(engine.manager().size() == 1);
    CHECK(block->is_full_sequence);
    CHECK(block->anim.frames.size() == 3);
    CHECK(block->anim.animation_enabled);
    CHECK(engine.manager().frame_cache().contains(id));
    CHECK(engine.next_frame_in().has_value());

    engine.handle_block_click(id, false);
    CHECK_FALSE(engine.manager().find(id)->anim.animation_enabled);
}

TEST_CASE("Full frames reaching a block inside a group enter the frame cache") {
    CanvasEngine engine(AppConfig::defaults(), fake_decode);
    engine.ingest(batch({"spin.gif", "spin.gif"}));
    REQUIRE(engine.manager().size() == 2);
    const BlockId boxed_child = engine.manager().blocks()[0]->id();
    const BlockId loose = engine.manager().blocks()[1]->id();
    engine.toggle_chain(boxed_child);
    REQUIRE(engine.manager().box_chained().has_value());

    engine.handle_block_click(loose, false);
    engine.wait_for_decodes();
    engine.poll_decoded();

    const Block* child = engine.manager().find_recursive(boxed_child);
    REQUIRE(child != nullptr);
    CHECK(engine.manager().find(boxed_child) == nullptr);
    CHECK(child->anim.frames.size() == 3);
    CHECK(engine.manager().frame_cache().contains(boxed_child));
    CHECK(engine.manager().frame_cache().contains(loose));
}

TEST_CASE("Ctrl-click toggles the chain instead of the animation") {
    CanvasEngine engine(AppConfig::defaults(), fake_decode);
    engine.ingest(batch({"a.png"}));
    const BlockId id = engine.manager().blocks().front()->id();
    engine.handle_block_click(id, true);
    CHECK(engine.manager().find(id)->chained);
}

TEST_CASE("Viewport width drives the working width and reflows only on real change") {
    CanvasEngine engine(AppConfig::defaults(), fake_decode);
    CHECK(engine.set_viewport_width(800.0f));
    CHECK(engine.working_inner_width() == doctest::Approx(800.0f - kCanvasPadding * 2.0f));
    CHECK_FALSE(engine.set_viewport_width(800.2f));

    Viewport viewport;
    viewport.width = 800.0f;
    viewport.height = 560.0f;
    const SDL_FPoint size = engine.canvas_size(viewport.height);
    CHECK(size.x == doctest::Approx(800.0f));
    CHECK(size.y == doctest::Approx(560.0f));
}

TEST_CASE("Zoom is clamped and maps screen to world") {
    CanvasEngine engine(AppConfig::defaults(), fake_decode);
    engine.apply_zoom(1000.0f);
    CHECK(engine.zoom() == doctest::Approx(kMaxZoom));
    engine.apply_zoom(0.0f);
    CHECK(engine.zoom() == doctest::Approx(kMaxZoom));
    engine.apply_zoom(0.00001f);
    CHECK(engine.zoom() == doctest::Approx(kMinZoom));

    CanvasEngine plain(AppConfig::defaults(), fake_decode);
    plain.apply_zoom(2.0f);
    Viewport viewport;
    const SDL_FPoint world = plain.screen_to_world(SDL_FPoint{100.0f, viewport.origin.y + 50.0f}, viewport);
    CHECK(world.x == doctest::Approx(50.0f));
    CHECK(world.y == doctest::Approx(25.0f));
    const SDL_FRect screen = plain.world_to_screen(SDL_FRect{50.0f, 25.0f, 10.0f, 10.0f}, viewport);
    CHECK(screen.x == doctest::Approx(100.0f));
    CHECK(screen.w == doctest::Approx(20.0f));
}

TEST_CASE("Clicking empty canvas clears the chain") {
    CanvasEngine engine(AppConfig::defaults(), fake_decode);
    engine.ingest(batch({"a.png", "b.png"}));
    for (const auto& block : engine.manager().blocks()) {
        engine.toggle_chain(block->id());
    }
    REQUIRE(engine.manager().chained_count() == 2);

    Viewport viewport;
    InputSnapshot input = pointer_at(SDL_FPoint{700.0f, 500.0f});
    input.primary_clicked = true;
    input.primary_released = true;
    engine.update(input, viewport, 0.016f);

    CHECK(engine.manager().chained_count() == 0);
    CHECK(engine.manager().remembered_chains().size() == 1);
}

TEST_CASE("Block buttons act on the block under the pointer") {
    CanvasEngine engine(AppConfig::defaults(), fake_decode);
    engine.ingest(batch({"wide.png", "small.png"}));
    Viewport viewport;
    engine.set_viewport_width(viewport.width);

    const Block& first = *engine.manager().blocks().front();
    const BlockId first_id = first.id();
    const ControlRects rects = control_rects(engine.world_to_screen(first.rect(), viewport), engine.zoom());

    InputSnapshot counter_click = pointer_at(rect_center(rects.counter));
    counter_click.primary_clicked = true;
    engine.update(counter_click, viewport, 0.0f);
    CHECK(engine.manager().find(first_id)->counter == 1);

    InputSnapshot chain_click = pointer_at(rect_center(rects.chain));
    chain_click.primary_clicked = true;
    engine.update(chain_click, viewport, 0.0f);
    CHECK(engine.manager().find(first_id)->chained);

    InputSnapshot close_click = pointer_at(rect_center(rects.close));
    close_click.primary_clicked = true;
    engine.update(close_click, viewport, 0.0f);
    CHECK(engine.manager().find(first_id) == nullptr);
    CHECK(engine.manager().size() == 1);
}

TEST_CASE("Dragging a block past its neighbour reorders on release") {
    CanvasEngine engine(AppConfig::defaults(), fake_decode);
    engine.ingest(batch({"wide.png", "small.png"}));
    Viewport viewport;
    engine.set_viewport_width(viewport.width);
    const BlockId wide = engine.manager().blocks()[0]->id();
    const BlockId small = engine.manager().blocks()[1]->id();

    InputSnapshot press = pointer_at(SDL_FPoint{100.0f, viewport.origin.y + 80.0f});
    press.primary_pressed = true;
    press.primary_down = true;
    engine.update(press, viewport, 0.0f);

    InputSnapshot move = pointer_at(SDL_FPoint{400.0f, viewport.origin.y + 80.0f});
    move.primary_down = true;
    engine.update(move, viewport, 0.0f);
    CHECK(engine.manager().find(wide)->pos.is_dragging);
    CHECK(engine.manager().find(wide)->pos.position.x == doctest::Approx(332.0f));

    InputSnapshot release = pointer_at(SDL_FPoint{400.0f, viewport.origin.y + 80.0f});
    release.primary_released = true;
    engine.update(release, viewport, 0.0f);

    const auto& blocks = engine.manager().blocks();
    CHECK_FALSE(engine.manager().any_dragging());
    CHECK(blocks[0]->id() == small);
    CHECK(blocks[1]->id() == wide);
    CHECK(blocks[0]->pos.position.x == doctest::Approx(kCanvasPadding));
}

TEST_CASE("Secondary drag resizes and reflows on release") {
    CanvasEngine engine(AppConfig::defaults(), fake_decode);
    engine.ingest(batch({"small.png"}));
    Viewport viewport;
    engine.set_viewport_width(viewport.width);
    const BlockId id = engine.manager().blocks().front()->id();
    const SDL_FRect screen = engine.world_to_screen(engine.manager().find(id)->rect(), viewport);

    InputSnapshot press = pointer_at(SDL_FPoint{screen.x + screen.w - 2.0f, screen.y + screen.h - 2.0f});
    press.secondary_pressed = true;
    engine.update(press, viewport, 0.0f);
    REQUIRE(engine.resize_state().has_value());

    InputSnapshot drag = pointer_at(SDL_FPoint{press.pointer.x + 75.0f, press.pointer.y});
    engine.update(drag, viewport, 0.0f);
    CHECK(engine.manager().find(id)->image_size.x == doctest::Approx(200.0f));

    InputSnapshot release = drag;
    release.secondary_released = true;
    engine.update(release, viewport, 0.0f);
    CHECK_FALSE(engine.resize_state().has_value());
    CHECK(engine.manager().find(id)->pos.position.x == doctest::Approx(kCanvasPadding));
    CHECK(engine.manager().find(id)->image_size.x == doctest::Approx(200.0f));
}

TEST_CASE("Compact toggle boxes the chain and reflows") {
    CanvasEngine engine(AppConfig::defaults(), fake_decode);
    engine.ingest(batch({"a.png", "b.png", "c.png"}));
    engine.toggle_chain(engine.manager().blocks()[0]->id());
    engine.toggle_chain(engine.manager().blocks()[1]->id());

    engine.toggle_compact_group();
    REQUIRE(engine.manager().size() == 2);
    CHECK(engine.manager().blocks()[0]->is_group());
    CHECK(engine.manager().blocks()[0]->pos.position.x == doctest::Approx(kCanvasPadding));
    CHECK(engine.manager().blocks()[1]->pos.position.y > kCanvasPadding);
}

TEST_CASE("Session save and load restore the canvas and refetch frames") {
    const auto dir = mablocks::test::scratch_dir("engine_session");
    const auto path = dir / "session.json";

    BlockId chained_id;
    {
        CanvasEngine engine(AppConfig::defaults(), fake_decode);
        engine.ingest(batch({"a.png", "b.png", "a.png"}));
        chained_id = engine.manager().blocks()[1]->id();
        engine.toggle_chain(chained_id);
        engine.apply_zoom(1.5f);
        engine.toggle_file_names();
        engine.save_session(path);
    }

    CanvasEngine restored(AppConfig::defaults(), fake_decode);
    restored.load_session(path);
    CHECK(restored.manager().size() == 3);
    CHECK(restored.zoom() == doctest::Approx(1.5f));
    CHECK(restored.show_file_names());
    CHECK(restored.manager().find(chained_id)->chained);

    restored.wait_for_decodes();
    restored.poll_decoded();
    CHECK(restored.manager().size() == 3);
    for (const auto& block : restored.manager().blocks()) {
        CHECK(block->anim.frames.size() == 1);
    }

    const BlockId fresh = restored.manager().allocate_id();
    for (const auto& block : restored.manager().blocks()) {
        CHECK(block->id() != fresh);
    }
}

TEST_CASE("Autosave waits for the interval") {
    const auto dir = mablocks::test::scratch_dir("autosave");
    const auto path = dir / "autosave.json";
    CanvasEngine engine(AppConfig::defaults(), fake_decode);
    engine.set_autosave(path, 60.0);

    CHECK_FALSE(engine.tick_autosave(30.0));
    CHECK_FALSE(std::filesystem::exists(path));
    CHECK(engine.tick_autosave(61.0));
    CHECK(std::filesystem::exists(path));
    CHECK_FALSE(engine.tick_autosave(100.0));
}
