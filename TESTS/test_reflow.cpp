#include "doctest/doctest.h"

#include <cmath>
#include <limits>
#include <optional>
#include <vector>

#include "blocks/block_manager.hpp"
#include "core/constants.hpp"
#include "layout/reflow.hpp"
#include "test_support.hpp"

using namespace mablocks;
using mablocks::test::add_group;
using mablocks::test::add_image;

namespace {

std::vector<SDL_FPoint> positions(const BlockManager& manager) {
    std::vector<SDL_FPoint> out;
    for (const auto& block : manager.blocks()) {
        out.push_back(block->pos.position);
    }
    return out;
}

}

TEST_CASE("Reflow packs blocks into rows and wraps at the inner width") {
    BlockManager manager;
    for (int i = 0; i < 4; ++i) {
        add_image(manager, 100.0f, 100.0f);
    }

    const layout::ReflowResult result = manager.reflow(400.0f);

    const auto& blocks = manager.blocks();
    CHECK(blocks[0]->pos.position.x == doctest::Approx(kCanvasPadding));
    CHECK(blocks[0]->pos.position.y == doctest::Approx(kCanvasPadding));
    CHECK(blocks[1]->pos.position.x == doctest::Approx(164.0f));
    CHECK(blocks[2]->pos.position.x == doctest::Approx(296.0f));
    CHECK(blocks[3]->pos.position.x == doctest::Approx(kCanvasPadding));
    CHECK(blocks[3]->pos.position.y == doctest::Approx(164.0f));
    CHECK(result.rows == 2);
    CHECK(result.content_height == doctest::Approx(272.0f));
}

TEST_CASE("Reflow never puts a group and an image on the same row") {
    BlockManager manager;
    add_group(manager);
    add_image(manager, 50.0f, 50.0f);

    manager.reflow(1400.0f);

    const auto& blocks = manager.blocks();
    CHECK(blocks[0]->pos.position.y == doctest::Approx(kCanvasPadding));
    CHECK(blocks[1]->pos.position.x == doctest::Approx(kCanvasPadding));
    CHECK(blocks[1]->pos.position.y ==
          doctest::Approx(kCanvasPadding + kDefaultGroupSize + kBlockPadding * 2.0f + kAlignSpacing));
}

TEST_CASE("Reflow is idempotent") {
    BlockManager manager;
    add_image(manager, 120.0f, 80.0f);
    add_image(manager, 300.0f, 200.0f);
    add_group(manager);
    add_image(manager, 60.0f, 240.0f);

    manager.reflow(500.0f);
    const auto first = positions(manager);
    manager.reflow(500.0f);
    const auto second = positions(manager);

    REQUIRE(first.size() == second.size());
    for (std::size_t i = 0; i < first.size(); ++i) {
        CHECK(first[i].x == doctest::Approx(second[i].x));
        CHECK(first[i].y == doctest::Approx(second[i].y));
    }
}

TEST_CASE("Reflow shrinks blocks wider than the row and restores them later") {
    BlockManager manager;
    Block& wide = add_image(manager, 1000.0f, 500.0f);

    manager.reflow(400.0f);
    CHECK(wide.image_size.x == doctest::Approx(400.0f - kBlockPadding * 2.0f));
    CHECK(wide.image_size.y == doctest::Approx((400.0f - kBlockPadding * 2.0f) / 2.0f));
    CHECK(wide.preferred_image_size.x == doctest::Approx(1000.0f));

    manager.reflow(2000.0f);
    CHECK(wide.image_size.x == doctest::Approx(1000.0f));
}

TEST_CASE("Degenerate inner widths are replaced") {
    CHECK(layout::effective_inner_width(std::numeric_limits<float>::quiet_NaN()) == doctest::Approx(kCanvasWorkingWidth));
    CHECK(layout::effective_inner_width(10.0f) == doctest::Approx(kMinCanvasInnerWidth));
    CHECK(layout::effective_inner_width(900.0f) == doctest::Approx(900.0f));
}

TEST_CASE("Insert index only searches the leader's own category") {
    BlockManager manager;
    add_group(manager, SDL_FPoint{32.0f, 32.0f});
    add_group(manager, SDL_FPoint{300.0f, 32.0f});
    add_image(manager, 50.0f, 50.0f, SDL_FPoint{32.0f, 250.0f});
    add_image(manager, 50.0f, 50.0f, SDL_FPoint{200.0f, 250.0f});

    BlockList& blocks = manager.blocks();
    CHECK(layout::group_boundary(blocks) == 2);

    // An image dropped at the very top still lands among the images.
    CHECK(layout::find_insert_index(blocks, SDL_FPoint{0.0f, 0.0f}, false) == 2);
    CHECK(layout::find_insert_index(blocks, SDL_FPoint{100.0f, 250.0f}, false) == 3);
    CHECK(layout::find_insert_index(blocks, SDL_FPoint{900.0f, 900.0f}, false) == 4);

    CHECK(layout::find_insert_index(blocks, SDL_FPoint{100.0f, 32.0f}, true) == 1);
    CHECK(layout::find_insert_index(blocks, SDL_FPoint{100.0f, 900.0f}, true) == 2);
}

TEST_CASE("Insert-before compares quantized rows before x") {
    CHECK(layout::should_insert_before(SDL_FPoint{500.0f, 10.0f}, SDL_FPoint{0.0f, 150.0f}));
    CHECK(layout::should_insert_before(SDL_FPoint{10.0f, 10.0f}, SDL_FPoint{20.0f, 90.0f}));
    CHECK_FALSE(layout::should_insert_before(SDL_FPoint{30.0f, 10.0f}, SDL_FPoint{20.0f, 90.0f}));
}

TEST_CASE("Reflowing an empty canvas has no rows and no height") {
    BlockManager manager;
    const layout::ReflowResult result = manager.reflow(kCanvasWorkingWidth);
    CHECK(result.rows == 0);
    CHECK(result.content_height == doctest::Approx(0.0f));
    CHECK(manager.reorder_and_reflow(std::nullopt, kCanvasWorkingWidth).rows == 0);
}
