#include "doctest/doctest.h"

#include <limits>
#include <stdexcept>

#include "blocks/block.hpp"
#include "core/constants.hpp"
#include "test_support.hpp"

using namespace mablocks;
using mablocks::test::blank_frames;

TEST_CASE("Image block derives aspect ratio and outer size from its image") {
    auto block = Block::make_image(BlockId{1}, "a/cat.png", blank_frames(1), SDL_FPoint{200.0f, 100.0f}, false, false);

    CHECK(block->aspect_ratio() == doctest::Approx(2.0f));
    CHECK(block->outer_size().x == doctest::Approx(200.0f + kBlockPadding * 2.0f));
    CHECK(block->outer_size().y == doctest::Approx(100.0f + kBlockPadding * 2.0f));
    CHECK(block->file_name() == "cat.png");
    CHECK_FALSE(block->is_group());
}

TEST_CASE("Zero-height image falls back to a square aspect ratio") {
    auto block = Block::make_image(BlockId{1}, "flat.png", blank_frames(1), SDL_FPoint{40.0f, 0.0f}, false, false);
    CHECK(block->aspect_ratio() == doctest::Approx(1.0f));
}

TEST_CASE("Counter never goes below zero and groups ignore counter changes") {
    auto block = Block::make_image(BlockId{1}, "a.png", blank_frames(1), SDL_FPoint{50.0f, 50.0f}, false, false);
    block->decrement_counter();
    CHECK(block->counter == 0);
    block->increment_counter();
    block->increment_counter();
    block->decrement_counter();
    CHECK(block->counter == 1);

    auto group = Block::make_group(BlockId{2}, BlockList{});
    group->increment_counter();
    CHECK(group->counter == 0);
}

TEST_CASE("Group names follow the number of children") {
    auto group = Block::make_group(BlockId{10}, BlockList{});
    CHECK(group->display_name() == "Empty Group");
    CHECK(group->outer_size().x == doctest::Approx(kDefaultGroupSize + kBlockPadding * 2.0f));

    group->adopt_child(Block::make_image(BlockId{11}, "dir/first.gif", blank_frames(1), SDL_FPoint{50.0f, 50.0f}, false, false));
    CHECK(group->display_name() == "Box: first.gif");

    group->adopt_child(Block::make_image(BlockId{12}, "second.png", blank_frames(1), SDL_FPoint{50.0f, 50.0f}, false, false));
    CHECK(group->display_name() == "Group of 2");
    CHECK(group->depth() == 2);
}

TEST_CASE("Groups refuse nested groups and non-groups refuse children") {
    auto group = Block::make_group(BlockId{1}, BlockList{});
    CHECK_THROWS_AS(group->adopt_child(Block::make_group(BlockId{2}, BlockList{})), std::invalid_argument);

    auto image = Block::make_image(BlockId{3}, "a.png", blank_frames(1), SDL_FPoint{50.0f, 50.0f}, false, false);
    CHECK_THROWS_AS(image->adopt_child(Block::make_image(BlockId{4}, "b.png", blank_frames(1), SDL_FPoint{50.0f, 50.0f}, false, false)),
                    std::invalid_argument);
}

TEST_CASE("Adopted children lose chain and drag state") {
    auto group = Block::make_group(BlockId{1}, BlockList{});
    auto child = Block::make_image(BlockId{2}, "a.png", blank_frames(1), SDL_FPoint{50.0f, 50.0f}, false, false);
    child->chained = true;
    child->pos.is_dragging = true;
    group->adopt_child(std::move(child));

    REQUIRE(group->child_count() == 1);
    CHECK_FALSE(group->children().front()->chained);
    CHECK_FALSE(group->children().front()->pos.is_dragging);
}

TEST_CASE("Animation advances through frames by elapsed time") {
    auto block = Block::make_image(BlockId{1}, "anim.gif", blank_frames(3, 100), SDL_FPoint{50.0f, 50.0f}, true, true);
    CHECK_FALSE(block->update_animation(1.0f));

    block->toggle_animation();
    REQUIRE(block->anim.animation_enabled);
    CHECK(block->update_animation(0.25f));
    CHECK(block->anim.current_frame == 2);

    auto next = block->time_until_next_frame();
    REQUIRE(next.has_value());
    CHECK(next->count() == 50);

    block->toggle_animation();
    CHECK_FALSE(block->anim.animation_enabled);
    CHECK(block->anim.current_frame == 0);
}

TEST_CASE("Single-frame images cannot be animated") {
    auto block = Block::make_image(BlockId{1}, "still.png", blank_frames(1), SDL_FPoint{50.0f, 50.0f}, false, true);
    block->toggle_animation();
    CHECK_FALSE(block->anim.animation_enabled);
    CHECK_FALSE(block->time_until_next_frame().has_value());
}

TEST_CASE("Truncating keeps only the first frame of a full sequence") {
    auto block = Block::make_image(BlockId{1}, "anim.gif", blank_frames(4), SDL_FPoint{50.0f, 50.0f}, true, true);
    block->toggle_animation();
    CHECK(block->truncate_to_first_frame());
    CHECK(block->anim.frames.size() == 1);
    CHECK_FALSE(block->is_full_sequence);
    CHECK_FALSE(block->anim.animation_enabled);
    CHECK_FALSE(block->truncate_to_first_frame());
}

TEST_CASE("Populating frames fills skeletons and upgrades to the full sequence") {
    auto skeleton = Block::make_image(BlockId{1}, "anim.gif", FrameList{}, SDL_FPoint{50.0f, 50.0f}, false, false);
    CHECK(skeleton->needs_frames_for("anim.gif", false));
    CHECK_FALSE(skeleton->needs_frames_for("other.gif", false));

    std::vector<BlockId> updated;
    CHECK(skeleton->populate_frames("anim.gif", blank_frames(1), true, false, &updated));
    CHECK(skeleton->anim.frames.size() == 1);
    CHECK(skeleton->anim.has_animation);
    CHECK_FALSE(skeleton->needs_frames_for("anim.gif", false));
    CHECK(skeleton->needs_frames_for("anim.gif", true));

    CHECK(skeleton->populate_frames("anim.gif", blank_frames(5), true, true, &updated));
    CHECK(skeleton->anim.frames.size() == 5);
    CHECK(skeleton->is_full_sequence);
    CHECK(skeleton->anim.animation_enabled);
    CHECK(updated.size() == 2);
}

TEST_CASE("Layout order puts groups first, then rows, then x") {
    auto group = Block::make_group(BlockId{1}, BlockList{});
    group->pos.position = SDL_FPoint{500.0f, 500.0f};
    auto left = Block::make_image(BlockId{2}, "a.png", blank_frames(1), SDL_FPoint{50.0f, 50.0f}, false, false);
    left->pos.position = SDL_FPoint{10.0f, 20.0f};
    auto right_same_row = Block::make_image(BlockId{3}, "b.png", blank_frames(1), SDL_FPoint{50.0f, 50.0f}, false, false);
    right_same_row->pos.position = SDL_FPoint{300.0f, 90.0f};
    auto next_row = Block::make_image(BlockId{4}, "c.png", blank_frames(1), SDL_FPoint{50.0f, 50.0f}, false, false);
    next_row->pos.position = SDL_FPoint{0.0f, 120.0f};

    CHECK(Block::layout_less(*group, *left));
    CHECK(Block::layout_less(*left, *right_same_row));
    CHECK(Block::layout_less(*right_same_row, *next_row));
    CHECK_FALSE(Block::layout_less(*next_row, *left));
}

TEST_CASE("Row index stays defined for huge and non-finite positions") {
    const float inf = std::numeric_limits<float>::infinity();
    CHECK(Block::row_index(250.0f) == 2);
    CHECK(Block::row_index(std::numeric_limits<float>::quiet_NaN()) == 0);
    CHECK(Block::row_index(inf) == Block::row_index(kMaxCanvasCoordinate));
    CHECK(Block::row_index(-inf) == Block::row_index(-kMaxCanvasCoordinate));
    CHECK(Block::row_index(1.0e30f) > Block::row_index(1.0e6f));
}
