#include "layout/reflow.hpp"

#include <algorithm>
#include <cmath>

#include "core/constants.hpp"

namespace mablocks::layout {

float effective_inner_width(float inner_width) {
    if (!std::isfinite(inner_width)) {
        inner_width = kCanvasWorkingWidth;
    }
    return std::max(inner_width, kMinCanvasInnerWidth);
}

ReflowResult reflow(BlockList& blocks, float inner_width) {
    inner_width = effective_inner_width(inner_width);
    const float row_limit = kCanvasPadding + inner_width;
    const float max_image_width = std::max(inner_width - kBlockPadding * 2.0f, 1.0f);

    for (auto& block : blocks) {
        block->reset_to_preferred_size();
        block->constrain_to_width(max_image_width);
    }

    ReflowResult result;
    if (blocks.empty()) {
        return result;
    }

    SDL_FPoint cursor{kCanvasPadding, kCanvasPadding};
    float row_height = 0.0f;
    bool has_prev = false;
    bool prev_is_group = false;
    result.rows = 1;

    auto wrap = [&]() {
        cursor.x = kCanvasPadding;
        cursor.y += row_height + kAlignSpacing;
        row_height = 0.0f;
        ++result.rows;
    };

    for (auto& block : blocks) {
        if (has_prev && prev_is_group != block->is_group() && cursor.x > kCanvasPadding) {
            wrap();
        }
        has_prev = true;
        prev_is_group = block->is_group();

        const SDL_FPoint size = block->outer_size();
        if (cursor.x > kCanvasPadding && cursor.x + size.x > row_limit) {
            wrap();
        }

        block->pos.position = cursor;
        cursor.x += size.x + kAlignSpacing;
        row_height = std::max(row_height, size.y);
        result.content_height = std::max(result.content_height, block->pos.position.y + size.y);
    }
    return result;
}

void sort_by_layout(BlockList& blocks) {
    std::stable_sort(blocks.begin(), blocks.end(), [](const auto& a, const auto& b) {
        return Block::layout_less(*a, *b);
    });
}

std::size_t group_boundary(const BlockList& blocks) {
    auto it = std::find_if(blocks.begin(), blocks.end(), [](const auto& b) { return !b->is_group(); });
    return static_cast<std::size_t>(std::distance(blocks.begin(), it));
}

bool should_insert_before(SDL_FPoint leader_pos, SDL_FPoint block_pos) {
    const int leader_row = Block::row_index(leader_pos.y);
    const int block_row = Block::row_index(block_pos.y);
    return leader_row < block_row || (leader_row == block_row && leader_pos.x < block_pos.x);
}

std::size_t find_insert_index(const BlockList& remaining, SDL_FPoint leader_pos, bool leader_is_group) {
    const std::size_t boundary = group_boundary(remaining);
    const std::size_t begin = leader_is_group ? 0 : boundary;
    const std::size_t end = leader_is_group ? boundary : remaining.size();
    for (std::size_t i = begin; i < end; ++i) {
        if (should_insert_before(leader_pos, remaining[i]->pos.position)) {
            return i;
        }
    }
    return end;
}

}
