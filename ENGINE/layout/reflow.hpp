#pragma once

#include <cstddef>

#include <SDL.h>

#include "blocks/block.hpp"

namespace mablocks::layout {

struct ReflowResult {
    float content_height = 0.0f;
    int   rows = 0;
};

float effective_inner_width(float inner_width);

// Row-packs blocks in their current order. Groups and images never share a
// row: a category change always starts a new row.
ReflowResult reflow(BlockList& blocks, float inner_width);

void sort_by_layout(BlockList& blocks);

std::size_t group_boundary(const BlockList& blocks);

bool should_insert_before(SDL_FPoint leader_pos, SDL_FPoint block_pos);

// Index in a layout-sorted list where a dropped block belongs. Only the
// partition matching the leader's category is searched.
std::size_t find_insert_index(const BlockList& remaining, SDL_FPoint leader_pos, bool leader_is_group);

}
