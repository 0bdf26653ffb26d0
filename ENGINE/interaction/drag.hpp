#pragma once

#include <optional>

#include <SDL.h>

#include "blocks/block_id.hpp"

namespace mablocks {

class BlockManager;

struct DropOutcome {
    // Set when the block was released on empty canvas; the caller reorders
    // around it.
    std::optional<BlockId> reorder_leader;
    // Set when the block (and its chain) went into a group.
    std::optional<BlockId> target_group;
};

bool begin_drag(BlockManager& manager, BlockId id, SDL_FPoint world_pointer);

// Moves the leader so the grab point stays under the pointer. Every other
// chained top-level block moves by the same delta.
bool drag_to(BlockManager& manager, BlockId id, SDL_FPoint world_pointer);

DropOutcome end_drag(BlockManager& manager, BlockId id, SDL_FPoint world_pointer);

// Group that would receive the block currently being dragged, if any.
std::optional<BlockId> hovered_drop_target(const BlockManager& manager, SDL_FPoint world_pointer);

std::optional<BlockId> dragging_block(const BlockManager& manager);

}
