#include "interaction/drag.hpp"

#include "blocks/block_manager.hpp"
#include "utils/log.hpp"

namespace mablocks {

namespace {

const log::Channel kLog{"Drag"};

}

bool begin_drag(BlockManager& manager, BlockId id, SDL_FPoint world_pointer) {
    Block* block = manager.find(id);
    if (!block) {
        return false;
    }
    block->pos.drag_offset = SDL_FPoint{world_pointer.x - block->pos.position.x,
                                        world_pointer.y - block->pos.position.y};
    block->pos.is_dragging = true;
    return true;
}

bool drag_to(BlockManager& manager, BlockId id, SDL_FPoint world_pointer) {
    Block* leader = manager.find(id);
    if (!leader || !leader->pos.is_dragging) {
        return false;
    }
    const SDL_FPoint old_pos = leader->pos.position;
    const SDL_FPoint new_pos{world_pointer.x - leader->pos.drag_offset.x,
                             world_pointer.y - leader->pos.drag_offset.y};
    const SDL_FPoint delta{new_pos.x - old_pos.x, new_pos.y - old_pos.y};
    leader->pos.position = new_pos;

    if (leader->chained) {
        for (auto& other : manager.blocks()) {
            if (other->chained && other->id() != id) {
                other->pos.position.x += delta.x;
                other->pos.position.y += delta.y;
            }
        }
    }
    return true;
}

DropOutcome end_drag(BlockManager& manager, BlockId id, SDL_FPoint world_pointer) {
    DropOutcome outcome;
    Block* block = manager.find(id);
    if (!block || !block->pos.is_dragging) {
        return outcome;
    }
    block->pos.is_dragging = false;

    if (!block->is_group()) {
        if (const Block* target = manager.find_group_at(world_pointer, id)) {
            const BlockId group_id = target->id();
            if (manager.drop_into_group(id, group_id)) {
                kLog.debug("Dropped block " + id.to_string() + " into group " + group_id.to_string() + ".");
                outcome.target_group = group_id;
                return outcome;
            }
        }
    }
    outcome.reorder_leader = id;
    return outcome;
}

std::optional<BlockId> hovered_drop_target(const BlockManager& manager, SDL_FPoint world_pointer) {
    const auto dragging = dragging_block(manager);
    if (!dragging) {
        return std::nullopt;
    }
    const Block* block = manager.find(*dragging);
    if (!block || block->is_group()) {
        return std::nullopt;
    }
    if (const Block* target = manager.find_group_at(world_pointer, *dragging)) {
        return target->id();
    }
    return std::nullopt;
}

std::optional<BlockId> dragging_block(const BlockManager& manager) {
    for (const auto& block : manager.blocks()) {
        if (block->pos.is_dragging) {
            return block->id();
        }
    }
    return std::nullopt;
}

}
