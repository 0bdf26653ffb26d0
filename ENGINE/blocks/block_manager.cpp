#include "blocks/block_manager.hpp"

#include <algorithm>
#include <limits>
#include <utility>

#include "utils/log.hpp"

namespace mablocks {

namespace {

const log::Channel kLog{"BlockManager"};

}

BlockManager::BlockManager(std::size_t max_cached_animations)
    : frame_cache_(max_cached_animations) {
    frame_cache_.set_evict_callback([this](BlockId id) { purge_animation_frames(id); });
}

std::optional<std::size_t> BlockManager::index_of(BlockId id) const {
    for (std::size_t i = 0; i < blocks_.size(); ++i) {
        if (blocks_[i]->id() == id) {
            return i;
        }
    }
    return std::nullopt;
}

Block* BlockManager::find(BlockId id) {
    auto idx = index_of(id);
    return idx ? blocks_[*idx].get() : nullptr;
}

const Block* BlockManager::find(BlockId id) const {
    auto idx = index_of(id);
    return idx ? blocks_[*idx].get() : nullptr;
}

Block* BlockManager::find_recursive(BlockId id) {
    return const_cast<Block*>(static_cast<const BlockManager*>(this)->find_recursive(id));
}

const Block* BlockManager::find_recursive(BlockId id) const {
    for (const auto& block : blocks_) {
        if (block->id() == id) {
            return block.get();
        }
        for (const auto& child : block->children()) {
            if (child->id() == id) {
                return child.get();
            }
        }
    }
    return nullptr;
}

Block& BlockManager::push(std::unique_ptr<Block> block) {
    ids_.reserve_past(block->id());
    blocks_.push_back(std::move(block));
    return *blocks_.back();
}

Block& BlockManager::insert(std::size_t index, std::unique_ptr<Block> block) {
    ids_.reserve_past(block->id());
    index = std::min(index, blocks_.size());
    auto it = blocks_.insert(blocks_.begin() + static_cast<std::ptrdiff_t>(index), std::move(block));
    return **it;
}

std::unique_ptr<Block> BlockManager::take_at(std::size_t index) {
    std::unique_ptr<Block> block = std::move(blocks_[index]);
    blocks_.erase(blocks_.begin() + static_cast<std::ptrdiff_t>(index));
    return block;
}

void BlockManager::discard(const std::vector<BlockId>& removed_ids) {
    frame_cache_.forget(removed_ids);
    if (history_.last_boxed_id &&
        std::find(removed_ids.begin(), removed_ids.end(), *history_.last_boxed_id) != removed_ids.end()) {
        history_.last_boxed_id.reset();
    }
}

std::vector<BlockId> BlockManager::remove_with_children(BlockId id) {
    std::vector<BlockId> removed;
    auto idx = index_of(id);
    if (!idx) {
        return removed;
    }
    take_at(*idx)->collect_ids(removed);
    for (BlockId gone : removed) {
        remembered_.prune_member(gone);
    }
    discard(removed);
    return removed;
}

std::vector<BlockId> BlockManager::remove_cascade(BlockId id) {
    const Block* target = find(id);
    if (!target) {
        return {};
    }
    if (!target->chained) {
        return remove_with_children(id);
    }

    std::vector<std::size_t> indices = chained_indices();
    std::sort(indices.rbegin(), indices.rend());

    std::vector<BlockId> removed;
    for (std::size_t idx : indices) {
        take_at(idx)->collect_ids(removed);
    }
    remembered_.forget_members(ChainedIds(removed.begin(), removed.end()));
    discard(removed);
    kLog.info("Cascade removed " + std::to_string(removed.size()) + " block(s).");
    return removed;
}

void BlockManager::clear() {
    blocks_.clear();
    frame_cache_.clear();
}

void BlockManager::restore(BlockList blocks, std::vector<ChainedIds> remembered, BoxHistory history) {
    clear();
    blocks_ = std::move(blocks);
    std::vector<BlockId> loaded;
    for (const auto& block : blocks_) {
        block->collect_ids(loaded);
    }
    for (BlockId id : loaded) {
        ids_.reserve_past(id);
    }
    remembered_.assign(std::move(remembered));
    history_ = std::move(history);
}

void BlockManager::mark_animation_used(BlockId id) {
    frame_cache_.mark_used(id);
}

void BlockManager::purge_animation_frames(BlockId id) {
    if (Block* block = find_recursive(id)) {
        block->truncate_to_first_frame();
    }
}

std::size_t BlockManager::chained_count() const {
    return static_cast<std::size_t>(std::count_if(blocks_.begin(), blocks_.end(), [](const auto& b) {
        return b->chained;
    }));
}

ChainedIds BlockManager::chained_ids() const {
    ChainedIds ids;
    for (const auto& block : blocks_) {
        if (block->chained) {
            ids.insert(block->id());
        }
    }
    return ids;
}

std::vector<std::size_t> BlockManager::chained_indices() const {
    std::vector<std::size_t> indices;
    for (std::size_t i = 0; i < blocks_.size(); ++i) {
        if (blocks_[i]->chained) {
            indices.push_back(i);
        }
    }
    return indices;
}

void BlockManager::clear_chain_group() {
    const ChainedIds chained = chained_ids();
    if (remembered_.remember(chained)) {
        kLog.debug("Remembered chain of " + std::to_string(chained.size()) + " block(s).");
    }
    for (auto& block : blocks_) {
        block->chained = false;
    }
}

void BlockManager::toggle_chain(BlockId id) {
    Block* block = find(id);
    if (!block) {
        return;
    }
    if (block->chained) {
        block->chained = false;
        return;
    }
    if (auto chain = remembered_.find_containing(id)) {
        for (auto& member : blocks_) {
            if (chain->count(member->id()) > 0) {
                member->chained = true;
            }
        }
    }
    block->chained = true;
}

void BlockManager::enforce_chain_constraints() {
    if (blocks_.empty()) {
        clear_chain_group();
    }
}

std::optional<BlockId> BlockManager::box_chained() {
    std::vector<std::size_t> indices = chained_indices();
    if (indices.empty()) {
        return std::nullopt;
    }
    std::sort(indices.rbegin(), indices.rend());

    SDL_FPoint min_pos{std::numeric_limits<float>::max(), std::numeric_limits<float>::max()};
    BlockList absorbed;
    for (std::size_t idx : indices) {
        std::unique_ptr<Block> block = take_at(idx);
        min_pos.x = std::min(min_pos.x, block->pos.position.x);
        min_pos.y = std::min(min_pos.y, block->pos.position.y);
        absorbed.push_back(std::move(block));
    }
    std::reverse(absorbed.begin(), absorbed.end());

    // A chained group is dissolved into the new group so nesting stays at two levels.
    // Children stay in the frame cache; eviction reaches them through find_recursive.
    BlockList children;
    std::vector<BlockId> gone;
    for (auto& block : absorbed) {
        if (block->is_group()) {
            gone.push_back(block->id());
            remembered_.prune_member(block->id());
            for (auto& child : block->release_children()) {
                children.push_back(std::move(child));
            }
        } else {
            children.push_back(std::move(block));
        }
    }
    discard(gone);

    std::unique_ptr<Block> group = Block::make_group(allocate_id(), std::move(children));
    group->pos.position = min_pos;
    const BlockId group_id = group->id();
    kLog.info("Boxed " + std::to_string(group->child_count()) + " block(s) into group " + group_id.to_string() + ".");
    blocks_.insert(blocks_.begin(), std::move(group));
    return group_id;
}

std::vector<BlockId> BlockManager::unbox_group(BlockId group_id) {
    std::vector<BlockId> unboxed;
    auto idx = index_of(group_id);
    if (!idx || !blocks_[*idx]->is_group()) {
        return unboxed;
    }
    std::unique_ptr<Block> group = take_at(*idx);
    BlockList children = group->release_children();

    const std::size_t insert_at = layout::group_boundary(blocks_);
    for (std::size_t i = 0; i < children.size(); ++i) {
        children[i]->chained = false;
        unboxed.push_back(children[i]->id());
        blocks_.insert(blocks_.begin() + static_cast<std::ptrdiff_t>(insert_at + i), std::move(children[i]));
    }
    remembered_.prune_member(group_id);
    discard({group_id});
    for (BlockId id : unboxed) {
        const Block* child = find(id);
        if (child && child->is_full_sequence && child->anim.frames.size() > 1) {
            frame_cache_.mark_used(id);
        }
    }
    kLog.info("Unboxed group " + group_id.to_string() + " (" + std::to_string(unboxed.size()) + " block(s)).");
    return unboxed;
}

bool BlockManager::drop_into_group(BlockId block_id, BlockId group_id) {
    const Block* block = find(block_id);
    const Block* group = find(group_id);
    if (!block || !group || !group->is_group() || block->is_group() || block_id == group_id) {
        return false;
    }

    std::vector<BlockId> moving;
    if (block->chained) {
        for (const auto& candidate : blocks_) {
            if (candidate->chained && !candidate->is_group() && candidate->id() != group_id) {
                moving.push_back(candidate->id());
            }
        }
    } else {
        moving.push_back(block_id);
    }
    for (BlockId id : moving) {
        move_single_into_group(id, group_id);
    }
    return !moving.empty();
}

void BlockManager::move_single_into_group(BlockId block_id, BlockId group_id) {
    auto block_idx = index_of(block_id);
    if (!block_idx) {
        return;
    }
    std::unique_ptr<Block> block = take_at(*block_idx);
    Block* group = find(group_id);
    if (!group) {
        blocks_.insert(blocks_.begin() + static_cast<std::ptrdiff_t>(*block_idx), std::move(block));
        return;
    }
    group->adopt_child(std::move(block));
}

const Block* BlockManager::find_group_at(SDL_FPoint world, BlockId exclude) const {
    for (const auto& block : blocks_) {
        if (block->id() != exclude && block->is_group() && block->contains(world)) {
            return block.get();
        }
    }
    return nullptr;
}

bool BlockManager::try_rebox_last_unboxed() {
    if (history_.last_unboxed_ids.empty()) {
        return false;
    }
    bool found_any = false;
    for (auto& block : blocks_) {
        const auto& wanted = history_.last_unboxed_ids;
        if (std::find(wanted.begin(), wanted.end(), block->id()) != wanted.end()) {
            block->chained = true;
            found_any = true;
        }
    }
    if (!found_any) {
        return false;
    }
    history_.last_boxed_id = box_chained();
    history_.last_unboxed_ids.clear();
    return true;
}

bool BlockManager::try_unbox_last_boxed() {
    if (!history_.last_boxed_id) {
        return false;
    }
    const BlockId last = *history_.last_boxed_id;
    const Block* group = find(last);
    if (!group || !group->is_group()) {
        return false;
    }
    history_.last_unboxed_ids = unbox_group(last);
    history_.last_boxed_id.reset();
    return true;
}

bool BlockManager::unbox_single_chained_group() {
    std::optional<BlockId> only;
    std::size_t count = 0;
    for (const auto& block : blocks_) {
        if (block->chained && block->is_group()) {
            only = block->id();
            ++count;
        }
    }
    if (count != 1) {
        return false;
    }
    history_.last_unboxed_ids = unbox_group(*only);
    history_.last_boxed_id.reset();
    return true;
}

bool BlockManager::toggle_compact_group() {
    if (chained_count() == 0) {
        return try_rebox_last_unboxed() || try_unbox_last_boxed();
    }
    if (unbox_single_chained_group()) {
        return true;
    }
    history_.last_boxed_id = box_chained();
    history_.last_unboxed_ids.clear();
    return true;
}

float BlockManager::max_block_height() const {
    float tallest = 0.0f;
    for (const auto& block : blocks_) {
        if (!block->is_group()) {
            tallest = std::max(tallest, block->preferred_image_size.y);
        }
    }
    return tallest;
}

layout::ReflowResult BlockManager::reflow(float inner_width) {
    return layout::reflow(blocks_, inner_width);
}

layout::ReflowResult BlockManager::reorder_and_reflow(std::optional<BlockId> leader_id, float inner_width) {
    if (!leader_id) {
        layout::sort_by_layout(blocks_);
        return reflow(inner_width);
    }

    const Block* leader = find(*leader_id);
    if (!leader) {
        return layout::ReflowResult{};
    }
    const bool leader_chained = leader->chained;
    const bool leader_is_group = leader->is_group();
    const SDL_FPoint leader_pos = leader->pos.position;

    BlockList moved;
    BlockList remaining;
    for (auto& block : blocks_) {
        const bool is_moved = leader_chained ? block->chained : block->id() == *leader_id;
        (is_moved ? moved : remaining).push_back(std::move(block));
    }
    blocks_.clear();

    layout::sort_by_layout(remaining);
    const std::size_t insert_at = layout::find_insert_index(remaining, leader_pos, leader_is_group);

    blocks_ = std::move(remaining);
    blocks_.insert(blocks_.begin() + static_cast<std::ptrdiff_t>(insert_at),
                   std::make_move_iterator(moved.begin()),
                   std::make_move_iterator(moved.end()));
    return reflow(inner_width);
}

void BlockManager::reset_all_counters() {
    for (auto& block : blocks_) {
        block->reset_counters_recursive();
    }
}

bool BlockManager::any_dragging() const {
    return std::any_of(blocks_.begin(), blocks_.end(), [](const auto& b) { return b->pos.is_dragging; });
}

}
