#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <vector>

#include <SDL.h>

#include "blocks/block.hpp"
#include "blocks/block_id.hpp"
#include "blocks/chain_registry.hpp"
#include "blocks/frame_cache.hpp"
#include "core/constants.hpp"
#include "layout/reflow.hpp"

namespace mablocks {

// Owns the top-level block collection and every structural operation on it:
// lookup, removal, chaining, boxing/unboxing, the frame cache and layout.
// Every lookup by id tolerates ids that no longer exist.
class BlockManager {
public:
    explicit BlockManager(std::size_t max_cached_animations = kMaxCachedAnimations);

    BlockManager(const BlockManager&) = delete;
    BlockManager& operator=(const BlockManager&) = delete;

    const BlockList& blocks() const { return blocks_; }
    BlockList& blocks() { return blocks_; }
    std::size_t size() const { return blocks_.size(); }
    bool empty() const { return blocks_.empty(); }

    BlockId allocate_id() { return ids_.allocate(); }
    IdAllocator& ids() { return ids_; }

    std::optional<std::size_t> index_of(BlockId id) const;
    Block* find(BlockId id);
    const Block* find(BlockId id) const;
    Block* find_recursive(BlockId id);
    const Block* find_recursive(BlockId id) const;

    Block& push(std::unique_ptr<Block> block);
    Block& insert(std::size_t index, std::unique_ptr<Block> block);
    std::vector<BlockId> remove_with_children(BlockId id);
    std::vector<BlockId> remove_cascade(BlockId id);
    void clear();
    void restore(BlockList blocks, std::vector<ChainedIds> remembered, BoxHistory history);

    FrameCachePolicy& frame_cache() { return frame_cache_; }
    const FrameCachePolicy& frame_cache() const { return frame_cache_; }
    void mark_animation_used(BlockId id);

    std::size_t chained_count() const;
    ChainedIds chained_ids() const;
    std::vector<std::size_t> chained_indices() const;
    const RememberedChains& remembered_chains() const { return remembered_; }
    void clear_chain_group();
    void toggle_chain(BlockId id);
    void enforce_chain_constraints();

    std::optional<BlockId> box_chained();
    std::vector<BlockId> unbox_group(BlockId group_id);
    bool drop_into_group(BlockId block_id, BlockId group_id);
    const Block* find_group_at(SDL_FPoint world, BlockId exclude) const;
    const BoxHistory& box_history() const { return history_; }
    bool toggle_compact_group();

    float max_block_height() const;
    layout::ReflowResult reflow(float inner_width);
    layout::ReflowResult reorder_and_reflow(std::optional<BlockId> leader_id, float inner_width);

    void reset_all_counters();
    bool any_dragging() const;

private:
    std::unique_ptr<Block> take_at(std::size_t index);
    void discard(const std::vector<BlockId>& removed_ids);
    void move_single_into_group(BlockId block_id, BlockId group_id);
    bool try_rebox_last_unboxed();
    bool try_unbox_last_boxed();
    bool unbox_single_chained_group();
    void purge_animation_frames(BlockId id);

    BlockList blocks_;
    IdAllocator ids_;
    RememberedChains remembered_;
    FrameCachePolicy frame_cache_;
    BoxHistory history_;
};

}
