#pragma once

#include <cstddef>
#include <functional>
#include <list>
#include <optional>
#include <vector>

#include "blocks/block_id.hpp"
#include "core/constants.hpp"

namespace mablocks {

// Bounds how many blocks keep a full decoded frame sequence. Access order is
// oldest first; pushing past capacity evicts the front entry and hands its id
// to the eviction callback, which is expected to drop the extra frames.
class FrameCachePolicy {
public:
    using EvictCallback = std::function<void(BlockId)>;

    explicit FrameCachePolicy(std::size_t capacity = kMaxCachedAnimations);

    void set_evict_callback(EvictCallback callback);
    void set_capacity(std::size_t capacity);
    std::size_t capacity() const { return capacity_; }

    std::optional<BlockId> mark_used(BlockId id);
    void forget(BlockId id);
    void forget(const std::vector<BlockId>& ids);
    void clear();

    bool contains(BlockId id) const;
    std::size_t size() const { return order_.size(); }
    std::vector<BlockId> order() const;

private:
    std::optional<BlockId> evict_over_capacity();

    std::size_t capacity_;
    std::list<BlockId> order_;
    EvictCallback on_evict_;
};

}
