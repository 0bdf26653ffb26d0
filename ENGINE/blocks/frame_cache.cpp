#include "blocks/frame_cache.hpp"

#include <algorithm>
#include <utility>

#include "utils/log.hpp"

namespace mablocks {

namespace {

const log::Channel kLog{"FrameCache"};

}

FrameCachePolicy::FrameCachePolicy(std::size_t capacity)
    : capacity_(std::max<std::size_t>(capacity, 1)) {}

void FrameCachePolicy::set_evict_callback(EvictCallback callback) {
    on_evict_ = std::move(callback);
}

void FrameCachePolicy::set_capacity(std::size_t capacity) {
    capacity_ = std::max<std::size_t>(capacity, 1);
    while (order_.size() > capacity_) {
        evict_over_capacity();
    }
}

std::optional<BlockId> FrameCachePolicy::mark_used(BlockId id) {
    order_.remove(id);
    order_.push_back(id);
    if (order_.size() <= capacity_) {
        return std::nullopt;
    }
    return evict_over_capacity();
}

std::optional<BlockId> FrameCachePolicy::evict_over_capacity() {
    if (order_.empty()) {
        return std::nullopt;
    }
    const BlockId victim = order_.front();
    order_.pop_front();
    kLog.debug("Evicting frames of block " + victim.to_string());
    if (on_evict_) {
        on_evict_(victim);
    }
    return victim;
}

void FrameCachePolicy::forget(BlockId id) {
    order_.remove(id);
}

void FrameCachePolicy::forget(const std::vector<BlockId>& ids) {
    order_.remove_if([&](BlockId id) {
        return std::find(ids.begin(), ids.end(), id) != ids.end();
    });
}

void FrameCachePolicy::clear() {
    order_.clear();
}

bool FrameCachePolicy::contains(BlockId id) const {
    return std::find(order_.begin(), order_.end(), id) != order_.end();
}

std::vector<BlockId> FrameCachePolicy::order() const {
    return std::vector<BlockId>(order_.begin(), order_.end());
}

}
