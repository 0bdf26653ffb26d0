#pragma once

#include <cstddef>
#include <optional>
#include <set>
#include <vector>

#include "blocks/block_id.hpp"

namespace mablocks {

using ChainedIds = std::set<BlockId>;

// Disjoint sets of block ids that were chained together when the chain was
// cleared. Re-chaining any member brings back the whole set.
class RememberedChains {
public:
    bool remember(const ChainedIds& chain);
    std::optional<ChainedIds> find_containing(BlockId id) const;

    void forget_members(const ChainedIds& removed);
    void prune_member(BlockId id);
    void clear() { chains_.clear(); }

    void assign(std::vector<ChainedIds> chains);
    const std::vector<ChainedIds>& chains() const { return chains_; }
    std::size_t size() const { return chains_.size(); }
    bool empty() const { return chains_.empty(); }

private:
    std::vector<ChainedIds> chains_;
};

// Single slot used by the box/unbox toggle: which group was boxed last, or
// which children came out of the last unbox.
struct BoxHistory {
    std::optional<BlockId> last_boxed_id;
    std::vector<BlockId> last_unboxed_ids;

    void clear() {
        last_boxed_id.reset();
        last_unboxed_ids.clear();
    }
};

bool intersects(const ChainedIds& a, const ChainedIds& b);

}
