#include "blocks/chain_registry.hpp"

#include <algorithm>
#include <utility>

namespace mablocks {

bool intersects(const ChainedIds& a, const ChainedIds& b) {
    const ChainedIds& small = a.size() <= b.size() ? a : b;
    const ChainedIds& large = a.size() <= b.size() ? b : a;
    return std::any_of(small.begin(), small.end(), [&](BlockId id) { return large.count(id) > 0; });
}

bool RememberedChains::remember(const ChainedIds& chain) {
    if (chain.size() < 2) {
        return false;
    }
    forget_members(chain);
    chains_.push_back(chain);
    return true;
}

std::optional<ChainedIds> RememberedChains::find_containing(BlockId id) const {
    auto it = std::find_if(chains_.begin(), chains_.end(), [&](const ChainedIds& chain) {
        return chain.count(id) > 0;
    });
    if (it == chains_.end()) {
        return std::nullopt;
    }
    return *it;
}

void RememberedChains::forget_members(const ChainedIds& removed) {
    chains_.erase(std::remove_if(chains_.begin(), chains_.end(), [&](const ChainedIds& chain) {
                      return intersects(chain, removed);
                  }),
                  chains_.end());
}

void RememberedChains::prune_member(BlockId id) {
    for (auto& chain : chains_) {
        chain.erase(id);
    }
    chains_.erase(std::remove_if(chains_.begin(), chains_.end(), [](const ChainedIds& chain) {
                      return chain.size() < 2;
                  }),
                  chains_.end());
}

void RememberedChains::assign(std::vector<ChainedIds> chains) {
    chains_.clear();
    for (auto& chain : chains) {
        remember(chain);
    }
}

}
