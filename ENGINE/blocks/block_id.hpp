#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

namespace mablocks {

struct BlockId {
    std::uint64_t value = 0;

    constexpr bool is_nil() const { return value == 0; }
    std::string to_string() const { return std::to_string(value); }

    friend constexpr bool operator==(BlockId a, BlockId b) { return a.value == b.value; }
    friend constexpr bool operator!=(BlockId a, BlockId b) { return a.value != b.value; }
    friend constexpr bool operator<(BlockId a, BlockId b) { return a.value < b.value; }
};

// Monotonic id source. Owned by the block manager and handed to anything that
// creates blocks; 0 is reserved for the nil id.
class IdAllocator {
public:
    BlockId allocate() { return BlockId{next_++}; }

    void reserve_past(BlockId id) {
        if (id.value >= next_) {
            next_ = id.value + 1;
        }
    }

    std::uint64_t peek() const { return next_; }

private:
    std::uint64_t next_ = 1;
};

}

namespace std {
template <>
struct hash<mablocks::BlockId> {
    std::size_t operator()(mablocks::BlockId id) const noexcept {
        return std::hash<std::uint64_t>{}(id.value);
    }
};
}
