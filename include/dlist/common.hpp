#ifndef DLIST_COMMON_HPP
#define DLIST_COMMON_HPP

#include <cstddef>
#include <cstdint>

namespace dlist {

using SlotIndex = std::uint32_t;
using Generation = std::uint64_t;

// Sentinels live in the first two slots of every store and are never released.
inline constexpr SlotIndex HEAD_SLOT = 0;
inline constexpr SlotIndex TAIL_SLOT = 1;
inline constexpr SlotIndex NO_SLOT = static_cast<SlotIndex>(-1);

[[nodiscard]] constexpr bool is_sentinel(SlotIndex index) noexcept {
    return index == HEAD_SLOT || index == TAIL_SLOT;
}

// Construction-time knobs of a List.
struct ListConfig {
    std::size_t initial_capacity{0}; // value slots reserved up front, rounded up to a power of two
    bool log_errors{false};          // log every rejected operation before throwing
};

} // namespace dlist

#endif // DLIST_COMMON_HPP
