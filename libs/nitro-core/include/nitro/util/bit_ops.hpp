#pragma once

#include "inline.hpp"

#include <climits>
#include <concepts>
#include <cstddef>
#include <type_traits>

namespace bit {

// Tests if a bit is set.
template <std::size_t pos, std::integral T>
[[nodiscard]] FORCE_INLINE constexpr bool test(T value) {
    static_assert(pos < sizeof(T) * CHAR_BIT, "pos out of range");
    return (value >> pos) & 1;
}

// Extracts a range of bits from the value.
// start and end are both inclusive.
template <std::size_t start, std::size_t end = start, std::integral T>
[[nodiscard]] FORCE_INLINE constexpr T extract(T value) {
    static_assert(start < sizeof(T) * CHAR_BIT, "start out of range");
    static_assert(end < sizeof(T) * CHAR_BIT, "end out of range");
    static_assert(end >= start, "end cannot be before start");

    using UT = std::make_unsigned_t<T>;

    constexpr std::size_t length = end - start;
    constexpr UT mask = static_cast<UT>(~(~0ull << length << 1));
    return static_cast<T>((value >> start) & mask);
}

// Deposits a range of bits into the value and returns the modified value.
// Bits of the value outside the range are discarded.
// start and end are both inclusive.
template <std::size_t start, std::size_t end = start, std::integral T, std::integral TV = T>
[[nodiscard]] FORCE_INLINE constexpr T deposit(T base, TV value) {
    static_assert(start < sizeof(T) * CHAR_BIT, "start out of range");
    static_assert(end < sizeof(T) * CHAR_BIT, "end out of range");
    static_assert(end >= start, "end cannot be before start");

    using UT = std::make_unsigned_t<T>;

    constexpr std::size_t length = end - start;
    constexpr UT mask = static_cast<UT>(~(~0ull << length << 1));
    UT result = static_cast<UT>(base);
    result &= static_cast<UT>(~(mask << start));
    result |= static_cast<UT>((static_cast<UT>(value) & mask) << start);
    return static_cast<T>(result);
}

// Deposits a range of bits into the destination value.
// start and end are both inclusive.
template <std::size_t start, std::size_t end = start, std::integral T, std::integral TV = T>
FORCE_INLINE constexpr void deposit_into(T &dest, TV value) {
    dest = deposit<start, end>(dest, value);
}

} // namespace bit
