#pragma once

#include <arrayx/fwd.hh>

#include <bit>
#include <type_traits>

// =========================================================================================================
// Bit manipulation functions
// =========================================================================================================
//
// Population count:
//   popcount(value)                 - count number of 1 bits in unsigned integer
//
// Single bits:
//   has_bit(mask, i)                - true if bit i of mask is set
//
// Byte shifts:
//   shift_byte_left(b, s)           - (b << s) truncated to 8 bits
//   shift_byte_right(b, s)          - b >> s
//

namespace ax
{
// =========================================================================================================
// Population count
// =========================================================================================================

/// Counts the number of 1 bits in an unsigned integer
/// Usage:
///   int count = ax::popcount(u8(0b1011));  // 3
using std::popcount;

// =========================================================================================================
// Single bits
// =========================================================================================================

/// Usage:
///   ax::has_bit(0b0101u, 2)  // true
///   ax::has_bit(0b0101u, 1)  // false
template <class T>
[[nodiscard]] constexpr bool has_bit(T mask, int i) noexcept
{
    static_assert(std::is_unsigned_v<T>, "has_bit requires an unsigned mask");
    return ((mask >> i) & T(1)) != 0;
}

// =========================================================================================================
// Byte shifts
// =========================================================================================================

/// Bits shifted past bit 7 are dropped, zeros come in from the right
/// Usage:
///   ax::shift_byte_left(0x81, 1)  // 0x02
[[nodiscard]] constexpr u8 shift_byte_left(u8 b, int s) noexcept
{
    return u8((unsigned(b) << s) & 0xFFu);
}

/// Zeros come in from the left
[[nodiscard]] constexpr u8 shift_byte_right(u8 b, int s) noexcept
{
    return u8(unsigned(b) >> s);
}

} // namespace ax
