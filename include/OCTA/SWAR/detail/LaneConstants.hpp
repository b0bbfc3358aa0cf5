#pragma once

// SPDX-License-Identifier: Apache-2.0
//
// Word-level constants and helpers shared by the byte-lane types. Each constant
// repeats one byte pattern across all eight lanes; together they mark the lane
// boundaries that keep whole-word arithmetic from carrying between lanes.

#include <bit>

#include "OCTA/Primitives.hpp"

namespace OCTA::SWAR::detail
{
    /// @brief Every lane set to 0x01.
    inline constexpr UInt64 kLaneOnes = 0x0101010101010101ULL;

    /// @brief Every lane set to 0x7f: the low seven bits of each lane.
    ///
    /// Masking both operands with this leaves a spare bit per lane, so a sum of
    /// the low bits cannot carry into the next lane.
    inline constexpr UInt64 kLowBits = 0x7f7f7f7f7f7f7f7fULL;

    /// @brief Every lane set to 0x80: only the most significant bit of each lane.
    inline constexpr UInt64 kHighBits = 0x8080808080808080ULL;

    /// @brief Every lane set to 0xfe. Clears the bit that a right shift by one
    /// would move into the neighbouring lane.
    inline constexpr UInt64 kShiftSafeBits = 0xfefefefefefefefeULL;

    static_assert(kLowBits == ~kHighBits);
    static_assert(kLaneOnes * 0x7f == kLowBits);

    /// @brief Expands each lane's bit 7 into a whole 0x00 or 0xff lane.
    /// @param highBits A word with no bits set outside kHighBits.
    [[nodiscard]] constexpr auto BroadcastHighBits(UInt64 highBits) noexcept -> UInt64
    {
        return (highBits >> 7) * 0xffULL;
    }

    /// @brief Converts between native and little-endian byte order. The
    /// conversion is its own inverse.
    [[nodiscard]] constexpr auto ToLittleEndian(UInt64 word) noexcept -> UInt64
    {
        if constexpr (std::endian::native == std::endian::little)
        {
            return word;
        }
        else
        {
            return std::byteswap(word);
        }
    }

    /// @brief Converts between native and big-endian byte order. The
    /// conversion is its own inverse.
    [[nodiscard]] constexpr auto ToBigEndian(UInt64 word) noexcept -> UInt64
    {
        if constexpr (std::endian::native == std::endian::big)
        {
            return word;
        }
        else
        {
            return std::byteswap(word);
        }
    }

    static_assert(std::endian::native == std::endian::little || std::endian::native == std::endian::big,
                  "Byte-lane types require a little- or big-endian target.");

    /// @brief Per-lane borrow out of bit 7 when computing lhs - rhs lane by lane.
    /// @param lhs Minuend word.
    /// @param rhs Subtrahend word.
    /// @param difference The lane-wise wrapping difference lhs - rhs.
    /// @return kHighBits restricted to the lanes where lhs < rhs.
    [[nodiscard]] constexpr auto BorrowBits(UInt64 lhs, UInt64 rhs, UInt64 difference) noexcept -> UInt64
    {
        return ((~lhs & rhs) | ((~lhs | rhs) & difference)) & kHighBits;
    }

    /// @brief Per-lane carry out of bit 7 when computing lhs + rhs lane by lane.
    [[nodiscard]] constexpr auto CarryBits(UInt64 lhs, UInt64 rhs, UInt64 sum) noexcept -> UInt64
    {
        return ((lhs & rhs) | ((lhs | rhs) & ~sum)) & kHighBits;
    }
}// namespace OCTA::SWAR::detail
