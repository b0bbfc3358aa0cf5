#pragma once

// SPDX-License-Identifier: Apache-2.0
//
// Eight unsigned 8-bit lanes packed into one 64-bit word. Every operation runs
// on the whole word with ordinary scalar instructions; the lane constants in
// detail/LaneConstants.hpp keep carries and borrows inside their own lane.
//
// Lane i is the byte at offset i of the word's object representation, so the
// lane order follows memory order on every target while the numeric position
// of a lane inside the word depends on the native byte order.

#include <array>
#include <bit>
#include <cassert>
#include <type_traits>

#include "OCTA/Defines.hpp"
#include "OCTA/Exceptions/OutOfRangeException.hpp"
#include "OCTA/Primitives.hpp"
#include "OCTA/SWAR/Forward.hpp"
#include "OCTA/SWAR/Mask8x8.hpp"
#include "OCTA/SWAR/detail/LaneConstants.hpp"

namespace OCTA::SWAR
{
    class OCTA_MAY_ALIAS U8x8
    {
    public:
        static constexpr int lanes = laneCount;

        using value_type = UInt8;
        using array_type = std::array<UInt8, lanes>;
        using mask_type  = Mask8x8;

        /// @brief All eight lanes zero.
        static const U8x8 Zeroes;

        constexpr U8x8() noexcept = default;

        [[nodiscard]] static constexpr auto FromArray(const array_type& values) noexcept -> U8x8
        {
            return U8x8(std::bit_cast<UInt64>(values));
        }

        /// @brief Reinterprets a native-order word as eight lanes.
        [[nodiscard]] static constexpr auto FromRaw(UInt64 word) noexcept -> U8x8
        {
            return U8x8(word);
        }

        /// @brief Broadcasts @p value into every lane.
        [[nodiscard]] static constexpr auto Splat(UInt8 value) noexcept -> U8x8
        {
            return U8x8(static_cast<UInt64>(value) * detail::kLaneOnes);
        }

        [[nodiscard]] constexpr auto ToArray() const noexcept -> array_type
        {
            return std::bit_cast<array_type>(m_word);
        }

        [[nodiscard]] constexpr auto Raw() const noexcept -> UInt64
        {
            return m_word;
        }

        /// @brief Iterates the lanes in lane order, lane 0 first.
        ///
        /// The range reads this object's bytes in place, so it is invalidated
        /// with the vector and observes later writes to it.
        [[nodiscard]] auto begin() const noexcept -> const UInt8*
        {
            return reinterpret_cast<const UInt8*>(&m_word);
        }

        [[nodiscard]] auto end() const noexcept -> const UInt8*
        {
            return begin() + lanes;
        }

        [[nodiscard]] constexpr auto GetLane(int index) const noexcept -> UInt8
        {
#if OCTA_SWAR_ENABLE_LANE_CHECKS
            assert(index >= 0 && index < lanes && "U8x8 lane index out of range.");
#endif
            return static_cast<UInt8>(detail::ToLittleEndian(m_word) >> (index * laneBits));
        }

        /// @brief Bounds-checked lane access.
        /// @throws Exceptions::OutOfRangeException if @p index is not in [0, 8).
        [[nodiscard]] constexpr auto At(int index) const -> UInt8
        {
            if (index < 0 || index >= lanes)
            {
                throw Exceptions::OutOfRangeException("U8x8 lane index out of range.");
            }
            return GetLane(index);
        }

        // Bitwise ------------------------------------------------------------------
        // Bitwise operations never move bits between positions and therefore
        // never cross a lane boundary.

        [[nodiscard]] constexpr auto Complement() const noexcept -> U8x8
        {
            return U8x8(~m_word);
        }

        [[nodiscard]] constexpr auto BitAnd(U8x8 other) const noexcept -> U8x8
        {
            return U8x8(m_word & other.m_word);
        }

        [[nodiscard]] constexpr auto BitOr(U8x8 other) const noexcept -> U8x8
        {
            return U8x8(m_word | other.m_word);
        }

        [[nodiscard]] constexpr auto BitXor(U8x8 other) const noexcept -> U8x8
        {
            return U8x8(m_word ^ other.m_word);
        }

        // Arithmetic ---------------------------------------------------------------

        /// @brief Lane-wise addition modulo 256.
        ///
        /// The low seven bits of both operands are summed with the high bits
        /// cleared, so each lane's carry stops in its own bit 7. That bit then
        /// holds the carry out of the low seven bits; XOR with a7 ^ b7 gives the
        /// true top bit of the 8-bit sum.
        [[nodiscard]] constexpr auto WrappingAdd(U8x8 other) const noexcept -> U8x8
        {
            const UInt64 low = (m_word & detail::kLowBits) + (other.m_word & detail::kLowBits);
            return U8x8(low ^ ((m_word ^ other.m_word) & detail::kHighBits));
        }

        /// @brief Lane-wise addition clamped to 255.
        [[nodiscard]] constexpr auto SaturatingAdd(U8x8 other) const noexcept -> U8x8
        {
            const UInt64 sum   = WrappingAdd(other).m_word;
            const UInt64 carry = detail::CarryBits(m_word, other.m_word, sum);
            return U8x8(sum | detail::BroadcastHighBits(carry));
        }

        /// @brief Lane-wise subtraction modulo 256.
        ///
        /// Setting bit 7 of the minuend and clearing it in the subtrahend gives
        /// every lane a bit to borrow from, so no borrow reaches the next lane.
        /// The top bit is then corrected with a7 ^ ~b7.
        [[nodiscard]] constexpr auto WrappingSub(U8x8 other) const noexcept -> U8x8
        {
            const UInt64 low = (m_word | detail::kHighBits) - (other.m_word & detail::kLowBits);
            return U8x8(low ^ ((m_word ^ ~other.m_word) & detail::kHighBits));
        }

        /// @brief Lane-wise subtraction clamped to 0.
        [[nodiscard]] constexpr auto SaturatingSub(U8x8 other) const noexcept -> U8x8
        {
            const UInt64 diff   = WrappingSub(other).m_word;
            const UInt64 borrow = detail::BorrowBits(m_word, other.m_word, diff);
            return U8x8(diff & ~detail::BroadcastHighBits(borrow));
        }

        /// @brief Lane-wise |a - b|.
        [[nodiscard]] constexpr auto AbsDifference(U8x8 other) const noexcept -> U8x8
        {
            const UInt64 selector = LessThanSelector(other);
            const UInt64 larger   = (m_word & ~selector) | (other.m_word & selector);
            const UInt64 smaller  = (m_word & selector) | (other.m_word & ~selector);
            return U8x8(larger).WrappingSub(U8x8(smaller));
        }

        [[nodiscard]] constexpr auto Max(U8x8 other) const noexcept -> U8x8
        {
            const UInt64 selector = LessThanSelector(other);
            return U8x8((m_word & ~selector) | (other.m_word & selector));
        }

        [[nodiscard]] constexpr auto Min(U8x8 other) const noexcept -> U8x8
        {
            const UInt64 selector = LessThanSelector(other);
            return U8x8((m_word & selector) | (other.m_word & ~selector));
        }

        /// @brief Lane-wise floor((a + b) / 2), computed without overflow as
        /// (a & b) + ((a ^ b) >> 1).
        [[nodiscard]] constexpr auto Mean(U8x8 other) const noexcept -> U8x8
        {
            const UInt64 shared = m_word & other.m_word;
            const UInt64 diff   = (m_word ^ other.m_word) & detail::kShiftSafeBits;
            return U8x8(shared + (diff >> 1));
        }

        /// @brief Number of set bits in each lane.
        [[nodiscard]] constexpr auto Popcount() const noexcept -> U8x8
        {
            const UInt64 pairs   = m_word - ((m_word >> 1) & 0x5555555555555555ULL);
            const UInt64 nibbles = (pairs & 0x3333333333333333ULL) + ((pairs >> 2) & 0x3333333333333333ULL);
            return U8x8((nibbles + (nibbles >> 4)) & 0x0f0f0f0f0f0f0f0fULL);
        }

        /// @brief Sum of all eight lanes, in [0, 2040].
        [[nodiscard]] constexpr auto ReduceSum() const noexcept -> UInt32
        {
            constexpr UInt64 kEvenBytes = 0x00ff00ff00ff00ffULL;
            const UInt64     halves     = (m_word & kEvenBytes) + ((m_word >> 8) & kEvenBytes);
            return static_cast<UInt32>((halves * 0x0001000100010001ULL) >> 48);
        }

        // Comparisons --------------------------------------------------------------

        /// @brief Lanes where both vectors hold the same value.
        ///
        /// Adding 0x7f to the low seven bits of a ^ b sets bit 7 exactly when
        /// those bits are non-zero; OR-ing a ^ b back covers its own bit 7.
        [[nodiscard]] constexpr auto Equals(U8x8 other) const noexcept -> Mask8x8
        {
            const UInt64 diff    = m_word ^ other.m_word;
            const UInt64 nonZero = ((diff & detail::kLowBits) + detail::kLowBits) | diff;
            return Mask8x8((~nonZero & detail::kHighBits) >> 7);
        }

        /// @brief Lanes where this vector is strictly less than @p other.
        [[nodiscard]] constexpr auto LessThan(U8x8 other) const noexcept -> Mask8x8
        {
            const UInt64 diff      = (m_word | detail::kHighBits) - (other.m_word & detail::kLowBits);
            const UInt64 sameTop   = ~(m_word ^ other.m_word);
            const UInt64 notBelow  = ((m_word & ~sameTop) | (diff & sameTop)) & detail::kHighBits;
            return Mask8x8((notBelow ^ detail::kHighBits) >> 7);
        }

        /// @brief Lanes where this vector is strictly greater than @p other.
        [[nodiscard]] constexpr auto GreaterThan(U8x8 other) const noexcept -> Mask8x8
        {
            return other.LessThan(*this);
        }

        constexpr auto operator&=(U8x8 other) noexcept -> U8x8&
        {
            m_word &= other.m_word;
            return *this;
        }

        constexpr auto operator|=(U8x8 other) noexcept -> U8x8&
        {
            m_word |= other.m_word;
            return *this;
        }

        constexpr auto operator^=(U8x8 other) noexcept -> U8x8&
        {
            m_word ^= other.m_word;
            return *this;
        }

        constexpr auto operator+=(U8x8 other) noexcept -> U8x8&
        {
            *this = WrappingAdd(other);
            return *this;
        }

        constexpr auto operator-=(U8x8 other) noexcept -> U8x8&
        {
            *this = WrappingSub(other);
            return *this;
        }

        /// @brief Value equality of all eight lanes. Use Equals for a lane mask.
        [[nodiscard]] friend constexpr bool operator==(const U8x8&, const U8x8&) noexcept = default;

    private:
        constexpr explicit U8x8(UInt64 word) noexcept
            : m_word(word)
        {}

        /// 0xff in every lane where this < other, 0x00 elsewhere.
        [[nodiscard]] constexpr auto LessThanSelector(U8x8 other) const noexcept -> UInt64
        {
            const UInt64 diff = WrappingSub(other).m_word;
            return detail::BroadcastHighBits(detail::BorrowBits(m_word, other.m_word, diff));
        }

        UInt64 m_word {0};
    };

    inline constexpr U8x8 U8x8::Zeroes {};

    static_assert(sizeof(U8x8) == sizeof(UInt64));
    static_assert(alignof(U8x8) == alignof(UInt64));
    static_assert(std::is_trivially_copyable_v<U8x8>);
    static_assert(std::is_standard_layout_v<U8x8>);

    [[nodiscard]] constexpr auto operator~(U8x8 value) noexcept -> U8x8
    {
        return value.Complement();
    }

    [[nodiscard]] constexpr auto operator&(U8x8 lhs, U8x8 rhs) noexcept -> U8x8
    {
        return lhs.BitAnd(rhs);
    }

    [[nodiscard]] constexpr auto operator|(U8x8 lhs, U8x8 rhs) noexcept -> U8x8
    {
        return lhs.BitOr(rhs);
    }

    [[nodiscard]] constexpr auto operator^(U8x8 lhs, U8x8 rhs) noexcept -> U8x8
    {
        return lhs.BitXor(rhs);
    }

    /// @brief Wrapping lane-wise addition.
    [[nodiscard]] constexpr auto operator+(U8x8 lhs, U8x8 rhs) noexcept -> U8x8
    {
        return lhs.WrappingAdd(rhs);
    }

    /// @brief Wrapping lane-wise subtraction.
    [[nodiscard]] constexpr auto operator-(U8x8 lhs, U8x8 rhs) noexcept -> U8x8
    {
        return lhs.WrappingSub(rhs);
    }

    // Mask8x8 lane views ----------------------------------------------------------

    constexpr auto Mask8x8::ToU8x8() const noexcept -> U8x8
    {
        return U8x8::FromRaw(m_word);
    }

    constexpr auto Mask8x8::ToU8x8With(UInt8 value) const noexcept -> U8x8
    {
        // Each lane is 0 or 1, so the product stays inside its lane.
        return U8x8::FromRaw(m_word * value);
    }

    constexpr auto Mask8x8::Select(UInt8 trueValue, UInt8 falseValue) const noexcept -> U8x8
    {
        const UInt64 selector = m_word * 0xffULL;
        const UInt64 ifTrue   = U8x8::Splat(trueValue).Raw();
        const UInt64 ifFalse  = U8x8::Splat(falseValue).Raw();
        return U8x8::FromRaw((ifTrue & selector) | (ifFalse & ~selector));
    }
}// namespace OCTA::SWAR
