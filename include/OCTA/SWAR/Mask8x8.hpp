#pragma once

// SPDX-License-Identifier: Apache-2.0
//
// Eight boolean lanes packed into one 64-bit word. Each lane byte holds 0x00
// (false) or 0x01 (true); no public operation produces any other byte value.

#include <array>
#include <bit>
#include <cassert>
#include <type_traits>

#include "OCTA/Defines.hpp"
#include "OCTA/Exceptions/OutOfRangeException.hpp"
#include "OCTA/Primitives.hpp"
#include "OCTA/SWAR/Forward.hpp"
#include "OCTA/SWAR/detail/LaneConstants.hpp"

namespace OCTA::SWAR
{
    class Mask8x8
    {
    public:
        static constexpr int lanes = laneCount;

        using value_type = bool;
        using array_type = std::array<bool, lanes>;

        /// @brief All eight lanes false.
        static const Mask8x8 AllFalse;
        /// @brief All eight lanes true.
        static const Mask8x8 AllTrue;

        /// @brief All lanes false. Other masks come from the named constructors
        /// or from U8x8 comparisons.
        constexpr Mask8x8() noexcept = default;

        /// @brief Builds a mask from eight booleans; element i becomes lane i.
        [[nodiscard]] static constexpr auto FromArray(const array_type& values) noexcept -> Mask8x8
        {
            std::array<UInt8, lanes> bytes {};
            for (std::size_t lane = 0; lane < bytes.size(); ++lane)
            {
                bytes[lane] = values[lane] ? UInt8 {1} : UInt8 {0};
            }
            return Mask8x8(std::bit_cast<UInt64>(bytes));
        }

        /// @brief Builds a mask from a bitmask whose least significant bit is lane 0.
        [[nodiscard]] static constexpr auto FromBitmaskLE(UInt8 bits) noexcept -> Mask8x8
        {
            return Mask8x8(detail::ToLittleEndian(SpreadBits(bits)));
        }

        /// @brief Builds a mask from a bitmask whose most significant bit is lane 0.
        [[nodiscard]] static constexpr auto FromBitmaskBE(UInt8 bits) noexcept -> Mask8x8
        {
            return Mask8x8(detail::ToBigEndian(SpreadBits(bits)));
        }

        [[nodiscard]] constexpr auto ToArray() const noexcept -> array_type
        {
            const auto bytes = std::bit_cast<std::array<UInt8, lanes>>(m_word);
            array_type values {};
            for (std::size_t lane = 0; lane < values.size(); ++lane)
            {
                values[lane] = bytes[lane] != 0;
            }
            return values;
        }

        /// @brief Packs the lanes into a bitmask with lane 0 in the least significant bit.
        [[nodiscard]] constexpr auto ToBitmaskLE() const noexcept -> UInt8
        {
            return GatherBits(detail::ToLittleEndian(m_word));
        }

        /// @brief Packs the lanes into a bitmask with lane 0 in the most significant bit.
        [[nodiscard]] constexpr auto ToBitmaskBE() const noexcept -> UInt8
        {
            return GatherBits(detail::ToBigEndian(m_word));
        }

        /// @brief Lane view with true lanes as 0x01 and false lanes as 0x00.
        [[nodiscard]] constexpr auto ToU8x8() const noexcept -> U8x8;

        /// @brief Lane view with true lanes as @p value and false lanes as 0x00.
        [[nodiscard]] constexpr auto ToU8x8With(UInt8 value) const noexcept -> U8x8;

        /// @brief Chooses @p trueValue for true lanes and @p falseValue for false lanes.
        [[nodiscard]] constexpr auto Select(UInt8 trueValue, UInt8 falseValue) const noexcept -> U8x8;

        [[nodiscard]] constexpr auto Not() const noexcept -> Mask8x8
        {
            return Mask8x8(m_word ^ detail::kLaneOnes);
        }

        [[nodiscard]] constexpr auto And(Mask8x8 other) const noexcept -> Mask8x8
        {
            return Mask8x8(m_word & other.m_word);
        }

        [[nodiscard]] constexpr auto Or(Mask8x8 other) const noexcept -> Mask8x8
        {
            return Mask8x8(m_word | other.m_word);
        }

        [[nodiscard]] constexpr auto Xor(Mask8x8 other) const noexcept -> Mask8x8
        {
            return Mask8x8(m_word ^ other.m_word);
        }

        /// @brief Number of true lanes, in [0, 8].
        [[nodiscard]] constexpr auto CountTrue() const noexcept -> UInt32
        {
            // Lane bytes are 0 or 1, so the running byte sums never carry.
            return static_cast<UInt32>((m_word * detail::kLaneOnes) >> 56);
        }

        /// @brief Number of false lanes, in [0, 8].
        [[nodiscard]] constexpr auto CountFalse() const noexcept -> UInt32
        {
            return static_cast<UInt32>(lanes - std::popcount(m_word));
        }

        [[nodiscard]] constexpr auto Any() const noexcept -> bool
        {
            return m_word != 0;
        }

        [[nodiscard]] constexpr auto All() const noexcept -> bool
        {
            return m_word == detail::kLaneOnes;
        }

        [[nodiscard]] constexpr auto None() const noexcept -> bool
        {
            return m_word == 0;
        }

        [[nodiscard]] constexpr auto GetLane(int index) const noexcept -> bool
        {
#if OCTA_SWAR_ENABLE_LANE_CHECKS
            assert(index >= 0 && index < lanes && "Mask8x8 lane index out of range.");
#endif
            return ((detail::ToLittleEndian(m_word) >> (index * laneBits)) & 1U) != 0;
        }

        /// @brief Bounds-checked lane access.
        /// @throws Exceptions::OutOfRangeException if @p index is not in [0, 8).
        [[nodiscard]] constexpr auto At(int index) const -> bool
        {
            if (index < 0 || index >= lanes)
            {
                throw Exceptions::OutOfRangeException("Mask8x8 lane index out of range.");
            }
            return GetLane(index);
        }

        /// @brief The packed word; every byte is 0x00 or 0x01.
        [[nodiscard]] constexpr auto Raw() const noexcept -> UInt64
        {
            return m_word;
        }

        constexpr auto operator&=(Mask8x8 other) noexcept -> Mask8x8&
        {
            m_word &= other.m_word;
            return *this;
        }

        constexpr auto operator|=(Mask8x8 other) noexcept -> Mask8x8&
        {
            m_word |= other.m_word;
            return *this;
        }

        constexpr auto operator^=(Mask8x8 other) noexcept -> Mask8x8&
        {
            m_word ^= other.m_word;
            return *this;
        }

        [[nodiscard]] friend constexpr bool operator==(const Mask8x8&, const Mask8x8&) noexcept = default;

    private:
        friend class U8x8;

        constexpr explicit Mask8x8(UInt64 word) noexcept
            : m_word(word)
        {}

        /// Places bit i of @p bits in bit 0 of byte i (numeric order). The
        /// multiplier 0x02040810204081 sums 2^(7k) for k = 0..7, moving bit i
        /// up by 7i; odd and even source bits are multiplied separately so that
        /// no two partial products overlap.
        [[nodiscard]] static constexpr auto SpreadBits(UInt8 bits) noexcept -> UInt64
        {
            constexpr UInt64 kSpread = 0x02040810204081ULL;
            const UInt64     raw     = bits;
            return (((raw & 0x55U) * kSpread) | ((raw & 0xaaU) * kSpread)) & detail::kLaneOnes;
        }

        /// Inverse of SpreadBits: byte j (numeric order) of @p word lands in bit
        /// 56 + j of the product, so the top byte is the bitmask.
        [[nodiscard]] static constexpr auto GatherBits(UInt64 word) noexcept -> UInt8
        {
            constexpr UInt64 kGather = 0x0102040810204080ULL;
            return static_cast<UInt8>((word * kGather) >> 56);
        }

        UInt64 m_word {0};
    };

    inline constexpr Mask8x8 Mask8x8::AllFalse {};
    inline constexpr Mask8x8 Mask8x8::AllTrue {detail::kLaneOnes};

    [[nodiscard]] constexpr auto operator~(Mask8x8 mask) noexcept -> Mask8x8
    {
        return mask.Not();
    }

    [[nodiscard]] constexpr auto operator&(Mask8x8 lhs, Mask8x8 rhs) noexcept -> Mask8x8
    {
        return lhs.And(rhs);
    }

    [[nodiscard]] constexpr auto operator|(Mask8x8 lhs, Mask8x8 rhs) noexcept -> Mask8x8
    {
        return lhs.Or(rhs);
    }

    [[nodiscard]] constexpr auto operator^(Mask8x8 lhs, Mask8x8 rhs) noexcept -> Mask8x8
    {
        return lhs.Xor(rhs);
    }

    static_assert(sizeof(Mask8x8) == sizeof(UInt64));
    static_assert(std::is_trivially_copyable_v<Mask8x8>);
}// namespace OCTA::SWAR

// U8x8 completes the lane-view conversions declared above.
#include "OCTA/SWAR/U8x8.hpp"
