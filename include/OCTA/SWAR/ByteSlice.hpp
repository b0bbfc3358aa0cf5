#pragma once

// SPDX-License-Identifier: Apache-2.0
//
// Splits a byte buffer around U8x8 alignment so the aligned middle can be
// processed eight lanes at a time.

#include <algorithm>
#include <span>

#include "OCTA/Primitives.hpp"
#include "OCTA/SWAR/U8x8.hpp"

namespace OCTA::SWAR
{
    /// @brief Three views over one byte buffer: an unaligned prefix, the run of
    /// whole U8x8 words that follows it, and the unaligned remainder.
    ///
    /// All three views borrow the buffer passed to SplitAligned. prefix and
    /// suffix hold at most 7 bytes each unless the buffer never reaches a word
    /// boundary, in which case prefix holds the whole buffer.
    template<class Byte, class Word>
    struct ByteSlice
    {
        std::span<Byte> prefix {};
        std::span<Word> words {};
        std::span<Byte> suffix {};
    };

    using ConstByteSlice   = ByteSlice<const UInt8, const U8x8>;
    using MutableByteSlice = ByteSlice<UInt8, U8x8>;

    namespace detail
    {
        /// @brief Bytes needed to move @p address forward to a multiple of @p alignment.
        /// @param alignment A power of two.
        [[nodiscard]] constexpr auto AlignmentAdjustment(UIntPtr address, UIntSize alignment) noexcept -> UIntSize
        {
            const UIntSize misalignment = address & (alignment - 1);
            return misalignment ? (alignment - misalignment) : 0;
        }

        template<class Word, class Byte>
        [[nodiscard]] inline auto SplitAlignedImpl(std::span<Byte> bytes) noexcept -> ByteSlice<Byte, Word>
        {
            static_assert((alignof(U8x8) & (alignof(U8x8) - 1)) == 0, "U8x8 alignment must be a power of two.");

            const auto address     = reinterpret_cast<UIntPtr>(bytes.data());
            const auto prefixCount = std::min(AlignmentAdjustment(address, alignof(U8x8)), bytes.size());

            ByteSlice<Byte, Word> slice;
            slice.prefix = bytes.first(prefixCount);

            const auto rest      = bytes.subspan(prefixCount);
            const auto wordCount = rest.size() / sizeof(U8x8);
            if (wordCount != 0)
            {
                // rest starts on a U8x8 boundary; U8x8 is declared may_alias so
                // reading the bytes through it is well-defined on GCC and Clang.
                slice.words = std::span<Word>(reinterpret_cast<Word*>(rest.data()), wordCount);
            }
            slice.suffix = rest.subspan(wordCount * sizeof(U8x8));
            return slice;
        }
    }// namespace detail

    /// @brief Splits a read-only buffer into prefix bytes, aligned words and suffix bytes.
    [[nodiscard]] inline auto SplitAligned(std::span<const UInt8> bytes) noexcept -> ConstByteSlice
    {
        return detail::SplitAlignedImpl<const U8x8>(bytes);
    }

    /// @brief Mutable variant of SplitAligned. Writes through the words view
    /// land in the original buffer.
    [[nodiscard]] inline auto SplitAlignedMutable(std::span<UInt8> bytes) noexcept -> MutableByteSlice
    {
        return detail::SplitAlignedImpl<U8x8>(bytes);
    }
}// namespace OCTA::SWAR
