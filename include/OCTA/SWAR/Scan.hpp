#pragma once

// SPDX-License-Identifier: Apache-2.0
//
// Byte-oriented scan helpers built on the aligned split and U8x8. Each helper
// handles the unaligned prefix and suffix one byte at a time and the aligned
// middle eight lanes at a time; results match a plain byte loop for every
// length and start address.

#include <span>

#include "OCTA/Defines.hpp"
#include "OCTA/Primitives.hpp"

namespace OCTA::SWAR
{
    /// @brief Counts the bytes equal to @p value.
    [[nodiscard]] OCTA_BASE_API auto CountEqByte(std::span<const UInt8> data, UInt8 value) noexcept -> UIntSize;

    /// @brief Pointer/length form of CountEqByte.
    /// @throws Exceptions::InvalidArgumentException if @p data is null and @p length is not zero.
    [[nodiscard]] OCTA_BASE_API auto CountEqByte(const UInt8* data, UIntSize length, UInt8 value) -> UIntSize;

    /// @brief Index of the first byte equal to @p value, or data.size() if none matches.
    [[nodiscard]] OCTA_BASE_API auto FindEqByte(std::span<const UInt8> data, UInt8 value) noexcept -> UIntSize;

    /// @brief Pointer/length form of FindEqByte; returns @p length if none matches.
    /// @throws Exceptions::InvalidArgumentException if @p data is null and @p length is not zero.
    [[nodiscard]] OCTA_BASE_API auto FindEqByte(const UInt8* data, UIntSize length, UInt8 value) -> UIntSize;

    /// @brief Index of the first byte equal to @p a or @p b, or data.size() if none matches.
    [[nodiscard]] OCTA_BASE_API auto FindAnyByte(std::span<const UInt8> data, UInt8 a, UInt8 b) noexcept -> UIntSize;

    /// @brief Pointer/length form of FindAnyByte; returns @p length if none matches.
    /// @throws Exceptions::InvalidArgumentException if @p data is null and @p length is not zero.
    [[nodiscard]] OCTA_BASE_API auto FindAnyByte(const UInt8* data, UIntSize length, UInt8 a, UInt8 b) -> UIntSize;

    /// @brief Replaces every byte equal to @p from with @p to.
    /// @return The number of bytes replaced.
    OCTA_BASE_API auto ReplaceByte(std::span<UInt8> data, UInt8 from, UInt8 to) noexcept -> UIntSize;

    /// @brief Adds @p amount to every byte, clamping at 255.
    OCTA_BASE_API void SaturatingAddInPlace(std::span<UInt8> data, UInt8 amount) noexcept;
}// namespace OCTA::SWAR
