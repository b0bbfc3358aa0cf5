// This file belongs to the core module: fundamental type definitions.
#pragma once
#include <cstddef>
#include <cstdint>

namespace OCTA
{
    /// @brief Represents a 64-bit unsigned integer.
    using UInt64 = std::uint64_t;
    /// @brief Represents a 32-bit unsigned integer.
    using UInt32 = std::uint32_t;
    /// @brief Represents an 8-bit unsigned integer, the element type of a byte lane.
    using UInt8 = std::uint8_t;

    /// @brief Represents an unsigned integer type that is large enough to hold a pointer.
    using UIntPtr = std::uintptr_t;

    using UIntSize = std::size_t;
}// namespace OCTA
