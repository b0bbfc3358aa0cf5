/// @file ScanTests.cpp
/// @brief Tests for the OCTA::SWAR byte scan helpers against plain byte loops.

#include <catch2/catch_test_macros.hpp>

#include <OCTA/Exceptions/InvalidArgumentException.hpp>
#include <OCTA/SWAR/Scan.hpp>

#include <algorithm>
#include <array>
#include <cstdint>
#include <random>

using namespace OCTA;
using namespace OCTA::SWAR;

namespace
{
    constexpr std::size_t kMaxLength = 112;

    struct alignas(8) Buffer
    {
        std::array<UInt8, kMaxLength + 8> bytes {};
    };

    // Small alphabet so matches are frequent and misses still occur.
    void FillRandom(Buffer& buffer, std::mt19937& rng)
    {
        std::uniform_int_distribution<int> dist(0, 5);
        for (auto& byte: buffer.bytes)
        {
            byte = static_cast<UInt8>(dist(rng) * 51);
        }
    }

    [[nodiscard]] auto IndexOf(std::span<const UInt8> view, UInt8 value) -> std::size_t
    {
        return static_cast<std::size_t>(std::find(view.begin(), view.end(), value) - view.begin());
    }
}// namespace

TEST_CASE("CountEqByte matches std::count", "[SWAR][Scan]")
{
    std::mt19937 rng(0x5eed);
    Buffer       buffer;
    int          mismatches = 0;

    for (int round = 0; round < 4; ++round)
    {
        FillRandom(buffer, rng);
        for (std::size_t offset = 0; offset < 8; ++offset)
        {
            for (std::size_t length = 0; length <= kMaxLength; ++length)
            {
                const std::span<const UInt8> view(buffer.bytes.data() + offset, length);
                for (const UInt8 value: {UInt8 {0}, UInt8 {51}, UInt8 {255}, UInt8 {7}})
                {
                    const auto expected = static_cast<UIntSize>(std::count(view.begin(), view.end(), value));
                    if (CountEqByte(view, value) != expected)
                    {
                        ++mismatches;
                    }
                }
            }
        }
    }
    CHECK(mismatches == 0);
}

TEST_CASE("FindEqByte and FindAnyByte match std::find", "[SWAR][Scan]")
{
    std::mt19937 rng(0xfeed);
    Buffer       buffer;
    int          mismatches = 0;

    for (int round = 0; round < 4; ++round)
    {
        FillRandom(buffer, rng);
        for (std::size_t offset = 0; offset < 8; ++offset)
        {
            for (std::size_t length = 0; length <= kMaxLength; ++length)
            {
                const std::span<const UInt8> view(buffer.bytes.data() + offset, length);
                for (const UInt8 value: {UInt8 {0}, UInt8 {102}, UInt8 {255}, UInt8 {9}})
                {
                    if (FindEqByte(view, value) != IndexOf(view, value))
                    {
                        ++mismatches;
                    }
                }

                const auto expectedAny = std::min(IndexOf(view, 153), IndexOf(view, 204));
                if (FindAnyByte(view, 153, 204) != expectedAny)
                {
                    ++mismatches;
                }
            }
        }
    }
    CHECK(mismatches == 0);
}

TEST_CASE("FindEqByte locates a single match anywhere", "[SWAR][Scan]")
{
    Buffer buffer;
    int    mismatches = 0;
    for (std::size_t offset = 0; offset < 8; ++offset)
    {
        const std::span<const UInt8> view(buffer.bytes.data() + offset, kMaxLength);
        for (std::size_t position = 0; position < view.size(); ++position)
        {
            buffer.bytes[offset + position] = 0x2a;
            if (FindEqByte(view, 0x2a) != position)
            {
                ++mismatches;
            }
            buffer.bytes[offset + position] = 0;
        }
        if (FindEqByte(view, 0x2a) != view.size())
        {
            ++mismatches;
        }
    }
    CHECK(mismatches == 0);
}

TEST_CASE("Pointer overloads validate their arguments", "[SWAR][Scan]")
{
    const std::array<UInt8, 5> bytes {1, 2, 3, 2, 1};

    CHECK(CountEqByte(bytes.data(), bytes.size(), 2) == 2);
    CHECK(FindEqByte(bytes.data(), bytes.size(), 3) == 2);
    CHECK(FindEqByte(bytes.data(), bytes.size(), 9) == bytes.size());

    CHECK(CountEqByte(nullptr, 0, 1) == 0);
    CHECK(FindEqByte(nullptr, 0, 1) == 0);

    CHECK(FindAnyByte(bytes.data(), bytes.size(), 3, 2) == 1);
    CHECK(FindAnyByte(bytes.data(), bytes.size(), 8, 9) == bytes.size());
    CHECK(FindAnyByte(nullptr, 0, 1, 2) == 0);

    CHECK_THROWS_AS(CountEqByte(nullptr, 4, 1), Exceptions::InvalidArgumentException);
    CHECK_THROWS_AS(FindEqByte(nullptr, 4, 1), Exceptions::InvalidArgumentException);
    CHECK_THROWS_AS(FindAnyByte(nullptr, 4, 1, 2), Exceptions::InvalidArgumentException);
}

TEST_CASE("ReplaceByte rewrites every match in place", "[SWAR][Scan]")
{
    std::mt19937 rng(0xbead);
    Buffer       buffer;
    int          mismatches = 0;

    for (std::size_t offset = 0; offset < 8; ++offset)
    {
        for (std::size_t length = 0; length <= kMaxLength; length += 3)
        {
            FillRandom(buffer, rng);
            const auto before = buffer.bytes;

            std::span<UInt8> view(buffer.bytes.data() + offset, length);
            const auto       expectedCount = static_cast<UIntSize>(std::count(view.begin(), view.end(), UInt8 {51}));

            if (ReplaceByte(view, 51, 1) != expectedCount)
            {
                ++mismatches;
            }
            for (std::size_t index = 0; index < buffer.bytes.size(); ++index)
            {
                const bool inside   = index >= offset && index < offset + length;
                const auto expected = (inside && before[index] == 51) ? UInt8 {1} : before[index];
                if (buffer.bytes[index] != expected)
                {
                    ++mismatches;
                }
            }
        }
    }
    CHECK(mismatches == 0);
}

TEST_CASE("SaturatingAddInPlace clamps at 255 for every offset and length", "[SWAR][Scan]")
{
    std::mt19937                       rng(0xadd5);
    std::uniform_int_distribution<int> anyByte(0, 255);
    Buffer                             buffer;
    int                                mismatches = 0;

    for (const UInt8 amount: {UInt8 {0}, UInt8 {1}, UInt8 {100}, UInt8 {200}, UInt8 {255}})
    {
        for (std::size_t offset = 0; offset < 8; ++offset)
        {
            for (std::size_t length = 0; length <= kMaxLength; ++length)
            {
                for (auto& byte: buffer.bytes)
                {
                    byte = static_cast<UInt8>(anyByte(rng));
                }
                const auto before = buffer.bytes;

                SaturatingAddInPlace(std::span<UInt8>(buffer.bytes.data() + offset, length), amount);

                for (std::size_t index = 0; index < buffer.bytes.size(); ++index)
                {
                    const bool inside   = index >= offset && index < offset + length;
                    const auto expected = inside ? static_cast<UInt8>(std::min(before[index] + amount, 255))
                                                 : before[index];
                    if (buffer.bytes[index] != expected)
                    {
                        ++mismatches;
                    }
                }
            }
        }
    }
    CHECK(mismatches == 0);
}
