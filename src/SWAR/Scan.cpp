#include <OCTA/SWAR/Scan.hpp>

#include <OCTA/Exceptions/InvalidArgumentException.hpp>
#include <OCTA/SWAR/ByteSlice.hpp>
#include <OCTA/SWAR/Config.hpp>
#include <OCTA/SWAR/U8x8.hpp>

#include <bit>
#include <span>

namespace OCTA::SWAR
{
    namespace
    {
        constexpr UIntSize kScanMinBytes = OCTA_SWAR_SCAN_MIN_BYTES;

        [[nodiscard]] auto CountScalar(std::span<const UInt8> bytes, UInt8 value) noexcept -> UIntSize
        {
            UIntSize count = 0;
            for (const UInt8 byte: bytes)
            {
                if (byte == value)
                {
                    ++count;
                }
            }
            return count;
        }

        template<class Predicate>
        [[nodiscard]] auto FindScalar(std::span<const UInt8> bytes, Predicate&& predicate) noexcept -> UIntSize
        {
            for (UIntSize index = 0; index < bytes.size(); ++index)
            {
                if (predicate(bytes[index]))
                {
                    return index;
                }
            }
            return bytes.size();
        }

        template<class Predicate, class WordMatch>
        [[nodiscard]] auto FindWith(std::span<const UInt8> data, Predicate&& predicate, WordMatch&& wordMatch) noexcept
                -> UIntSize
        {
            if (data.size() < kScanMinBytes)
            {
                return FindScalar(data, predicate);
            }

            const auto slice = SplitAligned(data);

            const auto inPrefix = FindScalar(slice.prefix, predicate);
            if (inPrefix != slice.prefix.size())
            {
                return inPrefix;
            }

            UIntSize offset = slice.prefix.size();
            for (const U8x8 word: slice.words)
            {
                const UInt8 bits = wordMatch(word).ToBitmaskLE();
                if (bits != 0)
                {
                    return offset + static_cast<UIntSize>(std::countr_zero(bits));
                }
                offset += sizeof(U8x8);
            }

            const auto inSuffix = FindScalar(slice.suffix, predicate);
            if (inSuffix != slice.suffix.size())
            {
                return offset + inSuffix;
            }
            return data.size();
        }

        void RequireBuffer(const UInt8* data, UIntSize length)
        {
            if (data == nullptr && length != 0)
            {
                throw Exceptions::InvalidArgumentException("Null buffer with non-zero length.");
            }
        }
    }// namespace

    auto CountEqByte(std::span<const UInt8> data, UInt8 value) noexcept -> UIntSize
    {
        if (data.size() < kScanMinBytes)
        {
            return CountScalar(data, value);
        }

        const auto slice  = SplitAligned(data);
        const auto needle = U8x8::Splat(value);

        UIntSize count = CountScalar(slice.prefix, value) + CountScalar(slice.suffix, value);
        for (const U8x8 word: slice.words)
        {
            count += word.Equals(needle).CountTrue();
        }
        return count;
    }

    auto CountEqByte(const UInt8* data, UIntSize length, UInt8 value) -> UIntSize
    {
        RequireBuffer(data, length);
        if (length == 0)
        {
            return 0;
        }
        return CountEqByte(std::span<const UInt8>(data, length), value);
    }

    auto FindEqByte(std::span<const UInt8> data, UInt8 value) noexcept -> UIntSize
    {
        const auto needle = U8x8::Splat(value);
        return FindWith(
                data,
                [value](UInt8 byte) { return byte == value; },
                [needle](U8x8 word) { return word.Equals(needle); });
    }

    auto FindEqByte(const UInt8* data, UIntSize length, UInt8 value) -> UIntSize
    {
        RequireBuffer(data, length);
        if (length == 0)
        {
            return 0;
        }
        return FindEqByte(std::span<const UInt8>(data, length), value);
    }

    auto FindAnyByte(std::span<const UInt8> data, UInt8 a, UInt8 b) noexcept -> UIntSize
    {
        const auto va = U8x8::Splat(a);
        const auto vb = U8x8::Splat(b);
        return FindWith(
                data,
                [a, b](UInt8 byte) { return byte == a || byte == b; },
                [va, vb](U8x8 word) { return word.Equals(va) | word.Equals(vb); });
    }

    auto FindAnyByte(const UInt8* data, UIntSize length, UInt8 a, UInt8 b) -> UIntSize
    {
        RequireBuffer(data, length);
        if (length == 0)
        {
            return 0;
        }
        return FindAnyByte(std::span<const UInt8>(data, length), a, b);
    }

    auto ReplaceByte(std::span<UInt8> data, UInt8 from, UInt8 to) noexcept -> UIntSize
    {
        UIntSize replaced    = 0;
        auto     replaceEach = [&](std::span<UInt8> bytes) {
            for (UInt8& byte: bytes)
            {
                if (byte == from)
                {
                    byte = to;
                    ++replaced;
                }
            }
        };

        if (data.size() < kScanMinBytes)
        {
            replaceEach(data);
            return replaced;
        }

        const auto slice       = SplitAlignedMutable(data);
        const auto fromVector  = U8x8::Splat(from);
        const auto replacement = U8x8::Splat(to);

        replaceEach(slice.prefix);
        for (U8x8& word: slice.words)
        {
            const auto matches  = word.Equals(fromVector);
            const auto selector = matches.ToU8x8With(0xff);
            replaced += matches.CountTrue();
            word = (word & ~selector) | (replacement & selector);
        }
        replaceEach(slice.suffix);
        return replaced;
    }

    void SaturatingAddInPlace(std::span<UInt8> data, UInt8 amount) noexcept
    {
        auto addEach = [amount](std::span<UInt8> bytes) {
            for (UInt8& byte: bytes)
            {
                const unsigned sum = static_cast<unsigned>(byte) + amount;
                byte               = static_cast<UInt8>(sum > 0xffU ? 0xffU : sum);
            }
        };

        if (data.size() < kScanMinBytes)
        {
            addEach(data);
            return;
        }

        const auto slice  = SplitAlignedMutable(data);
        const auto addend = U8x8::Splat(amount);

        addEach(slice.prefix);
        for (U8x8& word: slice.words)
        {
            word = word.SaturatingAdd(addend);
        }
        addEach(slice.suffix);
    }
}// namespace OCTA::SWAR
