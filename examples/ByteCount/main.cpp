// main.cpp
#include <iostream>
#include <span>
#include <string_view>

#include <OCTA/SWAR.hpp>

using namespace OCTA;
using namespace OCTA::SWAR;

// Counts the bytes that are not ASCII spaces, eight lanes at a time.
static UIntSize CountNonSpace(std::string_view text)
{
    const std::span<const UInt8> bytes(reinterpret_cast<const UInt8*>(text.data()), text.size());
    const auto                   slice  = SplitAligned(bytes);
    const auto                   spaces = U8x8::Splat(' ');

    UIntSize count = 0;
    for (const UInt8 byte: slice.prefix)
    {
        count += byte != ' ';
    }
    for (const U8x8 word: slice.words)
    {
        count += word.Equals(spaces).Not().CountTrue();
    }
    for (const UInt8 byte: slice.suffix)
    {
        count += byte != ' ';
    }
    return count;
}

int main()
{
    constexpr std::string_view text = "The quick brown fox jumps over the lazy dog";

    std::cout << "text:       \"" << text << "\"\n";
    std::cout << "non-space:  " << CountNonSpace(text) << "\n";
    std::cout << "spaces:     " << CountEqByte(std::span(reinterpret_cast<const UInt8*>(text.data()), text.size()), ' ')
              << "\n";

    const auto first = U8x8::FromArray({'T', 'h', 'e', ' ', 'q', 'u', 'i', 'c'});
    std::cout << "lanes:      " << first << "\n";
    std::cout << "is space:   " << first.Equals(U8x8::Splat(' ')) << "\n";
    std::cout << "brightened: " << first.SaturatingAdd(U8x8::Splat(200)) << "\n";
    return 0;
}
