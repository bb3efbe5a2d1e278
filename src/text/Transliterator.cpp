// SPDX-License-Identifier: Apache-2.0
#include "Transliterator.hpp"

#include <array>
#include <utility>

namespace srtvoice
{

namespace
{

    using Mapping = std::pair<std::string_view, std::string_view>;

    // Digraphs come first so that "nj" is never read as "n" followed by "j".
    constexpr auto SerbianLatinToCyrillic = std::array<Mapping, 63> { {
        { "D\xC5\xBD", "\xD0\x8F" }, // DŽ
        { "D\xC5\xBE", "\xD0\x8F" }, // Dž
        { "d\xC5\xBE", "\xD1\x9F" }, // dž
        { "LJ", "\xD0\x89" },
        { "Lj", "\xD0\x89" },
        { "lj", "\xD1\x99" },
        { "NJ", "\xD0\x8A" },
        { "Nj", "\xD0\x8A" },
        { "nj", "\xD1\x9A" },
        { "\xC4\x8C", "\xD0\xA7" }, // Č
        { "\xC4\x8D", "\xD1\x87" }, // č
        { "\xC4\x86", "\xD0\x8B" }, // Ć
        { "\xC4\x87", "\xD1\x9B" }, // ć
        { "\xC4\x90", "\xD0\x82" }, // Đ
        { "\xC4\x91", "\xD1\x92" }, // đ
        { "\xC5\xA0", "\xD0\xA8" }, // Š
        { "\xC5\xA1", "\xD1\x88" }, // š
        { "\xC5\xBD", "\xD0\x96" }, // Ž
        { "\xC5\xBE", "\xD0\xB6" }, // ž
        { "A", "\xD0\x90" },
        { "a", "\xD0\xB0" },
        { "B", "\xD0\x91" },
        { "b", "\xD0\xB1" },
        { "C", "\xD0\xA6" },
        { "c", "\xD1\x86" },
        { "D", "\xD0\x94" },
        { "d", "\xD0\xB4" },
        { "E", "\xD0\x95" },
        { "e", "\xD0\xB5" },
        { "F", "\xD0\xA4" },
        { "f", "\xD1\x84" },
        { "G", "\xD0\x93" },
        { "g", "\xD0\xB3" },
        { "H", "\xD0\xA5" },
        { "h", "\xD1\x85" },
        { "I", "\xD0\x98" },
        { "i", "\xD0\xB8" },
        { "J", "\xD0\x88" },
        { "j", "\xD1\x98" },
        { "K", "\xD0\x9A" },
        { "k", "\xD0\xBA" },
        { "L", "\xD0\x9B" },
        { "l", "\xD0\xBB" },
        { "M", "\xD0\x9C" },
        { "m", "\xD0\xBC" },
        { "N", "\xD0\x9D" },
        { "n", "\xD0\xBD" },
        { "O", "\xD0\x9E" },
        { "o", "\xD0\xBE" },
        { "P", "\xD0\x9F" },
        { "p", "\xD0\xBF" },
        { "R", "\xD0\xA0" },
        { "r", "\xD1\x80" },
        { "S", "\xD0\xA1" },
        { "s", "\xD1\x81" },
        { "T", "\xD0\xA2" },
        { "t", "\xD1\x82" },
        { "U", "\xD0\xA3" },
        { "u", "\xD1\x83" },
        { "V", "\xD0\x92" },
        { "v", "\xD0\xB2" },
        { "Z", "\xD0\x97" },
        { "z", "\xD0\xB7" },
    } };

} // namespace

auto containsCyrillic(std::string_view text) -> bool
{
    // U+0400..U+04FF are encoded with lead bytes 0xD0..0xD3.
    for (auto i = std::size_t { 0 }; i + 1 < text.size(); ++i)
    {
        auto const lead = static_cast<unsigned char>(text[i]);
        auto const trail = static_cast<unsigned char>(text[i + 1]);
        if (lead >= 0xD0 && lead <= 0xD3 && (trail & 0xC0) == 0x80)
            return true;
    }
    return false;
}

auto toSerbianCyrillic(std::string_view text) -> std::string
{
    auto result = std::string {};
    result.reserve(text.size() * 2);

    auto position = std::size_t { 0 };
    while (position < text.size())
    {
        auto const rest = text.substr(position);
        auto matched = false;
        for (auto const& [latin, cyrillic]: SerbianLatinToCyrillic)
        {
            if (rest.starts_with(latin))
            {
                result += cyrillic;
                position += latin.size();
                matched = true;
                break;
            }
        }

        if (!matched)
            result += text[position++];
    }
    return result;
}

} // namespace srtvoice
