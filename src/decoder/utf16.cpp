//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "utf16.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace regdec
{
namespace detail
{
namespace
{

constexpr char16_t HighSurrogateMin = 0xD800;
constexpr char16_t HighSurrogateMax = 0xDBFF;
constexpr char16_t LowSurrogateMin  = 0xDC00;
constexpr char16_t LowSurrogateMax  = 0xDFFF;
constexpr char32_t SupplementaryMin = 0x10000;
constexpr char32_t CodePointMax     = 0x10FFFF;

bool isHighSurrogate(const char32_t unit)
{
    return (unit >= HighSurrogateMin) && (unit <= HighSurrogateMax);
}

bool isLowSurrogate(const char32_t unit)
{
    return (unit >= LowSurrogateMin) && (unit <= LowSurrogateMax);
}

// NOLINTBEGIN(readability-magic-numbers, cppcoreguidelines-avoid-magic-numbers)

void appendUtf8(std::string& out, const char32_t cp)
{
    if (cp < 0x80)
    {
        out.push_back(static_cast<char>(cp));
    }
    else if (cp < 0x800)
    {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
    else if (cp < 0x10000)
    {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
    else
    {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

void appendUtf16le(std::vector<std::uint8_t>& out, const char32_t unit)
{
    out.push_back(static_cast<std::uint8_t>(unit & 0xFF));
    out.push_back(static_cast<std::uint8_t>((unit >> 8) & 0xFF));
}

/// Decodes one UTF-8 sequence starting at `pos`, and advances `pos` past it.
///
char32_t nextUtf8CodePoint(const std::string& text, std::size_t& pos)
{
    const auto lead = static_cast<std::uint8_t>(text[pos++]);
    if (lead < 0x80)
    {
        return lead;
    }

    std::size_t extra  = 0;
    char32_t    cp     = 0;
    char32_t    min_cp = 0;
    if ((lead & 0xE0) == 0xC0)
    {
        extra  = 1;
        cp     = lead & 0x1F;
        min_cp = 0x80;
    }
    else if ((lead & 0xF0) == 0xE0)
    {
        extra  = 2;
        cp     = lead & 0x0F;
        min_cp = 0x800;
    }
    else if ((lead & 0xF8) == 0xF0)
    {
        extra  = 3;
        cp     = lead & 0x07;
        min_cp = SupplementaryMin;
    }
    else
    {
        return ReplacementChar;
    }

    for (std::size_t i = 0; i < extra; ++i)
    {
        if ((pos >= text.size()) || ((static_cast<std::uint8_t>(text[pos]) & 0xC0) != 0x80))
        {
            return ReplacementChar;
        }
        cp = (cp << 6) | (static_cast<std::uint8_t>(text[pos++]) & 0x3F);
    }

    if ((cp < min_cp) || (cp > CodePointMax) || isHighSurrogate(cp) || isLowSurrogate(cp))
    {
        return ReplacementChar;
    }
    return cp;
}

}  // namespace

std::string utf16leToUtf8(const std::uint8_t* const data, const std::size_t size)
{
    // A trailing half unit is kept as a whole unit, which then becomes the replacement character.
    std::vector<char32_t> units((size + 1) / 2);
    for (std::size_t i = 0; i < units.size(); ++i)
    {
        const std::size_t offset = i * 2;
        if (offset + 1 < size)
        {
            units[i] = static_cast<char32_t>(data[offset]) | (static_cast<char32_t>(data[offset + 1]) << 8);
        }
        else
        {
            units[i] = ReplacementChar;
        }
    }

    std::string result;
    result.reserve(units.size());
    for (std::size_t i = 0; i < units.size(); ++i)
    {
        const char32_t unit = units[i];
        if (isHighSurrogate(unit) && (i + 1 < units.size()) && isLowSurrogate(units[i + 1]))
        {
            const char32_t low = units[++i];
            appendUtf8(result, SupplementaryMin + ((unit - HighSurrogateMin) << 10) + (low - LowSurrogateMin));
        }
        else if (isHighSurrogate(unit) || isLowSurrogate(unit))
        {
            appendUtf8(result, ReplacementChar);
        }
        else
        {
            appendUtf8(result, unit);
        }
    }
    return result;
}

std::vector<std::uint8_t> utf8ToUtf16le(const std::string& text)
{
    std::vector<std::uint8_t> result;
    result.reserve(text.size() * 2);

    std::size_t pos = 0;
    while (pos < text.size())
    {
        const char32_t cp = nextUtf8CodePoint(text, pos);
        if (cp >= SupplementaryMin)
        {
            const char32_t offset = cp - SupplementaryMin;
            appendUtf16le(result, HighSurrogateMin + (offset >> 10));
            appendUtf16le(result, LowSurrogateMin + (offset & 0x3FF));
        }
        else
        {
            appendUtf16le(result, cp);
        }
    }
    return result;
}

// NOLINTEND(readability-magic-numbers, cppcoreguidelines-avoid-magic-numbers)

}  // namespace detail
}  // namespace regdec
