//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "decoder/utf16.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <cstdint>
#include <string>
#include <vector>

namespace
{

using namespace regdec::detail;  // NOLINT This our main concern here in the unit tests.

using testing::IsEmpty;
using testing::ElementsAre;

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

class TestUtf16 : public testing::Test
{
protected:
    static std::string toUtf8(const std::vector<std::uint8_t>& bytes)
    {
        return utf16leToUtf8(bytes.data(), bytes.size());
    }
};

// MARK: - Tests:

TEST_F(TestUtf16, utf16le_to_utf8)
{
    EXPECT_THAT(toUtf8({}), "");
    EXPECT_THAT(toUtf8({'a', 0, 'b', 0}), "ab");

    // Nulls are kept as is.
    EXPECT_THAT(toUtf8({'a', 0, 0, 0, 'b', 0}), std::string("a\0b", 3));

    // 2 and 3 bytes long UTF-8 sequences.
    EXPECT_THAT(toUtf8({0xE9, 0x00, 0xAC, 0x20}), "\xC3\xA9\xE2\x82\xAC");

    // Surrogate pair.
    EXPECT_THAT(toUtf8({0x3D, 0xD8, 0x00, 0xDE}), "\xF0\x9F\x98\x80");
}

TEST_F(TestUtf16, utf16le_to_utf8_malformed)
{
    // Lone high surrogate at the end, and lone low surrogate.
    EXPECT_THAT(toUtf8({'a', 0, 0x3D, 0xD8}), "a\xEF\xBF\xBD");
    EXPECT_THAT(toUtf8({0x00, 0xDE, 'a', 0}), "\xEF\xBF\xBD" "a");

    // Odd trailing byte.
    EXPECT_THAT(toUtf8({'a'}), "\xEF\xBF\xBD");
    EXPECT_THAT(toUtf8({'a', 0, 'b'}), "a\xEF\xBF\xBD");
}

TEST_F(TestUtf16, utf8_to_utf16le)
{
    EXPECT_THAT(utf8ToUtf16le(""), IsEmpty());
    EXPECT_THAT(utf8ToUtf16le("ab"), ElementsAre('a', 0, 'b', 0));
    EXPECT_THAT(utf8ToUtf16le("\xC3\xA9\xE2\x82\xAC"), ElementsAre(0xE9, 0x00, 0xAC, 0x20));
    EXPECT_THAT(utf8ToUtf16le("\xF0\x9F\x98\x80"), ElementsAre(0x3D, 0xD8, 0x00, 0xDE));

    // Malformed UTF-8 becomes the replacement character.
    EXPECT_THAT(utf8ToUtf16le("\xFF"), ElementsAre(0xFD, 0xFF));
    EXPECT_THAT(utf8ToUtf16le("\xC3"), ElementsAre(0xFD, 0xFF));
}

TEST_F(TestUtf16, round_trip)
{
    const std::string text = "Windows 10 Pro \xE2\x80\x94 \xF0\x9F\x98\x80";
    const auto        utf16 = utf8ToUtf16le(text);
    EXPECT_THAT(utf16leToUtf8(utf16.data(), utf16.size()), text);
}

// NOLINTEND(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

}  // namespace
