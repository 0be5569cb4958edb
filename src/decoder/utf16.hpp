//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef REGDEC_DECODER_UTF16_HPP_INCLUDED
#define REGDEC_DECODER_UTF16_HPP_INCLUDED

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace regdec
{
namespace detail
{

constexpr char32_t ReplacementChar = 0xFFFD;

/// Converts UTF-16LE bytes into a UTF-8 string.
///
/// An odd trailing byte, as well as any unpaired surrogate, turns into U+FFFD.
/// Null characters are preserved.
///
std::string utf16leToUtf8(const std::uint8_t* const data, const std::size_t size);

/// Converts a UTF-8 string into UTF-16LE bytes (without any terminator).
///
/// Malformed UTF-8 sequences turn into U+FFFD.
///
std::vector<std::uint8_t> utf8ToUtf16le(const std::string& text);

}  // namespace detail
}  // namespace regdec

#endif  // REGDEC_DECODER_UTF16_HPP_INCLUDED
