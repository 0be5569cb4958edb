//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "regdec/value_codec.hpp"

#include "regdec/error.hpp"
#include "regdec/value_type.hpp"
#include "utf16.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <spdlog/fmt/fmt.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace regdec
{
namespace
{

using Bytes = std::vector<std::uint8_t>;

constexpr std::size_t TerminatorSize = 2;  // one UTF-16 code unit

template <typename UInt>
DecodeResult::Var decodeInteger(const Bytes& raw_data, const bool big_endian, const std::string& value_name)
{
    if (raw_data.size() < sizeof(UInt))
    {
        return makeError(ErrorCode::MalformedValue,
                         fmt::format("registry: value '{}' has {} bytes, but at least {} are required.",
                                     value_name,
                                     raw_data.size(),
                                     sizeof(UInt)));
    }

    UInt value = 0;
    for (std::size_t i = 0; i < sizeof(UInt); ++i)
    {
        const std::size_t byte_index = big_endian ? i : (sizeof(UInt) - 1 - i);
        value = static_cast<UInt>((value << 8U) | raw_data[byte_index]);  // NOLINT(*-magic-numbers)
    }
    return CanonicalValue{value};
}

std::string decodeText(const Bytes& raw_data)
{
    const std::size_t size = (raw_data.size() >= TerminatorSize) ? (raw_data.size() - TerminatorSize) : 0;
    return detail::utf16leToUtf8(raw_data.data(), size);
}

/// Splits the whole buffer on null characters, and then drops the last two segments.
///
/// The first dropped segment is the empty one produced by the double terminator;
/// dropping the second one as well keeps compatibility with the existing decoders of this format.
///
std::vector<std::string> decodeMultiText(const Bytes& raw_data)
{
    const std::string all = detail::utf16leToUtf8(raw_data.data(), raw_data.size());

    std::vector<std::string> segments;
    std::size_t              begin = 0;
    while (true)
    {
        const auto end = all.find('\0', begin);
        if (end == std::string::npos)
        {
            segments.push_back(all.substr(begin));
            break;
        }
        segments.push_back(all.substr(begin, end - begin));
        begin = end + 1;
    }

    constexpr std::size_t dropped = 2;
    segments.resize((segments.size() > dropped) ? (segments.size() - dropped) : 0);
    return segments;
}

}  // namespace

DecodeResult::Var decodeRaw(const Bytes& raw_data, const ValueType value_type, const std::string& value_name)
{
    switch (value_type)
    {
    case ValueType::DwordBigEndian:
        return decodeInteger<std::uint32_t>(raw_data, true, value_name);
    case ValueType::Dword:
        return decodeInteger<std::uint32_t>(raw_data, false, value_name);
    case ValueType::Qword:
        return decodeInteger<std::uint64_t>(raw_data, false, value_name);
    case ValueType::String:
    case ValueType::ExpandString:
        return CanonicalValue{decodeText(raw_data)};
    case ValueType::MultiString:
        return CanonicalValue{decodeMultiText(raw_data)};
    case ValueType::Binary:
        return CanonicalValue{raw_data};
    default:
        return makeError(ErrorCode::UnsupportedStoreType,
                         fmt::format("registry: tried to unmarshal registry value '{}' of type 0x{:08x} ({}), "
                                     "but we don't know what to do with it.",
                                     value_name,
                                     static_cast<std::uint32_t>(value_type),
                                     describeValueType(value_type)));
    }
}

}  // namespace regdec
