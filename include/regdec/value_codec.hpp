//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef REGDEC_VALUE_CODEC_HPP_INCLUDED
#define REGDEC_VALUE_CODEC_HPP_INCLUDED

#include "error.hpp"
#include "value_type.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace regdec
{

/// Kinds of decoded values, independent of both store tags and target field types.
///
enum class CanonicalKind
{
    BigInteger,
    Integer,
    Text,
    TextList,
    Blob,

};  // CanonicalKind

/// Intermediate decoded form of a store value.
///
/// Alternatives are in the order of `CanonicalKind` enumerators.
/// Texts are UTF-8 encoded.
///
using CanonicalValue = cetl::variant<std::uint64_t,             // BigInteger
                                     std::uint32_t,             // Integer
                                     std::string,               // Text
                                     std::vector<std::string>,  // TextList
                                     std::vector<std::uint8_t>  // Blob
                                     >;

inline CanonicalKind kindOf(const CanonicalValue& value) noexcept
{
    return static_cast<CanonicalKind>(value.index());
}

inline const char* describeCanonicalKind(const CanonicalKind kind) noexcept
{
    switch (kind)
    {
    case CanonicalKind::BigInteger:
        return "big integer";
    case CanonicalKind::Integer:
        return "integer";
    case CanonicalKind::Text:
        return "text";
    case CanonicalKind::TextList:
        return "text list";
    case CanonicalKind::Blob:
        return "blob";
    default:
        return "unknown";
    }
}

struct DecodeResult
{
    using Success = CanonicalValue;
    using Failure = Error;
    using Var     = cetl::variant<Success, Failure>;
};

/// Decodes raw store bytes according to their store type tag.
///
/// Pure function, no I/O.
///
/// @param value_name Name of the value; used for error messages only.
///
DecodeResult::Var decodeRaw(const std::vector<std::uint8_t>& raw_data,
                            const ValueType                  value_type,
                            const std::string&               value_name = {});

}  // namespace regdec

#endif  // REGDEC_VALUE_CODEC_HPP_INCLUDED
