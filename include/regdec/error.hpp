//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef REGDEC_ERROR_HPP_INCLUDED
#define REGDEC_ERROR_HPP_INCLUDED

#include <cetl/pf17/cetlpf.hpp>

#include <string>
#include <utility>

namespace regdec
{

/// Defines categories of decode failures.
///
/// Every failure aborts the whole decode; a missing optional container or value is not a failure.
///
enum class ErrorCode
{
    /// The root name of a location is not one of the known registry roots.
    UnknownRoot,

    /// A container or value marked as `required` could not be opened or read.
    RequiredMissing,

    /// The store reported a value type tag which has no decoding rule.
    UnsupportedStoreType,

    /// A decoded value kind is incompatible with the declared type of its target field.
    TypeMismatch,

    /// The target type can't be described as a schema (e.g. duplicate field names).
    MalformedTarget,

    /// The location string doesn't follow `//<root>/<segment>/...` syntax.
    MalformedAddress,

    /// A value payload is too short for its store type tag.
    MalformedValue,

    /// A container handle could not be released.
    ReleaseFailed,

};  // ErrorCode

struct Error
{
    ErrorCode   code;
    std::string message;

};  // Error

inline const char* describeErrorCode(const ErrorCode code) noexcept
{
    switch (code)
    {
    case ErrorCode::UnknownRoot:
        return "UnknownRoot";
    case ErrorCode::RequiredMissing:
        return "RequiredMissing";
    case ErrorCode::UnsupportedStoreType:
        return "UnsupportedStoreType";
    case ErrorCode::TypeMismatch:
        return "TypeMismatch";
    case ErrorCode::MalformedTarget:
        return "MalformedTarget";
    case ErrorCode::MalformedAddress:
        return "MalformedAddress";
    case ErrorCode::MalformedValue:
        return "MalformedValue";
    case ErrorCode::ReleaseFailed:
        return "ReleaseFailed";
    default:
        return "Unknown";
    }
}

/// Result of a status-only operation: `cetl::nullopt` on success.
///
using OptError = cetl::optional<Error>;

inline Error makeError(const ErrorCode code, std::string message)
{
    return Error{code, std::move(message)};
}

}  // namespace regdec

#endif  // REGDEC_ERROR_HPP_INCLUDED
