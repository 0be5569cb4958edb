//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef REGDEC_LOCATION_HPP_INCLUDED
#define REGDEC_LOCATION_HPP_INCLUDED

#include "error.hpp"
#include "store.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <string>

namespace regdec
{

/// Location of a container in a store, parsed from `[scheme:]//<root>/<segment>/...` strings.
///
/// E.g. `//hklm/SOFTWARE/Microsoft/Windows%20NT` has `hklm` root and `SOFTWARE\Microsoft\Windows NT` path.
///
struct Location
{
    struct ParseResult
    {
        using Success = Location;
        using Failure = Error;
        using Var     = cetl::variant<Success, Failure>;
    };

    /// Parses a location string.
    ///
    /// The root name is lower-cased but not validated (see `lookupRoot`).
    /// Path segments are percent-decoded, and joined with `\`; empty segments are dropped,
    /// as well as any `?query` or `#fragment` suffix.
    ///
    static ParseResult::Var parse(const std::string& str);

    std::string root;
    std::string path;

};  // Location

/// Resolves a (lower-cased) root name into a predefined root of a store.
///
/// Known names are `hkcr`, `hkcu`, `hklm`, `hku` and `hkcc`.
///
cetl::optional<RootKey> lookupRoot(const std::string& name);

}  // namespace regdec

#endif  // REGDEC_LOCATION_HPP_INCLUDED
