//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "regdec/decoder.hpp"

#include "logging.hpp"
#include "regdec/error.hpp"
#include "regdec/location.hpp"
#include "regdec/store.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <spdlog/fmt/fmt.h>

#include <string>
#include <utility>

namespace regdec
{
namespace detail
{

ResolveRootResult::Var resolveRoot(const Location& location)
{
    const auto root_key = lookupRoot(location.root);
    if (!root_key)
    {
        return makeError(ErrorCode::UnknownRoot, fmt::format("registry: unknown root key '{}'.", location.root));
    }
    return *root_key;
}

}  // namespace detail

Decoder::MakeResult::Var Decoder::make(Store& store, const std::string& location)
{
    auto maybe_location = Location::parse(location);
    if (auto* const failure = cetl::get_if<Location::ParseResult::Failure>(&maybe_location))
    {
        common::getLogger("regdec")->debug("Failed to make decoder: {}", failure->message);
        return std::move(*failure);
    }

    return Decoder{store, cetl::get<Location::ParseResult::Success>(std::move(maybe_location))};
}

}  // namespace regdec
