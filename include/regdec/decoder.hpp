//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef REGDEC_DECODER_HPP_INCLUDED
#define REGDEC_DECODER_HPP_INCLUDED

#include "error.hpp"
#include "location.hpp"
#include "schema.hpp"
#include "store.hpp"
#include "detail/engine.hpp"
#include "detail/entry_builder.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <functional>
#include <string>
#include <utility>

namespace regdec
{
namespace detail
{

struct ResolveRootResult
{
    using Success = RootKey;
    using Failure = Error;
    using Var     = cetl::variant<Success, Failure>;
};

/// Resolves the root of a location into a predefined root key; fails with `UnknownRoot`.
///
ResolveRootResult::Var resolveRoot(const Location& location);

}  // namespace detail

/// Decodes store containers into statically typed composites.
///
/// A decoder is bound to a store and a location; every `decode` call rebuilds its entry tree
/// from the target type, so one decoder might be used for different target types.
///
class Decoder final
{
public:
    struct MakeResult
    {
        using Success = Decoder;
        using Failure = Error;
        using Var     = cetl::variant<Success, Failure>;
    };

    /// Makes a new decoder.
    ///
    /// @param store The store to read from. Must outlive the decoder.
    /// @param location Location string of the root container (see `Location::parse`).
    ///
    static MakeResult::Var make(Store& store, const std::string& location);

    /// Decodes the container at the location of this decoder into the given target.
    ///
    /// On failure the target is left untouched.
    ///
    /// @return `cetl::nullopt` on success, otherwise the first error encountered.
    ///
    template <typename T>
    CETL_NODISCARD OptError decode(T& target) const
    {
        static_assert(detail::IsComposite<T>::value, "registry: decode target must be a composite type");

        auto maybe_root = detail::resolveRoot(location_);
        if (auto* const failure = cetl::get_if<detail::ResolveRootResult::Failure>(&maybe_root))
        {
            return std::move(*failure);
        }
        const auto root_key = cetl::get<detail::ResolveRootResult::Success>(maybe_root);

        FieldSpec root_spec;
        root_spec.name     = location_.path;
        root_spec.required = true;

        auto maybe_entry = detail::buildEntry<T>(std::move(root_spec));
        if (auto* const failure = cetl::get_if<detail::BuildResult::Failure>(&maybe_entry))
        {
            return std::move(*failure);
        }
        const auto root_entry = cetl::get<detail::BuildResult::Success>(std::move(maybe_entry));

        return detail::decodeTree(*root_entry, store_.get(), root_key, location_.root, &target);
    }

    const Location& location() const noexcept
    {
        return location_;
    }

private:
    Decoder(Store& store, Location location)
        : store_{store}
        , location_{std::move(location)}
    {
    }

    std::reference_wrapper<Store> store_;
    Location                      location_;

};  // Decoder

/// Decodes the container at the given location into the target.
///
/// Same as `Decoder::make` followed by `Decoder::decode`.
///
template <typename T>
CETL_NODISCARD OptError decode(Store& store, const std::string& location, T& target)
{
    auto maybe_decoder = Decoder::make(store, location);
    if (auto* const failure = cetl::get_if<Decoder::MakeResult::Failure>(&maybe_decoder))
    {
        return std::move(*failure);
    }
    return cetl::get<Decoder::MakeResult::Success>(maybe_decoder).decode(target);
}

}  // namespace regdec

#endif  // REGDEC_DECODER_HPP_INCLUDED
