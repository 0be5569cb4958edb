//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef REGDEC_DETAIL_ENTRY_BUILDER_HPP_INCLUDED
#define REGDEC_DETAIL_ENTRY_BUILDER_HPP_INCLUDED

#include "entry.hpp"
#include "value_converter.hpp"

#include "regdec/error.hpp"
#include "regdec/schema.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <cstddef>
#include <memory>
#include <string>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

namespace regdec
{
namespace detail
{

struct BuildResult
{
    using Success = EntryPtr;
    using Failure = Error;
    using Var     = cetl::variant<Success, Failure>;
};

/// Unwraps one level of pointer or optional around a field type.
///
template <typename T>
struct Unwrap
{
    using Type = T;

    static void* materialize(void* const field)
    {
        return field;
    }
};

template <typename T>
struct Unwrap<std::unique_ptr<T>>
{
    using Type = T;

    static void* materialize(void* const field)
    {
        auto& ptr = *static_cast<std::unique_ptr<T>*>(field);
        if (!ptr)
        {
            ptr = std::make_unique<T>();
        }
        return ptr.get();
    }
};

template <typename T>
struct Unwrap<cetl::optional<T>>
{
    using Type = T;

    static void* materialize(void* const field)
    {
        auto& opt = *static_cast<cetl::optional<T>*>(field);
        if (!opt.has_value())
        {
            opt.emplace();
        }
        return &opt.value();
    }
};

/// Checks that store names of subentries are unique (case insensitive, as store names are).
///
/// Fields of embedded members are checked together with the enclosing ones, since they are read
/// from the same container; the name of an embedded member itself is not a store name.
///
OptError checkUniqueNames(const FieldSpec& parent, const std::vector<EntryPtr>& subentries);

template <typename Field>
BuildResult::Var buildEntry(FieldSpec spec);

template <typename Composite, typename Owner, typename Member>
OptError appendSubentry(const FieldDesc<Owner, Member>& desc,
                        const std::size_t               decl_index,
                        const FieldSpec&                parent,
                        std::vector<EntryPtr>&          subentries)
{
    static_assert(std::is_base_of<Owner, Composite>::value || std::is_same<Owner, Composite>::value,
                  "registry: field belongs to another type");

    auto maybe_spec = parseFieldTag(desc.tag, desc.declared_name);
    if (!maybe_spec)
    {
        return cetl::nullopt;
    }
    FieldSpec spec = std::move(*maybe_spec);
    spec.index     = parent.index;
    spec.index.push_back(decl_index);

    if (spec.embedded && !IsComposite<typename Unwrap<Member>::Type>::value)
    {
        return makeError(ErrorCode::MalformedTarget,
                         "registry: embedded field '" + std::string{desc.declared_name} + "' of '" + parent.name +
                             "' is not a struct.");
    }

    auto maybe_entry = buildEntry<Member>(std::move(spec));
    if (auto* const failure = cetl::get_if<BuildResult::Failure>(&maybe_entry))
    {
        return std::move(*failure);
    }
    auto entry = cetl::get<BuildResult::Success>(std::move(maybe_entry));

    const auto member = desc.member;
    entry->locate     = [member](void* const parent_composite) -> void* {
        //
        return &(static_cast<Composite*>(parent_composite)->*member);
    };
    subentries.push_back(std::move(entry));
    return cetl::nullopt;
}

template <typename Composite, std::size_t Index, typename Fields>
std::enable_if_t<(Index == std::tuple_size<Fields>::value), OptError> appendSubentries(const Fields&,
                                                                                       const FieldSpec&,
                                                                                       std::vector<EntryPtr>&)
{
    return cetl::nullopt;
}

template <typename Composite, std::size_t Index, typename Fields>
std::enable_if_t<(Index < std::tuple_size<Fields>::value), OptError> appendSubentries(const Fields&          descs,
                                                                                      const FieldSpec&       parent,
                                                                                      std::vector<EntryPtr>& subentries)
{
    if (auto failure = appendSubentry<Composite>(std::get<Index>(descs), Index, parent, subentries))
    {
        return failure;
    }
    return appendSubentries<Composite, Index + 1>(descs, parent, subentries);
}

template <typename Field>
BuildResult::Var buildEntryImpl(FieldSpec spec, std::true_type /* is composite */)
{
    using Composite = typename Unwrap<Field>::Type;

    ContainerNode node;
    node.materialize = &Unwrap<Field>::materialize;

    const auto descs = schemaFieldsOf<Composite>();
    if (auto failure = appendSubentries<Composite, 0>(descs, spec, node.subentries))
    {
        return std::move(*failure);
    }
    if (auto failure = checkUniqueNames(spec, node.subentries))
    {
        return std::move(*failure);
    }

    auto entry   = std::make_unique<Entry>();
    entry->field = std::move(spec);
    entry->node  = std::move(node);
    return BuildResult::Var{std::move(entry)};
}

template <typename Field>
BuildResult::Var buildEntryImpl(FieldSpec spec, std::false_type /* is composite */)
{
    using Converter = ValueConverter<Field>;

    ValueNode node;
    node.accepts     = &Converter::accepts;
    node.assign      = &assignToField<Field>;
    node.target_type = Converter::typeName();

    auto entry   = std::make_unique<Entry>();
    entry->field = std::move(spec);
    entry->node  = std::move(node);
    return BuildResult::Var{std::move(entry)};
}

/// Builds the entry tree of a field type.
///
/// Pure, no I/O. Composites (see `IsComposite`) become container entries, and everything else
/// becomes value entries; a pointer or optional is unwrapped one level first.
///
template <typename Field>
BuildResult::Var buildEntry(FieldSpec spec)
{
    return buildEntryImpl<Field>(std::move(spec), IsComposite<typename Unwrap<Field>::Type>{});
}

}  // namespace detail
}  // namespace regdec

#endif  // REGDEC_DETAIL_ENTRY_BUILDER_HPP_INCLUDED
