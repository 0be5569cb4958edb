//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef REGDEC_DETAIL_ENTRY_HPP_INCLUDED
#define REGDEC_DETAIL_ENTRY_HPP_INCLUDED

#include "regdec/schema.hpp"
#include "regdec/store.hpp"
#include "regdec/value_codec.hpp"
#include "regdec/value_type.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace regdec
{
namespace detail
{

struct Entry;
using EntryPtr = std::unique_ptr<Entry>;

/// Mirrors a composite field, which is backed by a store container.
///
struct ContainerNode
{
    /// Maps the address of the target field to the address of the composite itself,
    /// allocating the composite first if it is behind an empty pointer or optional.
    using Materialize = void* (*) (void* field);

    std::vector<EntryPtr> subentries;  // in field declaration order
    Materialize           materialize{nullptr};

    bool skipped{false};

};  // ContainerNode

/// Mirrors a scalar or array field, which is backed by a store value.
///
struct ValueNode
{
    using Accepts = bool (*)(CanonicalKind kind);
    using Assign  = void (*)(void* field, CanonicalValue&& value);

    Accepts     accepts{nullptr};
    Assign      assign{nullptr};
    std::string target_type;

    cetl::optional<Store::Bytes> raw_data;
    cetl::optional<ValueType>    value_type;
    bool                         skipped{false};

    /// Decoded and type checked value, which awaits to be written into the target.
    cetl::optional<CanonicalValue> staged;

};  // ValueNode

/// A node of the entry tree, which is built from the static shape of a target type,
/// populated from a store, and then consumed exactly once to write a target instance.
///
struct Entry
{
    /// Maps the address of the parent composite to the address of this field.
    /// Empty for the root entry.
    using Locate = std::function<void*(void* parent)>;

    FieldSpec                               field;
    Locate                                  locate;
    cetl::variant<ContainerNode, ValueNode> node;

};  // Entry

}  // namespace detail
}  // namespace regdec

#endif  // REGDEC_DETAIL_ENTRY_HPP_INCLUDED
