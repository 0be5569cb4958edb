//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef REGDEC_DETAIL_ENGINE_HPP_INCLUDED
#define REGDEC_DETAIL_ENGINE_HPP_INCLUDED

#include "entry.hpp"

#include "regdec/error.hpp"
#include "regdec/store.hpp"

#include <string>

namespace regdec
{
namespace detail
{

/// Populates an entry tree from the store (depth first, in field declaration order).
///
/// Missing optional containers and values are marked as skipped; missing required ones fail.
/// Every container handle opened here is closed before return, on all paths.
///
/// @param parent_path Full path of the parent container; used for logs and error messages only.
///
OptError populate(Entry& entry, Store& store, const Store::Handle parent, const std::string& parent_path);

/// Writes a fully populated entry tree into the target field.
///
/// Decodes and type checks every value first, and only then writes anything,
/// so that on failure the target stays untouched.
///
/// @param field Address of the target field of the entry.
///
OptError unmarshal(Entry& entry, void* const field);

/// Runs the whole decode of an entry tree: resolves the root, populates, and then unmarshals.
///
/// @param root_name Name of the root as given in the location; used for logs and error messages only.
///
OptError decodeTree(Entry&             root_entry,
                    Store&             store,
                    const RootKey      root_key,
                    const std::string& root_name,
                    void* const        target);

}  // namespace detail
}  // namespace regdec

#endif  // REGDEC_DETAIL_ENGINE_HPP_INCLUDED
