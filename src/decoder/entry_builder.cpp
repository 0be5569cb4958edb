//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "regdec/detail/entry_builder.hpp"

#include "regdec/detail/entry.hpp"
#include "regdec/error.hpp"
#include "regdec/schema.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cctype>
#include <string>
#include <unordered_set>
#include <vector>

namespace regdec
{
namespace detail
{
namespace
{

std::string foldCase(std::string name)
{
    std::transform(name.begin(), name.end(), name.begin(), [](const unsigned char ch) {
        //
        return static_cast<char>(std::tolower(ch));
    });
    return name;
}

OptError collectNames(const FieldSpec&                 parent,
                      const std::vector<EntryPtr>&     subentries,
                      std::unordered_set<std::string>& names)
{
    for (const auto& subentry : subentries)
    {
        // An embedded member has no store name of its own; its fields live in the enclosing container.
        if (subentry->field.embedded)
        {
            const auto* const node = cetl::get_if<ContainerNode>(&subentry->node);
            CETL_DEBUG_ASSERT(node != nullptr, "Embedded field must be a composite.");

            if (auto failure = collectNames(parent, node->subentries, names))
            {
                return failure;
            }
            continue;
        }

        if (!names.insert(foldCase(subentry->field.name)).second)
        {
            return makeError(ErrorCode::MalformedTarget,
                             fmt::format("registry: duplicate field name '{}' in '{}'.",
                                         subentry->field.name,
                                         parent.name));
        }
    }
    return cetl::nullopt;
}

}  // namespace

OptError checkUniqueNames(const FieldSpec& parent, const std::vector<EntryPtr>& subentries)
{
    std::unordered_set<std::string> names;
    return collectNames(parent, subentries, names);
}

}  // namespace detail
}  // namespace regdec
