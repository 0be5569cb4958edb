//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "regdec/schema.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <cstddef>
#include <string>

namespace regdec
{

cetl::optional<FieldSpec> parseFieldTag(const std::string& tag, const std::string& declared_name)
{
    if (tag == "-")
    {
        return cetl::nullopt;
    }

    FieldSpec spec;

    std::size_t begin = 0;
    std::size_t comma = tag.find(',');
    spec.name         = tag.substr(0, comma);
    if (spec.name.empty())
    {
        spec.name = declared_name;
    }

    // Unknown options are ignored.
    while (comma != std::string::npos)
    {
        begin             = comma + 1;
        comma             = tag.find(',', begin);
        const auto option = tag.substr(begin, (comma == std::string::npos) ? std::string::npos : comma - begin);
        if (option == "required")
        {
            spec.required = true;
        }
        else if (option == "embedded")
        {
            spec.embedded = true;
        }
    }

    return spec;
}

}  // namespace regdec
