//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef REGDEC_VALUE_TYPE_HPP_INCLUDED
#define REGDEC_VALUE_TYPE_HPP_INCLUDED

#include <cstdint>

namespace regdec
{

/// Store-defined type tag of a value.
///
/// Numeric values are the ones of the Windows registry `REG_*` constants,
/// so that a native store can pass its tags through unchanged.
///
enum class ValueType : std::uint32_t
{
    None                     = 0,
    String                   = 1,
    ExpandString             = 2,
    Binary                   = 3,
    Dword                    = 4,
    DwordBigEndian           = 5,
    Link                     = 6,
    MultiString              = 7,
    ResourceList             = 8,
    FullResourceDescriptor   = 9,
    ResourceRequirementsList = 10,
    Qword                    = 11,

};  // ValueType

inline const char* describeValueType(const ValueType value_type) noexcept
{
    switch (value_type)
    {
    case ValueType::None:
        return "REG_NONE";
    case ValueType::String:
        return "REG_SZ";
    case ValueType::ExpandString:
        return "REG_EXPAND_SZ";
    case ValueType::Binary:
        return "REG_BINARY";
    case ValueType::Dword:
        return "REG_DWORD";
    case ValueType::DwordBigEndian:
        return "REG_DWORD_BIG_ENDIAN";
    case ValueType::Link:
        return "REG_LINK";
    case ValueType::MultiString:
        return "REG_MULTI_SZ";
    case ValueType::ResourceList:
        return "REG_RESOURCE_LIST";
    case ValueType::FullResourceDescriptor:
        return "REG_FULL_RESOURCE_DESCRIPTOR";
    case ValueType::ResourceRequirementsList:
        return "REG_RESOURCE_REQUIREMENTS_LIST";
    case ValueType::Qword:
        return "REG_QWORD";
    default:
        return "REG_UNKNOWN";
    }
}

}  // namespace regdec

#endif  // REGDEC_VALUE_TYPE_HPP_INCLUDED
