//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef REGDEC_STORE_MOCK_HPP_INCLUDED
#define REGDEC_STORE_MOCK_HPP_INCLUDED

#include <regdec/store.hpp>
#include <regdec/value_type.hpp>

#include <gmock/gmock.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace regdec
{

class StoreMock : public Store
{
public:
    StoreMock()           = default;
    ~StoreMock() override = default;

    StoreMock(const StoreMock&)                = delete;
    StoreMock(StoreMock&&) noexcept            = delete;
    StoreMock& operator=(const StoreMock&)     = delete;
    StoreMock& operator=(StoreMock&&) noexcept = delete;

    MOCK_METHOD(Handle, getRoot, (const RootKey root), (const, override));
    MOCK_METHOD(OpenResult::Var, openContainer, (const Handle parent, const std::string& name), (override));
    MOCK_METHOD(int, closeContainer, (const Handle handle), (override));
    MOCK_METHOD(ProbeResult::Var, probeValue, (const Handle handle, const std::string& name), (override));
    MOCK_METHOD(ReadResult::Var,
                readValue,
                (const Handle handle, const std::string& name, const std::size_t size_hint),
                (override));

};  // StoreMock

// MARK: - Raw payload builders:

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

inline Store::Bytes dwordBytes(const std::uint32_t value)
{
    return {static_cast<std::uint8_t>(value),
            static_cast<std::uint8_t>(value >> 8U),
            static_cast<std::uint8_t>(value >> 16U),
            static_cast<std::uint8_t>(value >> 24U)};
}

inline Store::Bytes qwordBytes(const std::uint64_t value)
{
    Store::Bytes bytes;
    for (unsigned i = 0; i < 8; ++i)
    {
        bytes.push_back(static_cast<std::uint8_t>(value >> (i * 8U)));
    }
    return bytes;
}

/// Encodes ASCII text as UTF-16LE with the null terminator.
///
inline Store::Bytes textBytes(const std::string& ascii)
{
    Store::Bytes bytes;
    for (const char ch : ascii)
    {
        bytes.push_back(static_cast<std::uint8_t>(ch));
        bytes.push_back(0);
    }
    bytes.push_back(0);
    bytes.push_back(0);
    return bytes;
}

// NOLINTEND(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

}  // namespace regdec

#endif  // REGDEC_STORE_MOCK_HPP_INCLUDED
