//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef REGDEC_DETAIL_VALUE_CONVERTER_HPP_INCLUDED
#define REGDEC_DETAIL_VALUE_CONVERTER_HPP_INCLUDED

#include "regdec/value_codec.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <cstdint>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace regdec
{
namespace detail
{

/// Converts canonical values into target fields of type `T`.
///
/// Every specialization provides:
/// - `accepts(kind)`, which tells whether a canonical kind is compatible with `T`;
/// - `assign(value, target)`, which writes an accepted value into the target;
/// - `typeName()`, which describes `T` for error messages.
///
/// Target types without a specialization can't be used as value fields.
///
template <typename T, typename = void>
struct ValueConverter;

template <typename T>
struct IsSmallInteger : std::integral_constant<bool,
                                               std::is_integral<T>::value && !std::is_same<T, bool>::value &&
                                                   (sizeof(T) <= sizeof(std::uint32_t))>
{};

template <typename T>
struct IsBigInteger : std::integral_constant<bool,
                                             std::is_integral<T>::value && !std::is_same<T, bool>::value &&
                                                 (sizeof(T) == sizeof(std::uint64_t))>
{};

template <typename T>
std::string integerTypeName()
{
    return (std::is_signed<T>::value ? "int" : "uint") + std::to_string(sizeof(T) * 8);  // NOLINT(*-magic-numbers)
}

/// Integers up to 32 bits accept `Integer` only.
///
/// Narrowing is not range checked, so `0x12345` becomes `0x2345` in a 16-bit field.
///
template <typename T>
struct ValueConverter<T, std::enable_if_t<IsSmallInteger<T>::value>>
{
    static bool accepts(const CanonicalKind kind) noexcept
    {
        return kind == CanonicalKind::Integer;
    }

    static void assign(CanonicalValue&& value, T& target)
    {
        target = static_cast<T>(cetl::get<std::uint32_t>(value));
    }

    static std::string typeName()
    {
        return integerTypeName<T>();
    }
};

/// 64-bit integers accept `BigInteger` only.
///
template <typename T>
struct ValueConverter<T, std::enable_if_t<IsBigInteger<T>::value>>
{
    static bool accepts(const CanonicalKind kind) noexcept
    {
        return kind == CanonicalKind::BigInteger;
    }

    static void assign(CanonicalValue&& value, T& target)
    {
        target = static_cast<T>(cetl::get<std::uint64_t>(value));
    }

    static std::string typeName()
    {
        return integerTypeName<T>();
    }
};

template <>
struct ValueConverter<std::string>
{
    static bool accepts(const CanonicalKind kind) noexcept
    {
        return kind == CanonicalKind::Text;
    }

    static void assign(CanonicalValue&& value, std::string& target)
    {
        target = cetl::get<std::string>(std::move(value));
    }

    static std::string typeName()
    {
        return "string";
    }
};

template <>
struct ValueConverter<std::vector<std::string>>
{
    static bool accepts(const CanonicalKind kind) noexcept
    {
        return kind == CanonicalKind::TextList;
    }

    static void assign(CanonicalValue&& value, std::vector<std::string>& target)
    {
        target = cetl::get<std::vector<std::string>>(std::move(value));
    }

    static std::string typeName()
    {
        return "list of strings";
    }
};

template <>
struct ValueConverter<std::vector<std::uint8_t>>
{
    static bool accepts(const CanonicalKind kind) noexcept
    {
        return kind == CanonicalKind::Blob;
    }

    static void assign(CanonicalValue&& value, std::vector<std::uint8_t>& target)
    {
        target = cetl::get<std::vector<std::uint8_t>>(std::move(value));
    }

    static std::string typeName()
    {
        return "byte array";
    }
};

/// Pointer fields are allocated (anew) only once a value has been accepted.
///
template <typename T>
struct ValueConverter<std::unique_ptr<T>>
{
    static bool accepts(const CanonicalKind kind) noexcept
    {
        return ValueConverter<T>::accepts(kind);
    }

    static void assign(CanonicalValue&& value, std::unique_ptr<T>& target)
    {
        target = std::make_unique<T>();
        ValueConverter<T>::assign(std::move(value), *target);
    }

    static std::string typeName()
    {
        return "pointer to " + ValueConverter<T>::typeName();
    }
};

template <typename T>
struct ValueConverter<cetl::optional<T>>
{
    static bool accepts(const CanonicalKind kind) noexcept
    {
        return ValueConverter<T>::accepts(kind);
    }

    static void assign(CanonicalValue&& value, cetl::optional<T>& target)
    {
        target.emplace();
        ValueConverter<T>::assign(std::move(value), *target);
    }

    static std::string typeName()
    {
        return "optional " + ValueConverter<T>::typeName();
    }
};

/// Type erased `ValueConverter<T>::assign`, where `field` is the address of a `T` field.
///
template <typename T>
void assignToField(void* const field, CanonicalValue&& value)
{
    ValueConverter<T>::assign(std::move(value), *static_cast<T*>(field));
}

}  // namespace detail
}  // namespace regdec

#endif  // REGDEC_DETAIL_VALUE_CONVERTER_HPP_INCLUDED
