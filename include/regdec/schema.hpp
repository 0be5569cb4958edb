//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef REGDEC_SCHEMA_HPP_INCLUDED
#define REGDEC_SCHEMA_HPP_INCLUDED

#include <cetl/pf17/cetlpf.hpp>

#include <cstddef>
#include <string>
#include <tuple>
#include <type_traits>
#include <vector>

/// Declares a field of a composite type, using the member name as the declared field name.
///
/// The tag has `name[,required][,embedded]` syntax; an empty name defaults to the member name,
/// and exactly `-` excludes the field. For example:
/// ```
/// struct Settings
/// {
///     std::string   title;
///     std::uint32_t timeout_ms;
///
///     static auto regdecSchema()
///     {
///         return regdec::fields(REGDEC_FIELD(Settings, title, "Title,required"),
///                               REGDEC_FIELD(Settings, timeout_ms, "TimeoutMs"));
///     }
/// };
/// ```
#define REGDEC_FIELD(Type, member, tag) ::regdec::field(&Type::member, #member, tag)

namespace regdec
{

/// Resolved schema information of a single field.
///
struct FieldSpec
{
    /// Name of the store container or value.
    std::string name;

    /// A missing required container or value fails the whole decode.
    bool required{false};

    /// Members of an embedded composite are read from the enclosing container.
    bool embedded{false};

    /// Chain of declaration indices from the root type down to this field.
    /// Diagnostics only; fields are addressed through member pointers.
    std::vector<std::size_t> index;

};  // FieldSpec

/// Describes a declared field of the `Owner` composite type.
///
template <typename Owner, typename Member>
struct FieldDesc
{
    using OwnerType  = Owner;
    using MemberType = Member;

    Member Owner::*member;
    const char*    declared_name;
    const char*    tag;

};  // FieldDesc

template <typename Owner, typename Member>
constexpr FieldDesc<Owner, Member> field(Member Owner::*member, const char* declared_name, const char* tag = "")
{
    return FieldDesc<Owner, Member>{member, declared_name, tag};
}

/// Makes an ordered list of field descriptors (in declaration order).
///
template <typename... Fields>
constexpr std::tuple<Fields...> fields(const Fields&... descs)
{
    return std::tuple<Fields...>{descs...};
}

/// Non-intrusive schema registration.
///
/// Specialize it with a static `fields()` function (returning `regdec::fields(...)`)
/// for types which can't have the `regdecSchema()` static member function.
///
template <typename T>
struct Schema
{};

/// Parses a field tag.
///
/// @return Field spec with resolved name and flags (but empty index),
///         or `cetl::nullopt` if the field is excluded from the schema.
///
cetl::optional<FieldSpec> parseFieldTag(const std::string& tag, const std::string& declared_name);

namespace detail
{

template <typename...>
struct MakeVoid
{
    using type = void;
};
template <typename... Ts>
using VoidT = typename MakeVoid<Ts...>::type;

template <typename T, typename = void>
struct HasMemberSchema : std::false_type
{};
template <typename T>
struct HasMemberSchema<T, VoidT<decltype(T::regdecSchema())>> : std::true_type
{};

template <typename T, typename = void>
struct HasSchemaSpecialization : std::false_type
{};
template <typename T>
struct HasSchemaSpecialization<T, VoidT<decltype(Schema<T>::fields())>> : std::true_type
{};

/// A composite is any type with a registered schema.
///
template <typename T>
struct IsComposite
    : std::integral_constant<bool, HasMemberSchema<T>::value || HasSchemaSpecialization<T>::value>
{};

template <typename T>
auto schemaFieldsOf(std::true_type /* has member */)
{
    return T::regdecSchema();
}
template <typename T>
auto schemaFieldsOf(std::false_type /* has member */)
{
    return Schema<T>::fields();
}

/// Gets field descriptors of a composite type; the member function takes precedence over the specialization.
///
template <typename T>
auto schemaFieldsOf()
{
    static_assert(IsComposite<T>::value, "registry: type has no registered schema");
    return schemaFieldsOf<T>(HasMemberSchema<T>{});
}

}  // namespace detail
}  // namespace regdec

#endif  // REGDEC_SCHEMA_HPP_INCLUDED
