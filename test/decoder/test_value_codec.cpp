//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "regdec/value_codec.hpp"

#include "regdec_gtest_helpers.hpp"
#include "store_mock.hpp"

#include <regdec/error.hpp>
#include <regdec/value_type.hpp>

#include <cetl/pf17/cetlpf.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <cstdint>
#include <string>
#include <vector>

namespace
{

using namespace regdec;  // NOLINT This our main concern here in the unit tests.

using testing::_;
using testing::IsEmpty;
using testing::ElementsAre;
using testing::HasSubstr;
using testing::VariantWith;

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

class TestValueCodec : public testing::Test
{
protected:
    using Bytes = std::vector<std::uint8_t>;

    static DecodeResult::Var decode(const Bytes& raw_data, const ValueType value_type)
    {
        return decodeRaw(raw_data, value_type, "Value");
    }
};

// MARK: - Tests:

TEST_F(TestValueCodec, dword)
{
    EXPECT_THAT(decode({0x78, 0x56, 0x34, 0x12}, ValueType::Dword),
                VariantWith<CanonicalValue>(VariantWith<std::uint32_t>(0x12345678U)));

    EXPECT_THAT(decode({0x12, 0x34, 0x56, 0x78}, ValueType::DwordBigEndian),
                VariantWith<CanonicalValue>(VariantWith<std::uint32_t>(0x12345678U)));

    // Extra trailing bytes are ignored.
    EXPECT_THAT(decode({0x01, 0x00, 0x00, 0x00, 0xFF}, ValueType::Dword),
                VariantWith<CanonicalValue>(VariantWith<std::uint32_t>(1U)));
}

TEST_F(TestValueCodec, qword)
{
    EXPECT_THAT(decode({0xEF, 0xCD, 0xAB, 0x89, 0x67, 0x45, 0x23, 0x01}, ValueType::Qword),
                VariantWith<CanonicalValue>(VariantWith<std::uint64_t>(0x0123456789ABCDEFULL)));
}

TEST_F(TestValueCodec, short_integer_payload)
{
    EXPECT_THAT(decode({0x01, 0x02, 0x03}, ValueType::Dword),
                VariantWith<Error>(ErrorWith(ErrorCode::MalformedValue, HasSubstr("'Value'"))));
    EXPECT_THAT(decode({}, ValueType::DwordBigEndian), VariantWith<Error>(ErrorWith(ErrorCode::MalformedValue)));
    EXPECT_THAT(decode({1, 2, 3, 4, 5, 6, 7}, ValueType::Qword),
                VariantWith<Error>(ErrorWith(ErrorCode::MalformedValue)));
}

TEST_F(TestValueCodec, text)
{
    // "AB" followed by the 2-byte terminator.
    EXPECT_THAT(decode({'A', 0, 'B', 0, 0, 0}, ValueType::String),
                VariantWith<CanonicalValue>(VariantWith<std::string>("AB")));

    EXPECT_THAT(decode(textBytes("%SystemRoot%"), ValueType::ExpandString),
                VariantWith<CanonicalValue>(VariantWith<std::string>("%SystemRoot%")));

    // Non-ASCII: "é€" and U+1F600 (as a surrogate pair).
    EXPECT_THAT(decode({0xE9, 0x00, 0xAC, 0x20, 0x3D, 0xD8, 0x00, 0xDE, 0, 0}, ValueType::String),
                VariantWith<CanonicalValue>(VariantWith<std::string>("\xC3\xA9\xE2\x82\xAC\xF0\x9F\x98\x80")));
}

TEST_F(TestValueCodec, text_malformed)
{
    // Too short to have even the terminator.
    EXPECT_THAT(decode({}, ValueType::String), VariantWith<CanonicalValue>(VariantWith<std::string>("")));
    EXPECT_THAT(decode({'A'}, ValueType::String), VariantWith<CanonicalValue>(VariantWith<std::string>("")));

    // Odd trailing byte becomes the replacement character.
    EXPECT_THAT(decode({'A', 0, 'B', 0, 0}, ValueType::String),
                VariantWith<CanonicalValue>(VariantWith<std::string>("A\xEF\xBF\xBD")));

    // Unpaired surrogate becomes the replacement character.
    EXPECT_THAT(decode({0x3D, 0xD8, 'A', 0, 0, 0}, ValueType::String),
                VariantWith<CanonicalValue>(VariantWith<std::string>("\xEF\xBF\xBD" "A")));
}

TEST_F(TestValueCodec, multi_text)
{
    using Strings = std::vector<std::string>;

    // "A", NUL, "B", and then the 2-byte terminator - the last two segments are dropped.
    EXPECT_THAT(decode({'A', 0, 0, 0, 'B', 0, 0, 0}, ValueType::MultiString),
                VariantWith<CanonicalValue>(VariantWith<Strings>(ElementsAre("A"))));

    // Each string terminated, plus the list terminator.
    EXPECT_THAT(decode({'A', 0, 0, 0, 'B', 0, 0, 0, 0, 0}, ValueType::MultiString),
                VariantWith<CanonicalValue>(VariantWith<Strings>(ElementsAre("A", "B"))));

    EXPECT_THAT(decode({}, ValueType::MultiString),
                VariantWith<CanonicalValue>(VariantWith<Strings>(IsEmpty())));
    EXPECT_THAT(decode({0, 0}, ValueType::MultiString),
                VariantWith<CanonicalValue>(VariantWith<Strings>(IsEmpty())));
}

TEST_F(TestValueCodec, binary)
{
    EXPECT_THAT(decode({0x00, 0xFF, 0x10}, ValueType::Binary),
                VariantWith<CanonicalValue>(VariantWith<Bytes>(ElementsAre(0x00, 0xFF, 0x10))));
    EXPECT_THAT(decode({}, ValueType::Binary), VariantWith<CanonicalValue>(VariantWith<Bytes>(IsEmpty())));
}

TEST_F(TestValueCodec, unsupported_type)
{
    for (const auto value_type : {ValueType::None,
                                  ValueType::Link,
                                  ValueType::ResourceList,
                                  ValueType::FullResourceDescriptor,
                                  ValueType::ResourceRequirementsList,
                                  static_cast<ValueType>(0x42)})
    {
        EXPECT_THAT(decode({1, 2, 3, 4}, value_type),
                    VariantWith<Error>(ErrorWith(ErrorCode::UnsupportedStoreType, HasSubstr("'Value'"))))
            << describeValueType(value_type);
    }

    EXPECT_THAT(decode({}, ValueType::Link),
                VariantWith<Error>(ErrorWith(ErrorCode::UnsupportedStoreType, HasSubstr("0x00000006 (REG_LINK)"))));
}

TEST_F(TestValueCodec, kind_of)
{
    EXPECT_THAT(kindOf(CanonicalValue{std::uint64_t{1}}), CanonicalKind::BigInteger);
    EXPECT_THAT(kindOf(CanonicalValue{std::uint32_t{1}}), CanonicalKind::Integer);
    EXPECT_THAT(kindOf(CanonicalValue{std::string{}}), CanonicalKind::Text);
    EXPECT_THAT(kindOf(CanonicalValue{std::vector<std::string>{}}), CanonicalKind::TextList);
    EXPECT_THAT(kindOf(CanonicalValue{Bytes{}}), CanonicalKind::Blob);
}

// NOLINTEND(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

}  // namespace
