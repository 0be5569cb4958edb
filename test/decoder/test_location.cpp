//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "regdec/location.hpp"

#include "regdec_gtest_helpers.hpp"

#include <regdec/error.hpp>
#include <regdec/store.hpp>

#include <cetl/pf17/cetlpf.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <string>

namespace
{

using namespace regdec;  // NOLINT This our main concern here in the unit tests.

using testing::_;
using testing::HasSubstr;
using testing::VariantWith;

class TestLocation : public testing::Test
{
protected:
    using Result = Location::ParseResult;

    static Location parseOk(const std::string& str)
    {
        auto maybe_location = Location::parse(str);
        EXPECT_THAT(maybe_location, VariantWith<Result::Success>(_)) << str;
        if (const auto* const location = cetl::get_if<Result::Success>(&maybe_location))
        {
            return *location;
        }
        return {};
    }
};

// MARK: - Tests:

TEST_F(TestLocation, parse)
{
    {
        const auto location = parseOk("//hklm/Software/HowettNET/Test");
        EXPECT_THAT(location.root, "hklm");
        EXPECT_THAT(location.path, "Software\\HowettNET\\Test");
    }

    // Root is case insensitive; percent escapes are decoded.
    {
        const auto location = parseOk("//HKLM/SOFTWARE/Microsoft/Windows%20NT/CurrentVersion");
        EXPECT_THAT(location.root, "hklm");
        EXPECT_THAT(location.path, "SOFTWARE\\Microsoft\\Windows NT\\CurrentVersion");
    }

    // Plain spaces are kept.
    {
        const auto location = parseOk("//hkcu/Control Panel/Desktop");
        EXPECT_THAT(location.root, "hkcu");
        EXPECT_THAT(location.path, "Control Panel\\Desktop");
    }

    // Root only.
    {
        const auto location = parseOk("//hku");
        EXPECT_THAT(location.root, "hku");
        EXPECT_THAT(location.path, "");
    }
    {
        const auto location = parseOk("//hku/");
        EXPECT_THAT(location.root, "hku");
        EXPECT_THAT(location.path, "");
    }
}

TEST_F(TestLocation, parse_scheme_query_and_empty_segments)
{
    {
        const auto location = parseOk("reg://hklm/Software//Test/");
        EXPECT_THAT(location.root, "hklm");
        EXPECT_THAT(location.path, "Software\\Test");
    }
    {
        const auto location = parseOk("//hkcu/Software/App?view=64#top");
        EXPECT_THAT(location.root, "hkcu");
        EXPECT_THAT(location.path, "Software\\App");
    }
    {
        // Unknown roots are not rejected by the parser.
        const auto location = parseOk("//bogus/Some/Path");
        EXPECT_THAT(location.root, "bogus");
        EXPECT_THAT(location.path, "Some\\Path");
    }
}

TEST_F(TestLocation, parse_malformed)
{
    for (const auto* const str : {"", "hklm/Software", "/hklm/Software", "//", "///Software", "1reg://hklm", "reg//hklm"})
    {
        EXPECT_THAT(Location::parse(str), VariantWith<Result::Failure>(ErrorWith(ErrorCode::MalformedAddress)))
            << "'" << str << "'";
    }

    EXPECT_THAT(Location::parse("//hklm/Bad%2"),
                VariantWith<Result::Failure>(ErrorWith(ErrorCode::MalformedAddress, HasSubstr("percent"))));
    EXPECT_THAT(Location::parse("//hklm/Bad%zz/x"),
                VariantWith<Result::Failure>(ErrorWith(ErrorCode::MalformedAddress, HasSubstr("percent"))));
    EXPECT_THAT(Location::parse("//hklm/a%00b"),
                VariantWith<Result::Failure>(ErrorWith(ErrorCode::MalformedAddress, HasSubstr("percent"))));
    EXPECT_THAT(Location::parse("//hklm/SOFTWARE%00junk/Test"),
                VariantWith<Result::Failure>(ErrorWith(ErrorCode::MalformedAddress)));
}

TEST_F(TestLocation, lookup_root)
{
    EXPECT_THAT(lookupRoot("hkcr"), cetl::optional<RootKey>{RootKey::ClassesRoot});
    EXPECT_THAT(lookupRoot("hkcu"), cetl::optional<RootKey>{RootKey::CurrentUser});
    EXPECT_THAT(lookupRoot("hklm"), cetl::optional<RootKey>{RootKey::LocalMachine});
    EXPECT_THAT(lookupRoot("hku"), cetl::optional<RootKey>{RootKey::Users});
    EXPECT_THAT(lookupRoot("hkcc"), cetl::optional<RootKey>{RootKey::CurrentConfig});

    EXPECT_FALSE(lookupRoot("bogus").has_value());
    EXPECT_FALSE(lookupRoot("HKLM").has_value());
    EXPECT_FALSE(lookupRoot("").has_value());
}

}  // namespace
