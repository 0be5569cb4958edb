//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef REGDEC_GTEST_HELPERS_HPP_INCLUDED
#define REGDEC_GTEST_HELPERS_HPP_INCLUDED

#include <regdec/error.hpp>
#include <regdec/value_codec.hpp>
#include <regdec/value_type.hpp>

#include <cetl/pf17/cetlpf.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest-matchers.h>
#include <gtest/gtest-printers.h>

#include <ostream>
#include <string>
#include <utility>

namespace regdec
{

// MARK: - GTest Printers:

inline void PrintTo(const ErrorCode code, std::ostream* os)
{
    *os << describeErrorCode(code);
}

inline void PrintTo(const ValueType value_type, std::ostream* os)
{
    *os << describeValueType(value_type);
}

inline void PrintTo(const Error& error, std::ostream* os)
{
    *os << "Error{code=" << describeErrorCode(error.code) << ", msg='" << error.message << "'}";
}

inline void PrintTo(const OptError& maybe_error, std::ostream* os)
{
    if (maybe_error)
    {
        PrintTo(*maybe_error, os);
    }
    else
    {
        *os << "nullopt";
    }
}

inline void PrintTo(const CanonicalKind kind, std::ostream* os)
{
    *os << describeCanonicalKind(kind);
}

// MARK: - GTest Matchers:

/// Matches either an `Error` or a present `OptError`.
///
class ErrorMatcher
{
public:
    ErrorMatcher(const ErrorCode code, testing::Matcher<const std::string&> message_matcher)
        : code_{code}
        , message_matcher_(std::move(message_matcher))
    {
    }

    bool MatchAndExplain(const Error& error, testing::MatchResultListener* listener) const
    {
        if (error.code != code_)
        {
            if (listener->IsInterested())
            {
                *listener << "whose code is " << describeErrorCode(error.code);
            }
            return false;
        }
        return message_matcher_.MatchAndExplain(error.message, listener);
    }

    bool MatchAndExplain(const OptError& maybe_error, testing::MatchResultListener* listener) const
    {
        if (!maybe_error)
        {
            if (listener->IsInterested())
            {
                *listener << "which is nullopt";
            }
            return false;
        }
        return MatchAndExplain(*maybe_error, listener);
    }

    void DescribeTo(std::ostream* os) const
    {
        *os << "is an error with code " << describeErrorCode(code_) << " and message which ";
        message_matcher_.DescribeTo(os);
    }

    void DescribeNegationTo(std::ostream* os) const
    {
        *os << "is not an error with code " << describeErrorCode(code_) << " or message which ";
        message_matcher_.DescribeNegationTo(os);
    }

private:
    ErrorCode                                  code_;
    const testing::Matcher<const std::string&> message_matcher_;

};  // ErrorMatcher

inline testing::PolymorphicMatcher<ErrorMatcher> ErrorWith(
    const ErrorCode                             code,
    const testing::Matcher<const std::string&>& message_matcher = testing::_)
{
    return testing::MakePolymorphicMatcher(ErrorMatcher(code, message_matcher));
}

/// Matches a successful status (`OptError` without an error).
///
class NoErrorMatcher
{
public:
    bool MatchAndExplain(const OptError& maybe_error, testing::MatchResultListener* listener) const
    {
        if (maybe_error && listener->IsInterested())
        {
            *listener << "which is " << testing::PrintToString(*maybe_error);
        }
        return !maybe_error;
    }

    void DescribeTo(std::ostream* os) const
    {
        *os << "is nullopt";
    }

    void DescribeNegationTo(std::ostream* os) const
    {
        *os << "is an error";
    }

};  // NoErrorMatcher

inline testing::PolymorphicMatcher<NoErrorMatcher> NoError()
{
    return testing::MakePolymorphicMatcher(NoErrorMatcher{});
}

}  // namespace regdec

#endif  // REGDEC_GTEST_HELPERS_HPP_INCLUDED
