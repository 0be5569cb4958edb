//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "regdec/location.hpp"

#include "regdec/error.hpp"
#include "regdec/store.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <cstddef>
#include <string>
#include <utility>

namespace regdec
{
namespace
{

struct RootName
{
    const char* name;
    RootKey     key;
};

// NOLINTNEXTLINE(cert-err58-cpp)
const std::array<RootName, 5> s_root_names{{
    {"hkcr", RootKey::ClassesRoot},
    {"hkcu", RootKey::CurrentUser},
    {"hklm", RootKey::LocalMachine},
    {"hku", RootKey::Users},
    {"hkcc", RootKey::CurrentConfig},
}};

constexpr char PathSeparator = '\\';

std::string toLower(std::string str)
{
    std::transform(str.begin(), str.end(), str.begin(), [](const unsigned char ch) {
        //
        return static_cast<char>(std::tolower(ch));
    });
    return str;
}

bool isValidScheme(const std::string& scheme)
{
    if (scheme.empty() || (std::isalpha(static_cast<unsigned char>(scheme.front())) == 0))
    {
        return false;
    }
    return std::all_of(scheme.cbegin(), scheme.cend(), [](const unsigned char ch) {
        //
        return (std::isalnum(ch) != 0) || (ch == '+') || (ch == '-') || (ch == '.');
    });
}

int hexDigitValue(const char ch)
{
    if ((ch >= '0') && (ch <= '9'))
    {
        return ch - '0';
    }
    if ((ch >= 'a') && (ch <= 'f'))
    {
        return ch - 'a' + 10;  // NOLINT(*-magic-numbers)
    }
    if ((ch >= 'A') && (ch <= 'F'))
    {
        return ch - 'A' + 10;  // NOLINT(*-magic-numbers)
    }
    return -1;
}

cetl::optional<std::string> percentDecode(const std::string& segment)
{
    std::string result;
    result.reserve(segment.size());
    for (std::size_t i = 0; i < segment.size(); ++i)
    {
        if (segment[i] != '%')
        {
            result.push_back(segment[i]);
            continue;
        }
        if (i + 2 >= segment.size())
        {
            return cetl::nullopt;
        }
        const int high = hexDigitValue(segment[i + 1]);
        const int low  = hexDigitValue(segment[i + 2]);
        if ((high < 0) || (low < 0))
        {
            return cetl::nullopt;
        }
        // Store names are null terminated, so an embedded NUL would silently truncate the path.
        if ((high == 0) && (low == 0))
        {
            return cetl::nullopt;
        }
        result.push_back(static_cast<char>((high << 4) | low));  // NOLINT(*-magic-numbers)
        i += 2;
    }
    return result;
}

}  // namespace

Location::ParseResult::Var Location::parse(const std::string& str)
{
    const auto malformed = [&str](const char* const reason) {
        //
        return makeError(ErrorCode::MalformedAddress, fmt::format("registry: malformed location '{}': {}.", str, reason));
    };

    // Optional `scheme:` prefix, and then mandatory `//` authority marker.
    //
    const auto slashes_pos = str.find("//");
    if (slashes_pos == std::string::npos)
    {
        return malformed("expected '//<root>/...'");
    }
    if (slashes_pos > 0)
    {
        if ((str[slashes_pos - 1] != ':') || !isValidScheme(str.substr(0, slashes_pos - 1)))
        {
            return malformed("invalid scheme");
        }
    }

    // Drop `?query` and `#fragment` suffixes, if any.
    //
    const auto rest_begin = slashes_pos + 2;
    const auto rest_end   = std::min(str.find('?', rest_begin), str.find('#', rest_begin));
    const auto rest       = str.substr(rest_begin, (rest_end == std::string::npos) ? rest_end : rest_end - rest_begin);

    const auto root_end = rest.find('/');
    Location   result;
    result.root = toLower(rest.substr(0, root_end));
    if (result.root.empty())
    {
        return malformed("empty root");
    }

    std::size_t begin = (root_end == std::string::npos) ? rest.size() : root_end + 1;
    while (begin < rest.size())
    {
        auto end = rest.find('/', begin);
        if (end == std::string::npos)
        {
            end = rest.size();
        }
        if (end > begin)
        {
            auto segment = percentDecode(rest.substr(begin, end - begin));
            if (!segment)
            {
                return malformed("invalid percent escape");
            }
            if (!result.path.empty())
            {
                result.path.push_back(PathSeparator);
            }
            result.path += *segment;
        }
        begin = end + 1;
    }

    return result;
}

cetl::optional<RootKey> lookupRoot(const std::string& name)
{
    const auto it = std::find_if(s_root_names.cbegin(), s_root_names.cend(), [&name](const RootName& root_name) {
        //
        return name == root_name.name;
    });
    if (it == s_root_names.cend())
    {
        return cetl::nullopt;
    }
    return it->key;
}

}  // namespace regdec
