//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "config.hpp"

#include <regdec/location.hpp>
#include <regdec/toml_store.hpp>

#include <cetl/pf17/cetlpf.hpp>

#include <spdlog/spdlog.h>
#include <toml.hpp>

#include <algorithm>
#include <cctype>
#include <exception>
#include <memory>
#include <string>
#include <utility>

namespace regdec
{
namespace cli
{
namespace
{

class ConfigImpl final : public Config
{
public:
    using TomlConf  = toml::ordered_type_config;
    using TomlValue = toml::basic_value<TomlConf>;

    explicit ConfigImpl(TomlValue&& root)
        : root_{std::move(root)}
    {
    }

    // Config

    auto getHiveFiles() const -> TomlStore::HiveFiles override
    {
        TomlStore::HiveFiles hive_files;
        if (!root_.is_table() || !root_.contains("hives") || !root_.at("hives").is_table())
        {
            return hive_files;
        }

        for (const auto& root_file : root_.at("hives").as_table())
        {
            std::string root_name = root_file.first;
            std::transform(root_name.begin(), root_name.end(), root_name.begin(), [](const unsigned char ch) {
                //
                return static_cast<char>(std::tolower(ch));
            });

            const auto root_key = lookupRoot(root_name);
            if (!root_key || !root_file.second.is_string())
            {
                spdlog::warn("Ignoring hive config entry '{}'.", root_file.first);
                continue;
            }
            hive_files[*root_key] = root_file.second.as_string();
        }
        return hive_files;
    }

    auto getLoggingFile() const -> cetl::optional<std::string> override
    {
        return findImpl<std::string>("logging", "file");
    }

    auto getLoggingLevel() const -> cetl::optional<std::string> override
    {
        return findImpl<std::string>("logging", "level");
    }

    auto getLoggingFlushLevel() const -> cetl::optional<std::string> override
    {
        return findImpl<std::string>("logging", "flush_level");
    }

private:
    template <typename T, typename... Keys>
    cetl::optional<T> findImpl(Keys&&... keys) const
    {
        try
        {
            return cetl::make_optional(toml::find<T>(root_, std::forward<Keys>(keys)...));

        } catch (const std::exception&)
        {
            return cetl::nullopt;
        }
    }

    TomlValue root_;

};  // ConfigImpl

}  // namespace

Config::Ptr Config::make(const std::string& file_path)
{
    try
    {
        auto root = toml::parse<ConfigImpl::TomlConf>(file_path);
        return std::make_shared<ConfigImpl>(std::move(root));

    } catch (const std::exception& ex)
    {
        spdlog::warn("Failed to load config file '{}' - using defaults. Error: {}", file_path, ex.what());
        return std::make_shared<ConfigImpl>(ConfigImpl::TomlValue{ConfigImpl::TomlValue::table_type{}});
    }
}

Config::Ptr Config::makeFromText(const std::string& text)
{
    try
    {
        auto root = toml::parse_str<ConfigImpl::TomlConf>(text);
        return std::make_shared<ConfigImpl>(std::move(root));

    } catch (const std::exception& ex)
    {
        spdlog::warn("Failed to parse config - using defaults. Error: {}", ex.what());
        return std::make_shared<ConfigImpl>(ConfigImpl::TomlValue{ConfigImpl::TomlValue::table_type{}});
    }
}

}  // namespace cli
}  // namespace regdec
