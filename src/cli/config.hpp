//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef REGDEC_CLI_CONFIG_HPP_INCLUDED
#define REGDEC_CLI_CONFIG_HPP_INCLUDED

#include <regdec/toml_store.hpp>

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <memory>
#include <string>

namespace regdec
{
namespace cli
{

class Config
{
public:
    using Ptr = std::shared_ptr<Config>;

    /// Loads configuration from a TOML file.
    ///
    /// Missing or malformed file is not an error - the result just has no settings at all.
    ///
    CETL_NODISCARD static Ptr make(const std::string& file_path);

    CETL_NODISCARD static Ptr makeFromText(const std::string& text);

    Config(const Config&)                = delete;
    Config(Config&&) noexcept            = delete;
    Config& operator=(const Config&)     = delete;
    Config& operator=(Config&&) noexcept = delete;

    virtual ~Config() = default;

    /// Gets hive files per root, from the `[hives]` table (keyed by root names, like `hklm`).
    ///
    /// Entries with unknown root names are ignored.
    ///
    CETL_NODISCARD virtual auto getHiveFiles() const -> TomlStore::HiveFiles = 0;

    CETL_NODISCARD virtual auto getLoggingFile() const -> cetl::optional<std::string>       = 0;
    CETL_NODISCARD virtual auto getLoggingLevel() const -> cetl::optional<std::string>      = 0;
    CETL_NODISCARD virtual auto getLoggingFlushLevel() const -> cetl::optional<std::string> = 0;

protected:
    Config() = default;

};  // Config

}  // namespace cli
}  // namespace regdec

#endif  // REGDEC_CLI_CONFIG_HPP_INCLUDED
