//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "config.hpp"
#include "os_info.hpp"
#include "setup_logging.hpp"

#include <regdec/decoder.hpp>
#include <regdec/error.hpp>
#include <regdec/store.hpp>
#include <regdec/toml_store.hpp>
#ifdef _WIN32
#    include <regdec/platform/registry_store.hpp>
#endif

#include <cetl/pf17/cetlpf.hpp>

#include <spdlog/fmt/fmt.h>
#include <spdlog/fmt/ranges.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>

namespace
{

constexpr const char* DefaultLocation   = "//hklm/SOFTWARE/Microsoft/Windows NT/CurrentVersion";
constexpr const char* DefaultConfigFile = "./regdec.toml";

struct Arguments
{
    std::string config_file{DefaultConfigFile};
    std::string location{DefaultLocation};
};

/// Parses command line; `SPDLOG_LEVEL=` and `SPDLOG_FLUSH_LEVEL=` arguments are left for the logging setup.
///
cetl::optional<Arguments> parseArguments(const int argc, const char** const argv)
{
    Arguments args;
    if (const auto* const env_config = std::getenv("REGDEC_CONFIG"))
    {
        args.config_file = env_config;
    }

    bool has_location = false;
    for (int i = 1; i < argc; ++i)
    {
        const std::string arg = argv[i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        if (arg == "--config")
        {
            if (++i >= argc)
            {
                return cetl::nullopt;
            }
            args.config_file = argv[i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        }
        else if (arg.compare(0, 6, "SPDLOG") == 0)
        {
            continue;
        }
        else if (!has_location)
        {
            args.location = arg;
            has_location  = true;
        }
        else
        {
            return cetl::nullopt;
        }
    }
    return args;
}

regdec::Store::Ptr makeStore(const regdec::cli::Config& config)
{
#ifdef _WIN32
    const auto hive_files = config.getHiveFiles();
    if (hive_files.empty())
    {
        return regdec::platform::RegistryStore::make();
    }
    return regdec::TomlStore::make(hive_files);
#else
    return regdec::TomlStore::make(config.getHiveFiles());
#endif
}

void printOsInfo(const regdec::cli::OsInfo& info)
{
    fmt::print("Product name    : {}\n", info.product_name);
    fmt::print("Edition         : {}\n", info.edition_id);
    fmt::print("Display version : {}\n", info.display_version);
    fmt::print("Version         : {}.{}\n", info.major_version, info.minor_version);
    fmt::print("Build           : {}.{} ({})\n", info.build.current_build, info.build.ubr, info.build.build_lab_ex);
    fmt::print("Install date    : {} (time={})\n", info.install_date, info.install_time);
    fmt::print("System root     : {}\n", info.system_root);
    fmt::print("Product id      : {} byte(s)\n", info.digital_product_id.size());
    fmt::print("Language packs  : {}\n", fmt::join(info.language_packs, ", "));
    fmt::print("Registered owner: {}\n", info.registered_owner.value_or("<none>"));
}

}  // namespace

int main(const int argc, const char** const argv)
{
    const auto maybe_args = parseArguments(argc, argv);
    if (!maybe_args)
    {
        std::cerr << "Usage: regdec-cli [--config <file>] [<location>]\n";
        return EXIT_FAILURE;
    }
    const auto& args = *maybe_args;

    const auto config = regdec::cli::Config::make(args.config_file);
    regdec::cli::setupLogging(argc, argv, config);

    const auto logger = spdlog::get("cli");
    logger->info("regdec-cli started (location='{}', config='{}').", args.location, args.config_file);

    int result = EXIT_SUCCESS;
    try
    {
        const auto store = makeStore(*config);

        regdec::cli::OsInfo os_info;
        if (const auto failure = regdec::decode(*store, args.location, os_info))
        {
            logger->error("Failed to decode '{}' ({}): {}",
                          args.location,
                          regdec::describeErrorCode(failure->code),
                          failure->message);
            std::cerr << failure->message << '\n';
            result = EXIT_FAILURE;
        }
        else
        {
            printOsInfo(os_info);
        }

    } catch (const std::exception& ex)
    {
        logger->critical("Unhandled exception: {}", ex.what());
        result = EXIT_FAILURE;
    }
    logger->info("regdec-cli terminated.");

    return result;
}
