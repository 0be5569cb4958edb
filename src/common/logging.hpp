//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef REGDEC_COMMON_LOGGING_HPP_INCLUDED
#define REGDEC_COMMON_LOGGING_HPP_INCLUDED

#include <cetl/cetl.hpp>

#include <spdlog/common.h>
#include <spdlog/logger.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace regdec
{
namespace common
{

using Logger    = spdlog::logger;
using LoggerPtr = std::shared_ptr<Logger>;

/// Gets a named subsystem logger.
///
/// Unknown names are cloned from the default logger (so they share its sinks),
/// and then registered, which also applies levels loaded by `spdlog::cfg`.
///
inline LoggerPtr getLogger(const std::string& name) noexcept
{
    if (auto logger = spdlog::get(name))
    {
        return logger;
    }

    auto default_logger = spdlog::default_logger();
    CETL_DEBUG_ASSERT(default_logger, "default");

    auto logger = default_logger->clone(name);
    CETL_DEBUG_ASSERT(logger, name.c_str());

    try
    {
        spdlog::initialize_logger(logger);

    } catch (const spdlog::spdlog_ex& ex)
    {
        // Still usable, just not registered (so it won't pick up levels set by name).
        spdlog::error("Failed to register '{}' logger: {}", name, ex.what());
    }

    return logger;
}

}  // namespace common
}  // namespace regdec

#endif  // REGDEC_COMMON_LOGGING_HPP_INCLUDED
