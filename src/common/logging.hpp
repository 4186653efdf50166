//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DOCMAP_COMMON_LOGGING_HPP_INCLUDED
#define DOCMAP_COMMON_LOGGING_HPP_INCLUDED

#include "common_helpers.hpp"

#include <docmap/sdk/index_spec.hpp>

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <spdlog/fmt/fmt.h>
#include <spdlog/logger.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace docmap
{
namespace common
{

using Logger    = spdlog::logger;
using LoggerPtr = std::shared_ptr<Logger>;

/// Names of the subsystem loggers.
///
struct LoggerName final
{
    static constexpr const char* Sdk    = "sdk";
    static constexpr const char* Index  = "index";
    static constexpr const char* Config = "config";
    static constexpr const char* Cli    = "cli";

};  // LoggerName

/// Gets a registered logger, or registers a clone of the default one under the given name.
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

    performWithoutThrowing([&logger] {
        //
        spdlog::register_logger(logger);
    });

    return logger;
}

}  // namespace common
}  // namespace docmap

template <>
struct fmt::formatter<docmap::sdk::IndexSpec>
{
    constexpr auto parse(format_parse_context& ctx) -> decltype(ctx.begin())
    {
        return ctx.begin();
    }

    template <typename FormatContext>
    auto format(const docmap::sdk::IndexSpec& spec, FormatContext& ctx) const -> decltype(ctx.out())
    {
        return fmt::format_to(ctx.out(), "{}", spec.toString());
    }
};

#endif  // DOCMAP_COMMON_LOGGING_HPP_INCLUDED
