//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DOCMAP_CLI_SETUP_LOGGING_HPP_INCLUDED
#define DOCMAP_CLI_SETUP_LOGGING_HPP_INCLUDED

#include "config/config.hpp"
#include "logging.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <spdlog/cfg/argv.h>
#include <spdlog/cfg/helpers.h>
#include <spdlog/common.h>
#include <spdlog/logger.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>
#include <string>

namespace detail
{

/// Parses a level name, case-insensitively. Unknown names give `nullopt`.
///
inline cetl::optional<spdlog::level::level_enum> parseLevel(std::string level_name)
{
    const auto& lower_name = spdlog::cfg::helpers::to_lower_(level_name);  // NOLINT
    const auto  level      = spdlog::level::from_str(lower_name);
    if ((level == spdlog::level::off) && (lower_name != "off"))
    {
        return cetl::nullopt;
    }
    return level;
}

/// Applies flush levels written like `SPDLOG_LEVEL` ones, f.e. `warn,index=debug`.
///
/// Loggers which are not listed get the flush level of the default logger.
///
inline void applyFlushLevels(const std::string& flush_levels)
{
    constexpr std::size_t max_flush_levels_len = 512;
    if (flush_levels.empty() || (flush_levels.size() > max_flush_levels_len))
    {
        return;
    }

    const auto name_levels = spdlog::cfg::helpers::extract_key_vals_(flush_levels);  // NOLINT
    for (const auto& name_level : name_levels)
    {
        const auto level  = parseLevel(name_level.second);
        const auto logger = spdlog::get(name_level.first);
        if (level && logger)
        {
            logger->flush_on(*level);
        }
    }

    const auto default_flush_level = spdlog::default_logger()->flush_level();
    spdlog::apply_all([&name_levels, default_flush_level](const std::shared_ptr<spdlog::logger>& logger) {
        const bool is_listed = name_levels.find(logger->name()) != name_levels.end();
        if (!logger->name().empty() && !is_listed)
        {
            logger->flush_on(default_flush_level);
        }
    });
}

/// Applies every `SPDLOG_FLUSH_LEVEL=...` argument.
///
inline void applyArgvFlushLevels(const int argc, const char** const argv)
{
    static const std::string flush_level_prefix = "SPDLOG_FLUSH_LEVEL=";
    for (int i = 1; i < argc; i++)
    {
        const std::string arg_str = argv[i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        if (arg_str.compare(0, flush_level_prefix.size(), flush_level_prefix) == 0)
        {
            applyFlushLevels(arg_str.substr(flush_level_prefix.size()));
        }
    }
}

}  // namespace detail

/// Sets up the logging system.
///
/// File sink is used for all loggers (with Info default level). The file, levels and flush levels
/// come from the `[logging]` section of the configuration, and may be overridden
/// by `SPDLOG_LEVEL` & `SPDLOG_FLUSH_LEVEL` arguments (like `SPDLOG_LEVEL=debug,index=trace`).
///
inline void setupLogging(const int argc, const char** const argv, const docmap::common::config::Config& config)
{
    using docmap::common::LoggerName;
    using spdlog::sinks::rotating_file_sink_st;

    try
    {
        constexpr std::size_t log_max_files     = 4;
        constexpr std::size_t log_file_max_size = 16UL * 1048576UL;  // 16 MB

        const std::string log_prefix    = "docmap-cli";
        auto              log_file_path = "./" + log_prefix + ".log";
        if (const auto logging_file = config.getLoggingFile())
        {
            log_file_path = logging_file.value();
        }

        // Drop all existing loggers, including the default one, so that we can reconfigure them.
        spdlog::drop_all();

        const auto file_sink = std::make_shared<rotating_file_sink_st>(  //
            log_file_path,
            log_file_max_size,
            log_max_files);
        file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%P] [%n] [%l] %v");

        const auto default_logger = std::make_shared<spdlog::logger>("", file_sink);
        register_logger(default_logger);
        set_default_logger(default_logger);

        // Register specific subsystem loggers.
        //
        register_logger(std::make_shared<spdlog::logger>(LoggerName::Sdk, file_sink));
        register_logger(std::make_shared<spdlog::logger>(LoggerName::Index, file_sink));
        register_logger(std::make_shared<spdlog::logger>(LoggerName::Config, file_sink));
        register_logger(std::make_shared<spdlog::logger>(LoggerName::Cli, file_sink));

        if (const auto logging_level = config.getLoggingLevel())
        {
            spdlog::cfg::helpers::load_levels(logging_level.value());
        }
        if (const auto logging_flush_level = config.getLoggingFlushLevel())
        {
            detail::applyFlushLevels(logging_flush_level.value());
        }
        spdlog::cfg::load_argv_levels(argc, argv);
        detail::applyArgvFlushLevels(argc, argv);

        spdlog::info("--------------------------");

    } catch (const std::exception& ex)
    {
        std::cerr << "Failed to setup logging: " << ex.what() << '\n';
        std::exit(EXIT_FAILURE);
    }
}

#endif  // DOCMAP_CLI_SETUP_LOGGING_HPP_INCLUDED
