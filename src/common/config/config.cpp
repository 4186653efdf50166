//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "config.hpp"

#include "logging.hpp"
#include "schema_loader.hpp"

#include <docmap/sdk/errors.hpp>
#include <docmap/sdk/index_manager.hpp>
#include <docmap/sdk/schema.hpp>

#include <cetl/pf17/cetlpf.hpp>

#include <toml.hpp>

#include <exception>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace docmap
{
namespace common
{
namespace config
{
namespace
{

class ConfigImpl final : public Config
{
public:
    ConfigImpl(std::string origin, TomlValue&& root)
        : origin_{std::move(origin)}
        , root_{std::move(root)}
        , logger_{getLogger(LoggerName::Config)}
    {
    }

    // Config

    auto getConnectionSettings() const -> sdk::ConnectionSettings override
    {
        sdk::ConnectionSettings settings;
        if (const auto auto_create_index = findImpl<bool>("connection", "auto_create_index"))
        {
            settings.auto_create_index = *auto_create_index;
        }
        return settings;
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

    auto getDocuments() const -> Documents::Result override
    {
        Documents::Success schema_defs;
        if (!root_.contains("documents"))
        {
            return schema_defs;
        }

        try
        {
            for (const auto& document : toml::find(root_, "documents").as_array())
            {
                schema_defs.push_back(SchemaLoader::loadSchema(document));
            }

        } catch (const std::exception& ex)
        {
            logger_->error("Invalid documents in config '{}': {}", origin_, ex.what());
            return sdk::ConfigError{ex.what()};
        }

        logger_->debug("Loaded {} document(s) from config '{}'.", schema_defs.size(), origin_);
        return schema_defs;
    }

private:
    /// Finds an optional value of a section; a value of a wrong type is reported and treated as missing.
    ///
    template <typename T>
    cetl::optional<T> findImpl(const std::string& section, const std::string& key) const
    {
        if (!root_.contains(section) || !root_.at(section).is_table() || !root_.at(section).contains(key))
        {
            return cetl::nullopt;
        }
        try
        {
            return cetl::make_optional(toml::find<T>(root_, section, key));

        } catch (const std::exception& ex)
        {
            logger_->warn("Ignoring invalid '{}.{}' in config '{}': {}", section, key, origin_, ex.what());
            return cetl::nullopt;
        }
    }

    const std::string       origin_;
    const TomlValue         root_;
    const common::LoggerPtr logger_;

};  // ConfigImpl

}  // namespace

Config::Load::Result Config::make(const std::string& file_path)
{
    try
    {
        auto root = toml::parse<TomlConf>(file_path);
        return std::make_shared<ConfigImpl>(file_path, std::move(root));

    } catch (const std::exception& ex)
    {
        getLogger(LoggerName::Config)->error("Failed to load config '{}': {}", file_path, ex.what());
        return sdk::ConfigError{ex.what()};
    }
}

Config::Load::Result Config::parse(const std::string& toml_text)
{
    try
    {
        auto root = toml::parse_str<TomlConf>(toml_text);
        return std::make_shared<ConfigImpl>("<string>", std::move(root));

    } catch (const std::exception& ex)
    {
        getLogger(LoggerName::Config)->error("Failed to parse config: {}", ex.what());
        return sdk::ConfigError{ex.what()};
    }
}

}  // namespace config
}  // namespace common
}  // namespace docmap
