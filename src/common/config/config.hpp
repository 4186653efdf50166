//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DOCMAP_COMMON_CONFIG_CONFIG_HPP_INCLUDED
#define DOCMAP_COMMON_CONFIG_CONFIG_HPP_INCLUDED

#include <docmap/sdk/errors.hpp>
#include <docmap/sdk/index_manager.hpp>
#include <docmap/sdk/schema.hpp>

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <memory>
#include <string>
#include <vector>

namespace docmap
{
namespace common
{
namespace config
{

/// Read-only TOML configuration.
///
/// ```toml
/// [connection]
/// auto_create_index = true
///
/// [logging]
/// file = "./docmap.log"
/// level = "info"
/// flush_level = "warn"
///
/// [[documents]]
/// name = "BlogPost"
/// indexes = ["-date", ["category", "-date"], { fields = ["tags"], sparse = true }]
///
///   [[documents.fields]]
///   name = "date"
///   db_field = "addDate"
///   type = "datetime"
/// ```
///
class Config
{
public:
    using Ptr = std::shared_ptr<Config>;

    struct Load final
    {
        using Success = Ptr;
        using Failure = sdk::ConfigError;
        using Result  = cetl::variant<Success, Failure>;
    };
    CETL_NODISCARD static Load::Result make(const std::string& file_path);
    CETL_NODISCARD static Load::Result parse(const std::string& toml_text);

    Config(const Config&)                = delete;
    Config(Config&&) noexcept            = delete;
    Config& operator=(const Config&)     = delete;
    Config& operator=(Config&&) noexcept = delete;

    virtual ~Config() = default;

    CETL_NODISCARD virtual auto getConnectionSettings() const -> sdk::ConnectionSettings     = 0;
    CETL_NODISCARD virtual auto getLoggingFile() const -> cetl::optional<std::string>       = 0;
    CETL_NODISCARD virtual auto getLoggingLevel() const -> cetl::optional<std::string>      = 0;
    CETL_NODISCARD virtual auto getLoggingFlushLevel() const -> cetl::optional<std::string> = 0;

    /// Gets schema definitions in the order they are listed.
    ///
    struct Documents final
    {
        using Success = std::vector<sdk::SchemaDef>;
        using Failure = sdk::ConfigError;
        using Result  = cetl::variant<Success, Failure>;
    };
    CETL_NODISCARD virtual auto getDocuments() const -> Documents::Result = 0;

protected:
    Config() = default;

};  // Config

}  // namespace config
}  // namespace common
}  // namespace docmap

#endif  // DOCMAP_COMMON_CONFIG_CONFIG_HPP_INCLUDED
