//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DOCMAP_COMMON_CONFIG_SCHEMA_LOADER_HPP_INCLUDED
#define DOCMAP_COMMON_CONFIG_SCHEMA_LOADER_HPP_INCLUDED

#include <docmap/sdk/index_declaration.hpp>
#include <docmap/sdk/schema.hpp>

#include <toml.hpp>

#include <string>

namespace docmap
{
namespace common
{
namespace config
{

using TomlConf  = toml::ordered_type_config;
using TomlValue = toml::basic_value<TomlConf>;

/// Builds schema definitions out of `[[documents]]` tables.
///
/// Malformed input is reported by throwing: `toml::exception` for wrong value types,
/// and `std::invalid_argument` for unknown keys and values.
///
class SchemaLoader final
{
public:
    static sdk::SchemaDef        loadSchema(const TomlValue& document);
    static sdk::FieldDef         loadField(const TomlValue& field, const std::string& schema_name);
    static sdk::IndexDeclaration loadIndex(const TomlValue& index, const std::string& schema_name);

private:
    static sdk::IndexDeclaration::Item loadIndexItem(const TomlValue& item, const std::string& schema_name);

};  // SchemaLoader

}  // namespace config
}  // namespace common
}  // namespace docmap

#endif  // DOCMAP_COMMON_CONFIG_SCHEMA_LOADER_HPP_INCLUDED
