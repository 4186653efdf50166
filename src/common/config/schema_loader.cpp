//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "schema_loader.hpp"

#include <docmap/sdk/index_declaration.hpp>
#include <docmap/sdk/index_spec.hpp>
#include <docmap/sdk/schema.hpp>

#include <cetl/pf17/cetlpf.hpp>

#include <toml.hpp>

#include <algorithm>
#include <cstdint>
#include <initializer_list>
#include <stdexcept>
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

using sdk::IndexDeclaration;

void checkKeys(const TomlValue& table, std::initializer_list<const char*> known_keys, const std::string& context)
{
    for (const auto& key_value : table.as_table())
    {
        const auto& key   = key_value.first;
        const bool  known = std::any_of(known_keys.begin(), known_keys.end(), [&key](const char* known_key) {
            return key == known_key;
        });
        if (!known)
        {
            throw std::invalid_argument("Unknown key '" + key + "' in " + context + ".");
        }
    }
}

template <typename T>
cetl::optional<T> findOptional(const TomlValue& table, const std::string& key)
{
    if (!table.contains(key))
    {
        return cetl::nullopt;
    }
    return toml::find<T>(table, key);
}

template <typename T>
T findOr(const TomlValue& table, const std::string& key, T default_value)
{
    return findOptional<T>(table, key).value_or(std::move(default_value));
}

/// Accepts either a single string or an array of strings.
///
std::vector<std::string> findStrings(const TomlValue& table, const std::string& key)
{
    if (!table.contains(key))
    {
        return {};
    }
    const auto& value = table.at(key);
    if (value.is_string())
    {
        return {value.as_string()};
    }
    return toml::find<std::vector<std::string>>(table, key);
}

sdk::SchemaKind parseKind(const std::string& kind, const std::string& schema_name)
{
    if (kind == "document")
    {
        return sdk::SchemaKind::Document;
    }
    if (kind == "dynamic_document")
    {
        return sdk::SchemaKind::DynamicDocument;
    }
    if (kind == "embedded_document")
    {
        return sdk::SchemaKind::EmbeddedDocument;
    }
    throw std::invalid_argument("Unknown kind '" + kind + "' of '" + schema_name + "'.");
}

sdk::FieldType parseType(const std::string& type_name, const std::string& context)
{
    if (const auto type = sdk::parseFieldType(type_name))
    {
        return *type;
    }
    throw std::invalid_argument("Unknown field type '" + type_name + "' in " + context + ".");
}

sdk::IndexDirection parseDirection(const TomlValue& direction, const std::string& schema_name)
{
    if (direction.is_integer())
    {
        switch (direction.as_integer())
        {
        case 1:
            return sdk::IndexDirection::Ascending;
        case -1:
            return sdk::IndexDirection::Descending;
        default:
            break;
        }
    }
    else if (direction.is_string())
    {
        const auto& token = direction.as_string();
        if (token == "1")
        {
            return sdk::IndexDirection::Ascending;
        }
        if (token == "-1")
        {
            return sdk::IndexDirection::Descending;
        }
        if (token == "2d")
        {
            return sdk::IndexDirection::Geo2d;
        }
    }
    throw std::invalid_argument("Invalid index direction '" + toml::format(direction) + "' in indexes of '" +
                                schema_name + "'.");
}

/// `["name", -1]` - a two element array with an integer as the second element.
///
bool isDirectedPair(const TomlValue& value)
{
    if (!value.is_array())
    {
        return false;
    }
    const auto& array = value.as_array();
    return (array.size() == 2) && array[0].is_string() && array[1].is_integer();
}

}  // namespace

sdk::SchemaDef SchemaLoader::loadSchema(const TomlValue& document)
{
    sdk::SchemaDef schema_def;
    schema_def.name = toml::find<std::string>(document, "name");

    const auto context = "document '" + schema_def.name + "'";
    checkKeys(document,
              {"name",
               "kind",
               "parent",
               "abstract",
               "allow_inheritance",
               "auto_create_index",
               "collection",
               "index_background",
               "index_drop_dups",
               "index_cls",
               "indexes",
               "fields"},
              context);

    schema_def.kind   = parseKind(findOr<std::string>(document, "kind", "document"), schema_def.name);
    schema_def.parent = findOr<std::string>(document, "parent", "");

    auto& meta             = schema_def.meta;
    meta.abstract          = findOr(document, "abstract", false);
    meta.allow_inheritance = findOptional<bool>(document, "allow_inheritance");
    meta.auto_create_index = findOptional<bool>(document, "auto_create_index");
    meta.collection        = findOptional<std::string>(document, "collection");
    meta.index_background  = findOr(document, "index_background", false);
    meta.index_drop_dups   = findOr(document, "index_drop_dups", false);
    meta.index_cls         = findOr(document, "index_cls", true);

    if (document.contains("fields"))
    {
        for (const auto& field : toml::find(document, "fields").as_array())
        {
            schema_def.fields.push_back(loadField(field, schema_def.name));
        }
    }
    if (document.contains("indexes"))
    {
        for (const auto& index : toml::find(document, "indexes").as_array())
        {
            meta.indexes.push_back(loadIndex(index, schema_def.name));
        }
    }
    return schema_def;
}

sdk::FieldDef SchemaLoader::loadField(const TomlValue& field, const std::string& schema_name)
{
    sdk::FieldDef field_def;
    field_def.name = toml::find<std::string>(field, "name");

    const auto context = "field '" + schema_name + "." + field_def.name + "'";
    checkKeys(field,
              {"name", "db_field", "type", "item_type", "document", "unique", "unique_with", "primary_key", "required"},
              context);

    field_def.db_field      = findOr<std::string>(field, "db_field", "");
    field_def.type          = parseType(findOr<std::string>(field, "type", "string"), context);
    field_def.item_type     = parseType(findOr<std::string>(field, "item_type", "string"), context);
    field_def.document_type = findOr<std::string>(field, "document", "");
    field_def.unique        = findOr(field, "unique", false);
    field_def.unique_with   = findStrings(field, "unique_with");
    field_def.primary_key   = findOr(field, "primary_key", false);
    field_def.required      = findOr(field, "required", false);
    return field_def;
}

sdk::IndexDeclaration SchemaLoader::loadIndex(const TomlValue& index, const std::string& schema_name)
{
    if (index.is_string())
    {
        return IndexDeclaration::field(index.as_string());
    }

    if (isDirectedPair(index))
    {
        const auto& pair = index.as_array();
        return IndexDeclaration::directed(pair[0].as_string(), parseDirection(pair[1], schema_name));
    }

    if (index.is_array())
    {
        IndexDeclaration::Compound compound;
        for (const auto& item : index.as_array())
        {
            compound.items.push_back(loadIndexItem(item, schema_name));
        }
        return IndexDeclaration{std::move(compound)};
    }

    if (index.is_table())
    {
        checkKeys(index,
                  {"fields",
                   "unique",
                   "sparse",
                   "types",
                   "background",
                   "drop_dups",
                   "dropDups",
                   "expireAfterSeconds",
                   "expire_after_seconds"},
                  "an index of '" + schema_name + "'");

        IndexDeclaration::OptionsRecord record;
        if (index.contains("fields"))
        {
            const auto& fields = index.at("fields");
            std::vector<IndexDeclaration::Item> items;
            if (fields.is_string())
            {
                items.emplace_back(IndexDeclaration::FieldRef{fields.as_string()});
            }
            else
            {
                for (const auto& item : fields.as_array())
                {
                    items.push_back(loadIndexItem(item, schema_name));
                }
            }
            record.fields = std::move(items);
        }
        record.unique     = findOr(index, "unique", false);
        record.sparse     = findOr(index, "sparse", false);
        record.types      = findOr(index, "types", true);
        record.background = findOr(index, "background", false);
        record.drop_dups  = findOr(index, "drop_dups", findOr(index, "dropDups", false));

        record.expire_after_seconds = findOptional<std::int64_t>(index, "expireAfterSeconds");
        if (!record.expire_after_seconds)
        {
            record.expire_after_seconds = findOptional<std::int64_t>(index, "expire_after_seconds");
        }
        return IndexDeclaration::record(std::move(record));
    }

    throw std::invalid_argument("Unsupported index declaration '" + toml::format(index) + "' of '" + schema_name +
                                "'.");
}

sdk::IndexDeclaration::Item SchemaLoader::loadIndexItem(const TomlValue& item, const std::string& schema_name)
{
    if (item.is_string())
    {
        return IndexDeclaration::FieldRef{item.as_string()};
    }
    if (item.is_array() && (item.as_array().size() == 2) && item.as_array()[0].is_string())
    {
        const auto& pair = item.as_array();
        return IndexDeclaration::DirectedFieldRef{pair[0].as_string(), parseDirection(pair[1], schema_name)};
    }
    throw std::invalid_argument("Unsupported index field '" + toml::format(item) + "' of '" + schema_name + "'.");
}

}  // namespace config
}  // namespace common
}  // namespace docmap
