//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include <docmap/sdk/schema_registry.hpp>

#include "common_helpers.hpp"
#include "index/index_compiler.hpp"
#include "logging.hpp"

#include <docmap/sdk/errors.hpp>
#include <docmap/sdk/index_spec.hpp>
#include <docmap/sdk/schema.hpp>

#include <cetl/pf17/cetlpf.hpp>

#include <algorithm>
#include <iterator>
#include <string>
#include <utility>

namespace docmap
{
namespace sdk
{
namespace
{

bool needsDocument(const FieldType type)
{
    return (type == FieldType::Embedded) || (type == FieldType::Reference);
}

}  // namespace

const Schema* SchemaRegistry::find(const std::string& name) const
{
    const auto it = std::find_if(schemas_.cbegin(), schemas_.cend(), [&name](const Schema& schema) {
        return schema.name == name;
    });
    return (it != schemas_.cend()) ? &*it : nullptr;
}

SchemaRegistry::Define::Result SchemaRegistry::define(const SchemaDef& schema_def)
{
    const auto logger = common::getLogger(common::LoggerName::Sdk);

    if (schema_def.name.empty())
    {
        return ConfigError{"Schema name must not be empty."};
    }
    if (find(schema_def.name) != nullptr)
    {
        return ConfigError{"Schema '" + schema_def.name + "' is already defined."};
    }

    Schema schema;
    schema.id   = schemas_.size();
    schema.name = schema_def.name;
    schema.kind = schema_def.kind;

    const auto& meta = schema_def.meta;
    if (!schema_def.parent.empty())
    {
        const Schema* const parent = find(schema_def.parent);
        if (parent == nullptr)
        {
            return ConfigError{"Parent '" + schema_def.parent + "' of '" + schema_def.name + "' is not defined."};
        }
        if (parent->isEmbedded() != (schema_def.kind == SchemaKind::EmbeddedDocument))
        {
            return ConfigError{"Schema '" + schema_def.name + "' may not inherit '" + parent->name +
                               "' of a different kind."};
        }
        if (!parent->abstract && !parent->allow_inheritance)
        {
            return ConfigError{"Schema '" + parent->name + "' may not be subclassed (inheritance is not allowed)."};
        }

        schema.parent    = parent->id;
        schema.ancestors = parent->ancestors;
        schema.ancestors.push_back(parent->id);
        schema.fields            = parent->fields;
        schema.allow_inheritance = meta.allow_inheritance.value_or(parent->allow_inheritance);
        schema.auto_create_index = meta.auto_create_index ? meta.auto_create_index : parent->auto_create_index;
    }
    else
    {
        schema.allow_inheritance = meta.allow_inheritance.value_or(true);
        schema.auto_create_index = meta.auto_create_index;
    }

    if (meta.abstract && (schema_def.kind == SchemaKind::EmbeddedDocument))
    {
        return ConfigError{"Embedded schema '" + schema_def.name + "' may not be abstract."};
    }
    schema.abstract         = meta.abstract;
    schema.own_indexes      = meta.indexes;
    schema.index_background = meta.index_background;
    schema.index_drop_dups  = meta.index_drop_dups;
    schema.index_cls        = meta.index_cls;

    if (auto error = resolveFields(schema_def, schema))
    {
        return std::move(*error);
    }
    schema.collection = deriveCollection(schema_def, schema);

    // The schema must be visible while compiling (f.e. for self-references); it's withdrawn on failure.
    //
    schemas_.push_back(std::move(schema));
    const index::IndexCompiler compiler{*this};
    auto                       compiled = compiler.compile(schemas_.back());
    if (auto* const error = cetl::get_if<index::IndexCompiler::Compile::Failure>(&compiled))
    {
        schemas_.pop_back();
        logger->error("Schema '{}' is rejected: {}", schema_def.name, error->message);
        return std::move(*error);
    }

    auto& defined       = schemas_.back();
    defined.index_specs = cetl::get<index::IndexCompiler::Compile::Success>(std::move(compiled));
    logger->debug("Schema '{}' is defined (id={}, collection='{}', indexes={}).",
                  defined.name,
                  defined.id,
                  defined.collection,
                  defined.index_specs.size());
    return defined.id;
}

cetl::optional<ConfigError> SchemaRegistry::resolveFields(const SchemaDef& schema_def, Schema& schema) const
{
    for (const auto& field_def : schema_def.fields)
    {
        if (field_def.name.empty())
        {
            return ConfigError{"Field of '" + schema_def.name + "' has no name."};
        }
        if ((field_def.name.find('.') != std::string::npos) || (field_def.db_field.find('.') != std::string::npos))
        {
            return ConfigError{"Field '" + field_def.name + "' of '" + schema_def.name + "' may not contain dots."};
        }

        Field field;
        field.name        = field_def.name;
        field.db_field    = field_def.db_field.empty() ? field_def.name : field_def.db_field;
        field.type        = field_def.type;
        field.item_type   = field_def.item_type;
        field.unique      = field_def.unique;
        field.unique_with = field_def.unique_with;
        field.primary_key = field_def.primary_key;
        if (field.primary_key)
        {
            const auto existing_pk = std::find_if(schema.fields.cbegin(), schema.fields.cend(), [](const Field& f) {
                return f.primary_key;
            });
            if ((existing_pk != schema.fields.cend()) && (existing_pk->name != field.name))
            {
                return ConfigError{"Schema '" + schema_def.name + "' may not have more than one primary key."};
            }
            field.db_field = PrimaryKey;
        }
        if (auto error = resolveFieldDocument(field_def, schema, field))
        {
            return error;
        }

        // A field with the name of an inherited one overrides it.
        const auto same = std::find_if(schema.fields.begin(), schema.fields.end(), [&field](const Field& f) {
            return f.name == field.name;
        });
        if (same != schema.fields.end())
        {
            *same = std::move(field);
        }
        else
        {
            schema.fields.push_back(std::move(field));
        }
    }

    const bool has_pk = std::any_of(schema.fields.cbegin(), schema.fields.cend(), [](const Field& field) {
        return field.primary_key;
    });
    if (!has_pk && !schema.isEmbedded())
    {
        Field id_field;
        id_field.name        = "id";
        id_field.db_field    = PrimaryKey;
        id_field.type        = FieldType::ObjectId;
        id_field.primary_key = true;
        schema.fields.insert(schema.fields.begin(), std::move(id_field));
    }

    // Storage keys must be distinct.
    for (auto it = schema.fields.cbegin(); it != schema.fields.cend(); ++it)
    {
        const auto clash = std::find_if(std::next(it), schema.fields.cend(), [it](const Field& field) {
            return field.db_field == it->db_field;
        });
        if (clash != schema.fields.cend())
        {
            return ConfigError{"Fields '" + it->name + "' and '" + clash->name + "' of '" + schema_def.name +
                               "' share the storage key '" + it->db_field + "'."};
        }
    }
    return cetl::nullopt;
}

cetl::optional<ConfigError> SchemaRegistry::resolveFieldDocument(const FieldDef& field_def,
                                                                 const Schema&   schema,
                                                                 Field&          field) const
{
    const auto target_type = (field_def.type == FieldType::List) ? field_def.item_type : field_def.type;
    if (!needsDocument(target_type))
    {
        return cetl::nullopt;
    }
    if (field_def.document_type.empty())
    {
        return ConfigError{"Field '" + field_def.name + "' of '" + schema.name + "' has no document type."};
    }

    bool is_embedded_target = false;
    if ((field_def.document_type == "self") || (field_def.document_type == schema.name))
    {
        field.document     = schema.id;
        is_embedded_target = schema.isEmbedded();
    }
    else
    {
        const Schema* const target = find(field_def.document_type);
        if (target == nullptr)
        {
            return ConfigError{"Document type '" + field_def.document_type + "' of '" + schema.name + "." +
                               field_def.name + "' is not defined."};
        }
        field.document     = target->id;
        is_embedded_target = target->isEmbedded();
    }

    if ((target_type == FieldType::Embedded) != is_embedded_target)
    {
        return ConfigError{"Field '" + field_def.name + "' of '" + schema.name + "' must " +
                           ((target_type == FieldType::Embedded) ? "embed an embedded" : "reference a stored") +
                           " document type."};
    }
    return cetl::nullopt;
}

std::string SchemaRegistry::deriveCollection(const SchemaDef& schema_def, const Schema& schema) const
{
    if (schema.isEmbedded() || schema.abstract)
    {
        return {};
    }
    if (schema_def.meta.collection && !schema_def.meta.collection->empty())
    {
        return *schema_def.meta.collection;
    }

    // Polymorphic storage: documents of a concrete parent and all its subclasses share one collection.
    for (auto it = schema.ancestors.crbegin(); it != schema.ancestors.crend(); ++it)
    {
        const auto& ancestor = get(*it);
        if (ancestor.hasCollection())
        {
            return ancestor.collection;
        }
    }
    return common::toSnakeCase(schema.name);
}

}  // namespace sdk
}  // namespace docmap
