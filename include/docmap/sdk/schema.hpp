//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DOCMAP_SDK_SCHEMA_HPP_INCLUDED
#define DOCMAP_SDK_SCHEMA_HPP_INCLUDED

#include "index_declaration.hpp"
#include "index_spec.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace docmap
{
namespace sdk
{

enum class FieldType : std::uint8_t
{
    String,
    Int,
    Float,
    Boolean,
    DateTime,
    ObjectId,
    Dict,
    List,
    GeoPoint,
    Reference,
    Embedded,

};  // FieldType

CETL_NODISCARD cetl::optional<FieldType> parseFieldType(const std::string& type_name);

enum class SchemaKind : std::uint8_t
{
    Document,
    DynamicDocument,
    EmbeddedDocument,

};  // SchemaKind

// MARK: - Authored metadata

/// Field as it is authored.
///
/// `document_type` names the nested schema of embedded and reference fields, and of lists which item type
/// is embedded or reference. The `"self"` value refers to the schema being defined.
///
struct FieldDef final
{
    std::string              name;
    std::string              db_field;  // defaults to `name`
    FieldType                type{FieldType::String};
    FieldType                item_type{FieldType::String};
    std::string              document_type;
    bool                     unique{false};
    std::vector<std::string> unique_with;
    bool                     primary_key{false};
    bool                     required{false};

};  // FieldDef

struct SchemaMeta final
{
    IndexDeclarations           indexes;
    cetl::optional<bool>        allow_inheritance;  // inherited from the parent, `true` for roots
    bool                        abstract{false};
    cetl::optional<bool>        auto_create_index;  // falls back to the connection setting
    cetl::optional<std::string> collection;
    bool                        index_background{false};
    bool                        index_drop_dups{false};
    bool                        index_cls{true};

};  // SchemaMeta

struct SchemaDef final
{
    std::string           name;
    SchemaKind            kind{SchemaKind::Document};
    std::string           parent;
    std::vector<FieldDef> fields;
    SchemaMeta            meta;

};  // SchemaDef

// MARK: - Resolved descriptors

/// Index of a schema descriptor in its registry.
///
using SchemaId = std::size_t;

struct Field final
{
    std::string              name;
    std::string              db_field;
    FieldType                type{FieldType::String};
    FieldType                item_type{FieldType::String};
    cetl::optional<SchemaId> document;
    bool                     unique{false};
    std::vector<std::string> unique_with;
    bool                     primary_key{false};

    /// Type which decides how a sub-path is resolved: the item type for lists, own type otherwise.
    ///
    CETL_NODISCARD FieldType effectiveType() const
    {
        return (type == FieldType::List) ? item_type : type;
    }

    CETL_NODISCARD bool isUnique() const
    {
        return unique || !unique_with.empty();
    }

};  // Field

/// Resolved schema descriptor.
///
/// Descriptors are immutable once their registry has accepted them;
/// the compiled index list is computed exactly once at that moment.
///
struct Schema final
{
    SchemaId                 id{0};
    std::string              name;
    SchemaKind               kind{SchemaKind::Document};
    cetl::optional<SchemaId> parent;
    std::vector<SchemaId>    ancestors;  // oldest first
    std::vector<Field>       fields;     // inherited ones first
    IndexDeclarations        own_indexes;
    bool                     abstract{false};
    bool                     allow_inheritance{true};
    cetl::optional<bool>     auto_create_index;
    std::string              collection;  // empty for abstract and embedded schemas
    bool                     index_background{false};
    bool                     index_drop_dups{false};
    bool                     index_cls{true};
    IndexSpecs               index_specs;

    CETL_NODISCARD bool isEmbedded() const
    {
        return kind == SchemaKind::EmbeddedDocument;
    }

    CETL_NODISCARD bool isDynamic() const
    {
        return kind == SchemaKind::DynamicDocument;
    }

    /// Documents of a polymorphic schema carry the type discriminator.
    ///
    CETL_NODISCARD bool isPolymorphic() const
    {
        return allow_inheritance && !isEmbedded();
    }

    CETL_NODISCARD bool hasCollection() const
    {
        return !collection.empty();
    }

    CETL_NODISCARD const Field* findField(const std::string& field_name) const
    {
        for (const auto& field : fields)
        {
            if (field.name == field_name)
            {
                return &field;
            }
        }
        return nullptr;
    }

};  // Schema

}  // namespace sdk
}  // namespace docmap

#endif  // DOCMAP_SDK_SCHEMA_HPP_INCLUDED
