//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DOCMAP_SDK_SCHEMA_REGISTRY_HPP_INCLUDED
#define DOCMAP_SDK_SCHEMA_REGISTRY_HPP_INCLUDED

#include "errors.hpp"
#include "schema.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace docmap
{
namespace sdk
{

/// Owns all schema descriptors, addressed by their `SchemaId`.
///
/// Nested and parent schemas are referenced by id, so self-referencing and mutually recursive
/// embedded documents are fine. Schemas must be defined parents (and nested types) first,
/// except for the `"self"` reference. The registry is not thread-safe for `define`;
/// once populated it may be read concurrently.
///
class SchemaRegistry final
{
public:
    using Ptr = std::shared_ptr<SchemaRegistry>;

    CETL_NODISCARD static Ptr make()
    {
        return std::make_shared<SchemaRegistry>();
    }

    SchemaRegistry() = default;

    SchemaRegistry(SchemaRegistry&&)                 = delete;
    SchemaRegistry(const SchemaRegistry&)            = delete;
    SchemaRegistry& operator=(SchemaRegistry&&)      = delete;
    SchemaRegistry& operator=(const SchemaRegistry&) = delete;

    ~SchemaRegistry() = default;

    /// Validates and registers a new schema, and compiles its canonical index list.
    ///
    /// On failure the registry stays unchanged.
    ///
    struct Define final
    {
        using Success = SchemaId;
        using Failure = ConfigError;
        using Result  = cetl::variant<Success, Failure>;
    };
    CETL_NODISCARD Define::Result define(const SchemaDef& schema_def);

    CETL_NODISCARD const Schema* find(const std::string& name) const;

    /// @param id Must be an id previously returned by `define`.
    ///
    CETL_NODISCARD const Schema& get(const SchemaId id) const
    {
        CETL_DEBUG_ASSERT(id < schemas_.size(), "");
        return schemas_[id];
    }

    CETL_NODISCARD std::size_t size() const noexcept
    {
        return schemas_.size();
    }

private:
    cetl::optional<ConfigError> resolveFields(const SchemaDef& schema_def, Schema& schema) const;
    cetl::optional<ConfigError> resolveFieldDocument(const FieldDef& field_def,
                                                     const Schema&   schema,
                                                     Field&          field) const;
    std::string                 deriveCollection(const SchemaDef& schema_def, const Schema& schema) const;

    std::vector<Schema> schemas_;

};  // SchemaRegistry

}  // namespace sdk
}  // namespace docmap

#endif  // DOCMAP_SDK_SCHEMA_REGISTRY_HPP_INCLUDED
