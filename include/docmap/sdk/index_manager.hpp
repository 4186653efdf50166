//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DOCMAP_SDK_INDEX_MANAGER_HPP_INCLUDED
#define DOCMAP_SDK_INDEX_MANAGER_HPP_INCLUDED

#include "catalog_client.hpp"
#include "errors.hpp"
#include "index_spec.hpp"
#include "schema_registry.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <memory>
#include <string>

namespace docmap
{
namespace sdk
{

/// Settings which are scoped to one connection to the backing store.
///
struct ConnectionSettings final
{
    /// When `false`, indexes are not created automatically,
    /// unless a schema explicitly enables it in its metadata.
    bool auto_create_index{true};

};  // ConnectionSettings

/// Defines the entry point for index management of registered schemas.
///
class IndexManager
{
public:
    /// Defines the shared pointer type for the interface.
    ///
    using Ptr = std::shared_ptr<IndexManager>;

    /// Makes a new index manager.
    ///
    /// @param registry Populated schema registry. Schemas defined later are visible as well.
    /// @param catalog_client Client of the backing store catalog.
    /// @param settings Connection scoped settings.
    ///
    CETL_NODISCARD static Ptr make(std::shared_ptr<const SchemaRegistry> registry,
                                   CatalogClient::Ptr                    catalog_client,
                                   const ConnectionSettings&             settings = {});

    // No copy/move semantics.
    IndexManager(IndexManager&&)                 = delete;
    IndexManager(const IndexManager&)            = delete;
    IndexManager& operator=(IndexManager&&)      = delete;
    IndexManager& operator=(const IndexManager&) = delete;

    virtual ~IndexManager() = default;

    /// Gets canonical index list of a schema.
    ///
    /// The list is compiled once, when the schema is defined. It includes inherited declarations,
    /// the discriminator prefix, indexes of geospatial fields, and implicit unique indexes.
    ///
    struct CompileIndexSpecs final
    {
        using Success = IndexSpecs;
        using Failure = NotRegisteredError;
        using Result  = cetl::variant<Success, Failure>;
    };
    virtual CompileIndexSpecs::Result compileIndexSpecs(const std::string& schema_name) const = 0;

    /// Makes sure that every index of a schema exists in the store.
    ///
    /// Missing indexes are created, existing ones are never dropped or rebuilt.
    /// Repeated calls are no-ops. Does nothing (successfully) if automatic index creation is disabled.
    ///
    /// @return `nullopt` on success. On failure, indexes created before the failing one remain in place.
    ///
    struct EnsureIndexes final
    {
        using Failure = cetl::variant<NotRegisteredError, ConfigError, IndexConflictError, TransportError>;
    };
    virtual cetl::optional<EnsureIndexes::Failure> ensureIndexes(const std::string& schema_name) = 0;

    /// Gets geospatial subset of the canonical index list.
    ///
    struct GeoIndexes final
    {
        using Success = IndexSpecs;
        using Failure = NotRegisteredError;
        using Result  = cetl::variant<Success, Failure>;
    };
    virtual GeoIndexes::Result geoIndexes(const std::string& schema_name) const = 0;

    virtual const ConnectionSettings& getSettings() const noexcept = 0;

protected:
    IndexManager() = default;

};  // IndexManager

}  // namespace sdk
}  // namespace docmap

#endif  // DOCMAP_SDK_INDEX_MANAGER_HPP_INCLUDED
