//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DOCMAP_SDK_CATALOG_CLIENT_HPP_INCLUDED
#define DOCMAP_SDK_CATALOG_CLIENT_HPP_INCLUDED

#include "errors.hpp"
#include "index_spec.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <memory>
#include <string>
#include <vector>

namespace docmap
{
namespace sdk
{

/// One index as it exists in the store's catalog.
///
struct CatalogEntry final
{
    std::string  name;
    IndexKeys    keys;
    IndexOptions options;

};  // CatalogEntry

/// Defines the interface to the index catalog of the backing store.
///
/// Implementations must be safe to call from multiple threads.
///
class CatalogClient
{
public:
    /// Defines the shared pointer type for the interface.
    ///
    using Ptr = std::shared_ptr<CatalogClient>;

    /// Makes a new in-process catalog.
    ///
    /// A collection comes into existence with its `_id_` primary-key index on its first index creation.
    ///
    CETL_NODISCARD static Ptr makeInMemory();

    // No copy/move semantics.
    CatalogClient(CatalogClient&&)                 = delete;
    CatalogClient(const CatalogClient&)            = delete;
    CatalogClient& operator=(CatalogClient&&)      = delete;
    CatalogClient& operator=(const CatalogClient&) = delete;

    virtual ~CatalogClient() = default;

    /// Gets current indexes of a collection.
    ///
    /// An unknown collection has no indexes (and it's not an error).
    ///
    struct ListIndexes final
    {
        using Success = std::vector<CatalogEntry>;
        using Failure = TransportError;
        using Result  = cetl::variant<Success, Failure>;
    };
    virtual ListIndexes::Result listIndexes(const std::string& collection) = 0;

    /// Creates an index.
    ///
    /// Creating an index identical to an existing one is a no-op.
    /// An index on the same keys but with different constraints is reported as a conflict.
    ///
    struct CreateIndex final
    {
        using Failure = cetl::variant<IndexConflictError, TransportError>;
    };
    virtual cetl::optional<CreateIndex::Failure> createIndex(const std::string& collection, const IndexSpec& spec) = 0;

protected:
    CatalogClient() = default;

};  // CatalogClient

}  // namespace sdk
}  // namespace docmap

#endif  // DOCMAP_SDK_CATALOG_CLIENT_HPP_INCLUDED
