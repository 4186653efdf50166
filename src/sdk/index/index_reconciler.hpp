//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DOCMAP_SDK_INDEX_INDEX_RECONCILER_HPP_INCLUDED
#define DOCMAP_SDK_INDEX_INDEX_RECONCILER_HPP_INCLUDED

#include "logging.hpp"

#include <docmap/sdk/catalog_client.hpp>
#include <docmap/sdk/errors.hpp>
#include <docmap/sdk/index_spec.hpp>
#include <docmap/sdk/schema.hpp>

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

namespace docmap
{
namespace sdk
{
namespace index
{

/// Brings the store's catalog of a schema's collection up to its compiled index list.
///
/// The catalog is queried on every call, so nothing is assumed about what exists.
/// Indexes are only ever created; existing ones are neither dropped nor rebuilt.
///
class IndexReconciler final
{
public:
    explicit IndexReconciler(CatalogClient& catalog_client)
        : catalog_client_{catalog_client}
        , logger_{common::getLogger(common::LoggerName::Index)}
    {
    }

    struct Reconcile final
    {
        using Failure = cetl::variant<ConfigError, IndexConflictError, TransportError>;
    };
    CETL_NODISCARD cetl::optional<Reconcile::Failure> reconcile(const Schema& schema) const;

    /// Makes the list of indexes which should exist for a schema.
    ///
    /// It's the compiled list with build options of the schema applied, and the standalone discriminator index
    /// for a polymorphic schema (unless disabled, or some index already starts with the discriminator).
    ///
    CETL_NODISCARD static IndexSpecs plan(const Schema& schema);

private:
    CatalogClient&          catalog_client_;
    const common::LoggerPtr logger_;

};  // IndexReconciler

}  // namespace index
}  // namespace sdk
}  // namespace docmap

#endif  // DOCMAP_SDK_INDEX_INDEX_RECONCILER_HPP_INCLUDED
