//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "index_reconciler.hpp"

#include <docmap/sdk/catalog_client.hpp>
#include <docmap/sdk/errors.hpp>
#include <docmap/sdk/index_spec.hpp>
#include <docmap/sdk/schema.hpp>

#include <cetl/pf17/cetlpf.hpp>

#include <algorithm>
#include <cstddef>
#include <utility>
#include <vector>

namespace docmap
{
namespace sdk
{
namespace index
{

IndexSpecs IndexReconciler::plan(const Schema& schema)
{
    IndexSpecs specs = schema.index_specs;
    for (auto& spec : specs)
    {
        spec.options.background = spec.options.background || schema.index_background;
        spec.options.drop_dups  = spec.options.drop_dups || schema.index_drop_dups;
    }

    const bool has_discriminator_index = std::any_of(specs.cbegin(), specs.cend(), [](const IndexSpec& spec) {
        return spec.beginsWith(DiscriminatorKey);
    });
    if (schema.isPolymorphic() && schema.index_cls && !has_discriminator_index)
    {
        IndexSpec discriminator_spec;
        discriminator_spec.keys.push_back(IndexKey{DiscriminatorKey, IndexDirection::Ascending});
        discriminator_spec.options.background = schema.index_background;
        specs.push_back(std::move(discriminator_spec));
    }
    return specs;
}

cetl::optional<IndexReconciler::Reconcile::Failure> IndexReconciler::reconcile(const Schema& schema) const
{
    if (!schema.hasCollection())
    {
        return ConfigError{"Schema '" + schema.name + "' has no collection (it's abstract or embedded)."};
    }
    const auto& collection = schema.collection;

    auto listed = catalog_client_.listIndexes(collection);
    if (auto* const error = cetl::get_if<CatalogClient::ListIndexes::Failure>(&listed))
    {
        logger_->error("Failed to list indexes of '{}' (code={}): {}", collection, error->code, error->message);
        return std::move(*error);
    }
    auto catalog = cetl::get<CatalogClient::ListIndexes::Success>(std::move(listed));

    std::size_t created = 0;
    for (const auto& spec : plan(schema))
    {
        if (spec.isPrimaryKeyOnly())
        {
            logger_->trace("Index {} of '{}' is the primary key one.", spec, collection);
            continue;
        }

        const auto existing = std::find_if(catalog.cbegin(), catalog.cend(), [&spec](const CatalogEntry& entry) {
            return entry.keys == spec.keys;
        });
        if (existing != catalog.cend())
        {
            if (spec.sameConstraints(existing->options))
            {
                logger_->trace("Index '{}' of '{}' already exists.", existing->name, collection);
                continue;
            }
            logger_->error("Index {} of '{}' conflicts with existing '{}'.", spec, collection, existing->name);
            return IndexConflictError{spec,
                                      existing->name,
                                      "Index '" + existing->name + "' of '" + collection +
                                          "' already exists with different options than " + spec.toString() + "."};
        }

        logger_->info("Creating index '{}' of '{}': {}", spec.name(), collection, spec);
        if (auto failure = catalog_client_.createIndex(collection, spec))
        {
            logger_->error("Failed to create index '{}' of '{}'.", spec.name(), collection);
            return cetl::visit(  //
                [](auto&& error) -> Reconcile::Failure { return std::forward<decltype(error)>(error); },
                std::move(*failure));
        }
        catalog.push_back(CatalogEntry{spec.name(), spec.keys, spec.options});
        ++created;
    }

    logger_->debug("Indexes of '{}' are reconciled ({} created).", collection, created);
    return cetl::nullopt;
}

}  // namespace index
}  // namespace sdk
}  // namespace docmap
