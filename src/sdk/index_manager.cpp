//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include <docmap/sdk/index_manager.hpp>

#include "index/geo_collector.hpp"
#include "index/index_reconciler.hpp"
#include "logging.hpp"

#include <docmap/sdk/catalog_client.hpp>
#include <docmap/sdk/errors.hpp>
#include <docmap/sdk/schema.hpp>
#include <docmap/sdk/schema_registry.hpp>

#include <cetl/pf17/cetlpf.hpp>

#include <memory>
#include <string>
#include <utility>

namespace docmap
{
namespace sdk
{
namespace
{

class IndexManagerImpl final : public IndexManager
{
public:
    IndexManagerImpl(std::shared_ptr<const SchemaRegistry> registry,
                     CatalogClient::Ptr                    catalog_client,
                     const ConnectionSettings&             settings)
        : registry_{std::move(registry)}
        , catalog_client_{std::move(catalog_client)}
        , settings_{settings}
        , logger_{common::getLogger(common::LoggerName::Sdk)}
    {
    }

    // IndexManager

    CompileIndexSpecs::Result compileIndexSpecs(const std::string& schema_name) const override
    {
        const Schema* const schema = registry_->find(schema_name);
        if (schema == nullptr)
        {
            logger_->warn("IndexManager: schema '{}' is not registered.", schema_name);
            return NotRegisteredError{schema_name};
        }
        return schema->index_specs;
    }

    cetl::optional<EnsureIndexes::Failure> ensureIndexes(const std::string& schema_name) override
    {
        const Schema* const schema = registry_->find(schema_name);
        if (schema == nullptr)
        {
            logger_->warn("IndexManager: schema '{}' is not registered.", schema_name);
            return NotRegisteredError{schema_name};
        }

        if (!schema->auto_create_index.value_or(settings_.auto_create_index))
        {
            logger_->debug("IndexManager: automatic index creation is disabled for '{}'.", schema_name);
            return cetl::nullopt;
        }

        logger_->debug("IndexManager: ensuring indexes of '{}' (collection='{}').", schema_name, schema->collection);
        const index::IndexReconciler reconciler{*catalog_client_};
        if (auto failure = reconciler.reconcile(*schema))
        {
            return cetl::visit(  //
                [](auto&& error) -> EnsureIndexes::Failure { return std::forward<decltype(error)>(error); },
                std::move(*failure));
        }
        return cetl::nullopt;
    }

    GeoIndexes::Result geoIndexes(const std::string& schema_name) const override
    {
        const Schema* const schema = registry_->find(schema_name);
        if (schema == nullptr)
        {
            logger_->warn("IndexManager: schema '{}' is not registered.", schema_name);
            return NotRegisteredError{schema_name};
        }
        return index::GeoCollector::selectGeo(schema->index_specs);
    }

    const ConnectionSettings& getSettings() const noexcept override
    {
        return settings_;
    }

private:
    const std::shared_ptr<const SchemaRegistry> registry_;
    const CatalogClient::Ptr                    catalog_client_;
    const ConnectionSettings                    settings_;
    const common::LoggerPtr                     logger_;

};  // IndexManagerImpl

}  // namespace

IndexManager::Ptr IndexManager::make(std::shared_ptr<const SchemaRegistry> registry,
                                     CatalogClient::Ptr                    catalog_client,
                                     const ConnectionSettings&             settings)
{
    if (!registry || !catalog_client)
    {
        common::getLogger(common::LoggerName::Sdk)->error("IndexManager: registry and catalog client are required.");
        return nullptr;
    }
    return std::make_shared<IndexManagerImpl>(std::move(registry), std::move(catalog_client), settings);
}

}  // namespace sdk
}  // namespace docmap
