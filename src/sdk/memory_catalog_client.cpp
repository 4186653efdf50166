//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include <docmap/sdk/catalog_client.hpp>

#include "logging.hpp"

#include <docmap/sdk/errors.hpp>
#include <docmap/sdk/index_spec.hpp>

#include <cetl/pf17/cetlpf.hpp>

#include <algorithm>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace docmap
{
namespace sdk
{
namespace
{

class InMemoryCatalogClient final : public CatalogClient
{
public:
    InMemoryCatalogClient()
        : logger_{common::getLogger(common::LoggerName::Sdk)}
    {
    }

    // CatalogClient

    ListIndexes::Result listIndexes(const std::string& collection) override
    {
        const std::lock_guard<std::mutex> lock{mutex_};

        const auto it = collections_.find(collection);
        if (it == collections_.end())
        {
            return ListIndexes::Success{};
        }
        return it->second;
    }

    cetl::optional<CreateIndex::Failure> createIndex(const std::string& collection, const IndexSpec& spec) override
    {
        const std::lock_guard<std::mutex> lock{mutex_};

        auto& entries = collections_[collection];
        if (entries.empty())
        {
            logger_->debug("Catalog: collection '{}' is created.", collection);
            entries.push_back(CatalogEntry{PrimaryIndexName, {IndexKey{PrimaryKey, IndexDirection::Ascending}}, {}});
        }

        // Generated names are ambiguous (`{"a_1_b": 1}` and `{a: 1, b: 1}` are both `a_1_b_1`),
        // so an index is identified by its key sequence only.
        const auto name     = spec.name();
        const auto existing = std::find_if(entries.cbegin(), entries.cend(), [&spec](const CatalogEntry& entry) {
            return entry.keys == spec.keys;
        });
        if (existing != entries.cend())
        {
            if (spec.sameConstraints(existing->options))
            {
                logger_->trace("Catalog: index '{}' of '{}' already exists.", name, collection);
                return cetl::nullopt;
            }
            return IndexConflictError{spec,
                                      existing->name,
                                      "Index '" + existing->name + "' of '" + collection +
                                          "' already exists with different options."};
        }

        entries.push_back(CatalogEntry{name, spec.keys, spec.options});
        logger_->debug("Catalog: index '{}' of '{}' is created ({}).", name, collection, spec);
        return cetl::nullopt;
    }

private:
    std::mutex                                       mutex_;
    std::map<std::string, std::vector<CatalogEntry>> collections_;
    const common::LoggerPtr                          logger_;

};  // InMemoryCatalogClient

}  // namespace

CatalogClient::Ptr CatalogClient::makeInMemory()
{
    return std::make_shared<InMemoryCatalogClient>();
}

}  // namespace sdk
}  // namespace docmap
