//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "unique_deriver.hpp"

#include <docmap/sdk/index_spec.hpp>
#include <docmap/sdk/schema.hpp>

#include <cetl/pf17/cetlpf.hpp>

#include <algorithm>
#include <string>
#include <utility>
#include <vector>

namespace docmap
{
namespace sdk
{
namespace index
{

UniqueDeriver::Derive::Result UniqueDeriver::derive(const Schema& schema) const
{
    IndexSpecs            specs;
    std::vector<SchemaId> visiting{schema.id};
    if (auto error = deriveInto(schema, "", visiting, specs))
    {
        return std::move(*error);
    }

    logger_->debug("Derived {} unique index(es) of '{}'.", specs.size(), schema.name);
    return specs;
}

cetl::optional<ConfigError> UniqueDeriver::deriveInto(const Schema&          schema,
                                                      const std::string&     name_space,
                                                      std::vector<SchemaId>& visiting,
                                                      IndexSpecs&            specs) const
{
    for (const auto& field : schema.fields)
    {
        if (field.isUnique())
        {
            IndexSpec spec;
            spec.keys.push_back(IndexKey{name_space + field.db_field, IndexDirection::Ascending});
            for (const auto& companion : field.unique_with)
            {
                auto resolved = resolver_.resolve(schema, companion);
                if (auto* const error = cetl::get_if<FieldPathResolver::Resolve::Failure>(&resolved))
                {
                    return ConfigError{"Invalid 'unique_with' of '" + schema.name + "." + field.name +
                                       "': " + error->message};
                }
                spec.keys.push_back(IndexKey{name_space + cetl::get<FieldPathResolver::Resolve::Success>(resolved),
                                             IndexDirection::Ascending});
            }
            spec.options.unique = true;
            spec.options.sparse = false;
            specs.push_back(std::move(spec));
        }

        // Only directly embedded documents are descended into, never lists or references.
        if ((field.type == FieldType::Embedded) && field.document)
        {
            const auto nested_id = *field.document;
            if (std::find(visiting.cbegin(), visiting.cend(), nested_id) != visiting.cend())
            {
                logger_->trace("Skipping recursive '{}' of '{}'.", field.name, schema.name);
                continue;
            }

            visiting.push_back(nested_id);
            auto error = deriveInto(registry_.get(nested_id), name_space + field.db_field + ".", visiting, specs);
            visiting.pop_back();
            if (error)
            {
                return error;
            }
        }
    }
    return cetl::nullopt;
}

}  // namespace index
}  // namespace sdk
}  // namespace docmap
