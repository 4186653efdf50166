//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "geo_collector.hpp"

#include <docmap/sdk/index_spec.hpp>
#include <docmap/sdk/schema.hpp>

#include <algorithm>
#include <iterator>
#include <string>
#include <utility>
#include <vector>

namespace docmap
{
namespace sdk
{
namespace index
{

IndexSpecs GeoCollector::collectFieldSpecs(const Schema& schema) const
{
    IndexSpecs            specs;
    std::vector<SchemaId> visiting{schema.id};
    collectInto(schema, "", visiting, specs);
    return specs;
}

IndexSpecs GeoCollector::selectGeo(const IndexSpecs& specs)
{
    IndexSpecs geo_specs;
    std::copy_if(specs.cbegin(), specs.cend(), std::back_inserter(geo_specs), [](const IndexSpec& spec) {
        return spec.isGeo();
    });
    return geo_specs;
}

void GeoCollector::collectInto(const Schema&          schema,
                               const std::string&     name_space,
                               std::vector<SchemaId>& visiting,
                               IndexSpecs&            specs) const
{
    for (const auto& field : schema.fields)
    {
        if (field.type == FieldType::GeoPoint)
        {
            IndexSpec spec;
            spec.keys.push_back(IndexKey{name_space + field.db_field, IndexDirection::Geo2d});
            specs.push_back(std::move(spec));
            continue;
        }

        if ((field.effectiveType() != FieldType::Embedded) || !field.document)
        {
            continue;
        }
        const auto nested_id = *field.document;
        if (std::find(visiting.cbegin(), visiting.cend(), nested_id) != visiting.cend())
        {
            continue;
        }
        visiting.push_back(nested_id);
        collectInto(registry_.get(nested_id), name_space + field.db_field + ".", visiting, specs);
        visiting.pop_back();
    }
}

}  // namespace index
}  // namespace sdk
}  // namespace docmap
