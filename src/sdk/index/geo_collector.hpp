//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DOCMAP_SDK_INDEX_GEO_COLLECTOR_HPP_INCLUDED
#define DOCMAP_SDK_INDEX_GEO_COLLECTOR_HPP_INCLUDED

#include <docmap/sdk/index_spec.hpp>
#include <docmap/sdk/schema.hpp>
#include <docmap/sdk/schema_registry.hpp>

#include <cetl/cetl.hpp>

#include <string>
#include <vector>

namespace docmap
{
namespace sdk
{
namespace index
{

class GeoCollector final
{
public:
    explicit GeoCollector(const SchemaRegistry& registry) noexcept
        : registry_{registry}
    {
    }

    /// Makes a `(path, 2d)` spec for every geo point field of the schema.
    ///
    /// Embedded documents and lists of them are searched as well; a document type which is already
    /// being searched along the current path is not entered again. References are never followed.
    ///
    CETL_NODISCARD IndexSpecs collectFieldSpecs(const Schema& schema) const;

    /// Selects geospatial specs of a compiled list, preserving their order.
    ///
    CETL_NODISCARD static IndexSpecs selectGeo(const IndexSpecs& specs);

private:
    void collectInto(const Schema&          schema,
                     const std::string&     name_space,
                     std::vector<SchemaId>& visiting,
                     IndexSpecs&            specs) const;

    const SchemaRegistry& registry_;

};  // GeoCollector

}  // namespace index
}  // namespace sdk
}  // namespace docmap

#endif  // DOCMAP_SDK_INDEX_GEO_COLLECTOR_HPP_INCLUDED
