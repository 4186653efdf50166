//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DOCMAP_SDK_INDEX_UNIQUE_DERIVER_HPP_INCLUDED
#define DOCMAP_SDK_INDEX_UNIQUE_DERIVER_HPP_INCLUDED

#include "field_path_resolver.hpp"
#include "logging.hpp"

#include <docmap/sdk/errors.hpp>
#include <docmap/sdk/index_spec.hpp>
#include <docmap/sdk/schema.hpp>
#include <docmap/sdk/schema_registry.hpp>

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <string>
#include <vector>

namespace docmap
{
namespace sdk
{
namespace index
{

/// Derives unique indexes from field level `unique` and `unique_with` constraints.
///
/// Such an index starts with the field's own key followed by its `unique_with` companions (in their order).
/// Embedded documents contribute their constraints under the embedding field's storage key.
/// Derived specs are never prefixed with the discriminator.
///
class UniqueDeriver final
{
public:
    UniqueDeriver(const SchemaRegistry& registry, const FieldPathResolver& resolver)
        : registry_{registry}
        , resolver_{resolver}
        , logger_{common::getLogger(common::LoggerName::Index)}
    {
    }

    struct Derive final
    {
        using Success = IndexSpecs;
        using Failure = ConfigError;
        using Result  = cetl::variant<Success, Failure>;
    };
    CETL_NODISCARD Derive::Result derive(const Schema& schema) const;

private:
    CETL_NODISCARD cetl::optional<ConfigError> deriveInto(const Schema&          schema,
                                                          const std::string&     name_space,
                                                          std::vector<SchemaId>& visiting,
                                                          IndexSpecs&            specs) const;

    const SchemaRegistry&    registry_;
    const FieldPathResolver& resolver_;
    const common::LoggerPtr  logger_;

};  // UniqueDeriver

}  // namespace index
}  // namespace sdk
}  // namespace docmap

#endif  // DOCMAP_SDK_INDEX_UNIQUE_DERIVER_HPP_INCLUDED
