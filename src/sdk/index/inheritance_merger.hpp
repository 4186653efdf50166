//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DOCMAP_SDK_INDEX_INHERITANCE_MERGER_HPP_INCLUDED
#define DOCMAP_SDK_INDEX_INHERITANCE_MERGER_HPP_INCLUDED

#include "declaration_normalizer.hpp"
#include "logging.hpp"

#include <docmap/sdk/errors.hpp>
#include <docmap/sdk/index_spec.hpp>
#include <docmap/sdk/schema.hpp>
#include <docmap/sdk/schema_registry.hpp>

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

namespace docmap
{
namespace sdk
{
namespace index
{

/// Collects declared indexes of a schema and all its ancestors (abstract ones included).
///
/// Ancestors' declarations come first (oldest first), then the schema's own ones; exact duplicates are dropped.
/// For a polymorphic schema every eligible spec is prefixed with the ascending discriminator key.
///
class InheritanceMerger final
{
public:
    InheritanceMerger(const SchemaRegistry& registry, const DeclarationNormalizer& normalizer)
        : registry_{registry}
        , normalizer_{normalizer}
        , logger_{common::getLogger(common::LoggerName::Index)}
    {
    }

    struct Merge final
    {
        using Success = IndexSpecs;
        using Failure = ConfigError;
        using Result  = cetl::variant<Success, Failure>;
    };
    CETL_NODISCARD Merge::Result merge(const Schema& schema) const;

private:
    const SchemaRegistry&        registry_;
    const DeclarationNormalizer& normalizer_;
    const common::LoggerPtr      logger_;

};  // InheritanceMerger

}  // namespace index
}  // namespace sdk
}  // namespace docmap

#endif  // DOCMAP_SDK_INDEX_INHERITANCE_MERGER_HPP_INCLUDED
