//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "inheritance_merger.hpp"

#include "declaration_normalizer.hpp"

#include <docmap/sdk/index_spec.hpp>
#include <docmap/sdk/schema.hpp>

#include <cetl/pf17/cetlpf.hpp>

#include <algorithm>
#include <utility>
#include <vector>

namespace docmap
{
namespace sdk
{
namespace index
{
namespace
{

/// Declarations with the same key sequence collapse into one spec, so that only one index per key sequence exists.
/// The later declaration's options win, except that `unique` is never dropped.
///
void appendByKeys(NormalizedIndexes& indexes, NormalizedIndex&& index)
{
    const auto same_keys = std::find_if(indexes.begin(), indexes.end(), [&index](const NormalizedIndex& existing) {
        return existing.spec.keys == index.spec.keys;
    });
    if (same_keys == indexes.end())
    {
        indexes.push_back(std::move(index));
        return;
    }

    const bool was_unique             = same_keys->spec.options.unique;
    same_keys->spec.options           = index.spec.options;
    same_keys->spec.options.unique    = was_unique || index.spec.options.unique;
    same_keys->discriminator_eligible = index.discriminator_eligible;
}

}  // namespace

InheritanceMerger::Merge::Result InheritanceMerger::merge(const Schema& schema) const
{
    std::vector<const Schema*> chain;
    chain.reserve(schema.ancestors.size() + 1);
    for (const auto ancestor_id : schema.ancestors)
    {
        chain.push_back(&registry_.get(ancestor_id));
    }
    chain.push_back(&schema);

    // Paths of inherited declarations are resolved against the schema itself, which has all inherited fields.
    //
    NormalizedIndexes merged;
    for (const auto* const declaring : chain)
    {
        for (const auto& declaration : declaring->own_indexes)
        {
            auto normalized = normalizer_.normalize(schema, declaration);
            if (auto* const error = cetl::get_if<DeclarationNormalizer::Normalize::Failure>(&normalized))
            {
                logger_->warn("Index declared by '{}' is invalid for '{}': {}",
                              declaring->name,
                              schema.name,
                              error->message);
                return std::move(*error);
            }
            appendByKeys(merged, cetl::get<DeclarationNormalizer::Normalize::Success>(std::move(normalized)));
        }
    }

    if (schema.isPolymorphic())
    {
        const IndexKey    discriminator{DiscriminatorKey, IndexDirection::Ascending};
        NormalizedIndexes prefixed;
        prefixed.reserve(merged.size());
        for (auto& index : merged)
        {
            if (index.discriminator_eligible && !index.spec.beginsWith(DiscriminatorKey))
            {
                index.spec.keys.insert(index.spec.keys.begin(), discriminator);
            }
            // Prefixing may have made two key sequences equal.
            appendByKeys(prefixed, std::move(index));
        }
        merged = std::move(prefixed);
    }

    IndexSpecs result;
    result.reserve(merged.size());
    for (auto& index : merged)
    {
        result.push_back(std::move(index.spec));
    }
    logger_->debug("Merged {} declared index(es) of '{}'.", result.size(), schema.name);
    return result;
}

}  // namespace index
}  // namespace sdk
}  // namespace docmap
