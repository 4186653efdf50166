//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "index_compiler.hpp"

#include "declaration_normalizer.hpp"
#include "field_path_resolver.hpp"
#include "geo_collector.hpp"
#include "inheritance_merger.hpp"
#include "unique_deriver.hpp"

#include <docmap/sdk/index_spec.hpp>
#include <docmap/sdk/schema.hpp>

#include <cetl/pf17/cetlpf.hpp>

#include <algorithm>
#include <utility>

namespace docmap
{
namespace sdk
{
namespace index
{

IndexCompiler::Compile::Result IndexCompiler::compile(const Schema& schema) const
{
    const FieldPathResolver     resolver{registry_};
    const DeclarationNormalizer normalizer{resolver};
    const InheritanceMerger     merger{registry_, normalizer};
    const UniqueDeriver         unique_deriver{registry_, resolver};
    const GeoCollector          geo_collector{registry_};

    auto merged = merger.merge(schema);
    if (auto* const error = cetl::get_if<InheritanceMerger::Merge::Failure>(&merged))
    {
        return std::move(*error);
    }
    auto specs = cetl::get<InheritanceMerger::Merge::Success>(std::move(merged));

    mergeByKeys(specs, geo_collector.collectFieldSpecs(schema));

    auto uniques = unique_deriver.derive(schema);
    if (auto* const error = cetl::get_if<UniqueDeriver::Derive::Failure>(&uniques))
    {
        return std::move(*error);
    }
    mergeByKeys(specs, cetl::get<UniqueDeriver::Derive::Success>(uniques));

    logger_->debug("Compiled {} index spec(s) of '{}'.", specs.size(), schema.name);
    for (const auto& spec : specs)
    {
        logger_->trace("'{}' index: {}", schema.name, spec);
    }
    return specs;
}

void IndexCompiler::mergeByKeys(IndexSpecs& specs, const IndexSpecs& implicit_specs)
{
    for (const auto& implicit_spec : implicit_specs)
    {
        const auto same_keys = std::find_if(specs.begin(), specs.end(), [&implicit_spec](const IndexSpec& spec) {
            return spec.keys == implicit_spec.keys;
        });
        if (same_keys == specs.end())
        {
            specs.push_back(implicit_spec);
            continue;
        }

        auto& options  = same_keys->options;
        options.unique = options.unique || implicit_spec.options.unique;
        options.sparse = implicit_spec.options.sparse;
        if (implicit_spec.options.expire_after_seconds)
        {
            options.expire_after_seconds = implicit_spec.options.expire_after_seconds;
        }
    }
}

}  // namespace index
}  // namespace sdk
}  // namespace docmap
