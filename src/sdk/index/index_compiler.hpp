//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DOCMAP_SDK_INDEX_INDEX_COMPILER_HPP_INCLUDED
#define DOCMAP_SDK_INDEX_INDEX_COMPILER_HPP_INCLUDED

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

/// Produces the canonical index list of a schema.
///
/// The list is: merged declared indexes (with the discriminator prefix), then indexes of geo point fields,
/// then implicit unique indexes. Implicit specs are merged in by their key sequence.
///
class IndexCompiler final
{
public:
    explicit IndexCompiler(const SchemaRegistry& registry)
        : registry_{registry}
        , logger_{common::getLogger(common::LoggerName::Index)}
    {
    }

    struct Compile final
    {
        using Success = IndexSpecs;
        using Failure = ConfigError;
        using Result  = cetl::variant<Success, Failure>;
    };
    CETL_NODISCARD Compile::Result compile(const Schema& schema) const;

    /// Merges implicit specs into a list.
    ///
    /// A spec with the same key sequence as an already listed one updates options of the listed spec
    /// (so it becomes unique, for example); any other spec is appended.
    ///
    static void mergeByKeys(IndexSpecs& specs, const IndexSpecs& implicit_specs);

private:
    const SchemaRegistry&   registry_;
    const common::LoggerPtr logger_;

};  // IndexCompiler

}  // namespace index
}  // namespace sdk
}  // namespace docmap

#endif  // DOCMAP_SDK_INDEX_INDEX_COMPILER_HPP_INCLUDED
