//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DOCMAP_SDK_INDEX_FIELD_PATH_RESOLVER_HPP_INCLUDED
#define DOCMAP_SDK_INDEX_FIELD_PATH_RESOLVER_HPP_INCLUDED

#include "logging.hpp"

#include <docmap/sdk/errors.hpp>
#include <docmap/sdk/schema.hpp>
#include <docmap/sdk/schema_registry.hpp>

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <string>

namespace docmap
{
namespace sdk
{
namespace index
{

/// Translates logical dotted field paths into storage paths.
///
/// Every path segment is replaced with the storage key of the field it names:
/// - `pk`, `id` and `_id` (as the whole path) name the primary key;
/// - `_cls` (as the whole path) names the discriminator of a polymorphic schema;
/// - embedded and list-of-embedded fields descend into their nested schema;
/// - dict fields (and lists of dicts) take the rest of the path verbatim;
/// - dynamic documents take undeclared top level names verbatim.
///
class FieldPathResolver final
{
public:
    explicit FieldPathResolver(const SchemaRegistry& registry) noexcept
        : registry_{registry}
        , logger_{common::getLogger(common::LoggerName::Index)}
    {
    }

    struct Resolve final
    {
        using Success = std::string;
        using Failure = ConfigError;
        using Result  = cetl::variant<Success, Failure>;
    };
    CETL_NODISCARD Resolve::Result resolve(const Schema& schema, const std::string& path) const;

private:
    const SchemaRegistry&   registry_;
    const common::LoggerPtr logger_;

};  // FieldPathResolver

}  // namespace index
}  // namespace sdk
}  // namespace docmap

#endif  // DOCMAP_SDK_INDEX_FIELD_PATH_RESOLVER_HPP_INCLUDED
