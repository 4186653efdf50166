//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DOCMAP_SDK_INDEX_DECLARATION_NORMALIZER_HPP_INCLUDED
#define DOCMAP_SDK_INDEX_DECLARATION_NORMALIZER_HPP_INCLUDED

#include "field_path_resolver.hpp"

#include <docmap/sdk/errors.hpp>
#include <docmap/sdk/index_declaration.hpp>
#include <docmap/sdk/index_spec.hpp>
#include <docmap/sdk/schema.hpp>

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

/// Index spec together with what its declaration says about the discriminator prefix.
///
struct NormalizedIndex final
{
    IndexSpec spec;

    /// `false` for sparse, geospatial, and `types = false` declarations.
    bool discriminator_eligible{true};

};  // NormalizedIndex

using NormalizedIndexes = std::vector<NormalizedIndex>;

/// Converts any declaration shape into an index spec with storage keys.
///
class DeclarationNormalizer final
{
public:
    explicit DeclarationNormalizer(const FieldPathResolver& resolver) noexcept
        : resolver_{resolver}
    {
    }

    struct Normalize final
    {
        using Success = NormalizedIndex;
        using Failure = ConfigError;
        using Result  = cetl::variant<Success, Failure>;
    };
    CETL_NODISCARD Normalize::Result normalize(const Schema& schema, const IndexDeclaration& declaration) const;

private:
    CETL_NODISCARD cetl::optional<ConfigError> appendKey(const Schema&                 schema,
                                                         const IndexDeclaration::Item& item,
                                                         IndexKeys&                    keys) const;

    const FieldPathResolver& resolver_;

};  // DeclarationNormalizer

}  // namespace index
}  // namespace sdk
}  // namespace docmap

#endif  // DOCMAP_SDK_INDEX_DECLARATION_NORMALIZER_HPP_INCLUDED
