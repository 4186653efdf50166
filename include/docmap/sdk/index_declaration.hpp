//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DOCMAP_SDK_INDEX_DECLARATION_HPP_INCLUDED
#define DOCMAP_SDK_INDEX_DECLARATION_HPP_INCLUDED

#include "index_spec.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace docmap
{
namespace sdk
{

/// Defines shapes in which an index may be declared in the schema metadata.
///
/// A field reference is a logical dotted path with an optional one character prefix:
/// - no prefix or `+` - ascending;
/// - `-` - descending;
/// - `*` - two-dimensional geospatial.
///
struct IndexDeclaration final
{
    /// F.e. `"-date"` or `"tags.name"`.
    ///
    struct FieldRef final
    {
        std::string path;

    };  // FieldRef

    /// F.e. `("date", -1)`. The path must not carry a prefix.
    ///
    struct DirectedFieldRef final
    {
        std::string    path;
        IndexDirection direction{IndexDirection::Ascending};

    };  // DirectedFieldRef

    using Item = cetl::variant<FieldRef, DirectedFieldRef>;

    /// F.e. `("category", "-date")`.
    ///
    /// A compound of exactly two plain references whose second element is a direction token
    /// (`1`, `-1` or `2d`) is read as a directed reference.
    ///
    struct Compound final
    {
        std::vector<Item> items;

    };  // Compound

    /// Full record form, f.e. `{fields: ["-date"], unique: true, sparse: true, types: false}`.
    ///
    struct OptionsRecord final
    {
        cetl::optional<std::vector<Item>> fields;

        bool                         unique{false};
        bool                         sparse{false};
        bool                         background{false};
        bool                         drop_dups{false};
        cetl::optional<std::int64_t> expire_after_seconds;

        /// `false` opts the index out of the discriminator prefix.
        bool types{true};

    };  // OptionsRecord

    using Var = cetl::variant<FieldRef, DirectedFieldRef, Compound, OptionsRecord>;

    Var value;

    // MARK: Factories

    static IndexDeclaration field(std::string path)
    {
        return IndexDeclaration{FieldRef{std::move(path)}};
    }

    static IndexDeclaration directed(std::string path, const IndexDirection direction)
    {
        return IndexDeclaration{DirectedFieldRef{std::move(path), direction}};
    }

    static IndexDeclaration compound(std::vector<Item> items)
    {
        return IndexDeclaration{Compound{std::move(items)}};
    }

    static IndexDeclaration compoundOf(const std::vector<std::string>& paths)
    {
        Compound compound;
        for (const auto& path : paths)
        {
            compound.items.emplace_back(FieldRef{path});
        }
        return IndexDeclaration{std::move(compound)};
    }

    static IndexDeclaration record(OptionsRecord options_record)
    {
        return IndexDeclaration{std::move(options_record)};
    }

};  // IndexDeclaration

using IndexDeclarations = std::vector<IndexDeclaration>;

}  // namespace sdk
}  // namespace docmap

#endif  // DOCMAP_SDK_INDEX_DECLARATION_HPP_INCLUDED
