//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "declaration_normalizer.hpp"

#include <docmap/sdk/errors.hpp>
#include <docmap/sdk/index_declaration.hpp>
#include <docmap/sdk/index_spec.hpp>
#include <docmap/sdk/schema.hpp>

#include <cetl/pf17/cetlpf.hpp>
#include <cetl/visit_helpers.hpp>

#include <string>
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

using Item          = IndexDeclaration::Item;
using FieldRef      = IndexDeclaration::FieldRef;
using Directed      = IndexDeclaration::DirectedFieldRef;
using Compound      = IndexDeclaration::Compound;
using OptionsRecord = IndexDeclaration::OptionsRecord;

constexpr char PrefixAscending  = '+';
constexpr char PrefixDescending = '-';
constexpr char PrefixGeo        = '*';

bool startsWithPrefix(const std::string& path)
{
    return !path.empty() &&
           ((path.front() == PrefixAscending) || (path.front() == PrefixDescending) || (path.front() == PrefixGeo));
}

cetl::optional<IndexDirection> parseDirectionToken(const std::string& token)
{
    if ((token == "1") || (token == "+1"))
    {
        return IndexDirection::Ascending;
    }
    if (token == "-1")
    {
        return IndexDirection::Descending;
    }
    if (token == "2d")
    {
        return IndexDirection::Geo2d;
    }
    return cetl::nullopt;
}

/// A compound of two plain references with a direction token as the second one is a directed reference.
///
std::vector<Item> compoundItems(const Compound& compound)
{
    if (compound.items.size() == 2)
    {
        const auto* const first  = cetl::get_if<FieldRef>(&compound.items[0]);
        const auto* const second = cetl::get_if<FieldRef>(&compound.items[1]);
        if ((first != nullptr) && (second != nullptr))
        {
            if (const auto direction = parseDirectionToken(second->path))
            {
                return {Directed{first->path, *direction}};
            }
        }
    }
    return compound.items;
}

/// Brings every declaration shape to the record one.
///
OptionsRecord toRecord(const IndexDeclaration& declaration)
{
    return cetl::visit(cetl::make_overloaded(
                           [](const FieldRef& field_ref) {
                               OptionsRecord record;
                               record.fields = std::vector<Item>{field_ref};
                               return record;
                           },
                           [](const Directed& directed) {
                               OptionsRecord record;
                               record.fields = std::vector<Item>{directed};
                               return record;
                           },
                           [](const Compound& compound) {
                               OptionsRecord record;
                               record.fields = compoundItems(compound);
                               return record;
                           },
                           [](const OptionsRecord& record) { return record; }),
                       declaration.value);
}

}  // namespace

DeclarationNormalizer::Normalize::Result DeclarationNormalizer::normalize(const Schema&           schema,
                                                                          const IndexDeclaration& declaration) const
{
    const auto record = toRecord(declaration);
    if (!record.fields || record.fields->empty())
    {
        return ConfigError{"Index declaration of '" + schema.name + "' has no fields."};
    }

    IndexSpec spec;
    for (const auto& item : *record.fields)
    {
        if (auto error = appendKey(schema, item, spec.keys))
        {
            return std::move(*error);
        }
    }

    spec.options.unique               = record.unique;
    spec.options.sparse               = record.sparse;
    spec.options.background           = record.background;
    spec.options.drop_dups            = record.drop_dups;
    spec.options.expire_after_seconds = record.expire_after_seconds;

    const bool is_geo = spec.isGeo();
    if (is_geo && (spec.keys.size() > 1))
    {
        return ConfigError{"Geospatial index '" + spec.name() + "' of '" + schema.name + "' must have one field."};
    }
    if (record.sparse && (spec.keys.size() > 1))
    {
        return ConfigError{"Sparse index '" + spec.name() + "' of '" + schema.name + "' may have only one field."};
    }
    if (record.expire_after_seconds && (*record.expire_after_seconds < 0))
    {
        return ConfigError{"Index '" + spec.name() + "' of '" + schema.name + "' has negative expiry."};
    }

    const bool eligible = !record.sparse && record.types && !is_geo;
    return NormalizedIndex{std::move(spec), eligible};
}

cetl::optional<ConfigError> DeclarationNormalizer::appendKey(const Schema&                 schema,
                                                             const IndexDeclaration::Item& item,
                                                             IndexKeys&                    keys) const
{
    std::string    path;
    IndexDirection direction = IndexDirection::Ascending;
    if (const auto* const field_ref = cetl::get_if<FieldRef>(&item))
    {
        path = field_ref->path;
        if (startsWithPrefix(path))
        {
            switch (path.front())
            {
            case PrefixDescending:
                direction = IndexDirection::Descending;
                break;
            case PrefixGeo:
                direction = IndexDirection::Geo2d;
                break;
            default:
                break;
            }
            path.erase(0, 1);
            if (startsWithPrefix(path))
            {
                return ConfigError{"Conflicting direction markers in '" + field_ref->path + "' of '" + schema.name +
                                   "'."};
            }
        }
    }
    else
    {
        const auto& directed = cetl::get<Directed>(item);
        if (startsWithPrefix(directed.path))
        {
            return ConfigError{"Explicit direction conflicts with the prefix of '" + directed.path + "' of '" +
                               schema.name + "'."};
        }
        path      = directed.path;
        direction = directed.direction;
    }

    if (path.empty())
    {
        return ConfigError{"Empty field path in an index of '" + schema.name + "'."};
    }

    auto resolved = resolver_.resolve(schema, path);
    if (auto* const error = cetl::get_if<FieldPathResolver::Resolve::Failure>(&resolved))
    {
        return std::move(*error);
    }
    auto& storage_path = cetl::get<FieldPathResolver::Resolve::Success>(resolved);

    for (const auto& existing : keys)
    {
        if (existing.key == storage_path)
        {
            return ConfigError{"Duplicate key '" + storage_path + "' in an index of '" + schema.name + "'."};
        }
    }
    keys.push_back(IndexKey{std::move(storage_path), direction});
    return cetl::nullopt;
}

}  // namespace index
}  // namespace sdk
}  // namespace docmap
