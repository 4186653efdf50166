//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include <docmap/sdk/schema.hpp>

#include <cetl/pf17/cetlpf.hpp>

#include <string>
#include <utility>

namespace docmap
{
namespace sdk
{

cetl::optional<FieldType> parseFieldType(const std::string& type_name)
{
    static const std::pair<const char*, FieldType> known_types[] = {  // NOLINT(*-avoid-c-arrays)
        {"string", FieldType::String},
        {"int", FieldType::Int},
        {"float", FieldType::Float},
        {"boolean", FieldType::Boolean},
        {"datetime", FieldType::DateTime},
        {"object_id", FieldType::ObjectId},
        {"dict", FieldType::Dict},
        {"list", FieldType::List},
        {"geo_point", FieldType::GeoPoint},
        {"reference", FieldType::Reference},
        {"embedded", FieldType::Embedded},
    };
    for (const auto& known : known_types)
    {
        if (type_name == known.first)
        {
            return known.second;
        }
    }
    return cetl::nullopt;
}

}  // namespace sdk
}  // namespace docmap
