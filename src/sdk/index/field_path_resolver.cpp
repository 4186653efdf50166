//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "field_path_resolver.hpp"

#include <docmap/sdk/errors.hpp>
#include <docmap/sdk/index_spec.hpp>
#include <docmap/sdk/schema.hpp>

#include <cetl/pf17/cetlpf.hpp>

#include <cstddef>
#include <string>
#include <vector>

namespace docmap
{
namespace sdk
{
namespace index
{
namespace
{

std::vector<std::string> splitPath(const std::string& path)
{
    std::vector<std::string> parts;
    std::size_t              begin = 0;
    while (true)
    {
        const auto end = path.find('.', begin);
        parts.push_back(path.substr(begin, end - begin));
        if (end == std::string::npos)
        {
            break;
        }
        begin = end + 1;
    }
    return parts;
}

bool isPrimaryKeyAlias(const std::string& path)
{
    return (path == "pk") || (path == "id") || (path == PrimaryKey);
}

}  // namespace

FieldPathResolver::Resolve::Result FieldPathResolver::resolve(const Schema& schema, const std::string& path) const
{
    if (isPrimaryKeyAlias(path))
    {
        return std::string{PrimaryKey};
    }
    if ((path == DiscriminatorKey) && schema.isPolymorphic())
    {
        return std::string{DiscriminatorKey};
    }

    const auto parts = splitPath(path);

    std::string   storage_path;
    const Schema* current   = &schema;  // `nullptr` means free-form content (the rest is taken verbatim)
    bool          free_form = false;
    for (std::size_t i = 0; i < parts.size(); ++i)
    {
        const auto& part = parts[i];
        if (part.empty())
        {
            return ConfigError{"Invalid field path '" + path + "' of '" + schema.name + "'."};
        }
        if (!storage_path.empty())
        {
            storage_path += '.';
        }

        if (free_form)
        {
            storage_path += part;
            continue;
        }
        if (current == nullptr)
        {
            return ConfigError{"Cannot resolve subfield '" + part + "' of path '" + path + "' on '" + schema.name +
                               "'."};
        }

        const Field* const field = current->findField(part);
        if (field == nullptr)
        {
            if ((i == 0) && current->isDynamic())
            {
                storage_path += part;
                free_form = true;
                continue;
            }
            return ConfigError{"Cannot resolve field '" + part + "' of path '" + path + "' on '" + current->name +
                               "'."};
        }
        storage_path += field->db_field;

        switch (field->effectiveType())
        {
        case FieldType::Embedded:
            CETL_DEBUG_ASSERT(field->document, "Embedded field must have its document resolved.");
            current = &registry_.get(*field->document);
            break;
        case FieldType::Dict:
            free_form = true;
            break;
        case FieldType::Reference:
            // References are never joined, so nothing below a reference could be indexed.
        default:
            current = nullptr;
            break;
        }
    }

    logger_->trace("Path '{}' of '{}' resolved to '{}'.", path, schema.name, storage_path);
    return storage_path;
}

}  // namespace index
}  // namespace sdk
}  // namespace docmap
