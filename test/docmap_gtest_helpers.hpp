//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DOCMAP_GTEST_HELPERS_HPP_INCLUDED
#define DOCMAP_GTEST_HELPERS_HPP_INCLUDED

#include <docmap/sdk/catalog_client.hpp>
#include <docmap/sdk/errors.hpp>
#include <docmap/sdk/index_spec.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest-matchers.h>

#include <ostream>
#include <string>

// MARK: - GTest Printers:

namespace docmap
{
namespace sdk
{

inline void PrintTo(const IndexKey& index_key, std::ostream* os)
{
    *os << "(" << index_key.key << ", " << toString(index_key.direction) << ")";
}

inline void PrintTo(const IndexSpec& spec, std::ostream* os)
{
    *os << spec.toString();
}

inline void PrintTo(const CatalogEntry& entry, std::ostream* os)
{
    *os << "CatalogEntry{" << entry.name << "}";
}

inline void PrintTo(const ConfigError& error, std::ostream* os)
{
    *os << "ConfigError{" << error.message << "}";
}

inline void PrintTo(const IndexConflictError& error, std::ostream* os)
{
    *os << "IndexConflictError{existing=" << error.existing_name << "}";
}

inline void PrintTo(const TransportError& error, std::ostream* os)
{
    *os << "TransportError{code=" << error.code << "}";
}

inline void PrintTo(const NotRegisteredError& error, std::ostream* os)
{
    *os << "NotRegisteredError{" << error.schema_name << "}";
}

}  // namespace sdk
}  // namespace docmap

// MARK: - GTest Matchers:

namespace docmap
{

MATCHER_P(HasIndexName, name, std::string{"has index name "} + testing::PrintToString(name))
{
    return arg.name() == name;
}

MATCHER_P(IsEntryNamed, name, std::string{"is catalog entry "} + testing::PrintToString(name))
{
    return arg.name == name;
}

MATCHER_P(HasMessageContaining, text, std::string{"has message containing "} + testing::PrintToString(text))
{
    return arg.message.find(text) != std::string::npos;
}

}  // namespace docmap

#endif  // DOCMAP_GTEST_HELPERS_HPP_INCLUDED
