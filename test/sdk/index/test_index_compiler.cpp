//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "index/index_compiler.hpp"

#include "docmap_gtest_helpers.hpp"
#include "schema_fixtures.hpp"

#include <docmap/sdk/index_declaration.hpp>
#include <docmap/sdk/index_spec.hpp>
#include <docmap/sdk/schema.hpp>
#include <docmap/sdk/schema_registry.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <string>
#include <vector>

namespace
{

using namespace docmap::sdk;            // NOLINT This our main concern here in the unit tests.
using namespace docmap::sdk::fixtures;  // NOLINT
using docmap::sdk::index::IndexCompiler;

using testing::ElementsAre;
using testing::HasSubstr;
using testing::IsEmpty;
using testing::VariantWith;

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

class TestIndexCompiler : public testing::Test
{
protected:
    using Success = IndexCompiler::Compile::Success;

    IndexCompiler::Compile::Result compile(const std::string& schema_name) const
    {
        const IndexCompiler compiler{registry_};
        return compiler.compile(*registry_.find(schema_name));
    }

    const IndexSpecs& compiled(const std::string& schema_name) const
    {
        return registry_.find(schema_name)->index_specs;
    }

    // NOLINTBEGIN
    SchemaRegistry registry_;
    // NOLINTEND
};

// MARK: - Tests:

TEST_F(TestIndexCompiler, declared_indexes_of_polymorphic_schema)
{
    ASSERT_TRUE(defined(registry_,
                        document("BlogPost",
                                 {field("date", FieldType::DateTime, "addDate"),
                                  field("category"),
                                  list("tags", FieldType::String)},
                                 {IndexDeclaration::field("-date"),
                                  IndexDeclaration::field("tags"),
                                  IndexDeclaration::compoundOf({"category", "-date"})})));

    EXPECT_THAT(compiled("BlogPost"),
                ElementsAre(spec({asc("_cls"), desc("addDate")}),
                            spec({asc("_cls"), asc("tags")}),
                            spec({asc("_cls"), asc("category"), desc("addDate")})));

    // Compiling again yields the very same list as cached by the registry.
    EXPECT_THAT(compile("BlogPost"), VariantWith<Success>(compiled("BlogPost")));
}

TEST_F(TestIndexCompiler, dictionary_sub_paths)
{
    ASSERT_TRUE(defined(registry_,
                        document("BlogPost",
                                 {field("tags", FieldType::Dict)},
                                 {IndexDeclaration::field("tags.name"), IndexDeclaration::field("-tags.rank")})));

    EXPECT_THAT(compiled("BlogPost"),
                ElementsAre(spec({asc("_cls"), asc("tags.name")}), spec({asc("_cls"), desc("tags.rank")})));
}

TEST_F(TestIndexCompiler, unique_with_embedded_companion)
{
    ASSERT_TRUE(defined(registry_, embeddedDocument("DateParts", {field("year", FieldType::Int, "yr")})));
    ASSERT_TRUE(defined(registry_,
                        document("BlogPost",
                                 {field("title"),
                                  embedded("date", "DateParts"),
                                  unique(field("slug"), {"date.year"})})));

    EXPECT_THAT(compiled("BlogPost"), ElementsAre(spec({asc("slug"), asc("date.yr")}, uniqueOptions())));
}

TEST_F(TestIndexCompiler, primary_key_in_unique_record)
{
    ASSERT_TRUE(defined(registry_, embeddedDocument("Comment", {field("comment_id", FieldType::Int)})));

    IndexDeclaration::OptionsRecord record;
    record.fields = std::vector<IndexDeclaration::Item>{IndexDeclaration::FieldRef{"pk"},
                                                        IndexDeclaration::FieldRef{"comments.comment_id"}};
    record.unique = true;
    ASSERT_TRUE(defined(registry_,
                        document("BlogPost",
                                 {list("comments", FieldType::Embedded, "Comment")},
                                 {IndexDeclaration::record(record)})));

    EXPECT_THAT(compiled("BlogPost"),
                ElementsAre(spec({asc("_cls"), asc("_id"), asc("comments.comment_id")}, uniqueOptions())));
}

TEST_F(TestIndexCompiler, declared_index_becomes_unique)
{
    auto cust_id     = unique(field("cust_id", FieldType::Int));
    cust_id.required = true;
    ASSERT_TRUE(defined(registry_,
                        monomorphic(document("Customer", {cust_id}, {IndexDeclaration::field("cust_id")}))));

    EXPECT_THAT(compiled("Customer"), ElementsAre(spec({asc("cust_id")}, uniqueOptions())));
}

TEST_F(TestIndexCompiler, time_to_live)
{
    IndexDeclaration::OptionsRecord record;
    record.fields               = std::vector<IndexDeclaration::Item>{IndexDeclaration::FieldRef{"created"}};
    record.expire_after_seconds = 3600;
    ASSERT_TRUE(defined(registry_,
                        monomorphic(document("Session",
                                             {field("created", FieldType::DateTime)},
                                             {IndexDeclaration::record(record)}))));

    IndexOptions options;
    options.expire_after_seconds = 3600;
    EXPECT_THAT(compiled("Session"), ElementsAre(spec({asc("created")}, options)));
}

TEST_F(TestIndexCompiler, geo_fields_follow_declared_indexes)
{
    ASSERT_TRUE(defined(registry_,
                        document("Place",
                                 {field("name"), field("location", FieldType::GeoPoint), unique(field("code"))},
                                 {IndexDeclaration::field("name"), IndexDeclaration::field("*location")})));

    EXPECT_THAT(compiled("Place"),
                ElementsAre(spec({asc("_cls"), asc("name")}),
                            spec({geo("location")}),
                            spec({asc("code")}, uniqueOptions())));
}

TEST_F(TestIndexCompiler, geo_point_behind_reference_is_not_indexed)
{
    ASSERT_TRUE(defined(registry_, document("Place", {field("location", FieldType::GeoPoint)})));
    ASSERT_TRUE(defined(registry_, document("Trip", {reference("destination", "Place")})));

    EXPECT_THAT(compiled("Place"), ElementsAre(spec({geo("location")})));
    EXPECT_THAT(compiled("Trip"), IsEmpty());
}

TEST_F(TestIndexCompiler, recursive_embedding_terminates)
{
    ASSERT_TRUE(defined(registry_,
                        embeddedDocument("Node",
                                         {unique(field("key")),
                                          field("at", FieldType::GeoPoint),
                                          embedded("child", "self")})));
    ASSERT_TRUE(defined(registry_, document("Tree", {embedded("root", "Node")})));

    EXPECT_THAT(compiled("Tree"), ElementsAre(spec({geo("root.at")}), spec({asc("root.key")}, uniqueOptions())));
}

TEST_F(TestIndexCompiler, failure_rejects_schema)
{
    const auto message = rejection(registry_, document("Broken", {field("a")}, {IndexDeclaration::field("b")}));

    EXPECT_THAT(message, HasSubstr("'b'"));
    EXPECT_THAT(registry_.find("Broken"), testing::IsNull());
    EXPECT_EQ(registry_.size(), 0U);
}

TEST_F(TestIndexCompiler, merge_by_keys)
{
    IndexSpecs specs{spec({asc("_cls"), asc("name")}), spec({asc("email")})};

    IndexOptions sparse_ttl;
    sparse_ttl.sparse               = true;
    sparse_ttl.expire_after_seconds = 60;
    IndexCompiler::mergeByKeys(specs,
                               {spec({asc("email")}, uniqueOptions()),
                                spec({asc("email")}, sparse_ttl),
                                spec({desc("email")})});

    IndexOptions merged;
    merged.unique               = true;
    merged.sparse               = true;
    merged.expire_after_seconds = 60;
    EXPECT_THAT(specs,
                ElementsAre(spec({asc("_cls"), asc("name")}), spec({asc("email")}, merged), spec({desc("email")})));
}

TEST_F(TestIndexCompiler, merge_by_keys_takes_implicit_sparseness)
{
    IndexOptions sparse;
    sparse.sparse = true;
    IndexSpecs specs{spec({asc("email")}, sparse)};

    IndexCompiler::mergeByKeys(specs, {spec({asc("email")}, uniqueOptions())});

    EXPECT_THAT(specs, ElementsAre(spec({asc("email")}, uniqueOptions())));
}

// NOLINTEND(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

}  // namespace
