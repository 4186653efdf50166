//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "index/field_path_resolver.hpp"

#include "docmap_gtest_helpers.hpp"
#include "schema_fixtures.hpp"

#include <docmap/sdk/errors.hpp>
#include <docmap/sdk/schema.hpp>
#include <docmap/sdk/schema_registry.hpp>

#include <cetl/pf17/cetlpf.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <string>

namespace
{

using namespace docmap::sdk;            // NOLINT This our main concern here in the unit tests.
using namespace docmap::sdk::fixtures;  // NOLINT
using docmap::HasMessageContaining;
using docmap::sdk::index::FieldPathResolver;

using testing::VariantWith;

class TestFieldPathResolver : public testing::Test
{
protected:
    using Success = FieldPathResolver::Resolve::Success;
    using Failure = FieldPathResolver::Resolve::Failure;

    void SetUp() override
    {
        ASSERT_TRUE(defined(registry_, embeddedDocument("DateParts", {field("year", FieldType::Int, "yr")})));
        ASSERT_TRUE(defined(registry_, embeddedDocument("Tag", {field("name", FieldType::String, "tag")})));
        ASSERT_TRUE(defined(registry_, document("Author", {field("name")})));
        ASSERT_TRUE(defined(registry_,
                            document("BlogPost",
                                     {embedded("date", "DateParts", "addDate"),
                                      list("tags", FieldType::Embedded, "Tag"),
                                      list("keywords", FieldType::String),
                                      field("location", FieldType::Dict),
                                      list("extras", FieldType::Dict),
                                      reference("author", "Author"),
                                      field("title")})));

        auto dynamic = document("Dynamic", {field("known", FieldType::String, "k")});
        dynamic.kind = SchemaKind::DynamicDocument;
        ASSERT_TRUE(defined(registry_, dynamic));

        ASSERT_TRUE(defined(registry_, monomorphic(document("Plain", {field("a")}))));
    }

    FieldPathResolver::Resolve::Result resolve(const std::string& schema_name, const std::string& path) const
    {
        const FieldPathResolver resolver{registry_};
        return resolver.resolve(*registry_.find(schema_name), path);
    }

    // NOLINTBEGIN
    SchemaRegistry registry_;
    // NOLINTEND
};

// MARK: - Tests:

TEST_F(TestFieldPathResolver, plain_and_renamed_fields)
{
    EXPECT_THAT(resolve("BlogPost", "title"), VariantWith<Success>("title"));
    EXPECT_THAT(resolve("BlogPost", "date"), VariantWith<Success>("addDate"));
}

TEST_F(TestFieldPathResolver, primary_key_aliases)
{
    EXPECT_THAT(resolve("BlogPost", "pk"), VariantWith<Success>("_id"));
    EXPECT_THAT(resolve("BlogPost", "id"), VariantWith<Success>("_id"));
    EXPECT_THAT(resolve("BlogPost", "_id"), VariantWith<Success>("_id"));
}

TEST_F(TestFieldPathResolver, embedded_paths_use_nested_storage_keys)
{
    EXPECT_THAT(resolve("BlogPost", "date.year"), VariantWith<Success>("addDate.yr"));
    EXPECT_THAT(resolve("BlogPost", "tags.name"), VariantWith<Success>("tags.tag"));
}

TEST_F(TestFieldPathResolver, dict_paths_are_free_form)
{
    EXPECT_THAT(resolve("BlogPost", "location.point"), VariantWith<Success>("location.point"));
    EXPECT_THAT(resolve("BlogPost", "location.a.b.c"), VariantWith<Success>("location.a.b.c"));
    EXPECT_THAT(resolve("BlogPost", "extras.any"), VariantWith<Success>("extras.any"));
}

TEST_F(TestFieldPathResolver, dynamic_document_accepts_undeclared_names)
{
    EXPECT_THAT(resolve("Dynamic", "known"), VariantWith<Success>("k"));
    EXPECT_THAT(resolve("Dynamic", "whatever"), VariantWith<Success>("whatever"));
    EXPECT_THAT(resolve("Dynamic", "whatever.deep"), VariantWith<Success>("whatever.deep"));
}

TEST_F(TestFieldPathResolver, unresolvable_paths)
{
    EXPECT_THAT(resolve("BlogPost", "missing"), VariantWith<Failure>(HasMessageContaining("'missing'")));
    EXPECT_THAT(resolve("BlogPost", "date.month"), VariantWith<Failure>(HasMessageContaining("'month'")));
    EXPECT_THAT(resolve("BlogPost", "title.sub"), VariantWith<Failure>(HasMessageContaining("subfield")));
    EXPECT_THAT(resolve("BlogPost", "keywords.sub"), VariantWith<Failure>(HasMessageContaining("subfield")));
    EXPECT_THAT(resolve("BlogPost", "author.name"), VariantWith<Failure>(HasMessageContaining("subfield")));
    EXPECT_THAT(resolve("BlogPost", "date..year"), VariantWith<Failure>(HasMessageContaining("Invalid field path")));
    EXPECT_THAT(resolve("BlogPost", ""), VariantWith<Failure>(HasMessageContaining("Invalid field path")));
}

TEST_F(TestFieldPathResolver, discriminator_of_polymorphic_schema)
{
    EXPECT_THAT(resolve("BlogPost", "_cls"), VariantWith<Success>("_cls"));
    EXPECT_THAT(resolve("Plain", "_cls"), VariantWith<Failure>(HasMessageContaining("'_cls'")));
}

TEST_F(TestFieldPathResolver, primary_key_alias_only_as_whole_path)
{
    EXPECT_THAT(resolve("BlogPost", "pk.x"), VariantWith<Failure>(HasMessageContaining("'pk'")));
}

}  // namespace
