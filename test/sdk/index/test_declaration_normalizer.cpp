//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "index/declaration_normalizer.hpp"
#include "index/field_path_resolver.hpp"

#include "docmap_gtest_helpers.hpp"
#include "schema_fixtures.hpp"

#include <docmap/sdk/index_declaration.hpp>
#include <docmap/sdk/index_spec.hpp>
#include <docmap/sdk/schema.hpp>
#include <docmap/sdk/schema_registry.hpp>

#include <cetl/pf17/cetlpf.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <string>
#include <vector>

namespace
{

using namespace docmap::sdk;            // NOLINT This our main concern here in the unit tests.
using namespace docmap::sdk::fixtures;  // NOLINT
using docmap::HasMessageContaining;
using docmap::sdk::index::DeclarationNormalizer;
using docmap::sdk::index::FieldPathResolver;
using docmap::sdk::index::NormalizedIndex;

using testing::VariantWith;

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

class TestDeclarationNormalizer : public testing::Test
{
protected:
    using Success = DeclarationNormalizer::Normalize::Success;
    using Failure = DeclarationNormalizer::Normalize::Failure;
    using Record  = IndexDeclaration::OptionsRecord;

    void SetUp() override
    {
        ASSERT_TRUE(defined(registry_, embeddedDocument("DateParts", {field("year", FieldType::Int, "yr")})));
        ASSERT_TRUE(defined(registry_,
                            document("BlogPost",
                                     {embedded("date", "DateParts", "addDate"),
                                      field("category"),
                                      field("title"),
                                      field("created", FieldType::DateTime),
                                      field("location", FieldType::Dict)})));
    }

    DeclarationNormalizer::Normalize::Result normalize(const IndexDeclaration& declaration) const
    {
        const FieldPathResolver     resolver{registry_};
        const DeclarationNormalizer normalizer{resolver};
        return normalizer.normalize(*registry_.find("BlogPost"), declaration);
    }

    static Record record(const std::vector<std::string>& paths)
    {
        Record result;
        result.fields = std::vector<IndexDeclaration::Item>{};
        for (const auto& path : paths)
        {
            result.fields->emplace_back(IndexDeclaration::FieldRef{path});
        }
        return result;
    }

    // NOLINTBEGIN
    SchemaRegistry registry_;
    // NOLINTEND
};

MATCHER_P(IsSpec, expected_spec, "")
{
    return arg.spec == expected_spec;
}

MATCHER_P2(IsIndex, expected_spec, eligible, "")
{
    return (arg.spec == expected_spec) && (arg.discriminator_eligible == eligible);
}

// MARK: - Tests:

TEST_F(TestDeclarationNormalizer, field_prefixes)
{
    EXPECT_THAT(normalize(IndexDeclaration::field("title")), VariantWith<Success>(IsIndex(spec({asc("title")}), true)));
    EXPECT_THAT(normalize(IndexDeclaration::field("+title")), VariantWith<Success>(IsSpec(spec({asc("title")}))));
    EXPECT_THAT(normalize(IndexDeclaration::field("-date")), VariantWith<Success>(IsSpec(spec({desc("addDate")}))));
    EXPECT_THAT(normalize(IndexDeclaration::field("*location.point")),
                VariantWith<Success>(IsIndex(spec({geo("location.point")}), false)));
}

TEST_F(TestDeclarationNormalizer, explicit_pair)
{
    EXPECT_THAT(normalize(IndexDeclaration::directed("date.year", IndexDirection::Descending)),
                VariantWith<Success>(IsSpec(spec({desc("addDate.yr")}))));

    // A compound of a name and a direction token is a pair as well.
    EXPECT_THAT(normalize(IndexDeclaration::compoundOf({"title", "-1"})),
                VariantWith<Success>(IsSpec(spec({desc("title")}))));
    EXPECT_THAT(normalize(IndexDeclaration::compoundOf({"location", "2d"})),
                VariantWith<Success>(IsIndex(spec({geo("location")}), false)));
    EXPECT_THAT(normalize(IndexDeclaration::compoundOf({"title", "1"})),
                VariantWith<Success>(IsSpec(spec({asc("title")}))));
}

TEST_F(TestDeclarationNormalizer, compound_preserves_order)
{
    EXPECT_THAT(normalize(IndexDeclaration::compoundOf({"category", "-date"})),
                VariantWith<Success>(IsIndex(spec({asc("category"), desc("addDate")}), true)));
    EXPECT_THAT(normalize(IndexDeclaration::compoundOf({"-date", "category"})),
                VariantWith<Success>(IsSpec(spec({desc("addDate"), asc("category")}))));
    EXPECT_THAT(normalize(IndexDeclaration::compound(
                    {IndexDeclaration::FieldRef{"title"},
                     IndexDeclaration::DirectedFieldRef{"created", IndexDirection::Descending},
                     IndexDeclaration::FieldRef{"pk"}})),
                VariantWith<Success>(IsSpec(spec({asc("title"), desc("created"), asc("_id")}))));
}

TEST_F(TestDeclarationNormalizer, options_record)
{
    auto options   = record({"-date"});
    options.unique = true;
    options.sparse = true;
    options.types  = false;

    IndexOptions expected_options;
    expected_options.unique = true;
    expected_options.sparse = true;
    EXPECT_THAT(normalize(IndexDeclaration::record(options)),
                VariantWith<Success>(IsIndex(spec({desc("addDate")}, expected_options), false)));

    auto ttl                 = record({"created"});
    ttl.expire_after_seconds = 3600;
    ttl.background           = true;
    IndexOptions ttl_options;
    ttl_options.expire_after_seconds = 3600;
    ttl_options.background           = true;
    EXPECT_THAT(normalize(IndexDeclaration::record(ttl)),
                VariantWith<Success>(IsIndex(spec({asc("created")}, ttl_options), true)));
}

TEST_F(TestDeclarationNormalizer, discriminator_eligibility)
{
    EXPECT_THAT(normalize(IndexDeclaration::record(record({"title", "category"}))),
                VariantWith<Success>(IsIndex(spec({asc("title"), asc("category")}), true)));

    auto sparse   = record({"title"});
    sparse.sparse = true;
    IndexOptions sparse_options;
    sparse_options.sparse = true;
    EXPECT_THAT(normalize(IndexDeclaration::record(sparse)),
                VariantWith<Success>(IsIndex(spec({asc("title")}, sparse_options), false)));

    auto no_types  = record({"title"});
    no_types.types = false;
    EXPECT_THAT(normalize(IndexDeclaration::record(no_types)),
                VariantWith<Success>(IsIndex(spec({asc("title")}), false)));

    auto unique   = record({"title"});
    unique.unique = true;
    EXPECT_THAT(normalize(IndexDeclaration::record(unique)),
                VariantWith<Success>(IsIndex(spec({asc("title")}, uniqueOptions()), true)));
}

TEST_F(TestDeclarationNormalizer, malformed_declarations)
{
    EXPECT_THAT(normalize(IndexDeclaration::field("")), VariantWith<Failure>(HasMessageContaining("Empty")));
    EXPECT_THAT(normalize(IndexDeclaration::field("-")), VariantWith<Failure>(HasMessageContaining("Empty")));
    EXPECT_THAT(normalize(IndexDeclaration::field("-*title")),
                VariantWith<Failure>(HasMessageContaining("Conflicting")));
    EXPECT_THAT(normalize(IndexDeclaration::directed("-title", IndexDirection::Ascending)),
                VariantWith<Failure>(HasMessageContaining("conflicts")));
    EXPECT_THAT(normalize(IndexDeclaration::compoundOf({})),
                VariantWith<Failure>(HasMessageContaining("no fields")));
    EXPECT_THAT(normalize(IndexDeclaration::record(Record{})),
                VariantWith<Failure>(HasMessageContaining("no fields")));
    EXPECT_THAT(normalize(IndexDeclaration::compoundOf({"title", "-title"})),
                VariantWith<Failure>(HasMessageContaining("Duplicate key")));
    EXPECT_THAT(normalize(IndexDeclaration::compoundOf({"*location", "title"})),
                VariantWith<Failure>(HasMessageContaining("one field")));
    EXPECT_THAT(normalize(IndexDeclaration::field("nope")), VariantWith<Failure>(HasMessageContaining("'nope'")));

    auto sparse   = record({"title", "category"});
    sparse.sparse = true;
    EXPECT_THAT(normalize(IndexDeclaration::record(sparse)), VariantWith<Failure>(HasMessageContaining("Sparse")));

    auto negative_ttl                 = record({"created"});
    negative_ttl.expire_after_seconds = -1;
    EXPECT_THAT(normalize(IndexDeclaration::record(negative_ttl)),
                VariantWith<Failure>(HasMessageContaining("negative")));
}

// NOLINTEND(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

}  // namespace
