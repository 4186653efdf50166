//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "index/geo_collector.hpp"

#include "docmap_gtest_helpers.hpp"
#include "schema_fixtures.hpp"

#include <docmap/sdk/index_declaration.hpp>
#include <docmap/sdk/index_spec.hpp>
#include <docmap/sdk/schema.hpp>
#include <docmap/sdk/schema_registry.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <string>

namespace
{

using namespace docmap::sdk;            // NOLINT This our main concern here in the unit tests.
using namespace docmap::sdk::fixtures;  // NOLINT
using docmap::sdk::index::GeoCollector;

using testing::ElementsAre;
using testing::IsEmpty;

class TestGeoCollector : public testing::Test
{
protected:
    IndexSpecs collect(const std::string& schema_name) const
    {
        const GeoCollector collector{registry_};
        return collector.collectFieldSpecs(*registry_.find(schema_name));
    }

    // NOLINTBEGIN
    SchemaRegistry registry_;
    // NOLINTEND
};

// MARK: - Tests:

TEST_F(TestGeoCollector, top_level_geo_point)
{
    ASSERT_TRUE(defined(registry_, document("Place", {field("name"), field("location", FieldType::GeoPoint, "loc")})));

    EXPECT_THAT(collect("Place"), ElementsAre(spec({geo("loc")})));
}

TEST_F(TestGeoCollector, embedded_documents_and_lists_of_them)
{
    ASSERT_TRUE(defined(registry_, embeddedDocument("Venue", {field("point", FieldType::GeoPoint, "p")})));
    ASSERT_TRUE(defined(registry_, embeddedDocument("Stop", {field("at", FieldType::GeoPoint)})));
    ASSERT_TRUE(defined(registry_,
                        document("Event",
                                 {field("title"),
                                  embedded("venue", "Venue", "v"),
                                  list("stops", FieldType::Embedded, "Stop"),
                                  field("origin", FieldType::GeoPoint)})));

    EXPECT_THAT(collect("Event"), ElementsAre(spec({geo("v.p")}), spec({geo("stops.at")}), spec({geo("origin")})));
}

TEST_F(TestGeoCollector, references_are_not_followed)
{
    ASSERT_TRUE(defined(registry_, document("Place", {field("location", FieldType::GeoPoint)})));
    ASSERT_TRUE(defined(registry_,
                        document("Trip",
                                 {reference("destination", "Place"),
                                  list("visited", FieldType::Reference, "Place")})));

    EXPECT_THAT(collect("Trip"), IsEmpty());
}

TEST_F(TestGeoCollector, recursive_embedding_is_entered_once)
{
    ASSERT_TRUE(defined(registry_,
                        embeddedDocument("Area",
                                         {field("center", FieldType::GeoPoint),
                                          list("sub_areas", FieldType::Embedded, "self")})));
    ASSERT_TRUE(defined(registry_, document("Map", {embedded("root", "Area")})));

    EXPECT_THAT(collect("Map"), ElementsAre(spec({geo("root.center")})));
}

TEST_F(TestGeoCollector, select_geo_keeps_order)
{
    const IndexSpecs specs{spec({asc("_cls"), asc("name")}),
                           spec({geo("location")}),
                           spec({asc("slug")}, uniqueOptions()),
                           spec({geo("area.center"), asc("kind")})};

    EXPECT_THAT(GeoCollector::selectGeo(specs),
                ElementsAre(spec({geo("location")}), spec({geo("area.center"), asc("kind")})));
    EXPECT_THAT(GeoCollector::selectGeo({}), IsEmpty());
}

}  // namespace
