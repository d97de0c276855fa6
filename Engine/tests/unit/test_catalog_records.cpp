/**
 * @file test_catalog_records.cpp
 * @brief Unit tests for listing JSON and detail page decoding
 */

#include <gtest/gtest.h>
#include <external/catalog_records.hpp>
#include <utils/files.hpp>
#include "../support/in_memory_stores.hpp"
#include <stdexcept>

using namespace Armory;
using Armory::Testing::fixture_path;

static std::string fixture(const std::string& relative) {
    auto content = read_file(fixture_path(relative));
    if (!content) throw std::runtime_error("missing fixture " + relative);
    return *content;
}

// ============================================================================
// Listing
// ============================================================================

TEST(CatalogRecordsTest, ListingFields) {
    auto records = parse_listing(fixture("catalog/listing_tons_0_19.json"));
    ASSERT_EQ(records.size(), 3u);

    const auto& atlas = records[0];
    EXPECT_EQ(atlas.external_id, 140);
    EXPECT_EQ(atlas.name, "Atlas AS7-D");
    EXPECT_EQ(atlas.class_name, std::string("Atlas"));
    EXPECT_DOUBLE_EQ(atlas.tonnage, 100.0);
    EXPECT_EQ(atlas.battle_value, 1897);
    EXPECT_EQ(atlas.cost, int64_t{9626000});
    EXPECT_EQ(atlas.role, std::string("Juggernaut"));
    EXPECT_EQ(atlas.intro_year, 2755);
    EXPECT_EQ(atlas.technology, std::string("Inner Sphere"));
    EXPECT_EQ(atlas.unit_type, std::string("BattleMech"));
}

TEST(CatalogRecordsTest, ZeroValuesAreAbsent) {
    auto records = parse_listing(fixture("catalog/listing_tons_0_19.json"));
    ASSERT_GE(records.size(), 2u);
    const auto& dasher = records[1];
    EXPECT_FALSE(dasher.battle_value.has_value());
    EXPECT_FALSE(dasher.cost.has_value());
    EXPECT_EQ(dasher.intro_year, 3050);

    const auto& bare = records[2];
    EXPECT_FALSE(bare.role.has_value());
    EXPECT_FALSE(bare.intro_year.has_value());
}

TEST(CatalogRecordsTest, BareArrayIsAccepted) {
    auto records = parse_listing(R"([{"Id": 1, "Name": "Locust LCT-1V", "Tonnage": 20}])");
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].name, "Locust LCT-1V");
}

TEST(CatalogRecordsTest, MalformedListingThrows) {
    EXPECT_THROW(parse_listing("<html>"), std::invalid_argument);
    EXPECT_THROW(parse_listing(R"({"Error": "busy"})"), std::invalid_argument);
}

TEST(CatalogRecordsTest, IntroYearFromDate) {
    EXPECT_EQ(intro_year_from_date("3067-01-01"), 3067);
    EXPECT_EQ(intro_year_from_date("~3050"), 3050);
    EXPECT_FALSE(intro_year_from_date("early").has_value());
}

// ============================================================================
// Availability
// ============================================================================

TEST(CatalogRecordsTest, AvailabilityPanels) {
    auto notes = parse_availability(fixture("catalog/detail_140.html"));
    ASSERT_EQ(notes.size(), 7u);

    EXPECT_EQ(notes[0].era_name, "Star League");
    EXPECT_EQ(notes[0].faction_name, "Star League");
    EXPECT_EQ(notes[1].faction_name, "Lyran Commonwealth");
    EXPECT_EQ(notes[2].era_name, "Clan Invasion");
    EXPECT_EQ(notes[2].faction_name, "Federated Commonwealth");
    EXPECT_EQ(notes[5].faction_name, "Kell Hounds & Friends");
    EXPECT_EQ(notes[6].era_name, "Unknown Epoch");
}

TEST(CatalogRecordsTest, PageWithoutPanelsHasNoAvailability) {
    EXPECT_TRUE(parse_availability("<html><body>Not found</body></html>").empty());
    EXPECT_TRUE(parse_availability("").empty());
}

// ============================================================================
// Names
// ============================================================================

TEST(CatalogRecordsTest, AlternateName) {
    EXPECT_EQ(extract_alternate_name("Dasher (Fire Moth) Prime"), std::string("Fire Moth Prime"));
    EXPECT_FALSE(extract_alternate_name("Atlas AS7-D").has_value());
    EXPECT_FALSE(extract_alternate_name("Awesome AWS-8Q (Smith)").has_value());
}
