/**
 * @file test_equipment_stats.cpp
 * @brief Unit tests for the curated equipment stats document
 */

#include <gtest/gtest.h>
#include <storage/equipment_stats.hpp>
#include <core/errors.hpp>
#include <utils/files.hpp>
#include "../support/in_memory_stores.hpp"

using namespace Armory;
using Armory::Testing::fixture_path;

TEST(EquipmentStatsTest, ParsesFixture) {
    auto text = read_file(fixture_path("catalog/equipment_stats.json"));
    ASSERT_TRUE(text.has_value());
    auto stats = parse_equipment_stats(*text);
    ASSERT_EQ(stats.size(), 3u);

    EXPECT_EQ(stats[0].slug, "medium-laser");
    EXPECT_EQ(stats[0].damage, std::string("5"));
    EXPECT_EQ(stats[0].range_min, 0);
    EXPECT_EQ(stats[0].bv, 46);

    EXPECT_FALSE(stats[1].range_min.has_value());
    EXPECT_DOUBLE_EQ(*stats[1].tonnage, 14.0);

    EXPECT_FALSE(stats[2].damage.has_value());
    EXPECT_FALSE(stats[2].bv.has_value());
}

TEST(EquipmentStatsTest, MalformedDocumentThrows) {
    EXPECT_THROW(parse_equipment_stats("{\"slug\": \"x\"}"), SetupError);
    EXPECT_THROW(parse_equipment_stats("[{\"tonnage\": 1}]"), SetupError);
    EXPECT_THROW(parse_equipment_stats("[{\"slug\": \"x\", \"bv\": \"lots\"}]"), SetupError);
    EXPECT_THROW(parse_equipment_stats("not json"), SetupError);
}

TEST(EquipmentStatsTest, ArchiveSlugAliases) {
    EXPECT_EQ(archive_equipment_slug("clan-er-large-laser"), std::string("clerlargelaser"));
    EXPECT_EQ(archive_equipment_slug("ultra-autocannon-20"), std::string("isultraac20"));
    EXPECT_FALSE(archive_equipment_slug("medium-laser").has_value());
}
