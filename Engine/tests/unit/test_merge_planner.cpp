/**
 * @file test_merge_planner.cpp
 * @brief Unit tests for per-field merge decisions
 */

#include <gtest/gtest.h>
#include <matching/merge_planner.hpp>

using namespace Armory;

static CatalogRecord atlas_record() {
    CatalogRecord r;
    r.external_id = 140;
    r.name = "Atlas AS7-D";
    r.tonnage = 100;
    r.battle_value = 1897;
    r.cost = 9626000;
    r.role = "Juggernaut";
    r.intro_year = 2755;
    return r;
}

TEST(MergePlannerTest, SourcePriority) {
    EXPECT_EQ(source_priority(std::string(kSourceArchive)), 10);
    EXPECT_EQ(source_priority(std::string(kSourceCatalog)), 20);
    EXPECT_EQ(source_priority(std::string(kSourceManual)), 30);
    EXPECT_EQ(source_priority(std::nullopt), 0);
    EXPECT_EQ(source_priority(std::string("spreadsheet")), 0);
}

TEST(MergePlannerTest, EmptyUnitTakesEveryField) {
    MergePlan plan = plan_merge({}, atlas_record(), kSourceCatalog, false);
    EXPECT_EQ(plan.battle_value, 1897);
    EXPECT_EQ(plan.cost, int64_t{9626000});
    EXPECT_EQ(plan.role, std::string("Juggernaut"));
    EXPECT_EQ(plan.external_id, 140);
    EXPECT_EQ(plan.intro_year, 2755);
    EXPECT_FALSE(plan.alternate_name.has_value());
    EXPECT_EQ(plan.field_count(), 5u);
}

TEST(MergePlannerTest, ManualValueIsNotClobbered) {
    UnitCatalogFields current;
    current.battle_value = {1500, std::string(kSourceManual)};
    current.role = {std::string("Sniper"), std::string(kSourceManual)};

    MergePlan plan = plan_merge(current, atlas_record(), kSourceCatalog, false);
    EXPECT_FALSE(plan.battle_value.has_value());
    EXPECT_FALSE(plan.role.has_value());
    EXPECT_TRUE(plan.cost.has_value());
}

TEST(MergePlannerTest, ForceOverwritesHigherPriority) {
    UnitCatalogFields current;
    current.battle_value = {1500, std::string(kSourceManual)};

    MergePlan plan = plan_merge(current, atlas_record(), kSourceCatalog, true);
    EXPECT_EQ(plan.battle_value, 1897);
}

TEST(MergePlannerTest, ArchiveValueIsReplaced) {
    UnitCatalogFields current;
    current.intro_year = {2750, std::string(kSourceArchive)};

    MergePlan plan = plan_merge(current, atlas_record(), kSourceCatalog, false);
    EXPECT_EQ(plan.intro_year, 2755);
}

TEST(MergePlannerTest, UnchangedWritesAreDropped) {
    UnitCatalogFields current;
    current.battle_value = {1897, std::string(kSourceCatalog)};
    current.cost = {int64_t{9626000}, std::string(kSourceCatalog)};
    current.role = {std::string("Juggernaut"), std::string(kSourceCatalog)};
    current.external_id = {140, std::string(kSourceCatalog)};
    current.intro_year = {2755, std::string(kSourceCatalog)};

    EXPECT_TRUE(plan_merge(current, atlas_record(), kSourceCatalog, false).empty());
    EXPECT_TRUE(plan_merge(current, atlas_record(), kSourceCatalog, true).empty());
}

TEST(MergePlannerTest, SameValueUnderNewProvenanceIsWritten) {
    UnitCatalogFields current;
    current.battle_value = {1897, std::string(kSourceCatalog)};

    MergePlan plan = plan_merge(current, atlas_record(), kSourceManual, false);
    EXPECT_EQ(plan.battle_value, 1897);
}

TEST(MergePlannerTest, AbsentIncomingNeverClears) {
    UnitCatalogFields current;
    current.cost = {int64_t{100}, std::string(kSourceArchive)};
    CatalogRecord r = atlas_record();
    r.cost.reset();

    EXPECT_FALSE(plan_merge(current, r, kSourceCatalog, true).cost.has_value());
}

TEST(MergePlannerTest, AlternateNameFromDualName) {
    CatalogRecord r;
    r.external_id = 42;
    r.name = "Dasher (Fire Moth) Prime";

    MergePlan plan = plan_merge({}, r, kSourceCatalog, false);
    EXPECT_EQ(plan.alternate_name, std::string("Fire Moth Prime"));
    EXPECT_EQ(plan.field_count(), 2u);
}
