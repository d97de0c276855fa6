/**
 * @file test_equipment_cache.cpp
 * @brief Unit tests for the equipment identity cache and label classifier
 */

#include <gtest/gtest.h>
#include <ingestion/equipment_cache.hpp>
#include <ingestion/equipment_classifier.hpp>
#include <atomic>
#include <thread>
#include <vector>

using namespace Armory;

// ============================================================================
// EquipmentCache
// ============================================================================

TEST(EquipmentCacheTest, CreatesOncePerKey) {
    EquipmentCache cache;
    int calls = 0;
    auto create = [&]() -> int64_t { return 100 + calls++; };

    EXPECT_EQ(cache.get_or_create("Medium Laser", create), 100);
    EXPECT_EQ(cache.get_or_create("Medium Laser", create), 100);
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(cache.hits(), 1u);
    EXPECT_EQ(cache.misses(), 1u);
}

TEST(EquipmentCacheTest, SpellingsWithOneSlugShareAnEntry) {
    EquipmentCache cache;
    int calls = 0;
    auto create = [&]() -> int64_t { ++calls; return 7; };

    cache.get_or_create("LRM 20", create);
    EXPECT_EQ(cache.get_or_create("LRM-20", create), 7);
    EXPECT_EQ(cache.get_or_create("lrm 20", create), 7);
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(cache.size(), 1u);
    EXPECT_EQ(cache.find("Lrm/20"), 7);
}

TEST(EquipmentCacheTest, EvictForgetsUncommittedIds) {
    EquipmentCache cache;
    std::vector<std::string> inserted;
    cache.get_or_create("AC/20", [] { return int64_t{1}; }, &inserted);
    cache.get_or_create("AC/20", [] { return int64_t{2}; }, &inserted);
    ASSERT_EQ(inserted.size(), 1u);
    EXPECT_EQ(inserted[0], "ac-20");

    cache.evict(inserted);
    EXPECT_FALSE(cache.find("AC/20").has_value());
    EXPECT_EQ(cache.get_or_create("AC/20", [] { return int64_t{3}; }), 3);
}

TEST(EquipmentCacheTest, FailedCreateLeavesNoEntry) {
    EquipmentCache cache;
    EXPECT_THROW(cache.get_or_create("Gauss Rifle", []() -> int64_t { throw std::runtime_error("db"); }),
                 std::runtime_error);
    EXPECT_EQ(cache.size(), 0u);
}

TEST(EquipmentCacheTest, ConcurrentCallersCreateOnce) {
    EquipmentCache cache;
    std::atomic<int> calls{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&] {
            for (int i = 0; i < 100; ++i) {
                cache.get_or_create("PPC", [&] { ++calls; return int64_t{5}; });
            }
        });
    }
    for (auto& th : threads) th.join();
    EXPECT_EQ(calls.load(), 1);
    EXPECT_EQ(cache.hits(), 799u);
}

// ============================================================================
// Classifier
// ============================================================================

TEST(EquipmentClassifierTest, Categories) {
    EXPECT_EQ(classify_equipment("Medium Laser"), EquipmentCategory::EnergyWeapon);
    EXPECT_EQ(classify_equipment("ER PPC"), EquipmentCategory::EnergyWeapon);
    EXPECT_EQ(classify_equipment("AC/20"), EquipmentCategory::BallisticWeapon);
    EXPECT_EQ(classify_equipment("Gauss Rifle"), EquipmentCategory::BallisticWeapon);
    EXPECT_EQ(classify_equipment("LRM 20"), EquipmentCategory::MissileWeapon);
    EXPECT_EQ(classify_equipment("ISAMS"), EquipmentCategory::MissileWeapon);
    EXPECT_EQ(classify_equipment("Hatchet"), EquipmentCategory::PhysicalWeapon);
    EXPECT_EQ(classify_equipment("Heat Sink"), EquipmentCategory::HeatSink);
    EXPECT_EQ(classify_equipment("Jump Jet"), EquipmentCategory::JumpJet);
    EXPECT_EQ(classify_equipment("ISTargeting Computer"), EquipmentCategory::TargetingComputer);
    EXPECT_EQ(classify_equipment("Endo Steel"), EquipmentCategory::Structure);
    EXPECT_EQ(classify_equipment("CASE"), EquipmentCategory::Equipment);
}

TEST(EquipmentClassifierTest, AmmoWinsOverWeaponKeywords) {
    EXPECT_EQ(classify_equipment("IS Ammo LRM-20"), EquipmentCategory::Ammunition);
    EXPECT_EQ(classify_equipment("Gauss Ammo"), EquipmentCategory::Ammunition);
}

TEST(EquipmentClassifierTest, TechBaseFromPrefix) {
    EXPECT_EQ(equipment_tech_base("CLERMediumLaser"), TechBase::Clan);
    EXPECT_EQ(equipment_tech_base("Clan Ammo LRM-15"), TechBase::Clan);
    EXPECT_EQ(equipment_tech_base("Medium Laser"), TechBase::InnerSphere);
}

TEST(EquipmentClassifierTest, AmmoParentLabel) {
    EXPECT_EQ(ammo_parent_label("IS Ammo AC/20"), std::string("AC/20"));
    EXPECT_EQ(ammo_parent_label("Clan Ammo LRM-15"), std::string("LRM-15"));
    EXPECT_EQ(ammo_parent_label("SRM 6 Ammo"), std::string("SRM 6"));
    EXPECT_EQ(ammo_parent_label("IS Ammo SRM-6 - Half"), std::string("SRM-6"));
    EXPECT_FALSE(ammo_parent_label("Medium Laser").has_value());
    EXPECT_FALSE(ammo_parent_label("Ammo").has_value());
}
