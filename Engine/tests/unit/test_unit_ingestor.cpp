/**
 * @file test_unit_ingestor.cpp
 * @brief Unit tests for per-unit ingestion, batch runs and resume
 *
 * Runs the ingestor and IngestRun against InMemoryUnitStore, which snapshots
 * on begin() and restores on rollback(), so transaction boundaries are
 * observable without a database.
 */

#include <gtest/gtest.h>
#include <ingestion/checkpoint.hpp>
#include <ingestion/ingest_run.hpp>
#include <ingestion/unit_ingestor.hpp>
#include <core/errors.hpp>
#include <utils/files.hpp>
#include "../support/in_memory_stores.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

using namespace Armory;
using namespace Armory::Testing;

static ParsedUnit make_mech(const std::string& chassis, const std::string& model) {
    ParsedUnit u;
    u.chassis = chassis;
    u.model = model;
    u.unit_type = UnitType::Mek;
    u.tonnage = 20.0;
    u.locations = {{Location::CenterTorso, 10, 2, std::nullopt}};
    u.loadout = {{"Medium Laser", Location::CenterTorso, 1, false}};
    ParsedMechData mech;
    mech.config = "Biped";
    mech.engine_rating = 160;
    mech.engine_type = "Fusion Engine(IS)";
    mech.armor_type = "Standard(Inner Sphere)";
    mech.structure_type = "IS Standard";
    mech.heat_sink_type = "Single";
    mech.heat_sink_count = 10;
    u.mech_data = mech;
    return u;
}

// Feeds a fixed list of entries.
class VectorSource : public UnitSource {
public:
    explicit VectorSource(std::vector<SourceEntry> entries) : entries_(std::move(entries)) {}

    void open() override { pos_ = 0; opened = true; }
    std::optional<SourceEntry> next() override {
        if (pos_ >= entries_.size()) return std::nullopt;
        return entries_[pos_++];
    }
    void close() override { closed = true; }

    bool opened = false;
    bool closed = false;

private:
    std::vector<SourceEntry> entries_;
    size_t pos_ = 0;
};

static SourceEntry mtf_entry(const std::string& name, const std::string& chassis, const std::string& model) {
    std::string content = "chassis:" + chassis + "\nmodel:" + model + "\nmass:25\n"
                          "engine:175 Fusion Engine(IS)\n"
                          "Weapons:1\n1 Medium Laser, Right Arm\n";
    return {name, {UnitFormat::Mtf, UnitType::Mek}, content};
}

class IngestorTest : public ::testing::Test {
protected:
    InMemoryUnitStore store;
    EquipmentCache cache;
    AliasResolver resolver;
    UnitIngestor ingestor{store, cache, resolver};
};

// ============================================================================
// UnitIngestor
// ============================================================================

TEST_F(IngestorTest, NewUnitIsCreated) {
    auto outcome = ingestor.ingest(make_mech("Locust", "LCT-1V"));
    EXPECT_EQ(outcome.status, UpsertStatus::Created);
    EXPECT_EQ(outcome.slug, "locust-lct-1v");
    EXPECT_EQ(outcome.equipment_created, 1u);
    EXPECT_EQ(store.unit_id("locust-lct-1v"), outcome.unit_id);
    EXPECT_EQ(store.commits, 1u);
}

TEST_F(IngestorTest, SharedEquipmentIsOneRow) {
    for (int i = 0; i < 100; ++i) {
        ingestor.ingest(make_mech("Locust", "LCT-" + std::to_string(i)));
    }
    EXPECT_EQ(store.equipment_rows(), 1u);
    EXPECT_EQ(store.loadout_row_count(), 100u);
    EXPECT_EQ(store.state().chassis.size(), 1u);
    EXPECT_EQ(cache.misses(), 1u);
}

static ParsedUnit make_vehicle(const std::string& chassis, const std::string& model) {
    ParsedUnit u;
    u.chassis = chassis;
    u.model = model;
    u.unit_type = UnitType::Vehicle;
    u.tonnage = 80.0;
    u.locations = {{Location::Front, 40, std::nullopt, std::nullopt}};
    u.loadout = {{"AC/20", Location::Front, 2, false}};
    return u;
}

TEST(ChassisSlugTest, UnitTypeKeepsSameNameApart) {
    ParsedUnit tank = make_vehicle("Demolisher", "Heavy Tank");
    ParsedUnit mech = make_mech("Demolisher", "DML-1");
    EXPECT_EQ(chassis_slug(tank), "demolisher-vehicle");
    EXPECT_EQ(chassis_slug(mech), "demolisher-mek");
    EXPECT_NE(chassis_slug(tank), chassis_slug(mech));
}

TEST_F(IngestorTest, SameChassisNameInTwoCategoriesIsTwoChassis) {
    auto tank = ingestor.ingest(make_vehicle("Demolisher", "Heavy Tank"));
    auto mech = ingestor.ingest(make_mech("Demolisher", "DML-1"));
    EXPECT_EQ(tank.status, UpsertStatus::Created);
    EXPECT_EQ(mech.status, UpsertStatus::Created);
    EXPECT_EQ(store.state().chassis.size(), 2u);
    EXPECT_EQ(store.state().chassis.count("demolisher-vehicle"), 1u);
    EXPECT_EQ(store.state().chassis.count("demolisher-mek"), 1u);
}

TEST_F(IngestorTest, RepeatedIngestIsUnchanged) {
    ParsedUnit unit = make_mech("Locust", "LCT-1V");
    auto first = ingestor.ingest(unit);
    auto second = ingestor.ingest(unit);

    EXPECT_EQ(second.status, UpsertStatus::Unchanged);
    EXPECT_EQ(second.unit_id, first.unit_id);
    EXPECT_EQ(second.equipment_created, 0u);
    EXPECT_EQ(store.equipment_rows(), 1u);
}

TEST_F(IngestorTest, ChangedDependentIsUpdated) {
    ParsedUnit unit = make_mech("Locust", "LCT-1V");
    ingestor.ingest(unit);

    unit.loadout.push_back({"Machine Gun", Location::LeftArm, 2, false});
    auto outcome = ingestor.ingest(unit);
    EXPECT_EQ(outcome.status, UpsertStatus::Updated);
    EXPECT_EQ(store.equipment_rows(), 2u);
}

TEST_F(IngestorTest, AmmoIsLinkedToItsWeapon) {
    ParsedUnit unit = make_mech("Hunchback", "HBK-4G");
    // Ammo listed first still finds its weapon.
    unit.loadout = {
        {"IS Ammo AC/20", Location::LeftTorso, 2, false},
        {"AC/20", Location::RightTorso, 1, false},
    };
    ingestor.ingest(unit);

    const auto* weapon = store.equipment("ac-20");
    const auto* ammo = store.equipment("is-ammo-ac-20");
    ASSERT_NE(weapon, nullptr);
    ASSERT_NE(ammo, nullptr);
    EXPECT_EQ(ammo->record.category, EquipmentCategory::Ammunition);
    EXPECT_EQ(ammo->record.ammo_for_id, weapon->id);
    EXPECT_EQ(weapon->record.category, EquipmentCategory::BallisticWeapon);
}

TEST_F(IngestorTest, FailedUnitRollsBackAndEvicts) {
    ParsedUnit bad = make_mech("Atlas", "AS7-D");
    bad.loadout = {{"Gauss Rifle", Location::RightTorso, 1, false}};
    store.fail_on_slug = "atlas-as7-d";

    EXPECT_THROW(ingestor.ingest(bad), StoreError);
    EXPECT_EQ(store.rollbacks, 1u);
    EXPECT_FALSE(store.unit_id("atlas-as7-d").has_value());
    EXPECT_EQ(store.equipment("gauss-rifle"), nullptr);
    EXPECT_FALSE(cache.find("Gauss Rifle").has_value());

    // The next unit creates the row again instead of reusing a rolled back id.
    ParsedUnit good = make_mech("Highlander", "HGN-732");
    good.loadout = {{"Gauss Rifle", Location::LeftTorso, 1, false}};
    auto outcome = ingestor.ingest(good);
    EXPECT_EQ(outcome.equipment_created, 1u);
    ASSERT_NE(store.equipment("gauss-rifle"), nullptr);
    EXPECT_EQ(cache.find("Gauss Rifle"), store.equipment("gauss-rifle")->id);
}

TEST_F(IngestorTest, LostConnectionPropagatesAsSetupError) {
    store.disconnect_on_slug = "locust-lct-1v";
    EXPECT_THROW(ingestor.ingest(make_mech("Locust", "LCT-1V")), SetupError);
    EXPECT_EQ(store.rollbacks, 1u);
    EXPECT_EQ(cache.size(), 0u);
}

TEST_F(IngestorTest, GapsReportUnknownAndMissingLabels) {
    ParsedUnit unit = make_mech("Urbanmech", "UM-R60");
    unit.mech_data->engine_type.reset();
    unit.mech_data->gyro_type = "Prototype Flux Gyro";

    auto outcome = ingestor.ingest(unit);
    ASSERT_EQ(outcome.gaps.size(), 2u);

    bool engine = false, gyro = false;
    for (const auto& g : outcome.gaps) {
        if (g.category == ComponentCategory::Engine) {
            engine = true;
            EXPECT_EQ(g.status, ResolutionStatus::Unresolved);
            EXPECT_FALSE(g.raw_label.has_value());
        }
        if (g.category == ComponentCategory::Gyro) {
            gyro = true;
            EXPECT_EQ(g.status, ResolutionStatus::Defaulted);
        }
    }
    EXPECT_TRUE(engine);
    EXPECT_TRUE(gyro);
}

TEST_F(IngestorTest, DefaultedAbsentLabelsAreNotGaps) {
    auto outcome = ingestor.ingest(make_mech("Locust", "LCT-1V"));
    EXPECT_TRUE(outcome.gaps.empty());
}

// ============================================================================
// Checkpoint
// ============================================================================

TEST(CheckpointTest, RecordLoadRemove) {
    ScratchDir dir("checkpoint");
    {
        Checkpoint cp(dir / "run.checkpoint");
        cp.load();
        EXPECT_EQ(cp.size(), 0u);
        cp.record("mechs/Atlas.mtf");
        cp.record("mechs/Locust.mtf");
    }
    Checkpoint cp(dir / "run.checkpoint");
    cp.load();
    EXPECT_EQ(cp.size(), 2u);
    EXPECT_TRUE(cp.contains("mechs/Atlas.mtf"));

    cp.remove();
    EXPECT_FALSE(std::filesystem::exists(dir / "run.checkpoint"));
    EXPECT_EQ(cp.size(), 0u);
}

// ============================================================================
// IngestRun
// ============================================================================

class IngestRunTest : public IngestorTest {
protected:
    ScratchDir dir{"ingest-run"};

    IngestOptions options() {
        IngestOptions o;
        o.checkpoint = dir / "ingest.checkpoint";
        o.run_id = "test-run";
        return o;
    }
};

TEST_F(IngestRunTest, FixtureArchiveCounts) {
    DirectorySource source(fixture_path("archive"));
    IngestRun run(source, ingestor, store);
    RunReport report = run.run(options());

    EXPECT_TRUE(report.completed);
    EXPECT_FALSE(report.aborted);
    EXPECT_EQ(report.entries, 4u);
    EXPECT_EQ(report.created, 3u);
    EXPECT_EQ(report.parse_failures, 1u);
    ASSERT_EQ(report.parse_errors.size(), 1u);
    EXPECT_EQ(report.parse_errors[0].entry, "mechs/Broken.mtf");
    EXPECT_EQ(store.refreshes, 1u);
    EXPECT_FALSE(std::filesystem::exists(dir / "ingest.checkpoint"));
}

TEST_F(IngestRunTest, SecondRunIsUnchanged) {
    {
        DirectorySource source(fixture_path("archive"));
        IngestRun(source, ingestor, store).run(options());
    }
    size_t equipment = store.equipment_rows();

    DirectorySource source(fixture_path("archive"));
    RunReport report = IngestRun(source, ingestor, store).run(options());
    EXPECT_EQ(report.created, 0u);
    EXPECT_EQ(report.updated, 0u);
    EXPECT_EQ(report.unchanged, 3u);
    EXPECT_EQ(report.equipment_created, 0u);
    EXPECT_EQ(store.equipment_rows(), equipment);
}

TEST_F(IngestRunTest, InterruptedRunResumes) {
    IngestOptions first = options();
    first.limit = 2;
    {
        DirectorySource source(fixture_path("archive"));
        RunReport report = IngestRun(source, ingestor, store).run(first);
        EXPECT_FALSE(report.completed);
        EXPECT_EQ(report.created, 2u);
    }
    ASSERT_TRUE(std::filesystem::exists(dir / "ingest.checkpoint"));

    DirectorySource source(fixture_path("archive"));
    RunReport report = IngestRun(source, ingestor, store).run(options());
    EXPECT_TRUE(report.completed);
    EXPECT_EQ(report.skipped, 2u);
    EXPECT_EQ(report.created, 1u);
    EXPECT_EQ(report.parse_failures, 1u);
    EXPECT_FALSE(std::filesystem::exists(dir / "ingest.checkpoint"));
}

TEST_F(IngestRunTest, PersistenceFailureIsCountedAndNotCheckpointed) {
    store.fail_on_slug = "atlas-as7-d";
    IngestOptions o = options();
    o.limit = 2;

    DirectorySource source(fixture_path("archive"));
    RunReport report = IngestRun(source, ingestor, store).run(o);
    EXPECT_EQ(report.failed, 1u);
    EXPECT_EQ(report.created, 1u);
    ASSERT_EQ(report.persistence_errors.size(), 1u);
    EXPECT_EQ(report.persistence_errors[0].entry, "mechs/Atlas_AS7-D.mtf");

    Checkpoint cp(dir / "ingest.checkpoint");
    cp.load();
    EXPECT_TRUE(cp.contains("fighters/Sparrowhawk_SPR-H5.blk"));
    EXPECT_FALSE(cp.contains("mechs/Atlas_AS7-D.mtf"));
}

TEST_F(IngestRunTest, ErrorBudgetAborts) {
    VectorSource source({
        {"bad1.mtf", {UnitFormat::Mtf, UnitType::Mek}, "model:X\n"},
        {"bad2.mtf", {UnitFormat::Mtf, UnitType::Mek}, "model:Y\n"},
        mtf_entry("good.mtf", "Locust", "LCT-1V"),
    });
    IngestOptions o = options();
    o.max_errors = 2;

    RunReport report = IngestRun(source, ingestor, store).run(o);
    EXPECT_TRUE(report.aborted);
    EXPECT_FALSE(report.completed);
    EXPECT_EQ(report.errors(), 2u);
    EXPECT_EQ(report.created, 0u);
    EXPECT_TRUE(source.closed);
}

TEST_F(IngestRunTest, SetupErrorStopsTheRun) {
    VectorSource source({mtf_entry("a.mtf", "Locust", "LCT-1V"), mtf_entry("b.mtf", "Wasp", "WSP-1A")});
    store.disconnect_on_slug = "locust-lct-1v";
    EXPECT_THROW(IngestRun(source, ingestor, store).run(options()), SetupError);
}

TEST_F(IngestRunTest, ReportIsWrittenAsJson) {
    VectorSource source({mtf_entry("a.mtf", "Locust", "LCT-1V")});
    RunReport report = IngestRun(source, ingestor, store).run(options());
    auto path = report.write(dir.path());

    EXPECT_EQ(path.filename().string(), "test-run-report.json");
    auto text = read_file(path);
    ASSERT_TRUE(text.has_value());
    auto doc = nlohmann::json::parse(*text);
    EXPECT_EQ(doc["counts"]["created"], 1);
    EXPECT_EQ(doc["completed"], true);
    EXPECT_TRUE(doc["parse_errors"].empty());
}
