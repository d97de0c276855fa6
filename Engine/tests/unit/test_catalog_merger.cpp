/**
 * @file test_catalog_merger.cpp
 * @brief Unit tests for the merge stage and the unmatched list
 *
 * Runs the listing fixture against an in-memory store holding the Atlas and
 * the Fire Moth. The Atlas detail page carries availability for known,
 * mapped and unknown factions and one era that maps nowhere.
 */

#include <gtest/gtest.h>
#include <matching/catalog_merger.hpp>
#include <matching/exception_list.hpp>
#include <core/errors.hpp>
#include <utils/files.hpp>
#include "../support/in_memory_stores.hpp"

using namespace Armory;
using namespace Armory::Testing;

class CatalogMergerTest : public ::testing::Test {
protected:
    ScratchDir dir{"catalog-merger"};
    InMemoryMergeStore store;
    std::unique_ptr<ExceptionList> exceptions;
    std::vector<CatalogRecord> records;

    void SetUp() override {
        store.add_unit(1, "atlas-as7-d", "Atlas AS7-D");
        store.add_unit(4, "fire-moth-prime", "Fire Moth Prime");
        store.add_faction("star-league", "Star League");
        store.add_faction("steiner", "Lyran Commonwealth");
        store.add_faction("davion", "Federated Suns");

        exceptions = std::make_unique<ExceptionList>(dir / "unmatched.csv");

        auto listing = read_file(fixture_path("catalog/listing_tons_0_19.json"));
        ASSERT_TRUE(listing.has_value());
        records = parse_listing(*listing);
        ASSERT_EQ(records.size(), 3u);
    }

    MergeOptions options() const {
        MergeOptions o;
        o.run_id = "test-match";
        o.detail_loader = [](int id) -> std::optional<std::string> {
            if (id != 140) return std::nullopt;
            return read_file(fixture_path("catalog/detail_140.html"));
        };
        return o;
    }

    MatchSummary run(const MergeOptions& o) {
        CatalogMerger merger(store, *exceptions);
        return merger.run(records, o);
    }
};

// ============================================================================
// Matching and fields
// ============================================================================

TEST_F(CatalogMergerTest, MatchesAndWritesFields) {
    MatchSummary s = run(options());

    EXPECT_EQ(s.records, 3u);
    EXPECT_EQ(s.matched, 2u);
    EXPECT_EQ(s.matched_by_strategy["exact-slug"], 1u);
    EXPECT_EQ(s.matched_by_strategy["normalized-slug"], 1u);
    EXPECT_EQ(s.units_updated, 2u);
    EXPECT_EQ(s.failed, 0u);

    const auto& atlas = store.fields(1);
    EXPECT_EQ(atlas.battle_value.value, 1897);
    EXPECT_EQ(atlas.battle_value.source, std::string("catalog"));
    EXPECT_EQ(atlas.external_id.value, 140);

    const auto& moth = store.fields(4);
    EXPECT_FALSE(moth.battle_value.value.has_value());  // zero in the listing
    EXPECT_EQ(moth.alternate_name.value, std::string("Fire Moth Prime"));
    EXPECT_EQ(moth.intro_year.value, 3050);

    ASSERT_EQ(s.unmatched.size(), 1u);
    EXPECT_EQ(s.unmatched[0].external_id, 9001);
    EXPECT_EQ(s.unmatched[0].reason, UnmatchedReason::NoMatch);
}

TEST_F(CatalogMergerTest, ManualFieldsSurviveCatalogMerge) {
    store.fields(1).battle_value = {1700, std::string("manual")};
    run(options());
    EXPECT_EQ(store.fields(1).battle_value.value, 1700);
    EXPECT_EQ(store.fields(1).battle_value.source, std::string("manual"));

    MergeOptions forced = options();
    forced.force = true;
    run(forced);
    EXPECT_EQ(store.fields(1).battle_value.value, 1897);
}

TEST_F(CatalogMergerTest, SecondRunWritesNothing) {
    run(options());
    MatchSummary again = run(options());
    EXPECT_EQ(again.matched, 2u);
    EXPECT_EQ(again.units_updated, 0u);
    EXPECT_EQ(again.fields_written, 0u);
    EXPECT_EQ(again.availability_rows, 0u);
    EXPECT_EQ(again.factions_created, 0u);
    EXPECT_EQ(again.skipped_known, 1u);
}

// ============================================================================
// Availability
// ============================================================================

TEST_F(CatalogMergerTest, AvailabilityAndFactions) {
    MatchSummary s = run(options());

    // Star League: 2 rows. Clan Invasion: 4 rows. Unknown Epoch maps nowhere.
    EXPECT_EQ(s.availability_rows, 6u);
    EXPECT_EQ(store.state().availability.size(), 6u);
    EXPECT_EQ(s.unmapped_eras, std::set<std::string>{"Unknown Epoch"});

    const auto* davion = store.faction("davion");
    ASSERT_NE(davion, nullptr);
    EXPECT_EQ(store.state().availability.count({1, davion->id, 6}), 1u);

    EXPECT_EQ(s.factions_created, 3u);
    const auto* fronc = store.faction("fronc-reaches");
    ASSERT_NE(fronc, nullptr);
    EXPECT_TRUE(fronc->auto_created);
    EXPECT_EQ(fronc->data.faction_type, "other");

    const auto* lion = store.faction("clan-stone-lion");
    ASSERT_NE(lion, nullptr);
    EXPECT_EQ(lion->data.faction_type, "clan");
    EXPECT_TRUE(lion->data.is_clan);

    EXPECT_NE(store.faction("kell-hounds-friends"), nullptr);
}

TEST_F(CatalogMergerTest, SkipAvailability) {
    MergeOptions o = options();
    o.skip_availability = true;
    MatchSummary s = run(o);
    EXPECT_EQ(s.availability_rows, 0u);
    EXPECT_EQ(s.factions_created, 0u);
    EXPECT_TRUE(store.state().availability.empty());
}

// ============================================================================
// Overrides and conflicts
// ============================================================================

TEST_F(CatalogMergerTest, OverridesAndDuplicates) {
    CatalogRecord dup = records[0];
    records.push_back(dup);

    CatalogRecord missing;
    missing.external_id = 7777;
    missing.name = "Nonexistent NX-2";
    records.push_back(missing);

    MergeOptions o = options();
    o.overrides = {{42, "fire-moth-prime"}, {7777, "missing-unit-x"}};
    MatchSummary s = run(o);

    EXPECT_EQ(s.duplicates, 1u);
    EXPECT_EQ(s.matched_by_strategy["override"], 1u);
    ASSERT_EQ(s.unmatched.size(), 2u);
    EXPECT_EQ(s.unmatched[1].reason, UnmatchedReason::OverrideTargetMissing);
}

TEST_F(CatalogMergerTest, SecondRecordForSameUnitIsReported) {
    CatalogRecord other;
    other.external_id = 141;
    other.name = "Atlas  AS7-D";
    records.push_back(other);

    MatchSummary s = run(options());
    EXPECT_EQ(s.matched, 2u);
    ASSERT_EQ(s.unmatched.size(), 2u);
    EXPECT_EQ(s.unmatched[1].external_id, 141);
    EXPECT_EQ(s.unmatched[1].reason, UnmatchedReason::TargetAlreadyMatched);
    EXPECT_EQ(store.fields(1).external_id.value, 140);
}

// ============================================================================
// Exception list
// ============================================================================

TEST_F(CatalogMergerTest, ListedRecordsAreSkippedUnlessRetried) {
    run(options());
    ASSERT_EQ(exceptions->external_ids(), std::set<int>{9001});

    // The operator adds the missing unit; a plain run still skips the record.
    store.add_unit(9, "nonexistent-nx-1", "Nonexistent NX-1");
    MatchSummary plain = run(options());
    EXPECT_EQ(plain.skipped_known, 1u);
    EXPECT_EQ(plain.matched, 2u);

    MergeOptions retry = options();
    retry.retry_unmatched = true;
    MatchSummary retried = run(retry);
    EXPECT_EQ(retried.matched, 3u);
    EXPECT_TRUE(exceptions->load().empty());
}

TEST_F(CatalogMergerTest, RetryKeepsListedRecordsAbsentFromRun) {
    run(options());
    ASSERT_EQ(exceptions->external_ids(), std::set<int>{9001});

    // The partition holding 9001 was not available this time.
    records.pop_back();
    MergeOptions retry = options();
    retry.retry_unmatched = true;
    MatchSummary s = run(retry);

    EXPECT_EQ(s.matched, 2u);
    EXPECT_TRUE(s.unmatched.empty());
    EXPECT_EQ(exceptions->external_ids(), std::set<int>{9001});
}

TEST_F(CatalogMergerTest, RetryKeepsRecordsWhoseMergeFailed) {
    exceptions->append({{140, "Atlas AS7-D", "atlas-as7-d", 100, UnmatchedReason::NoMatch}});
    store.fail_on_unit = 1;

    MergeOptions retry = options();
    retry.retry_unmatched = true;
    MatchSummary s = run(retry);

    EXPECT_EQ(s.failed, 1u);
    EXPECT_EQ(exceptions->external_ids(), (std::set<int>{140, 9001}));
}

TEST_F(CatalogMergerTest, FailedMergeRollsBack) {
    store.fail_on_unit = 1;
    MatchSummary s = run(options());

    EXPECT_EQ(s.failed, 1u);
    ASSERT_EQ(s.failures.size(), 1u);
    EXPECT_EQ(s.failures[0].external_id, 140);
    EXPECT_EQ(store.rollbacks, 1u);
    EXPECT_FALSE(store.fields(1).battle_value.value.has_value());
    EXPECT_EQ(store.fields(4).alternate_name.value, std::string("Fire Moth Prime"));
}

TEST_F(CatalogMergerTest, SummaryReport) {
    MatchSummary s = run(options());
    auto path = s.write(dir.path());
    EXPECT_EQ(path.filename().string(), "test-match-report.json");

    nlohmann::json doc = s.to_json();
    EXPECT_EQ(doc["counts"]["matched"], 2);
    EXPECT_EQ(doc["counts"]["unmatched"], 1);
    EXPECT_EQ(doc["unmatched"][0]["reason"], "no-match");
    EXPECT_EQ(doc["unmapped_eras"][0], "Unknown Epoch");
}

TEST(ExceptionListTest, CsvEscapeAndSplit) {
    EXPECT_EQ(csv_escape("plain"), "plain");
    EXPECT_EQ(csv_escape("a,b"), "\"a,b\"");
    EXPECT_EQ(csv_escape("say \"hi\""), "\"say \"\"hi\"\"\"");

    auto f = csv_split("7,\"Hunchback, HBK-4G\",hunchback-hbk-4g,50,no-match");
    ASSERT_EQ(f.size(), 5u);
    EXPECT_EQ(f[1], "Hunchback, HBK-4G");
}

TEST(ExceptionListTest, ReconcileDropsOnlyResolvedRows) {
    ScratchDir dir("exception-reconcile");
    ExceptionList list(dir / "unmatched.csv");
    list.append({{7, "Hunchback HBK-4G", "hunchback-hbk-4g", 50, UnmatchedReason::NoMatch},
                 {8, "Locust LCT-1V", "locust-lct-1v", 20, UnmatchedReason::NoMatch},
                 {9, "Wasp WSP-1A", "wasp-wsp-1a", 20, UnmatchedReason::NoMatch}});

    list.reconcile({7}, {{8, "Locust LCT-1V", "locust-lct-1v", 20, UnmatchedReason::Ambiguous},
                         {10, "Stinger STG-3R", "stinger-stg-3r", 20, UnmatchedReason::NoMatch}});

    auto rows = list.load();
    ASSERT_EQ(rows.size(), 3u);
    EXPECT_EQ(rows[0].external_id, 9);
    EXPECT_EQ(rows[1].external_id, 8);
    EXPECT_EQ(rows[1].reason, UnmatchedReason::Ambiguous);
    EXPECT_EQ(rows[2].external_id, 10);
}

TEST(ExceptionListTest, AppendKeepsExistingRows) {
    ScratchDir dir("exception-list");
    ExceptionList list(dir / "unmatched.csv");
    EXPECT_TRUE(list.load().empty());

    EXPECT_EQ(list.append({}), 0u);
    auto written = read_file(list.path());
    ASSERT_TRUE(written.has_value());
    EXPECT_EQ(*written, "external_id,candidate_name,computed_slug,tonnage,reason\n");

    Unmatched a{7, "Hunchback, HBK-4G", "hunchback-hbk-4g", 50, UnmatchedReason::Ambiguous};
    Unmatched b{8, "Locust LCT-1V", "locust-lct-1v", 20, UnmatchedReason::NoMatch};
    EXPECT_EQ(list.append({a}), 1u);
    EXPECT_EQ(list.append({a, b}), 1u);

    auto rows = list.load();
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[0].candidate_name, "Hunchback, HBK-4G");
    EXPECT_EQ(rows[0].reason, UnmatchedReason::Ambiguous);
    EXPECT_DOUBLE_EQ(rows[1].tonnage, 20.0);

    list.rewrite({b});
    EXPECT_EQ(list.external_ids(), std::set<int>{8});
}
