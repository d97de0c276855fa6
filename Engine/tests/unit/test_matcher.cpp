/**
 * @file test_matcher.cpp
 * @brief Unit tests for the unit index and the tiered matcher
 *
 * The tiers are exact key comparisons. A key shared by two units is never
 * resolved to either of them.
 */

#include <gtest/gtest.h>
#include <matching/matcher.hpp>
#include <matching/unit_index.hpp>
#include <core/errors.hpp>
#include <utils/files.hpp>
#include <utils/text.hpp>
#include "../support/in_memory_stores.hpp"

using namespace Armory;
using Armory::Testing::fixture_path;

static CatalogRecord record(int id, const std::string& name, double tons = 0.0) {
    CatalogRecord r;
    r.external_id = id;
    r.name = name;
    r.tonnage = tons;
    return r;
}

static UnitIndex sample_index() {
    return UnitIndex({
        {1, "atlas-as7-d", "Atlas AS7-D"},
        {2, "mad-cat-prime", "Mad Cat Prime"},
        {3, "madcat-prime", "MadCat Prime"},
        {4, "fire-moth-prime", "Fire Moth Prime"},
        {5, "annihilator-anh-1a-xyz", "Annihilator ANH-1A"},
        {6, "awesome-aws-8q", "Awesome AWS-8Q"},
    });
}

// ============================================================================
// UnitIndex
// ============================================================================

TEST(UnitIndexTest, SharedCompactKeyIsAmbiguous) {
    UnitIndex index = sample_index();
    KeyLookup found = index.by_compact("madcatprime");
    EXPECT_FALSE(found);
    EXPECT_TRUE(found.ambiguous);

    KeyLookup atlas = index.by_compact(compact_key("Atlas AS7 D"));
    ASSERT_TRUE(atlas);
    EXPECT_EQ(atlas.unit->id, 1);
}

TEST(UnitIndexTest, NameKeyFoldsCaseAndSpacing) {
    EXPECT_EQ(UnitIndex::name_key("  Atlas   AS7-D "), "atlas as7-d");
}

// ============================================================================
// Name variants
// ============================================================================

TEST(MatcherTest, NameVariantsOrder) {
    auto v = name_variants("Dasher (Fire Moth) Prime");
    ASSERT_EQ(v.size(), 4u);
    EXPECT_EQ(v[0], "Dasher (Fire Moth) Prime");
    EXPECT_EQ(v[1], "Dasher Prime");
    EXPECT_EQ(v[2], "Fire Moth Prime");
    EXPECT_EQ(v[3], "Dasher");

    EXPECT_EQ(name_variants("Atlas AS7-D").size(), 1u);
}

// ============================================================================
// Tiers
// ============================================================================

TEST(MatcherTest, ExactSlugTier) {
    UnitIndex index = sample_index();
    Matcher matcher(index, {});
    auto out = matcher.match(record(140, "Atlas AS7-D"));
    ASSERT_NE(out.unit, nullptr);
    EXPECT_EQ(out.unit->id, 1);
    EXPECT_EQ(out.strategy, "exact-slug");
}

TEST(MatcherTest, OverrideWinsOverEveryOtherTier) {
    UnitIndex index = sample_index();
    Matcher matcher(index, {{42, "fire-moth-prime"}, {140, "awesome-aws-8q"}});

    auto moth = matcher.match(record(42, "Dasher (Fire Moth) Prime"));
    ASSERT_NE(moth.unit, nullptr);
    EXPECT_EQ(moth.unit->slug, "fire-moth-prime");
    EXPECT_EQ(moth.strategy, "override");

    // An override is obeyed even where the name would match elsewhere.
    auto atlas = matcher.match(record(140, "Atlas AS7-D"));
    ASSERT_NE(atlas.unit, nullptr);
    EXPECT_EQ(atlas.unit->slug, "awesome-aws-8q");
}

TEST(MatcherTest, DualNameFindsAlternateHalf) {
    UnitIndex index = sample_index();
    Matcher matcher(index, {});
    auto out = matcher.match(record(42, "Dasher (Fire Moth) Prime"));
    ASSERT_NE(out.unit, nullptr);
    EXPECT_EQ(out.unit->slug, "fire-moth-prime");
    EXPECT_EQ(out.strategy, "normalized-slug");
}

TEST(MatcherTest, DualNameHalvesComeBeforeStrippedName) {
    // Both "Dasher" and "Fire Moth Prime" exist; the dual-name half wins.
    UnitIndex index({{1, "dasher", "Dasher"}, {2, "fire-moth-prime", "Fire Moth Prime"}});
    Matcher matcher(index, {});
    auto out = matcher.match(record(42, "Dasher (Fire Moth) Prime"));
    ASSERT_NE(out.unit, nullptr);
    EXPECT_EQ(out.unit->id, 2);
}

TEST(MatcherTest, TrailingParentheticalIsDropped) {
    UnitIndex index = sample_index();
    Matcher matcher(index, {});
    auto out = matcher.match(record(7, "Awesome AWS-8Q (Smith)"));
    ASSERT_NE(out.unit, nullptr);
    EXPECT_EQ(out.unit->id, 6);
}

TEST(MatcherTest, FullNameTier) {
    UnitIndex index = sample_index();
    Matcher matcher(index, {});
    auto out = matcher.match(record(9, "annihilator   ANH-1A"));
    ASSERT_NE(out.unit, nullptr);
    EXPECT_EQ(out.unit->id, 5);
    EXPECT_EQ(out.strategy, "full-name");
}

TEST(MatcherTest, AmbiguityIsNeverMatched) {
    UnitIndex index = sample_index();
    Matcher matcher(index, {});
    auto out = matcher.match(record(11, "Madcat Pri-me", 75));
    EXPECT_EQ(out.unit, nullptr);
    ASSERT_TRUE(out.unmatched.has_value());
    EXPECT_EQ(out.unmatched->reason, UnmatchedReason::Ambiguous);
    EXPECT_EQ(out.unmatched->computed_slug, "madcat-pri-me");
    EXPECT_DOUBLE_EQ(out.unmatched->tonnage, 75.0);
}

TEST(MatcherTest, MissingOverrideTargetIsReported) {
    UnitIndex index = sample_index();
    Matcher matcher(index, {{7777, "missing-unit-x"}});
    auto out = matcher.match(record(7777, "Nonexistent NX-1"));
    ASSERT_TRUE(out.unmatched.has_value());
    EXPECT_EQ(out.unmatched->reason, UnmatchedReason::OverrideTargetMissing);
}

TEST(MatcherTest, NoMatch) {
    UnitIndex index = sample_index();
    Matcher matcher(index, {});
    auto out = matcher.match(record(9001, "Nonexistent NX-1"));
    ASSERT_TRUE(out.unmatched.has_value());
    EXPECT_EQ(out.unmatched->reason, UnmatchedReason::NoMatch);
    EXPECT_EQ(out.unmatched->candidate_name, "Nonexistent NX-1");
}

// A site-specific tier appended after the built-in four.
class ExternalIdAsSlugStrategy : public MatchStrategy {
public:
    const char* name() const override { return "id-slug"; }
    StrategyResult match(const CatalogRecord& record, const UnitIndex& index) const override {
        if (record.external_id == 1) return StrategyResult::hit(index.by_slug("atlas-as7-d"));
        return StrategyResult::miss();
    }
};

TEST(MatcherTest, CustomStrategyRunsLast) {
    UnitIndex index = sample_index();
    Matcher matcher(index, {});
    matcher.add_strategy(std::make_unique<ExternalIdAsSlugStrategy>());
    EXPECT_EQ(matcher.strategies().size(), 5u);

    auto out = matcher.match(record(1, "Something Else"));
    ASSERT_NE(out.unit, nullptr);
    EXPECT_EQ(out.strategy, "id-slug");
}

// ============================================================================
// Overrides file
// ============================================================================

TEST(MatcherTest, ParseOverridesFixture) {
    auto text = read_file(fixture_path("catalog/overrides.json"));
    ASSERT_TRUE(text.has_value());
    auto overrides = parse_overrides(*text);
    ASSERT_EQ(overrides.size(), 2u);
    EXPECT_EQ(overrides.at(42), "fire-moth-prime");
}

TEST(MatcherTest, MalformedOverridesThrow) {
    EXPECT_THROW(parse_overrides("[1, 2]"), SetupError);
    EXPECT_THROW(parse_overrides(R"({"abc": "x"})"), SetupError);
    EXPECT_THROW(parse_overrides(R"({"42": 5})"), SetupError);
}

TEST(MatcherTest, ReasonStringsRoundTrip) {
    EXPECT_EQ(unmatched_reason_from_string("override-target-missing"), UnmatchedReason::OverrideTargetMissing);
    EXPECT_FALSE(unmatched_reason_from_string("bogus").has_value());
}
