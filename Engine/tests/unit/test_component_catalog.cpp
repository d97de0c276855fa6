/**
 * @file test_component_catalog.cpp
 * @brief Unit tests for the component catalog and the alias resolver
 *
 * Covers the alias uniqueness rule, exact (never fuzzy) lookup, and the
 * default-fill policy: gyro, cockpit and myomer fall back to standard,
 * the other four categories never do.
 */

#include <gtest/gtest.h>
#include <catalog/alias_resolver.hpp>
#include <catalog/component_catalog.hpp>
#include <catalog/reference_data.hpp>
#include <core/errors.hpp>
#include <set>

using namespace Armory;

static ComponentType make_type(int id, const std::string& slug, const std::string& name) {
    ComponentType t;
    t.id = id;
    t.slug = slug;
    t.name = name;
    return t;
}

static int id_of(ComponentCategory c, const std::string& slug) {
    const auto* t = ComponentCatalog::builtin().find_by_slug(c, slug);
    if (!t) throw std::runtime_error("no " + slug);
    return t->id;
}

// ============================================================================
// Catalog
// ============================================================================

TEST(ComponentCatalogTest, BuiltinHasStandardWhereDefaultsApply) {
    const auto& cat = ComponentCatalog::builtin();
    for (ComponentCategory c : kComponentCategories) {
        EXPECT_FALSE(cat.types(c).empty()) << to_string(c);
        if (AliasResolver::has_default(c)) {
            EXPECT_NO_THROW(cat.standard_id(c)) << to_string(c);
        }
    }
}

TEST(ComponentCatalogTest, SlugsAndIdsAreUniquePerCategory) {
    const auto& cat = ComponentCatalog::builtin();
    for (ComponentCategory c : kComponentCategories) {
        std::set<int> ids;
        std::set<std::string> slugs;
        for (const auto& t : cat.types(c)) {
            EXPECT_TRUE(ids.insert(t.id).second) << to_string(c) << " id " << t.id;
            EXPECT_TRUE(slugs.insert(t.slug).second) << to_string(c) << " slug " << t.slug;
        }
    }
}

TEST(ComponentCatalogTest, EveryAliasTargetsAnExistingEntry) {
    const auto& cat = ComponentCatalog::builtin();
    for (ComponentCategory c : kComponentCategories) {
        for (const auto& [alias, id] : cat.aliases(c)) {
            EXPECT_NE(cat.find_by_id(c, id), nullptr) << to_string(c) << " alias " << alias;
        }
    }
}

TEST(ComponentCatalogTest, ConflictingAliasThrows) {
    ComponentCatalog cat;
    cat.add_type(ComponentCategory::Engine, make_type(1, "standard-fusion", "Fusion Engine"));
    cat.add_type(ComponentCategory::Engine, make_type(2, "xl-is", "XL Engine"));
    cat.add_alias(ComponentCategory::Engine, "Fusion", "standard-fusion");

    // Same target again is idempotent, after normalization too.
    EXPECT_NO_THROW(cat.add_alias(ComponentCategory::Engine, "  FUSION ", "standard-fusion"));
    EXPECT_THROW(cat.add_alias(ComponentCategory::Engine, "fusion", "xl-is"), CatalogError);
}

TEST(ComponentCatalogTest, DuplicateTypeOrUnknownTargetThrows) {
    ComponentCatalog cat;
    cat.add_type(ComponentCategory::Gyro, make_type(1, "standard", "Standard Gyro"));
    EXPECT_THROW(cat.add_type(ComponentCategory::Gyro, make_type(1, "xl", "XL Gyro")), CatalogError);
    EXPECT_THROW(cat.add_type(ComponentCategory::Gyro, make_type(2, "standard", "Other Gyro")), CatalogError);
    EXPECT_THROW(cat.add_alias(ComponentCategory::Gyro, "XL", "xl"), CatalogError);
}

TEST(ComponentCatalogTest, SameAliasInDifferentCategoriesIsIndependent) {
    const auto& cat = ComponentCatalog::builtin();
    EXPECT_TRUE(cat.lookup(ComponentCategory::Armor, "Standard").has_value());
    EXPECT_TRUE(cat.lookup(ComponentCategory::Structure, "Standard").has_value());
}

// ============================================================================
// Resolver
// ============================================================================

TEST(AliasResolverTest, ResolvesDisplayNameIgnoringCase) {
    AliasResolver resolver;
    auto id = resolver.resolve(ComponentCategory::Armor, "Ferro-Fibrous (Clan)");
    ASSERT_TRUE(id.has_value());
    EXPECT_EQ(*id, id_of(ComponentCategory::Armor, "ferro-fibrous-clan"));

    EXPECT_EQ(resolver.resolve(ComponentCategory::Armor, "  ferro-fibrous (CLAN)"), id);
}

TEST(AliasResolverTest, NoPartialMatching) {
    AliasResolver resolver;
    EXPECT_FALSE(resolver.resolve(ComponentCategory::Armor, "Ferro").has_value());
    EXPECT_FALSE(resolver.resolve(ComponentCategory::Engine, "XL").has_value());
}

TEST(AliasResolverTest, AbsentGyroIsDefaulted) {
    AliasResolver resolver;
    ParsedMechData mech;
    mech.engine_type = "Fusion Engine(IS)";

    auto r = resolver.resolve_all(mech);
    const auto& gyro = r.get(ComponentCategory::Gyro);
    EXPECT_EQ(gyro.status, ResolutionStatus::Defaulted);
    EXPECT_EQ(gyro.canonical_id, ComponentCatalog::builtin().standard_id(ComponentCategory::Gyro));
    EXPECT_EQ(r.get(ComponentCategory::Cockpit).status, ResolutionStatus::Defaulted);
    EXPECT_EQ(r.get(ComponentCategory::Myomer).status, ResolutionStatus::Defaulted);
}

TEST(AliasResolverTest, AbsentEngineIsUnresolved) {
    AliasResolver resolver;
    ParsedMechData mech;

    auto r = resolver.resolve_all(mech);
    const auto& engine = r.get(ComponentCategory::Engine);
    EXPECT_EQ(engine.status, ResolutionStatus::Unresolved);
    EXPECT_FALSE(engine.canonical_id.has_value());

    auto unresolved = r.unresolved();
    EXPECT_EQ(unresolved.size(), 4u);
    EXPECT_TRUE(r.unknown_labels().empty());
}

TEST(AliasResolverTest, UnknownGyroLabelIsDefaultedButReported) {
    AliasResolver resolver;
    ParsedMechData mech;
    mech.gyro_type = "Prototype Flux Gyro";

    auto r = resolver.resolve_all(mech);
    EXPECT_EQ(r.get(ComponentCategory::Gyro).status, ResolutionStatus::Defaulted);
    auto unknown = r.unknown_labels();
    ASSERT_EQ(unknown.size(), 1u);
    EXPECT_EQ(unknown[0], ComponentCategory::Gyro);
}

TEST(AliasResolverTest, UnknownEngineLabelStaysUnresolved) {
    AliasResolver resolver;
    ParsedMechData mech;
    mech.engine_type = "Warp Core";

    auto r = resolver.resolve_all(mech);
    const auto& engine = r.get(ComponentCategory::Engine);
    EXPECT_EQ(engine.status, ResolutionStatus::Unresolved);
    ASSERT_TRUE(engine.raw_label.has_value());
    EXPECT_EQ(*engine.raw_label, "Warp Core");
}

TEST(AliasResolverTest, ArchiveLabelsResolve) {
    AliasResolver resolver;
    ParsedMechData mech;
    mech.engine_type = "XL Engine(IS)";
    mech.armor_type = "Standard(Inner Sphere)";
    mech.structure_type = "IS Endo Steel";
    mech.heat_sink_type = "Double";
    mech.gyro_type = "Standard Gyro";
    mech.cockpit_type = "Standard Cockpit";
    mech.myomer_type = "Standard";

    auto r = resolver.resolve_all(mech);
    for (const auto& c : r.components) {
        EXPECT_EQ(c.status, ResolutionStatus::Resolved) << to_string(c.category);
    }
    EXPECT_EQ(r.get(ComponentCategory::Engine).canonical_id, id_of(ComponentCategory::Engine, "xl-is"));
    EXPECT_EQ(r.get(ComponentCategory::Structure).canonical_id,
              id_of(ComponentCategory::Structure, "endo-steel-is"));
}

// ============================================================================
// Reference data
// ============================================================================

TEST(ReferenceDataTest, EraNamesMapToSeededEras) {
    EXPECT_EQ(map_era("Star League"), std::string("star-league"));
    EXPECT_EQ(map_era("Late Succession War - Renaissance"), std::string("renaissance"));
    EXPECT_FALSE(map_era("Unknown Epoch").has_value());

    std::set<std::string> slugs;
    for (const auto& e : builtin_eras()) slugs.insert(e.slug);
    EXPECT_TRUE(slugs.count(*map_era("Clan Invasion")));
}

TEST(ReferenceDataTest, FactionTypeInference) {
    EXPECT_EQ(infer_faction_type("Clan Stone Lion"), "clan");
    EXPECT_EQ(map_faction("Federated Commonwealth"), std::string("davion"));
    EXPECT_FALSE(map_faction("Fronc Reaches").has_value());
}
