/**
 * @file component_catalog.hpp
 * @brief Canonical construction-component catalogs and their alias sets
 */

#pragma once

#include <export.hpp>
#include <model/unit_types.hpp>
#include <nlohmann/json.hpp>
#include <array>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace Armory {

/// Bumped whenever a canonical entry or alias changes; recorded in dataset_metadata.
constexpr int kCatalogVersion = 3;

enum class ComponentCategory {
    Engine,
    Armor,
    Structure,
    HeatSink,
    Gyro,
    Cockpit,
    Myomer
};

constexpr std::array<ComponentCategory, 7> kComponentCategories = {
    ComponentCategory::Engine, ComponentCategory::Armor, ComponentCategory::Structure,
    ComponentCategory::HeatSink, ComponentCategory::Gyro, ComponentCategory::Cockpit,
    ComponentCategory::Myomer,
};

/// "engine", "armor", "structure", "heat_sink", "gyro", "cockpit", "myomer"
const char* to_string(ComponentCategory c);

/// Reference table, e.g. "heatsink_types".
const char* type_table(ComponentCategory c);

/// Alias table, e.g. "heatsink_type_aliases".
const char* alias_table(ComponentCategory c);

/// Foreign key column in unit_mech_data and the alias table, e.g. "heatsink_type_id".
const char* id_column(ComponentCategory c);

struct ComponentType {
    int id = 0;
    std::string slug;
    std::string name;
    TechBase tech_base = TechBase::InnerSphere;
    RulesLevel rules_level = RulesLevel::Standard;
    std::optional<int> intro_year;
    nlohmann::json properties;  // category-specific numbers, stored as JSONB
};

/**
 * @brief Closed set of canonical entries per category plus the alias map that
 * is the only path from free text to a canonical id.
 *
 * Aliases are stored normalized (trim + case-fold). A normalized alias maps to
 * exactly one id; adding it again for the same id is a no-op, adding it for a
 * different id throws CatalogError.
 */
class ARMORY_API ComponentCatalog {
public:
    /// The curated catalog shipped with this version.
    static const ComponentCatalog& builtin();

    /// Throws CatalogError on a duplicate id or slug. The name becomes an alias.
    void add_type(ComponentCategory category, ComponentType type);

    /// Throws CatalogError for an unknown target slug or a conflicting alias.
    void add_alias(ComponentCategory category, std::string_view alias, std::string_view slug);

    const std::vector<ComponentType>& types(ComponentCategory category) const;
    const std::map<std::string, int>& aliases(ComponentCategory category) const;

    const ComponentType* find_by_slug(ComponentCategory category, std::string_view slug) const;
    const ComponentType* find_by_id(ComponentCategory category, int id) const;

    /// Alias lookup after normalization. No partial or fuzzy matching.
    std::optional<int> lookup(ComponentCategory category, std::string_view label) const;

    /// Id of the "standard" entry; throws CatalogError when the category has none.
    int standard_id(ComponentCategory category) const;

    size_t alias_count() const;

private:
    struct Table {
        std::vector<ComponentType> types;
        std::map<std::string, int> aliases;
    };

    std::array<Table, 7> tables_;

    Table& table(ComponentCategory c) { return tables_[static_cast<size_t>(c)]; }
    const Table& table(ComponentCategory c) const { return tables_[static_cast<size_t>(c)]; }

    void add_alias_id(ComponentCategory category, std::string_view alias, int id);
};

} // namespace Armory
