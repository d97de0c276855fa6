/**
 * @file unit_store.hpp
 * @brief Persistence interface for the per-unit ingestion pipeline
 */

#pragma once

#include <catalog/alias_resolver.hpp>
#include <model/unit_types.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace Armory {

enum class UpsertStatus {
    Created,
    Updated,
    Unchanged
};

const char* to_string(UpsertStatus s);

struct UpsertResult {
    int64_t id = 0;
    UpsertStatus status = UpsertStatus::Unchanged;
};

/**
 * @brief A new equipment row, keyed by slug.
 */
struct EquipmentRecord {
    std::string slug;
    std::string name;
    EquipmentCategory category = EquipmentCategory::Equipment;
    TechBase tech_base = TechBase::InnerSphere;
    RulesLevel rules_level = RulesLevel::Standard;
    std::optional<int64_t> ammo_for_id;
};

struct LoadoutRow {
    int64_t equipment_id = 0;
    std::optional<Location> location;
    int quantity = 1;
    bool is_rear = false;
};

/**
 * @brief Writes one unit's dependent-entity graph.
 *
 * Calls between begin() and commit() belong to one unit. The replace_* and
 * sync methods return true only when stored rows actually changed, so a
 * repeated ingest of identical input keeps row identities.
 */
class UnitStore {
public:
    virtual ~UnitStore() = default;

    virtual void begin() = 0;
    virtual void commit() = 0;
    virtual void rollback() = 0;

    /// Find-or-create by chassis_slug(unit). Never Updated.
    virtual UpsertResult upsert_chassis(const ParsedUnit& unit) = 0;

    /// Upsert by unit_slug(unit), writing only scalar fields that differ.
    virtual UpsertResult upsert_unit(const ParsedUnit& unit, int64_t chassis_id) = 0;

    virtual bool replace_locations(int64_t unit_id, const std::vector<ParsedLocation>& locations) = 0;

    virtual std::optional<int64_t> find_equipment(const std::string& slug) = 0;

    /// Id of the row with record.slug, inserting it when absent.
    virtual int64_t upsert_equipment(const EquipmentRecord& record) = 0;

    virtual bool replace_loadout(int64_t unit_id, const std::vector<LoadoutRow>& rows) = 0;

    /// Make the unit's quirk set equal to the given slugs.
    virtual bool replace_quirks(int64_t unit_id, const std::vector<std::string>& quirk_slugs) = 0;

    virtual bool upsert_mech_data(int64_t unit_id, const ParsedMechData& mech,
                                  const MechResolution& resolution) = 0;

    /// Recompute equipment.observed_locations from loadout rows.
    virtual void refresh_observed_locations() = 0;
};

} // namespace Armory
