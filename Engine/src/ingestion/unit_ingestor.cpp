/**
 * @file unit_ingestor.cpp
 * @brief Per-unit upsert ordering, equipment identity and rollback
 */

#include <ingestion/unit_ingestor.hpp>
#include <ingestion/equipment_classifier.hpp>
#include <core/errors.hpp>
#include <utils/logger.hpp>

namespace Armory {

UnitIngestor::UnitIngestor(UnitStore& store, EquipmentCache& cache, const AliasResolver& resolver)
    : store_(store), cache_(cache), resolver_(resolver) {}

int64_t UnitIngestor::equipment_id(const std::string& label, const ParsedUnit& unit,
                                   std::vector<std::string>& inserted, size_t& created) {
    // The cache lock is held while create() runs, so the parent is looked up first.
    // Parents are written before ammunition, so a weapon on this unit is already cached.
    std::optional<int64_t> parent_id;
    if (auto parent = ammo_parent_label(label)) {
        if (!cache_.find(label)) {
            parent_id = cache_.find(*parent);
            if (!parent_id) parent_id = store_.find_equipment(EquipmentCache::key(*parent));
        }
    }

    return cache_.get_or_create(label, [&]() -> int64_t {
        std::string slug = EquipmentCache::key(label);
        if (auto existing = store_.find_equipment(slug)) return *existing;

        EquipmentRecord rec;
        rec.slug = slug;
        rec.name = label;
        rec.category = classify_equipment(label);
        rec.tech_base = equipment_tech_base(label);
        rec.rules_level = unit.rules_level;
        rec.ammo_for_id = parent_id;

        ++created;
        return store_.upsert_equipment(rec);
    }, &inserted);
}

std::vector<LoadoutRow> UnitIngestor::build_loadout(const ParsedUnit& unit,
                                                    std::vector<std::string>& inserted,
                                                    size_t& created) {
    std::vector<LoadoutRow> rows(unit.loadout.size());
    std::vector<size_t> ammo;

    for (size_t i = 0; i < unit.loadout.size(); ++i) {
        const auto& entry = unit.loadout[i];
        if (classify_equipment(entry.equipment) == EquipmentCategory::Ammunition) {
            ammo.push_back(i);
            continue;
        }
        rows[i] = {equipment_id(entry.equipment, unit, inserted, created),
                   entry.location, entry.quantity, entry.is_rear};
    }
    for (size_t i : ammo) {
        const auto& entry = unit.loadout[i];
        rows[i] = {equipment_id(entry.equipment, unit, inserted, created),
                   entry.location, entry.quantity, entry.is_rear};
    }
    return rows;
}

void UnitIngestor::abandon(const std::string& slug, const std::vector<std::string>& inserted) {
    cache_.evict(inserted);
    try {
        store_.rollback();
    } catch (const std::exception& e) {
        Logger::error("Rollback failed for " + slug + ": " + e.what());
    }
}

IngestOutcome UnitIngestor::ingest(const ParsedUnit& unit) {
    IngestOutcome outcome;
    outcome.slug = unit_slug(unit);

    std::vector<std::string> inserted;
    size_t created = 0;

    store_.begin();
    try {
        UpsertResult chassis = store_.upsert_chassis(unit);
        UpsertResult row = store_.upsert_unit(unit, chassis.id);
        outcome.unit_id = row.id;

        bool changed = row.status != UpsertStatus::Unchanged;
        changed |= store_.replace_locations(row.id, unit.locations);
        changed |= store_.replace_loadout(row.id, build_loadout(unit, inserted, created));
        changed |= store_.replace_quirks(row.id, unit.quirks);

        if (unit.mech_data) {
            MechResolution resolution = resolver_.resolve_all(*unit.mech_data);
            changed |= store_.upsert_mech_data(row.id, *unit.mech_data, resolution);

            for (const auto& c : resolution.components) {
                bool unknown = c.raw_label && c.status != ResolutionStatus::Resolved;
                bool missing = !c.raw_label && c.status == ResolutionStatus::Unresolved;
                if (unknown || missing) {
                    outcome.gaps.push_back({outcome.slug, c.category, c.raw_label, c.status});
                }
            }
        }

        store_.commit();

        if (row.status == UpsertStatus::Created) outcome.status = UpsertStatus::Created;
        else outcome.status = changed ? UpsertStatus::Updated : UpsertStatus::Unchanged;
        outcome.equipment_created = created;
    } catch (const SetupError&) {
        abandon(outcome.slug, inserted);
        throw;
    } catch (const std::exception& e) {
        abandon(outcome.slug, inserted);
        throw StoreError("Failed to ingest " + outcome.slug + ": " + e.what());
    }

    for (const auto& gap : outcome.gaps) {
        Logger::debug(outcome.slug + ": " + to_string(gap.category) + " " +
                      to_string(gap.status) + " (" + gap.raw_label.value_or("absent") + ")");
    }
    return outcome;
}

} // namespace Armory
