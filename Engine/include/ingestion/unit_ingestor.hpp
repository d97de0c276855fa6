/**
 * @file unit_ingestor.hpp
 * @brief Per-unit transactional write of a parsed unit's entity graph
 */

#pragma once

#include <catalog/alias_resolver.hpp>
#include <export.hpp>
#include <ingestion/equipment_cache.hpp>
#include <model/unit_types.hpp>
#include <storage/unit_store.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace Armory {

/**
 * @brief A category the alias resolver could not map from a present label,
 * or a never-defaulted category with no label at all.
 */
struct ResolutionGap {
    std::string unit_slug;
    ComponentCategory category;
    std::optional<std::string> raw_label;
    ResolutionStatus status;
};

struct IngestOutcome {
    int64_t unit_id = 0;
    std::string slug;
    UpsertStatus status = UpsertStatus::Unchanged;
    std::vector<ResolutionGap> gaps;
    size_t equipment_created = 0;
};

/**
 * @brief Writes one ParsedUnit per transaction.
 *
 * Order: chassis, unit, locations, loadout, quirks, mechanical attributes.
 * Equipment ids come from the shared EquipmentCache; ids created inside a
 * transaction that rolls back are evicted again.
 */
class ARMORY_API UnitIngestor {
public:
    UnitIngestor(UnitStore& store, EquipmentCache& cache, const AliasResolver& resolver);

    /**
     * @brief Upsert the unit and all dependents.
     *
     * Created when the unit row is new, Updated when it or any dependent
     * changed, Unchanged otherwise. Throws StoreError after rolling back;
     * a SetupError (lost connection) is rethrown as is.
     */
    IngestOutcome ingest(const ParsedUnit& unit);

private:
    UnitStore& store_;
    EquipmentCache& cache_;
    const AliasResolver& resolver_;

    int64_t equipment_id(const std::string& label, const ParsedUnit& unit,
                         std::vector<std::string>& inserted, size_t& created);

    std::vector<LoadoutRow> build_loadout(const ParsedUnit& unit,
                                          std::vector<std::string>& inserted, size_t& created);

    // Roll back the open transaction and forget equipment ids it created.
    void abandon(const std::string& slug, const std::vector<std::string>& inserted);
};

} // namespace Armory
