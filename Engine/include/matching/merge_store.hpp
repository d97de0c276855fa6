/**
 * @file merge_store.hpp
 * @brief Persistence interface for the catalog merge stage
 */

#pragma once

#include <matching/merge_planner.hpp>
#include <matching/unit_index.hpp>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace Armory {

struct NewFaction {
    std::string slug;
    std::string name;
    std::string faction_type;
    bool is_clan = false;
};

class MergeStore {
public:
    virtual ~MergeStore() = default;

    virtual std::vector<IndexedUnit> load_units() = 0;

    /// Era slug -> id.
    virtual std::map<std::string, int64_t> load_eras() = 0;

    virtual void begin() = 0;
    virtual void commit() = 0;
    virtual void rollback() = 0;

    virtual UnitCatalogFields load_catalog_fields(int64_t unit_id) = 0;

    /// Write the planned columns, each with the given provenance, and stamp the import time.
    virtual void apply_merge(int64_t unit_id, const MergePlan& plan, const std::string& source) = 0;

    /// Faction id by exact name or slug.
    virtual std::optional<int64_t> find_faction(const std::string& name_or_slug) = 0;

    /// Insert a faction flagged as auto-created; returns the existing id on a slug conflict.
    virtual int64_t create_faction(const NewFaction& faction) = 0;

    /// Insert missing (faction id, era id) rows. Returns how many were new.
    virtual size_t upsert_availability(int64_t unit_id,
                                       const std::vector<std::pair<int64_t, int64_t>>& rows) = 0;
};

} // namespace Armory
