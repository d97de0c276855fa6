/**
 * @file equipment_stats.hpp
 * @brief Import of curated equipment statistics onto inferred equipment rows
 */

#pragma once

#include <database/postgres_connection.hpp>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace Armory {

struct EquipmentStats {
    std::string slug;
    std::optional<double> tonnage;
    std::optional<int> crits;
    std::optional<std::string> damage;
    std::optional<int> heat;
    std::optional<int> range_min;
    std::optional<int> range_short;
    std::optional<int> range_medium;
    std::optional<int> range_long;
    std::optional<int> bv;
};

struct StatsImportSummary {
    size_t updated = 0;
    size_t unchanged = 0;
    size_t not_found = 0;
    size_t alias_hits = 0;
};

/// Array of stats objects. Throws SetupError on a malformed document.
std::vector<EquipmentStats> parse_equipment_stats(const std::string& json_text);

/**
 * @brief Equipment slug used by the archive for a curated slug, when the two
 * naming schemes differ ("clan-er-large-laser" -> "clerlargelaser").
 */
std::optional<std::string> archive_equipment_slug(const std::string& curated_slug);

/**
 * @brief Apply stats to equipment rows matched by slug, then by archive alias.
 *
 * Without force only NULL columns are filled; with force every column is
 * overwritten. Either way the row is marked stats_source = 'seed'.
 */
class EquipmentStatsImporter {
public:
    explicit EquipmentStatsImporter(PostgresConnection& db);

    StatsImportSummary import(const std::vector<EquipmentStats>& entries, bool force);

private:
    PostgresConnection& db_;
};

} // namespace Armory
