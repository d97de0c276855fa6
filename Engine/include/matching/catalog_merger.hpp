/**
 * @file catalog_merger.hpp
 * @brief Match catalog records to units, merge their fields and availability
 */

#pragma once

#include <export.hpp>
#include <external/catalog_records.hpp>
#include <matching/exception_list.hpp>
#include <matching/matcher.hpp>
#include <matching/merge_store.hpp>
#include <nlohmann/json.hpp>
#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace Armory {

struct MergeOptions {
    /// Provenance written with merged fields: "catalog" or "manual".
    std::string source = kSourceCatalog;
    bool force = false;
    /// Re-process records on the exception list. Rows for merged records are
    /// removed; rows for records absent from the run or failed are kept.
    bool retry_unmatched = false;
    bool skip_availability = false;
    std::map<int, std::string> overrides;
    /// Detail page HTML by external id; empty means no availability data.
    std::function<std::optional<std::string>(int)> detail_loader;
    std::string run_id;
};

struct RecordFailure {
    int external_id = 0;
    std::string reason;
};

struct MatchSummary {
    std::string run_id;
    std::string started_at;
    std::string finished_at;

    size_t records = 0;
    size_t duplicates = 0;
    size_t skipped_known = 0;   // already on the exception list
    size_t matched = 0;
    std::map<std::string, size_t> matched_by_strategy;
    size_t units_updated = 0;
    size_t fields_written = 0;
    size_t availability_rows = 0;
    size_t factions_created = 0;
    size_t failed = 0;

    std::vector<Unmatched> unmatched;
    std::set<std::string> unmapped_eras;
    std::vector<RecordFailure> failures;

    nlohmann::json to_json() const;

    /// Writes <dir>/<run_id>-report.json atomically and returns the path.
    std::filesystem::path write(const std::filesystem::path& dir) const;
};

/**
 * @brief The merge stage.
 *
 * Each matched record is merged in its own transaction. Unmatched records go
 * to the exception list; by default records already on it are not retried.
 */
class ARMORY_API CatalogMerger {
public:
    CatalogMerger(MergeStore& store, ExceptionList& exceptions);

    MatchSummary run(const std::vector<CatalogRecord>& records, const MergeOptions& options);

private:
    MergeStore& store_;
    ExceptionList& exceptions_;
    std::map<std::string, int64_t> eras_;
    std::map<std::string, int64_t> factions_;  // by external name, per run

    size_t merge_availability(int64_t unit_id, const std::string& html, MatchSummary& summary);
    int64_t faction_id(const std::string& name, MatchSummary& summary);
};

} // namespace Armory
