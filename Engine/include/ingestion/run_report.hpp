/**
 * @file run_report.hpp
 * @brief Counts and enumerated issues of one ingestion run
 */

#pragma once

#include <export.hpp>
#include <ingestion/unit_ingestor.hpp>
#include <nlohmann/json.hpp>
#include <filesystem>
#include <string>
#include <vector>

namespace Armory {

/// An archive entry that produced no unit, or whose unit failed to persist.
struct EntryFailure {
    std::string entry;
    std::string reason;
};

struct RunReport {
    std::string run_id;
    std::string source;
    std::string started_at;
    std::string finished_at;
    bool completed = false;
    bool aborted = false;  // stopped at max_errors

    size_t entries = 0;
    size_t created = 0;
    size_t updated = 0;
    size_t unchanged = 0;
    size_t skipped = 0;  // already committed by an earlier run
    size_t parse_failures = 0;
    size_t failed = 0;
    size_t equipment_created = 0;

    std::vector<EntryFailure> parse_errors;
    std::vector<EntryFailure> persistence_errors;
    std::vector<ResolutionGap> gaps;

    size_t errors() const { return parse_failures + failed; }

    nlohmann::json to_json() const;

    /// Writes <dir>/<run_id>-report.json atomically and returns the path.
    std::filesystem::path write(const std::filesystem::path& dir) const;
};

} // namespace Armory
