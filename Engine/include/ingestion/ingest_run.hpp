/**
 * @file ingest_run.hpp
 * @brief Batch driver: archive entries -> parsed units -> persisted graph
 */

#pragma once

#include <export.hpp>
#include <ingestion/run_report.hpp>
#include <ingestion/unit_ingestor.hpp>
#include <parsing/unit_source.hpp>
#include <filesystem>
#include <optional>
#include <string>

namespace Armory {

struct IngestOptions {
    /// Stop after this many parse or persistence failures; 0 means no limit.
    size_t max_errors = 0;
    /// Stop after this many entries; 0 means all.
    size_t limit = 0;
    /// Resume file of committed entry names; none disables resume.
    std::optional<std::filesystem::path> checkpoint;
    std::string run_id;
};

/**
 * @brief Walks a UnitSource and feeds every parsed unit to a UnitIngestor.
 *
 * Parse failures and per-unit persistence failures are counted and listed in
 * the report; only SetupError (unreadable archive, unwritable checkpoint)
 * propagates.
 */
class ARMORY_API IngestRun {
public:
    IngestRun(UnitSource& source, UnitIngestor& ingestor, UnitStore& store);

    RunReport run(const IngestOptions& options);

private:
    UnitSource& source_;
    UnitIngestor& ingestor_;
    UnitStore& store_;
};

} // namespace Armory
