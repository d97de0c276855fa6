/**
 * @file ingest_run.cpp
 * @brief Batch ingestion with checkpointed resume and error budget
 */

#include <ingestion/ingest_run.hpp>
#include <ingestion/checkpoint.hpp>
#include <core/errors.hpp>
#include <utils/logger.hpp>
#include <utils/time.hpp>

namespace Armory {

IngestRun::IngestRun(UnitSource& source, UnitIngestor& ingestor, UnitStore& store)
    : source_(source), ingestor_(ingestor), store_(store) {}

RunReport IngestRun::run(const IngestOptions& options) {
    RunReport report;
    report.run_id = options.run_id.empty() ? "ingest-" + utc_file_stamp() : options.run_id;
    report.started_at = utc_timestamp();

    std::optional<Checkpoint> checkpoint;
    if (options.checkpoint) {
        checkpoint.emplace(*options.checkpoint);
        checkpoint->load();
        if (checkpoint->size() > 0) {
            Logger::info("Resuming: " + std::to_string(checkpoint->size()) + " entries already committed");
        }
    }

    Timer timer;
    source_.open();

    bool exhausted = true;
    while (auto entry = source_.next()) {
        if (options.limit > 0 && report.entries >= options.limit) {
            exhausted = false;
            break;
        }
        ++report.entries;

        if (checkpoint && checkpoint->contains(entry->name)) {
            ++report.skipped;
            continue;
        }

        auto unit = parse_entry(*entry);
        if (!unit) {
            ++report.parse_failures;
            report.parse_errors.push_back({entry->name, "unparseable"});
            Logger::warn("Parse failed: " + entry->name);
        } else {
            try {
                IngestOutcome outcome = ingestor_.ingest(*unit);
                switch (outcome.status) {
                    case UpsertStatus::Created:   ++report.created; break;
                    case UpsertStatus::Updated:   ++report.updated; break;
                    case UpsertStatus::Unchanged: ++report.unchanged; break;
                }
                report.equipment_created += outcome.equipment_created;
                report.gaps.insert(report.gaps.end(), outcome.gaps.begin(), outcome.gaps.end());
                if (checkpoint) checkpoint->record(entry->name);
            } catch (const StoreError& e) {
                ++report.failed;
                report.persistence_errors.push_back({entry->name, e.what()});
                Logger::error(e.what());
            }
        }

        if (options.max_errors > 0 && report.errors() >= options.max_errors) {
            Logger::error("Error limit reached (" + std::to_string(options.max_errors) + "), stopping");
            report.aborted = true;
            exhausted = false;
            break;
        }

        if (report.entries % 500 == 0) {
            Logger::bulk(std::to_string(report.entries) + " entries, " +
                         std::to_string(report.created) + " created, " +
                         std::to_string(report.errors()) + " errors");
        }
    }
    source_.close();

    store_.refresh_observed_locations();

    report.completed = exhausted;
    report.finished_at = utc_timestamp();
    if (checkpoint && report.completed) checkpoint->remove();

    Logger::success("Ingested " + std::to_string(report.entries) + " entries in " +
                    std::to_string(timer.elapsed_sec()) + "s: " +
                    std::to_string(report.created) + " created, " +
                    std::to_string(report.updated) + " updated, " +
                    std::to_string(report.unchanged) + " unchanged, " +
                    std::to_string(report.skipped) + " skipped, " +
                    std::to_string(report.parse_failures) + " unparseable, " +
                    std::to_string(report.failed) + " failed");
    return report;
}

} // namespace Armory
