/**
 * @file ingest_units.cpp
 * @brief Ingest a unit archive (zip or extracted directory) into PostgreSQL
 */

#include <catalog/alias_resolver.hpp>
#include <catalog/component_catalog.hpp>
#include <config/config.hpp>
#include <core/errors.hpp>
#include <database/postgres_connection.hpp>
#include <ingestion/equipment_cache.hpp>
#include <ingestion/ingest_run.hpp>
#include <ingestion/unit_ingestor.hpp>
#include <parsing/unit_source.hpp>
#include <storage/pg_unit_store.hpp>
#include <storage/reference_store.hpp>
#include <utils/logger.hpp>
#include <utils/text.hpp>
#include <iostream>
#include <optional>
#include <string>

using namespace Armory;

static void usage(const char* prog) {
    std::cerr << "Usage: " << prog << " <unit_files.zip|dir> [options]\n"
              << "\nOptions:\n"
              << "  --schema <file.sql>       Apply the schema script first\n"
              << "  --version <name>          Archive version recorded in dataset_metadata\n"
              << "  --max-errors <n>          Stop after n failed entries (0 = no limit)\n"
              << "  --limit <n>               Process at most n entries\n"
              << "  --checkpoint <file>       Resume file of committed entries\n"
              << "  --no-resume               Ignore and do not write a checkpoint\n";
}

static size_t size_arg(const std::string& flag, const char* value) {
    auto n = parse_int64(value);
    if (!n || *n < 0) throw SetupError(flag + " expects a non-negative number, got '" + value + "'");
    return static_cast<size_t>(*n);
}

int main(int argc, char** argv) {
    if (argc < 2) {
        usage(argv[0]);
        return 1;
    }

    std::string input = argv[1];
    std::optional<std::string> schema;
    std::string version = "unknown";
    IngestOptions options;
    bool resume = true;

    try {
        for (int i = 2; i < argc; ++i) {
            std::string arg = argv[i];
            bool has_value = i + 1 < argc;
            if (arg == "--schema" && has_value) schema = argv[++i];
            else if (arg == "--version" && has_value) version = argv[++i];
            else if (arg == "--max-errors" && has_value) options.max_errors = size_arg(arg, argv[++i]);
            else if (arg == "--limit" && has_value) options.limit = size_arg(arg, argv[++i]);
            else if (arg == "--checkpoint" && has_value) options.checkpoint = std::filesystem::path(argv[++i]);
            else if (arg == "--no-resume") resume = false;
            else {
                usage(argv[0]);
                return 1;
            }
        }

        std::string report_dir = report_dir_from_env();
        if (!resume) options.checkpoint.reset();
        else if (!options.checkpoint) options.checkpoint = std::filesystem::path(report_dir) / "ingest.checkpoint";

        // ─────────────────────────────────────────────────────────────────────
        // Reference data
        // ─────────────────────────────────────────────────────────────────────
        PostgresConnection db(DbConfig::load_from_env());
        ReferenceStore reference(db);
        if (schema) reference.apply_schema(*schema);
        const ComponentCatalog& catalog = ComponentCatalog::builtin();
        reference.seed(catalog);

        // ─────────────────────────────────────────────────────────────────────
        // Units
        // ─────────────────────────────────────────────────────────────────────
        Logger::step("Ingesting " + input);
        auto source = make_unit_source(input);
        PgUnitStore store(db);
        EquipmentCache cache;
        AliasResolver resolver(catalog);
        UnitIngestor ingestor(store, cache, resolver);
        IngestRun run(*source, ingestor, store);

        RunReport report = run.run(options);
        report.source = input;
        auto path = report.write(report_dir);
        Logger::info("Report written to " + path.string());

        if (report.completed && reference.record_dataset(version, "Unit archive " + input)) {
            Logger::info("Recorded dataset version " + version);
        }
        Logger::info("Equipment cache: " + std::to_string(cache.size()) + " entries, " +
                     std::to_string(cache.hits()) + " hits");
        if (!report.gaps.empty()) {
            Logger::warn(std::to_string(report.gaps.size()) + " component labels left unresolved");
        }
        return report.aborted ? 2 : 0;
    } catch (const std::exception& e) {
        Logger::error(e.what());
        return 1;
    }
}
