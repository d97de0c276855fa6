/**
 * @file match_catalog.cpp
 * @brief Match cached catalog records to ingested units and merge them
 */

#include <config/config.hpp>
#include <core/errors.hpp>
#include <database/postgres_connection.hpp>
#include <external/catalog_cache.hpp>
#include <external/catalog_records.hpp>
#include <matching/catalog_merger.hpp>
#include <matching/exception_list.hpp>
#include <matching/matcher.hpp>
#include <matching/pg_merge_store.hpp>
#include <utils/files.hpp>
#include <utils/logger.hpp>
#include <iostream>
#include <stdexcept>
#include <string>

using namespace Armory;

static void usage(const char* prog) {
    std::cerr << "Usage: " << prog << " [options]\n"
              << "\nOptions:\n"
              << "  --overrides <file.json>   {\"<external id>\": \"<unit slug>\"}\n"
              << "  --manual                  Record merged fields with manual provenance\n"
              << "  --force                   Overwrite fields owned by higher-priority sources\n"
              << "  --retry-unmatched         Re-process records on the unmatched list\n"
              << "  --skip-availability       Do not read detail pages\n";
}

int main(int argc, char** argv) {
    MergeOptions options;
    std::string overrides_path;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--overrides" && i + 1 < argc) overrides_path = argv[++i];
        else if (arg == "--manual") options.source = kSourceManual;
        else if (arg == "--force") options.force = true;
        else if (arg == "--retry-unmatched") options.retry_unmatched = true;
        else if (arg == "--skip-availability") options.skip_availability = true;
        else {
            usage(argv[0]);
            return 1;
        }
    }

    try {
        CatalogClientConfig config = CatalogClientConfig::load_from_env();
        CatalogCache cache(config.cache_dir);
        std::string report_dir = report_dir_from_env();

        if (!overrides_path.empty()) {
            auto text = read_file(overrides_path);
            if (!text) throw SetupError("Cannot read overrides " + overrides_path);
            options.overrides = parse_overrides(*text);
            Logger::info("Loaded " + std::to_string(options.overrides.size()) + " overrides");
        }

        // ─────────────────────────────────────────────────────────────────────
        // Records from cached listing partitions
        // ─────────────────────────────────────────────────────────────────────
        std::vector<CatalogRecord> records;
        auto files = cache.listing_files();
        if (files.empty()) throw SetupError("No cached listings in " + config.cache_dir);
        for (const auto& file : files) {
            auto body = read_file(file);
            if (!body) throw SetupError("Cannot read " + file.string());
            try {
                auto part = parse_listing(*body);
                records.insert(records.end(), part.begin(), part.end());
            } catch (const std::invalid_argument& e) {
                Logger::warn(file.string() + ": " + e.what());
            }
        }

        options.detail_loader = [&cache](int id) { return cache.read_detail(id); };

        // ─────────────────────────────────────────────────────────────────────
        // Match and merge
        // ─────────────────────────────────────────────────────────────────────
        PostgresConnection db(DbConfig::load_from_env());
        PgMergeStore store(db);
        ExceptionList exceptions(std::filesystem::path(report_dir) / "unmatched.csv");
        CatalogMerger merger(store, exceptions);

        MatchSummary summary = merger.run(records, options);
        auto path = summary.write(report_dir);
        Logger::info("Report written to " + path.string());
        Logger::info("Unmatched list: " + exceptions.path().string());
        return 0;
    } catch (const std::exception& e) {
        Logger::error(e.what());
        return 1;
    }
}
