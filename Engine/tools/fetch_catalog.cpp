/**
 * @file fetch_catalog.cpp
 * @brief Fetch external catalog listings and detail pages into the local cache
 */

#include <config/config.hpp>
#include <external/catalog_cache.hpp>
#include <external/catalog_client.hpp>
#include <external/curl_transport.hpp>
#include <utils/logger.hpp>
#include <utils/text.hpp>
#include <utils/time.hpp>
#include <nlohmann/json.hpp>
#include <iostream>
#include <string>
#include <vector>

using namespace Armory;

static void usage(const char* prog) {
    std::cerr << "Usage: " << prog << " [options]\n"
              << "\nOptions:\n"
              << "  --types <t1,t2,...>   Catalog unit type ids (default: 18)\n"
              << "  --listing-only        Skip detail pages\n"
              << "  --clear-failures      Forget recorded permanent failures\n"
              << "\nCache directory, base URL, delay and retries come from ARMORY_CACHE_DIR,\n"
              << "ARMORY_CATALOG_URL, ARMORY_CATALOG_DELAY_MS and ARMORY_CATALOG_MAX_ATTEMPTS.\n";
}

int main(int argc, char** argv) {
    std::vector<int> types = {18};
    bool listing_only = false;
    bool clear_failures = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--types" && i + 1 < argc) {
            types.clear();
            for (const auto& part : split(argv[++i], ',')) {
                auto t = parse_int(part);
                if (!t) {
                    usage(argv[0]);
                    return 1;
                }
                types.push_back(*t);
            }
        } else if (arg == "--listing-only") {
            listing_only = true;
        } else if (arg == "--clear-failures") {
            clear_failures = true;
        } else {
            usage(argv[0]);
            return 1;
        }
    }

    try {
        CatalogClientConfig config = CatalogClientConfig::load_from_env();
        CatalogCache cache(config.cache_dir);
        if (clear_failures) cache.clear_permanent_failures();

        CurlTransport transport(config.user_agent);
        CatalogClient client(CatalogClient::Options::from_config(config), transport, cache);

        // ─────────────────────────────────────────────────────────────────────
        // Listings
        // ─────────────────────────────────────────────────────────────────────
        std::vector<int> ids;
        nlohmann::json listing_counts = nlohmann::json::object();
        size_t failed_partitions = 0;
        for (int type : types) {
            Logger::step("Listing type " + std::to_string(type));
            ListingFetch listing = client.fetch_listing(type);
            listing_counts[std::to_string(type)] = listing.records.size();
            failed_partitions += listing.failed;
            for (const auto& rec : listing.records) ids.push_back(rec.external_id);
        }

        // ─────────────────────────────────────────────────────────────────────
        // Details
        // ─────────────────────────────────────────────────────────────────────
        DetailFetch details;
        if (!listing_only) {
            Logger::step("Fetching detail pages");
            details = client.fetch_details(ids);
        }

        cache.write_manifest({
            {"fetched_at", utc_timestamp()},
            {"base_url", config.base_url},
            {"types", types},
            {"listing_counts", listing_counts},
            {"failed_partitions", failed_partitions},
            {"detail_pages_fetched", details.fetched},
            {"detail_pages_cached", details.cached},
            {"detail_pages_permanent_failures", details.skipped_permanent + details.new_permanent},
            {"detail_pages_transient_failures", details.failed_transient},
            {"requests", client.requests()},
        });

        bool complete = failed_partitions == 0 && details.failed_transient == 0;
        if (complete) Logger::success("Catalog cache complete in " + config.cache_dir);
        else Logger::warn("Catalog cache incomplete; rerun to resume");
        return complete ? 0 : 2;
    } catch (const std::exception& e) {
        Logger::error(e.what());
        return 1;
    }
}
