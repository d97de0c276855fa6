/**
 * @file config.hpp
 * @brief Environment-driven configuration for the Armory tools
 */

#pragma once

#include <chrono>
#include <string>

namespace Armory {

/**
 * @brief PostgreSQL connection settings from the standard libpq variables.
 *
 * PGHOST, PGPORT, PGUSER, PGPASSWORD, PGDATABASE. PGDATABASE is required.
 */
struct DbConfig {
    std::string host = "localhost";
    std::string port = "5432";
    std::string user;
    std::string password;
    std::string dbname;

    static DbConfig load_from_env();

    std::string connection_string() const;
};

/**
 * @brief Settings for the external catalog fetch client.
 */
struct CatalogClientConfig {
    std::string base_url = "https://masterunitlist.azurewebsites.net";
    std::string user_agent = "armory-catalog-fetch/1.0";
    std::chrono::milliseconds request_delay{1000};
    std::chrono::seconds timeout{30};
    int max_attempts = 4;
    std::string cache_dir = "catalog-cache";

    /**
     * @brief Defaults overridden by ARMORY_CATALOG_URL, ARMORY_CATALOG_DELAY_MS,
     * ARMORY_CATALOG_TIMEOUT_S, ARMORY_CATALOG_MAX_ATTEMPTS, ARMORY_CACHE_DIR.
     */
    static CatalogClientConfig load_from_env();
};

/**
 * @brief Where run reports and the unmatched list are written (ARMORY_REPORT_DIR).
 */
std::string report_dir_from_env();

} // namespace Armory
