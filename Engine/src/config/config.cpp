/**
 * @file config.cpp
 * @brief Environment-driven configuration
 */

#include <config/config.hpp>
#include <core/errors.hpp>
#include <utils/text.hpp>
#include <cstdlib>
#include <sstream>

namespace Armory {

static const char* env(const char* name) {
    const char* v = std::getenv(name);
    return (v && *v) ? v : nullptr;
}

static int env_int(const char* name, int fallback) {
    const char* v = env(name);
    if (!v) return fallback;
    auto parsed = parse_int(v);
    if (!parsed || *parsed < 0) {
        throw SetupError(std::string(name) + " must be a non-negative integer, got '" + v + "'");
    }
    return *parsed;
}

DbConfig DbConfig::load_from_env() {
    DbConfig config;

    if (const char* v = env("PGHOST")) config.host = v;
    if (const char* v = env("PGPORT")) config.port = v;
    if (const char* v = env("PGUSER")) config.user = v;
    else if (const char* u = env("USER")) config.user = u;
    if (const char* v = env("PGPASSWORD")) config.password = v;

    if (const char* v = env("PGDATABASE")) config.dbname = v;
    else throw SetupError("PGDATABASE environment variable is not set");

    return config;
}

std::string DbConfig::connection_string() const {
    std::ostringstream conninfo;
    conninfo << "host=" << host << " port=" << port << " dbname=" << dbname;
    if (!user.empty()) conninfo << " user=" << user;
    if (!password.empty()) conninfo << " password=" << password;
    return conninfo.str();
}

CatalogClientConfig CatalogClientConfig::load_from_env() {
    CatalogClientConfig config;

    if (const char* v = env("ARMORY_CATALOG_URL")) config.base_url = v;
    while (!config.base_url.empty() && config.base_url.back() == '/') config.base_url.pop_back();

    config.request_delay = std::chrono::milliseconds(env_int("ARMORY_CATALOG_DELAY_MS",
        static_cast<int>(config.request_delay.count())));
    config.timeout = std::chrono::seconds(env_int("ARMORY_CATALOG_TIMEOUT_S",
        static_cast<int>(config.timeout.count())));
    config.max_attempts = env_int("ARMORY_CATALOG_MAX_ATTEMPTS", config.max_attempts);
    if (const char* v = env("ARMORY_CACHE_DIR")) config.cache_dir = v;

    if (config.timeout.count() == 0) {
        throw SetupError("ARMORY_CATALOG_TIMEOUT_S must be greater than zero");
    }
    if (config.max_attempts < 1) {
        throw SetupError("ARMORY_CATALOG_MAX_ATTEMPTS must be at least 1");
    }
    return config;
}

std::string report_dir_from_env() {
    const char* v = env("ARMORY_REPORT_DIR");
    return v ? v : "reports";
}

} // namespace Armory
