/**
 * @file catalog_cache.hpp
 * @brief Local durable store of raw external catalog responses
 */

#pragma once

#include <nlohmann/json.hpp>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace Armory {

struct PermanentFailure {
    std::string url;
    long status = 0;
    std::string recorded_at;
};

/**
 * @brief File layout under one root directory:
 *
 *   listing-<type>-<min>-<max>.json   one listing partition
 *   details/<id>.html                 one detail page
 *   permanent_failures.json           ids not to be fetched again
 *   manifest.json                     summary of the last fetch run
 *
 * Every write goes through a temp file and rename, so a file that exists is
 * complete.
 */
class CatalogCache {
public:
    explicit CatalogCache(std::filesystem::path root);

    const std::filesystem::path& root() const { return root_; }

    std::filesystem::path listing_path(int type_id, int min_tons, int max_tons) const;
    std::filesystem::path detail_path(int external_id) const;

    bool has_listing(int type_id, int min_tons, int max_tons) const;
    std::optional<std::string> read_listing(int type_id, int min_tons, int max_tons) const;
    void write_listing(int type_id, int min_tons, int max_tons, const std::string& body);
    void remove_listing(int type_id, int min_tons, int max_tons);

    /// All cached listing partitions in name order.
    std::vector<std::filesystem::path> listing_files() const;

    bool has_detail(int external_id) const;
    std::optional<std::string> read_detail(int external_id) const;
    void write_detail(int external_id, const std::string& html);

    /// Loaded lazily from permanent_failures.json.
    const std::map<int, PermanentFailure>& permanent_failures();
    bool is_permanent_failure(int external_id);
    void record_permanent_failure(int external_id, const std::string& url, long status);
    void clear_permanent_failures();

    void write_manifest(const nlohmann::json& manifest);
    std::optional<nlohmann::json> read_manifest() const;

private:
    std::filesystem::path root_;
    std::optional<std::map<int, PermanentFailure>> failures_;

    void save_failures();
};

} // namespace Armory
