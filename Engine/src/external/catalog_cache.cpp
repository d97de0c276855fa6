#include <external/catalog_cache.hpp>
#include <core/errors.hpp>
#include <utils/files.hpp>
#include <utils/logger.hpp>
#include <utils/text.hpp>
#include <utils/time.hpp>
#include <algorithm>

namespace fs = std::filesystem;

namespace Armory {

CatalogCache::CatalogCache(fs::path root) : root_(std::move(root)) {}

fs::path CatalogCache::listing_path(int type_id, int min_tons, int max_tons) const {
    return root_ / ("listing-" + std::to_string(type_id) + "-" + std::to_string(min_tons) + "-" +
                    std::to_string(max_tons) + ".json");
}

fs::path CatalogCache::detail_path(int external_id) const {
    return root_ / "details" / (std::to_string(external_id) + ".html");
}

bool CatalogCache::has_listing(int type_id, int min_tons, int max_tons) const {
    std::error_code ec;
    return fs::is_regular_file(listing_path(type_id, min_tons, max_tons), ec);
}

std::optional<std::string> CatalogCache::read_listing(int type_id, int min_tons, int max_tons) const {
    return read_file(listing_path(type_id, min_tons, max_tons));
}

void CatalogCache::write_listing(int type_id, int min_tons, int max_tons, const std::string& body) {
    write_file_atomic(listing_path(type_id, min_tons, max_tons), body);
}

void CatalogCache::remove_listing(int type_id, int min_tons, int max_tons) {
    std::error_code ec;
    fs::remove(listing_path(type_id, min_tons, max_tons), ec);
}

std::vector<fs::path> CatalogCache::listing_files() const {
    std::vector<fs::path> files;
    std::error_code ec;
    if (!fs::is_directory(root_, ec)) return files;
    for (const auto& entry : fs::directory_iterator(root_, ec)) {
        std::string name = entry.path().filename().string();
        if (entry.is_regular_file() && starts_with(name, "listing-") && ends_with(name, ".json")) {
            files.push_back(entry.path());
        }
    }
    std::sort(files.begin(), files.end());
    return files;
}

bool CatalogCache::has_detail(int external_id) const {
    std::error_code ec;
    return fs::is_regular_file(detail_path(external_id), ec);
}

std::optional<std::string> CatalogCache::read_detail(int external_id) const {
    return read_file(detail_path(external_id));
}

void CatalogCache::write_detail(int external_id, const std::string& html) {
    write_file_atomic(detail_path(external_id), html);
}

const std::map<int, PermanentFailure>& CatalogCache::permanent_failures() {
    if (failures_) return *failures_;
    failures_.emplace();

    auto content = read_file(root_ / "permanent_failures.json");
    if (!content) return *failures_;

    auto doc = nlohmann::json::parse(*content, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        throw SetupError("Corrupt failure ledger " + (root_ / "permanent_failures.json").string());
    }
    for (auto it = doc.begin(); it != doc.end(); ++it) {
        auto id = parse_int(it.key());
        if (!id) continue;
        PermanentFailure f;
        f.url = it->value("url", "");
        f.status = it->value("status", 0L);
        f.recorded_at = it->value("recorded_at", "");
        (*failures_)[*id] = f;
    }
    return *failures_;
}

bool CatalogCache::is_permanent_failure(int external_id) {
    return permanent_failures().count(external_id) > 0;
}

void CatalogCache::record_permanent_failure(int external_id, const std::string& url, long status) {
    permanent_failures();
    (*failures_)[external_id] = {url, status, utc_timestamp()};
    save_failures();
}

void CatalogCache::clear_permanent_failures() {
    failures_.emplace();
    std::error_code ec;
    fs::remove(root_ / "permanent_failures.json", ec);
}

void CatalogCache::save_failures() {
    nlohmann::json doc = nlohmann::json::object();
    for (const auto& [id, f] : *failures_) {
        doc[std::to_string(id)] = {{"url", f.url}, {"status", f.status}, {"recorded_at", f.recorded_at}};
    }
    write_file_atomic(root_ / "permanent_failures.json", doc.dump(2) + "\n");
}

void CatalogCache::write_manifest(const nlohmann::json& manifest) {
    write_file_atomic(root_ / "manifest.json", manifest.dump(2) + "\n");
}

std::optional<nlohmann::json> CatalogCache::read_manifest() const {
    auto content = read_file(root_ / "manifest.json");
    if (!content) return std::nullopt;
    auto doc = nlohmann::json::parse(*content, nullptr, false);
    if (doc.is_discarded()) return std::nullopt;
    return doc;
}

} // namespace Armory
