/**
 * @file catalog_client.cpp
 * @brief Retry, partitioning and resume for catalog fetches
 */

#include <external/catalog_client.hpp>
#include <core/errors.hpp>
#include <utils/logger.hpp>
#include <utils/text.hpp>
#include <algorithm>
#include <stdexcept>
#include <thread>

namespace Armory {

const std::vector<TonnagePartition>& tonnage_partitions() {
    static const std::vector<TonnagePartition> kPartitions = {
        {0, 25}, {26, 35}, {36, 45}, {46, 55}, {56, 65},
        {66, 75}, {76, 85}, {86, 100}, {101, 200}, {201, 999999},
    };
    return kPartitions;
}

CatalogClient::Options CatalogClient::Options::from_config(const CatalogClientConfig& config) {
    Options o;
    o.base_url = config.base_url;
    o.request_delay = config.request_delay;
    o.timeout = config.timeout;
    o.retry.max_attempts = config.max_attempts;
    return o;
}

CatalogClient::Sleeper CatalogClient::default_sleeper() {
    return [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
}

CatalogClient::CatalogClient(Options options, HttpTransport& transport, CatalogCache& cache, Sleeper sleeper)
    : options_(std::move(options)), transport_(transport), cache_(cache),
      sleep_(std::move(sleeper)), rng_(options_.seed) {
    while (ends_with(options_.base_url, "/")) options_.base_url.pop_back();
    if (options_.retry.max_attempts < 1) options_.retry.max_attempts = 1;
}

std::string CatalogClient::listing_url(int type_id, const TonnagePartition& p) const {
    return options_.base_url + "/Unit/QuickList?Types=" + std::to_string(type_id) +
           "&MinTons=" + std::to_string(p.min_tons) + "&MaxTons=" + std::to_string(p.max_tons);
}

std::string CatalogClient::detail_url(int external_id) const {
    return options_.base_url + "/Unit/Details/" + std::to_string(external_id);
}

void CatalogClient::courtesy_delay() {
    auto d = jittered(options_.request_delay, options_.delay_jitter, rng_);
    if (d.count() > 0) sleep_(d);
}

std::string CatalogClient::fetch_with_retry(const std::string& url) {
    const RetryPolicy& policy = options_.retry;
    long last_status = 0;
    std::string last_error;

    for (int attempt = 0; attempt < policy.max_attempts; ++attempt) {
        std::chrono::milliseconds wait{0};
        ++requests_;
        try {
            HttpResponse response = transport_.get(url, options_.timeout);
            if (response.ok()) return std::move(response.body);

            last_status = response.status;
            last_error = "HTTP " + std::to_string(response.status);
            if (!RetryPolicy::is_transient(response.status)) {
                throw FetchError("GET " + url + " failed: " + last_error, url, response.status, false);
            }
            wait = policy.delay_for(response, attempt, rng_);
        } catch (const TransportError& e) {
            last_status = 0;
            last_error = e.what();
            wait = policy.backoff(attempt, rng_);
        }

        if (attempt + 1 < policy.max_attempts) {
            Logger::warn("GET " + url + ": " + last_error + ", retrying in " +
                         std::to_string(wait.count()) + "ms (attempt " + std::to_string(attempt + 1) +
                         "/" + std::to_string(policy.max_attempts) + ")");
            sleep_(wait);
        }
    }

    throw FetchError("GET " + url + " failed after " + std::to_string(policy.max_attempts) +
                     " attempts: " + last_error, url, last_status, true);
}

ListingFetch CatalogClient::fetch_listing(int type_id) {
    ListingFetch result;

    for (const auto& p : tonnage_partitions()) {
        std::string label = "type " + std::to_string(type_id) + " " + std::to_string(p.min_tons) +
                            "-" + std::to_string(p.max_tons) + "t";
        std::optional<std::string> body = cache_.read_listing(type_id, p.min_tons, p.max_tons);
        bool from_cache = body.has_value();

        if (!from_cache) {
            try {
                body = fetch_with_retry(listing_url(type_id, p));
            } catch (const FetchError& e) {
                Logger::error("Listing " + label + ": " + e.what());
                ++result.failed;
                continue;
            }
            cache_.write_listing(type_id, p.min_tons, p.max_tons, *body);
        }

        try {
            auto records = parse_listing(*body);
            Logger::debug("Listing " + label + ": " + std::to_string(records.size()) + " units" +
                          (from_cache ? " (cached)" : ""));
            result.records.insert(result.records.end(), records.begin(), records.end());
            if (from_cache) ++result.cached;
            else ++result.fetched;
        } catch (const std::invalid_argument& e) {
            // An unusable body must not mark the partition done.
            Logger::error("Listing " + label + " unusable: " + e.what());
            cache_.remove_listing(type_id, p.min_tons, p.max_tons);
            ++result.failed;
        }

        if (!from_cache) courtesy_delay();
    }

    Logger::info("Listing type " + std::to_string(type_id) + ": " + std::to_string(result.records.size()) +
                 " units, " + std::to_string(result.fetched) + " partitions fetched, " +
                 std::to_string(result.cached) + " cached, " + std::to_string(result.failed) + " failed");
    return result;
}

DetailFetch CatalogClient::fetch_details(const std::vector<int>& ids) {
    std::vector<int> unique(ids);
    std::sort(unique.begin(), unique.end());
    unique.erase(std::unique(unique.begin(), unique.end()), unique.end());

    DetailFetch result;
    size_t done = 0;
    for (int id : unique) {
        ++done;
        if (cache_.has_detail(id)) {
            ++result.cached;
            continue;
        }
        if (cache_.is_permanent_failure(id)) {
            ++result.skipped_permanent;
            continue;
        }

        std::string url = detail_url(id);
        try {
            cache_.write_detail(id, fetch_with_retry(url));
            ++result.fetched;
        } catch (const FetchError& e) {
            if (e.transient()) {
                ++result.failed_transient;
                Logger::warn("Detail " + std::to_string(id) + " left for a later run: " + e.what());
            } else {
                ++result.new_permanent;
                cache_.record_permanent_failure(id, url, e.status());
                Logger::warn("Detail " + std::to_string(id) + " failed permanently: " + e.what());
            }
        }

        if (result.fetched > 0 && result.fetched % 100 == 0) {
            Logger::bulk(std::to_string(done) + "/" + std::to_string(unique.size()) + " detail pages");
        }
        courtesy_delay();
    }

    Logger::info("Details: " + std::to_string(result.fetched) + " fetched, " +
                 std::to_string(result.cached) + " cached, " +
                 std::to_string(result.skipped_permanent + result.new_permanent) + " permanent failures, " +
                 std::to_string(result.failed_transient) + " transient failures");
    return result;
}

} // namespace Armory
