/**
 * @file catalog_client.hpp
 * @brief Resilient, resumable fetch of the external unit catalog
 */

#pragma once

#include <config/config.hpp>
#include <export.hpp>
#include <external/catalog_cache.hpp>
#include <external/catalog_records.hpp>
#include <external/http_transport.hpp>
#include <external/retry_policy.hpp>
#include <chrono>
#include <functional>
#include <random>
#include <string>
#include <vector>

namespace Armory {

struct TonnagePartition {
    int min_tons;
    int max_tons;
};

/// The fixed listing partitions; each keeps a response under the upstream size limit.
ARMORY_API const std::vector<TonnagePartition>& tonnage_partitions();

struct ListingFetch {
    std::vector<CatalogRecord> records;
    size_t fetched = 0;
    size_t cached = 0;
    size_t failed = 0;
};

struct DetailFetch {
    size_t fetched = 0;
    size_t cached = 0;
    size_t skipped_permanent = 0;
    size_t new_permanent = 0;
    size_t failed_transient = 0;
};

/**
 * @brief Fetches listing partitions and detail pages into a CatalogCache.
 *
 * Every response is written to the cache before it is parsed, and anything
 * already cached is not requested again, so an interrupted run picks up at
 * the first missing file. Requests are separated by a courtesy delay.
 */
class ARMORY_API CatalogClient {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    struct Options {
        std::string base_url;
        std::chrono::milliseconds request_delay{1000};
        double delay_jitter = 0.3;
        std::chrono::seconds timeout{30};
        RetryPolicy retry;
        unsigned seed = std::random_device{}();

        static Options from_config(const CatalogClientConfig& config);
    };

    CatalogClient(Options options, HttpTransport& transport, CatalogCache& cache,
                  Sleeper sleeper = default_sleeper());

    /**
     * @brief GET with retries. Throws FetchError: transient() when retries ran
     * out on 429/5xx/transport errors, !transient() for any other status.
     */
    std::string fetch_with_retry(const std::string& url);

    /// All partitions for one unit type; partitions already in the cache are read, not fetched.
    ListingFetch fetch_listing(int type_id);

    /**
     * @brief Detail pages for the given ids. Cached pages and ids in the
     * permanent-failure ledger are skipped; new 4xx failures are added to it.
     */
    DetailFetch fetch_details(const std::vector<int>& ids);

    std::string listing_url(int type_id, const TonnagePartition& p) const;
    std::string detail_url(int external_id) const;

    size_t requests() const { return requests_; }

    static Sleeper default_sleeper();

private:
    Options options_;
    HttpTransport& transport_;
    CatalogCache& cache_;
    Sleeper sleep_;
    std::mt19937 rng_;
    size_t requests_ = 0;

    void courtesy_delay();
};

} // namespace Armory
