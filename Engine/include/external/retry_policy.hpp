#pragma once

#include <external/http_transport.hpp>
#include <chrono>
#include <optional>
#include <random>

namespace Armory {

/**
 * @brief Backoff schedule for transient catalog failures.
 *
 * Delay before retry n (0-based) is base * multiplier^n, scaled by a random
 * factor in [1 - jitter, 1 + jitter] and never more than max_delay. A 429 waits for Retry-After instead,
 * capped at retry_after_cap, or default_retry_after when the header is absent.
 */
struct RetryPolicy {
    int max_attempts = 4;
    std::chrono::milliseconds base_delay{2000};
    double multiplier = 2.5;
    double jitter = 0.3;
    std::chrono::milliseconds max_delay{300000};
    std::chrono::milliseconds retry_after_cap{60000};
    std::chrono::milliseconds default_retry_after{5000};

    /// 429, 5xx. Transport failures are transient too but never reach here.
    static bool is_transient(long status) { return status == 429 || status >= 500; }

    std::chrono::milliseconds backoff(int retry, std::mt19937& rng) const;

    std::chrono::milliseconds delay_for(const HttpResponse& response, int retry, std::mt19937& rng) const;
};

/// Delay spread uniformly over [d * (1 - fraction), d * (1 + fraction)].
std::chrono::milliseconds jittered(std::chrono::milliseconds d, double fraction, std::mt19937& rng);

/// Retry-After in delta-seconds form; HTTP-date values are ignored.
std::optional<std::chrono::seconds> parse_retry_after(const HttpResponse& response);

} // namespace Armory
