#include <external/retry_policy.hpp>
#include <utils/text.hpp>
#include <algorithm>
#include <cmath>

namespace Armory {

std::chrono::milliseconds jittered(std::chrono::milliseconds d, double fraction, std::mt19937& rng) {
    if (fraction <= 0.0 || d.count() <= 0) return d;
    std::uniform_real_distribution<double> dist(1.0 - fraction, 1.0 + fraction);
    return std::chrono::milliseconds(static_cast<long long>(std::llround(d.count() * dist(rng))));
}

std::optional<std::chrono::seconds> parse_retry_after(const HttpResponse& response) {
    auto it = response.headers.find("retry-after");
    if (it == response.headers.end()) return std::nullopt;
    auto secs = parse_int64(it->second);
    if (!secs || *secs < 0) return std::nullopt;
    return std::chrono::seconds(*secs);
}

std::chrono::milliseconds RetryPolicy::backoff(int retry, std::mt19937& rng) const {
    const double cap = static_cast<double>(max_delay.count());
    double scaled = std::min(static_cast<double>(base_delay.count()) * std::pow(multiplier, retry), cap);
    auto delay = jittered(std::chrono::milliseconds(static_cast<long long>(scaled)), jitter, rng);
    return std::min(delay, max_delay);
}

std::chrono::milliseconds RetryPolicy::delay_for(const HttpResponse& response, int retry,
                                                 std::mt19937& rng) const {
    if (response.status == 429) {
        auto after = parse_retry_after(response);
        if (!after) return default_retry_after;
        return std::min<std::chrono::milliseconds>(*after, retry_after_cap);
    }
    return backoff(retry, rng);
}

} // namespace Armory
