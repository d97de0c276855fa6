/**
 * @file errors.hpp
 * @brief Exception hierarchy for the ingestion and reconciliation engine
 *
 * Setup failures abort a run. Everything else is caught at the per-unit or
 * per-record boundary and lands in the run report.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace Armory {

class ArmoryError : public std::runtime_error {
public:
    explicit ArmoryError(const std::string& msg) : std::runtime_error(msg) {}
};

/**
 * @brief Unreadable archive, unreachable database, bad configuration.
 */
class SetupError : public ArmoryError {
public:
    explicit SetupError(const std::string& msg) : ArmoryError(msg) {}
};

/**
 * @brief Inconsistent reference catalog content (conflicting alias, duplicate id).
 */
class CatalogError : public ArmoryError {
public:
    explicit CatalogError(const std::string& msg) : ArmoryError(msg) {}
};

/**
 * @brief Persistence failure scoped to one unit or one catalog record.
 */
class StoreError : public ArmoryError {
public:
    explicit StoreError(const std::string& msg) : ArmoryError(msg) {}
};

/**
 * @brief Transport-level failure (DNS, connect, timeout). Always transient.
 */
class TransportError : public ArmoryError {
public:
    explicit TransportError(const std::string& msg) : ArmoryError(msg) {}
};

/**
 * @brief A remote resource could not be fetched.
 */
class FetchError : public ArmoryError {
public:
    FetchError(const std::string& msg, std::string url, long status, bool transient)
        : ArmoryError(msg), url_(std::move(url)), status_(status), transient_(transient) {}

    const std::string& url() const { return url_; }

    /// HTTP status of the last attempt, 0 for transport failures.
    long status() const { return status_; }

    /// True when retries were exhausted; false for permanent (4xx) failures.
    bool transient() const { return transient_; }

private:
    std::string url_;
    long status_;
    bool transient_;
};

} // namespace Armory
