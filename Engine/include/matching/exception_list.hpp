/**
 * @file exception_list.hpp
 * @brief Durable list of catalog records that found no unit
 */

#pragma once

#include <matching/matcher.hpp>
#include <filesystem>
#include <set>
#include <string>
#include <vector>

namespace Armory {

/**
 * @brief CSV with header external_id,candidate_name,computed_slug,tonnage,reason.
 *
 * Operators curate it by adding overrides; entries stay listed until a run
 * with retry re-processes them.
 */
class ExceptionList {
public:
    explicit ExceptionList(std::filesystem::path path);

    /// Rows already on disk; a missing file is an empty list.
    std::vector<Unmatched> load() const;

    std::set<int> external_ids() const;

    /// Add rows for ids not yet listed. Returns how many were added.
    size_t append(const std::vector<Unmatched>& entries);

    /// Replace the whole list.
    void rewrite(const std::vector<Unmatched>& entries);

    /**
     * @brief Drop rows whose id is in resolved, replace rows for ids that were
     * reported again, add the rest. Rows this run never saw are kept.
     */
    void reconcile(const std::set<int>& resolved, const std::vector<Unmatched>& entries);

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

std::string csv_escape(const std::string& field);

/// Split one CSV line honoring double-quoted fields.
std::vector<std::string> csv_split(const std::string& line);

} // namespace Armory
