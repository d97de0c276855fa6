#pragma once

#include <filesystem>
#include <string>
#include <unordered_set>

namespace Armory {

/**
 * @brief Append-only list of archive entries whose unit has been committed.
 *
 * One entry name per line. A restarted run skips listed entries; a run that
 * completes removes the file.
 */
class Checkpoint {
public:
    explicit Checkpoint(std::filesystem::path path);

    /// Read existing entries. A missing file is an empty checkpoint.
    void load();

    bool contains(const std::string& entry) const { return done_.count(entry) > 0; }

    /// Append and flush. Throws SetupError when the file cannot be written.
    void record(const std::string& entry);

    void remove();

    size_t size() const { return done_.size(); }

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
    std::unordered_set<std::string> done_;
};

} // namespace Armory
