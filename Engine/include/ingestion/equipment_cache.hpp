#pragma once

#include <utils/text.hpp>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace Armory {

/**
 * @brief Per-run identity cache for equipment rows.
 *
 * Keyed by key(label), which is exactly the value stored in the UNIQUE
 * equipment.slug column, so two spellings that share a row share an entry.
 * Owned by one ingestion run and passed by reference; no state outlives it.
 */
class EquipmentCache {
public:
    EquipmentCache() = default;

    EquipmentCache(const EquipmentCache&) = delete;
    EquipmentCache& operator=(const EquipmentCache&) = delete;

    static std::string key(std::string_view label) { return slugify(label); }

    std::optional<int64_t> find(std::string_view label) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = ids_.find(key(label));
        if (it == ids_.end()) return std::nullopt;
        return it->second;
    }

    /**
     * @brief Cached id for the label, or the id returned by create().
     *
     * The lock is held across create() so one label is never created twice.
     * Keys added by this call are appended to inserted (when given) so the
     * caller can evict them if its transaction rolls back.
     */
    int64_t get_or_create(std::string_view label, const std::function<int64_t()>& create,
                          std::vector<std::string>* inserted = nullptr) {
        std::string k = key(label);
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = ids_.find(k);
        if (it != ids_.end()) {
            ++hits_;
            return it->second;
        }

        int64_t id = create();
        ids_.emplace(k, id);
        ++misses_;
        if (inserted) inserted->push_back(std::move(k));
        return id;
    }

    /// Drop ids whose rows were never committed.
    void evict(const std::vector<std::string>& keys) {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& k : keys) ids_.erase(k);
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return ids_.size();
    }

    size_t hits() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return hits_;
    }

    size_t misses() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return misses_;
    }

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, int64_t> ids_;
    size_t hits_ = 0;
    size_t misses_ = 0;
};

} // namespace Armory
