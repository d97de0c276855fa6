/**
 * @file unit_index.hpp
 * @brief Lookup keys over the persisted units for cross-source matching
 */

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace Armory {

struct IndexedUnit {
    int64_t id = 0;
    std::string slug;
    std::string full_name;
};

/// Result of a key lookup. A key shared by several units is ambiguous and yields no unit.
struct KeyLookup {
    const IndexedUnit* unit = nullptr;
    bool ambiguous = false;

    explicit operator bool() const { return unit != nullptr; }
};

/**
 * @brief Three indexes over one unit list: exact slug, compact slug
 * (alphanumerics only) and case-folded full name.
 */
class UnitIndex {
public:
    UnitIndex() = default;
    explicit UnitIndex(std::vector<IndexedUnit> units);

    void add(IndexedUnit unit);

    const IndexedUnit* by_slug(std::string_view slug) const;
    KeyLookup by_compact(std::string_view key) const;
    KeyLookup by_name(std::string_view lowered_name) const;

    size_t size() const { return units_.size(); }

    /// Lowercased, whitespace-collapsed full name.
    static std::string name_key(std::string_view name);

private:
    std::vector<IndexedUnit> units_;
    std::unordered_map<std::string, size_t> slugs_;
    std::unordered_map<std::string, std::vector<size_t>> compact_;
    std::unordered_map<std::string, std::vector<size_t>> names_;

    KeyLookup lookup(const std::unordered_map<std::string, std::vector<size_t>>& map,
                     std::string_view key) const;
};

} // namespace Armory
