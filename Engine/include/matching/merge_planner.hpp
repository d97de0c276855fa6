/**
 * @file merge_planner.hpp
 * @brief Per-field write/keep decisions under source priority
 */

#pragma once

#include <export.hpp>
#include <external/catalog_records.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace Armory {

/// Provenance labels and their rank: archive < catalog < manual.
constexpr const char* kSourceArchive = "archive";
constexpr const char* kSourceCatalog = "catalog";
constexpr const char* kSourceManual = "manual";

/// 10, 20, 30 for the known sources; 0 for none or an unknown label.
ARMORY_API int source_priority(const std::optional<std::string>& source);

template <typename T>
struct SourcedField {
    std::optional<T> value;
    std::optional<std::string> source;
};

/// The unit columns the catalog can write, with their provenance.
struct UnitCatalogFields {
    SourcedField<int> battle_value;
    SourcedField<int64_t> cost;
    SourcedField<std::string> role;
    SourcedField<std::string> alternate_name;
    SourcedField<int> external_id;
    SourcedField<int> intro_year;
};

/**
 * @brief Columns to write. Unset members are kept as stored.
 */
struct MergePlan {
    std::optional<int> battle_value;
    std::optional<int64_t> cost;
    std::optional<std::string> role;
    std::optional<std::string> alternate_name;
    std::optional<int> external_id;
    std::optional<int> intro_year;

    size_t field_count() const;
    bool empty() const { return field_count() == 0; }
};

/**
 * @brief Write when an incoming value exists and either force is set, the
 * stored value is empty, or the stored provenance does not outrank the
 * incoming one. Writes that would change neither value nor provenance are
 * dropped.
 */
template <typename T>
bool should_write(const SourcedField<T>& current, const std::optional<T>& incoming,
                  int incoming_priority, const std::string& incoming_source, bool force) {
    if (!incoming) return false;
    if (current.value == incoming && current.source == incoming_source) return false;
    if (force || !current.value) return true;
    return source_priority(current.source) <= incoming_priority;
}

/// Pure: decide each field from the stored state, the record and the source label.
ARMORY_API MergePlan plan_merge(const UnitCatalogFields& current, const CatalogRecord& record,
                                const std::string& source, bool force);

} // namespace Armory
