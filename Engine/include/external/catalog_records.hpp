/**
 * @file catalog_records.hpp
 * @brief Decoding of external catalog listing JSON and detail HTML
 */

#pragma once

#include <export.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace Armory {

struct CatalogRecord {
    int external_id = 0;
    std::string name;
    std::optional<std::string> class_name;
    std::optional<std::string> variant;
    double tonnage = 0.0;
    std::optional<int> battle_value;  // absent when the listing says 0
    std::optional<int64_t> cost;      // absent when the listing says 0
    std::optional<std::string> rules;
    std::optional<std::string> role;
    std::optional<int> intro_year;
    std::optional<std::string> technology;
    std::optional<std::string> unit_type;
};

/// Listed availability: the unit is available to the faction in the era.
struct AvailabilityNote {
    std::string era_name;
    std::string faction_name;
};

/**
 * @brief Records of a listing response: {"Units": [...]} or a bare array.
 *
 * Throws std::invalid_argument for a body that is not JSON or has neither
 * shape. Entries without an id or name are skipped.
 */
ARMORY_API std::vector<CatalogRecord> parse_listing(std::string_view json_text);

/// First run of four digits in an introduction date ("~3050", "3067-01-01").
ARMORY_API std::optional<int> intro_year_from_date(std::string_view date);

/**
 * @brief Era/faction pairs from a detail page.
 *
 * Each era is a "panel panel-default" block whose heading link names the era
 * (a trailing "(2571 - 2780)" range is dropped); each faction is the first
 * link of a table row in that panel's body.
 */
ARMORY_API std::vector<AvailabilityNote> parse_availability(std::string_view html);

/**
 * @brief Name carried in parentheses when text follows it:
 * "Dasher (Fire Moth) A" -> "Fire Moth A". nullopt otherwise.
 */
ARMORY_API std::optional<std::string> extract_alternate_name(std::string_view name);

} // namespace Armory
