/**
 * @file reference_data.hpp
 * @brief Seeded eras and factions, and the external catalog's names for them
 */

#pragma once

#include <export.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace Armory {

struct EraSeed {
    const char* slug;
    const char* name;
    int start_year;
    std::optional<int> end_year;  // open-ended for the current era
    const char* description;
};

struct FactionSeed {
    const char* slug;
    const char* name;
    const char* short_name;
    const char* faction_type;
    bool is_clan;
};

ARMORY_API const std::vector<EraSeed>& builtin_eras();
ARMORY_API const std::vector<FactionSeed>& builtin_factions();

/// External era display name -> local era slug. Several names share one era.
ARMORY_API std::optional<std::string> map_era(std::string_view external_name);

/// External faction display name -> local faction slug, when it is a seeded faction.
ARMORY_API std::optional<std::string> map_faction(std::string_view external_name);

/**
 * @brief Type recorded for a faction created from external data:
 * "clan", "periphery", "mercenary" or "other".
 */
ARMORY_API std::string infer_faction_type(std::string_view name);

} // namespace Armory
