/**
 * @file mtf_parser.hpp
 * @brief Parser for the line-oriented key:value mech format
 */

#pragma once

#include <export.hpp>
#include <model/unit_types.hpp>
#include <optional>
#include <string_view>

namespace Armory {

/**
 * @brief Parse one mech definition.
 *
 * Recognized keys are matched case-insensitively. Location headers
 * ("Left Arm:") open a critical-slot section, "Weapons:N" opens the weapon
 * list. Inline annotations are decoded: "300 XL Engine(IS)" gives rating and
 * label, "20 Double" gives heat sink count and type, a trailing "(R)" marks a
 * rear-facing mount.
 *
 * @return The parsed unit with mech_data set, or nullopt when the chassis
 *         name or the mass is missing or unreadable.
 */
ARMORY_API std::optional<ParsedUnit> parse_mtf(std::string_view content);

} // namespace Armory
