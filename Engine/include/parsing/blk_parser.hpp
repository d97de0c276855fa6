/**
 * @file blk_parser.hpp
 * @brief Parser for the nested tag-delimited unit format (vehicles, fighters, others)
 */

#pragma once

#include <export.hpp>
#include <model/unit_types.hpp>
#include <optional>
#include <string_view>

namespace Armory {

/**
 * @brief Parse one tag-delimited unit block.
 *
 * Tags open on a line of their own ("<Name>") or inline ("<Name>Atlas</Name>").
 * Tag names are matched case-insensitively. "<X Equipment>" blocks list one
 * mount per line for location X.
 *
 * @param default_type Category used when the UnitType tag is missing or
 *        not recognized, usually taken from the entry's directory.
 * @return The parsed unit (no mech_data), or nullopt when Name or a numeric
 *         tonnage is missing.
 */
ARMORY_API std::optional<ParsedUnit> parse_blk(std::string_view content, UnitType default_type);

} // namespace Armory
