#pragma once

#include <export.hpp>
#include <model/unit_types.hpp>
#include <optional>
#include <string>
#include <string_view>

namespace Armory {

/**
 * @brief Category from keywords in the label. Ammunition is checked first,
 * anything unrecognized is plain equipment.
 */
ARMORY_API EquipmentCategory classify_equipment(std::string_view label);

/// "CL..." and "Clan ..." labels are Clan tech, everything else Inner Sphere.
ARMORY_API TechBase equipment_tech_base(std::string_view label);

/**
 * @brief Label of the weapon an ammunition label feeds.
 *
 * "IS Ammo AC/20" -> "AC/20", "Clan Ammo LRM-15" -> "LRM-15",
 * "SRM 6 Ammo" -> "SRM 6". nullopt for labels that are not ammunition.
 */
ARMORY_API std::optional<std::string> ammo_parent_label(std::string_view label);

} // namespace Armory
