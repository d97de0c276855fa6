/**
 * @file unit_types.hpp
 * @brief Parsed unit records shared by both archive formats
 */

#pragma once

#include <export.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace Armory {

enum class UnitType {
    Mek,
    Vehicle,
    Fighter,
    Other
};

enum class TechBase {
    InnerSphere,
    Clan,
    Mixed,
    Primitive
};

enum class RulesLevel {
    Introductory,
    Standard,
    Advanced,
    Experimental,
    Unofficial
};

/// Values of the location_name enum in the schema.
enum class Location {
    Head,
    CenterTorso,
    LeftTorso,
    RightTorso,
    LeftArm,
    RightArm,
    LeftLeg,
    RightLeg,
    Front,
    Rear,
    LeftSide,
    RightSide,
    Turret,
    Body
};

/// Values of the equipment_category enum in the schema.
enum class EquipmentCategory {
    EnergyWeapon,
    BallisticWeapon,
    MissileWeapon,
    PhysicalWeapon,
    Ammunition,
    Equipment,
    Armor,
    Structure,
    Engine,
    Gyro,
    Cockpit,
    Actuator,
    HeatSink,
    JumpJet,
    TargetingComputer
};

const char* to_string(UnitType t);
const char* to_string(TechBase t);
const char* to_string(RulesLevel r);
const char* to_string(Location l);
const char* to_string(EquipmentCategory c);

/**
 * @brief "Clan" without "Inner" is clan; "Mixed" and "Primitive" are matched
 * by substring; anything else is Inner Sphere.
 */
TechBase tech_base_from_text(std::string_view s);

/// Numeric rules level 0..5 as used by the line-oriented format.
RulesLevel rules_level_from_int(int n);

/// "IS Level 2", "Clan Level 3", "Unofficial" as used by the tag format.
RulesLevel rules_level_from_type(std::string_view s);

struct ParsedLocation {
    Location location;
    std::optional<int> armor;
    std::optional<int> rear_armor;
    std::optional<int> structure;
};

struct ParsedLoadoutEntry {
    std::string equipment;
    std::optional<Location> location;
    int quantity = 1;
    bool is_rear = false;
};

/**
 * @brief Construction attributes as received. Labels are kept verbatim.
 */
struct ParsedMechData {
    std::string config;
    bool is_omnimech = false;
    std::optional<int> engine_rating;
    std::optional<int> walk_mp;
    std::optional<int> jump_mp;
    std::optional<int> heat_sink_count;
    std::optional<std::string> engine_type;
    std::optional<std::string> armor_type;
    std::optional<std::string> structure_type;
    std::optional<std::string> heat_sink_type;
    std::optional<std::string> gyro_type;
    std::optional<std::string> cockpit_type;
    std::optional<std::string> myomer_type;
};

struct ParsedUnit {
    std::string chassis;
    std::string model;
    std::optional<int> mul_id;
    UnitType unit_type = UnitType::Other;
    TechBase tech_base = TechBase::InnerSphere;
    RulesLevel rules_level = RulesLevel::Standard;
    std::optional<int> intro_year;
    std::optional<std::string> source;
    double tonnage = 0.0;
    std::vector<ParsedLocation> locations;
    std::vector<ParsedLoadoutEntry> loadout;
    std::vector<std::string> quirks;
    std::optional<std::string> description;
    std::optional<ParsedMechData> mech_data;
};

/// "Atlas AS7-D", or the chassis alone when the model is empty.
ARMORY_API std::string full_name(const ParsedUnit& unit);

/// slugify(full_name(unit))
ARMORY_API std::string unit_slug(const ParsedUnit& unit);

/// slugify(chassis) + "-" + unit type, so equal names in different categories stay distinct.
/// The suffix is to_string(UnitType): "demolisher-vehicle", "demolisher-mek" (not "-mech").
ARMORY_API std::string chassis_slug(const ParsedUnit& unit);

/**
 * @brief Merge entries with the same (equipment, location, rear) key, summing
 * quantities and keeping first-appearance order.
 */
std::vector<ParsedLoadoutEntry> merge_loadout(const std::vector<ParsedLoadoutEntry>& entries);

} // namespace Armory
