/**
 * @file unit_types.cpp
 * @brief Enum names, slug derivation and loadout merging
 */

#include <model/unit_types.hpp>
#include <utils/text.hpp>

namespace Armory {

const char* to_string(UnitType t) {
    switch (t) {
        case UnitType::Mek:     return "mek";
        case UnitType::Vehicle: return "vehicle";
        case UnitType::Fighter: return "fighter";
        case UnitType::Other:   return "other";
    }
    return "other";
}

const char* to_string(TechBase t) {
    switch (t) {
        case TechBase::InnerSphere: return "inner_sphere";
        case TechBase::Clan:        return "clan";
        case TechBase::Mixed:       return "mixed";
        case TechBase::Primitive:   return "primitive";
    }
    return "inner_sphere";
}

const char* to_string(RulesLevel r) {
    switch (r) {
        case RulesLevel::Introductory: return "introductory";
        case RulesLevel::Standard:     return "standard";
        case RulesLevel::Advanced:     return "advanced";
        case RulesLevel::Experimental: return "experimental";
        case RulesLevel::Unofficial:   return "unofficial";
    }
    return "standard";
}

const char* to_string(Location l) {
    switch (l) {
        case Location::Head:        return "head";
        case Location::CenterTorso: return "center_torso";
        case Location::LeftTorso:   return "left_torso";
        case Location::RightTorso:  return "right_torso";
        case Location::LeftArm:     return "left_arm";
        case Location::RightArm:    return "right_arm";
        case Location::LeftLeg:     return "left_leg";
        case Location::RightLeg:    return "right_leg";
        case Location::Front:       return "front";
        case Location::Rear:        return "rear";
        case Location::LeftSide:    return "left_side";
        case Location::RightSide:   return "right_side";
        case Location::Turret:      return "turret";
        case Location::Body:        return "body";
    }
    return "body";
}

const char* to_string(EquipmentCategory c) {
    switch (c) {
        case EquipmentCategory::EnergyWeapon:      return "energy_weapon";
        case EquipmentCategory::BallisticWeapon:   return "ballistic_weapon";
        case EquipmentCategory::MissileWeapon:     return "missile_weapon";
        case EquipmentCategory::PhysicalWeapon:    return "physical_weapon";
        case EquipmentCategory::Ammunition:        return "ammunition";
        case EquipmentCategory::Equipment:         return "equipment";
        case EquipmentCategory::Armor:             return "armor";
        case EquipmentCategory::Structure:         return "structure";
        case EquipmentCategory::Engine:            return "engine";
        case EquipmentCategory::Gyro:              return "gyro";
        case EquipmentCategory::Cockpit:           return "cockpit";
        case EquipmentCategory::Actuator:          return "actuator";
        case EquipmentCategory::HeatSink:          return "heat_sink";
        case EquipmentCategory::JumpJet:           return "jump_jet";
        case EquipmentCategory::TargetingComputer: return "targeting_computer";
    }
    return "equipment";
}

TechBase tech_base_from_text(std::string_view s) {
    std::string lower = to_lower(s);
    if (contains(lower, "clan") && !contains(lower, "inner")) return TechBase::Clan;
    if (contains(lower, "mixed")) return TechBase::Mixed;
    if (contains(lower, "primitive")) return TechBase::Primitive;
    return TechBase::InnerSphere;
}

RulesLevel rules_level_from_int(int n) {
    switch (n) {
        case 0: return RulesLevel::Introductory;
        case 1: return RulesLevel::Standard;
        case 2: return RulesLevel::Advanced;
        case 3: return RulesLevel::Experimental;
        case 4:
        case 5: return RulesLevel::Unofficial;
        default: return RulesLevel::Standard;
    }
}

RulesLevel rules_level_from_type(std::string_view s) {
    std::string lower = to_lower(s);
    if (contains(lower, "level 1")) return RulesLevel::Standard;
    if (contains(lower, "level 2")) return RulesLevel::Advanced;
    if (contains(lower, "level 3")) return RulesLevel::Experimental;
    if (contains(lower, "unofficial")) return RulesLevel::Unofficial;
    return RulesLevel::Standard;
}

std::string full_name(const ParsedUnit& unit) {
    if (unit.model.empty()) return unit.chassis;
    return unit.chassis + " " + unit.model;
}

std::string unit_slug(const ParsedUnit& unit) {
    return slugify(full_name(unit));
}

std::string chassis_slug(const ParsedUnit& unit) {
    return slugify(unit.chassis) + "-" + to_string(unit.unit_type);
}

std::vector<ParsedLoadoutEntry> merge_loadout(const std::vector<ParsedLoadoutEntry>& entries) {
    std::vector<ParsedLoadoutEntry> out;
    for (const auto& entry : entries) {
        bool merged = false;
        for (auto& existing : out) {
            if (existing.equipment == entry.equipment &&
                existing.location == entry.location &&
                existing.is_rear == entry.is_rear) {
                existing.quantity += entry.quantity;
                merged = true;
                break;
            }
        }
        if (!merged) out.push_back(entry);
    }
    return out;
}

} // namespace Armory
