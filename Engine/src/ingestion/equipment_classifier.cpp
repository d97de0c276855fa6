#include <ingestion/equipment_classifier.hpp>
#include <utils/text.hpp>
#include <initializer_list>

namespace Armory {

namespace {

bool any_of(const std::string& s, std::initializer_list<const char*> needles) {
    for (const char* n : needles) {
        if (contains(s, n)) return true;
    }
    return false;
}

} // namespace

EquipmentCategory classify_equipment(std::string_view label) {
    std::string lower = to_lower(label);

    if (contains(lower, "ammo")) return EquipmentCategory::Ammunition;
    if (contains(lower, "heat sink") || contains(lower, "heatsink")) return EquipmentCategory::HeatSink;
    if (contains(lower, "jump jet")) return EquipmentCategory::JumpJet;
    if (contains(lower, "targeting computer")) return EquipmentCategory::TargetingComputer;
    if (contains(lower, "actuator")) return EquipmentCategory::Actuator;
    if (contains(lower, "gyro")) return EquipmentCategory::Gyro;
    if (contains(lower, "cockpit")) return EquipmentCategory::Cockpit;
    if (any_of(lower, {"endo steel", "endo-steel", "structure"})) return EquipmentCategory::Structure;
    if (any_of(lower, {"ferro", "reactive armor", "stealth"})) return EquipmentCategory::Armor;
    if (contains(lower, "engine")) return EquipmentCategory::Engine;
    if (any_of(lower, {"laser", "ppc", "flamer", "plasma rifle"})) return EquipmentCategory::EnergyWeapon;
    if (any_of(lower, {"lrm", "srm", "streak", "narc", "mml", "atm", "rocket", "arrow iv",
                       "thunderbolt", "anti-missile"})) {
        return EquipmentCategory::MissileWeapon;
    }
    if (lower == "ams" || ends_with(lower, " ams") || starts_with(lower, "isams") ||
        starts_with(lower, "clams")) {
        return EquipmentCategory::MissileWeapon;
    }
    if (any_of(lower, {"autocannon", "ac/", "gauss", "rifle", "lbx", "lb ", "ultra", "rotary",
                       "hag", "machine gun"})) {
        return EquipmentCategory::BallisticWeapon;
    }
    if (any_of(lower, {"hatchet", "sword", "claw", "mace", "talon", "lance", "retractable blade"})) {
        return EquipmentCategory::PhysicalWeapon;
    }
    return EquipmentCategory::Equipment;
}

TechBase equipment_tech_base(std::string_view label) {
    if (starts_with(label, "CL") || istarts_with(label, "clan")) return TechBase::Clan;
    return TechBase::InnerSphere;
}

std::optional<std::string> ammo_parent_label(std::string_view label) {
    if (classify_equipment(label) != EquipmentCategory::Ammunition) return std::nullopt;

    std::string s = trim(label);
    for (const char* prefix : {"IS Ammo ", "Clan Ammo ", "CL Ammo ", "Ammo "}) {
        if (istarts_with(s, prefix)) {
            s = trim(std::string_view(s).substr(std::string_view(prefix).size()));
            break;
        }
    }

    std::string lower = to_lower(s);
    if (ends_with(lower, " ammo")) {
        s = trim(std::string_view(s).substr(0, s.size() - 5));
    }

    // "(Clan)" style markers and "- Half" style suffixes name the bin, not the weapon.
    size_t dash = s.find(" - ");
    if (dash != std::string::npos) s = trim(std::string_view(s).substr(0, dash));

    if (s.empty() || contains(to_lower(s), "ammo")) return std::nullopt;
    return s;
}

} // namespace Armory
