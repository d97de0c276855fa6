/**
 * @file mtf_parser.cpp
 * @brief Line-oriented mech format parser
 */

#include <parsing/mtf_parser.hpp>
#include <utils/text.hpp>
#include <array>
#include <map>
#include <set>
#include <utility>

namespace Armory {

namespace {

enum class Section { None, Weapons, Slots };

struct ArmorValues {
    std::optional<int> front;
    std::optional<int> rear;
};

// Section headers and weapon-line locations, both full names and codes.
std::optional<Location> mtf_location(std::string_view raw) {
    static const std::map<std::string, Location> kLocations = {
        {"head", Location::Head},                {"hd", Location::Head},
        {"center torso", Location::CenterTorso}, {"ct", Location::CenterTorso},
        {"left torso", Location::LeftTorso},     {"lt", Location::LeftTorso},
        {"right torso", Location::RightTorso},   {"rt", Location::RightTorso},
        {"left arm", Location::LeftArm},         {"la", Location::LeftArm},
        {"right arm", Location::RightArm},       {"ra", Location::RightArm},
        {"left leg", Location::LeftLeg},         {"ll", Location::LeftLeg},
        {"right leg", Location::RightLeg},       {"rl", Location::RightLeg},
        // Quad front legs occupy the arm locations.
        {"front left leg", Location::LeftArm},   {"fll", Location::LeftArm},
        {"front right leg", Location::RightArm}, {"frl", Location::RightArm},
        {"rear left leg", Location::LeftLeg},    {"rll", Location::LeftLeg},
        {"rear right leg", Location::RightLeg},  {"rrl", Location::RightLeg},
    };
    auto it = kLocations.find(to_lower(trim(raw)));
    if (it == kLocations.end()) return std::nullopt;
    return it->second;
}

// Armor keys: "LA armor", "RTC armor" (rear center torso), ...
std::optional<std::pair<Location, bool>> armor_location(std::string_view code) {
    std::string c = to_lower(trim(code));
    if (c == "rtl") return std::make_pair(Location::LeftTorso, true);
    if (c == "rtr") return std::make_pair(Location::RightTorso, true);
    if (c == "rtc") return std::make_pair(Location::CenterTorso, true);
    if (auto loc = mtf_location(c)) return std::make_pair(*loc, false);
    return std::nullopt;
}

bool is_structural_component(const std::string& s) {
    static const std::set<std::string> kFixed = {
        "Shoulder", "Upper Arm Actuator", "Lower Arm Actuator", "Hand Actuator",
        "Hip", "Upper Leg Actuator", "Lower Leg Actuator", "Foot Actuator",
        "Life Support", "Sensors", "Cockpit", "Gyro", "Compact Gyro",
        "Heavy Duty Gyro", "XL Gyro", "Superheavy Gyro", "-Empty-",
    };
    if (kFixed.count(s)) return true;
    return contains(s, "Engine") || contains(s, "Endo Steel") || contains(s, "Endo-Steel") ||
           contains(s, "Ferro-Fibrous") || contains(s, "Reactive Armor") ||
           contains(s, "Stealth Armor") || contains(s, "Endo-Composite");
}

// Drops "(R)" and "(omnipod)" suffixes; reports whether the mount faces rear.
std::string strip_slot_annotations(std::string_view raw, bool& is_rear) {
    std::string s = trim(raw);
    is_rear = false;
    bool changed = true;
    while (changed) {
        changed = false;
        std::string lower = to_lower(s);
        if (ends_with(lower, "(r)")) {
            is_rear = true;
            s = trim(std::string_view(s).substr(0, s.size() - 3));
            changed = true;
        } else if (ends_with(lower, "(omnipod)")) {
            s = trim(std::string_view(s).substr(0, s.size() - 9));
            changed = true;
        }
    }
    return s;
}

// "300 XL Engine(IS)" -> {300, "XL Engine(IS)"}; also "20 Double" for heat sinks.
std::pair<std::optional<int>, std::optional<std::string>> split_count_label(std::string_view val) {
    std::string v = trim(val);
    size_t space = v.find(' ');
    std::string head = space == std::string::npos ? v : v.substr(0, space);
    if (auto n = parse_int(head)) {
        std::string rest = space == std::string::npos ? "" : trim(std::string_view(v).substr(space + 1));
        if (rest.empty()) return {n, std::nullopt};
        return {n, rest};
    }
    if (v.empty()) return {std::nullopt, std::nullopt};
    return {std::nullopt, v};
}

// Patchwork armor writes "Ferro-Fibrous(Inner Sphere):26"; the points follow the last colon.
std::optional<int> armor_points(std::string_view val) {
    if (auto n = parse_int(val)) return n;
    size_t colon = val.rfind(':');
    if (colon == std::string_view::npos) return std::nullopt;
    return parse_int(val.substr(colon + 1));
}

// "[qty] name, location[, Ammo:N]"
void parse_weapon_line(std::string_view line, std::vector<ParsedLoadoutEntry>& weapons) {
    auto parts = split(line, ',');
    if (parts.size() < 2) return;

    std::string name_part = trim(parts[0]);
    int qty = 1;
    size_t space = name_part.find(' ');
    if (space != std::string::npos) {
        if (auto n = parse_int(std::string_view(name_part).substr(0, space))) {
            qty = *n;
            name_part = trim(std::string_view(name_part).substr(space + 1));
        }
    }

    bool name_rear = false;
    std::string name = strip_slot_annotations(name_part, name_rear);
    if (name.empty() || name == "-Empty-" || qty <= 0) return;

    bool loc_rear = false;
    std::string loc_label = strip_slot_annotations(parts[1], loc_rear);

    ParsedLoadoutEntry entry;
    entry.equipment = name;
    entry.location = mtf_location(loc_label);
    entry.quantity = qty;
    entry.is_rear = name_rear || loc_rear;
    weapons.push_back(std::move(entry));
}

} // namespace

std::optional<ParsedUnit> parse_mtf(std::string_view content) {
    ParsedUnit unit;
    unit.unit_type = UnitType::Mek;
    ParsedMechData mech;

    std::optional<double> mass;
    std::map<Location, ArmorValues> armor;
    std::vector<ParsedLoadoutEntry> weapons;
    std::vector<ParsedLoadoutEntry> slots;

    Section section = Section::None;
    std::optional<Location> slot_location;

    for (const auto& raw_line : split(content, '\n')) {
        std::string line = trim(raw_line);
        if (line.empty() || line[0] == '#') continue;

        size_t colon = line.find(':');

        // Weapon lines may carry ", Ammo:N" so they are checked before key:value handling.
        if (section == Section::Weapons && contains(line, ",")) {
            parse_weapon_line(line, weapons);
            continue;
        }

        if (colon == std::string::npos) {
            if (section == Section::Slots && slot_location) {
                bool rear = false;
                std::string equip = strip_slot_annotations(line, rear);
                if (!equip.empty() && !is_structural_component(equip)) {
                    slots.push_back({equip, slot_location, 1, rear});
                }
            } else {
                section = Section::None;
            }
            continue;
        }

        std::string key = to_lower(trim(std::string_view(line).substr(0, colon)));
        std::string val = trim(std::string_view(line).substr(colon + 1));

        if (key == "weapons") {
            section = Section::Weapons;
            continue;
        }

        if (val.empty()) {
            slot_location = mtf_location(key);
            section = slot_location ? Section::Slots : Section::None;
            continue;
        }

        section = Section::None;
        slot_location.reset();

        if (key == "chassis") {
            unit.chassis = val;
        } else if (key == "model") {
            unit.model = val;
        } else if (key == "mul id") {
            unit.mul_id = parse_int(val);
        } else if (key == "config") {
            mech.config = val;
            mech.is_omnimech = contains(to_lower(val), "omni");
        } else if (key == "techbase" || key == "tech base") {
            unit.tech_base = tech_base_from_text(val);
        } else if (key == "era" || key == "year") {
            unit.intro_year = parse_int(val);
        } else if (key == "source") {
            unit.source = val;
        } else if (key == "rules level") {
            auto n = parse_int(val);
            unit.rules_level = n ? rules_level_from_int(*n) : RulesLevel::Standard;
        } else if (key == "mass" || key == "tonnage") {
            mass = parse_double(val);
        } else if (key == "engine") {
            auto [rating, label] = split_count_label(val);
            mech.engine_rating = rating;
            mech.engine_type = label;
        } else if (key == "structure" || key == "internal") {
            mech.structure_type = val;
        } else if (key == "myomer") {
            mech.myomer_type = val;
        } else if (key == "gyro") {
            mech.gyro_type = val;
        } else if (key == "cockpit") {
            mech.cockpit_type = val;
        } else if (key == "heat sinks" || key == "heatsinks") {
            auto [count, label] = split_count_label(val);
            mech.heat_sink_count = count;
            mech.heat_sink_type = label;
        } else if (key == "walk mp") {
            mech.walk_mp = parse_int(val);
        } else if (key == "jump mp") {
            mech.jump_mp = parse_int(val);
        } else if (key == "armor") {
            mech.armor_type = val;
        } else if (key == "quirk") {
            std::string slug = slugify(val);
            if (!slug.empty()) unit.quirks.push_back(slug);
        } else if (key == "overview") {
            std::string desc = val;
            if (desc.size() >= 2 && desc.front() == '"' && desc.back() == '"') {
                desc = desc.substr(1, desc.size() - 2);
            }
            unit.description = desc;
        } else if (ends_with(key, " armor")) {
            if (auto loc = armor_location(std::string_view(key).substr(0, key.size() - 6))) {
                auto points = armor_points(val);
                if (loc->second) armor[loc->first].rear = points;
                else armor[loc->first].front = points;
            }
        }
    }

    if (trim(unit.chassis).empty() || !mass) return std::nullopt;
    unit.tonnage = *mass;

    static const std::array<Location, 8> kBodyOrder = {
        Location::LeftArm, Location::RightArm, Location::LeftTorso, Location::RightTorso,
        Location::CenterTorso, Location::Head, Location::LeftLeg, Location::RightLeg,
    };
    for (Location loc : kBodyOrder) {
        auto it = armor.find(loc);
        if (it == armor.end()) continue;
        unit.locations.push_back({loc, it->second.front, it->second.rear, std::nullopt});
    }

    // The weapon list is authoritative for weapons; slot lines naming a listed
    // weapon are its critical slots, not additional mounts.
    std::set<std::string> weapon_names;
    for (const auto& w : weapons) weapon_names.insert(w.equipment);

    std::vector<ParsedLoadoutEntry> loadout = weapons;
    for (const auto& s : slots) {
        if (!weapon_names.count(s.equipment)) loadout.push_back(s);
    }
    unit.loadout = merge_loadout(loadout);

    if (mech.config.empty()) mech.config = "Biped";
    unit.mech_data = std::move(mech);
    return unit;
}

} // namespace Armory
