/**
 * @file blk_parser.cpp
 * @brief Tag-delimited unit format parser
 */

#include <parsing/blk_parser.hpp>
#include <utils/text.hpp>
#include <map>
#include <utility>

namespace Armory {

namespace {

struct TagBlocks {
    std::map<std::string, std::string> values;
    // (lowercased location part of "<X Equipment>", mount line), in file order
    std::vector<std::pair<std::string, std::string>> equipment;
};

void close_tag(TagBlocks& blocks, const std::string& tag, const std::string& value) {
    static const std::string kEquipmentSuffix = " equipment";
    if (ends_with(tag, kEquipmentSuffix) || tag == "equipment") {
        std::string loc = tag == "equipment" ? "" : trim(std::string_view(tag).substr(0, tag.size() - kEquipmentSuffix.size()));
        for (const auto& line : split(value, '\n')) {
            std::string mount = trim(line);
            if (!mount.empty()) blocks.equipment.emplace_back(loc, mount);
        }
        return;
    }
    blocks.values[tag] = trim(value);
}

TagBlocks collect_tags(std::string_view content) {
    TagBlocks blocks;
    std::optional<std::string> current;
    std::string value;

    for (const auto& raw : split(content, '\n')) {
        std::string line = trim(raw);
        if (line.empty() || line[0] == '#') {
            continue;
        }

        if (starts_with(line, "</")) {
            if (current) close_tag(blocks, *current, value);
            current.reset();
            value.clear();
            continue;
        }

        if (line[0] == '<') {
            size_t close = line.find('>');
            if (close == std::string::npos) continue;
            std::string tag = to_lower(trim(std::string_view(line).substr(1, close - 1)));
            std::string rest = line.substr(close + 1);

            // Inline form: <tag>value</tag>
            size_t end = rest.find("</");
            if (end != std::string::npos) {
                close_tag(blocks, tag, rest.substr(0, end));
                current.reset();
                value.clear();
                continue;
            }

            current = tag;
            value = trim(rest);
            continue;
        }

        if (current) {
            if (!value.empty()) value += '\n';
            value += line;
        }
    }
    return blocks;
}

std::optional<Location> blk_location(const std::string& loc) {
    static const std::map<std::string, Location> kLocations = {
        {"front", Location::Front},
        {"rear", Location::Rear},
        {"right", Location::RightSide},
        {"left", Location::LeftSide},
        {"turret", Location::Turret},
        {"body", Location::Body},
        {"left arm", Location::LeftArm},
        {"right arm", Location::RightArm},
    };
    auto it = kLocations.find(loc);
    if (it == kLocations.end()) return std::nullopt;
    return it->second;
}

UnitType unit_type_from_tag(const std::string& raw, UnitType fallback) {
    std::string t = to_lower(trim(raw));
    if (t == "tank" || t == "vtol" || t == "naval" || t == "wheeled vehicle" ||
        t == "tracked vehicle" || starts_with(t, "support")) {
        return UnitType::Vehicle;
    }
    if (t == "aero" || t == "aerospacefighter" || t == "aerospacespacefighter" ||
        t == "conv_fighter" || t == "conventional fighter" || t == "convfighter") {
        return UnitType::Fighter;
    }
    return fallback;
}

const std::string* find_tag(const TagBlocks& blocks, const std::string& key) {
    auto it = blocks.values.find(key);
    return it == blocks.values.end() ? nullptr : &it->second;
}

std::string strip_quotes(std::string s) {
    if (s.size() >= 2 && s.front() == '"' && s.back() == '"') {
        s = s.substr(1, s.size() - 2);
    }
    return trim(s);
}

// Vehicle armor is listed Front, Right, Left, Rear, then Turret. A VTOL's fifth
// value is its rotor, which has no location in the schema.
std::vector<ParsedLocation> vehicle_armor(const std::string& value, bool is_vtol) {
    static const Location kOrder[] = {
        Location::Front, Location::RightSide, Location::LeftSide, Location::Rear, Location::Turret,
    };
    std::vector<ParsedLocation> out;
    size_t i = 0;
    for (const auto& line : split(value, '\n')) {
        std::string v = trim(line);
        if (v.empty()) continue;
        if (i >= 5 || (i == 4 && is_vtol)) break;
        if (auto points = parse_int(v)) {
            out.push_back({kOrder[i], points, std::nullopt, std::nullopt});
        }
        ++i;
    }
    return out;
}

} // namespace

std::optional<ParsedUnit> parse_blk(std::string_view content, UnitType default_type) {
    TagBlocks blocks = collect_tags(content);

    const std::string* name = find_tag(blocks, "name");
    if (!name || name->empty()) return std::nullopt;

    const std::string* tonnage = find_tag(blocks, "tonnage");
    if (!tonnage) return std::nullopt;
    auto tons = parse_double(*tonnage);
    if (!tons) return std::nullopt;

    ParsedUnit unit;
    unit.chassis = *name;
    unit.tonnage = *tons;

    if (auto* model = find_tag(blocks, "model")) unit.model = *model;

    const std::string* mul = find_tag(blocks, "mul id:");
    if (!mul) mul = find_tag(blocks, "mul id");
    if (mul) unit.mul_id = parse_int(*mul);

    if (auto* year = find_tag(blocks, "year")) unit.intro_year = parse_int(*year);
    if (auto* source = find_tag(blocks, "source")) {
        if (!source->empty()) unit.source = *source;
    }

    std::string raw_type;
    if (auto* ut = find_tag(blocks, "unittype")) raw_type = to_lower(*ut);
    unit.unit_type = unit_type_from_tag(raw_type, default_type);

    if (auto* type = find_tag(blocks, "type")) {
        unit.tech_base = tech_base_from_text(*type);
        unit.rules_level = rules_level_from_type(*type);
    }

    if (auto* overview = find_tag(blocks, "overview")) {
        std::string desc = strip_quotes(*overview);
        if (!desc.empty()) unit.description = desc;
    }

    if (auto* quirks = find_tag(blocks, "quirks")) {
        for (const auto& line : split(*quirks, '\n')) {
            std::string slug = slugify(line);
            if (!slug.empty()) unit.quirks.push_back(slug);
        }
    }

    if (unit.unit_type == UnitType::Vehicle) {
        if (auto* armor = find_tag(blocks, "armor")) {
            unit.locations = vehicle_armor(*armor, raw_type == "vtol");
        }
    }

    std::vector<ParsedLoadoutEntry> loadout;
    for (const auto& [loc, mount] : blocks.equipment) {
        std::string label = mount;
        bool rear = false;
        if (ends_with(to_lower(label), "(r)")) {
            rear = true;
            label = trim(std::string_view(label).substr(0, label.size() - 3));
        }
        if (label.empty()) continue;
        loadout.push_back({label, blk_location(loc), 1, rear});
    }
    unit.loadout = merge_loadout(loadout);

    return unit;
}

} // namespace Armory
