/**
 * @file component_catalog.cpp
 * @brief Builtin canonical component entries and alias sets
 */

#include <catalog/component_catalog.hpp>
#include <core/errors.hpp>
#include <utils/text.hpp>
#include <algorithm>

namespace Armory {

using json = nlohmann::json;

const char* to_string(ComponentCategory c) {
    switch (c) {
        case ComponentCategory::Engine:    return "engine";
        case ComponentCategory::Armor:     return "armor";
        case ComponentCategory::Structure: return "structure";
        case ComponentCategory::HeatSink:  return "heat_sink";
        case ComponentCategory::Gyro:      return "gyro";
        case ComponentCategory::Cockpit:   return "cockpit";
        case ComponentCategory::Myomer:    return "myomer";
    }
    return "engine";
}

const char* type_table(ComponentCategory c) {
    switch (c) {
        case ComponentCategory::Engine:    return "engine_types";
        case ComponentCategory::Armor:     return "armor_types";
        case ComponentCategory::Structure: return "structure_types";
        case ComponentCategory::HeatSink:  return "heatsink_types";
        case ComponentCategory::Gyro:      return "gyro_types";
        case ComponentCategory::Cockpit:   return "cockpit_types";
        case ComponentCategory::Myomer:    return "myomer_types";
    }
    return "engine_types";
}

const char* alias_table(ComponentCategory c) {
    switch (c) {
        case ComponentCategory::Engine:    return "engine_type_aliases";
        case ComponentCategory::Armor:     return "armor_type_aliases";
        case ComponentCategory::Structure: return "structure_type_aliases";
        case ComponentCategory::HeatSink:  return "heatsink_type_aliases";
        case ComponentCategory::Gyro:      return "gyro_type_aliases";
        case ComponentCategory::Cockpit:   return "cockpit_type_aliases";
        case ComponentCategory::Myomer:    return "myomer_type_aliases";
    }
    return "engine_type_aliases";
}

const char* id_column(ComponentCategory c) {
    switch (c) {
        case ComponentCategory::Engine:    return "engine_type_id";
        case ComponentCategory::Armor:     return "armor_type_id";
        case ComponentCategory::Structure: return "structure_type_id";
        case ComponentCategory::HeatSink:  return "heatsink_type_id";
        case ComponentCategory::Gyro:      return "gyro_type_id";
        case ComponentCategory::Cockpit:   return "cockpit_type_id";
        case ComponentCategory::Myomer:    return "myomer_type_id";
    }
    return "engine_type_id";
}

// =============================================================================
// ComponentCatalog
// =============================================================================

void ComponentCatalog::add_type(ComponentCategory category, ComponentType type) {
    Table& t = table(category);
    for (const auto& existing : t.types) {
        if (existing.id == type.id || existing.slug == type.slug) {
            throw CatalogError(std::string("Duplicate ") + to_string(category) +
                               " type: " + type.slug);
        }
    }
    int id = type.id;
    std::string name = type.name;
    t.types.push_back(std::move(type));
    add_alias_id(category, name, id);
}

void ComponentCatalog::add_alias(ComponentCategory category, std::string_view alias, std::string_view slug) {
    const ComponentType* target = find_by_slug(category, slug);
    if (!target) {
        throw CatalogError(std::string("Alias '") + std::string(alias) + "' targets unknown " +
                           to_string(category) + " type '" + std::string(slug) + "'");
    }
    add_alias_id(category, alias, target->id);
}

void ComponentCatalog::add_alias_id(ComponentCategory category, std::string_view alias, int id) {
    std::string key = normalize_label(alias);
    if (key.empty()) return;

    auto& aliases = table(category).aliases;
    auto it = aliases.find(key);
    if (it != aliases.end()) {
        if (it->second == id) return;
        throw CatalogError(std::string("Conflicting ") + to_string(category) + " alias '" + key +
                           "': maps to " + std::to_string(it->second) + " and " + std::to_string(id));
    }
    aliases.emplace(std::move(key), id);
}

const std::vector<ComponentType>& ComponentCatalog::types(ComponentCategory category) const {
    return table(category).types;
}

const std::map<std::string, int>& ComponentCatalog::aliases(ComponentCategory category) const {
    return table(category).aliases;
}

const ComponentType* ComponentCatalog::find_by_slug(ComponentCategory category, std::string_view slug) const {
    const auto& types = table(category).types;
    auto it = std::find_if(types.begin(), types.end(),
                           [&](const ComponentType& t) { return t.slug == slug; });
    return it == types.end() ? nullptr : &*it;
}

const ComponentType* ComponentCatalog::find_by_id(ComponentCategory category, int id) const {
    const auto& types = table(category).types;
    auto it = std::find_if(types.begin(), types.end(),
                           [&](const ComponentType& t) { return t.id == id; });
    return it == types.end() ? nullptr : &*it;
}

std::optional<int> ComponentCatalog::lookup(ComponentCategory category, std::string_view label) const {
    const auto& aliases = table(category).aliases;
    auto it = aliases.find(normalize_label(label));
    if (it == aliases.end()) return std::nullopt;
    return it->second;
}

int ComponentCatalog::standard_id(ComponentCategory category) const {
    const ComponentType* t = find_by_slug(category, "standard");
    if (!t) {
        throw CatalogError(std::string("No standard ") + to_string(category) + " type");
    }
    return t->id;
}

size_t ComponentCatalog::alias_count() const {
    size_t n = 0;
    for (const auto& t : tables_) n += t.aliases.size();
    return n;
}

// =============================================================================
// Builtin content
// =============================================================================

namespace {

using C = ComponentCategory;
using TB = TechBase;
using RL = RulesLevel;

struct TypeSeed {
    const char* slug;
    const char* name;
    TechBase tech_base;
    RulesLevel rules_level;
    int intro_year;  // 0 = unknown
};

struct AliasSeed {
    const char* alias;
    const char* slug;
};

// Ids are positional (1-based) and must never be reordered.
void add_types(ComponentCatalog& cat, C category,
               std::initializer_list<std::pair<TypeSeed, json>> seeds) {
    int id = 1;
    for (const auto& [seed, props] : seeds) {
        ComponentType t;
        t.id = id++;
        t.slug = seed.slug;
        t.name = seed.name;
        t.tech_base = seed.tech_base;
        t.rules_level = seed.rules_level;
        if (seed.intro_year > 0) t.intro_year = seed.intro_year;
        t.properties = props;
        cat.add_type(category, std::move(t));
    }
}

void add_aliases(ComponentCatalog& cat, C category, std::initializer_list<AliasSeed> seeds) {
    for (const auto& a : seeds) cat.add_alias(category, a.alias, a.slug);
}

json engine(double weight_multiplier, int ct_crits, int st_crits) {
    return {{"weight_multiplier", weight_multiplier}, {"ct_crits", ct_crits}, {"st_crits", st_crits}};
}

json armor(double points_per_ton, int crits) {
    return {{"points_per_ton", points_per_ton}, {"crits", crits}};
}

json structure(double weight_fraction, int crits) {
    return {{"weight_fraction", weight_fraction}, {"crits", crits}};
}

json heat_sink(int dissipation, int crits, double weight) {
    return {{"dissipation", dissipation}, {"crits", crits}, {"weight", weight}};
}

json gyro(double weight_multiplier, int crits) {
    return {{"weight_multiplier", weight_multiplier}, {"crits", crits}};
}

json cockpit(double weight, int crits) {
    return {{"weight", weight}, {"crits", crits}};
}

ComponentCatalog build_catalog() {
    ComponentCatalog cat;

    add_types(cat, C::Engine, {
        {{"standard-fusion", "Fusion Engine", TB::InnerSphere, RL::Introductory, 2021}, engine(1.0, 6, 0)},
        {{"xl-is", "XL Engine", TB::InnerSphere, RL::Standard, 2579}, engine(0.5, 6, 3)},
        {{"xl-clan", "XL Engine (Clan)", TB::Clan, RL::Standard, 2827}, engine(0.5, 6, 2)},
        {{"light", "Light Engine", TB::InnerSphere, RL::Standard, 3062}, engine(0.75, 6, 2)},
        {{"compact", "Compact Engine", TB::InnerSphere, RL::Standard, 3068}, engine(1.5, 3, 0)},
        {{"xxl-is", "XXL Engine", TB::InnerSphere, RL::Experimental, 3055}, engine(0.333, 6, 6)},
        {{"ice", "I.C.E.", TB::InnerSphere, RL::Introductory, 1950}, engine(2.0, 6, 0)},
        {{"fuel-cell", "Fuel Cell", TB::InnerSphere, RL::Standard, 2300}, engine(1.2, 6, 0)},
        {{"primitive-fusion", "Primitive Fusion Engine", TB::InnerSphere, RL::Advanced, 2300}, engine(1.2, 6, 0)},
        {{"xxl-clan", "XXL Engine (Clan)", TB::Clan, RL::Experimental, 3055}, engine(0.333, 6, 4)},
        {{"fission", "Fission Engine", TB::InnerSphere, RL::Experimental, 0}, engine(1.75, 6, 0)},
    });

    add_types(cat, C::Armor, {
        {{"standard", "Standard Armor", TB::InnerSphere, RL::Introductory, 2470}, armor(16.0, 0)},
        {{"ferro-fibrous-is", "Ferro-Fibrous (Inner Sphere)", TB::InnerSphere, RL::Standard, 2571}, armor(17.92, 14)},
        {{"ferro-fibrous-clan", "Ferro-Fibrous (Clan)", TB::Clan, RL::Standard, 2820}, armor(19.2, 7)},
        {{"light-ferro", "Light Ferro-Fibrous", TB::InnerSphere, RL::Standard, 3067}, armor(17.06, 7)},
        {{"heavy-ferro", "Heavy Ferro-Fibrous", TB::InnerSphere, RL::Standard, 3069}, armor(19.73, 21)},
        {{"stealth", "Stealth Armor", TB::InnerSphere, RL::Standard, 3063}, armor(16.0, 12)},
        {{"reactive", "Reactive Armor", TB::InnerSphere, RL::Advanced, 3063}, armor(16.0, 14)},
        {{"hardened", "Hardened Armor", TB::InnerSphere, RL::Advanced, 3047}, armor(8.0, 0)},
        {{"primitive", "Primitive Armor", TB::InnerSphere, RL::Advanced, 2300}, armor(10.67, 0)},
        {{"industrial", "Industrial Armor", TB::InnerSphere, RL::Introductory, 2439}, armor(16.0, 0)},
        {{"heavy-industrial", "Heavy Industrial Armor", TB::InnerSphere, RL::Standard, 2460}, armor(8.0, 0)},
        {{"commercial", "Commercial Armor", TB::InnerSphere, RL::Introductory, 2400}, armor(8.0, 0)},
        {{"reflective-is", "Reflective Armor (IS)", TB::InnerSphere, RL::Experimental, 3058}, armor(16.0, 10)},
        {{"reflective-clan", "Reflective Armor (Clan)", TB::Clan, RL::Experimental, 3061}, armor(16.0, 5)},
        {{"ferro-lamellor", "Ferro-Lamellor Armor", TB::Clan, RL::Experimental, 3070}, armor(17.92, 12)},
    });

    add_types(cat, C::Structure, {
        {{"standard", "Standard Structure", TB::InnerSphere, RL::Introductory, 2439}, structure(0.10, 0)},
        {{"endo-steel-is", "Endo Steel (Inner Sphere)", TB::InnerSphere, RL::Standard, 2487}, structure(0.05, 14)},
        {{"endo-steel-clan", "Endo Steel (Clan)", TB::Clan, RL::Standard, 2827}, structure(0.05, 7)},
        {{"composite", "Composite Structure", TB::InnerSphere, RL::Advanced, 3061}, structure(0.05, 0)},
        {{"reinforced", "Reinforced Structure", TB::InnerSphere, RL::Advanced, 3057}, structure(0.20, 0)},
        {{"endo-composite-is", "Endo-Composite", TB::InnerSphere, RL::Advanced, 3067}, structure(0.075, 7)},
        {{"industrial", "Industrial Structure", TB::InnerSphere, RL::Introductory, 2350}, structure(0.10, 0)},
        {{"endo-composite-clan", "Endo-Composite (Clan)", TB::Clan, RL::Advanced, 3073}, structure(0.075, 4)},
        {{"reinforced-clan", "Reinforced Structure (Clan)", TB::Clan, RL::Advanced, 3065}, structure(0.20, 0)},
    });

    add_types(cat, C::HeatSink, {
        {{"single", "Single Heat Sink", TB::InnerSphere, RL::Introductory, 2022}, heat_sink(1, 1, 1.0)},
        {{"double-is", "Double Heat Sink", TB::InnerSphere, RL::Standard, 2567}, heat_sink(2, 3, 1.0)},
        {{"double-clan", "Clan Double Heat Sink", TB::Clan, RL::Standard, 2827}, heat_sink(2, 2, 1.0)},
        {{"compact", "Compact Heat Sink", TB::InnerSphere, RL::Experimental, 3058}, heat_sink(1, 1, 1.5)},
        {{"laser", "Laser Heat Sink", TB::Clan, RL::Experimental, 3075}, heat_sink(2, 2, 1.0)},
    });

    add_types(cat, C::Gyro, {
        {{"standard", "Standard Gyro", TB::InnerSphere, RL::Introductory, 2300}, gyro(1.0, 4)},
        {{"xl", "XL Gyro", TB::InnerSphere, RL::Standard, 3067}, gyro(0.5, 6)},
        {{"compact", "Compact Gyro", TB::InnerSphere, RL::Standard, 3068}, gyro(1.5, 2)},
        {{"heavy-duty", "Heavy Duty Gyro", TB::InnerSphere, RL::Standard, 3067}, gyro(2.0, 4)},
        {{"superheavy", "Superheavy Gyro", TB::InnerSphere, RL::Advanced, 2905}, gyro(2.0, 4)},
    });

    add_types(cat, C::Cockpit, {
        {{"standard", "Standard Cockpit", TB::InnerSphere, RL::Introductory, 2300}, cockpit(3.0, 1)},
        {{"small", "Small Cockpit", TB::InnerSphere, RL::Standard, 3067}, cockpit(2.0, 1)},
        {{"command-console", "Command Console", TB::InnerSphere, RL::Advanced, 2631}, cockpit(3.0, 1)},
        {{"torso-mounted", "Torso-Mounted Cockpit", TB::InnerSphere, RL::Advanced, 3053}, cockpit(4.0, 1)},
        {{"industrial", "Industrial Cockpit", TB::InnerSphere, RL::Standard, 2300}, cockpit(3.0, 1)},
        {{"primitive", "Primitive Cockpit", TB::InnerSphere, RL::Advanced, 2300}, cockpit(5.0, 1)},
    });

    // MASC slot count depends on tonnage.
    add_types(cat, C::Myomer, {
        {{"standard", "Standard Myomer", TB::InnerSphere, RL::Introductory, 2300}, json{{"crits", 0}}},
        {{"masc", "MASC", TB::InnerSphere, RL::Standard, 2740}, json{{"crits", nullptr}}},
        {{"tsm", "Triple-Strength Myomer", TB::InnerSphere, RL::Standard, 3050}, json{{"crits", 6}}},
        {{"industrial", "Industrial Myomer", TB::InnerSphere, RL::Introductory, 2300}, json{{"crits", 0}}},
    });

    // Labels as written by the simulator files. "(IS)" after an engine label is
    // the chassis tech base, not the engine's.
    add_aliases(cat, C::Engine, {
        {"Fusion", "standard-fusion"},
        {"Fusion Engine(IS)", "standard-fusion"},
        {"Fusion (Clan) Engine", "standard-fusion"},
        {"Fusion (Clan) Engine(IS)", "standard-fusion"},
        {"Fusion Engine (Clan)", "standard-fusion"},
        {"XL Fusion Engine", "xl-is"},
        {"XL Engine(IS)", "xl-is"},
        {"XL (Clan) Engine", "xl-clan"},
        {"XL (Clan) Engine(IS)", "xl-clan"},
        {"Clan XL Engine", "xl-clan"},
        {"Clan XL Engine(IS)", "xl-clan"},
        {"Light Fusion Engine", "light"},
        {"Light Engine(IS)", "light"},
        {"Light Fusion Engine(IS)", "light"},
        {"Compact Fusion Engine", "compact"},
        {"Compact Engine(IS)", "compact"},
        {"Compact Fusion Engine(IS)", "compact"},
        {"XXL Fusion Engine", "xxl-is"},
        {"XXL Engine(IS)", "xxl-is"},
        {"XXL Fusion Engine(IS)", "xxl-is"},
        {"XXL (Clan) Engine", "xxl-clan"},
        {"XXL (Clan) Engine(IS)", "xxl-clan"},
        {"Clan XXL Engine", "xxl-clan"},
        {"Clan XXL Engine(IS)", "xxl-clan"},
        {"ICE", "ice"},
        {"ICE Engine", "ice"},
        {"ICE Engine(IS)", "ice"},
        {"I.C.E. Engine", "ice"},
        {"I.C.E. Engine(IS)", "ice"},
        {"Fuel Cell Engine", "fuel-cell"},
        {"Fuel-Cell Engine", "fuel-cell"},
        {"Fuel Cell Engine(IS)", "fuel-cell"},
        {"Fuel-Cell Engine(IS)", "fuel-cell"},
        {"Primitive Engine", "primitive-fusion"},
        {"Primitive Fusion Engine(IS)", "primitive-fusion"},
        {"Primitive Engine(IS)", "primitive-fusion"},
        {"Fission Engine(IS)", "fission"},
    });

    add_aliases(cat, C::Armor, {
        {"Standard", "standard"},
        {"Standard(Inner Sphere)", "standard"},
        {"Standard(Clan)", "standard"},
        {"Standard(IS/Clan)", "standard"},
        {"Standard Armor(Inner Sphere)", "standard"},
        {"Ferro-Fibrous", "ferro-fibrous-is"},
        {"Ferro-Fibrous(Inner Sphere)", "ferro-fibrous-is"},
        {"Clan Ferro-Fibrous", "ferro-fibrous-clan"},
        {"Ferro-Fibrous(Clan)", "ferro-fibrous-clan"},
        {"Light Ferro-Fibrous(Inner Sphere)", "light-ferro"},
        {"Light Ferro-Fibrous(Clan)", "light-ferro"},
        {"Heavy Ferro-Fibrous(Inner Sphere)", "heavy-ferro"},
        {"Stealth", "stealth"},
        {"Stealth(Inner Sphere)", "stealth"},
        {"Stealth Armor(Inner Sphere)", "stealth"},
        {"Reactive", "reactive"},
        {"Reactive(Inner Sphere)", "reactive"},
        {"Reactive(Clan)", "reactive"},
        {"Reactive Armor(Inner Sphere)", "reactive"},
        {"Hardened", "hardened"},
        {"Hardened(Inner Sphere)", "hardened"},
        {"Hardened(Clan)", "hardened"},
        {"Hardened Armor(Inner Sphere)", "hardened"},
        {"Primitive", "primitive"},
        {"Primitive(Inner Sphere)", "primitive"},
        {"Primitive Armor(Inner Sphere)", "primitive"},
        {"Industrial(Inner Sphere)", "industrial"},
        {"Industrial (Inner Sphere)", "industrial"},
        {"Industrial Armor(Inner Sphere)", "industrial"},
        {"Heavy Industrial(Inner Sphere)", "heavy-industrial"},
        {"Heavy Industrial(Clan)", "heavy-industrial"},
        {"Commercial(Inner Sphere)", "commercial"},
        {"Commercial Armor(Inner Sphere)", "commercial"},
        {"Reflective(Inner Sphere)", "reflective-is"},
        {"Reflective Armor(Inner Sphere)", "reflective-is"},
        {"Laser-Reflective(Inner Sphere)", "reflective-is"},
        {"Reflective(Clan)", "reflective-clan"},
        {"Laser-Reflective(Clan)", "reflective-clan"},
        {"Ferro-Lamellor(Clan)", "ferro-lamellor"},
    });

    add_aliases(cat, C::Structure, {
        {"Standard", "standard"},
        {"IS Standard", "standard"},
        {"Clan Standard", "standard"},
        {"Endo Steel", "endo-steel-is"},
        {"Endo-Steel", "endo-steel-is"},
        {"IS Endo Steel", "endo-steel-is"},
        {"IS Endo-Steel", "endo-steel-is"},
        {"IS Endo-Steel Prototype", "endo-steel-is"},
        {"Endo Steel Prototype", "endo-steel-is"},
        {"Clan Endo Steel", "endo-steel-clan"},
        {"Clan Endo-Steel", "endo-steel-clan"},
        {"Composite", "composite"},
        {"IS Composite", "composite"},
        {"Reinforced", "reinforced"},
        {"IS Reinforced", "reinforced"},
        {"Clan Reinforced", "reinforced-clan"},
        {"IS Endo-Composite", "endo-composite-is"},
        {"Clan Endo-Composite", "endo-composite-clan"},
        {"Clan Endo Composite", "endo-composite-clan"},
        {"Industrial", "industrial"},
        {"IS Industrial", "industrial"},
        {"Clan Industrial", "industrial"},
    });

    add_aliases(cat, C::HeatSink, {
        {"Single", "single"},
        {"Double", "double-is"},
        {"IS Double", "double-is"},
        {"IS Double Heat Sink", "double-is"},
        {"Double (Inner Sphere)", "double-is"},
        {"Clan Double", "double-clan"},
        {"Double (Clan)", "double-clan"},
        {"Compact", "compact"},
        {"Laser", "laser"},
    });

    add_aliases(cat, C::Gyro, {
        {"Standard", "standard"},
        {"Heavy-Duty Gyro", "heavy-duty"},
    });

    add_aliases(cat, C::Cockpit, {
        {"Standard", "standard"},
        {"Small", "small"},
        {"Torso Cockpit", "torso-mounted"},
        {"Industrial", "industrial"},
        {"Primitive", "primitive"},
    });

    add_aliases(cat, C::Myomer, {
        {"Standard", "standard"},
        {"Triple Strength Myomer", "tsm"},
        {"Triple-Strength", "tsm"},
        {"Industrial Triple-Strength", "tsm"},
        {"TSM", "tsm"},
        {"ISMASC", "masc"},
        {"CLMASC", "masc"},
        {"IS MASC", "masc"},
        {"Clan MASC", "masc"},
        {"Industrial", "industrial"},
    });

    return cat;
}

} // namespace

const ComponentCatalog& ComponentCatalog::builtin() {
    static const ComponentCatalog instance = build_catalog();
    return instance;
}

} // namespace Armory
