/**
 * @file alias_resolver.cpp
 * @brief Component label resolution and default-fill
 */

#include <catalog/alias_resolver.hpp>
#include <utils/text.hpp>

namespace Armory {

const char* to_string(ResolutionStatus s) {
    switch (s) {
        case ResolutionStatus::Resolved:   return "resolved";
        case ResolutionStatus::Defaulted:  return "defaulted";
        case ResolutionStatus::Unresolved: return "unresolved";
    }
    return "unresolved";
}

const std::optional<std::string>& label_for(const ParsedMechData& mech, ComponentCategory category) {
    switch (category) {
        case ComponentCategory::Engine:    return mech.engine_type;
        case ComponentCategory::Armor:     return mech.armor_type;
        case ComponentCategory::Structure: return mech.structure_type;
        case ComponentCategory::HeatSink:  return mech.heat_sink_type;
        case ComponentCategory::Gyro:      return mech.gyro_type;
        case ComponentCategory::Cockpit:   return mech.cockpit_type;
        case ComponentCategory::Myomer:    return mech.myomer_type;
    }
    return mech.engine_type;
}

std::vector<ComponentCategory> MechResolution::unresolved() const {
    std::vector<ComponentCategory> out;
    for (const auto& c : components) {
        if (c.status == ResolutionStatus::Unresolved) out.push_back(c.category);
    }
    return out;
}

std::vector<ComponentCategory> MechResolution::unknown_labels() const {
    std::vector<ComponentCategory> out;
    for (const auto& c : components) {
        bool has_label = c.raw_label && !trim(*c.raw_label).empty();
        if (has_label && c.status != ResolutionStatus::Resolved) out.push_back(c.category);
    }
    return out;
}

AliasResolver::AliasResolver(const ComponentCatalog& catalog) : catalog_(catalog) {}

bool AliasResolver::has_default(ComponentCategory category) {
    return category == ComponentCategory::Gyro ||
           category == ComponentCategory::Cockpit ||
           category == ComponentCategory::Myomer;
}

std::optional<int> AliasResolver::resolve(ComponentCategory category, std::string_view label) const {
    return catalog_.lookup(category, label);
}

ComponentResolution AliasResolver::resolve_one(ComponentCategory category,
                                               const std::optional<std::string>& label) const {
    ComponentResolution r;
    r.category = category;
    r.raw_label = label;

    if (label && !trim(*label).empty()) {
        if (auto id = resolve(category, *label)) {
            r.canonical_id = id;
            r.status = ResolutionStatus::Resolved;
            return r;
        }
    }

    if (has_default(category)) {
        r.canonical_id = catalog_.standard_id(category);
        r.status = ResolutionStatus::Defaulted;
    }
    return r;
}

MechResolution AliasResolver::resolve_all(const ParsedMechData& mech) const {
    MechResolution out;
    for (ComponentCategory c : kComponentCategories) {
        out.components[static_cast<size_t>(c)] = resolve_one(c, label_for(mech, c));
    }
    return out;
}

} // namespace Armory
