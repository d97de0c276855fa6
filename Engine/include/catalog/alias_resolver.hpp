/**
 * @file alias_resolver.hpp
 * @brief Free-text component label -> canonical id, with default-fill
 */

#pragma once

#include <catalog/component_catalog.hpp>
#include <export.hpp>
#include <model/unit_types.hpp>
#include <array>
#include <optional>
#include <string>
#include <vector>

namespace Armory {

enum class ResolutionStatus {
    Resolved,    // label found in the alias set
    Defaulted,   // no usable label; standard entry applied
    Unresolved   // no usable label and no default for this category
};

const char* to_string(ResolutionStatus s);

struct ComponentResolution {
    ComponentCategory category;
    std::optional<std::string> raw_label;
    std::optional<int> canonical_id;
    ResolutionStatus status = ResolutionStatus::Unresolved;
};

/**
 * @brief Resolution of all seven categories for one unit.
 */
struct MechResolution {
    std::array<ComponentResolution, 7> components;

    const ComponentResolution& get(ComponentCategory c) const {
        return components[static_cast<size_t>(c)];
    }

    /// Categories left without a canonical id.
    std::vector<ComponentCategory> unresolved() const;

    /// Categories whose label was present but not in the alias set, including
    /// defaulted ones. These are the reportable alias-table gaps.
    std::vector<ComponentCategory> unknown_labels() const;
};

/**
 * @brief Exact alias lookup over a ComponentCatalog.
 *
 * Gyro, cockpit and myomer fall back to their standard entry when the label is
 * absent or unknown, because the source files routinely omit them when
 * standard. Engine, armor, structure and heat sink never fall back.
 */
class ARMORY_API AliasResolver {
public:
    explicit AliasResolver(const ComponentCatalog& catalog = ComponentCatalog::builtin());

    std::optional<int> resolve(ComponentCategory category, std::string_view label) const;

    MechResolution resolve_all(const ParsedMechData& mech) const;

    static bool has_default(ComponentCategory category);

private:
    const ComponentCatalog& catalog_;

    ComponentResolution resolve_one(ComponentCategory category,
                                    const std::optional<std::string>& label) const;
};

/// The raw label ParsedMechData carries for a category.
const std::optional<std::string>& label_for(const ParsedMechData& mech, ComponentCategory category);

} // namespace Armory
