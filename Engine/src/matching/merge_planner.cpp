#include <matching/merge_planner.hpp>

namespace Armory {

int source_priority(const std::optional<std::string>& source) {
    if (!source) return 0;
    if (*source == kSourceArchive) return 10;
    if (*source == kSourceCatalog) return 20;
    if (*source == kSourceManual) return 30;
    return 0;
}

size_t MergePlan::field_count() const {
    return static_cast<size_t>(battle_value.has_value()) + cost.has_value() + role.has_value() +
           alternate_name.has_value() + external_id.has_value() + intro_year.has_value();
}

MergePlan plan_merge(const UnitCatalogFields& current, const CatalogRecord& record,
                     const std::string& source, bool force) {
    const int priority = source_priority(source);
    MergePlan plan;

    if (should_write(current.battle_value, record.battle_value, priority, source, force)) {
        plan.battle_value = record.battle_value;
    }
    if (should_write(current.cost, record.cost, priority, source, force)) {
        plan.cost = record.cost;
    }
    if (should_write(current.role, record.role, priority, source, force)) {
        plan.role = record.role;
    }

    std::optional<std::string> alternate = extract_alternate_name(record.name);
    if (should_write(current.alternate_name, alternate, priority, source, force)) {
        plan.alternate_name = alternate;
    }

    std::optional<int> external_id = record.external_id;
    if (should_write(current.external_id, external_id, priority, source, force)) {
        plan.external_id = external_id;
    }
    if (should_write(current.intro_year, record.intro_year, priority, source, force)) {
        plan.intro_year = record.intro_year;
    }
    return plan;
}

} // namespace Armory
