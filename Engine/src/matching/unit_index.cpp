#include <matching/unit_index.hpp>
#include <utils/text.hpp>

namespace Armory {

UnitIndex::UnitIndex(std::vector<IndexedUnit> units) {
    units_.reserve(units.size());
    for (auto& u : units) add(std::move(u));
}

std::string UnitIndex::name_key(std::string_view name) {
    return to_lower(collapse_whitespace(name));
}

void UnitIndex::add(IndexedUnit unit) {
    size_t pos = units_.size();
    slugs_.emplace(unit.slug, pos);
    compact_[compact_key(unit.slug)].push_back(pos);
    names_[name_key(unit.full_name)].push_back(pos);
    units_.push_back(std::move(unit));
}

const IndexedUnit* UnitIndex::by_slug(std::string_view slug) const {
    auto it = slugs_.find(std::string(slug));
    return it == slugs_.end() ? nullptr : &units_[it->second];
}

KeyLookup UnitIndex::lookup(const std::unordered_map<std::string, std::vector<size_t>>& map,
                            std::string_view key) const {
    KeyLookup result;
    if (key.empty()) return result;
    auto it = map.find(std::string(key));
    if (it == map.end()) return result;
    if (it->second.size() > 1) {
        result.ambiguous = true;
        return result;
    }
    result.unit = &units_[it->second.front()];
    return result;
}

KeyLookup UnitIndex::by_compact(std::string_view key) const {
    return lookup(compact_, key);
}

KeyLookup UnitIndex::by_name(std::string_view lowered_name) const {
    return lookup(names_, lowered_name);
}

} // namespace Armory
