/**
 * @file matcher.cpp
 * @brief Match tiers and chain evaluation
 */

#include <matching/matcher.hpp>
#include <core/errors.hpp>
#include <utils/text.hpp>
#include <nlohmann/json.hpp>

namespace Armory {

const char* to_string(UnmatchedReason r) {
    switch (r) {
        case UnmatchedReason::NoMatch:               return "no-match";
        case UnmatchedReason::Ambiguous:             return "ambiguous";
        case UnmatchedReason::OverrideTargetMissing: return "override-target-missing";
        case UnmatchedReason::TargetAlreadyMatched:  return "target-already-matched";
    }
    return "no-match";
}

std::optional<UnmatchedReason> unmatched_reason_from_string(std::string_view s) {
    for (auto r : {UnmatchedReason::NoMatch, UnmatchedReason::Ambiguous,
                   UnmatchedReason::OverrideTargetMissing, UnmatchedReason::TargetAlreadyMatched}) {
        if (s == to_string(r)) return r;
    }
    return std::nullopt;
}

std::vector<std::string> name_variants(std::string_view name) {
    std::vector<std::string> out;
    auto push = [&](std::string v) {
        v = collapse_whitespace(v);
        if (v.empty()) return;
        for (const auto& existing : out) {
            if (existing == v) return;
        }
        out.push_back(std::move(v));
    };

    std::string trimmed = trim(name);
    push(trimmed);

    size_t open = trimmed.find('(');
    size_t close = open == std::string::npos ? std::string::npos : trimmed.find(')', open);
    if (open == std::string::npos || close == std::string::npos) return out;

    std::string before = trim(std::string_view(trimmed).substr(0, open));
    std::string inside = trim(std::string_view(trimmed).substr(open + 1, close - open - 1));
    std::string after = trim(std::string_view(trimmed).substr(close + 1));

    if (!before.empty() && !inside.empty()) {
        push(after.empty() ? before : before + " " + after);
        push(after.empty() ? inside : inside + " " + after);
    }

    size_t last_open = trimmed.rfind('(');
    push(trim(std::string_view(trimmed).substr(0, last_open)));
    return out;
}

// =============================================================================
// Strategies
// =============================================================================

OverrideStrategy::OverrideStrategy(std::map<int, std::string> overrides)
    : overrides_(std::move(overrides)) {}

StrategyResult OverrideStrategy::match(const CatalogRecord& record, const UnitIndex& index) const {
    auto it = overrides_.find(record.external_id);
    if (it == overrides_.end()) return StrategyResult::miss();
    if (const IndexedUnit* unit = index.by_slug(it->second)) return StrategyResult::hit(unit);
    return StrategyResult::decline(UnmatchedReason::OverrideTargetMissing);
}

StrategyResult ExactSlugStrategy::match(const CatalogRecord& record, const UnitIndex& index) const {
    if (const IndexedUnit* unit = index.by_slug(slugify(record.name))) return StrategyResult::hit(unit);
    return StrategyResult::miss();
}

StrategyResult NormalizedSlugStrategy::match(const CatalogRecord& record, const UnitIndex& index) const {
    std::optional<UnmatchedReason> declined;
    for (const auto& variant : name_variants(record.name)) {
        KeyLookup found = index.by_compact(compact_key(variant));
        if (found) return StrategyResult::hit(found.unit);
        if (found.ambiguous && !declined) declined = UnmatchedReason::Ambiguous;
    }
    return declined ? StrategyResult::decline(*declined) : StrategyResult::miss();
}

StrategyResult FullNameStrategy::match(const CatalogRecord& record, const UnitIndex& index) const {
    KeyLookup found = index.by_name(UnitIndex::name_key(record.name));
    if (found) return StrategyResult::hit(found.unit);
    if (found.ambiguous) return StrategyResult::decline(UnmatchedReason::Ambiguous);
    return StrategyResult::miss();
}

// =============================================================================
// Matcher
// =============================================================================

Matcher::Matcher(const UnitIndex& index, std::map<int, std::string> overrides) : index_(index) {
    strategies_.push_back(std::make_unique<OverrideStrategy>(std::move(overrides)));
    strategies_.push_back(std::make_unique<ExactSlugStrategy>());
    strategies_.push_back(std::make_unique<NormalizedSlugStrategy>());
    strategies_.push_back(std::make_unique<FullNameStrategy>());
}

void Matcher::add_strategy(std::unique_ptr<MatchStrategy> strategy) {
    strategies_.push_back(std::move(strategy));
}

MatchOutcome Matcher::match(const CatalogRecord& record) const {
    MatchOutcome outcome;
    std::optional<UnmatchedReason> declined;

    for (const auto& strategy : strategies_) {
        StrategyResult r = strategy->match(record, index_);
        if (r.unit) {
            outcome.unit = r.unit;
            outcome.strategy = strategy->name();
            return outcome;
        }
        if (r.declined && !declined) declined = r.declined;
    }

    outcome.unmatched = Unmatched{record.external_id, record.name, slugify(record.name), record.tonnage,
                                  declined.value_or(UnmatchedReason::NoMatch)};
    return outcome;
}

std::map<int, std::string> parse_overrides(const std::string& json_text) {
    auto doc = nlohmann::json::parse(json_text, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        throw SetupError("Overrides must be a JSON object of external id -> unit slug");
    }
    std::map<int, std::string> out;
    for (auto it = doc.begin(); it != doc.end(); ++it) {
        auto id = parse_int(it.key());
        if (!id || !it->is_string()) throw SetupError("Bad override entry: " + it.key());
        out[*id] = it->get<std::string>();
    }
    return out;
}

} // namespace Armory
