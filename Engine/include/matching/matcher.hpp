/**
 * @file matcher.hpp
 * @brief Ordered identity-resolution chain from catalog records to units
 */

#pragma once

#include <export.hpp>
#include <external/catalog_records.hpp>
#include <matching/unit_index.hpp>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace Armory {

enum class UnmatchedReason {
    NoMatch,
    Ambiguous,
    OverrideTargetMissing,
    TargetAlreadyMatched
};

const char* to_string(UnmatchedReason r);
std::optional<UnmatchedReason> unmatched_reason_from_string(std::string_view s);

struct Unmatched {
    int external_id = 0;
    std::string candidate_name;
    std::string computed_slug;
    double tonnage = 0.0;
    UnmatchedReason reason = UnmatchedReason::NoMatch;
};

/**
 * @brief What one tier concluded: a unit, nothing, or a reason it had to
 * decline a candidate (which the chain reports if no later tier hits).
 */
struct StrategyResult {
    const IndexedUnit* unit = nullptr;
    std::optional<UnmatchedReason> declined;

    static StrategyResult hit(const IndexedUnit* u) { return {u, std::nullopt}; }
    static StrategyResult miss() { return {}; }
    static StrategyResult decline(UnmatchedReason r) { return {nullptr, r}; }
};

class MatchStrategy {
public:
    virtual ~MatchStrategy() = default;

    virtual const char* name() const = 0;

    virtual StrategyResult match(const CatalogRecord& record, const UnitIndex& index) const = 0;
};

/// External id -> unit slug from an operator-maintained table.
class OverrideStrategy : public MatchStrategy {
public:
    explicit OverrideStrategy(std::map<int, std::string> overrides);

    const char* name() const override { return "override"; }
    StrategyResult match(const CatalogRecord& record, const UnitIndex& index) const override;

private:
    std::map<int, std::string> overrides_;
};

/// slugify(name) equals a unit slug.
class ExactSlugStrategy : public MatchStrategy {
public:
    const char* name() const override { return "exact-slug"; }
    StrategyResult match(const CatalogRecord& record, const UnitIndex& index) const override;
};

/**
 * @brief Compact keys equal. Tries the name itself, then both halves of a
 * dual name ("Dasher (Fire Moth) A" -> "Dasher A", "Fire Moth A"), then the
 * name without a trailing parenthetical ("Awesome AWS-8Q (Smith)").
 */
class NormalizedSlugStrategy : public MatchStrategy {
public:
    const char* name() const override { return "normalized-slug"; }
    StrategyResult match(const CatalogRecord& record, const UnitIndex& index) const override;
};

/// Case-insensitive full name equality.
class FullNameStrategy : public MatchStrategy {
public:
    const char* name() const override { return "full-name"; }
    StrategyResult match(const CatalogRecord& record, const UnitIndex& index) const override;
};

struct MatchOutcome {
    const IndexedUnit* unit = nullptr;
    std::string strategy;            // tier that hit
    std::optional<Unmatched> unmatched;
};

/**
 * @brief Runs strategies in order; the first hit wins. With no hit the
 * reason is the first tier's decline, or no-match.
 */
class ARMORY_API Matcher {
public:
    /// Override, exact slug, normalized slug, full name.
    Matcher(const UnitIndex& index, std::map<int, std::string> overrides);

    void add_strategy(std::unique_ptr<MatchStrategy> strategy);

    MatchOutcome match(const CatalogRecord& record) const;

    const std::vector<std::unique_ptr<MatchStrategy>>& strategies() const { return strategies_; }

private:
    const UnitIndex& index_;
    std::vector<std::unique_ptr<MatchStrategy>> strategies_;
};

/// Name variants tried by NormalizedSlugStrategy, in order.
std::vector<std::string> name_variants(std::string_view name);

/**
 * @brief {"<external id>": "<unit slug>"}. Throws SetupError for malformed
 * JSON or a non-numeric key.
 */
ARMORY_API std::map<int, std::string> parse_overrides(const std::string& json_text);

} // namespace Armory
