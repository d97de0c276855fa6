/**
 * @file catalog_merger.cpp
 * @brief Match, merge, availability and exception list bookkeeping
 */

#include <matching/catalog_merger.hpp>
#include <catalog/reference_data.hpp>
#include <core/errors.hpp>
#include <utils/files.hpp>
#include <utils/logger.hpp>
#include <utils/text.hpp>
#include <utils/time.hpp>
#include <algorithm>
#include <unordered_set>

namespace Armory {

CatalogMerger::CatalogMerger(MergeStore& store, ExceptionList& exceptions)
    : store_(store), exceptions_(exceptions) {}

int64_t CatalogMerger::faction_id(const std::string& name, MatchSummary& summary) {
    auto cached = factions_.find(name);
    if (cached != factions_.end()) return cached->second;

    std::optional<int64_t> id = store_.find_faction(name);
    if (!id) {
        if (auto slug = map_faction(name)) id = store_.find_faction(*slug);
    }
    if (!id) {
        NewFaction f{slugify(name), name, infer_faction_type(name), starts_with(name, "Clan ")};
        id = store_.create_faction(f);
        ++summary.factions_created;
        Logger::info("Created faction " + f.slug + " (" + f.faction_type + ")");
    }
    factions_[name] = *id;
    return *id;
}

size_t CatalogMerger::merge_availability(int64_t unit_id, const std::string& html, MatchSummary& summary) {
    std::vector<std::pair<int64_t, int64_t>> rows;
    for (const auto& note : parse_availability(html)) {
        auto era_slug = map_era(note.era_name);
        auto era = era_slug ? eras_.find(*era_slug) : eras_.end();
        if (era == eras_.end()) {
            if (summary.unmapped_eras.insert(note.era_name).second) {
                Logger::warn("Unmapped era: " + note.era_name);
            }
            continue;
        }
        rows.emplace_back(faction_id(note.faction_name, summary), era->second);
    }
    std::sort(rows.begin(), rows.end());
    rows.erase(std::unique(rows.begin(), rows.end()), rows.end());
    if (rows.empty()) return 0;
    return store_.upsert_availability(unit_id, rows);
}

MatchSummary CatalogMerger::run(const std::vector<CatalogRecord>& records, const MergeOptions& options) {
    MatchSummary summary;
    summary.run_id = options.run_id.empty() ? "match-" + utc_file_stamp() : options.run_id;
    summary.started_at = utc_timestamp();
    summary.records = records.size();

    UnitIndex index(store_.load_units());
    eras_ = store_.load_eras();
    factions_.clear();
    Matcher matcher(index, options.overrides);
    Logger::info("Matching " + std::to_string(records.size()) + " records against " +
                 std::to_string(index.size()) + " units");

    std::set<int> known = options.retry_unmatched ? std::set<int>{} : exceptions_.external_ids();
    std::unordered_set<int> seen;
    std::unordered_set<int64_t> claimed;
    std::set<int> merged;

    for (const auto& record : records) {
        if (!seen.insert(record.external_id).second) {
            ++summary.duplicates;
            continue;
        }
        if (known.count(record.external_id)) {
            ++summary.skipped_known;
            continue;
        }

        MatchOutcome outcome = matcher.match(record);
        if (!outcome.unit) {
            summary.unmatched.push_back(*outcome.unmatched);
            continue;
        }
        if (!claimed.insert(outcome.unit->id).second) {
            summary.unmatched.push_back({record.external_id, record.name, slugify(record.name),
                                         record.tonnage, UnmatchedReason::TargetAlreadyMatched});
            continue;
        }

        ++summary.matched;
        ++summary.matched_by_strategy[outcome.strategy];

        store_.begin();
        try {
            UnitCatalogFields current = store_.load_catalog_fields(outcome.unit->id);
            MergePlan plan = plan_merge(current, record, options.source, options.force);
            if (!plan.empty()) {
                store_.apply_merge(outcome.unit->id, plan, options.source);
                ++summary.units_updated;
                summary.fields_written += plan.field_count();
            }

            if (!options.skip_availability && options.detail_loader) {
                if (auto html = options.detail_loader(record.external_id)) {
                    summary.availability_rows += merge_availability(outcome.unit->id, *html, summary);
                }
            }
            store_.commit();
            merged.insert(record.external_id);
        } catch (const StoreError& e) {
            try {
                store_.rollback();
            } catch (const std::exception& rb) {
                Logger::error("Rollback failed: " + std::string(rb.what()));
            }
            // Factions created inside the rolled back transaction are gone.
            factions_.clear();
            ++summary.failed;
            summary.failures.push_back({record.external_id, e.what()});
            Logger::error("Merge failed for " + std::to_string(record.external_id) + " (" +
                          outcome.unit->slug + "): " + e.what());
        }
    }

    if (options.retry_unmatched) {
        exceptions_.reconcile(merged, summary.unmatched);
    } else {
        exceptions_.append(summary.unmatched);
    }

    summary.finished_at = utc_timestamp();
    Logger::success("Matched " + std::to_string(summary.matched) + "/" + std::to_string(summary.records) +
                    ", " + std::to_string(summary.unmatched.size()) + " unmatched, " +
                    std::to_string(summary.skipped_known) + " already listed, " +
                    std::to_string(summary.fields_written) + " fields written, " +
                    std::to_string(summary.availability_rows) + " availability rows, " +
                    std::to_string(summary.failed) + " failed");
    return summary;
}

nlohmann::json MatchSummary::to_json() const {
    nlohmann::json unmatched_json = nlohmann::json::array();
    for (const auto& u : unmatched) {
        unmatched_json.push_back({
            {"external_id", u.external_id},
            {"candidate_name", u.candidate_name},
            {"computed_slug", u.computed_slug},
            {"reason", to_string(u.reason)},
        });
    }
    nlohmann::json failures_json = nlohmann::json::array();
    for (const auto& f : failures) {
        failures_json.push_back({{"external_id", f.external_id}, {"reason", f.reason}});
    }

    return {
        {"run_id", run_id},
        {"started_at", started_at},
        {"finished_at", finished_at},
        {"counts", {
            {"records", records},
            {"duplicates", duplicates},
            {"skipped_known", skipped_known},
            {"matched", matched},
            {"unmatched", unmatched.size()},
            {"units_updated", units_updated},
            {"fields_written", fields_written},
            {"availability_rows", availability_rows},
            {"factions_created", factions_created},
            {"failed", failed},
        }},
        {"matched_by_strategy", matched_by_strategy},
        {"unmapped_eras", unmapped_eras},
        {"unmatched", unmatched_json},
        {"failures", failures_json},
    };
}

std::filesystem::path MatchSummary::write(const std::filesystem::path& dir) const {
    auto path = dir / (run_id + "-report.json");
    write_file_atomic(path, to_json().dump(2) + "\n");
    return path;
}

} // namespace Armory
