#include <ingestion/run_report.hpp>
#include <utils/files.hpp>

namespace Armory {

namespace {

nlohmann::json failures_json(const std::vector<EntryFailure>& failures) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& f : failures) {
        arr.push_back({{"entry", f.entry}, {"reason", f.reason}});
    }
    return arr;
}

} // namespace

nlohmann::json RunReport::to_json() const {
    nlohmann::json gaps_json = nlohmann::json::array();
    for (const auto& g : gaps) {
        gaps_json.push_back({
            {"unit", g.unit_slug},
            {"category", to_string(g.category)},
            {"raw_label", g.raw_label ? nlohmann::json(*g.raw_label) : nlohmann::json(nullptr)},
            {"status", to_string(g.status)},
        });
    }

    return {
        {"run_id", run_id},
        {"source", source},
        {"started_at", started_at},
        {"finished_at", finished_at},
        {"completed", completed},
        {"aborted", aborted},
        {"counts", {
            {"entries", entries},
            {"created", created},
            {"updated", updated},
            {"unchanged", unchanged},
            {"skipped", skipped},
            {"parse_failures", parse_failures},
            {"failed", failed},
            {"equipment_created", equipment_created},
            {"resolution_gaps", gaps.size()},
        }},
        {"parse_errors", failures_json(parse_errors)},
        {"persistence_errors", failures_json(persistence_errors)},
        {"resolution_gaps", gaps_json},
    };
}

std::filesystem::path RunReport::write(const std::filesystem::path& dir) const {
    auto path = dir / (run_id + "-report.json");
    write_file_atomic(path, to_json().dump(2) + "\n");
    return path;
}

} // namespace Armory
