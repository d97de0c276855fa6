#include <matching/exception_list.hpp>
#include <utils/files.hpp>
#include <utils/logger.hpp>
#include <utils/text.hpp>
#include <cstdio>

namespace Armory {

namespace {

constexpr const char* kHeader = "external_id,candidate_name,computed_slug,tonnage,reason";

std::string format_tonnage(double t) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%g", t);
    return buf;
}

std::string to_csv(const std::vector<Unmatched>& entries) {
    std::string out = std::string(kHeader) + "\n";
    for (const auto& u : entries) {
        out += std::to_string(u.external_id) + "," + csv_escape(u.candidate_name) + "," +
               csv_escape(u.computed_slug) + "," + format_tonnage(u.tonnage) + "," + to_string(u.reason) + "\n";
    }
    return out;
}

} // namespace

std::string csv_escape(const std::string& field) {
    if (field.find_first_of(",\"\n") == std::string::npos) return field;
    std::string out = "\"";
    for (char c : field) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

std::vector<std::string> csv_split(const std::string& line) {
    std::vector<std::string> fields;
    std::string cur;
    bool quoted = false;
    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (quoted) {
            if (c == '"' && i + 1 < line.size() && line[i + 1] == '"') {
                cur += '"';
                ++i;
            } else if (c == '"') {
                quoted = false;
            } else {
                cur += c;
            }
        } else if (c == '"') {
            quoted = true;
        } else if (c == ',') {
            fields.push_back(std::move(cur));
            cur.clear();
        } else if (c != '\r') {
            cur += c;
        }
    }
    fields.push_back(std::move(cur));
    return fields;
}

ExceptionList::ExceptionList(std::filesystem::path path) : path_(std::move(path)) {}

std::vector<Unmatched> ExceptionList::load() const {
    std::vector<Unmatched> entries;
    auto content = read_file(path_);
    if (!content) return entries;

    bool header = true;
    for (const auto& line : split(*content, '\n')) {
        if (trim(line).empty()) continue;
        if (header) {
            header = false;
            continue;
        }
        auto f = csv_split(line);
        auto id = parse_int(f[0]);
        if (!id || f.size() < 5) {
            Logger::warn("Skipping malformed line in " + path_.string() + ": " + line);
            continue;
        }
        Unmatched u;
        u.external_id = *id;
        u.candidate_name = f[1];
        u.computed_slug = f[2];
        u.tonnage = parse_double(f[3]).value_or(0.0);
        u.reason = unmatched_reason_from_string(trim(f[4])).value_or(UnmatchedReason::NoMatch);
        entries.push_back(std::move(u));
    }
    return entries;
}

std::set<int> ExceptionList::external_ids() const {
    std::set<int> ids;
    for (const auto& u : load()) ids.insert(u.external_id);
    return ids;
}

size_t ExceptionList::append(const std::vector<Unmatched>& entries) {
    std::vector<Unmatched> all = load();
    std::set<int> known;
    for (const auto& u : all) known.insert(u.external_id);

    size_t added = 0;
    for (const auto& u : entries) {
        if (known.insert(u.external_id).second) {
            all.push_back(u);
            ++added;
        }
    }
    if (added > 0 || !read_file(path_)) rewrite(all);
    return added;
}

void ExceptionList::reconcile(const std::set<int>& resolved, const std::vector<Unmatched>& entries) {
    std::set<int> reported;
    for (const auto& u : entries) reported.insert(u.external_id);

    std::vector<Unmatched> kept;
    for (auto& u : load()) {
        if (resolved.count(u.external_id) || reported.count(u.external_id)) continue;
        kept.push_back(std::move(u));
    }
    size_t carried = kept.size();
    kept.insert(kept.end(), entries.begin(), entries.end());
    if (carried > 0) {
        Logger::info("Kept " + std::to_string(carried) + " unmatched entries not seen in this run");
    }
    rewrite(kept);
}

void ExceptionList::rewrite(const std::vector<Unmatched>& entries) {
    write_file_atomic(path_, to_csv(entries));
}

} // namespace Armory
