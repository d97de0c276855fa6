/**
 * @file catalog_records.cpp
 * @brief Listing and detail page decoding
 */

#include <external/catalog_records.hpp>
#include <utils/text.hpp>
#include <nlohmann/json.hpp>
#include <cctype>
#include <stdexcept>

namespace Armory {

namespace {

std::optional<std::string> opt_string(const nlohmann::json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) return std::nullopt;
    std::string s = trim(it->get<std::string>());
    if (s.empty()) return std::nullopt;
    return s;
}

// {"Id": .., "Name": ".."} objects carry the display name.
std::optional<std::string> nested_name(const nlohmann::json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_object()) return std::nullopt;
    return opt_string(*it, "Name");
}

template <typename T>
std::optional<T> positive_number(const nlohmann::json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_number()) return std::nullopt;
    T v = it->get<T>();
    if (v <= 0) return std::nullopt;
    return v;
}

std::string strip_tags(std::string_view s) {
    std::string out;
    bool in_tag = false;
    for (char c : s) {
        if (c == '<') in_tag = true;
        else if (c == '>') in_tag = false;
        else if (!in_tag) out += c;
    }
    return out;
}

std::string decode_entities(std::string s) {
    static const std::pair<const char*, const char*> kEntities[] = {
        {"&amp;", "&"}, {"&quot;", "\""}, {"&#39;", "'"}, {"&apos;", "'"},
        {"&lt;", "<"}, {"&gt;", ">"}, {"&nbsp;", " "},
    };
    for (const auto& [from, to] : kEntities) {
        size_t pos = 0;
        std::string f(from);
        while ((pos = s.find(f, pos)) != std::string::npos) {
            s.replace(pos, f.size(), to);
            pos += std::string_view(to).size();
        }
    }
    return s;
}

std::string link_text(std::string_view inner) {
    return collapse_whitespace(decode_entities(strip_tags(inner)));
}

// Inner markup of the first <a ...>...</a> at or after pos, bounded by end.
std::optional<std::string_view> first_link(std::string_view html, size_t pos, size_t end) {
    size_t open = html.find("<a", pos);
    while (open != std::string_view::npos && open < end) {
        char next = open + 2 < html.size() ? html[open + 2] : '\0';
        if (next == ' ' || next == '>' || next == '\t' || next == '\n') break;
        open = html.find("<a", open + 2);
    }
    if (open == std::string_view::npos || open >= end) return std::nullopt;
    size_t gt = html.find('>', open);
    size_t close = html.find("</a>", gt == std::string_view::npos ? open : gt);
    if (gt == std::string_view::npos || close == std::string_view::npos || close > end) return std::nullopt;
    return html.substr(gt + 1, close - gt - 1);
}

// Offset of each element whose class attribute starts with the given classes.
std::vector<size_t> find_class(std::string_view html, std::string_view cls, size_t from, size_t to) {
    std::vector<size_t> out;
    std::string needle = "class=\"" + std::string(cls);
    size_t pos = html.find(needle, from);
    while (pos != std::string_view::npos && pos < to) {
        char after = html[pos + needle.size()];
        if (after == '"' || after == ' ') out.push_back(pos);
        pos = html.find(needle, pos + needle.size());
    }
    return out;
}

} // namespace

std::optional<int> intro_year_from_date(std::string_view date) {
    for (size_t i = 0; i + 4 <= date.size(); ++i) {
        bool digits = true;
        for (size_t j = 0; j < 4; ++j) {
            if (!std::isdigit(static_cast<unsigned char>(date[i + j]))) {
                digits = false;
                break;
            }
        }
        if (digits) return parse_int(date.substr(i, 4));
    }
    return std::nullopt;
}

std::vector<CatalogRecord> parse_listing(std::string_view json_text) {
    nlohmann::json doc = nlohmann::json::parse(json_text.begin(), json_text.end(), nullptr, false);
    if (doc.is_discarded()) throw std::invalid_argument("listing is not valid JSON");

    const nlohmann::json* units = nullptr;
    if (doc.is_array()) {
        units = &doc;
    } else if (doc.is_object()) {
        auto it = doc.find("Units");
        if (it == doc.end()) it = doc.find("units");
        if (it != doc.end() && it->is_array()) units = &*it;
    }
    if (!units) throw std::invalid_argument("listing has no Units array");

    std::vector<CatalogRecord> out;
    out.reserve(units->size());
    for (const auto& u : *units) {
        if (!u.is_object()) continue;
        auto id = u.find("Id");
        if (id == u.end() || !id->is_number_integer()) continue;
        auto name = opt_string(u, "Name");
        if (!name) continue;

        CatalogRecord rec;
        rec.external_id = id->get<int>();
        rec.name = *name;
        rec.class_name = opt_string(u, "Class");
        rec.variant = opt_string(u, "Variant");
        if (auto t = u.find("Tonnage"); t != u.end() && t->is_number()) rec.tonnage = t->get<double>();
        rec.battle_value = positive_number<int>(u, "BattleValue");
        rec.cost = positive_number<int64_t>(u, "Cost");
        rec.rules = opt_string(u, "Rules");
        rec.role = nested_name(u, "Role");
        if (auto date = opt_string(u, "DateIntroduced")) rec.intro_year = intro_year_from_date(*date);
        rec.technology = nested_name(u, "Technology");
        rec.unit_type = nested_name(u, "Type");
        out.push_back(std::move(rec));
    }
    return out;
}

std::vector<AvailabilityNote> parse_availability(std::string_view html) {
    std::vector<AvailabilityNote> notes;

    auto panels = find_class(html, "panel panel-default", 0, html.size());
    for (size_t i = 0; i < panels.size(); ++i) {
        size_t begin = panels[i];
        size_t end = i + 1 < panels.size() ? panels[i + 1] : html.size();

        auto headings = find_class(html, "panel-heading", begin, end);
        auto bodies = find_class(html, "panel-body", begin, end);
        if (headings.empty() || bodies.empty()) continue;

        auto heading = first_link(html, headings.front(), bodies.front());
        if (!heading) continue;
        std::string era = link_text(*heading);
        size_t paren = era.find('(');
        if (paren != std::string::npos) era = trim(std::string_view(era).substr(0, paren));
        if (era.empty()) continue;

        size_t tbody = html.find("<tbody", bodies.front());
        size_t pos = tbody == std::string_view::npos || tbody >= end ? bodies.front() : tbody;
        for (;;) {
            size_t row = html.find("<tr", pos);
            if (row == std::string_view::npos || row >= end) break;
            size_t row_end = html.find("</tr>", row);
            if (row_end == std::string_view::npos || row_end > end) row_end = end;

            if (auto link = first_link(html, row, row_end)) {
                std::string faction = link_text(*link);
                if (!faction.empty()) notes.push_back({era, faction});
            }
            pos = row_end;
        }
    }
    return notes;
}

std::optional<std::string> extract_alternate_name(std::string_view name) {
    size_t open = name.find('(');
    if (open == std::string_view::npos) return std::nullopt;
    size_t close = name.find(')', open);
    if (close == std::string_view::npos) return std::nullopt;

    std::string inner = trim(name.substr(open + 1, close - open - 1));
    std::string rest = trim(name.substr(close + 1));
    if (inner.empty() || rest.empty()) return std::nullopt;
    return inner + " " + rest;
}

} // namespace Armory
