/**
 * @file text.cpp
 * @brief String helpers
 */

#include <utils/text.hpp>
#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>

namespace Armory {

static bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v';
}

static bool is_ascii_alnum(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9');
}

static char ascii_lower(char c) {
    return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

std::string trim(std::string_view s) {
    size_t first = 0;
    while (first < s.size() && is_space(s[first])) ++first;
    size_t last = s.size();
    while (last > first && is_space(s[last - 1])) --last;
    return std::string(s.substr(first, last - first));
}

std::string to_lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(), ascii_lower);
    return out;
}

std::string to_upper(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](char c) { return (c >= 'a' && c <= 'z') ? static_cast<char>(c - 'a' + 'A') : c; });
    return out;
}

std::vector<std::string> split(std::string_view s, char delim) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        size_t pos = s.find(delim, start);
        if (pos == std::string_view::npos) {
            parts.emplace_back(s.substr(start));
            break;
        }
        parts.emplace_back(s.substr(start, pos - start));
        start = pos + 1;
    }
    return parts;
}

bool starts_with(std::string_view s, std::string_view prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

bool ends_with(std::string_view s, std::string_view suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool istarts_with(std::string_view s, std::string_view prefix) {
    if (s.size() < prefix.size()) return false;
    for (size_t i = 0; i < prefix.size(); ++i) {
        if (ascii_lower(s[i]) != ascii_lower(prefix[i])) return false;
    }
    return true;
}

bool contains(std::string_view s, std::string_view needle) {
    return s.find(needle) != std::string_view::npos;
}

std::string slugify(std::string_view s) {
    std::string slug;
    slug.reserve(s.size());
    bool pending_hyphen = false;
    for (char c : s) {
        if (is_ascii_alnum(c)) {
            if (pending_hyphen && !slug.empty()) slug.push_back('-');
            slug.push_back(ascii_lower(c));
            pending_hyphen = false;
        } else {
            pending_hyphen = true;
        }
    }
    return slug;
}

std::string normalize_label(std::string_view s) {
    return to_lower(trim(s));
}

std::string compact_key(std::string_view s) {
    std::string key;
    key.reserve(s.size());
    for (char c : s) {
        if (is_ascii_alnum(c)) key.push_back(ascii_lower(c));
    }
    return key;
}

std::string collapse_whitespace(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    bool in_space = false;
    for (char c : s) {
        if (is_space(c)) {
            in_space = true;
            continue;
        }
        if (in_space && !out.empty()) out.push_back(' ');
        out.push_back(c);
        in_space = false;
    }
    return out;
}

std::optional<int> parse_int(std::string_view s) {
    std::string t = trim(s);
    if (!t.empty() && t[0] == '+') t.erase(0, 1);
    int value = 0;
    auto [ptr, ec] = std::from_chars(t.data(), t.data() + t.size(), value);
    if (ec != std::errc() || ptr != t.data() + t.size() || t.empty()) return std::nullopt;
    return value;
}

std::optional<long long> parse_int64(std::string_view s) {
    std::string t = trim(s);
    long long value = 0;
    auto [ptr, ec] = std::from_chars(t.data(), t.data() + t.size(), value);
    if (ec != std::errc() || ptr != t.data() + t.size() || t.empty()) return std::nullopt;
    return value;
}

std::optional<double> parse_double(std::string_view s) {
    std::string t = trim(s);
    if (t.empty()) return std::nullopt;
    char* end = nullptr;
    double value = std::strtod(t.c_str(), &end);
    if (end != t.c_str() + t.size()) return std::nullopt;
    return value;
}

} // namespace Armory
