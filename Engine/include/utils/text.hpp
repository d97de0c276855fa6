/**
 * @file text.hpp
 * @brief String helpers shared by the parsers, resolver and matcher
 */

#pragma once

#include <export.hpp>
#include <string>
#include <string_view>
#include <vector>
#include <optional>

namespace Armory {

std::string trim(std::string_view s);
std::string to_lower(std::string_view s);
std::string to_upper(std::string_view s);
std::vector<std::string> split(std::string_view s, char delim);

bool starts_with(std::string_view s, std::string_view prefix);
bool ends_with(std::string_view s, std::string_view suffix);
bool istarts_with(std::string_view s, std::string_view prefix);
bool contains(std::string_view s, std::string_view needle);

/**
 * @brief Deterministic identifier for a display name.
 *
 * ASCII alphanumerics are lowercased; every run of other characters becomes
 * a single hyphen; no leading or trailing hyphen.
 * "Atlas AS7-D" -> "atlas-as7-d".
 */
ARMORY_API std::string slugify(std::string_view s);

/**
 * @brief Alias lookup key: trimmed and ASCII case-folded.
 */
ARMORY_API std::string normalize_label(std::string_view s);

/**
 * @brief Lowercase alphanumerics only. Equal for names that differ only in
 * case, spacing or punctuation ("AS7-D" and "as7 d").
 */
ARMORY_API std::string compact_key(std::string_view s);

/**
 * @brief Collapse internal whitespace runs to one space and trim.
 */
std::string collapse_whitespace(std::string_view s);

std::optional<int> parse_int(std::string_view s);
std::optional<long long> parse_int64(std::string_view s);
std::optional<double> parse_double(std::string_view s);

} // namespace Armory
