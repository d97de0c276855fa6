#pragma once

#include <database/postgres_connection.hpp>
#include <utils/text.hpp>
#include <cstdint>
#include <cstdio>
#include <optional>
#include <string>
#include <vector>

namespace Armory {

// Shared formatting utilities for the stores: C++ values to libpq text
// parameters and back.

inline SqlParam sql_text(const std::string& v) { return v; }

inline SqlParam sql_text(const std::optional<std::string>& v) { return v; }

inline SqlParam sql_int(int64_t v) { return std::to_string(v); }

inline SqlParam sql_int(const std::optional<int>& v) {
    if (!v) return std::nullopt;
    return std::to_string(*v);
}

inline SqlParam sql_int(const std::optional<int64_t>& v) {
    if (!v) return std::nullopt;
    return std::to_string(*v);
}

inline SqlParam sql_bool(bool v) { return std::string(v ? "true" : "false"); }

// One decimal is the schema's tonnage precision.
inline SqlParam sql_tonnage(double v) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.1f", v);
    return std::string(buf);
}

// PostgreSQL array literal for text[]; elements are double-quoted and escaped.
inline std::string pg_text_array(const std::vector<std::string>& values) {
    std::string out = "{";
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) out += ',';
        out += '"';
        for (char c : values[i]) {
            if (c == '"' || c == '\\') out += '\\';
            out += c;
        }
        out += '"';
    }
    out += '}';
    return out;
}

inline std::optional<int64_t> row_int64(const SqlRow& row, size_t col) {
    if (col >= row.size() || !row[col]) return std::nullopt;
    return parse_int64(*row[col]);
}

inline std::optional<int> row_int(const SqlRow& row, size_t col) {
    if (col >= row.size() || !row[col]) return std::nullopt;
    return parse_int(*row[col]);
}

inline bool row_bool(const SqlRow& row, size_t col) {
    return col < row.size() && row[col] && (*row[col] == "t" || *row[col] == "true");
}

inline std::optional<std::string> row_text(const SqlRow& row, size_t col) {
    if (col >= row.size()) return std::nullopt;
    return row[col];
}

} // namespace Armory
