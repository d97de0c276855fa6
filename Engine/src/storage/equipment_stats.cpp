#include <storage/equipment_stats.hpp>
#include <storage/format_utils.hpp>
#include <core/errors.hpp>
#include <utils/logger.hpp>
#include <cstdio>
#include <map>

namespace Armory {

namespace {

// The curated stats file uses readable slugs; the archive names equipment by
// its internal lookup names, which slugify differently.
const std::map<std::string, std::string>& archive_slug_aliases() {
    static const std::map<std::string, std::string> kAliases = {
        {"clan-er-large-laser", "clerlargelaser"},
        {"clan-er-medium-laser", "clermediumlaser"},
        {"clan-er-small-laser", "clersmalllaser"},
        {"clan-er-ppc", "clerppc"},
        {"clan-large-pulse-laser", "cllargepulselaser"},
        {"clan-medium-pulse-laser", "clmediumpulselaser"},
        {"clan-small-pulse-laser", "clsmallpulselaser"},
        {"clan-er-flamer", "clerflamer"},
        {"clan-plasma-cannon", "clplasmacannon"},
        {"pulse-large-laser", "islargepulselaser"},
        {"pulse-medium-laser", "ismediumpulselaser"},
        {"pulse-small-laser", "issmallpulselaser"},
        {"ultra-autocannon-2", "isultraac2"},
        {"ultra-autocannon-5", "isultraac5"},
        {"ultra-autocannon-10", "isultraac10"},
        {"ultra-autocannon-20", "isultraac20"},
        {"rotary-autocannon-5", "isrotaryac5"},
        {"light-autocannon-5", "light-ac-5"},
        {"clan-ultra-autocannon-2", "clultraac2"},
        {"clan-ultra-autocannon-5", "clultraac5"},
        {"clan-ultra-autocannon-10", "clultraac10"},
        {"clan-ultra-autocannon-20", "clultraac20"},
        {"clan-lb-2-x-ac", "cllbxac2"},
        {"clan-lb-5-x-ac", "cllbxac5"},
        {"clan-lb-10-x-ac", "cllbxac10"},
        {"clan-lb-20-x-ac", "cllbxac20"},
        {"clan-gauss-rifle", "clgaussrifle"},
        {"clan-srm-2", "clsrm2"},
        {"clan-srm-4", "clsrm4"},
        {"clan-srm-6", "clsrm6"},
        {"clan-lrm-5", "cllrm5"},
        {"clan-lrm-10", "cllrm10"},
        {"clan-lrm-15", "cllrm15"},
        {"clan-lrm-20", "cllrm20"},
        {"clan-streak-srm-2", "clstreaksrm2"},
        {"clan-streak-srm-4", "clstreaksrm4"},
        {"clan-streak-srm-6", "clstreaksrm6"},
        {"clan-arrow-iv", "clarrowiv"},
        {"narc-missile-beacon", "narc"},
        {"guardian-ecm-suite", "isguardianecmsuite"},
        {"clan-ecm-suite", "clecmsuite"},
        {"beagle-active-probe", "beagleactiveprobe"},
        {"clan-active-probe", "clactiveprobe"},
        {"clan-anti-missile-system", "clantimissilesystem"},
        {"targeting-computer", "istargeting-computer"},
        {"artemis-iv-fcs", "isartemisiv"},
        {"c3-master-computer", "isc3mastercomputer"},
        {"c3-slave-unit", "isc3slaveunit"},
    };
    return kAliases;
}

template <typename T>
std::optional<T> opt_field(const nlohmann::json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) return std::nullopt;
    return it->template get<T>();
}

SqlParam sql_decimal(const std::optional<double>& v) {
    if (!v) return std::nullopt;
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.2f", *v);
    return std::string(buf);
}


} // namespace

std::vector<EquipmentStats> parse_equipment_stats(const std::string& json_text) {
    std::vector<EquipmentStats> out;
    try {
        auto doc = nlohmann::json::parse(json_text);
        if (!doc.is_array()) throw SetupError("Equipment stats must be a JSON array");
        for (const auto& obj : doc) {
            EquipmentStats s;
            s.slug = obj.at("slug").get<std::string>();
            s.tonnage = opt_field<double>(obj, "tonnage");
            s.crits = opt_field<int>(obj, "crits");
            s.damage = opt_field<std::string>(obj, "damage");
            s.heat = opt_field<int>(obj, "heat");
            s.range_min = opt_field<int>(obj, "range_min");
            s.range_short = opt_field<int>(obj, "range_short");
            s.range_medium = opt_field<int>(obj, "range_medium");
            s.range_long = opt_field<int>(obj, "range_long");
            s.bv = opt_field<int>(obj, "bv");
            out.push_back(std::move(s));
        }
    } catch (const nlohmann::json::exception& e) {
        throw SetupError(std::string("Malformed equipment stats: ") + e.what());
    }
    return out;
}

std::optional<std::string> archive_equipment_slug(const std::string& curated_slug) {
    const auto& aliases = archive_slug_aliases();
    auto it = aliases.find(curated_slug);
    if (it == aliases.end()) return std::nullopt;
    return it->second;
}

EquipmentStatsImporter::EquipmentStatsImporter(PostgresConnection& db) : db_(db) {}

StatsImportSummary EquipmentStatsImporter::import(const std::vector<EquipmentStats>& entries, bool force) {
    static const char* kForceSql = R"(
        UPDATE equipment SET
            tonnage = $2::numeric, crits = $3::int, damage = $4, heat = $5::int,
            range_min = $6::int, range_short = $7::int, range_medium = $8::int, range_long = $9::int,
            bv = $10::int, stats_source = 'seed', stats_updated_at = NOW()
        WHERE id = $1::int
    )";

    // Fill only what is missing; rows that are already complete are left alone.
    static const char* kFillSql = R"(
        UPDATE equipment SET
            tonnage      = COALESCE(tonnage, $2::numeric),
            crits        = COALESCE(crits, $3::int),
            damage       = COALESCE(damage, $4),
            heat         = COALESCE(heat, $5::int),
            range_min    = COALESCE(range_min, $6::int),
            range_short  = COALESCE(range_short, $7::int),
            range_medium = COALESCE(range_medium, $8::int),
            range_long   = COALESCE(range_long, $9::int),
            bv           = COALESCE(bv, $10::int),
            stats_source = 'seed',
            stats_updated_at = NOW()
        WHERE id = $1::int
          AND (tonnage IS NULL OR crits IS NULL OR damage IS NULL OR heat IS NULL
               OR range_min IS NULL OR range_short IS NULL OR range_medium IS NULL
               OR range_long IS NULL OR bv IS NULL)
    )";

    StatsImportSummary summary;
    for (const auto& entry : entries) {
        auto id = db_.query_single("SELECT id FROM equipment WHERE slug = $1", {entry.slug});
        if (!id) {
            if (auto alt = archive_equipment_slug(entry.slug)) {
                id = db_.query_single("SELECT id FROM equipment WHERE slug = $1", {*alt});
                if (id) ++summary.alias_hits;
            }
        }
        if (!id) {
            Logger::warn("No equipment row for " + entry.slug);
            ++summary.not_found;
            continue;
        }

        long n = db_.execute(force ? kForceSql : kFillSql, {
            *id, sql_decimal(entry.tonnage), sql_int(entry.crits), sql_text(entry.damage),
            sql_int(entry.heat), sql_int(entry.range_min), sql_int(entry.range_short),
            sql_int(entry.range_medium), sql_int(entry.range_long), sql_int(entry.bv),
        });
        if (n > 0) ++summary.updated;
        else ++summary.unchanged;
    }

    Logger::success("Equipment stats: " + std::to_string(summary.updated) + " updated, " +
                    std::to_string(summary.unchanged) + " unchanged, " +
                    std::to_string(summary.not_found) + " not found, " +
                    std::to_string(summary.alias_hits) + " via alias");
    return summary;
}

} // namespace Armory
