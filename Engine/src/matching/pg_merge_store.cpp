#include <matching/pg_merge_store.hpp>
#include <storage/format_utils.hpp>
#include <core/errors.hpp>

namespace Armory {

PgMergeStore::PgMergeStore(PostgresConnection& db) : db_(db) {}

std::vector<IndexedUnit> PgMergeStore::load_units() {
    std::vector<IndexedUnit> units;
    db_.query("SELECT id, slug, full_name FROM units ORDER BY id", {}, [&](const SqlRow& row) {
        units.push_back({row_int64(row, 0).value_or(0), row_text(row, 1).value_or(""),
                         row_text(row, 2).value_or("")});
    });
    return units;
}

std::map<std::string, int64_t> PgMergeStore::load_eras() {
    std::map<std::string, int64_t> eras;
    db_.query("SELECT slug, id FROM eras", {}, [&](const SqlRow& row) {
        if (auto slug = row_text(row, 0)) eras[*slug] = row_int64(row, 1).value_or(0);
    });
    return eras;
}

void PgMergeStore::begin() { db_.begin(); }
void PgMergeStore::commit() { db_.commit(); }
void PgMergeStore::rollback() { db_.rollback(); }

UnitCatalogFields PgMergeStore::load_catalog_fields(int64_t unit_id) {
    UnitCatalogFields f;
    bool found = false;
    db_.query(R"(
        SELECT bv, bv_source, cost, cost_source, role, role_source,
               clan_name, clan_name_source, mul_id, mul_id_source, intro_year, intro_year_source
        FROM units WHERE id = $1::int
    )", {sql_int(unit_id)}, [&](const SqlRow& row) {
        found = true;
        f.battle_value = {row_int(row, 0), row_text(row, 1)};
        f.cost = {row_int64(row, 2), row_text(row, 3)};
        f.role = {row_text(row, 4), row_text(row, 5)};
        f.alternate_name = {row_text(row, 6), row_text(row, 7)};
        f.external_id = {row_int(row, 8), row_text(row, 9)};
        f.intro_year = {row_int(row, 10), row_text(row, 11)};
    });
    if (!found) throw StoreError("Unit " + std::to_string(unit_id) + " disappeared during merge");
    return f;
}

void PgMergeStore::apply_merge(int64_t unit_id, const MergePlan& plan, const std::string& source) {
    SqlParams params = {sql_int(unit_id), source};
    std::string sets;

    auto add = [&](const char* column, const char* source_column, const char* cast, SqlParam value) {
        params.push_back(std::move(value));
        sets += std::string(column) + " = $" + std::to_string(params.size()) + cast + ", " +
                source_column + " = $2, ";
    };

    if (plan.battle_value) add("bv", "bv_source", "::int", sql_int(static_cast<int64_t>(*plan.battle_value)));
    if (plan.cost) add("cost", "cost_source", "::bigint", sql_int(*plan.cost));
    if (plan.role) add("role", "role_source", "", *plan.role);
    if (plan.alternate_name) add("clan_name", "clan_name_source", "", *plan.alternate_name);
    if (plan.external_id) add("mul_id", "mul_id_source", "::int", sql_int(static_cast<int64_t>(*plan.external_id)));
    if (plan.intro_year) add("intro_year", "intro_year_source", "::int", sql_int(static_cast<int64_t>(*plan.intro_year)));

    db_.execute("UPDATE units SET " + sets + "last_mul_import_at = NOW(), updated_at = NOW() "
                "WHERE id = $1::int", params);
}

std::optional<int64_t> PgMergeStore::find_faction(const std::string& name_or_slug) {
    auto id = db_.query_single("SELECT id FROM factions WHERE name = $1 OR slug = $1 ORDER BY id LIMIT 1",
                               {name_or_slug});
    if (!id) return std::nullopt;
    return parse_int64(*id);
}

int64_t PgMergeStore::create_faction(const NewFaction& faction) {
    auto id = db_.query_single(R"(
        INSERT INTO factions (slug, name, faction_type, is_clan, auto_created)
        VALUES ($1, $2, $3, $4::boolean, true)
        ON CONFLICT (slug) DO NOTHING
        RETURNING id
    )", {faction.slug, faction.name, faction.faction_type, sql_bool(faction.is_clan)});
    if (!id) id = db_.query_single("SELECT id FROM factions WHERE slug = $1", {faction.slug});
    if (!id) throw StoreError("Faction " + faction.slug + " could not be created");
    return parse_int64(*id).value_or(0);
}

size_t PgMergeStore::upsert_availability(int64_t unit_id,
                                         const std::vector<std::pair<int64_t, int64_t>>& rows) {
    size_t inserted = 0;
    for (const auto& [faction_id, era_id] : rows) {
        inserted += static_cast<size_t>(db_.execute(R"(
            INSERT INTO unit_availability (unit_id, faction_id, era_id)
            VALUES ($1::int, $2::int, $3::int)
            ON CONFLICT (unit_id, faction_id, era_id) DO NOTHING
        )", {sql_int(unit_id), sql_int(faction_id), sql_int(era_id)}));
    }
    return inserted;
}

} // namespace Armory
