#include <storage/pg_unit_store.hpp>
#include <storage/format_utils.hpp>
#include <core/errors.hpp>
#include <utils/text.hpp>

namespace Armory {

const char* to_string(UpsertStatus s) {
    switch (s) {
        case UpsertStatus::Created:   return "created";
        case UpsertStatus::Updated:   return "updated";
        case UpsertStatus::Unchanged: return "unchanged";
    }
    return "unchanged";
}

PgUnitStore::PgUnitStore(PostgresConnection& db) : db_(db) {}

void PgUnitStore::begin() { db_.begin(); }
void PgUnitStore::commit() { db_.commit(); }
void PgUnitStore::rollback() { db_.rollback(); }

UpsertResult PgUnitStore::upsert_returning(const std::string& upsert_sql, const SqlParams& params,
                                           const std::string& select_sql, const SqlParams& select_params) {
    UpsertResult result;
    bool returned = false;

    db_.query(upsert_sql, params, [&](const SqlRow& row) {
        result.id = row_int64(row, 0).value_or(0);
        result.status = row_bool(row, 1) ? UpsertStatus::Created : UpsertStatus::Updated;
        returned = true;
    });
    if (returned) return result;

    auto id = db_.query_single(select_sql, select_params);
    if (!id) throw StoreError("Upsert returned no row: " + select_sql);
    result.id = parse_int64(*id).value_or(0);
    result.status = UpsertStatus::Unchanged;
    return result;
}

UpsertResult PgUnitStore::upsert_chassis(const ParsedUnit& unit) {
    std::string slug = chassis_slug(unit);
    return upsert_returning(R"(
        INSERT INTO unit_chassis (slug, name, unit_type, tech_base, tonnage, intro_year, description)
        VALUES ($1, $2, $3, $4::tech_base_enum, $5, $6::int, $7)
        ON CONFLICT (slug) DO NOTHING
        RETURNING id, true
    )", {
        slug, unit.chassis, std::string(to_string(unit.unit_type)),
        std::string(to_string(unit.tech_base)), sql_tonnage(unit.tonnage),
        sql_int(unit.intro_year), sql_text(unit.description),
    }, "SELECT id FROM unit_chassis WHERE slug = $1", {slug});
}

UpsertResult PgUnitStore::upsert_unit(const ParsedUnit& unit, int64_t chassis_id) {
    std::string slug = unit_slug(unit);

    // intro_year is only written while no catalog or manual value owns it.
    return upsert_returning(R"(
        INSERT INTO units (slug, chassis_id, variant, full_name, tech_base, rules_level, tonnage,
                           intro_year, intro_year_source, source_book, description, archive_mul_id)
        VALUES ($1, $2::int, $3, $4, $5::tech_base_enum, $6::rules_level_enum, $7::numeric,
                $8::int, CASE WHEN $8::int IS NULL THEN NULL ELSE 'archive' END, $9, $10, $11::int)
        ON CONFLICT (slug) DO UPDATE SET
            chassis_id     = EXCLUDED.chassis_id,
            variant        = EXCLUDED.variant,
            full_name      = EXCLUDED.full_name,
            tech_base      = EXCLUDED.tech_base,
            rules_level    = EXCLUDED.rules_level,
            tonnage        = EXCLUDED.tonnage,
            intro_year     = CASE WHEN units.intro_year_source IN ('catalog', 'manual')
                                  THEN units.intro_year ELSE EXCLUDED.intro_year END,
            intro_year_source = CASE WHEN units.intro_year_source IN ('catalog', 'manual')
                                     THEN units.intro_year_source ELSE EXCLUDED.intro_year_source END,
            source_book    = EXCLUDED.source_book,
            description    = EXCLUDED.description,
            archive_mul_id = EXCLUDED.archive_mul_id,
            updated_at     = NOW()
        WHERE (units.chassis_id, units.variant, units.full_name, units.tech_base, units.rules_level,
               units.tonnage, units.source_book, units.description, units.archive_mul_id)
              IS DISTINCT FROM
              (EXCLUDED.chassis_id, EXCLUDED.variant, EXCLUDED.full_name, EXCLUDED.tech_base,
               EXCLUDED.rules_level, EXCLUDED.tonnage, EXCLUDED.source_book, EXCLUDED.description,
               EXCLUDED.archive_mul_id)
           OR (COALESCE(units.intro_year_source, 'archive') NOT IN ('catalog', 'manual')
               AND units.intro_year IS DISTINCT FROM EXCLUDED.intro_year)
        RETURNING id, (xmax = 0)
    )", {
        slug, sql_int(chassis_id), unit.model, full_name(unit),
        std::string(to_string(unit.tech_base)), std::string(to_string(unit.rules_level)),
        sql_tonnage(unit.tonnage), sql_int(unit.intro_year), sql_text(unit.source),
        sql_text(unit.description), sql_int(unit.mul_id),
    }, "SELECT id FROM units WHERE slug = $1", {slug});
}

bool PgUnitStore::replace_locations(int64_t unit_id, const std::vector<ParsedLocation>& locations) {
    std::vector<SqlRow> desired;
    for (const auto& loc : locations) {
        desired.push_back({std::string(to_string(loc.location)), sql_int(loc.armor),
                           sql_int(loc.rear_armor), sql_int(loc.structure)});
    }

    std::vector<SqlRow> current;
    db_.query(R"(
        SELECT location::text, armor_points::text, rear_armor::text, structure_points::text
        FROM unit_locations WHERE unit_id = $1::int ORDER BY position
    )", {sql_int(unit_id)}, [&](const SqlRow& row) { current.push_back(row); });

    if (current == desired) return false;

    db_.execute("DELETE FROM unit_locations WHERE unit_id = $1::int", {sql_int(unit_id)});
    for (size_t i = 0; i < locations.size(); ++i) {
        const auto& loc = locations[i];
        db_.execute(R"(
            INSERT INTO unit_locations (unit_id, location, armor_points, rear_armor, structure_points, position)
            VALUES ($1::int, $2::location_name_enum, $3::int, $4::int, $5::int, $6::int)
        )", {
            sql_int(unit_id), std::string(to_string(loc.location)), sql_int(loc.armor),
            sql_int(loc.rear_armor), sql_int(loc.structure), sql_int(static_cast<int64_t>(i)),
        });
    }
    return true;
}

std::optional<int64_t> PgUnitStore::find_equipment(const std::string& slug) {
    auto id = db_.query_single("SELECT id FROM equipment WHERE slug = $1", {slug});
    if (!id) return std::nullopt;
    return parse_int64(*id);
}

int64_t PgUnitStore::upsert_equipment(const EquipmentRecord& record) {
    UpsertResult r = upsert_returning(R"(
        INSERT INTO equipment (slug, name, category, tech_base, rules_level, ammo_for_id,
                               stats_source, stats_updated_at)
        VALUES ($1, $2, $3::equipment_category_enum, $4::tech_base_enum, $5::rules_level_enum,
                $6::int, 'inferred', NOW())
        ON CONFLICT (slug) DO NOTHING
        RETURNING id, true
    )", {
        record.slug, record.name, std::string(to_string(record.category)),
        std::string(to_string(record.tech_base)), std::string(to_string(record.rules_level)),
        sql_int(record.ammo_for_id),
    }, "SELECT id FROM equipment WHERE slug = $1", {record.slug});

    // A row first seen before its parent weapon gets the back-reference later.
    if (r.status == UpsertStatus::Unchanged && record.ammo_for_id) {
        db_.execute("UPDATE equipment SET ammo_for_id = $2::int WHERE id = $1::int AND ammo_for_id IS NULL",
                    {sql_int(r.id), sql_int(record.ammo_for_id)});
    }
    return r.id;
}

bool PgUnitStore::replace_loadout(int64_t unit_id, const std::vector<LoadoutRow>& rows) {
    std::vector<SqlRow> desired;
    for (const auto& row : rows) {
        SqlParam loc = row.location ? SqlParam(std::string(to_string(*row.location))) : std::nullopt;
        desired.push_back({sql_int(row.equipment_id), loc, sql_int(std::optional<int>(row.quantity)),
                           std::string(row.is_rear ? "t" : "f")});
    }

    std::vector<SqlRow> current;
    db_.query(R"(
        SELECT equipment_id::text, location::text, quantity::text, is_rear_facing::text
        FROM unit_loadout WHERE unit_id = $1::int ORDER BY position
    )", {sql_int(unit_id)}, [&](const SqlRow& row) {
        SqlRow normalized = row;
        // boolean::text renders as "true"/"false"
        if (normalized[3]) normalized[3] = std::string(*normalized[3] == "true" ? "t" : "f");
        current.push_back(std::move(normalized));
    });

    if (current == desired) return false;

    db_.execute("DELETE FROM unit_loadout WHERE unit_id = $1::int", {sql_int(unit_id)});
    for (size_t i = 0; i < rows.size(); ++i) {
        const auto& row = rows[i];
        db_.execute(R"(
            INSERT INTO unit_loadout (unit_id, equipment_id, location, quantity, is_rear_facing, position)
            VALUES ($1::int, $2::int, $3::location_name_enum, $4::int, $5::boolean, $6::int)
        )", {
            sql_int(unit_id), sql_int(row.equipment_id), desired[i][1],
            sql_int(std::optional<int>(row.quantity)), sql_bool(row.is_rear),
            sql_int(static_cast<int64_t>(i)),
        });
    }
    return true;
}

bool PgUnitStore::replace_quirks(int64_t unit_id, const std::vector<std::string>& quirk_slugs) {
    for (const auto& slug : quirk_slugs) {
        std::string name = slug;
        for (char& c : name) if (c == '-') c = ' ';
        db_.execute("INSERT INTO quirks (slug, name) VALUES ($1, $2) ON CONFLICT (slug) DO NOTHING",
                    {slug, name});
    }

    std::string slugs = pg_text_array(quirk_slugs);
    long removed = db_.execute(R"(
        DELETE FROM unit_quirks
        WHERE unit_id = $1::int
          AND quirk_id NOT IN (SELECT id FROM quirks WHERE slug = ANY($2::text[]))
    )", {sql_int(unit_id), slugs});

    long added = db_.execute(R"(
        INSERT INTO unit_quirks (unit_id, quirk_id)
        SELECT $1::int, id FROM quirks WHERE slug = ANY($2::text[])
        ON CONFLICT (unit_id, quirk_id) DO NOTHING
    )", {sql_int(unit_id), slugs});

    return removed + added > 0;
}

bool PgUnitStore::upsert_mech_data(int64_t unit_id, const ParsedMechData& mech,
                                   const MechResolution& resolution) {
    std::vector<std::string> unresolved;
    for (ComponentCategory c : resolution.unresolved()) unresolved.emplace_back(to_string(c));

    auto id_of = [&](ComponentCategory c) { return sql_int(resolution.get(c).canonical_id); };

    long affected = db_.execute(R"(
        INSERT INTO unit_mech_data (
            unit_id, config, is_omnimech, engine_rating, walk_mp, jump_mp, heat_sink_count,
            engine_type, armor_type, structure_type, heat_sink_type, gyro_type, cockpit_type, myomer_type,
            engine_type_id, armor_type_id, structure_type_id, heatsink_type_id,
            gyro_type_id, cockpit_type_id, myomer_type_id, unresolved_categories)
        VALUES ($1::int, $2, $3::boolean, $4::int, $5::int, $6::int, $7::int,
                $8, $9, $10, $11, $12, $13, $14,
                $15::int, $16::int, $17::int, $18::int, $19::int, $20::int, $21::int, $22::text[])
        ON CONFLICT (unit_id) DO UPDATE SET
            config = EXCLUDED.config, is_omnimech = EXCLUDED.is_omnimech,
            engine_rating = EXCLUDED.engine_rating, walk_mp = EXCLUDED.walk_mp,
            jump_mp = EXCLUDED.jump_mp, heat_sink_count = EXCLUDED.heat_sink_count,
            engine_type = EXCLUDED.engine_type, armor_type = EXCLUDED.armor_type,
            structure_type = EXCLUDED.structure_type, heat_sink_type = EXCLUDED.heat_sink_type,
            gyro_type = EXCLUDED.gyro_type, cockpit_type = EXCLUDED.cockpit_type,
            myomer_type = EXCLUDED.myomer_type,
            engine_type_id = EXCLUDED.engine_type_id, armor_type_id = EXCLUDED.armor_type_id,
            structure_type_id = EXCLUDED.structure_type_id, heatsink_type_id = EXCLUDED.heatsink_type_id,
            gyro_type_id = EXCLUDED.gyro_type_id, cockpit_type_id = EXCLUDED.cockpit_type_id,
            myomer_type_id = EXCLUDED.myomer_type_id,
            unresolved_categories = EXCLUDED.unresolved_categories
        WHERE (unit_mech_data.config, unit_mech_data.is_omnimech, unit_mech_data.engine_rating,
               unit_mech_data.walk_mp, unit_mech_data.jump_mp, unit_mech_data.heat_sink_count,
               unit_mech_data.engine_type, unit_mech_data.armor_type, unit_mech_data.structure_type,
               unit_mech_data.heat_sink_type, unit_mech_data.gyro_type, unit_mech_data.cockpit_type,
               unit_mech_data.myomer_type, unit_mech_data.engine_type_id, unit_mech_data.armor_type_id,
               unit_mech_data.structure_type_id, unit_mech_data.heatsink_type_id,
               unit_mech_data.gyro_type_id, unit_mech_data.cockpit_type_id,
               unit_mech_data.myomer_type_id, unit_mech_data.unresolved_categories)
              IS DISTINCT FROM
              (EXCLUDED.config, EXCLUDED.is_omnimech, EXCLUDED.engine_rating, EXCLUDED.walk_mp,
               EXCLUDED.jump_mp, EXCLUDED.heat_sink_count, EXCLUDED.engine_type, EXCLUDED.armor_type,
               EXCLUDED.structure_type, EXCLUDED.heat_sink_type, EXCLUDED.gyro_type,
               EXCLUDED.cockpit_type, EXCLUDED.myomer_type, EXCLUDED.engine_type_id,
               EXCLUDED.armor_type_id, EXCLUDED.structure_type_id, EXCLUDED.heatsink_type_id,
               EXCLUDED.gyro_type_id, EXCLUDED.cockpit_type_id, EXCLUDED.myomer_type_id,
               EXCLUDED.unresolved_categories)
    )", {
        sql_int(unit_id), mech.config, sql_bool(mech.is_omnimech), sql_int(mech.engine_rating),
        sql_int(mech.walk_mp), sql_int(mech.jump_mp), sql_int(mech.heat_sink_count),
        sql_text(mech.engine_type), sql_text(mech.armor_type), sql_text(mech.structure_type),
        sql_text(mech.heat_sink_type), sql_text(mech.gyro_type), sql_text(mech.cockpit_type),
        sql_text(mech.myomer_type),
        id_of(ComponentCategory::Engine), id_of(ComponentCategory::Armor),
        id_of(ComponentCategory::Structure), id_of(ComponentCategory::HeatSink),
        id_of(ComponentCategory::Gyro), id_of(ComponentCategory::Cockpit),
        id_of(ComponentCategory::Myomer), pg_text_array(unresolved),
    });
    return affected > 0;
}

void PgUnitStore::refresh_observed_locations() {
    db_.execute(R"(
        UPDATE equipment e SET observed_locations = sub.locs
        FROM (
            SELECT equipment_id,
                   array_agg(DISTINCT location::text ORDER BY location::text) AS locs
            FROM unit_loadout
            WHERE location IS NOT NULL
            GROUP BY equipment_id
        ) sub
        WHERE e.id = sub.equipment_id
          AND e.observed_locations IS DISTINCT FROM sub.locs
    )");
}

} // namespace Armory
