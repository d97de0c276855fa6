#include <storage/reference_store.hpp>
#include <catalog/reference_data.hpp>
#include <storage/format_utils.hpp>
#include <core/errors.hpp>
#include <utils/files.hpp>
#include <utils/logger.hpp>

namespace Armory {

ReferenceStore::ReferenceStore(PostgresConnection& db) : db_(db) {}

void ReferenceStore::apply_schema(const std::filesystem::path& script) {
    auto sql = read_file(script);
    if (!sql) throw SetupError("Cannot read schema script " + script.string());
    db_.execute(*sql);
    Logger::success("Schema applied from " + script.string());
}

SeedSummary ReferenceStore::seed(const ComponentCatalog& catalog) {
    SeedSummary summary;
    PostgresConnection::Transaction tx(db_);
    summary.types_written = seed_types(catalog);
    summary.aliases_written = seed_aliases(catalog);
    summary.eras_written = seed_eras();
    summary.factions_written = seed_factions();
    tx.commit();

    Logger::info("Reference data: " + std::to_string(summary.types_written) + " types, " +
                 std::to_string(summary.aliases_written) + " aliases, " +
                 std::to_string(summary.eras_written) + " eras, " +
                 std::to_string(summary.factions_written) + " factions written");
    return summary;
}

size_t ReferenceStore::seed_types(const ComponentCatalog& catalog) {
    size_t written = 0;
    for (ComponentCategory category : kComponentCategories) {
        const std::string table = type_table(category);
        const std::string sql =
            "INSERT INTO " + table + " (id, slug, name, tech_base, rules_level, intro_year, properties) "
            "VALUES ($1::int, $2, $3, $4::tech_base_enum, $5::rules_level_enum, $6::int, $7::jsonb) "
            "ON CONFLICT (id) DO UPDATE SET "
            "slug = EXCLUDED.slug, name = EXCLUDED.name, tech_base = EXCLUDED.tech_base, "
            "rules_level = EXCLUDED.rules_level, intro_year = EXCLUDED.intro_year, "
            "properties = EXCLUDED.properties "
            "WHERE (" + table + ".slug, " + table + ".name, " + table + ".tech_base, " +
            table + ".rules_level, " + table + ".intro_year, " + table + ".properties) "
            "IS DISTINCT FROM (EXCLUDED.slug, EXCLUDED.name, EXCLUDED.tech_base, "
            "EXCLUDED.rules_level, EXCLUDED.intro_year, EXCLUDED.properties)";

        for (const auto& type : catalog.types(category)) {
            std::string props = type.properties.is_null() ? "{}" : type.properties.dump();
            written += static_cast<size_t>(db_.execute(sql, {
                sql_int(static_cast<int64_t>(type.id)), type.slug, type.name,
                std::string(to_string(type.tech_base)), std::string(to_string(type.rules_level)),
                sql_int(type.intro_year), props,
            }));
        }
    }
    return written;
}

size_t ReferenceStore::seed_aliases(const ComponentCatalog& catalog) {
    size_t written = 0;
    for (ComponentCategory category : kComponentCategories) {
        const std::string table = alias_table(category);
        const std::string column = id_column(category);
        // A re-pointed alias from an older catalog version is moved, not duplicated.
        const std::string sql =
            "INSERT INTO " + table + " (alias, " + column + ") VALUES ($1, $2::int) "
            "ON CONFLICT (alias) DO UPDATE SET " + column + " = EXCLUDED." + column +
            " WHERE " + table + "." + column + " IS DISTINCT FROM EXCLUDED." + column;

        for (const auto& [alias, id] : catalog.aliases(category)) {
            written += static_cast<size_t>(db_.execute(sql, {alias, sql_int(static_cast<int64_t>(id))}));
        }
    }
    return written;
}

size_t ReferenceStore::seed_eras() {
    size_t written = 0;
    for (const auto& era : builtin_eras()) {
        written += static_cast<size_t>(db_.execute(R"(
            INSERT INTO eras (slug, name, start_year, end_year, description)
            VALUES ($1, $2, $3::int, $4::int, $5)
            ON CONFLICT (slug) DO UPDATE SET
                name = EXCLUDED.name, start_year = EXCLUDED.start_year,
                end_year = EXCLUDED.end_year, description = EXCLUDED.description
            WHERE (eras.name, eras.start_year, eras.end_year, eras.description)
                IS DISTINCT FROM (EXCLUDED.name, EXCLUDED.start_year, EXCLUDED.end_year, EXCLUDED.description)
        )", {
            std::string(era.slug), std::string(era.name), sql_int(static_cast<int64_t>(era.start_year)),
            sql_int(era.end_year), std::string(era.description),
        }));
    }
    return written;
}

size_t ReferenceStore::seed_factions() {
    size_t written = 0;
    for (const auto& f : builtin_factions()) {
        // A seeded faction that was earlier auto-created from catalog data is adopted.
        written += static_cast<size_t>(db_.execute(R"(
            INSERT INTO factions (slug, name, short_name, faction_type, is_clan, auto_created)
            VALUES ($1, $2, $3, $4, $5::boolean, false)
            ON CONFLICT (slug) DO UPDATE SET
                name = EXCLUDED.name, short_name = EXCLUDED.short_name,
                faction_type = EXCLUDED.faction_type, is_clan = EXCLUDED.is_clan,
                auto_created = false
            WHERE (factions.name, factions.short_name, factions.faction_type, factions.is_clan, factions.auto_created)
                IS DISTINCT FROM (EXCLUDED.name, EXCLUDED.short_name, EXCLUDED.faction_type, EXCLUDED.is_clan, false)
        )", {
            std::string(f.slug), std::string(f.name), std::string(f.short_name),
            std::string(f.faction_type), sql_bool(f.is_clan),
        }));
    }
    return written;
}

bool ReferenceStore::record_dataset(const std::string& version, const std::string& description) {
    long n = db_.execute(R"(
        INSERT INTO dataset_metadata (version, catalog_version, description)
        VALUES ($1, $2::int, $3)
        ON CONFLICT (version) DO NOTHING
    )", {version, sql_int(static_cast<int64_t>(kCatalogVersion)), description});
    return n > 0;
}

} // namespace Armory
