/**
 * @file reference_store.hpp
 * @brief Schema application and idempotent seeding of reference data
 */

#pragma once

#include <catalog/component_catalog.hpp>
#include <database/postgres_connection.hpp>
#include <filesystem>
#include <string>

namespace Armory {

struct SeedSummary {
    size_t types_written = 0;
    size_t aliases_written = 0;
    size_t eras_written = 0;
    size_t factions_written = 0;
};

class ReferenceStore {
public:
    explicit ReferenceStore(PostgresConnection& db);

    /// Run the DDL script. Throws SetupError when it cannot be read.
    void apply_schema(const std::filesystem::path& script);

    /**
     * @brief Upsert every canonical entry and alias of the catalog, then the
     * builtin eras and factions, in one transaction.
     *
     * Re-running with the same catalog writes nothing.
     */
    SeedSummary seed(const ComponentCatalog& catalog);

    /// Record an ingested archive version. Returns false when already recorded.
    bool record_dataset(const std::string& version, const std::string& description);

private:
    PostgresConnection& db_;

    size_t seed_types(const ComponentCatalog& catalog);
    size_t seed_aliases(const ComponentCatalog& catalog);
    size_t seed_eras();
    size_t seed_factions();
};

} // namespace Armory
