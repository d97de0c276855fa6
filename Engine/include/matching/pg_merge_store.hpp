#pragma once

#include <database/postgres_connection.hpp>
#include <matching/merge_store.hpp>

namespace Armory {

/**
 * @brief MergeStore on libpq. Merged columns carry their provenance in the
 * matching *_source column of units.
 */
class PgMergeStore : public MergeStore {
public:
    explicit PgMergeStore(PostgresConnection& db);

    std::vector<IndexedUnit> load_units() override;
    std::map<std::string, int64_t> load_eras() override;

    void begin() override;
    void commit() override;
    void rollback() override;

    UnitCatalogFields load_catalog_fields(int64_t unit_id) override;
    void apply_merge(int64_t unit_id, const MergePlan& plan, const std::string& source) override;

    std::optional<int64_t> find_faction(const std::string& name_or_slug) override;
    int64_t create_faction(const NewFaction& faction) override;
    size_t upsert_availability(int64_t unit_id,
                               const std::vector<std::pair<int64_t, int64_t>>& rows) override;

private:
    PostgresConnection& db_;
};

} // namespace Armory
