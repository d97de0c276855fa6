#pragma once

#include <database/postgres_connection.hpp>
#include <storage/unit_store.hpp>

namespace Armory {

/**
 * @brief UnitStore on libpq with parameterized INSERT ... ON CONFLICT statements.
 *
 * Upserts carry a WHERE ... IS DISTINCT FROM guard so unchanged rows are not
 * rewritten; created vs updated comes from xmax on the returned row.
 */
class PgUnitStore : public UnitStore {
public:
    explicit PgUnitStore(PostgresConnection& db);

    void begin() override;
    void commit() override;
    void rollback() override;

    UpsertResult upsert_chassis(const ParsedUnit& unit) override;
    UpsertResult upsert_unit(const ParsedUnit& unit, int64_t chassis_id) override;
    bool replace_locations(int64_t unit_id, const std::vector<ParsedLocation>& locations) override;
    std::optional<int64_t> find_equipment(const std::string& slug) override;
    int64_t upsert_equipment(const EquipmentRecord& record) override;
    bool replace_loadout(int64_t unit_id, const std::vector<LoadoutRow>& rows) override;
    bool replace_quirks(int64_t unit_id, const std::vector<std::string>& quirk_slugs) override;
    bool upsert_mech_data(int64_t unit_id, const ParsedMechData& mech,
                          const MechResolution& resolution) override;
    void refresh_observed_locations() override;

private:
    PostgresConnection& db_;

    // Runs an upsert returning (id, inserted); falls back to select_sql when the
    // guard suppressed the update.
    UpsertResult upsert_returning(const std::string& upsert_sql, const SqlParams& params,
                                  const std::string& select_sql, const SqlParams& select_params);
};

} // namespace Armory
