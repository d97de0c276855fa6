/**
 * @file seed_equipment_stats.cpp
 * @brief Apply curated equipment statistics to ingested equipment rows
 */

#include <config/config.hpp>
#include <core/errors.hpp>
#include <database/postgres_connection.hpp>
#include <storage/equipment_stats.hpp>
#include <utils/files.hpp>
#include <utils/logger.hpp>
#include <iostream>
#include <string>

using namespace Armory;

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <equipment_stats.json> [--force]\n"
                  << "\nWithout --force only empty columns are filled.\n";
        return 1;
    }

    bool force = argc >= 3 && std::string(argv[2]) == "--force";

    try {
        auto text = read_file(argv[1]);
        if (!text) throw SetupError(std::string("Cannot read ") + argv[1]);
        auto entries = parse_equipment_stats(*text);
        Logger::info("Loaded " + std::to_string(entries.size()) + " equipment stats entries");

        PostgresConnection db(DbConfig::load_from_env());
        EquipmentStatsImporter importer(db);
        importer.import(entries, force);
        return 0;
    } catch (const std::exception& e) {
        Logger::error(e.what());
        return 1;
    }
}
