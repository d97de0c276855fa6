/**
 * @file reference_data.cpp
 * @brief Era and faction reference content
 */

#include <catalog/reference_data.hpp>
#include <utils/text.hpp>
#include <map>

namespace Armory {

const std::vector<EraSeed>& builtin_eras() {
    static const std::vector<EraSeed> eras = {
        {"age-of-war", "Age of War", 2398, 2570,
         "Interstellar warfare before the Star League."},
        {"star-league", "Star League", 2571, 2780,
         "The Star League era."},
        {"early-succession-wars", "Early Succession Wars", 2781, 2900,
         "First and Second Succession Wars."},
        {"late-succession-wars", "Late Succession Wars (LosTech)", 2901, 3019,
         "Third and early Fourth Succession Wars."},
        {"renaissance", "Renaissance", 3020, 3049,
         "Helm Memory Core recovery and the Fourth Succession War."},
        {"clan-invasion", "Clan Invasion", 3050, 3061,
         "Operation Revival and the Clan invasion corridor."},
        {"civil-war", "Civil War", 3062, 3067,
         "FedCom Civil War."},
        {"jihad", "Jihad", 3068, 3080,
         "Word of Blake Jihad."},
        {"dark-age", "Dark Age", 3081, 3150,
         "Republic of the Sphere and the HPG blackout."},
        {"ilclan", "ilClan", 3151, std::nullopt,
         "A new ilClan."},
    };
    return eras;
}

const std::vector<FactionSeed>& builtin_factions() {
    static const std::vector<FactionSeed> factions = {
        {"steiner", "Lyran Commonwealth", "LC", "great_house", false},
        {"davion", "Federated Suns", "FS", "great_house", false},
        {"kurita", "Draconis Combine", "DC", "great_house", false},
        {"marik", "Free Worlds League", "FWL", "great_house", false},
        {"liao", "Capellan Confederation", "CC", "great_house", false},
        {"star-league", "Star League", "SL", "star_league", false},
        {"comstar", "ComStar", "CS", "independent", false},
        {"word-of-blake", "Word of Blake", "WoB", "independent", false},
        {"republic", "Republic of the Sphere", "RS", "inner_sphere", false},
        {"clan-wolf", "Clan Wolf", "CW", "clan", true},
        {"clan-jade-falcon", "Clan Jade Falcon", "CJF", "clan", true},
        {"clan-ghost-bear", "Clan Ghost Bear", "CGB", "clan", true},
        {"clan-smoke-jaguar", "Clan Smoke Jaguar", "CSJ", "clan", true},
        {"clan-nova-cat", "Clan Nova Cat", "CNC", "clan", true},
        {"clan-steel-viper", "Clan Steel Viper", "CSV", "clan", true},
        {"clan-diamond-shark", "Clan Diamond Shark", "CDS", "clan", true},
        {"clan-goliath-scorpion", "Clan Goliath Scorpion", "CGS", "clan", true},
        {"clan-ice-hellion", "Clan Ice Hellion", "CIH", "clan", true},
        {"clan-star-adder", "Clan Star Adder", "CSA", "clan", true},
        {"clan-hell-horses", "Clan Hell's Horses", "CHH", "clan", true},
        {"clan-blood-spirit", "Clan Blood Spirit", "CBS", "clan", true},
        {"clan-coyote", "Clan Coyote", "CCY", "clan", true},
        {"clan-fire-mandrill", "Clan Fire Mandrill", "CFM", "clan", true},
        {"clan-mongoose", "Clan Mongoose", "CMG", "clan", true},
        {"clan-widowmaker", "Clan Widowmaker", "CWM", "clan", true},
        {"clan-wolverine", "Clan Wolverine", "CWOV", "clan", true},
        {"periphery-general", "Periphery (General)", "PER", "periphery", false},
        {"taurian-concordat", "Taurian Concordat", "TC", "periphery", false},
        {"magistracy-canopus", "Magistracy of Canopus", "MOC", "periphery", false},
        {"outworlds-alliance", "Outworlds Alliance", "OA", "periphery", false},
        {"marian-hegemony", "Marian Hegemony", "MH", "periphery", false},
        {"mercenary", "Mercenary", "MER", "mercenary", false},
        {"general", "General (All)", "GEN", "general", false},
    };
    return factions;
}

namespace {

std::optional<std::string> find_mapping(const std::map<std::string, std::string>& table,
                                        std::string_view name) {
    auto it = table.find(collapse_whitespace(name));
    if (it == table.end()) return std::nullopt;
    return it->second;
}

} // namespace

std::optional<std::string> map_era(std::string_view external_name) {
    static const std::map<std::string, std::string> kEras = {
        {"Age of War", "age-of-war"},
        {"Star League", "star-league"},
        {"Early Succession War", "early-succession-wars"},
        {"Early Succession Wars", "early-succession-wars"},
        {"Late Succession War - LosTech", "late-succession-wars"},
        {"Late Succession War - Renaissance", "renaissance"},
        {"Clan Invasion", "clan-invasion"},
        {"Civil War", "civil-war"},
        {"Jihad", "jihad"},
        {"Dark Age", "dark-age"},
        {"Early Republic", "dark-age"},
        {"Late Republic", "dark-age"},
        {"ilClan", "ilclan"},
    };
    return find_mapping(kEras, external_name);
}

std::optional<std::string> map_faction(std::string_view external_name) {
    static const std::map<std::string, std::string> kFactions = {
        {"Lyran Commonwealth", "steiner"},
        {"Lyran Alliance", "steiner"},
        {"Federated Suns", "davion"},
        {"Federated Commonwealth", "davion"},
        {"Draconis Combine", "kurita"},
        {"Free Worlds League", "marik"},
        {"Capellan Confederation", "liao"},
        {"Star League Regular", "star-league"},
        {"Star League Royal", "star-league"},
        {"Star League", "star-league"},
        {"ComStar", "comstar"},
        {"Word of Blake", "word-of-blake"},
        {"Republic of the Sphere", "republic"},
        {"Clan Wolf", "clan-wolf"},
        {"Clan Wolf (in Exile)", "clan-wolf"},
        {"Clan Jade Falcon", "clan-jade-falcon"},
        {"Clan Ghost Bear", "clan-ghost-bear"},
        {"Rasalhague Dominion", "clan-ghost-bear"},
        {"Clan Smoke Jaguar", "clan-smoke-jaguar"},
        {"Clan Nova Cat", "clan-nova-cat"},
        {"Clan Steel Viper", "clan-steel-viper"},
        {"Clan Diamond Shark", "clan-diamond-shark"},
        {"Clan Sea Fox", "clan-diamond-shark"},
        {"Clan Goliath Scorpion", "clan-goliath-scorpion"},
        {"Clan Ice Hellion", "clan-ice-hellion"},
        {"Clan Star Adder", "clan-star-adder"},
        {"Clan Hell's Horses", "clan-hell-horses"},
        {"Clan Blood Spirit", "clan-blood-spirit"},
        {"Clan Coyote", "clan-coyote"},
        {"Clan Fire Mandrill", "clan-fire-mandrill"},
        {"Clan Mongoose", "clan-mongoose"},
        {"Clan Widowmaker", "clan-widowmaker"},
        {"Clan Wolverine", "clan-wolverine"},
        {"Taurian Concordat", "taurian-concordat"},
        {"Magistracy of Canopus", "magistracy-canopus"},
        {"Outworlds Alliance", "outworlds-alliance"},
        {"Marian Hegemony", "marian-hegemony"},
        {"Inner Sphere General", "general"},
        {"Clan General", "general"},
        {"Mercenary", "mercenary"},
    };
    return find_mapping(kFactions, external_name);
}

std::string infer_faction_type(std::string_view name) {
    if (starts_with(name, "Clan ")) return "clan";
    for (const char* marker : {"Periphery", "Concordat", "Canopus", "Alliance", "Hegemony", "Magistracy"}) {
        if (contains(name, marker)) return "periphery";
    }
    if (contains(to_lower(name), "mercenary")) return "mercenary";
    return "other";
}

} // namespace Armory
