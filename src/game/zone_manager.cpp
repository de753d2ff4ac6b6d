#include "game/zone_manager.hpp"
#include "core/logger.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <cstdlib>

namespace trustwatch {
namespace game {

void ZoneManager::initialize() {
    // Starter nations and the surrounding field zones
    registerZone(100, "West Ronfaure");
    registerZone(101, "East Ronfaure");
    registerZone(102, "La Theine Plateau");
    registerZone(103, "Valkurm Dunes");
    registerZone(104, "Jugner Forest");
    registerZone(105, "Batallia Downs");
    registerZone(106, "North Gustaberg");
    registerZone(107, "South Gustaberg");
    registerZone(108, "Konschtat Highlands");
    registerZone(109, "Pashhow Marshlands");
    registerZone(110, "Rolanberry Fields");
    registerZone(111, "Beaucedine Glacier");
    registerZone(112, "Xarcabard");
    registerZone(113, "Cape Teriggan");
    registerZone(114, "Eastern Altepa Desert");
    registerZone(115, "West Sarutabaruta");
    registerZone(116, "East Sarutabaruta");
    registerZone(117, "Tahrongi Canyon");
    registerZone(118, "Buburimu Peninsula");
    registerZone(119, "Meriphataud Mountains");
    registerZone(120, "Sauromugue Champaign");

    registerZone(230, "Southern San d'Oria");
    registerZone(231, "Northern San d'Oria");
    registerZone(232, "Port San d'Oria");
    registerZone(234, "Bastok Mines");
    registerZone(235, "Bastok Markets");
    registerZone(236, "Port Bastok");
    registerZone(238, "Windurst Waters");
    registerZone(239, "Windurst Walls");
    registerZone(240, "Port Windurst");
    registerZone(241, "Windurst Woods");
    registerZone(243, "Ru'Lude Gardens");
    registerZone(244, "Upper Jeuno");
    registerZone(245, "Lower Jeuno");
    registerZone(246, "Port Jeuno");

    LOG_INFO("Zone manager initialized: ", zones.size(), " zones");
}

size_t ZoneManager::loadFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        LOG_ERROR("Failed to open zone table: ", path);
        return 0;
    }

    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        LOG_ERROR("Failed to parse zone table JSON: ", e.what());
        return 0;
    }
    if (!doc.is_object()) {
        LOG_ERROR("Zone table is not an object: ", path);
        return 0;
    }

    size_t loaded = 0;
    for (auto& [key, val] : doc.items()) {
        if (!val.is_string()) continue;
        char* end = nullptr;
        unsigned long id = std::strtoul(key.c_str(), &end, 10);
        if (end == key.c_str() || id > 0xFFFF) {
            LOG_WARNING("Zone table: skipping key '", key, "'");
            continue;
        }
        registerZone(static_cast<uint16_t>(id), val.get<std::string>());
        ++loaded;
    }

    LOG_INFO("Loaded zone table: ", loaded, " zones from ", path);
    return loaded;
}

void ZoneManager::registerZone(uint16_t id, const std::string& name) {
    ZoneInfo info;
    info.id = id;
    info.name = name;
    zones[id] = std::move(info);
}

const ZoneInfo* ZoneManager::getZoneInfo(uint16_t zoneId) const {
    auto it = zones.find(zoneId);
    if (it != zones.end()) {
        return &it->second;
    }
    return nullptr;
}

std::string ZoneManager::getZoneName(uint16_t zoneId) const {
    if (const ZoneInfo* info = getZoneInfo(zoneId)) {
        return info->name;
    }
    return "Zone " + std::to_string(zoneId);
}

} // namespace game
} // namespace trustwatch
