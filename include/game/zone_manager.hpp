#pragma once

#include <string>
#include <cstdint>
#include <unordered_map>

namespace trustwatch {
namespace game {

struct ZoneInfo {
    uint16_t id = 0;
    std::string name;
};

/**
 * Zone id -> display name. Mob profiles and spawn tables are keyed by the
 * name, so unknown ids still get a stable synthetic one.
 */
class ZoneManager {
public:
    void initialize();

    /**
     * Merge a JSON object of the form {"100": "West Ronfaure", ...}.
     * Returns the number of zones read, 0 on failure.
     */
    size_t loadFromFile(const std::string& path);

    void registerZone(uint16_t id, const std::string& name);
    const ZoneInfo* getZoneInfo(uint16_t zoneId) const;

    /** Registered name, or "Zone <id>". */
    std::string getZoneName(uint16_t zoneId) const;

    size_t getZoneCount() const { return zones.size(); }

private:
    std::unordered_map<uint16_t, ZoneInfo> zones;
};

} // namespace game
} // namespace trustwatch
