#pragma once

#include "stats/reservoir.hpp"
#include <glm/glm.hpp>
#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace trustwatch {
namespace stats {

struct SpawnLimits {
    size_t positionCap = 20;
    float minSpacing = 5.0f;   // compared squared on the x/z plane
};

/**
 * One named entity seen in a zone.
 */
struct ZoneEntityEntry {
    std::string name;
    uint32_t modelId = 0;
    bool hasModel = false;
    uint32_t count = 0;
    Reservoir<glm::vec3> positions;

    ZoneEntityEntry() = default;
    explicit ZoneEntityEntry(size_t positionCap) : positions(positionCap) {}
};

using ZoneSpawnTable = std::map<std::string, ZoneEntityEntry>;

/**
 * Per-zone spawn table built from entity update packets.
 *
 * Positions are kept only if they are at least minSpacing away (on the
 * x/z plane, y is height) from every position already stored for the
 * same name, which leaves a sparse sketch of the patrol area.
 */
class SpawnTracker {
public:
    explicit SpawnTracker(SpawnLimits limits = {});

    /** Returns true if a position sample was stored. */
    bool observe(const std::string& zone, const std::string& name, uint32_t modelId,
                 const std::optional<glm::vec3>& position);

    const ZoneSpawnTable* zone(const std::string& zoneName) const;
    const std::map<std::string, ZoneSpawnTable>& zones() const { return zones_; }
    size_t zoneCount() const { return zones_.size(); }

    void reset() { zones_.clear(); }

    /** Truncate each component toward zero at two decimals. */
    static glm::vec3 truncatePosition(const glm::vec3& position);

private:
    bool farFromAll(const ZoneEntityEntry& entry, const glm::vec3& position) const;

    SpawnLimits limits_;
    std::map<std::string, ZoneSpawnTable> zones_;
};

} // namespace stats
} // namespace trustwatch
