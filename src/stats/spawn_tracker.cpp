#include "stats/spawn_tracker.hpp"
#include "core/logger.hpp"
#include <cmath>

namespace trustwatch {
namespace stats {

SpawnTracker::SpawnTracker(SpawnLimits limits) : limits_(limits) {}

glm::vec3 SpawnTracker::truncatePosition(const glm::vec3& position) {
    auto trunc2 = [](float v) {
        return static_cast<float>(std::trunc(static_cast<double>(v) * 100.0) / 100.0);
    };
    return glm::vec3(trunc2(position.x), trunc2(position.y), trunc2(position.z));
}

bool SpawnTracker::farFromAll(const ZoneEntityEntry& entry, const glm::vec3& position) const {
    double minSq = static_cast<double>(limits_.minSpacing) * limits_.minSpacing;
    for (const glm::vec3& p : entry.positions) {
        double dx = static_cast<double>(position.x) - p.x;
        double dz = static_cast<double>(position.z) - p.z;
        if (dx * dx + dz * dz < minSq) return false;
    }
    return true;
}

bool SpawnTracker::observe(const std::string& zone, const std::string& name, uint32_t modelId,
                           const std::optional<glm::vec3>& position) {
    auto& table = zones_[zone];
    auto it = table.find(name);
    if (it == table.end()) {
        ZoneEntityEntry entry(limits_.positionCap);
        entry.name = name;
        it = table.emplace(name, std::move(entry)).first;
        LOG_DEBUG("Spawn table ", zone, ": new entry ", name);
    }

    ZoneEntityEntry& entry = it->second;
    ++entry.count;
    if (!entry.hasModel) {
        entry.modelId = modelId;
        entry.hasModel = true;
    }

    if (!position || entry.positions.full()) return false;

    glm::vec3 truncated = truncatePosition(*position);
    if (!farFromAll(entry, truncated)) return false;
    return entry.positions.add(truncated);
}

const ZoneSpawnTable* SpawnTracker::zone(const std::string& zoneName) const {
    auto it = zones_.find(zoneName);
    return it != zones_.end() ? &it->second : nullptr;
}

} // namespace stats
} // namespace trustwatch
