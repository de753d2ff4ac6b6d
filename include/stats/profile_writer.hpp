#pragma once

#include "stats/behavior_aggregator.hpp"
#include "stats/spawn_tracker.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace trustwatch {
namespace stats {

/**
 * JSON export and console reports for collected profiles.
 */
class ProfileWriter {
public:
    static nlohmann::json toJson(const ProfileSnapshot& snapshot);
    static nlohmann::json summaryJson(const BehaviorAggregator& aggregator);
    static nlohmann::json spawnTableJson(const std::string& zone, const ZoneSpawnTable& table);

    /**
     * Write one file per profile with data, plus _summary.json, into
     * `outputDir` (created if needed). Returns the number of profile files
     * written, or -1 if the directory or summary could not be written.
     */
    static int saveAll(const BehaviorAggregator& aggregator, const std::string& outputDir);

    /** Write <zone>_spawns.json per zone. Returns files written, -1 on failure. */
    static int saveSpawnTables(const SpawnTracker& tracker, const std::string& outputDir);

    /** Letters, digits, spaces and '-' survive; spaces become '_'. */
    static std::string sanitizeFilename(const std::string& name);
    static std::string fileNameFor(const ProfileKey& key);

    static std::vector<std::string> summaryLines(const BehaviorAggregator& aggregator);

    /**
     * Detail report for the first profile whose name matches exactly, then
     * case-insensitively, then as a substring.
     */
    static std::vector<std::string> detailLines(const BehaviorAggregator& aggregator,
                                                const std::string& search);

private:
    static bool writeJsonFile(const std::string& path, const nlohmann::json& doc);
};

} // namespace stats
} // namespace trustwatch
