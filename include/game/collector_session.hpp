#pragma once

#include "core/config.hpp"
#include "network/packet.hpp"
#include "game/action_packet.hpp"
#include "game/entity.hpp"
#include "game/entity_classifier.hpp"
#include "game/name_resolver.hpp"
#include "game/zone_manager.hpp"
#include "stats/behavior_aggregator.hpp"
#include "stats/damage_tracker.hpp"
#include "stats/spawn_tracker.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace trustwatch {
namespace game {

/**
 * Counters for the status command.
 */
struct SessionStats {
    uint64_t packetsSeen = 0;
    uint64_t actionsDecoded = 0;
    uint64_t actionsDropped = 0;       // malformed
    uint64_t announcementsSkipped = 0;
    uint64_t actionsRecorded = 0;      // per target/action effect
    uint64_t unknownActors = 0;
    uint64_t entityUpdates = 0;
};

/**
 * Drives the collector from host events: incoming chunks, the per-frame
 * tick and login/logout/zone lifecycle. Everything runs on the caller's
 * thread; a packet is fully processed before handlePacket() returns.
 */
class CollectorSession {
public:
    /**
     * `entities` is the session's view of the world: entity update packets
     * refresh it and the classifier reads it. Party membership and the
     * player id are the host's to maintain.
     */
    CollectorSession(const core::CollectorConfig& config,
                     EntityManager& entities,
                     const NameResolver& names);

    CollectorSession(const CollectorSession&) = delete;
    CollectorSession& operator=(const CollectorSession&) = delete;

    // ---- Host events ----

    /** Incoming chunk; ignored while tracking is off. */
    void handlePacket(network::Packet& packet);

    /** Per-frame tick. Runs the party scan and autosave when due. */
    void update(float deltaTime);

    void onZoneChange(const std::string& zoneName);
    void onZoneChange(uint16_t zoneId);
    void onLogin();
    void onLogout();

    // ---- Commands ----

    void start();
    /** Stop tracking and save. False if the save failed. */
    bool stop();
    /** Write every profile and spawn table. False if any summary or spawn table could not be written. */
    bool save();
    /** Clear profiles, spawn tables and cached classifications. */
    void reset();
    size_t scanParty();

    /** Handle "start", "status", "detail <name>", ... and return the output lines. */
    std::vector<std::string> handleCommand(const std::string& commandLine);

    // ---- State ----

    bool isTracking() const { return tracking_; }
    const SessionStats& stats() const { return stats_; }
    const core::CollectorConfig& config() const { return config_; }

    EntityClassifier& classifier() { return classifier_; }
    const EntityClassifier& classifier() const { return classifier_; }
    stats::BehaviorAggregator& aggregator() { return aggregator_; }
    const stats::BehaviorAggregator& aggregator() const { return aggregator_; }
    const stats::SpawnTracker& spawnTracker() const { return spawns_; }
    const stats::DamageTracker& damageTracker() const { return damage_; }
    ZoneManager& zoneManager() { return zones_; }

private:
    void handleAction(network::Packet& packet);
    void handleEntityUpdate(network::Packet& packet);
    void handleZoneIn(network::Packet& packet);

    void recordActions(const stats::ProfileKey& key, const ActionPacketData& data);
    void recordPlayerDamage(const ActionPacketData& data);
    void onEntityRegistered(EntityClass cls, const ClassifiedEntity& entity);

    std::vector<std::string> statusLines() const;
    std::vector<std::string> helpLines() const;

    core::CollectorConfig config_;
    EntityManager& entities_;
    ZoneManager zones_;

    EntityClassifier classifier_;
    stats::BehaviorAggregator aggregator_;
    stats::SpawnTracker spawns_;
    stats::DamageTracker damage_;

    bool tracking_ = true;
    float timeSinceLastPartyScan_ = 0.0f;
    float timeSinceLastSave_ = 0.0f;
    SessionStats stats_;
};

} // namespace game
} // namespace trustwatch
