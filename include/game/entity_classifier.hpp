#pragma once

#include "game/entity.hpp"
#include <cstdint>
#include <functional>
#include <string>
#include <unordered_map>
#include <unordered_set>

namespace trustwatch {
namespace game {

enum class EntityClass : uint8_t {
    TRUST,
    MOB,
    PLAYER,
    UNKNOWN
};

const char* entityClassName(EntityClass cls);

/**
 * Registration record for a Trust or Mob id. `zone` is empty for trusts.
 */
struct ClassifiedEntity {
    uint32_t id = 0;
    uint16_t index = 0;
    std::string name;
    uint32_t modelId = 0;
    std::string zone;
};

/**
 * Decides whether an entity id is a Trust (NPC in our party), a Mob (any
 * other NPC) or a Player.
 *
 * Answers are sticky: once an id is classified it is never looked at
 * again until onZoneChange(), because ids are only stable within one zone.
 * Ids the directory cannot resolve, and NPCs whose name has not arrived
 * yet, are reported UNKNOWN and retried on the next call.
 */
class EntityClassifier {
public:
    using RegistrationCallback = std::function<void(EntityClass, const ClassifiedEntity&)>;

    explicit EntityClassifier(const EntityDirectory& directory);

    EntityClass classify(uint32_t entityId);

    /**
     * Register NPC party members that are not classified yet as trusts.
     * Returns the number of new registrations.
     */
    size_t scanParty();

    /** Drop every cached classification and enter `zoneName`. */
    void onZoneChange(const std::string& zoneName);
    const std::string& currentZone() const { return zone_; }

    /** Drop cached classifications without changing zone. */
    void clearCaches();

    const ClassifiedEntity* trustInfo(uint32_t entityId) const;
    const ClassifiedEntity* mobInfo(uint32_t entityId) const;
    bool isCached(uint32_t entityId) const;

    const std::unordered_map<uint32_t, ClassifiedEntity>& trusts() const { return trusts_; }
    size_t trustCount() const { return trusts_.size(); }
    size_t mobCount() const { return mobs_.size(); }
    size_t playerCount() const { return players_.size(); }

    // Called once per newly registered Trust or Mob id
    void setRegistrationCallback(RegistrationCallback cb) { registrationCallback_ = std::move(cb); }

private:
    ClassifiedEntity makeRecord(const EntityInfo& info, bool scoped) const;
    void registerTrust(const EntityInfo& info, const char* how);

    const EntityDirectory& directory_;
    std::string zone_;

    std::unordered_map<uint32_t, ClassifiedEntity> trusts_;
    std::unordered_map<uint32_t, ClassifiedEntity> mobs_;
    std::unordered_set<uint32_t> players_;

    RegistrationCallback registrationCallback_;
};

} // namespace game
} // namespace trustwatch
