#pragma once

#include <glm/glm.hpp>
#include <cstdint>
#include <string>
#include <map>
#include <optional>
#include <set>
#include <vector>

namespace trustwatch {
namespace game {

/**
 * What the client currently knows about one entity.
 */
struct EntityInfo {
    uint32_t id = 0;
    uint16_t index = 0;
    std::string name;
    uint32_t modelId = 0;
    bool isNpc = false;
    std::optional<glm::vec3> position;
};

/**
 * Lookup interface onto the client's entity and party state.
 *
 * findEntity() returns nullptr when the id cannot be resolved right now
 * (out of range, not yet spawned). The pointer is only valid until the
 * next mutation of the directory.
 */
class EntityDirectory {
public:
    virtual ~EntityDirectory() = default;

    virtual const EntityInfo* findEntity(uint32_t id) const = 0;
    virtual bool isPartyMember(uint32_t id) const = 0;
    virtual std::vector<uint32_t> partyMemberIds() const = 0;
    virtual uint32_t playerId() const = 0;
};

/**
 * Entity manager for tracking all entities in view.
 *
 * In-memory EntityDirectory fed from entity update packets or a roster
 * file; the replay tool and tests drive the classifier through it.
 */
class EntityManager : public EntityDirectory {
public:
    // Add or replace entity
    void addEntity(const EntityInfo& entity);

    // Remove entity (also leaves the party)
    void removeEntity(uint32_t id);

    // Refresh position of a known entity; unknown ids are ignored
    bool updatePosition(uint32_t id, const glm::vec3& position);

    const EntityInfo* findEntity(uint32_t id) const override;
    bool hasEntity(uint32_t id) const;

    // Party membership (up to five other members, like p1..p5)
    void setPartyMembers(const std::vector<uint32_t>& ids);
    void addPartyMember(uint32_t id);
    void removePartyMember(uint32_t id);
    bool isPartyMember(uint32_t id) const override;
    std::vector<uint32_t> partyMemberIds() const override;

    void setPlayerId(uint32_t id) { playerId_ = id; }
    uint32_t playerId() const override { return playerId_; }

    const std::map<uint32_t, EntityInfo>& getEntities() const { return entities; }

    size_t getEntityCount() const { return entities.size(); }

private:
    std::map<uint32_t, EntityInfo> entities;
    std::set<uint32_t> party_;
    uint32_t playerId_ = 0;
};

} // namespace game
} // namespace trustwatch
