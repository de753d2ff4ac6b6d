#include "game/entity.hpp"
#include "core/logger.hpp"

namespace trustwatch {
namespace game {

void EntityManager::addEntity(const EntityInfo& entity) {
    if (entity.id == 0) {
        LOG_WARNING("Attempted to add entity with id 0 (", entity.name, ")");
        return;
    }

    entities[entity.id] = entity;

    LOG_DEBUG("Added entity: id=", entity.id, " name=", entity.name,
              " npc=", entity.isNpc ? "yes" : "no", " model=", entity.modelId);
}

void EntityManager::removeEntity(uint32_t id) {
    auto it = entities.find(id);
    if (it != entities.end()) {
        LOG_DEBUG("Removed entity: id=", id);
        entities.erase(it);
    }
    party_.erase(id);
}

bool EntityManager::updatePosition(uint32_t id, const glm::vec3& position) {
    auto it = entities.find(id);
    if (it == entities.end()) return false;
    it->second.position = position;
    return true;
}

const EntityInfo* EntityManager::findEntity(uint32_t id) const {
    auto it = entities.find(id);
    return (it != entities.end()) ? &it->second : nullptr;
}

bool EntityManager::hasEntity(uint32_t id) const {
    return entities.find(id) != entities.end();
}

void EntityManager::setPartyMembers(const std::vector<uint32_t>& ids) {
    party_.clear();
    for (uint32_t id : ids) {
        addPartyMember(id);
    }
}

void EntityManager::addPartyMember(uint32_t id) {
    if (id == 0 || id == playerId_) return;
    party_.insert(id);
}

void EntityManager::removePartyMember(uint32_t id) {
    party_.erase(id);
}

bool EntityManager::isPartyMember(uint32_t id) const {
    return party_.count(id) != 0;
}

std::vector<uint32_t> EntityManager::partyMemberIds() const {
    return std::vector<uint32_t>(party_.begin(), party_.end());
}

} // namespace game
} // namespace trustwatch
