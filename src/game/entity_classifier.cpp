#include "game/entity_classifier.hpp"
#include "core/logger.hpp"

namespace trustwatch {
namespace game {

const char* entityClassName(EntityClass cls) {
    switch (cls) {
        case EntityClass::TRUST:   return "trust";
        case EntityClass::MOB:     return "mob";
        case EntityClass::PLAYER:  return "player";
        case EntityClass::UNKNOWN: return "unknown";
    }
    return "unknown";
}

EntityClassifier::EntityClassifier(const EntityDirectory& directory)
    : directory_(directory) {}

ClassifiedEntity EntityClassifier::makeRecord(const EntityInfo& info, bool scoped) const {
    ClassifiedEntity record;
    record.id = info.id;
    record.index = info.index;
    record.name = info.name;
    record.modelId = info.modelId;
    if (scoped) record.zone = zone_;
    return record;
}

void EntityClassifier::registerTrust(const EntityInfo& info, const char* how) {
    ClassifiedEntity record = makeRecord(info, false);
    LOG_INFO("Tracking trust", how, ": ", record.name, " (ID: ", record.id,
             ", Model: ", record.modelId, ")");
    auto& stored = trusts_[info.id] = std::move(record);
    if (registrationCallback_) {
        registrationCallback_(EntityClass::TRUST, stored);
    }
}

EntityClass EntityClassifier::classify(uint32_t entityId) {
    if (trusts_.count(entityId)) return EntityClass::TRUST;
    if (mobs_.count(entityId)) return EntityClass::MOB;
    if (players_.count(entityId)) return EntityClass::PLAYER;

    const EntityInfo* info = directory_.findEntity(entityId);
    if (!info) {
        // Out of range or not spawned yet; ask again next time
        return EntityClass::UNKNOWN;
    }

    if (!info->isNpc) {
        players_.insert(entityId);
        return EntityClass::PLAYER;
    }

    // An NPC seen before its name arrived; profiles are keyed by name
    if (info->name.empty()) {
        return EntityClass::UNKNOWN;
    }

    if (directory_.isPartyMember(entityId)) {
        registerTrust(*info, " (lazy)");
        return EntityClass::TRUST;
    }

    ClassifiedEntity record = makeRecord(*info, true);
    LOG_DEBUG("Tracking mob: ", record.name, " (ID: ", record.id, ", Zone: ", record.zone, ")");
    auto& stored = mobs_[entityId] = std::move(record);
    if (registrationCallback_) {
        registrationCallback_(EntityClass::MOB, stored);
    }
    return EntityClass::MOB;
}

size_t EntityClassifier::scanParty() {
    size_t added = 0;
    uint32_t self = directory_.playerId();
    for (uint32_t id : directory_.partyMemberIds()) {
        if (id == 0 || id == self || isCached(id)) continue;
        const EntityInfo* info = directory_.findEntity(id);
        if (!info || !info->isNpc || info->name.empty()) continue;
        registerTrust(*info, "");
        ++added;
    }
    return added;
}

void EntityClassifier::onZoneChange(const std::string& zoneName) {
    clearCaches();
    zone_ = zoneName;
    LOG_INFO("Zone changed to '", zoneName, "'. Entity classifications cleared; will re-detect automatically.");
}

void EntityClassifier::clearCaches() {
    trusts_.clear();
    mobs_.clear();
    players_.clear();
}

const ClassifiedEntity* EntityClassifier::trustInfo(uint32_t entityId) const {
    auto it = trusts_.find(entityId);
    return it != trusts_.end() ? &it->second : nullptr;
}

const ClassifiedEntity* EntityClassifier::mobInfo(uint32_t entityId) const {
    auto it = mobs_.find(entityId);
    return it != mobs_.end() ? &it->second : nullptr;
}

bool EntityClassifier::isCached(uint32_t entityId) const {
    return trusts_.count(entityId) || mobs_.count(entityId) || players_.count(entityId);
}

} // namespace game
} // namespace trustwatch
