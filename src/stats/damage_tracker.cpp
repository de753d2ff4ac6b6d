#include "stats/damage_tracker.hpp"
#include <cstdint>

namespace trustwatch {
namespace stats {

DamageTracker::DamageTracker(game::EntityClassifier& classifier, BehaviorAggregator& aggregator)
    : classifier_(classifier), aggregator_(aggregator) {}

bool DamageTracker::observeDamage(uint32_t targetId, int64_t magnitude) {
    if (magnitude <= 0) return false;
    if (classifier_.classify(targetId) != game::EntityClass::MOB) return false;

    const game::ClassifiedEntity* mob = classifier_.mobInfo(targetId);
    if (!mob) return false;

    BehaviorProfile& profile = aggregator_.ensureProfile(ProfileKey::mob(mob->zone, mob->name), mob->modelId);
    ++observed_;
    uint32_t clamped = magnitude > UINT32_MAX ? UINT32_MAX : static_cast<uint32_t>(magnitude);
    return profile.addDamageTaken(clamped);
}

uint64_t DamageTracker::estimatedHp(const ProfileKey& key) const {
    const BehaviorProfile* profile = aggregator_.findProfile(key);
    return profile ? profile->estimatedHp() : 0;
}

} // namespace stats
} // namespace trustwatch
