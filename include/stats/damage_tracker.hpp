#pragma once

#include "stats/behavior_aggregator.hpp"
#include "game/entity_classifier.hpp"
#include <cstdint>

namespace trustwatch {
namespace stats {

/**
 * Attributes damage dealt by players to the mob that took it, so a mob's
 * HP can be estimated from the damage-taken log.
 */
class DamageTracker {
public:
    DamageTracker(game::EntityClassifier& classifier, BehaviorAggregator& aggregator);

    /**
     * No-op for magnitude <= 0 or a target that does not classify as a
     * mob. Returns true if the sample was stored.
     */
    bool observeDamage(uint32_t targetId, int64_t magnitude);

    /** Sum of the damage-taken log of a mob profile, 0 if unknown. */
    uint64_t estimatedHp(const ProfileKey& key) const;

    uint64_t observedCount() const { return observed_; }

private:
    game::EntityClassifier& classifier_;
    BehaviorAggregator& aggregator_;
    uint64_t observed_ = 0;
};

} // namespace stats
} // namespace trustwatch
