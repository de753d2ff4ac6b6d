#include "stats/behavior_aggregator.hpp"
#include "core/logger.hpp"

namespace trustwatch {
namespace stats {

using game::ActionCategory;
using game::CategoryBucket;

BehaviorAggregator::BehaviorAggregator(const game::NameResolver& names, ProfileLimits limits)
    : names_(names), limits_(limits) {}

BehaviorProfile& BehaviorAggregator::ensureProfile(const ProfileKey& key, uint32_t modelId) {
    auto it = profiles_.find(key);
    if (it == profiles_.end()) {
        it = profiles_.emplace(key, BehaviorProfile(key, modelId, limits_)).first;
        LOG_DEBUG("Created profile ", key.label(), " (model ", modelId, ")");
    } else if (modelId != 0) {
        it->second.setModelId(modelId);
    }
    return it->second;
}

bool BehaviorAggregator::record(const ProfileKey& key,
                                ActionCategory category,
                                uint32_t param,
                                uint16_t animationId,
                                uint32_t magnitude,
                                const std::optional<game::AdditionalEffect>& additionalEffect) {
    CategoryBucket bucket = game::categoryBucket(category);
    if (bucket == CategoryBucket::IGNORED) {
        LOG_WARNING("Announcement category ", game::categoryName(category),
                    " reached the aggregator for ", key.label());
        return false;
    }

    BehaviorProfile& profile = ensureProfile(key);
    profile.addSample();

    switch (bucket) {
        case CategoryBucket::MELEE_ANIMS:
        case CategoryBucket::RANGED_ANIMS: {
            CounterEntry& entry = profile.counter(bucket, animationId, "");
            entry.animationId = animationId;
            ++entry.count;
            break;
        }
        case CategoryBucket::WEAPON_SKILLS:
        case CategoryBucket::SPELLS:
        case CategoryBucket::JOB_ABILITIES:
        case CategoryBucket::MONSTER_ABILITIES:
        case CategoryBucket::PET_ABILITIES:
        case CategoryBucket::DANCES:
        case CategoryBucket::RUNES: {
            // Name is only resolved for a new entry
            std::string name;
            if (!profile.findCounter(bucket, param)) {
                name = names_.resolveOrPlaceholder(category, param);
            }
            CounterEntry& entry = profile.counter(bucket, param, name);
            ++entry.count;
            entry.animationId = animationId;
            if (game::recordsDamageSamples(category) && magnitude > 0) {
                entry.damageSamples.add(magnitude);
            }
            break;
        }
        case CategoryBucket::SAMPLES_ONLY:
        case CategoryBucket::IGNORED:
            break;
    }

    if (additionalEffect) {
        AdditionalEffectEntry& ae = profile.additionalEffect(
            additionalEffect->animation, additionalEffect->param, game::categoryName(category));
        ae.effect = additionalEffect->effect;
        ae.message = additionalEffect->message;
        ++ae.count;
    }
    return true;
}

BehaviorProfile* BehaviorAggregator::findProfile(const ProfileKey& key) {
    auto it = profiles_.find(key);
    return it != profiles_.end() ? &it->second : nullptr;
}

const BehaviorProfile* BehaviorAggregator::findProfile(const ProfileKey& key) const {
    auto it = profiles_.find(key);
    return it != profiles_.end() ? &it->second : nullptr;
}

std::optional<ProfileSnapshot> BehaviorAggregator::snapshot(const ProfileKey& key) const {
    const BehaviorProfile* profile = findProfile(key);
    if (!profile) return std::nullopt;
    return profile->snapshot();
}

} // namespace stats
} // namespace trustwatch
