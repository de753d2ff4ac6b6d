#pragma once

#include "stats/behavior_profile.hpp"
#include "game/action_category.hpp"
#include "game/action_packet.hpp"
#include "game/name_resolver.hpp"
#include <map>
#include <optional>

namespace trustwatch {
namespace stats {

/**
 * Folds completed actions into per-entity behaviour profiles.
 *
 * Profiles are created lazily and live until reset(); zone changes do not
 * touch them.
 */
class BehaviorAggregator {
public:
    explicit BehaviorAggregator(const game::NameResolver& names, ProfileLimits limits = {});

    /** Existing profile for `key`, or a new one. A non-zero model id updates the stored one. */
    BehaviorProfile& ensureProfile(const ProfileKey& key, uint32_t modelId = 0);

    /**
     * Record one action effect. Announcement categories (readying,
     * casting start, item start, ranged start) are rejected and leave the
     * profile untouched; callers are expected to filter them first.
     * Returns true when the observation was recorded.
     */
    bool record(const ProfileKey& key,
                game::ActionCategory category,
                uint32_t param,
                uint16_t animationId,
                uint32_t magnitude,
                const std::optional<game::AdditionalEffect>& additionalEffect = std::nullopt);

    BehaviorProfile* findProfile(const ProfileKey& key);
    const BehaviorProfile* findProfile(const ProfileKey& key) const;
    std::optional<ProfileSnapshot> snapshot(const ProfileKey& key) const;

    const std::map<ProfileKey, BehaviorProfile>& profiles() const { return profiles_; }
    size_t profileCount() const { return profiles_.size(); }
    bool empty() const { return profiles_.empty(); }

    const ProfileLimits& limits() const { return limits_; }
    void reset() { profiles_.clear(); }

private:
    const game::NameResolver& names_;
    ProfileLimits limits_;
    std::map<ProfileKey, BehaviorProfile> profiles_;
};

} // namespace stats
} // namespace trustwatch
