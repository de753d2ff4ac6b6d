#pragma once

#include "stats/reservoir.hpp"
#include "game/action_category.hpp"
#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace trustwatch {
namespace stats {

struct ProfileLimits {
    size_t damageSampleCap = 100;
    size_t damageTakenCap = 500;
};

enum class ProfileKind : uint8_t {
    TRUST,
    MOB
};

/**
 * Identity of a profile. Trusts are keyed by name alone; mobs by zone and
 * name, so two same-named mobs in one zone share a profile.
 */
struct ProfileKey {
    ProfileKind kind = ProfileKind::TRUST;
    std::string zone;
    std::string name;

    static ProfileKey trust(const std::string& name);
    static ProfileKey mob(const std::string& zone, const std::string& name);

    /** "Zeid II" or "Valkurm Dunes/Goblin Thug". */
    std::string label() const;

    bool operator<(const ProfileKey& other) const;
    bool operator==(const ProfileKey& other) const;
};

/**
 * Per-id statistics inside a bucket. `animationId` always holds the value
 * from the most recent observation.
 */
struct CounterEntry {
    uint32_t id = 0;
    std::string name;
    uint16_t animationId = 0;
    uint32_t count = 0;
    Reservoir<uint32_t> damageSamples;
    uint64_t firstSeen = 0;   // insertion order, breaks count ties

    CounterEntry() = default;
    explicit CounterEntry(size_t sampleCap) : damageSamples(sampleCap) {}
};

/**
 * Secondary proc keyed by (animation, magnitude).
 */
struct AdditionalEffectEntry {
    uint16_t animation = 0;
    uint8_t effect = 0;
    uint32_t param = 0;
    uint16_t message = 0;
    uint32_t count = 0;
    std::string sourceCategory;
    uint64_t firstSeen = 0;
};

using CounterTable = std::map<uint32_t, CounterEntry>;

/**
 * Counters sorted by descending count, ready for export.
 */
struct ProfileSnapshot {
    ProfileKey key;
    uint32_t modelId = 0;
    uint64_t totalSamples = 0;
    std::vector<std::pair<game::CategoryBucket, std::vector<CounterEntry>>> buckets;
    std::vector<AdditionalEffectEntry> additionalEffects;
    std::vector<uint32_t> damageTaken;
    uint64_t estimatedHp = 0;

    /** Entries of one bucket; empty when nothing was recorded there. */
    const std::vector<CounterEntry>& bucket(game::CategoryBucket which) const;
};

class BehaviorProfile {
public:
    BehaviorProfile(ProfileKey key, uint32_t modelId, const ProfileLimits& limits);

    const ProfileKey& key() const { return key_; }
    uint32_t modelId() const { return modelId_; }
    void setModelId(uint32_t modelId) { modelId_ = modelId; }

    uint64_t totalSamples() const { return totalSamples_; }
    void addSample() { ++totalSamples_; }

    /** Entry for `id`, created on first use with `name`. */
    CounterEntry& counter(game::CategoryBucket bucket, uint32_t id, const std::string& name);
    const CounterTable* table(game::CategoryBucket bucket) const;
    const CounterEntry* findCounter(game::CategoryBucket bucket, uint32_t id) const;
    size_t counterCount(game::CategoryBucket bucket) const;

    AdditionalEffectEntry& additionalEffect(uint16_t animation, uint32_t param,
                                            const std::string& sourceCategory);
    const std::map<std::pair<uint16_t, uint32_t>, AdditionalEffectEntry>& additionalEffects() const {
        return addEffects_;
    }

    bool addDamageTaken(uint32_t magnitude) { return damageTaken_.add(magnitude); }
    const Reservoir<uint32_t>& damageTaken() const { return damageTaken_; }
    /** Sum of observed damage; a lower bound on max HP. */
    uint64_t estimatedHp() const;

    ProfileSnapshot snapshot() const;

private:
    ProfileKey key_;
    uint32_t modelId_ = 0;
    ProfileLimits limits_;
    uint64_t totalSamples_ = 0;
    uint64_t nextSequence_ = 0;

    std::map<game::CategoryBucket, CounterTable> buckets_;
    std::map<std::pair<uint16_t, uint32_t>, AdditionalEffectEntry> addEffects_;
    Reservoir<uint32_t> damageTaken_;
};

} // namespace stats
} // namespace trustwatch
