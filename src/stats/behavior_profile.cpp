#include "stats/behavior_profile.hpp"
#include <algorithm>
#include <tuple>

namespace trustwatch {
namespace stats {

ProfileKey ProfileKey::trust(const std::string& name) {
    ProfileKey key;
    key.kind = ProfileKind::TRUST;
    key.name = name;
    return key;
}

ProfileKey ProfileKey::mob(const std::string& zone, const std::string& name) {
    ProfileKey key;
    key.kind = ProfileKind::MOB;
    key.zone = zone;
    key.name = name;
    return key;
}

std::string ProfileKey::label() const {
    if (kind == ProfileKind::MOB) return zone + "/" + name;
    return name;
}

bool ProfileKey::operator<(const ProfileKey& other) const {
    return std::tie(kind, zone, name) < std::tie(other.kind, other.zone, other.name);
}

bool ProfileKey::operator==(const ProfileKey& other) const {
    return kind == other.kind && zone == other.zone && name == other.name;
}

const std::vector<CounterEntry>& ProfileSnapshot::bucket(game::CategoryBucket which) const {
    static const std::vector<CounterEntry> empty;
    for (const auto& [b, entries] : buckets) {
        if (b == which) return entries;
    }
    return empty;
}

BehaviorProfile::BehaviorProfile(ProfileKey key, uint32_t modelId, const ProfileLimits& limits)
    : key_(std::move(key)), modelId_(modelId), limits_(limits),
      damageTaken_(limits.damageTakenCap) {}

CounterEntry& BehaviorProfile::counter(game::CategoryBucket bucket, uint32_t id, const std::string& name) {
    auto& table = buckets_[bucket];
    auto it = table.find(id);
    if (it == table.end()) {
        CounterEntry entry(limits_.damageSampleCap);
        entry.id = id;
        entry.name = name;
        entry.firstSeen = nextSequence_++;
        it = table.emplace(id, std::move(entry)).first;
    }
    return it->second;
}

const CounterTable* BehaviorProfile::table(game::CategoryBucket bucket) const {
    auto it = buckets_.find(bucket);
    return it != buckets_.end() ? &it->second : nullptr;
}

const CounterEntry* BehaviorProfile::findCounter(game::CategoryBucket bucket, uint32_t id) const {
    const CounterTable* t = table(bucket);
    if (!t) return nullptr;
    auto it = t->find(id);
    return it != t->end() ? &it->second : nullptr;
}

size_t BehaviorProfile::counterCount(game::CategoryBucket bucket) const {
    const CounterTable* t = table(bucket);
    return t ? t->size() : 0;
}

AdditionalEffectEntry& BehaviorProfile::additionalEffect(uint16_t animation, uint32_t param,
                                                         const std::string& sourceCategory) {
    auto key = std::make_pair(animation, param);
    auto it = addEffects_.find(key);
    if (it == addEffects_.end()) {
        AdditionalEffectEntry entry;
        entry.animation = animation;
        entry.param = param;
        entry.sourceCategory = sourceCategory;
        entry.firstSeen = nextSequence_++;
        it = addEffects_.emplace(key, std::move(entry)).first;
    }
    return it->second;
}

uint64_t BehaviorProfile::estimatedHp() const {
    uint64_t total = 0;
    for (uint32_t v : damageTaken_) total += v;
    return total;
}

namespace {

template<typename Entry>
void sortByCount(std::vector<Entry>& entries) {
    std::sort(entries.begin(), entries.end(), [](const Entry& a, const Entry& b) {
        if (a.count != b.count) return a.count > b.count;
        return a.firstSeen < b.firstSeen;
    });
}

} // namespace

ProfileSnapshot BehaviorProfile::snapshot() const {
    ProfileSnapshot snap;
    snap.key = key_;
    snap.modelId = modelId_;
    snap.totalSamples = totalSamples_;

    for (const auto& [bucket, table] : buckets_) {
        std::vector<CounterEntry> entries;
        entries.reserve(table.size());
        for (const auto& [id, entry] : table) {
            entries.push_back(entry);
        }
        sortByCount(entries);
        snap.buckets.emplace_back(bucket, std::move(entries));
    }

    snap.additionalEffects.reserve(addEffects_.size());
    for (const auto& [key, entry] : addEffects_) {
        snap.additionalEffects.push_back(entry);
    }
    sortByCount(snap.additionalEffects);

    snap.damageTaken = damageTaken_.samples();
    snap.estimatedHp = estimatedHp();
    return snap;
}

} // namespace stats
} // namespace trustwatch
