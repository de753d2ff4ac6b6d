// BehaviorAggregator / BehaviorProfile: bucket routing, counters and caps

#include <gtest/gtest.h>
#include <cstdint>
#include <string>

#include "game/name_resolver.hpp"
#include "stats/behavior_aggregator.hpp"
#include "stats/reservoir.hpp"

using namespace trustwatch;
using game::ActionCategory;
using game::CategoryBucket;
using stats::BehaviorAggregator;
using stats::ProfileKey;

class BehaviorAggregatorTest : public ::testing::Test {
protected:
    game::ResourceNameTable names;
    BehaviorAggregator aggregator{names};
    ProfileKey zeid = ProfileKey::trust("Zeid II");

    void SetUp() override {
        names.add(game::ResourceNameTable::Table::WEAPON_SKILLS, 30, "Savage Blade");
        names.add(game::ResourceNameTable::Table::SPELLS, 1, "Cure");
        names.add(game::ResourceNameTable::Table::JOB_ABILITIES, 50, "Provoke");
    }

    const stats::BehaviorProfile& profile(const ProfileKey& key) {
        const stats::BehaviorProfile* p = aggregator.findProfile(key);
        EXPECT_NE(p, nullptr);
        return *p;
    }
};

TEST_F(BehaviorAggregatorTest, WeaponSkillCountsAndKeepsLatestAnimation) {
    EXPECT_TRUE(aggregator.record(zeid, ActionCategory::WEAPON_SKILL, 30, 63, 450));
    EXPECT_TRUE(aggregator.record(zeid, ActionCategory::WEAPON_SKILL, 30, 64, 520));

    const stats::CounterEntry* ws = profile(zeid).findCounter(CategoryBucket::WEAPON_SKILLS, 30);
    ASSERT_NE(ws, nullptr);
    EXPECT_EQ(ws->name, "Savage Blade");
    EXPECT_EQ(ws->count, 2u);
    EXPECT_EQ(ws->animationId, 64);
    ASSERT_EQ(ws->damageSamples.size(), 2u);
    EXPECT_EQ(ws->damageSamples.samples()[0], 450u);
    EXPECT_EQ(ws->damageSamples.samples()[1], 520u);
    EXPECT_EQ(profile(zeid).totalSamples(), 2u);
}

TEST_F(BehaviorAggregatorTest, DamageSamplesStopAtCap) {
    for (uint32_t i = 1; i <= 150; ++i) {
        aggregator.record(zeid, ActionCategory::WEAPON_SKILL, 30, 63, i);
    }
    const stats::CounterEntry* ws = profile(zeid).findCounter(CategoryBucket::WEAPON_SKILLS, 30);
    ASSERT_NE(ws, nullptr);
    EXPECT_EQ(ws->count, 150u);
    ASSERT_EQ(ws->damageSamples.size(), 100u);
    EXPECT_EQ(ws->damageSamples.samples().front(), 1u);
    EXPECT_EQ(ws->damageSamples.samples().back(), 100u);
}

TEST_F(BehaviorAggregatorTest, ZeroMagnitudeNotSampled) {
    aggregator.record(zeid, ActionCategory::WEAPON_SKILL, 30, 63, 0);
    const stats::CounterEntry* ws = profile(zeid).findCounter(CategoryBucket::WEAPON_SKILLS, 30);
    ASSERT_NE(ws, nullptr);
    EXPECT_EQ(ws->count, 1u);
    EXPECT_TRUE(ws->damageSamples.empty());
}

TEST_F(BehaviorAggregatorTest, SpellsDoNotCollectDamageSamples) {
    aggregator.record(zeid, ActionCategory::MAGIC, 1, 7, 120);
    const stats::CounterEntry* cure = profile(zeid).findCounter(CategoryBucket::SPELLS, 1);
    ASSERT_NE(cure, nullptr);
    EXPECT_EQ(cure->name, "Cure");
    EXPECT_TRUE(cure->damageSamples.empty());
}

TEST_F(BehaviorAggregatorTest, MeleeKeyedByAnimation) {
    aggregator.record(zeid, ActionCategory::MELEE, 0, 0x1A, 80);
    aggregator.record(zeid, ActionCategory::MELEE, 0, 0x1A, 95);
    aggregator.record(zeid, ActionCategory::MELEE, 0, 0x1B, 70);

    const auto& p = profile(zeid);
    EXPECT_EQ(p.counterCount(CategoryBucket::MELEE_ANIMS), 2u);
    ASSERT_NE(p.findCounter(CategoryBucket::MELEE_ANIMS, 0x1A), nullptr);
    EXPECT_EQ(p.findCounter(CategoryBucket::MELEE_ANIMS, 0x1A)->count, 2u);
    EXPECT_EQ(p.totalSamples(), 3u);
}

TEST_F(BehaviorAggregatorTest, UnresolvedNamesGetPlaceholders) {
    aggregator.record(zeid, ActionCategory::WEAPON_SKILL, 999, 1, 0);
    aggregator.record(zeid, ActionCategory::MONSTER_ABILITY, 1700, 2, 300);
    aggregator.record(zeid, ActionCategory::PET_ABILITY, 12, 3, 0);

    const auto& p = profile(zeid);
    EXPECT_EQ(p.findCounter(CategoryBucket::WEAPON_SKILLS, 999)->name, "Unknown_WS_999");
    EXPECT_EQ(p.findCounter(CategoryBucket::MONSTER_ABILITIES, 1700)->name, "Unknown_MobSkill_1700");
    EXPECT_EQ(p.findCounter(CategoryBucket::PET_ABILITIES, 12)->name, "Unknown_PetSkill_12");
    EXPECT_EQ(p.findCounter(CategoryBucket::MONSTER_ABILITIES, 1700)->damageSamples.size(), 1u);
}

TEST_F(BehaviorAggregatorTest, DancesAndRunesUseJobAbilityNames) {
    names.add(game::ResourceNameTable::Table::JOB_ABILITIES, 190, "Curing Waltz");
    aggregator.record(zeid, ActionCategory::DANCE, 190, 1, 0);
    aggregator.record(zeid, ActionCategory::JOB_ABILITY, 50, 2, 0);

    const auto& p = profile(zeid);
    EXPECT_EQ(p.findCounter(CategoryBucket::DANCES, 190)->name, "Curing Waltz");
    EXPECT_EQ(p.findCounter(CategoryBucket::JOB_ABILITIES, 50)->name, "Provoke");
}

TEST_F(BehaviorAggregatorTest, SamplesOnlyCategories) {
    aggregator.record(zeid, ActionCategory::ITEM, 4112, 0, 0);
    aggregator.record(zeid, ActionCategory::NONE, 0, 0, 0);
    aggregator.record(zeid, ActionCategory::UNUSED_10, 0, 0, 0);

    const auto& p = profile(zeid);
    EXPECT_EQ(p.totalSamples(), 3u);
    auto snap = p.snapshot();
    for (const auto& bucket : snap.buckets) {
        EXPECT_TRUE(bucket.second.empty()) << game::bucketName(bucket.first);
    }
}

TEST_F(BehaviorAggregatorTest, AnnouncementCategoriesRejected) {
    for (ActionCategory cat : {ActionCategory::READYING, ActionCategory::CASTING_START,
                               ActionCategory::ITEM_START, ActionCategory::RANGED_START}) {
        EXPECT_TRUE(game::isAnnouncement(cat));
        EXPECT_FALSE(aggregator.record(zeid, cat, 30, 63, 450));
    }
    EXPECT_TRUE(aggregator.empty());
}

TEST_F(BehaviorAggregatorTest, AdditionalEffectsKeyedByAnimationAndParam) {
    game::AdditionalEffect enspell;
    enspell.animation = 163;
    enspell.param = 25;
    enspell.message = 229;

    aggregator.record(zeid, ActionCategory::MELEE, 0, 0x1A, 80, enspell);
    aggregator.record(zeid, ActionCategory::WEAPON_SKILL, 30, 63, 400, enspell);
    enspell.param = 26;
    aggregator.record(zeid, ActionCategory::MELEE, 0, 0x1A, 80, enspell);

    const auto& effects = profile(zeid).additionalEffects();
    ASSERT_EQ(effects.size(), 2u);
    const auto& first = effects.at({163, 25});
    EXPECT_EQ(first.count, 2u);
    EXPECT_EQ(first.sourceCategory, "melee");
    EXPECT_EQ(first.message, 229);
    EXPECT_EQ(effects.at({163, 26}).count, 1u);
}

TEST_F(BehaviorAggregatorTest, SnapshotSortedByCountThenFirstSeen) {
    names.add(game::ResourceNameTable::Table::WEAPON_SKILLS, 31, "Vorpal Blade");
    names.add(game::ResourceNameTable::Table::WEAPON_SKILLS, 32, "Red Lotus Blade");

    aggregator.record(zeid, ActionCategory::WEAPON_SKILL, 32, 1, 0);
    aggregator.record(zeid, ActionCategory::WEAPON_SKILL, 31, 1, 0);
    aggregator.record(zeid, ActionCategory::WEAPON_SKILL, 30, 1, 0);
    aggregator.record(zeid, ActionCategory::WEAPON_SKILL, 30, 1, 0);

    auto snap = aggregator.snapshot(zeid);
    ASSERT_TRUE(snap.has_value());
    const auto& ws = snap->bucket(CategoryBucket::WEAPON_SKILLS);
    ASSERT_EQ(ws.size(), 3u);
    EXPECT_EQ(ws[0].name, "Savage Blade");
    EXPECT_EQ(ws[1].name, "Red Lotus Blade");
    EXPECT_EQ(ws[2].name, "Vorpal Blade");
    EXPECT_TRUE(snap->bucket(CategoryBucket::SPELLS).empty());
}

TEST_F(BehaviorAggregatorTest, MobProfilesKeyedByZoneAndName) {
    ProfileKey valkurm = ProfileKey::mob("Valkurm Dunes", "Goblin Thug");
    ProfileKey jugner = ProfileKey::mob("Jugner Forest", "Goblin Thug");

    aggregator.record(valkurm, ActionCategory::MONSTER_ABILITY, 1700, 1, 100);
    aggregator.record(valkurm, ActionCategory::MONSTER_ABILITY, 1700, 1, 110);
    aggregator.record(jugner, ActionCategory::MELEE, 0, 1, 50);

    EXPECT_EQ(aggregator.profileCount(), 2u);
    EXPECT_EQ(profile(valkurm).totalSamples(), 2u);
    EXPECT_EQ(profile(jugner).totalSamples(), 1u);
    EXPECT_EQ(valkurm.label(), "Valkurm Dunes/Goblin Thug");
    EXPECT_EQ(aggregator.findProfile(ProfileKey::trust("Goblin Thug")), nullptr);
}

TEST_F(BehaviorAggregatorTest, EnsureProfileUpdatesModel) {
    aggregator.ensureProfile(zeid, 3021);
    aggregator.ensureProfile(zeid);
    EXPECT_EQ(profile(zeid).modelId(), 3021u);
    aggregator.ensureProfile(zeid, 3022);
    EXPECT_EQ(profile(zeid).modelId(), 3022u);
    EXPECT_EQ(profile(zeid).totalSamples(), 0u);
}

TEST_F(BehaviorAggregatorTest, ConfiguredCapsApply) {
    stats::ProfileLimits limits;
    limits.damageSampleCap = 3;
    limits.damageTakenCap = 2;
    BehaviorAggregator small(names, limits);

    for (uint32_t i = 1; i <= 5; ++i) {
        small.record(zeid, ActionCategory::WEAPON_SKILL, 30, 63, i * 100);
    }
    auto& p = small.ensureProfile(ProfileKey::mob("Valkurm Dunes", "Goblin Thug"));
    EXPECT_TRUE(p.addDamageTaken(10));
    EXPECT_TRUE(p.addDamageTaken(20));
    EXPECT_FALSE(p.addDamageTaken(30));
    EXPECT_EQ(p.estimatedHp(), 30u);

    EXPECT_EQ(small.findProfile(zeid)->findCounter(CategoryBucket::WEAPON_SKILLS, 30)->damageSamples.size(), 3u);
}

TEST_F(BehaviorAggregatorTest, ResetDropsProfiles) {
    aggregator.record(zeid, ActionCategory::MELEE, 0, 1, 1);
    aggregator.reset();
    EXPECT_TRUE(aggregator.empty());
    EXPECT_FALSE(aggregator.snapshot(zeid).has_value());
}

TEST(ReservoirTest, StopsAppendingWhenFull) {
    stats::Reservoir<int> reservoir(2);
    EXPECT_TRUE(reservoir.add(1));
    EXPECT_TRUE(reservoir.add(2));
    EXPECT_TRUE(reservoir.full());
    EXPECT_FALSE(reservoir.add(3));
    ASSERT_EQ(reservoir.size(), 2u);
    EXPECT_EQ(reservoir.samples()[1], 2);
}
