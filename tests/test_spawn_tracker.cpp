// SpawnTracker: per-zone counts, first model wins, sparse position sampling

#include <gtest/gtest.h>
#include <optional>

#include "stats/spawn_tracker.hpp"

using trustwatch::stats::SpawnLimits;
using trustwatch::stats::SpawnTracker;

TEST(SpawnTrackerTest, SpacingUsesPlanarDistance) {
    SpawnTracker tracker;
    EXPECT_TRUE(tracker.observe("Valkurm Dunes", "Goblin Thug", 412, glm::vec3(100.0f, 0.0f, 200.0f)));
    // Exactly five yalms away on x/z: kept
    EXPECT_TRUE(tracker.observe("Valkurm Dunes", "Goblin Thug", 412, glm::vec3(103.0f, 0.0f, 204.0f)));
    // Two yalms from the first sample: dropped
    EXPECT_FALSE(tracker.observe("Valkurm Dunes", "Goblin Thug", 412, glm::vec3(102.0f, 0.0f, 200.0f)));
    // Height is ignored
    EXPECT_FALSE(tracker.observe("Valkurm Dunes", "Goblin Thug", 412, glm::vec3(100.0f, 50.0f, 200.0f)));

    const auto* table = tracker.zone("Valkurm Dunes");
    ASSERT_NE(table, nullptr);
    const auto& entry = table->at("Goblin Thug");
    EXPECT_EQ(entry.count, 4u);
    EXPECT_EQ(entry.positions.size(), 2u);
}

TEST(SpawnTrackerTest, FirstModelWins) {
    SpawnTracker tracker;
    tracker.observe("Valkurm Dunes", "Goblin Thug", 412, std::nullopt);
    tracker.observe("Valkurm Dunes", "Goblin Thug", 999, std::nullopt);
    const auto& entry = tracker.zone("Valkurm Dunes")->at("Goblin Thug");
    EXPECT_EQ(entry.modelId, 412u);
    EXPECT_EQ(entry.count, 2u);
    EXPECT_TRUE(entry.positions.empty());
}

TEST(SpawnTrackerTest, PositionsTruncatedToTwoDecimals) {
    SpawnTracker tracker;
    tracker.observe("Valkurm Dunes", "Snipper", 300, glm::vec3(1.239f, -1.239f, 55.5555f));
    const auto& entry = tracker.zone("Valkurm Dunes")->at("Snipper");
    ASSERT_EQ(entry.positions.size(), 1u);
    const glm::vec3& p = entry.positions.samples()[0];
    EXPECT_FLOAT_EQ(p.x, 1.23f);
    EXPECT_FLOAT_EQ(p.y, -1.23f);
    EXPECT_FLOAT_EQ(p.z, 55.55f);
}

TEST(SpawnTrackerTest, PositionCapStopsAppending) {
    SpawnTracker tracker;
    for (int i = 0; i < 25; ++i) {
        tracker.observe("Jugner Forest", "Forest Hare", 201, glm::vec3(i * 10.0f, 0.0f, 0.0f));
    }
    const auto& entry = tracker.zone("Jugner Forest")->at("Forest Hare");
    EXPECT_EQ(entry.count, 25u);
    ASSERT_EQ(entry.positions.size(), 20u);
    EXPECT_FLOAT_EQ(entry.positions.samples().back().x, 190.0f);
}

TEST(SpawnTrackerTest, ZonesAreSeparate) {
    SpawnTracker tracker;
    tracker.observe("Valkurm Dunes", "Goblin Thug", 412, glm::vec3(0.0f));
    tracker.observe("Jugner Forest", "Goblin Thug", 412, glm::vec3(0.0f));
    EXPECT_EQ(tracker.zoneCount(), 2u);
    EXPECT_EQ(tracker.zone("Valkurm Dunes")->at("Goblin Thug").positions.size(), 1u);
    EXPECT_EQ(tracker.zone("Jugner Forest")->at("Goblin Thug").positions.size(), 1u);
    EXPECT_EQ(tracker.zone("Batallia Downs"), nullptr);

    tracker.reset();
    EXPECT_EQ(tracker.zoneCount(), 0u);
}

TEST(SpawnTrackerTest, ConfiguredLimits) {
    SpawnLimits limits;
    limits.positionCap = 2;
    limits.minSpacing = 1.0f;
    SpawnTracker tracker(limits);
    EXPECT_TRUE(tracker.observe("Z", "M", 1, glm::vec3(0.0f, 0.0f, 0.0f)));
    EXPECT_TRUE(tracker.observe("Z", "M", 1, glm::vec3(1.0f, 0.0f, 0.0f)));
    EXPECT_FALSE(tracker.observe("Z", "M", 1, glm::vec3(5.0f, 0.0f, 0.0f)));
}
