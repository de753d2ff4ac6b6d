// ProfileWriter: JSON layout, file naming and console reports

#include <gtest/gtest.h>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "game/name_resolver.hpp"
#include "stats/behavior_aggregator.hpp"
#include "stats/profile_writer.hpp"
#include "stats/spawn_tracker.hpp"

using namespace trustwatch;
using game::ActionCategory;
using stats::ProfileKey;
using stats::ProfileWriter;

namespace fs = std::filesystem;

class ProfileWriterTest : public ::testing::Test {
protected:
    game::ResourceNameTable names;
    stats::BehaviorAggregator aggregator{names};
    ProfileKey zeid = ProfileKey::trust("Zeid II");
    ProfileKey goblin = ProfileKey::mob("Valkurm Dunes", "Goblin Thug");
    fs::path outDir;

    void SetUp() override {
        names.add(game::ResourceNameTable::Table::WEAPON_SKILLS, 30, "Savage Blade");
        outDir = fs::temp_directory_path() /
                 ("trustwatch_writer_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::remove_all(outDir);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(outDir, ec);
    }

    static nlohmann::json readJson(const fs::path& path) {
        std::ifstream file(path);
        return nlohmann::json::parse(file);
    }
};

TEST_F(ProfileWriterTest, TrustJsonLayout) {
    aggregator.ensureProfile(zeid, 3021);
    aggregator.record(zeid, ActionCategory::WEAPON_SKILL, 30, 63, 450);
    aggregator.record(zeid, ActionCategory::MELEE, 0, 0x1A, 80);

    nlohmann::json doc = ProfileWriter::toJson(*aggregator.snapshot(zeid));
    EXPECT_EQ(doc["name"], "Zeid II");
    EXPECT_EQ(doc["kind"], "trust");
    EXPECT_FALSE(doc.contains("zone"));
    EXPECT_FALSE(doc.contains("damage_taken"));
    EXPECT_EQ(doc["model_id"], 3021);
    EXPECT_EQ(doc["total_samples"], 2);
    EXPECT_TRUE(doc.contains("captured_at"));

    ASSERT_EQ(doc["weapon_skills"].size(), 1u);
    const auto& ws = doc["weapon_skills"][0];
    EXPECT_EQ(ws["id"], 30);
    EXPECT_EQ(ws["name"], "Savage Blade");
    EXPECT_EQ(ws["animation_id"], 63);
    EXPECT_EQ(ws["count"], 1);
    EXPECT_EQ(ws["damage_samples"], nlohmann::json::array({450}));

    ASSERT_EQ(doc["melee_anims"].size(), 1u);
    EXPECT_EQ(doc["melee_anims"][0]["animation_id"], 0x1A);
    EXPECT_FALSE(doc["melee_anims"][0].contains("name"));

    EXPECT_TRUE(doc["spells"].is_array());
    EXPECT_TRUE(doc["spells"].empty());
    EXPECT_TRUE(doc["add_effects"].is_array());
}

TEST_F(ProfileWriterTest, MobJsonHasZoneAndDamageTaken) {
    aggregator.record(goblin, ActionCategory::MONSTER_ABILITY, 1700, 5, 90);
    aggregator.findProfile(goblin)->addDamageTaken(300);
    aggregator.findProfile(goblin)->addDamageTaken(150);

    nlohmann::json doc = ProfileWriter::toJson(*aggregator.snapshot(goblin));
    EXPECT_EQ(doc["kind"], "mob");
    EXPECT_EQ(doc["zone"], "Valkurm Dunes");
    EXPECT_EQ(doc["damage_taken"]["estimated_hp"], 450);
    EXPECT_EQ(doc["damage_taken"]["samples"].size(), 2u);
    EXPECT_EQ(doc["monster_abilities"][0]["name"], "Unknown_MobSkill_1700");
}

TEST_F(ProfileWriterTest, FileNames) {
    EXPECT_EQ(ProfileWriter::sanitizeFilename("Zeid II"), "Zeid_II");
    EXPECT_EQ(ProfileWriter::sanitizeFilename("Shantotto  II (UC)"), "Shantotto_II_UC");
    EXPECT_EQ(ProfileWriter::sanitizeFilename("Ark-EV"), "Ark-EV");
    EXPECT_EQ(ProfileWriter::sanitizeFilename("???"), "unnamed");
    EXPECT_EQ(ProfileWriter::fileNameFor(zeid), "Zeid_II.json");
    EXPECT_EQ(ProfileWriter::fileNameFor(goblin), "mob_Valkurm_Dunes__Goblin_Thug.json");
}

TEST_F(ProfileWriterTest, SaveAllSkipsEmptyProfiles) {
    aggregator.ensureProfile(ProfileKey::trust("Idle Trust"));
    aggregator.record(zeid, ActionCategory::WEAPON_SKILL, 30, 63, 450);
    aggregator.ensureProfile(goblin).addDamageTaken(10);

    int written = ProfileWriter::saveAll(aggregator, outDir.string());
    EXPECT_EQ(written, 2);
    EXPECT_TRUE(fs::exists(outDir / "Zeid_II.json"));
    EXPECT_TRUE(fs::exists(outDir / "mob_Valkurm_Dunes__Goblin_Thug.json"));
    EXPECT_FALSE(fs::exists(outDir / "Idle_Trust.json"));
    ASSERT_TRUE(fs::exists(outDir / "_summary.json"));

    nlohmann::json summary = readJson(outDir / "_summary.json");
    EXPECT_EQ(summary["trusts"].size(), 2u);
    ASSERT_EQ(summary["mobs"].size(), 1u);
    EXPECT_EQ(summary["mobs"][0]["estimated_hp"], 10);

    nlohmann::json zeidDoc = readJson(outDir / "Zeid_II.json");
    EXPECT_EQ(zeidDoc["weapon_skills"][0]["count"], 1);
}

TEST_F(ProfileWriterTest, SpawnTablesWritten) {
    stats::SpawnTracker tracker;
    tracker.observe("Valkurm Dunes", "Goblin Thug", 412, glm::vec3(100.0f, 0.0f, 200.0f));
    tracker.observe("Valkurm Dunes", "Goblin Thug", 412, glm::vec3(101.0f, 0.0f, 200.0f));
    tracker.observe("Valkurm Dunes", "Snipper", 300, std::nullopt);

    EXPECT_EQ(ProfileWriter::saveSpawnTables(tracker, outDir.string()), 1);
    nlohmann::json doc = readJson(outDir / "Valkurm_Dunes_spawns.json");
    EXPECT_EQ(doc["zone"], "Valkurm Dunes");
    ASSERT_EQ(doc["entities"].size(), 2u);
    EXPECT_EQ(doc["entities"][0]["name"], "Goblin Thug");
    EXPECT_EQ(doc["entities"][0]["count"], 2);
    EXPECT_EQ(doc["entities"][0]["positions"].size(), 1u);
    EXPECT_EQ(doc["entities"][1]["positions"].size(), 0u);
}

TEST_F(ProfileWriterTest, SummaryLines) {
    auto empty = ProfileWriter::summaryLines(aggregator);
    ASSERT_EQ(empty.size(), 1u);
    EXPECT_EQ(empty[0], "No trust data collected yet. Summon some trusts and fight!");

    aggregator.ensureProfile(ProfileKey::trust("Idle Trust"));
    aggregator.record(zeid, ActionCategory::WEAPON_SKILL, 30, 63, 450);
    auto lines = ProfileWriter::summaryLines(aggregator);
    ASSERT_GE(lines.size(), 4u);
    EXPECT_EQ(lines[0], "=== Trust Data Summary ===");
    EXPECT_NE(std::find(lines.begin(), lines.end(), "  Idle Trust: waiting..."), lines.end());
    EXPECT_NE(std::find(lines.begin(), lines.end(), "  Zeid II: 1 actions [1 WS]"), lines.end());
}

TEST_F(ProfileWriterTest, DetailLinesMatchLoosely) {
    aggregator.record(zeid, ActionCategory::WEAPON_SKILL, 30, 63, 450);

    auto exact = ProfileWriter::detailLines(aggregator, "Zeid II");
    ASSERT_FALSE(exact.empty());
    EXPECT_EQ(exact[0], "=== Zeid II ===");
    EXPECT_NE(std::find(exact.begin(), exact.end(), "  Savage Blade [ID:30 Anim:0x03F x1]"), exact.end());

    auto partial = ProfileWriter::detailLines(aggregator, "zeid");
    ASSERT_FALSE(partial.empty());
    EXPECT_EQ(partial[0], "=== Zeid II ===");

    auto missing = ProfileWriter::detailLines(aggregator, "Shantotto");
    ASSERT_EQ(missing.size(), 1u);
    EXPECT_EQ(missing[0], "No data for: Shantotto");
}
