// SMSG_ENTITY_UPDATE / SMSG_ZONE_IN decoding and zone naming

#include <gtest/gtest.h>
#include <cmath>
#include <limits>

#include "game/entity_update_packet.hpp"
#include "game/zone_manager.hpp"

using namespace trustwatch;
using namespace trustwatch::game;

TEST(EntityUpdatePacketTest, FullUpdateRoundTrip) {
    EntityUpdateData data;
    data.entityId = 0x0100A0B1;
    data.index = 177;
    data.position = glm::vec3(-120.5f, 8.25f, 301.0f);
    data.modelId = 412;
    data.name = "Goblin Thug";

    network::Packet packet = EntityUpdateParser::build(data);
    EXPECT_EQ(packet.getId(), 0x00E);

    auto decoded = EntityUpdateParser::parse(packet);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->entityId, 0x0100A0B1u);
    EXPECT_EQ(decoded->index, 177);
    EXPECT_EQ(decoded->mask & EntityUpdateMask::POSITION, EntityUpdateMask::POSITION);
    ASSERT_TRUE(decoded->position.has_value());
    EXPECT_FLOAT_EQ(decoded->position->x, -120.5f);
    EXPECT_FLOAT_EQ(decoded->position->y, 8.25f);
    EXPECT_FLOAT_EQ(decoded->position->z, 301.0f);
    ASSERT_TRUE(decoded->modelId.has_value());
    EXPECT_EQ(*decoded->modelId, 412);
    EXPECT_EQ(decoded->name, "Goblin Thug");
}

TEST(EntityUpdatePacketTest, UnflaggedFieldsAreAbsent) {
    EntityUpdateData data;
    data.entityId = 77;
    data.position = glm::vec3(1.0f, 2.0f, 3.0f);

    network::Packet packet = EntityUpdateParser::build(data);
    auto decoded = EntityUpdateParser::parse(packet);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_TRUE(decoded->position.has_value());
    EXPECT_FALSE(decoded->modelId.has_value());
    EXPECT_FALSE(decoded->hasName());
}

TEST(EntityUpdatePacketTest, NonFinitePositionIgnored) {
    EntityUpdateData data;
    data.entityId = 78;
    data.position = glm::vec3(std::numeric_limits<float>::quiet_NaN(), 0.0f, 0.0f);

    network::Packet packet = EntityUpdateParser::build(data);
    auto decoded = EntityUpdateParser::parse(packet);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_FALSE(decoded->position.has_value());
}

TEST(EntityUpdatePacketTest, ShortPacketRejected) {
    network::Packet packet(0x00E, {0x0E, 0x04, 0x00, 0x00, 0x01, 0x00, 0x00, 0x00});
    EXPECT_FALSE(EntityUpdateParser::parse(packet).has_value());
}

TEST(ZoneInPacketTest, ZoneIdAtOffset) {
    network::Packet packet = ZoneInParser::build(103);
    EXPECT_EQ(packet.getId(), 0x00A);
    EXPECT_EQ(packet.getData()[0x30], 103);

    auto zone = ZoneInParser::parse(packet);
    ASSERT_TRUE(zone.has_value());
    EXPECT_EQ(*zone, 103);
}

TEST(ZoneInPacketTest, ShortPacketRejected) {
    network::Packet packet(0x00A, std::vector<uint8_t>(0x30, 0));
    EXPECT_FALSE(ZoneInParser::parse(packet).has_value());
}

TEST(ZoneManagerTest, KnownAndSyntheticNames) {
    ZoneManager zones;
    zones.initialize();
    EXPECT_EQ(zones.getZoneName(103), "Valkurm Dunes");
    EXPECT_EQ(zones.getZoneName(9999), "Zone 9999");

    zones.registerZone(9999, "Test Arena");
    EXPECT_EQ(zones.getZoneName(9999), "Test Arena");
    ASSERT_NE(zones.getZoneInfo(9999), nullptr);
    EXPECT_EQ(zones.getZoneInfo(9999)->id, 9999);
}
