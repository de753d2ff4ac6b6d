#pragma once

#include "network/packet.hpp"
#include <glm/glm.hpp>
#include <cstdint>
#include <optional>
#include <string>

namespace trustwatch {
namespace game {

/**
 * Update mask bits of SMSG_ENTITY_UPDATE (0x00E) that the collector reads.
 */
namespace EntityUpdateMask {
    constexpr uint8_t POSITION = 0x01;
    constexpr uint8_t MODEL    = 0x10;
    constexpr uint8_t NAME     = 0x08;
}

/**
 * Presence data for one NPC/mob. Only the fields flagged in the update
 * mask are filled.
 */
struct EntityUpdateData {
    uint32_t entityId = 0;
    uint16_t index = 0;
    uint8_t mask = 0;
    std::optional<glm::vec3> position;   // x, y (height), z
    std::optional<uint16_t> modelId;
    std::string name;

    bool hasName() const { return !name.empty(); }
};

/**
 * SMSG_ENTITY_UPDATE layout (offsets from the chunk header):
 *   0x04 id u32, 0x08 index u16, 0x0A mask u8,
 *   0x0C x f32, 0x10 y f32, 0x14 z f32      (mask & POSITION)
 *   0x32 model u16                          (mask & MODEL)
 *   0x34 name char[16]                      (mask & NAME)
 */
class EntityUpdateParser {
public:
    static constexpr size_t MIN_SIZE = 0x0C;
    static constexpr size_t POSITION_OFFSET = 0x0C;
    static constexpr size_t MODEL_OFFSET = 0x32;
    static constexpr size_t NAME_OFFSET = 0x34;
    static constexpr size_t NAME_LENGTH = 16;

    static std::optional<EntityUpdateData> parse(network::Packet& packet);
    static network::Packet build(const EntityUpdateData& data, uint16_t sequence = 0);
};

/**
 * SMSG_ZONE_IN (0x00A): only the zone id is used.
 */
class ZoneInParser {
public:
    static constexpr size_t ZONE_OFFSET = 0x30;

    static std::optional<uint16_t> parse(network::Packet& packet);
    static network::Packet build(uint16_t zoneId, uint16_t sequence = 0);
};

} // namespace game
} // namespace trustwatch
