#include "game/entity_update_packet.hpp"
#include "game/opcodes.hpp"
#include "core/logger.hpp"
#include <cmath>

namespace trustwatch {
namespace game {

std::optional<EntityUpdateData> EntityUpdateParser::parse(network::Packet& packet) {
    if (packet.getSize() < MIN_SIZE) {
        LOG_DEBUG("SMSG_ENTITY_UPDATE dropped: ", packet.getSize(), " bytes");
        return std::nullopt;
    }

    EntityUpdateData data;
    packet.setReadPos(4);
    data.entityId = packet.readUInt32();
    data.index = packet.readUInt16();
    data.mask = packet.readUInt8();

    if ((data.mask & EntityUpdateMask::POSITION) &&
        packet.getSize() >= POSITION_OFFSET + 12) {
        packet.setReadPos(POSITION_OFFSET);
        float x = packet.readFloat();
        float y = packet.readFloat();
        float z = packet.readFloat();
        if (std::isfinite(x) && std::isfinite(y) && std::isfinite(z)) {
            data.position = glm::vec3(x, y, z);
        }
    }

    if ((data.mask & EntityUpdateMask::MODEL) && packet.getSize() >= MODEL_OFFSET + 2) {
        packet.setReadPos(MODEL_OFFSET);
        data.modelId = packet.readUInt16();
    }

    if ((data.mask & EntityUpdateMask::NAME) && packet.getSize() > NAME_OFFSET) {
        packet.setReadPos(NAME_OFFSET);
        data.name = packet.readFixedString(NAME_LENGTH);
    }

    return data;
}

network::Packet EntityUpdateParser::build(const EntityUpdateData& data, uint16_t sequence) {
    network::Packet packet(static_cast<uint16_t>(Opcode::SMSG_ENTITY_UPDATE));
    packet.writeHeader(sequence);
    packet.writeUInt32(data.entityId);
    packet.writeUInt16(data.index);

    uint8_t mask = data.mask;
    if (data.position) mask |= EntityUpdateMask::POSITION;
    if (data.modelId) mask |= EntityUpdateMask::MODEL;
    if (!data.name.empty()) mask |= EntityUpdateMask::NAME;
    packet.writeUInt8(mask);
    packet.writeUInt8(0); // rotation

    glm::vec3 pos = data.position.value_or(glm::vec3(0.0f));
    packet.writeFloat(pos.x);
    packet.writeFloat(pos.y);
    packet.writeFloat(pos.z);

    while (packet.getSize() < MODEL_OFFSET) packet.writeUInt8(0);
    packet.writeUInt16(data.modelId.value_or(0));
    packet.writeFixedString(data.name, NAME_LENGTH);
    packet.finalizeHeader();
    return packet;
}

std::optional<uint16_t> ZoneInParser::parse(network::Packet& packet) {
    if (packet.getSize() < ZONE_OFFSET + 2) {
        LOG_DEBUG("SMSG_ZONE_IN dropped: ", packet.getSize(), " bytes");
        return std::nullopt;
    }
    packet.setReadPos(ZONE_OFFSET);
    return packet.readUInt16();
}

network::Packet ZoneInParser::build(uint16_t zoneId, uint16_t sequence) {
    network::Packet packet(static_cast<uint16_t>(Opcode::SMSG_ZONE_IN));
    packet.writeHeader(sequence);
    while (packet.getSize() < ZONE_OFFSET) packet.writeUInt8(0);
    packet.writeUInt16(zoneId);
    packet.finalizeHeader();
    return packet;
}

} // namespace game
} // namespace trustwatch
