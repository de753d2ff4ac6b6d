#include "game/action_packet.hpp"
#include "game/opcodes.hpp"
#include "network/bit_reader.hpp"
#include "core/logger.hpp"

namespace trustwatch {
namespace game {

std::optional<ActionPacketData> ActionPacketParser::parse(network::Packet& packet) {
    if (packet.getSize() < MIN_SIZE) {
        LOG_DEBUG("SMSG_ACTION dropped: ", packet.getSize(), " bytes");
        return std::nullopt;
    }

    ActionPacketData data;
    packet.setReadPos(ACTOR_OFFSET);
    data.actorId = packet.readUInt32();

    network::BitReader reader(packet.getData(), BITS_OFFSET);
    uint32_t targetCount = reader.read(10);
    data.category = static_cast<uint8_t>(reader.read(4));
    data.param = static_cast<uint16_t>(reader.read(16));
    data.recast = static_cast<uint16_t>(reader.read(16));

    if (targetCount == 0 || targetCount > MAX_TARGETS) {
        LOG_DEBUG("SMSG_ACTION dropped: actor=", data.actorId, " targetCount=", targetCount);
        return std::nullopt;
    }

    data.targets.reserve(targetCount);
    for (uint32_t t = 0; t < targetCount; ++t) {
        ActionTarget target;
        target.targetId = reader.read(32);
        uint32_t actionCount = reader.read(4);
        if (actionCount > MAX_ACTIONS) {
            LOG_DEBUG("SMSG_ACTION dropped: actor=", data.actorId, " target=", target.targetId,
                      " actionCount=", actionCount);
            return std::nullopt;
        }

        target.actions.reserve(actionCount);
        for (uint32_t a = 0; a < actionCount; ++a) {
            ActionEffect action;
            action.reaction = static_cast<uint8_t>(reader.read(5));
            action.animation = static_cast<uint16_t>(reader.read(12));
            action.effect = static_cast<uint8_t>(reader.read(4));
            action.stagger = static_cast<uint8_t>(reader.read(7));
            action.knockback = static_cast<uint8_t>(reader.read(3));
            action.param = reader.read(17);
            action.message = static_cast<uint16_t>(reader.read(10));
            reader.skip(31);

            if (action.effect != 0) {
                AdditionalEffect add;
                add.animation = static_cast<uint16_t>(reader.read(10));
                add.effect = static_cast<uint8_t>(reader.read(4));
                add.param = reader.read(17);
                add.message = static_cast<uint16_t>(reader.read(10));

                if (add.effect != 0) {
                    SpikeEffect spike;
                    spike.animation = static_cast<uint16_t>(reader.read(10));
                    spike.effect = static_cast<uint8_t>(reader.read(4));
                    spike.param = static_cast<uint16_t>(reader.read(14));
                    spike.message = static_cast<uint16_t>(reader.read(10));
                    add.spike = spike;
                }
                action.addEffect = add;
            }
            target.actions.push_back(std::move(action));
        }
        data.targets.push_back(std::move(target));
    }

    if (reader.overrun()) {
        LOG_DEBUG("SMSG_ACTION actor=", data.actorId, " read past end (",
                  reader.bitPosition(), " bits of ", packet.getSize() * 8, ")");
    }
    return data;
}

network::Packet ActionPacketParser::build(const ActionPacketData& data, uint16_t sequence) {
    network::Packet packet(static_cast<uint16_t>(Opcode::SMSG_ACTION));
    packet.writeHeader(sequence);
    packet.writeUInt32(data.actorId);

    network::BitWriter writer;
    writer.write(static_cast<uint32_t>(data.targets.size()), 10);
    writer.write(data.category, 4);
    writer.write(data.param, 16);
    writer.write(data.recast, 16);

    for (const auto& target : data.targets) {
        writer.write(target.targetId, 32);
        writer.write(static_cast<uint32_t>(target.actions.size()), 4);
        for (const auto& action : target.actions) {
            // The flag follows the optional record so the two cannot disagree
            uint8_t effect = action.addEffect ? (action.effect ? action.effect : 1) : 0;
            writer.write(action.reaction, 5);
            writer.write(action.animation, 12);
            writer.write(effect, 4);
            writer.write(action.stagger, 7);
            writer.write(action.knockback, 3);
            writer.write(action.param, 17);
            writer.write(action.message, 10);
            writer.skip(31);

            if (!action.addEffect) continue;
            const auto& add = *action.addEffect;
            uint8_t spikeFlag = add.spike ? (add.effect ? add.effect : 1) : 0;
            writer.write(add.animation, 10);
            writer.write(spikeFlag, 4);
            writer.write(add.param, 17);
            writer.write(add.message, 10);

            if (!add.spike) continue;
            writer.write(add.spike->animation, 10);
            writer.write(add.spike->effect, 4);
            writer.write(add.spike->param, 14);
            writer.write(add.spike->message, 10);
        }
    }

    const auto& bits = writer.bytes();
    packet.writeBytes(bits.data(), bits.size());
    packet.finalizeHeader();
    return packet;
}

} // namespace game
} // namespace trustwatch
