#pragma once

#include "network/packet.hpp"
#include "game/action_category.hpp"
#include <cstdint>
#include <optional>
#include <vector>

namespace trustwatch {
namespace game {

/**
 * Tertiary effect (spikes) attached to an additional effect.
 */
struct SpikeEffect {
    uint16_t animation = 0;   // 10 bits
    uint8_t effect = 0;       // 4 bits
    uint16_t param = 0;       // 14 bits
    uint16_t message = 0;     // 10 bits
};

/**
 * Secondary effect (enspell damage, defense down proc, ...).
 */
struct AdditionalEffect {
    uint16_t animation = 0;   // 10 bits
    uint8_t effect = 0;       // 4 bits, non-zero when a spike follows
    uint32_t param = 0;       // 17 bits
    uint16_t message = 0;     // 10 bits
    std::optional<SpikeEffect> spike;
};

/**
 * Result of one action against one target.
 */
struct ActionEffect {
    uint8_t reaction = 0;     // 5 bits
    uint16_t animation = 0;   // 12 bits
    uint8_t effect = 0;       // 4 bits, non-zero when an additional effect follows
    uint8_t stagger = 0;      // 7 bits
    uint8_t knockback = 0;    // 3 bits
    uint32_t param = 0;       // 17 bits, damage or healing
    uint16_t message = 0;     // 10 bits
    std::optional<AdditionalEffect> addEffect;
};

struct ActionTarget {
    uint32_t targetId = 0;
    std::vector<ActionEffect> actions;   // at most MAX_ACTIONS
};

/**
 * Decoded SMSG_ACTION (0x028).
 */
struct ActionPacketData {
    uint32_t actorId = 0;
    uint8_t category = 0;     // 4 bits
    uint16_t param = 0;       // 16 bits: spell, weapon skill or ability id
    uint16_t recast = 0;      // 16 bits, not interpreted
    std::vector<ActionTarget> targets;   // 1..MAX_TARGETS

    ActionCategory actionCategory() const { return toActionCategory(category); }
};

/**
 * SMSG_ACTION layout. After the 4-byte chunk header the actor id is a
 * byte-aligned LE uint32 at offset 4; everything from offset 8 is
 * bit-packed:
 *
 *   target_count 10, category 4, param 16, recast 16
 *   per target:  target_id 32, action_count 4
 *   per action:  reaction 5, animation 12, effect 4, stagger 7,
 *                knockback 3, param 17, message 10, unknown 31
 *   effect != 0:     animation 10, effect 4, param 17, message 10
 *   add effect != 0: animation 10, effect 4, param 14, message 10
 */
class ActionPacketParser {
public:
    static constexpr size_t MIN_SIZE = 10;
    static constexpr size_t ACTOR_OFFSET = 4;
    static constexpr size_t BITS_OFFSET = 8;
    static constexpr uint32_t MAX_TARGETS = 16;
    static constexpr uint32_t MAX_ACTIONS = 8;

    /**
     * Decode the whole packet or nothing. std::nullopt for buffers under
     * MIN_SIZE, a target count of 0 or above MAX_TARGETS, or any target
     * with more than MAX_ACTIONS actions.
     */
    static std::optional<ActionPacketData> parse(network::Packet& packet);

    /** Encode `data` into a 0x028 chunk that parse() reads back. */
    static network::Packet build(const ActionPacketData& data, uint16_t sequence = 0);
};

} // namespace game
} // namespace trustwatch
