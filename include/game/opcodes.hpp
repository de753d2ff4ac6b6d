#pragma once

#include <cstdint>

namespace trustwatch {
namespace game {

// FFXI server-to-client chunk ids handled by the collector.
// Values follow the Windower packet field tables.
enum class Opcode : uint16_t {
    SMSG_ZONE_IN        = 0x00A,
    SMSG_ENTITY_UPDATE  = 0x00E,
    SMSG_ACTION         = 0x028,
};

} // namespace game
} // namespace trustwatch
