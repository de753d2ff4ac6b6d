#pragma once

#include "network/packet.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace trustwatch {
namespace network {

/**
 * Recorded server chunks, stored back to back as
 *   u16 id (LE), u16 length (LE), length bytes of chunk (header included).
 */
struct CaptureRecord {
    uint16_t id = 0;
    std::vector<uint8_t> bytes;

    Packet toPacket() const { return Packet(id, bytes); }
};

class CaptureFile {
public:
    /**
     * Read every record. A truncated trailing record is dropped with a
     * warning; nullopt only if the file cannot be opened.
     */
    static std::optional<std::vector<CaptureRecord>> read(const std::string& path);
    static std::vector<CaptureRecord> parse(const std::vector<uint8_t>& raw);

    static bool write(const std::string& path, const std::vector<CaptureRecord>& records);
    static std::vector<uint8_t> serialize(const std::vector<CaptureRecord>& records);
};

} // namespace network
} // namespace trustwatch
