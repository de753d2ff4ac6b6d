#pragma once

#include <vector>
#include <cstdint>
#include <string>

namespace trustwatch {
namespace network {

/**
 * One server-to-client FFXI chunk.
 *
 * The first four bytes are the chunk header: a 9-bit packet id, a 7-bit
 * size in 4-byte words and a 16-bit sequence number. Offsets passed to
 * setReadPos() are relative to the start of the header.
 *
 * Reads past the end of the buffer yield zero bytes instead of failing;
 * parsers check getSize() for the lengths they care about.
 */
class Packet {
public:
    static constexpr size_t HEADER_SIZE = 4;

    Packet() = default;
    explicit Packet(uint16_t id);
    Packet(uint16_t id, const std::vector<uint8_t>& data);

    /** Wrap a raw chunk; the id is taken from the header bits. */
    static Packet fromChunk(const uint8_t* bytes, size_t length);

    /** Id and sequence from the header, size left for finalizeHeader(). */
    void writeHeader(uint16_t sequence = 0);
    /** Pad to a 4-byte multiple and store the word count in the header. */
    void finalizeHeader();

    void writeUInt8(uint8_t value);
    void writeUInt16(uint16_t value);
    void writeUInt32(uint32_t value);
    void writeFloat(float value);
    void writeFixedString(const std::string& value, size_t length);
    void writeBytes(const uint8_t* data, size_t length);

    uint8_t readUInt8();
    uint16_t readUInt16();
    uint32_t readUInt32();
    float readFloat();
    /** Reads exactly `length` bytes, stopping the string at the first NUL. */
    std::string readFixedString(size_t length);

    uint16_t getId() const { return id; }
    uint16_t getSequence() const;
    const std::vector<uint8_t>& getData() const { return data; }
    size_t getReadPos() const { return readPos; }
    size_t getSize() const { return data.size(); }
    void setReadPos(size_t pos) { readPos = pos; }

private:
    uint16_t id = 0;
    std::vector<uint8_t> data;
    size_t readPos = 0;
};

} // namespace network
} // namespace trustwatch
