#include "network/packet.hpp"
#include <cstring>

namespace trustwatch {
namespace network {

Packet::Packet(uint16_t id) : id(id & 0x1FF) {}

Packet::Packet(uint16_t id, const std::vector<uint8_t>& data)
    : id(id & 0x1FF), data(data), readPos(0) {}

Packet Packet::fromChunk(const uint8_t* bytes, size_t length) {
    Packet packet;
    if (bytes && length > 0) {
        packet.data.assign(bytes, bytes + length);
    }
    if (length >= 2) {
        packet.id = static_cast<uint16_t>(bytes[0] | ((bytes[1] & 0x01) << 8));
    }
    return packet;
}

void Packet::writeHeader(uint16_t sequence) {
    data.clear();
    readPos = 0;
    writeUInt8(static_cast<uint8_t>(id & 0xFF));
    writeUInt8(static_cast<uint8_t>((id >> 8) & 0x01));
    writeUInt16(sequence);
}

void Packet::finalizeHeader() {
    while (data.size() % 4 != 0) {
        data.push_back(0);
    }
    if (data.size() < HEADER_SIZE) return;
    // 7 bits of word count; anything longer is not a valid chunk anyway
    size_t words = data.size() / 4;
    if (words > 0x7F) words = 0x7F;
    data[1] = static_cast<uint8_t>((data[1] & 0x01) | (words << 1));
}

void Packet::writeUInt8(uint8_t value) {
    data.push_back(value);
}

void Packet::writeUInt16(uint16_t value) {
    data.push_back(value & 0xFF);
    data.push_back((value >> 8) & 0xFF);
}

void Packet::writeUInt32(uint32_t value) {
    data.push_back(value & 0xFF);
    data.push_back((value >> 8) & 0xFF);
    data.push_back((value >> 16) & 0xFF);
    data.push_back((value >> 24) & 0xFF);
}

void Packet::writeFloat(float value) {
    uint32_t bits = 0;
    std::memcpy(&bits, &value, sizeof(float));
    writeUInt32(bits);
}

void Packet::writeFixedString(const std::string& value, size_t length) {
    for (size_t i = 0; i < length; ++i) {
        data.push_back(i < value.size() ? static_cast<uint8_t>(value[i]) : 0);
    }
}

void Packet::writeBytes(const uint8_t* bytes, size_t length) {
    data.insert(data.end(), bytes, bytes + length);
}

uint8_t Packet::readUInt8() {
    if (readPos >= data.size()) {
        ++readPos;
        return 0;
    }
    return data[readPos++];
}

uint16_t Packet::readUInt16() {
    uint16_t value = 0;
    value |= readUInt8();
    value |= (readUInt8() << 8);
    return value;
}

uint32_t Packet::readUInt32() {
    uint32_t value = 0;
    value |= readUInt8();
    value |= (readUInt8() << 8);
    value |= (readUInt8() << 16);
    value |= (static_cast<uint32_t>(readUInt8()) << 24);
    return value;
}

float Packet::readFloat() {
    // Read as uint32 and reinterpret as float
    uint32_t bits = readUInt32();
    float value;
    std::memcpy(&value, &bits, sizeof(float));
    return value;
}

std::string Packet::readFixedString(size_t length) {
    std::string result;
    bool terminated = false;
    for (size_t i = 0; i < length; ++i) {
        uint8_t c = readUInt8();
        if (c == 0) terminated = true;
        if (!terminated) result += static_cast<char>(c);
    }
    return result;
}

uint16_t Packet::getSequence() const {
    if (data.size() < HEADER_SIZE) return 0;
    return static_cast<uint16_t>(data[2] | (data[3] << 8));
}

} // namespace network
} // namespace trustwatch
