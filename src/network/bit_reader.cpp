#include "network/bit_reader.hpp"

namespace trustwatch {
namespace network {

BitReader::BitReader(const uint8_t* data, size_t size, size_t startByte)
    : data_(data), size_(data ? size : 0), bitPos_(startByte * 8) {}

BitReader::BitReader(const std::vector<uint8_t>& data, size_t startByte)
    : BitReader(data.data(), data.size(), startByte) {}

uint32_t BitReader::read(unsigned width) {
    uint32_t result = 0;
    unsigned produced = 0;
    unsigned wanted = width > 32 ? 32 : width;

    while (produced < wanted) {
        size_t byteIndex = bitPos_ >> 3;
        unsigned bitOffset = static_cast<unsigned>(bitPos_ & 7);
        unsigned chunk = 8 - bitOffset;
        if (chunk > wanted - produced) chunk = wanted - produced;

        if (byteIndex < size_) {
            uint32_t bits = (static_cast<uint32_t>(data_[byteIndex]) >> bitOffset) & ((1u << chunk) - 1);
            result |= bits << produced;
        }
        produced += chunk;
        bitPos_ += chunk;
    }

    // Remainder of an over-wide request is consumed but not returned
    if (width > wanted) bitPos_ += width - wanted;
    return result;
}

void BitWriter::ensureCapacity(size_t bitCount) {
    size_t needed = (bitCount + 7) / 8;
    if (bytes_.size() < needed) bytes_.resize(needed, 0);
}

void BitWriter::write(uint32_t value, unsigned width) {
    if (width > 32) width = 32;
    ensureCapacity(bitPos_ + width);
    for (unsigned i = 0; i < width; ++i) {
        size_t byteIndex = bitPos_ >> 3;
        unsigned bitOffset = static_cast<unsigned>(bitPos_ & 7);
        uint8_t mask = static_cast<uint8_t>(1u << bitOffset);
        if ((value >> i) & 1u) {
            bytes_[byteIndex] |= mask;
        } else {
            bytes_[byteIndex] &= static_cast<uint8_t>(~mask);
        }
        ++bitPos_;
    }
}

void BitWriter::skip(unsigned width) {
    bitPos_ += width;
    ensureCapacity(bitPos_);
}

} // namespace network
} // namespace trustwatch
