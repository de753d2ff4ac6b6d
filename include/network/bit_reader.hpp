#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace trustwatch {
namespace network {

/**
 * Reads unsigned fields of arbitrary bit width from a byte buffer.
 *
 * Bits are consumed least-significant-bit first within each byte; a field
 * that crosses a byte boundary continues at bit 0 of the next byte.
 * Bits past the end of the buffer read as zero, so a truncated packet
 * still decodes into a complete (if meaningless) structure. The cursor
 * only moves forward.
 */
class BitReader {
public:
    BitReader(const uint8_t* data, size_t size, size_t startByte = 0);
    BitReader(const std::vector<uint8_t>& data, size_t startByte = 0);

    /** Read `width` bits (1..32). Wider requests keep the low 32 bits. */
    uint32_t read(unsigned width);
    void skip(unsigned width) { bitPos_ += width; }

    size_t bitPosition() const { return bitPos_; }
    /** True once the cursor has moved past the last byte. */
    bool overrun() const { return bitPos_ > size_ * 8; }

private:
    const uint8_t* data_ = nullptr;
    size_t size_ = 0;
    size_t bitPos_ = 0;
};

/**
 * Writes fields in the same layout BitReader consumes. Used to build
 * action packets.
 */
class BitWriter {
public:
    BitWriter() = default;
    explicit BitWriter(size_t startBit) : bitPos_(startBit) {}

    void write(uint32_t value, unsigned width);
    void skip(unsigned width);

    size_t bitPosition() const { return bitPos_; }
    const std::vector<uint8_t>& bytes() const { return bytes_; }

private:
    void ensureCapacity(size_t bitCount);

    std::vector<uint8_t> bytes_;
    size_t bitPos_ = 0;
};

} // namespace network
} // namespace trustwatch
