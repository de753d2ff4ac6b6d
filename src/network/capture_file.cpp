#include "network/capture_file.hpp"
#include "core/logger.hpp"
#include <fstream>
#include <iterator>

namespace trustwatch {
namespace network {

namespace {

uint16_t readLe16(const std::vector<uint8_t>& raw, size_t pos) {
    return static_cast<uint16_t>(raw[pos] | (raw[pos + 1] << 8));
}

void writeLe16(std::vector<uint8_t>& out, uint16_t value) {
    out.push_back(static_cast<uint8_t>(value & 0xFF));
    out.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
}

} // namespace

std::vector<CaptureRecord> CaptureFile::parse(const std::vector<uint8_t>& raw) {
    std::vector<CaptureRecord> records;
    size_t pos = 0;
    while (pos + 4 <= raw.size()) {
        CaptureRecord record;
        record.id = readLe16(raw, pos);
        uint16_t length = readLe16(raw, pos + 2);
        pos += 4;
        if (pos + length > raw.size()) {
            LOG_WARNING("Capture truncated: record ", records.size(), " wants ", length,
                        " bytes, ", raw.size() - pos, " left");
            return records;
        }
        record.bytes.assign(raw.begin() + pos, raw.begin() + pos + length);
        pos += length;
        records.push_back(std::move(record));
    }
    if (pos != raw.size()) {
        LOG_WARNING("Capture has ", raw.size() - pos, " trailing bytes");
    }
    return records;
}

std::optional<std::vector<CaptureRecord>> CaptureFile::read(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        LOG_ERROR("Failed to open capture: ", path);
        return std::nullopt;
    }
    std::vector<uint8_t> raw((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    auto records = parse(raw);
    LOG_INFO("Loaded capture: ", path, " (", records.size(), " records)");
    return records;
}

std::vector<uint8_t> CaptureFile::serialize(const std::vector<CaptureRecord>& records) {
    std::vector<uint8_t> out;
    for (const auto& record : records) {
        writeLe16(out, record.id);
        writeLe16(out, static_cast<uint16_t>(record.bytes.size()));
        out.insert(out.end(), record.bytes.begin(), record.bytes.end());
    }
    return out;
}

bool CaptureFile::write(const std::string& path, const std::vector<CaptureRecord>& records) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        LOG_ERROR("Failed to create capture: ", path);
        return false;
    }
    std::vector<uint8_t> raw = serialize(records);
    file.write(reinterpret_cast<const char*>(raw.data()), static_cast<std::streamsize>(raw.size()));
    return static_cast<bool>(file);
}

} // namespace network
} // namespace trustwatch
