#pragma once

#include <cstdint>
#include <string>

namespace trustwatch {
namespace core {

/**
 * Collector settings. Every field has a usable default; a config file
 * only needs the keys it changes.
 */
struct CollectorConfig {
    float autoSaveInterval = 60.0f;    // seconds
    float partyScanInterval = 5.0f;    // seconds
    std::string outputDir = "data";
    bool trackOnStart = true;
    bool trackMobs = true;

    uint32_t damageSampleCap = 100;
    uint32_t damageTakenCap = 500;
    uint32_t positionSampleCap = 20;
    float minPositionSpacing = 5.0f;

    std::string logLevel;              // empty keeps the logger default
    std::string logFile = "logs/trustwatch.log";

    /**
     * Read a JSON config. Missing keys keep their current value. Returns
     * false (and leaves the config untouched) if the file cannot be read
     * or parsed.
     */
    bool loadFromFile(const std::string& path);
    bool loadFromString(const std::string& json);

    /** TRUSTWATCH_OUTPUT_DIR overrides outputDir. */
    void applyEnvironment();

    /** Push logLevel/logFile into the Logger. */
    void applyLogging() const;
};

} // namespace core
} // namespace trustwatch
