#include "core/config.hpp"
#include "core/logger.hpp"
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <fstream>

namespace trustwatch {
namespace core {

namespace {

bool applyJson(const nlohmann::json& doc, CollectorConfig& config) {
    if (!doc.is_object()) {
        LOG_ERROR("Config root is not an object");
        return false;
    }

    CollectorConfig next = config;
    try {
        next.autoSaveInterval = doc.value("auto_save_interval", next.autoSaveInterval);
        next.partyScanInterval = doc.value("party_scan_interval", next.partyScanInterval);
        next.outputDir = doc.value("output_dir", next.outputDir);
        next.trackOnStart = doc.value("track_on_start", next.trackOnStart);
        next.trackMobs = doc.value("track_mobs", next.trackMobs);
        next.damageSampleCap = doc.value("damage_sample_cap", next.damageSampleCap);
        next.damageTakenCap = doc.value("damage_taken_cap", next.damageTakenCap);
        next.positionSampleCap = doc.value("position_sample_cap", next.positionSampleCap);
        next.minPositionSpacing = doc.value("min_position_spacing", next.minPositionSpacing);
        next.logLevel = doc.value("log_level", next.logLevel);
        next.logFile = doc.value("log_file", next.logFile);
    } catch (const nlohmann::json::type_error& e) {
        LOG_ERROR("Config has a value of the wrong type: ", e.what());
        return false;
    }

    if (next.autoSaveInterval <= 0.0f || next.partyScanInterval <= 0.0f) {
        LOG_ERROR("Config intervals must be positive (auto_save_interval=", next.autoSaveInterval,
                  ", party_scan_interval=", next.partyScanInterval, ")");
        return false;
    }

    config = std::move(next);
    return true;
}

} // namespace

bool CollectorConfig::loadFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        LOG_ERROR("Failed to open config: ", path);
        return false;
    }

    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        LOG_ERROR("Failed to parse config JSON: ", e.what());
        return false;
    }

    if (!applyJson(doc, *this)) return false;
    LOG_INFO("Loaded config: ", path, " (output_dir=", outputDir,
             ", auto_save_interval=", autoSaveInterval, "s)");
    return true;
}

bool CollectorConfig::loadFromString(const std::string& json) {
    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(json);
    } catch (const nlohmann::json::parse_error& e) {
        LOG_ERROR("Failed to parse config JSON: ", e.what());
        return false;
    }
    return applyJson(doc, *this);
}

void CollectorConfig::applyEnvironment() {
    if (const char* dir = std::getenv("TRUSTWATCH_OUTPUT_DIR")) {
        if (dir[0] != '\0') {
            outputDir = dir;
        }
    }
}

void CollectorConfig::applyLogging() const {
    auto& logger = Logger::getInstance();
    logger.setLogFile(logFile);
    if (logLevel.empty()) return;
    if (auto level = parseLogLevel(logLevel)) {
        logger.setLogLevel(*level);
    } else {
        LOG_WARNING("Unknown log_level '", logLevel, "' in config");
    }
}

} // namespace core
} // namespace trustwatch
