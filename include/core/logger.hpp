#pragma once

#include <string>
#include <sstream>
#include <mutex>
#include <fstream>
#include <chrono>
#include <atomic>
#include <optional>
#include <cstdint>

namespace trustwatch {
namespace core {

#ifdef _WIN32
#pragma push_macro("ERROR")
#undef ERROR
#endif

enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR
};

// debug/info/warn/warning/error, case-insensitive.
std::optional<LogLevel> parseLogLevel(const std::string& text);

/**
 * Process-wide log sink. Lines go to stdout and, once the first line is
 * written, to a log file. Identical lines arriving within a short window
 * are collapsed into a "repeated N times" line, since a malformed capture
 * tends to produce the same drop message for every chunk.
 */
class Logger {
public:
    static Logger& getInstance();

    void setLogLevel(LogLevel level);
    bool shouldLog(LogLevel level) const;

    // Switches files if one is already open; "" disables the file.
    void setLogFile(const std::string& path);

    template<typename... Args>
    void write(LogLevel level, Args&&... args) {
        if (!shouldLog(level)) return;
        std::ostringstream oss;
        (oss << ... << args);
        log(level, oss.str());
    }

    void log(LogLevel level, const std::string& message);

private:
    static constexpr int kDefaultMinLevel =
#if defined(NDEBUG) || defined(TRUSTWATCH_RELEASE_LOGGING)
        static_cast<int>(LogLevel::WARNING);
#else
        static_cast<int>(LogLevel::INFO);
#endif

    Logger() = default;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void openLocked();
    void openFileLocked();
    void writeLineLocked(LogLevel level, const std::string& message);
    void flushRepeatsLocked();

    std::atomic<int> minLevel_{kDefaultMinLevel};
    std::mutex mutex_;
    std::ofstream file_;
    std::string filePath_ = "logs/trustwatch.log";
    bool opened_ = false;
    bool echo_ = true;

    std::chrono::steady_clock::time_point lastFlush_{};
    std::chrono::milliseconds flushInterval_{250};

    std::chrono::milliseconds repeatWindow_{250};
    LogLevel repeatLevel_ = LogLevel::DEBUG;
    std::string repeatMessage_;
    std::chrono::steady_clock::time_point repeatTime_{};
    uint64_t repeatCount_ = 0;
};

// Arguments are not evaluated when the level is disabled.
#define TRUSTWATCH_LOG(level, ...) do { \
    auto& _tw_logger = trustwatch::core::Logger::getInstance(); \
    if (_tw_logger.shouldLog(level)) { \
        _tw_logger.write(level, __VA_ARGS__); \
    } \
} while (0)

#define LOG_DEBUG(...)   TRUSTWATCH_LOG(trustwatch::core::LogLevel::DEBUG, __VA_ARGS__)
#define LOG_INFO(...)    TRUSTWATCH_LOG(trustwatch::core::LogLevel::INFO, __VA_ARGS__)
#define LOG_WARNING(...) TRUSTWATCH_LOG(trustwatch::core::LogLevel::WARNING, __VA_ARGS__)
#define LOG_ERROR(...)   TRUSTWATCH_LOG(trustwatch::core::LogLevel::ERROR, __VA_ARGS__)

} // namespace core
} // namespace trustwatch

#ifdef _WIN32
#pragma pop_macro("ERROR")
#endif
