#include "core/logger.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>

namespace trustwatch {
namespace core {

namespace {

const char* levelTag(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG:   return "DEBUG";
        case LogLevel::INFO:    return "INFO ";
        case LogLevel::WARNING: return "WARN ";
        case LogLevel::ERROR:   return "ERROR";
    }
    return "?????";
}

} // namespace

std::optional<LogLevel> parseLogLevel(const std::string& text) {
    std::string v(text);
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (v == "debug") return LogLevel::DEBUG;
    if (v == "info") return LogLevel::INFO;
    if (v == "warn" || v == "warning") return LogLevel::WARNING;
    if (v == "error") return LogLevel::ERROR;
    return std::nullopt;
}

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

void Logger::setLogLevel(LogLevel level) {
    minLevel_.store(static_cast<int>(level), std::memory_order_relaxed);
}

bool Logger::shouldLog(LogLevel level) const {
    return static_cast<int>(level) >= minLevel_.load(std::memory_order_relaxed);
}

void Logger::setLogFile(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (path == filePath_) return;
    filePath_ = path;
    if (!opened_) return;

    flushRepeatsLocked();
    if (file_.is_open()) file_.close();
    openFileLocked();
}

void Logger::openLocked() {
    if (opened_) return;
    opened_ = true;

    if (const char* env = std::getenv("TRUSTWATCH_LOG_STDOUT")) {
        if (env[0] == '0') echo_ = false;
    }
    if (const char* env = std::getenv("TRUSTWATCH_LOG_LEVEL")) {
        if (auto level = parseLogLevel(env)) setLogLevel(*level);
    }
    openFileLocked();
}

void Logger::openFileLocked() {
    if (filePath_.empty()) return;

    std::error_code ec;
    auto parent = std::filesystem::path(filePath_).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
    }
    file_.open(filePath_, std::ios::out | std::ios::trunc);
    if (!file_.is_open() && echo_) {
        std::cerr << "Could not open log file " << filePath_ << ", logging to stdout only\n";
    }
    lastFlush_ = std::chrono::steady_clock::now();
}

void Logger::writeLineLocked(LogLevel level, const std::string& message) {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm;
#ifdef _WIN32
    localtime_s(&tm, &time);
#else
    localtime_r(&time, &tm);
#endif

    // [YYYY-MM-DD HH:MM:SS.mmm] [LEVEL] message
    std::ostringstream line;
    line << "[" << std::put_time(&tm, "%Y-%m-%d %H:%M:%S")
         << "." << std::setfill('0') << std::setw(3) << ms.count()
         << "] [" << levelTag(level) << "] " << message;

    if (echo_) {
        std::cout << line.str() << '\n';
    }
    if (!file_.is_open()) return;

    file_ << line.str() << '\n';
    auto steadyNow = std::chrono::steady_clock::now();
    if (level >= LogLevel::WARNING || steadyNow - lastFlush_ >= flushInterval_) {
        file_.flush();
        lastFlush_ = steadyNow;
    }
}

void Logger::flushRepeatsLocked() {
    if (repeatCount_ == 0) return;
    writeLineLocked(repeatLevel_, "Previous message repeated " + std::to_string(repeatCount_) + " times");
    repeatCount_ = 0;
}

void Logger::log(LogLevel level, const std::string& message) {
    if (!shouldLog(level)) return;

    std::lock_guard<std::mutex> lock(mutex_);
    openLocked();

    auto now = std::chrono::steady_clock::now();
    if (level == repeatLevel_ && message == repeatMessage_ && !repeatMessage_.empty() &&
        now - repeatTime_ <= repeatWindow_) {
        ++repeatCount_;
        repeatTime_ = now;
        return;
    }

    flushRepeatsLocked();
    writeLineLocked(level, message);
    repeatLevel_ = level;
    repeatMessage_ = message;
    repeatTime_ = now;
}

} // namespace core
} // namespace trustwatch
