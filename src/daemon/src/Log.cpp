/*
 * LocalSim runtime - Logging (implementation)
 * (c) 2025 LocalSim contributors
 */

#include "include/Log.hpp"
#include "include/Utils.hpp"

#include <array>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <system_error>

namespace lsim {

// -----------------------------------------------------------------------------
// helpers
// -----------------------------------------------------------------------------

static inline std::string makeTimestamp() {
    // Format: "YYYY-MM-DD HH:MM:SS"
    std::time_t t = std::time(nullptr);
    std::tm tmv{};
    localtime_r(&t, &tmv);
    std::array<char, 32> buf{};
    if (std::strftime(buf.data(), buf.size(), "%Y-%m-%d %H:%M:%S", &tmv) == 0) {
        return "1970-01-01 00:00:00";
    }
    return std::string(buf.data());
}

bool parseLogLevel(const std::string& text, LogLevel& out) {
    const std::string v = util::to_lower(util::trim(text));
    if (v == "error")                   { out = LogLevel::Error; return true; }
    if (v == "warn" || v == "warning")  { out = LogLevel::Warn;  return true; }
    if (v == "info")                    { out = LogLevel::Info;  return true; }
    if (v == "debug")                   { out = LogLevel::Debug; return true; }
    if (v == "trace")                   { out = LogLevel::Trace; return true; }
    return false;
}

const char* logLevelName(LogLevel lvl) {
    switch (lvl) {
        case LogLevel::Error: return "error";
        case LogLevel::Warn:  return "warn";
        case LogLevel::Info:  return "info";
        case LogLevel::Debug: return "debug";
        case LogLevel::Trace: return "trace";
    }
    return "info";
}

// -----------------------------------------------------------------------------
// Logger
// -----------------------------------------------------------------------------

Logger& Logger::instance() {
    static Logger g;
    return g;
}

Logger::~Logger() {
    std::lock_guard<std::mutex> lock(mtx_);
    closeFileUnlocked();
}

void Logger::init(const std::string& logFilePath, LogLevel lvl, bool mirrorToStdio) {
    std::lock_guard<std::mutex> lock(mtx_);

    level_.store(static_cast<int>(lvl), std::memory_order_relaxed);
    mirror_.store(mirrorToStdio, std::memory_order_relaxed);

    closeFileUnlocked();
    filePath_ = logFilePath;

    if (!filePath_.empty()) {
        std::error_code ec;
        util::ensure_parent_dirs(filePath_, &ec);
        openFileIfNeeded();
    }
}

void Logger::setMirrorToStdio(bool on) {
    mirror_.store(on, std::memory_order_relaxed);
}

void Logger::setLevel(LogLevel lvl) {
    level_.store(static_cast<int>(lvl), std::memory_order_relaxed);
}

LogLevel Logger::level() const {
    return static_cast<LogLevel>(level_.load(std::memory_order_relaxed));
}

void Logger::shutdown() {
    std::lock_guard<std::mutex> lock(mtx_);
    closeFileUnlocked();
}

void Logger::closeFileUnlocked() {
    if (file_) {
        std::fflush(file_);
        std::fclose(file_);
        file_ = nullptr;
    }
}

void Logger::openFileIfNeeded() {
    if (file_ || filePath_.empty()) return;
    file_ = std::fopen(filePath_.c_str(), "a");
    if (!file_) {
        mirror_.store(true, std::memory_order_relaxed); // degrade gracefully
    }
}

const char* Logger::levelTag(LogLevel lvl) const {
    switch (lvl) {
        case LogLevel::Error: return "E";
        case LogLevel::Warn:  return "W";
        case LogLevel::Info:  return "I";
        case LogLevel::Debug: return "D";
        case LogLevel::Trace: return "T";
    }
    return "?";
}

void Logger::write(LogLevel lvl, const char* fmt, ...) {
    if (static_cast<int>(lvl) > level_.load(std::memory_order_relaxed)) return;

    va_list ap;
    va_start(ap, fmt);
    vwrite(lvl, fmt, ap);
    va_end(ap);
}

void Logger::vwrite(LogLevel lvl, const char* fmt, va_list ap) {
    if (static_cast<int>(lvl) > level_.load(std::memory_order_relaxed)) return;

    char msgBuf[2048];
    std::vsnprintf(msgBuf, sizeof(msgBuf), fmt, ap);

    // "2025-09-20 14:22:11 [I] message\n"
    std::string line = makeTimestamp();
    line += " [";
    line += levelTag(lvl);
    line += "] ";
    line += msgBuf;
    if (line.back() != '\n') line.push_back('\n');

    std::lock_guard<std::mutex> lock(mtx_);

    openFileIfNeeded();
    if (file_) {
        std::fwrite(line.data(), 1, line.size(), file_);
        std::fflush(file_);
    }

    if (mirror_.load(std::memory_order_relaxed)) {
        FILE* out = (lvl == LogLevel::Error || lvl == LogLevel::Warn) ? stderr : stdout;
        std::fwrite(line.data(), 1, line.size(), out);
        std::fflush(out);
    }
}

} // namespace lsim
