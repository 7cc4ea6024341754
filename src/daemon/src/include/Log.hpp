/*
 * LocalSim runtime - Logging (header)
 * - Thread-safe logger with optional file output and stdio mirror
 * - printf-style API for fast call-sites
 * (c) 2025 LocalSim contributors
 */
#pragma once

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <mutex>
#include <string>

namespace lsim {

/* Severity levels (ascending verbosity). */
enum class LogLevel {
    Error = 0,  // serious failure, operator-visible
    Warn  = 1,  // recoverable anomaly (bad frame, purged forces)
    Info  = 2,  // default operational messages
    Debug = 3,  // per-command diagnostics
    Trace = 4   // very verbose, per-frame
};

/* Parse "ERROR|WARN|WARNING|INFO|DEBUG|TRACE" (any case). Returns false on unknown text. */
bool parseLogLevel(const std::string& text, LogLevel& out);

/* Lowercase name of a level ("info", ...). */
const char* logLevelName(LogLevel lvl);

/*
 * Logger - singleton, safe for concurrent writers.
 * - The file is opened lazily in append mode; its directory is created if needed.
 * - Warn/Error go to stderr, the rest to stdout, when mirroring is enabled.
 * - A file that cannot be opened degrades to mirror mode.
 */
class Logger {
public:
    static Logger& instance();

    ~Logger();

    /*
     * Initialize from daemon main.
     *  - logFilePath: destination file (empty = no file).
     *  - lvl: minimum severity to emit.
     *  - mirrorToStdio: also print to stdout/stderr.
     */
    void init(const std::string& logFilePath, LogLevel lvl, bool mirrorToStdio);

    void setMirrorToStdio(bool on);
    void setLevel(LogLevel lvl);
    LogLevel level() const;

    /* Close the file (idempotent). */
    void shutdown();

    /* Core write (printf-style). Thread-safe. */
    void write(LogLevel lvl, const char* fmt, ...) __attribute__((format(printf, 3, 4)));

    void vwrite(LogLevel lvl, const char* fmt, va_list ap);

private:
    Logger() = default;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void openFileIfNeeded();
    void closeFileUnlocked();
    const char* levelTag(LogLevel lvl) const;

private:
    std::mutex mtx_;
    std::atomic<int> level_{static_cast<int>(LogLevel::Info)};
    std::atomic<bool> mirror_{false};
    std::string filePath_;
    FILE* file_{nullptr};
};

#define LOG_ERROR(fmt, ...) ::lsim::Logger::instance().write(::lsim::LogLevel::Error, fmt, ##__VA_ARGS__)
#define LOG_WARN(fmt, ...)  ::lsim::Logger::instance().write(::lsim::LogLevel::Warn,  fmt, ##__VA_ARGS__)
#define LOG_INFO(fmt, ...)  ::lsim::Logger::instance().write(::lsim::LogLevel::Info,  fmt, ##__VA_ARGS__)
#define LOG_DEBUG(fmt, ...) ::lsim::Logger::instance().write(::lsim::LogLevel::Debug, fmt, ##__VA_ARGS__)
#define LOG_TRACE(fmt, ...) ::lsim::Logger::instance().write(::lsim::LogLevel::Trace, fmt, ##__VA_ARGS__)

} // namespace lsim
