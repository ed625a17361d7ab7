/**
 * @file logger.hpp
 * @brief Injected logging capability and slow-operation timer.
 */

#pragma once

#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

namespace BackupLens {

/**
 * @brief Milliseconds elapsed since the first call in this process.
 */
long long getTimestampMs();

/**
 * @brief Abstract logging sink passed into every component.
 *
 * Components never log through a global; the caller decides where
 * messages go (stderr, a batch log file, memory, or several at once).
 */
class Logger {
public:
    enum class Level {
        Info,
        Warning,
        Error
    };

    virtual ~Logger() = default;

    /**
     * @brief Record one message.
     * @param level Severity
     * @param message Text without trailing newline
     */
    virtual void log(Level level, const std::string& message) = 0;

    void info(const std::string& message) { log(Level::Info, message); }
    void warn(const std::string& message) { log(Level::Warning, message); }
    void error(const std::string& message) { log(Level::Error, message); }

    static const char* levelName(Level level);
};

/**
 * @brief Writes `[<ms>ms] LEVEL: message` to stderr.
 *
 * Info messages are only shown in verbose mode.
 */
class StderrLogger : public Logger {
public:
    explicit StderrLogger(bool verbose = false) : m_verbose(verbose) {}

    void log(Level level, const std::string& message) override;

private:
    bool m_verbose;
};

/**
 * @brief Per-batch action log file.
 *
 * Each entry is appended as `[YYYY-MM-DD HH:MM:SS] LEVEL: message`.
 * An entry identical to the last line of the file is dropped so that
 * repeated refreshes do not flood the log.
 */
class FileLogger : public Logger {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    explicit FileLogger(std::filesystem::path logFile);

    /**
     * @brief Replace the clock used for entry timestamps.
     */
    void setClock(Clock clock) { m_clock = std::move(clock); }

    void log(Level level, const std::string& message) override;

    /**
     * @brief Switch to another log file (e.g. when a new batch is selected).
     */
    void setLogFile(std::filesystem::path logFile);

    const std::filesystem::path& logFile() const { return m_logFile; }

    /**
     * @brief Log file name for a batch.
     * @param logDir Directory holding batch logs
     * @param baseName Batch base name, or empty for the default log
     * @return `<logDir>/<baseName>_loghistory.txt` or the default log path
     */
    static std::filesystem::path batchLogPath(const std::filesystem::path& logDir,
                                              const std::string& baseName);

private:
    std::filesystem::path m_logFile;
    std::string m_lastEntry;    ///< Last line written or found in the file
    bool m_lastEntryLoaded = false;
    Clock m_clock;
};

/**
 * @brief Forwards every message to several loggers.
 */
class TeeLogger : public Logger {
public:
    TeeLogger() = default;

    void add(std::shared_ptr<Logger> logger);
    void log(Level level, const std::string& message) override;

private:
    std::vector<std::shared_ptr<Logger>> m_loggers;
};

/**
 * @brief Keeps entries in memory.
 */
class MemoryLogger : public Logger {
public:
    struct Entry {
        Level level;
        std::string message;
    };

    void log(Level level, const std::string& message) override {
        m_entries.push_back({level, message});
    }

    const std::vector<Entry>& entries() const { return m_entries; }
    size_t count(Level level) const;
    bool contains(const std::string& fragment) const;
    void clear() { m_entries.clear(); }

private:
    std::vector<Entry> m_entries;
};

/**
 * @brief Logs a SLOW warning when the enclosing scope exceeds a threshold.
 */
class ScopedTimer {
public:
    ScopedTimer(Logger& logger, const char* name, int thresholdMs = 50)
        : m_logger(logger), m_name(name), m_thresholdMs(thresholdMs),
          m_start(std::chrono::steady_clock::now()) {}

    ~ScopedTimer();

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    Logger& m_logger;
    const char* m_name;
    int m_thresholdMs;
    std::chrono::steady_clock::time_point m_start;
};

} // namespace BackupLens

#define LOG_INFO(logger, msg) do { std::ostringstream _oss; _oss << msg; (logger).info(_oss.str()); } while(0)
#define LOG_WARN(logger, msg) do { std::ostringstream _oss; _oss << msg; (logger).warn(_oss.str()); } while(0)
#define LOG_ERROR(logger, msg) do { std::ostringstream _oss; _oss << msg; (logger).error(_oss.str()); } while(0)

#define BACKUPLENS_CONCAT_IMPL(a, b) a##b
#define BACKUPLENS_CONCAT(a, b) BACKUPLENS_CONCAT_IMPL(a, b)
#define SCOPED_TIMER(logger, name) ::BackupLens::ScopedTimer BACKUPLENS_CONCAT(_timer_, __LINE__)(logger, name)
#define SCOPED_TIMER_THRESHOLD(logger, name, ms) ::BackupLens::ScopedTimer BACKUPLENS_CONCAT(_timer_, __LINE__)(logger, name, ms)
