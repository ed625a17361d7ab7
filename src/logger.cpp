#include "logger.hpp"
#include "time_util.hpp"
#include <algorithm>
#include <fstream>
#include <iostream>

namespace BackupLens {

long long getTimestampMs() {
    static auto startTime = std::chrono::steady_clock::now();
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - startTime).count();
}

const char* Logger::levelName(Level level) {
    switch (level) {
        case Level::Info:    return "INFO";
        case Level::Warning: return "WARNING";
        case Level::Error:   return "ERROR";
    }
    return "INFO";
}

// === StderrLogger ===

void StderrLogger::log(Level level, const std::string& message) {
    if (level == Level::Info && !m_verbose) {
        return;
    }
    std::cerr << "[" << getTimestampMs() << "ms] " << levelName(level) << ": " << message << std::endl;
}

// === FileLogger ===

FileLogger::FileLogger(std::filesystem::path logFile)
    : m_logFile(std::move(logFile)),
      m_clock([] { return std::chrono::system_clock::now(); }) {}

std::filesystem::path FileLogger::batchLogPath(const std::filesystem::path& logDir,
                                               const std::string& baseName) {
    if (baseName.empty()) {
        return logDir / "backuplens_default_log.txt";
    }
    return logDir / (baseName + "_loghistory.txt");
}

void FileLogger::setLogFile(std::filesystem::path logFile) {
    if (logFile == m_logFile) {
        return;
    }
    m_logFile = std::move(logFile);
    m_lastEntry.clear();
    m_lastEntryLoaded = false;
}

void FileLogger::log(Level level, const std::string& message) {
    std::string entry = "[" + formatLocalTime(m_clock(), kLogTimeFormat) + "] " + levelName(level) + ": " + message;

    std::error_code ec;
    if (m_logFile.has_parent_path()) {
        std::filesystem::create_directories(m_logFile.parent_path(), ec);
    }

    // Pick up the tail of an existing file once, so duplicates across runs are caught too
    if (!m_lastEntryLoaded) {
        std::ifstream in(m_logFile);
        std::string line;
        while (std::getline(in, line)) {
            if (!line.empty()) {
                m_lastEntry = line;
            }
        }
        m_lastEntryLoaded = true;
    }

    if (entry == m_lastEntry) {
        return;
    }

    std::ofstream out(m_logFile, std::ios::app);
    if (!out) {
        std::cerr << "Failed to write to log file " << m_logFile << ", original message: " << entry << std::endl;
        return;
    }
    out << entry << "\n";
    out.flush();
    m_lastEntry = std::move(entry);
}

// === TeeLogger ===

void TeeLogger::add(std::shared_ptr<Logger> logger) {
    if (logger) {
        m_loggers.push_back(std::move(logger));
    }
}

void TeeLogger::log(Level level, const std::string& message) {
    for (const auto& logger : m_loggers) {
        logger->log(level, message);
    }
}

// === MemoryLogger ===

size_t MemoryLogger::count(Level level) const {
    return static_cast<size_t>(std::count_if(m_entries.begin(), m_entries.end(),
        [level](const Entry& e) { return e.level == level; }));
}

bool MemoryLogger::contains(const std::string& fragment) const {
    return std::any_of(m_entries.begin(), m_entries.end(),
        [&fragment](const Entry& e) { return e.message.find(fragment) != std::string::npos; });
}

// === ScopedTimer ===

ScopedTimer::~ScopedTimer() {
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - m_start).count();
    if (elapsed >= m_thresholdMs) {
        m_logger.warn(std::string("SLOW: ") + m_name + " took " + std::to_string(elapsed) + "ms");
    }
}

} // namespace BackupLens
