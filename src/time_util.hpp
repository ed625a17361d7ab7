/**
 * @file time_util.hpp
 * @brief Local-time formatting helpers shared by logs, audit entries and tables.
 */

#pragma once

#include <chrono>
#include <filesystem>
#include <string>

namespace BackupLens {

/// Format used for log lines and audit entries, e.g. "2024-01-02 10:00:00".
inline constexpr const char* kLogTimeFormat = "%Y-%m-%d %H:%M:%S";

/// Format used for the version table, e.g. "Tue 01/02/2024 10:00AM" (lower-cased on output).
inline constexpr const char* kTableTimeFormat = "%a %m/%d/%Y %I:%M%p";

/**
 * @brief Format a time point in local time.
 * @param time Time to format
 * @param format strftime-style format
 */
std::string formatLocalTime(std::chrono::system_clock::time_point time, const char* format);

/**
 * @brief Convert a filesystem clock time to the system clock.
 */
std::chrono::system_clock::time_point toSystemTime(std::filesystem::file_time_type time);

/**
 * @brief Lower-case ASCII letters in place and return the string.
 */
std::string toLowerAscii(std::string text);

} // namespace BackupLens
