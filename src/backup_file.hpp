/**
 * @file backup_file.hpp
 * @brief Data types shared by the resolver, the diff pipeline and the UI layer.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace BackupLens {

/**
 * @brief One timestamped backup on disk.
 *
 * Identity is the absolute path. Content is not loaded here; the
 * pipeline reads lines on demand so that a file vanishing between
 * listing and reading only affects its own row.
 */
struct BackupFile {
    std::filesystem::path path;                     ///< Absolute path to the backup
    std::string filename;                           ///< File name without directory
    std::string baseName;                           ///< Logical name shared by the set
    std::chrono::system_clock::time_point created;  ///< Creation time used for ordering
};

/// Newest first, as returned by BackupSetResolver::resolve().
using BackupSet = std::vector<BackupFile>;

/**
 * @brief How a version differs from the next older one.
 *
 * Rendered as "N/A" for the oldest version, "Error" when either file
 * could not be read, and otherwise "<sign><count> lines" where the sign
 * is '+' if the file grew, '-' if it shrank and empty if the line count
 * is unchanged.
 */
struct ChangeDescriptor {
    enum class Kind {
        Baseline,   ///< Oldest version, nothing to compare with
        Changed,    ///< Compared successfully
        Error       ///< Read or compare failure
    };

    Kind kind = Kind::Baseline;
    int64_t changedLines = 0;   ///< Added plus removed lines
    int direction = 0;          ///< +1 grew, -1 shrank, 0 same length

    static ChangeDescriptor baseline() { return {}; }
    static ChangeDescriptor error() { return {Kind::Error, 0, 0}; }
    static ChangeDescriptor changed(int64_t count, int direction) { return {Kind::Changed, count, direction}; }

    std::string toString() const;
};

/**
 * @brief One row of the version table.
 */
struct VersionSummary {
    std::filesystem::path path;                     ///< Backup path (row identity)
    std::string filename;                           ///< Backup file name
    std::string baseName;                           ///< Logical name
    std::chrono::system_clock::time_point created;  ///< Creation time
    std::string dateLabel;                          ///< e.g. "tue 01/02/2024 10:00am"
    int version = 0;                                ///< 1 = oldest
    ChangeDescriptor change;                        ///< Delta against next older version
    std::optional<size_t> totalLines;               ///< std::nullopt when unreadable
    std::string metaTag;                            ///< Current source-channel text

    std::string versionLabel() const { return "V" + std::to_string(version); }
    std::string totalLinesLabel() const { return totalLines ? std::to_string(*totalLines) : "Error"; }
};

} // namespace BackupLens
