/**
 * @file backup_resolver.hpp
 * @brief Finds the backups that belong to one logical file.
 */

#pragma once

#include "backup_file.hpp"
#include "logger.hpp"
#include <chrono>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace BackupLens {

/**
 * @brief Resolves a base name to its set of backup files.
 *
 * Scans one directory (non-recursively) for entries whose name starts
 * with the base name and ends with `.bak`, reads each candidate's
 * creation time and returns them newest first.
 *
 * @par Usage Example:
 * @code
 * StderrLogger logger;
 * BackupSetResolver resolver(logger);
 * BackupSet set = resolver.resolve("/home/me/backups", "report");
 * for (const auto& f : set) {
 *     std::cout << f.filename << std::endl;
 * }
 * @endcode
 *
 * @note Resolution is synchronous and recomputed from disk on every
 *       call; there is no cache to invalidate.
 */
class BackupSetResolver {
public:
    /**
     * @brief Reads the creation time of one file.
     *
     * Must throw FileAccessError when the time cannot be read.
     */
    using TimeReader = std::function<std::chrono::system_clock::time_point(const std::filesystem::path&)>;

    /**
     * @param logger Receives per-file failures
     * @param timeReader Creation-time source (defaults to creationTime())
     */
    explicit BackupSetResolver(Logger& logger, TimeReader timeReader = {});

    /**
     * @brief Resolve a backup set.
     *
     * Files whose creation time cannot be read are skipped and reported
     * to the logger; the rest of the set is still returned.
     *
     * @param directory Directory holding the backups
     * @param baseName Base name from NameNormalizer::baseName()
     * @return Backups sorted by creation time, newest first
     * @throws DirectoryUnavailable if the directory is missing or unreadable
     */
    BackupSet resolve(const std::filesystem::path& directory, const std::string& baseName) const;

    /**
     * @brief Check whether a file name belongs to a base name's set.
     */
    static bool isCandidate(const std::string& filename, const std::string& baseName);

    /**
     * @brief Creation time of a file.
     *
     * Uses the birth time reported by statx() and falls back to the
     * inode change time on filesystems that do not record it.
     *
     * @throws FileAccessError if the file cannot be inspected
     */
    static std::chrono::system_clock::time_point creationTime(const std::filesystem::path& path);

private:
    std::vector<std::filesystem::path> listCandidates(const std::filesystem::path& directory,
                                                      const std::string& baseName) const;

    Logger& m_logger;
    TimeReader m_timeReader;
};

} // namespace BackupLens
