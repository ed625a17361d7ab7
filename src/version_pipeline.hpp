/**
 * @file version_pipeline.hpp
 * @brief Turns a resolved backup set into version table rows.
 */

#pragma once

#include "backup_file.hpp"
#include "logger.hpp"
#include <filesystem>
#include <string>
#include <vector>

namespace BackupLens {

class MetadataAuditMerger;

/**
 * @brief Computes version numbers, line counts and change deltas.
 *
 * For a set ordered newest first, entry `i` gets:
 * - version `size - i` (oldest is V1, newest is V<size>)
 * - its line count, or "Error" if it cannot be read
 * - a change descriptor against entry `i + 1` (the next older one):
 *   "N/A" for the oldest, otherwise "<sign><added+removed> lines"
 * - its current metadata tag
 *
 * A file that cannot be read only affects its own cells and the
 * descriptor of the version directly newer than it.
 *
 * @par Example:
 * @code
 * Input (newest first):  report.txt.2024-01-02_100000.bak (85 lines)
 *                        report.txt.2024-01-01_090000.bak (80 lines)
 * Output:  V2  "+5 lines"  85
 *          V1  "N/A"       80
 * @endcode
 */
class VersionDiffPipeline {
public:
    VersionDiffPipeline(MetadataAuditMerger& merger, Logger& logger);

    /**
     * @brief Build one summary per backup, in the same order.
     * @param set Backups sorted newest first
     * @return Summaries; empty for an empty set
     */
    std::vector<VersionSummary> summarize(const BackupSet& set);

    /**
     * @brief Re-read only the metadata tag of each row.
     */
    void refreshTags(std::vector<VersionSummary>& summaries);

    /**
     * @brief Compare two versions.
     * @param older Lines of the older version (baseline)
     * @param current Lines of the newer version
     */
    static ChangeDescriptor describeChange(const std::vector<std::string>& older,
                                           const std::vector<std::string>& current);

    /**
     * @brief Full text of a backup for previewing.
     * @return File content, or "Error reading file: <reason>"
     */
    static std::string preview(const std::filesystem::path& path);

private:
    MetadataAuditMerger& m_merger;
    Logger& m_logger;
};

} // namespace BackupLens
