/**
 * @file master_documents.hpp
 * @brief Lists live documents together with how many backups each has.
 */

#pragma once

#include "logger.hpp"
#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace BackupLens {

/**
 * @brief One live document in the production directory.
 */
struct MasterDocument {
    std::filesystem::path path;                 ///< Full path to the live file
    std::string filename;                       ///< File name only
    std::string baseName;                       ///< NameNormalizer::baseName(filename)
    std::optional<std::chrono::system_clock::time_point> modified;  ///< Last write time, if readable
    size_t backupCount = 0;                     ///< Matching .bak files in the backup directory

    /**
     * @brief Modification time as "YYYY-MM-DD HH:MM:SS", or "N/A".
     */
    std::string modifiedLabel() const;
};

/**
 * @brief Builds the master document list for a production/backup directory pair.
 *
 * @par Usage Example:
 * @code
 * StderrLogger logger;
 * MasterDocumentIndex index(logger);
 * for (const auto& doc : index.list("/srv/docs", "/srv/docs/backups")) {
 *     std::cout << doc.filename << " " << doc.backupCount << std::endl;
 * }
 * @endcode
 */
class MasterDocumentIndex {
public:
    explicit MasterDocumentIndex(Logger& logger);

    /**
     * @brief List every regular file in the production directory.
     * @param productionDir Directory holding the live documents
     * @param backupDir Directory holding their backups
     * @return Documents sorted by modification time, newest first
     * @throws DirectoryUnavailable if either directory is missing or unreadable
     */
    std::vector<MasterDocument> list(const std::filesystem::path& productionDir,
                                     const std::filesystem::path& backupDir) const;

private:
    std::vector<std::string> listFilenames(const std::filesystem::path& directory, bool regularOnly) const;

    Logger& m_logger;
};

} // namespace BackupLens
