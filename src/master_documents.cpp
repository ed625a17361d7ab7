#include "master_documents.hpp"
#include "backup_resolver.hpp"
#include "errors.hpp"
#include "name_normalizer.hpp"
#include "time_util.hpp"
#include <algorithm>

namespace BackupLens {

std::string MasterDocument::modifiedLabel() const {
    return modified ? formatLocalTime(*modified, kLogTimeFormat) : "N/A";
}

MasterDocumentIndex::MasterDocumentIndex(Logger& logger) : m_logger(logger) {}

std::vector<std::string> MasterDocumentIndex::listFilenames(const std::filesystem::path& directory,
                                                            bool regularOnly) const {
    std::error_code ec;
    if (!std::filesystem::is_directory(directory, ec)) {
        throw DirectoryUnavailable(directory, ec ? ec.message() : "not a directory");
    }

    std::vector<std::string> names;
    std::filesystem::directory_iterator it(directory, ec);
    const std::filesystem::directory_iterator end;
    while (!ec && it != end) {
        std::error_code typeEc;
        const bool keep = regularOnly ? it->is_regular_file(typeEc) : !it->is_directory(typeEc);
        if (keep) {
            names.push_back(it->path().filename().string());
        }
        it.increment(ec);
    }

    if (ec) {
        throw DirectoryUnavailable(directory, ec.message());
    }

    std::sort(names.begin(), names.end());
    return names;
}

std::vector<MasterDocument> MasterDocumentIndex::list(const std::filesystem::path& productionDir,
                                                      const std::filesystem::path& backupDir) const {
    SCOPED_TIMER(m_logger, "MasterDocumentIndex::list");

    const auto documents = listFilenames(productionDir, true);
    const auto backups = listFilenames(backupDir, false);

    std::vector<MasterDocument> result;
    result.reserve(documents.size());

    for (const auto& name : documents) {
        MasterDocument doc;
        doc.path = productionDir / name;
        doc.filename = name;
        doc.baseName = NameNormalizer::baseName(name);

        std::error_code ec;
        auto mtime = std::filesystem::last_write_time(doc.path, ec);
        if (ec) {
            LOG_ERROR(m_logger, "Failed to read modification time of " << doc.path.string() << ": " << ec.message());
        } else {
            doc.modified = toSystemTime(mtime);
        }

        doc.backupCount = static_cast<size_t>(std::count_if(backups.begin(), backups.end(),
            [&](const std::string& backup) { return BackupSetResolver::isCandidate(backup, doc.baseName); }));

        result.push_back(std::move(doc));
    }

    // Newest first; unreadable times sort last
    std::stable_sort(result.begin(), result.end(),
        [](const MasterDocument& a, const MasterDocument& b) {
            return a.modified > b.modified;
        });

    LOG_INFO(m_logger, "Listed " << result.size() << " master documents in " << productionDir.string());
    return result;
}

} // namespace BackupLens
