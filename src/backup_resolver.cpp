#include "backup_resolver.hpp"
#include "errors.hpp"
#include "name_normalizer.hpp"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>

namespace BackupLens {

namespace {

constexpr std::string_view kBackupSuffix = ".bak";

std::chrono::system_clock::time_point fromStatx(const struct statx_timestamp& ts) {
    return std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(
            std::chrono::seconds(ts.tv_sec) + std::chrono::nanoseconds(ts.tv_nsec)));
}

} // anonymous namespace

BackupSetResolver::BackupSetResolver(Logger& logger, TimeReader timeReader)
    : m_logger(logger), m_timeReader(std::move(timeReader)) {
    if (!m_timeReader) {
        m_timeReader = &BackupSetResolver::creationTime;
    }
}

bool BackupSetResolver::isCandidate(const std::string& filename, const std::string& baseName) {
    if (filename.size() < baseName.size() || filename.size() < kBackupSuffix.size()) {
        return false;
    }
    return filename.compare(0, baseName.size(), baseName) == 0 &&
           filename.compare(filename.size() - kBackupSuffix.size(), kBackupSuffix.size(), kBackupSuffix) == 0;
}

std::chrono::system_clock::time_point BackupSetResolver::creationTime(const std::filesystem::path& path) {
    struct statx stx {};
    if (statx(AT_FDCWD, path.c_str(), 0, STATX_BTIME | STATX_CTIME, &stx) != 0) {
        throw FileAccessError(path, std::strerror(errno));
    }

    if (stx.stx_mask & STATX_BTIME) {
        return fromStatx(stx.stx_btime);
    }
    if (stx.stx_mask & STATX_CTIME) {
        return fromStatx(stx.stx_ctime);
    }
    throw FileAccessError(path, "creation time not available");
}

std::vector<std::filesystem::path> BackupSetResolver::listCandidates(const std::filesystem::path& directory,
                                                                     const std::string& baseName) const {
    std::error_code ec;
    if (!std::filesystem::is_directory(directory, ec)) {
        throw DirectoryUnavailable(directory, ec ? ec.message() : "not a directory");
    }

    std::vector<std::filesystem::path> candidates;

    std::filesystem::directory_iterator it(directory, ec);
    const std::filesystem::directory_iterator end;
    while (!ec && it != end) {
        const auto& entry = *it;
        std::error_code typeEc;
        if (!entry.is_directory(typeEc) && isCandidate(entry.path().filename().string(), baseName)) {
            candidates.push_back(entry.path());
        }
        it.increment(ec);
    }

    if (ec) {
        throw DirectoryUnavailable(directory, ec.message());
    }

    // Directory order is unspecified; sort so equal timestamps always come out the same way
    std::sort(candidates.begin(), candidates.end());
    return candidates;
}

BackupSet BackupSetResolver::resolve(const std::filesystem::path& directory, const std::string& baseName) const {
    SCOPED_TIMER(m_logger, "BackupSetResolver::resolve");

    auto candidates = listCandidates(directory, baseName);
    LOG_INFO(m_logger, "Found " << candidates.size() << " backups for base '" << baseName << "' in " << directory.string());

    BackupSet result;
    result.reserve(candidates.size());

    for (const auto& path : candidates) {
        BackupFile file;
        file.path = std::filesystem::absolute(path);
        file.filename = path.filename().string();
        file.baseName = baseName;

        try {
            file.created = m_timeReader(path);
        } catch (const FileAccessError& e) {
            LOG_ERROR(m_logger, "Failed to access " << path.string() << ": " << e.what());
            continue;
        } catch (const std::filesystem::filesystem_error& e) {
            LOG_ERROR(m_logger, "Failed to access " << path.string() << ": " << e.what());
            continue;
        }

        result.push_back(std::move(file));
    }

    // Newest first; equal creation times fall back to the stamp in the name, then to name order
    std::stable_sort(result.begin(), result.end(),
        [](const BackupFile& a, const BackupFile& b) {
            if (a.created != b.created) {
                return a.created > b.created;
            }
            // Names without a stamp compare lowest
            return NameNormalizer::backupStamp(a.filename) > NameNormalizer::backupStamp(b.filename);
        });

    return result;
}

} // namespace BackupLens
