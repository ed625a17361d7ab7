#include "version_pipeline.hpp"
#include "errors.hpp"
#include "line_diff.hpp"
#include "metadata_audit.hpp"
#include "text_reader.hpp"
#include "time_util.hpp"
#include <optional>

namespace BackupLens {

VersionDiffPipeline::VersionDiffPipeline(MetadataAuditMerger& merger, Logger& logger)
    : m_merger(merger), m_logger(logger) {}

ChangeDescriptor VersionDiffPipeline::describeChange(const std::vector<std::string>& older,
                                                     const std::vector<std::string>& current) {
    const size_t changed = LineDiff::changedLineCount(older, current);
    const int direction = current.size() > older.size() ? 1 : current.size() < older.size() ? -1 : 0;
    return ChangeDescriptor::changed(static_cast<int64_t>(changed), direction);
}

std::vector<VersionSummary> VersionDiffPipeline::summarize(const BackupSet& set) {
    SCOPED_TIMER(m_logger, "VersionDiffPipeline::summarize");

    // Each file is read at most once and kept for two rows; std::nullopt marks a failed read
    std::vector<std::optional<std::vector<std::string>>> lines(set.size());
    std::vector<std::string> readErrors(set.size());
    std::vector<bool> loaded(set.size(), false);

    auto load = [&](size_t i) -> const std::optional<std::vector<std::string>>& {
        if (!loaded[i]) {
            loaded[i] = true;
            try {
                lines[i] = TextReader::readLines(set[i].path);
            } catch (const FileAccessError& e) {
                readErrors[i] = e.what();
            }
        }
        return lines[i];
    };

    std::vector<VersionSummary> result;
    result.reserve(set.size());

    const size_t total = set.size();
    for (size_t i = 0; i < total; ++i) {
        const BackupFile& file = set[i];

        VersionSummary summary;
        summary.path = file.path;
        summary.filename = file.filename;
        summary.baseName = file.baseName;
        summary.created = file.created;
        summary.dateLabel = toLowerAscii(formatLocalTime(file.created, kTableTimeFormat));
        summary.version = static_cast<int>(total - i);

        const auto& current = load(i);
        if (current) {
            summary.totalLines = current->size();
        } else {
            LOG_ERROR(m_logger, "Failed to count lines in " << file.path.string() << ": " << readErrors[i]);
        }

        if (i + 1 == total) {
            summary.change = ChangeDescriptor::baseline();
        } else {
            const auto& older = load(i + 1);
            if (current && older) {
                summary.change = describeChange(*older, *current);
            } else {
                LOG_ERROR(m_logger, "Failed to compare " << file.path.string() << " with "
                          << set[i + 1].path.string() << ": "
                          << (current ? readErrors[i + 1] : readErrors[i]));
                summary.change = ChangeDescriptor::error();
            }
        }

        summary.metaTag = m_merger.readSource(file.path);
        result.push_back(std::move(summary));

        // Only the next older file is needed from here on
        lines[i].reset();
    }

    return result;
}

void VersionDiffPipeline::refreshTags(std::vector<VersionSummary>& summaries) {
    for (auto& summary : summaries) {
        summary.metaTag = m_merger.readSource(summary.path);
    }
    LOG_INFO(m_logger, "Refreshed meta tags for " << summaries.size() << " files");
}

std::string VersionDiffPipeline::preview(const std::filesystem::path& path) {
    try {
        return TextReader::readAll(path);
    } catch (const FileAccessError& e) {
        return std::string("Error reading file: ") + e.what();
    }
}

} // namespace BackupLens
