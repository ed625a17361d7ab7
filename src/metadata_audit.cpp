#include "metadata_audit.hpp"
#include "errors.hpp"
#include "time_util.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <set>
#include <unordered_set>

namespace BackupLens {

MetadataAuditMerger::MetadataAuditMerger(MetadataChannel& channel, Logger& logger, std::filesystem::path tempDir)
    : m_channel(channel), m_logger(logger), m_tempDir(std::move(tempDir)),
      m_clock([] { return std::chrono::system_clock::now(); }) {}

std::string MetadataAuditMerger::trim(const std::string& text) {
    const char* whitespace = " \t\r\n\f\v";
    size_t begin = text.find_first_not_of(whitespace);
    if (begin == std::string::npos) {
        return {};
    }
    size_t end = text.find_last_not_of(whitespace);
    return text.substr(begin, end - begin + 1);
}

std::string MetadataAuditMerger::singleLine(const std::string& text) {
    const std::string trimmed = trim(text);
    std::string out;
    out.reserve(trimmed.size());
    for (size_t i = 0; i < trimmed.size(); ++i) {
        char c = trimmed[i];
        if (c != '\n' && c != '\r') {
            out += c;
            continue;
        }
        // A line break and the blanks around it become one space
        while (!out.empty() && (out.back() == ' ' || out.back() == '\t')) {
            out.pop_back();
        }
        while (i + 1 < trimmed.size() && std::isspace(static_cast<unsigned char>(trimmed[i + 1]))) {
            ++i;
        }
        out += ' ';
    }
    return out;
}

std::string MetadataAuditMerger::makeAuditEntry(const std::string& text, std::chrono::system_clock::time_point when) {
    return "[" + formatLocalTime(when, kLogTimeFormat) + "] " + singleLine(text);
}

std::filesystem::path MetadataAuditMerger::tempPathFor(const std::filesystem::path& file) const {
    return m_tempDir / ("temp_meta_audit_" + file.filename().string() + ".txt");
}

bool MetadataAuditMerger::withRetry(const char* what, const std::filesystem::path& file,
                                    const std::function<void()>& op) {
    for (int attempt = 1; attempt <= kMaxAttempts; ++attempt) {
        try {
            op();
            return true;
        } catch (const ChannelError& e) {
            LOG_ERROR(m_logger, "Failed to " << what << " for " << file.string()
                      << " (attempt " << attempt << "/" << kMaxAttempts << "): " << e.what());
        }
    }
    return false;
}

// === Source Channel ===

std::string MetadataAuditMerger::readSource(const std::filesystem::path& file) {
    try {
        auto content = m_channel.readSource(file);
        if (!content) {
            std::error_code ec;
            if (!std::filesystem::exists(file, ec)) {
                LOG_WARN(m_logger, "Main file missing " << file.string());
            }
            return {};
        }
        return trim(*content);
    } catch (const ChannelError& e) {
        LOG_ERROR(m_logger, "Failed to read :source for " << file.string() << ": " << e.what());
        return {};
    }
}

bool MetadataAuditMerger::writeSource(const std::filesystem::path& file, const std::string& text) {
    std::error_code ec;
    if (!std::filesystem::exists(file, ec)) {
        LOG_ERROR(m_logger, "Cannot tag missing file " << file.string());
        return false;
    }

    const std::string content = trim(text);
    try {
        m_channel.overwriteSource(file, content);
    } catch (const ChannelError& e) {
        LOG_ERROR(m_logger, "Failed to update metadata for " << file.string() << ": " << e.what());
        return false;
    }

    // Every edit is recorded, even when it repeats an earlier entry
    const std::string entry = makeAuditEntry(content, m_clock());
    if (!appendLines(file, {entry})) {
        LOG_WARN(m_logger, "No audit entry recorded for " << file.string());
    }
    LOG_INFO(m_logger, "Updated meta tag for " << file.string());
    return true;
}

// === Audit Channel ===

std::optional<std::vector<std::string>> MetadataAuditMerger::tryReadAudit(const std::filesystem::path& file) {
    std::vector<std::string> raw;
    bool ok = withRetry("read :meta_audit", file, [&] { raw = m_channel.readAudit(file); });

    if (!ok) {
        // Fallback: copy the stream out to a plain file and read that
        const auto tempPath = tempPathFor(file);
        try {
            std::error_code ec;
            std::filesystem::create_directories(m_tempDir, ec);
            m_channel.exportAudit(file, tempPath);

            std::ifstream in(tempPath, std::ios::binary);
            if (!in) {
                throw ChannelError("Cannot open " + tempPath.string());
            }
            raw.clear();
            std::string line;
            while (std::getline(in, line)) {
                raw.push_back(std::move(line));
            }
            in.close();
            std::filesystem::remove(tempPath, ec);
            LOG_INFO(m_logger, "Read :meta_audit via temp file for " << file.string());
        } catch (const ChannelError& e) {
            LOG_ERROR(m_logger, "Fallback failed to read :meta_audit for " << file.string() << ": " << e.what());
            std::error_code ec;
            std::filesystem::remove(tempPath, ec);
            return std::nullopt;
        }
    }

    std::vector<std::string> entries;
    entries.reserve(raw.size());
    for (const auto& line : raw) {
        std::string entry = trim(line);
        if (!entry.empty()) {
            entries.push_back(std::move(entry));
        }
    }
    return entries;
}

std::vector<std::string> MetadataAuditMerger::readAudit(const std::filesystem::path& file) {
    auto entries = tryReadAudit(file);
    return entries ? std::move(*entries) : std::vector<std::string>{};
}

std::vector<std::string> MetadataAuditMerger::readAuditNewestFirst(const std::filesystem::path& file) {
    auto entries = readAudit(file);
    std::reverse(entries.begin(), entries.end());
    return entries;
}

size_t MetadataAuditMerger::appendAudit(const std::filesystem::path& file, const std::vector<std::string>& entries) {
    if (entries.empty()) {
        return 0;
    }

    std::error_code ec;
    if (!std::filesystem::exists(file, ec)) {
        LOG_ERROR(m_logger, "Append :meta_audit failed, file missing: " << file.string());
        return 0;
    }

    auto existing = tryReadAudit(file);
    if (!existing) {
        LOG_ERROR(m_logger, "Skipping :meta_audit append for " << file.string() << ", existing history unreadable");
        return 0;
    }

    std::unordered_set<std::string> seen(existing->begin(), existing->end());
    std::vector<std::string> novel;
    for (const auto& entry : entries) {
        std::string line = singleLine(entry);
        if (line.empty()) continue;
        if (seen.insert(line).second) {
            novel.push_back(std::move(line));
        }
    }

    if (novel.empty()) {
        LOG_INFO(m_logger, "No new :meta_audit entries to append for " << file.string());
        return 0;
    }

    if (!appendLines(file, novel)) {
        return 0;
    }
    LOG_INFO(m_logger, "Appended " << novel.size() << " new :meta_audit entries to " << file.string());
    return novel.size();
}

bool MetadataAuditMerger::appendLines(const std::filesystem::path& file, const std::vector<std::string>& lines) {
    if (withRetry("append :meta_audit", file, [&] { m_channel.appendAudit(file, lines); })) {
        return true;
    }

    // Fallback: stage the new lines in a plain file and append that
    const auto tempPath = tempPathFor(file);
    std::error_code ec;
    try {
        std::filesystem::create_directories(m_tempDir, ec);
        {
            std::ofstream out(tempPath, std::ios::binary | std::ios::trunc);
            if (!out) {
                throw ChannelError("Cannot open " + tempPath.string());
            }
            for (const auto& line : lines) {
                out << line << "\n";
            }
            out.flush();
            if (!out) {
                throw ChannelError("Write failed for " + tempPath.string());
            }
        }
        m_channel.importAudit(file, tempPath);
        std::filesystem::remove(tempPath, ec);
        LOG_INFO(m_logger, "Appended :meta_audit entries via temp file for " << file.string());
        return true;
    } catch (const ChannelError& e) {
        LOG_ERROR(m_logger, "Fallback failed to append :meta_audit for " << file.string() << ": " << e.what());
        std::filesystem::remove(tempPath, ec);
        return false;
    }
}

size_t MetadataAuditMerger::syncAcrossSet(const std::vector<std::filesystem::path>& files) {
    if (files.empty()) {
        return 0;
    }
    SCOPED_TIMER(m_logger, "MetadataAuditMerger::syncAcrossSet");

    std::set<std::string> unionEntries;
    for (const auto& file : files) {
        auto entries = readAudit(file);
        if (entries.empty()) {
            LOG_INFO(m_logger, "No :meta_audit entries found for " << file.string());
        }
        unionEntries.insert(entries.begin(), entries.end());
    }

    if (unionEntries.empty()) {
        return 0;
    }

    const std::vector<std::string> merged(unionEntries.begin(), unionEntries.end());
    size_t appended = 0;
    for (const auto& file : files) {
        appended += appendAudit(file, merged);
    }
    return appended;
}

size_t MetadataAuditMerger::syncAcrossSet(const BackupSet& set) {
    std::vector<std::filesystem::path> files;
    files.reserve(set.size());
    for (const auto& backup : set) {
        files.push_back(backup.path);
    }
    return syncAcrossSet(files);
}

} // namespace BackupLens
