/**
 * @file metadata_audit.hpp
 * @brief Metadata tag editing and audit history merging across a backup set.
 */

#pragma once

#include "backup_file.hpp"
#include "logger.hpp"
#include "metadata_channel.hpp"
#include <chrono>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace BackupLens {

/**
 * @brief Reads and writes metadata channels with best-effort semantics.
 *
 * Every tracked file has a source channel (current tag) and an audit
 * channel (every tag ever written, one `[YYYY-MM-DD HH:MM:SS] text` line
 * per edit). An audit entry is identified by its exact trimmed text, so
 * appending the same line twice stores it once.
 *
 * Because the channels are keyed by path, renaming a backup loses its
 * history. syncAcrossSet() copies the union of all audit entries of a
 * backup set into every member, so the history follows the set.
 *
 * @par Failure handling:
 * Channel I/O is tried up to kMaxAttempts times. If all attempts fail,
 * audit reads and appends go through a temporary file in `tempDir` once
 * more. Anything still failing is logged and degrades to an empty result
 * or a skipped write; nothing is thrown to the caller.
 */
class MetadataAuditMerger {
public:
    static constexpr int kMaxAttempts = 3;

    using Clock = std::function<std::chrono::system_clock::time_point()>;

    /**
     * @param channel Storage backend
     * @param logger Receives failures and progress
     * @param tempDir Directory for the copy-through fallback
     */
    MetadataAuditMerger(MetadataChannel& channel, Logger& logger, std::filesystem::path tempDir);

    /**
     * @brief Replace the clock used to stamp audit entries.
     */
    void setClock(Clock clock) { m_clock = std::move(clock); }

    /**
     * @brief Current tag of a file.
     * @return Trimmed source channel content, or "" if absent or unreadable
     */
    std::string readSource(const std::filesystem::path& file);

    /**
     * @brief Set a file's tag and record it in the audit channel.
     *
     * The text is trimmed before storing. Each call appends one audit
     * entry, even if an identical entry already exists. A failed audit
     * append is logged but does not undo the tag write.
     *
     * @return true if the source channel was written
     */
    bool writeSource(const std::filesystem::path& file, const std::string& text);

    /**
     * @brief Audit history, oldest first, without blank lines.
     */
    std::vector<std::string> readAudit(const std::filesystem::path& file);

    /**
     * @brief Audit history, newest first (for history views).
     */
    std::vector<std::string> readAuditNewestFirst(const std::filesystem::path& file);

    /**
     * @brief Append the entries not already present in a file's audit channel.
     *
     * Entries are compared after singleLine(). If the existing history
     * cannot be read the append is skipped, since it could not be
     * deduplicated.
     *
     * @return Number of lines appended
     */
    size_t appendAudit(const std::filesystem::path& file, const std::vector<std::string>& entries);

    /**
     * @brief Give every file in a set the union of all their audit entries.
     * @return Total number of lines appended across the set
     */
    size_t syncAcrossSet(const std::vector<std::filesystem::path>& files);

    /// @copydoc syncAcrossSet(const std::vector<std::filesystem::path>&)
    size_t syncAcrossSet(const BackupSet& set);

    /**
     * @brief Format an audit line for a tag written at `when`.
     *
     * Line breaks in `text` are folded so the entry stays on one line.
     */
    static std::string makeAuditEntry(const std::string& text, std::chrono::system_clock::time_point when);

    /**
     * @brief Strip leading and trailing whitespace.
     */
    static std::string trim(const std::string& text);

    /**
     * @brief Trim `text` and fold each line break (with the blanks around it) into one space.
     */
    static std::string singleLine(const std::string& text);

private:
    /// Run `op` up to kMaxAttempts times; false if every attempt threw ChannelError.
    bool withRetry(const char* what, const std::filesystem::path& file, const std::function<void()>& op);

    /// Audit entries, or std::nullopt if the channel could not be read at all.
    std::optional<std::vector<std::string>> tryReadAudit(const std::filesystem::path& file);

    /// Append `lines` as-is, with retries and the temp file fallback.
    bool appendLines(const std::filesystem::path& file, const std::vector<std::string>& lines);

    std::filesystem::path tempPathFor(const std::filesystem::path& file) const;

    MetadataChannel& m_channel;
    Logger& m_logger;
    std::filesystem::path m_tempDir;
    Clock m_clock;
};

} // namespace BackupLens
