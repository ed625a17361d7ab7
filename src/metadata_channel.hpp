/**
 * @file metadata_channel.hpp
 * @brief Storage capability for per-file metadata side channels.
 */

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace BackupLens {

/**
 * @brief Two side channels attached to every tracked file.
 *
 * For a file at absolute path `P` the channels are addressed by the keys
 * `P + ":source"` and `P + ":meta_audit"`:
 * - **source** holds one free-text tag; writing replaces it.
 * - **audit** is an append-only list of lines.
 *
 * On NTFS these are alternate data streams. Backends here store them
 * outside the file (shadow files or SQLite) but keep the same keys.
 *
 * Every operation throws ChannelError on I/O failure. Callers decide
 * whether to retry; see MetadataAuditMerger.
 */
class MetadataChannel {
public:
    static constexpr const char* kSourceSuffix = ":source";
    static constexpr const char* kAuditSuffix = ":meta_audit";

    /**
     * @brief Canonical spelling of a file path used in keys.
     *
     * Relative paths are made absolute and "." / ".." are folded, so the
     * same file reached through different spellings shares its channels.
     */
    static std::string keyPath(const std::filesystem::path& file) {
        std::error_code ec;
        auto absolute = std::filesystem::absolute(file, ec);
        return (ec ? file : absolute).lexically_normal().string();
    }

    static std::string sourceKey(const std::filesystem::path& file) { return keyPath(file) + kSourceSuffix; }
    static std::string auditKey(const std::filesystem::path& file) { return keyPath(file) + kAuditSuffix; }

    virtual ~MetadataChannel() = default;

    /**
     * @brief Read the full source channel.
     * @return Raw content, or std::nullopt if the channel does not exist
     */
    virtual std::optional<std::string> readSource(const std::filesystem::path& file) = 0;

    /**
     * @brief Replace the source channel content.
     */
    virtual void overwriteSource(const std::filesystem::path& file, const std::string& text) = 0;

    /**
     * @brief Read every stored audit line, oldest first.
     * @return Lines without terminators; empty if the channel does not exist
     */
    virtual std::vector<std::string> readAudit(const std::filesystem::path& file) = 0;

    /**
     * @brief Append lines to the audit channel.
     */
    virtual void appendAudit(const std::filesystem::path& file, const std::vector<std::string>& lines) = 0;

    /**
     * @brief Copy the raw audit channel into a plain file.
     *
     * Writes an empty file when the channel does not exist.
     */
    virtual void exportAudit(const std::filesystem::path& file, const std::filesystem::path& target) = 0;

    /**
     * @brief Append the raw content of a plain file to the audit channel.
     */
    virtual void importAudit(const std::filesystem::path& file, const std::filesystem::path& source) = 0;

    /**
     * @brief Short backend description for logs.
     */
    virtual std::string describe() const = 0;
};

} // namespace BackupLens
