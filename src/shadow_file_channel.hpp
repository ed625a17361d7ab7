/**
 * @file shadow_file_channel.hpp
 * @brief Metadata channels stored as shadow files in a side directory.
 */

#pragma once

#include "metadata_channel.hpp"
#include <filesystem>
#include <string>

namespace BackupLens {

/**
 * @brief MetadataChannel backed by one shadow file per channel key.
 *
 * Shadow files live in a store directory (by default
 * ~/.local/share/BackupLens/streams) and are named after a hash of the
 * channel key:
 * - `<hash>.source` for `P:source`
 * - `<hash>.meta_audit` for `P:meta_audit`
 *
 * Each shadow file starts with a header line `BLSTREAM1 <key>`, so a hash
 * collision or a foreign file is detected instead of silently mixing
 * two files' metadata.
 */
class ShadowFileChannel : public MetadataChannel {
public:
    /**
     * @param storeDir Directory holding the shadow files (created if missing)
     */
    explicit ShadowFileChannel(std::filesystem::path storeDir);

    std::optional<std::string> readSource(const std::filesystem::path& file) override;
    void overwriteSource(const std::filesystem::path& file, const std::string& text) override;
    std::vector<std::string> readAudit(const std::filesystem::path& file) override;
    void appendAudit(const std::filesystem::path& file, const std::vector<std::string>& lines) override;
    void exportAudit(const std::filesystem::path& file, const std::filesystem::path& target) override;
    void importAudit(const std::filesystem::path& file, const std::filesystem::path& source) override;
    std::string describe() const override;

    /**
     * @brief Location of the shadow file for a channel key.
     * @param key Channel key (see MetadataChannel::sourceKey())
     * @param extension ".source" or ".meta_audit"
     */
    std::filesystem::path shadowPath(const std::string& key, const std::string& extension) const;

private:
    std::string hashKey(const std::string& key) const;

    /// Read the body of a shadow file, or std::nullopt if it does not exist.
    std::optional<std::string> readBody(const std::filesystem::path& shadow, const std::string& key) const;

    /// Append raw bytes, writing the header first for a new file.
    void appendBody(const std::filesystem::path& shadow, const std::string& key, const std::string& bytes) const;

    std::filesystem::path m_storeDir;
};

} // namespace BackupLens
