/**
 * @file errors.hpp
 * @brief Exception types raised by the backup pipeline.
 *
 * Only DirectoryUnavailable escapes the version pipeline. The other types are
 * thrown internally and contained per file: the pipeline turns
 * FileAccessError into an "Error" cell, and the audit merger retries
 * ChannelError before degrading to an empty result.
 */

#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>

namespace BackupLens {

/**
 * @brief A directory to scan is missing or cannot be listed.
 */
class DirectoryUnavailable : public std::runtime_error {
public:
    DirectoryUnavailable(const std::filesystem::path& directory, const std::string& reason)
        : std::runtime_error("Directory unavailable: " + directory.string() + " (" + reason + ")"),
          m_directory(directory) {}

    const std::filesystem::path& directory() const { return m_directory; }

private:
    std::filesystem::path m_directory;
};

/**
 * @brief A single file could not be read or inspected.
 */
class FileAccessError : public std::runtime_error {
public:
    FileAccessError(const std::filesystem::path& path, const std::string& reason)
        : std::runtime_error(path.string() + ": " + reason), m_path(path) {}

    const std::filesystem::path& path() const { return m_path; }

private:
    std::filesystem::path m_path;
};

/**
 * @brief I/O failure on a metadata side channel.
 */
class ChannelError : public std::runtime_error {
public:
    explicit ChannelError(const std::string& message) : std::runtime_error(message) {}
};

} // namespace BackupLens
