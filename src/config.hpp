/**
 * @file config.hpp
 * @brief Runtime configuration: data locations and metadata backend.
 */

#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace BackupLens {

/**
 * @brief Where metadata channels are stored.
 */
enum class StoreBackend {
    Files,      ///< ShadowFileChannel in storeDir
    Sqlite      ///< Database at databasePath
};

/**
 * @brief Resolved configuration for one run.
 *
 * Defaults follow the XDG layout:
 * - data:  $XDG_DATA_HOME/BackupLens or ~/.local/share/BackupLens
 * - cache: ~/.cache/BackupLens
 *
 * Setting BACKUPLENS_HOME puts everything under that directory instead.
 * Without HOME, /tmp/BackupLens is used.
 */
struct AppConfig {
    std::filesystem::path dataDir;
    std::filesystem::path cacheDir;
    std::filesystem::path storeDir;         ///< Shadow file store
    std::filesystem::path databasePath;     ///< SQLite metadata store
    std::filesystem::path logDir;           ///< Batch logs
    std::filesystem::path tempDir;          ///< Copy-through fallback files
    StoreBackend storeBackend = StoreBackend::Files;
    bool verbose = false;

    /**
     * @brief Configuration derived from the environment.
     */
    static AppConfig fromEnvironment();

    /**
     * @brief Configuration with every path derived from two roots.
     */
    static AppConfig fromRoots(const std::filesystem::path& dataDir, const std::filesystem::path& cacheDir);

    /**
     * @brief Parse "files" or "sqlite".
     */
    static std::optional<StoreBackend> parseBackend(const std::string& name);

    static const char* backendName(StoreBackend backend);

    /**
     * @brief Create the data, log and temp directories.
     * @return false if any could not be created
     */
    bool ensureDirectories() const;
};

} // namespace BackupLens
