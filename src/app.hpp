/**
 * @file app.hpp
 * @brief Application controller for BackupLens.
 */

#pragma once

#include "backup_file.hpp"
#include "config.hpp"
#include "logger.hpp"
#include <filesystem>
#include <iosfwd>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace BackupLens {

class BackupSetResolver;
class MasterDocumentIndex;
class MetadataAuditMerger;
class MetadataChannel;
class VersionDiffPipeline;

/**
 * @brief Thrown for a malformed command line (exit code 2).
 */
class UsageError : public std::runtime_error {
public:
    explicit UsageError(const std::string& message) : std::runtime_error(message) {}
};

/// @name Exit codes
/// @{
constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;
/// @}

/**
 * @brief Main application controller for BackupLens.
 *
 * Owns every subsystem and wires them together:
 * - loggers (stderr plus the per-batch action log)
 * - the metadata channel backend selected in AppConfig
 * - resolver, audit merger, diff pipeline and master document index
 *
 * Commands print their results to the output stream given at
 * construction. Per-item failures are logged and shown as sentinels;
 * DirectoryUnavailable and FileAccessError propagate to the caller.
 *
 * @par Usage Example:
 * @code
 * App app(AppConfig::fromEnvironment());
 * if (app.init()) {
 *     app.run("versions", {"/srv/docs/backups", "report.txt"});
 *     app.shutdown();
 * }
 * @endcode
 */
class App {
public:
    /**
     * @brief Backup set loaded for one reference file.
     */
    struct VersionView {
        std::string baseName;
        std::vector<VersionSummary> rows;   ///< Newest first
    };

    /**
     * @param config Resolved configuration
     * @param out Destination for command output
     */
    explicit App(AppConfig config, std::ostream& out);
    ~App();

    App(const App&) = delete;
    App& operator=(const App&) = delete;

    /**
     * @brief Create directories, loggers and the metadata backend.
     * @param extraLogger Optional additional sink for every log message
     * @return false if the metadata backend could not be opened
     */
    bool init(std::shared_ptr<Logger> extraLogger = nullptr);

    /**
     * @brief Close the metadata backend.
     */
    void shutdown();

    /**
     * @brief Run one command.
     * @param command Command name, e.g. "versions"
     * @param args Positional arguments after the command
     * @return Process exit code
     * @throws UsageError for unknown commands or wrong argument counts
     */
    int run(const std::string& command, const std::vector<std::string>& args);

    /**
     * @brief Resolve, sync and summarize the backups of a reference file.
     *
     * Selects the batch log for the reference file's base name first, so
     * everything logged while loading lands in that batch's history.
     *
     * @param backupDir Directory holding the backups
     * @param referenceFile Live file name or any backup name of the set
     * @throws DirectoryUnavailable if the backup directory cannot be listed
     */
    VersionView loadVersions(const std::filesystem::path& backupDir, const std::string& referenceFile);

    /**
     * @brief Route subsequent file log entries to a batch's log.
     * @param baseName Batch base name, or empty for the default log
     */
    void selectBatch(const std::string& baseName);

    /**
     * @brief Usage text for the command-line launcher.
     */
    static std::string usage(const std::string& program);

    Logger& logger() { return m_logger; }
    const AppConfig& config() const { return m_config; }
    MetadataAuditMerger& merger() { return *m_merger; }
    VersionDiffPipeline& pipeline() { return *m_pipeline; }
    const std::filesystem::path& currentLogFile() const;

private:
    /// @name Commands
    /// @{
    int cmdVersions(const std::vector<std::string>& args);
    int cmdTag(const std::vector<std::string>& args);
    int cmdShowTag(const std::vector<std::string>& args);
    int cmdHistory(const std::vector<std::string>& args);
    int cmdDocs(const std::vector<std::string>& args);
    int cmdPreview(const std::vector<std::string>& args);
    int cmdDiff(const std::vector<std::string>& args);
    /// @}

    void printVersionTable(const VersionView& view);
    void selectBatchFor(const std::filesystem::path& file);
    static void requireArgs(const std::string& command, const std::vector<std::string>& args,
                            size_t minCount, size_t maxCount);

    AppConfig m_config;
    std::ostream& m_out;

    /// @name Logging
    /// @{
    TeeLogger m_logger;
    std::shared_ptr<StderrLogger> m_stderrLogger;
    std::shared_ptr<FileLogger> m_fileLogger;
    /// @}

    /// @name Subsystems
    /// @{
    std::unique_ptr<MetadataChannel> m_channel;
    std::unique_ptr<MetadataAuditMerger> m_merger;
    std::unique_ptr<BackupSetResolver> m_resolver;
    std::unique_ptr<VersionDiffPipeline> m_pipeline;
    std::unique_ptr<MasterDocumentIndex> m_documents;
    /// @}
};

} // namespace BackupLens
