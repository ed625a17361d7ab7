/**
 * @file database.hpp
 * @brief SQLite database holding metadata side channels.
 */

#pragma once

#include "logger.hpp"
#include "metadata_channel.hpp"
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include <sqlite3.h>

namespace BackupLens {

/**
 * @brief MetadataChannel stored in a single SQLite database.
 *
 * Schema:
 * - `source_channel(key PRIMARY KEY, content, updated_at)`: one row per
 *   `P:source` key, replaced on every write.
 * - `audit_channel(id, key, entry, created_at)`: one row per audit line;
 *   `id` order is the append order.
 *
 * The database is stored at ~/.local/share/BackupLens/metadata.db unless
 * configured otherwise. A busy timeout is set so that a second process
 * holding the lock shows up as a (retryable) ChannelError rather than an
 * immediate failure.
 *
 * @note All operations are synchronous.
 */
class Database : public MetadataChannel {
public:
    explicit Database(Logger& logger);
    ~Database() override;

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    /**
     * @brief Open or create the database at the specified path.
     * @param dbPath Path to the SQLite database file
     * @return true if successfully opened, false on error
     */
    bool open(const std::filesystem::path& dbPath);

    /**
     * @brief Close the database connection.
     */
    void close();

    /**
     * @brief Check if the database is currently open.
     */
    bool isOpen() const { return m_db != nullptr; }

    /// @name MetadataChannel
    /// @{
    std::optional<std::string> readSource(const std::filesystem::path& file) override;
    void overwriteSource(const std::filesystem::path& file, const std::string& text) override;
    std::vector<std::string> readAudit(const std::filesystem::path& file) override;
    void appendAudit(const std::filesystem::path& file, const std::vector<std::string>& lines) override;
    void exportAudit(const std::filesystem::path& file, const std::filesystem::path& target) override;
    void importAudit(const std::filesystem::path& file, const std::filesystem::path& source) override;
    std::string describe() const override;
    /// @}

    /// @name Statistics
    /// @{

    /**
     * @brief Number of files with a stored source tag.
     */
    int getSourceCount();

    /**
     * @brief Number of stored audit lines across all files.
     */
    int getAuditEntryCount();

    /// @}

    /**
     * @brief Get the path to the database file.
     */
    std::filesystem::path getDatabasePath() const { return m_dbPath; }

private:
    bool createTables();
    bool execute(const std::string& sql);
    void requireOpen() const;

    /// Prepare a statement or throw ChannelError.
    sqlite3_stmt* prepare(const char* sql);

    /// Throw ChannelError carrying the current SQLite error message.
    [[noreturn]] void fail(const std::string& what);

    Logger& m_logger;
    sqlite3* m_db = nullptr;            ///< SQLite database handle
    std::filesystem::path m_dbPath;     ///< Path to database file
};

} // namespace BackupLens
