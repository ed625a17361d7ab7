#include "database.hpp"
#include "errors.hpp"
#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>

namespace BackupLens {

// Helper to safely get text from SQLite column (returns empty string if NULL)
static inline std::string safeColumnText(sqlite3_stmt* stmt, int col) {
    const unsigned char* text = sqlite3_column_text(stmt, col);
    return text ? reinterpret_cast<const char*>(text) : std::string{};
}

Database::Database(Logger& logger) : m_logger(logger) {}

Database::~Database() {
    close();
}

bool Database::open(const std::filesystem::path& dbPath) {
    if (m_db) {
        close();
    }

    m_dbPath = dbPath;

    // Create parent directory if it doesn't exist
    std::error_code ec;
    if (dbPath.has_parent_path()) {
        std::filesystem::create_directories(dbPath.parent_path(), ec);
    }

    int rc = sqlite3_open(dbPath.string().c_str(), &m_db);
    if (rc != SQLITE_OK) {
        LOG_ERROR(m_logger, "Failed to open database: " << sqlite3_errmsg(m_db));
        sqlite3_close(m_db);
        m_db = nullptr;
        return false;
    }

    sqlite3_busy_timeout(m_db, 2000);

    if (!createTables()) {
        LOG_ERROR(m_logger, "Failed to create metadata tables in " << dbPath.string());
        sqlite3_close(m_db);
        m_db = nullptr;
        return false;
    }

    LOG_INFO(m_logger, "Database opened: " << dbPath.string());
    return true;
}

void Database::close() {
    if (m_db) {
        sqlite3_close(m_db);
        m_db = nullptr;
        LOG_INFO(m_logger, "Database closed");
    }
}

std::string Database::describe() const {
    return "sqlite database " + m_dbPath.string();
}

bool Database::createTables() {
    return execute(R"(
        CREATE TABLE IF NOT EXISTS source_channel (
            key TEXT PRIMARY KEY NOT NULL,
            content TEXT NOT NULL,
            updated_at DATETIME DEFAULT CURRENT_TIMESTAMP
        );
    )") && execute(R"(
        CREATE TABLE IF NOT EXISTS audit_channel (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            key TEXT NOT NULL,
            entry TEXT NOT NULL,
            created_at DATETIME DEFAULT CURRENT_TIMESTAMP
        );
    )") && execute("CREATE INDEX IF NOT EXISTS idx_audit_key ON audit_channel(key);");
}

bool Database::execute(const std::string& sql) {
    char* errMsg = nullptr;
    int rc = sqlite3_exec(m_db, sql.c_str(), nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        LOG_ERROR(m_logger, "SQL error: " << (errMsg ? errMsg : sqlite3_errmsg(m_db)));
        sqlite3_free(errMsg);
        return false;
    }
    return true;
}

void Database::requireOpen() const {
    if (!m_db) {
        throw ChannelError("Metadata database is not open");
    }
}

void Database::fail(const std::string& what) {
    throw ChannelError(what + ": " + sqlite3_errmsg(m_db));
}

sqlite3_stmt* Database::prepare(const char* sql) {
    requireOpen();
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        fail("Failed to prepare statement");
    }
    return stmt;
}

// === Source Channel ===

std::optional<std::string> Database::readSource(const std::filesystem::path& file) {
    sqlite3_stmt* stmt = prepare("SELECT content FROM source_channel WHERE key = ?;");

    std::string key = sourceKey(file);
    sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);

    int rc = sqlite3_step(stmt);
    std::optional<std::string> result;
    if (rc == SQLITE_ROW) {
        result = safeColumnText(stmt, 0);
    }
    sqlite3_finalize(stmt);

    if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
        fail("Failed to read " + key);
    }
    return result;
}

void Database::overwriteSource(const std::filesystem::path& file, const std::string& text) {
    sqlite3_stmt* stmt = prepare(
        "INSERT OR REPLACE INTO source_channel (key, content, updated_at) VALUES (?, ?, CURRENT_TIMESTAMP);");

    std::string key = sourceKey(file);
    sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, text.c_str(), static_cast<int>(text.size()), SQLITE_TRANSIENT);

    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        fail("Failed to write " + key);
    }
}

// === Audit Channel ===

std::vector<std::string> Database::readAudit(const std::filesystem::path& file) {
    sqlite3_stmt* stmt = prepare("SELECT entry FROM audit_channel WHERE key = ? ORDER BY id;");

    std::string key = auditKey(file);
    sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);

    std::vector<std::string> result;
    int rc;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        result.emplace_back(safeColumnText(stmt, 0));
    }
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        fail("Failed to read " + key);
    }
    return result;
}

void Database::appendAudit(const std::filesystem::path& file, const std::vector<std::string>& lines) {
    if (lines.empty()) {
        return;
    }

    requireOpen();
    if (!execute("BEGIN TRANSACTION;")) {
        fail("Failed to begin transaction");
    }

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, "INSERT INTO audit_channel (key, entry) VALUES (?, ?);", -1, &stmt, nullptr) != SQLITE_OK) {
        std::string message = sqlite3_errmsg(m_db);
        execute("ROLLBACK;");
        throw ChannelError("Failed to prepare statement: " + message);
    }

    std::string key = auditKey(file);
    for (const auto& line : lines) {
        sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 2, line.c_str(), static_cast<int>(line.size()), SQLITE_TRANSIENT);

        if (sqlite3_step(stmt) != SQLITE_DONE) {
            std::string message = sqlite3_errmsg(m_db);
            sqlite3_finalize(stmt);
            execute("ROLLBACK;");
            throw ChannelError("Failed to append to " + key + ": " + message);
        }
        sqlite3_reset(stmt);
        sqlite3_clear_bindings(stmt);
    }
    sqlite3_finalize(stmt);

    if (!execute("COMMIT;")) {
        execute("ROLLBACK;");
        throw ChannelError("Failed to commit audit entries for " + key);
    }
}

void Database::exportAudit(const std::filesystem::path& file, const std::filesystem::path& target) {
    auto lines = readAudit(file);

    std::ofstream out(target, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw ChannelError("Cannot open " + target.string() + ": " + std::strerror(errno));
    }
    for (const auto& line : lines) {
        out << line << "\n";
    }
    out.flush();
    if (!out) {
        throw ChannelError("Write failed for " + target.string());
    }
}

void Database::importAudit(const std::filesystem::path& file, const std::filesystem::path& source) {
    std::ifstream in(source, std::ios::binary);
    if (!in) {
        throw ChannelError("Cannot open " + source.string() + ": " + std::strerror(errno));
    }

    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(std::move(line));
    }
    if (in.bad()) {
        throw ChannelError("Read failed for " + source.string());
    }

    appendAudit(file, lines);
}

// === Statistics ===

int Database::getSourceCount() {
    sqlite3_stmt* stmt = prepare("SELECT COUNT(*) FROM source_channel;");
    int count = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        count = sqlite3_column_int(stmt, 0);
    }
    sqlite3_finalize(stmt);
    return count;
}

int Database::getAuditEntryCount() {
    sqlite3_stmt* stmt = prepare("SELECT COUNT(*) FROM audit_channel;");
    int count = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        count = sqlite3_column_int(stmt, 0);
    }
    sqlite3_finalize(stmt);
    return count;
}

} // namespace BackupLens
