#include "app.hpp"
#include "backup_resolver.hpp"
#include "database.hpp"
#include "line_diff.hpp"
#include "master_documents.hpp"
#include "metadata_audit.hpp"
#include "name_normalizer.hpp"
#include "shadow_file_channel.hpp"
#include "text_reader.hpp"
#include "version_pipeline.hpp"
#include <iomanip>
#include <sstream>

namespace BackupLens {

App::App(AppConfig config, std::ostream& out)
    : m_config(std::move(config)), m_out(out) {}

App::~App() {
    shutdown();
}

bool App::init(std::shared_ptr<Logger> extraLogger) {
    m_stderrLogger = std::make_shared<StderrLogger>(m_config.verbose);
    m_logger.add(m_stderrLogger);

    if (!m_config.ensureDirectories()) {
        LOG_WARN(m_logger, "Could not create all data directories under " << m_config.dataDir.string());
    }

    m_fileLogger = std::make_shared<FileLogger>(FileLogger::batchLogPath(m_config.logDir, ""));
    m_logger.add(m_fileLogger);

    if (extraLogger) {
        m_logger.add(std::move(extraLogger));
    }

    if (m_config.storeBackend == StoreBackend::Sqlite) {
        auto database = std::make_unique<Database>(m_logger);
        if (!database->open(m_config.databasePath)) {
            LOG_ERROR(m_logger, "Failed to open metadata database " << m_config.databasePath.string());
            return false;
        }
        m_channel = std::move(database);
    } else {
        m_channel = std::make_unique<ShadowFileChannel>(m_config.storeDir);
    }
    LOG_INFO(m_logger, "Metadata store: " << m_channel->describe());

    m_merger = std::make_unique<MetadataAuditMerger>(*m_channel, m_logger, m_config.tempDir);
    m_resolver = std::make_unique<BackupSetResolver>(m_logger);
    m_pipeline = std::make_unique<VersionDiffPipeline>(*m_merger, m_logger);
    m_documents = std::make_unique<MasterDocumentIndex>(m_logger);
    return true;
}

void App::shutdown() {
    m_documents.reset();
    m_pipeline.reset();
    m_resolver.reset();
    m_merger.reset();
    m_channel.reset();
}

const std::filesystem::path& App::currentLogFile() const {
    static const std::filesystem::path empty;
    return m_fileLogger ? m_fileLogger->logFile() : empty;
}

void App::selectBatch(const std::string& baseName) {
    if (m_fileLogger) {
        m_fileLogger->setLogFile(FileLogger::batchLogPath(m_config.logDir, baseName));
    }
}

void App::selectBatchFor(const std::filesystem::path& file) {
    selectBatch(NameNormalizer::baseName(file.filename().string()));
}

std::string App::usage(const std::string& program) {
    std::ostringstream oss;
    oss << "Usage:\n"
        << "  " << program << " [options] versions <backup-dir> <file>\n"
        << "  " << program << " [options] tag <file> <text...>\n"
        << "  " << program << " [options] show-tag <file>\n"
        << "  " << program << " [options] history <file>\n"
        << "  " << program << " [options] docs <production-dir> <backup-dir>\n"
        << "  " << program << " [options] preview <file>\n"
        << "  " << program << " [options] diff <older> <newer>\n"
        << "\nOptions:\n"
        << "  -s, --store <files|sqlite>  Metadata backend (default: files)\n"
        << "  -d, --store-dir <dir>       Shadow file store directory\n"
        << "      --db <file>             SQLite metadata database\n"
        << "  -l, --log-dir <dir>         Batch log directory\n"
        << "  -v, --verbose               Show INFO messages on stderr\n"
        << "  -h, --help                  Show this help message\n";
    return oss.str();
}

void App::requireArgs(const std::string& command, const std::vector<std::string>& args,
                      size_t minCount, size_t maxCount) {
    if (args.size() < minCount || args.size() > maxCount) {
        throw UsageError("Wrong number of arguments for '" + command + "'");
    }
}

int App::run(const std::string& command, const std::vector<std::string>& args) {
    if (!m_merger) {
        throw std::logic_error("App::run called before init()");
    }

    if (command == "versions") return cmdVersions(args);
    if (command == "tag") return cmdTag(args);
    if (command == "show-tag") return cmdShowTag(args);
    if (command == "history") return cmdHistory(args);
    if (command == "docs") return cmdDocs(args);
    if (command == "preview") return cmdPreview(args);
    if (command == "diff") return cmdDiff(args);

    throw UsageError("Unknown command '" + command + "'");
}

// === Versions ===

App::VersionView App::loadVersions(const std::filesystem::path& backupDir, const std::string& referenceFile) {
    VersionView view;
    view.baseName = NameNormalizer::baseName(std::filesystem::path(referenceFile).filename().string());
    selectBatch(view.baseName);

    BackupSet set = m_resolver->resolve(backupDir, view.baseName);
    LOG_INFO(m_logger, "Loaded versions for " << view.baseName << " (" << set.size() << " backups)");

    size_t synced = m_merger->syncAcrossSet(set);
    if (synced > 0) {
        LOG_INFO(m_logger, "Synced " << synced << " audit entries across " << view.baseName);
    }

    view.rows = m_pipeline->summarize(set);
    return view;
}

void App::printVersionTable(const VersionView& view) {
    m_out << std::left
          << std::setw(24) << "Date/Time"
          << std::setw(20) << "Base"
          << std::setw(9) << "Version"
          << std::setw(14) << "Changes"
          << std::setw(13) << "Total Lines"
          << "Meta Tag" << "\n";

    for (const auto& row : view.rows) {
        m_out << std::left
              << std::setw(24) << row.dateLabel
              << std::setw(20) << row.baseName
              << std::setw(9) << row.versionLabel()
              << std::setw(14) << row.change.toString()
              << std::setw(13) << row.totalLinesLabel()
              << row.metaTag << "\n";
    }
}

int App::cmdVersions(const std::vector<std::string>& args) {
    requireArgs("versions", args, 2, 2);

    VersionView view = loadVersions(args[0], args[1]);
    if (view.rows.empty()) {
        m_out << "No backups found for '" << view.baseName << "' in " << args[0] << "\n";
        return kExitOk;
    }
    printVersionTable(view);
    return kExitOk;
}

// === Metadata ===

int App::cmdTag(const std::vector<std::string>& args) {
    if (args.size() < 2) {
        throw UsageError("Wrong number of arguments for 'tag'");
    }

    const std::filesystem::path file = args[0];
    std::string text;
    for (size_t i = 1; i < args.size(); ++i) {
        if (i > 1) text += ' ';
        text += args[i];
    }

    selectBatchFor(file);
    if (!m_merger->writeSource(file, text)) {
        return kExitFailure;
    }
    m_out << "Tagged " << file.filename().string() << ": " << MetadataAuditMerger::trim(text) << "\n";
    return kExitOk;
}

int App::cmdShowTag(const std::vector<std::string>& args) {
    requireArgs("show-tag", args, 1, 1);
    selectBatchFor(args[0]);
    m_out << m_merger->readSource(args[0]) << "\n";
    return kExitOk;
}

int App::cmdHistory(const std::vector<std::string>& args) {
    requireArgs("history", args, 1, 1);
    selectBatchFor(args[0]);

    auto entries = m_merger->readAuditNewestFirst(args[0]);
    if (entries.empty()) {
        m_out << "No metadata history available.\n";
        return kExitOk;
    }
    for (const auto& entry : entries) {
        m_out << entry << "\n";
    }
    LOG_INFO(m_logger, "Viewed metadata history for " << args[0]);
    return kExitOk;
}

// === Documents ===

int App::cmdDocs(const std::vector<std::string>& args) {
    requireArgs("docs", args, 2, 2);
    selectBatch("");

    auto documents = m_documents->list(args[0], args[1]);
    if (documents.empty()) {
        m_out << "No documents found in " << args[0] << "\n";
        return kExitOk;
    }

    m_out << std::left
          << std::setw(40) << "Document"
          << std::setw(22) << "Last Modified"
          << "Backups" << "\n";
    for (const auto& doc : documents) {
        m_out << std::left
              << std::setw(40) << doc.filename
              << std::setw(22) << doc.modifiedLabel()
              << doc.backupCount << "\n";
    }
    return kExitOk;
}

// === Content ===

int App::cmdPreview(const std::vector<std::string>& args) {
    requireArgs("preview", args, 1, 1);
    selectBatchFor(args[0]);

    std::string content = VersionDiffPipeline::preview(args[0]);
    m_out << content;
    if (!content.empty() && content.back() != '\n') {
        m_out << "\n";
    }
    LOG_INFO(m_logger, "Previewed " << args[0]);
    return kExitOk;
}

int App::cmdDiff(const std::vector<std::string>& args) {
    requireArgs("diff", args, 2, 2);
    selectBatchFor(args[1]);

    const auto older = TextReader::readLines(args[0]);
    const auto newer = TextReader::readLines(args[1]);

    std::string diff = LineDiff::unifiedDiff(older, newer, args[0], args[1]);
    if (diff.empty()) {
        m_out << "No differences.\n";
    } else {
        m_out << diff;
    }
    m_out << "Changes: " << VersionDiffPipeline::describeChange(older, newer).toString() << "\n";
    LOG_INFO(m_logger, "Compared " << args[0] << " with " << args[1]);
    return kExitOk;
}

} // namespace BackupLens
