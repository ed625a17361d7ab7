#include "config.hpp"
#include <cstdlib>

namespace BackupLens {

namespace {

std::optional<std::filesystem::path> envPath(const char* name) {
    const char* value = std::getenv(name);
    if (value && *value) {
        return std::filesystem::path(value);
    }
    return std::nullopt;
}

} // anonymous namespace

AppConfig AppConfig::fromRoots(const std::filesystem::path& dataDir, const std::filesystem::path& cacheDir) {
    AppConfig config;
    config.dataDir = dataDir;
    config.cacheDir = cacheDir;
    config.storeDir = dataDir / "streams";
    config.databasePath = dataDir / "metadata.db";
    config.logDir = dataDir / "logs";
    config.tempDir = cacheDir / "tmp";
    return config;
}

AppConfig AppConfig::fromEnvironment() {
    if (auto root = envPath("BACKUPLENS_HOME")) {
        return fromRoots(*root, *root / "cache");
    }

    auto home = envPath("HOME");
    if (!home) {
        return fromRoots("/tmp/BackupLens", "/tmp/BackupLens/cache");
    }

    std::filesystem::path dataDir;
    if (auto xdgData = envPath("XDG_DATA_HOME")) {
        dataDir = *xdgData / "BackupLens";
    } else {
        dataDir = *home / ".local" / "share" / "BackupLens";
    }
    return fromRoots(dataDir, *home / ".cache" / "BackupLens");
}

std::optional<StoreBackend> AppConfig::parseBackend(const std::string& name) {
    if (name == "files") return StoreBackend::Files;
    if (name == "sqlite") return StoreBackend::Sqlite;
    return std::nullopt;
}

const char* AppConfig::backendName(StoreBackend backend) {
    switch (backend) {
        case StoreBackend::Files:  return "files";
        case StoreBackend::Sqlite: return "sqlite";
    }
    return "files";
}

bool AppConfig::ensureDirectories() const {
    bool ok = true;
    for (const auto* dir : {&dataDir, &logDir, &tempDir}) {
        std::error_code ec;
        std::filesystem::create_directories(*dir, ec);
        if (ec) {
            ok = false;
        }
    }
    return ok;
}

} // namespace BackupLens
