#include "shadow_file_channel.hpp"
#include "errors.hpp"
#include <cerrno>
#include <cstring>
#include <fstream>
#include <functional>
#include <iterator>
#include <sstream>

namespace BackupLens {

namespace {

constexpr const char* kHeaderTag = "BLSTREAM1 ";
constexpr const char* kSourceExt = ".source";
constexpr const char* kAuditExt = ".meta_audit";

std::string headerFor(const std::string& key) {
    return std::string(kHeaderTag) + key + "\n";
}

std::vector<std::string> splitBody(const std::string& body) {
    std::vector<std::string> lines;
    std::istringstream iss(body);
    std::string line;
    while (std::getline(iss, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(std::move(line));
    }
    return lines;
}

std::string readPlainFile(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw ChannelError("Cannot open " + path.string() + ": " + std::strerror(errno));
    }
    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        throw ChannelError("Read failed for " + path.string());
    }
    return content;
}

} // anonymous namespace

ShadowFileChannel::ShadowFileChannel(std::filesystem::path storeDir)
    : m_storeDir(std::move(storeDir)) {
    std::error_code ec;
    std::filesystem::create_directories(m_storeDir, ec);
}

std::string ShadowFileChannel::describe() const {
    return "shadow files in " + m_storeDir.string();
}

std::string ShadowFileChannel::hashKey(const std::string& key) const {
    std::hash<std::string> hasher;
    size_t hash = hasher(key);

    std::ostringstream oss;
    oss << std::hex << hash;
    return oss.str();
}

std::filesystem::path ShadowFileChannel::shadowPath(const std::string& key, const std::string& extension) const {
    return m_storeDir / (hashKey(key) + extension);
}

std::optional<std::string> ShadowFileChannel::readBody(const std::filesystem::path& shadow,
                                                       const std::string& key) const {
    std::error_code ec;
    if (!std::filesystem::exists(shadow, ec)) {
        if (ec) {
            throw ChannelError("Cannot stat " + shadow.string() + ": " + ec.message());
        }
        return std::nullopt;
    }

    std::string content = readPlainFile(shadow);
    const std::string header = headerFor(key);
    if (content.compare(0, header.size(), header) != 0) {
        throw ChannelError("Shadow file " + shadow.string() + " does not belong to " + key);
    }
    return content.substr(header.size());
}

void ShadowFileChannel::appendBody(const std::filesystem::path& shadow, const std::string& key,
                                   const std::string& bytes) const {
    std::error_code ec;
    std::filesystem::create_directories(m_storeDir, ec);

    bool isNew = !std::filesystem::exists(shadow, ec);
    if (!isNew) {
        // Validates the header; throws on a foreign file
        readBody(shadow, key);
    }

    std::ofstream out(shadow, std::ios::binary | std::ios::app);
    if (!out) {
        throw ChannelError("Cannot open " + shadow.string() + " for append: " + std::strerror(errno));
    }
    if (isNew) {
        out << headerFor(key);
    }
    out << bytes;
    out.flush();
    if (!out) {
        throw ChannelError("Write failed for " + shadow.string());
    }
}

std::optional<std::string> ShadowFileChannel::readSource(const std::filesystem::path& file) {
    const std::string key = sourceKey(file);
    return readBody(shadowPath(key, kSourceExt), key);
}

void ShadowFileChannel::overwriteSource(const std::filesystem::path& file, const std::string& text) {
    const std::string key = sourceKey(file);
    if (key.find('\n') != std::string::npos) {
        throw ChannelError("Channel key contains a newline: " + file.string());
    }

    std::error_code ec;
    std::filesystem::create_directories(m_storeDir, ec);

    // Write beside the target and rename so readers never see a half-written tag
    const auto shadow = shadowPath(key, kSourceExt);
    auto staging = shadow;
    staging += ".tmp";

    {
        std::ofstream out(staging, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw ChannelError("Cannot open " + staging.string() + ": " + std::strerror(errno));
        }
        out << headerFor(key) << text;
        out.flush();
        if (!out) {
            throw ChannelError("Write failed for " + staging.string());
        }
    }

    std::filesystem::rename(staging, shadow, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(staging, ignored);
        throw ChannelError("Cannot replace " + shadow.string() + ": " + ec.message());
    }
}

std::vector<std::string> ShadowFileChannel::readAudit(const std::filesystem::path& file) {
    const std::string key = auditKey(file);
    auto body = readBody(shadowPath(key, kAuditExt), key);
    if (!body) {
        return {};
    }
    return splitBody(*body);
}

void ShadowFileChannel::appendAudit(const std::filesystem::path& file, const std::vector<std::string>& lines) {
    if (lines.empty()) {
        return;
    }

    const std::string key = auditKey(file);
    if (key.find('\n') != std::string::npos) {
        throw ChannelError("Channel key contains a newline: " + file.string());
    }

    std::string bytes;
    for (const auto& line : lines) {
        bytes += line;
        bytes += '\n';
    }
    appendBody(shadowPath(key, kAuditExt), key, bytes);
}

void ShadowFileChannel::exportAudit(const std::filesystem::path& file, const std::filesystem::path& target) {
    const std::string key = auditKey(file);
    auto body = readBody(shadowPath(key, kAuditExt), key);

    std::ofstream out(target, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw ChannelError("Cannot open " + target.string() + ": " + std::strerror(errno));
    }
    if (body) {
        out << *body;
    }
    out.flush();
    if (!out) {
        throw ChannelError("Write failed for " + target.string());
    }
}

void ShadowFileChannel::importAudit(const std::filesystem::path& file, const std::filesystem::path& source) {
    const std::string key = auditKey(file);
    if (key.find('\n') != std::string::npos) {
        throw ChannelError("Channel key contains a newline: " + file.string());
    }

    std::string bytes = readPlainFile(source);
    if (bytes.empty()) {
        return;
    }
    if (bytes.back() != '\n') {
        bytes += '\n';
    }
    appendBody(shadowPath(key, kAuditExt), key, bytes);
}

} // namespace BackupLens
