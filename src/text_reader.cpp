#include "text_reader.hpp"
#include "errors.hpp"
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <fstream>
#include <iterator>

namespace BackupLens {

namespace {

constexpr std::string_view kUtf8Bom = "\xEF\xBB\xBF";

} // anonymous namespace

bool TextReader::isValidUtf8(std::string_view text) {
    size_t i = 0;
    const size_t n = text.size();

    while (i < n) {
        auto c = static_cast<unsigned char>(text[i]);
        if (c < 0x80) {
            ++i;
            continue;
        }

        size_t len;
        uint32_t cp;
        if ((c & 0xE0) == 0xC0) {
            len = 2;
            cp = c & 0x1F;
        } else if ((c & 0xF0) == 0xE0) {
            len = 3;
            cp = c & 0x0F;
        } else if ((c & 0xF8) == 0xF0) {
            len = 4;
            cp = c & 0x07;
        } else {
            return false;
        }

        if (i + len > n) return false;

        for (size_t k = 1; k < len; ++k) {
            auto cc = static_cast<unsigned char>(text[i + k]);
            if ((cc & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (cc & 0x3F);
        }

        // Overlong encodings, surrogates and out-of-range code points
        if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000)) return false;
        if (cp >= 0xD800 && cp <= 0xDFFF) return false;
        if (cp > 0x10FFFF) return false;

        i += len;
    }
    return true;
}

std::string TextReader::readAll(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw FileAccessError(path, std::strerror(errno));
    }

    std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad()) {
        throw FileAccessError(path, "read failed");
    }

    if (content.compare(0, kUtf8Bom.size(), kUtf8Bom) == 0) {
        content.erase(0, kUtf8Bom.size());
    }

    if (!isValidUtf8(content)) {
        throw FileAccessError(path, "not valid UTF-8");
    }

    return content;
}

std::vector<std::string> TextReader::splitLines(std::string_view text) {
    std::vector<std::string> lines;
    std::string current;

    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (c == '\r' || c == '\n') {
            if (c == '\r' && i + 1 < text.size() && text[i + 1] == '\n') {
                ++i;
            }
            current.push_back('\n');
            lines.push_back(std::move(current));
            current.clear();
        } else {
            current.push_back(c);
        }
    }

    if (!current.empty()) {
        lines.push_back(std::move(current));
    }
    return lines;
}

std::vector<std::string> TextReader::readLines(const std::filesystem::path& path) {
    return splitLines(readAll(path));
}

size_t TextReader::countLines(const std::filesystem::path& path) {
    return readLines(path).size();
}

} // namespace BackupLens
