#include "name_normalizer.hpp"
#include <ctime>
#include <regex>

namespace BackupLens {

namespace {

const std::regex& backupPattern() {
    static const std::regex pattern(R"(^(.*)\.(\d{4})-(\d{2})-(\d{2})_(\d{2})(\d{2})(\d{2})\.bak$)");
    return pattern;
}

} // anonymous namespace

bool NameNormalizer::isTimestampedBackup(const std::string& filename) {
    return std::regex_match(filename, backupPattern());
}

std::string NameNormalizer::baseName(const std::string& filename) {
    std::smatch match;
    if (std::regex_match(filename, match, backupPattern())) {
        return match[1].str();
    }

    return filename.substr(0, filename.find('.'));
}

std::optional<std::chrono::system_clock::time_point> NameNormalizer::backupStamp(const std::string& filename) {
    std::smatch match;
    if (!std::regex_match(filename, match, backupPattern())) {
        return std::nullopt;
    }

    std::tm tm{};
    tm.tm_year = std::stoi(match[2].str()) - 1900;
    tm.tm_mon = std::stoi(match[3].str()) - 1;
    tm.tm_mday = std::stoi(match[4].str());
    tm.tm_hour = std::stoi(match[5].str());
    tm.tm_min = std::stoi(match[6].str());
    tm.tm_sec = std::stoi(match[7].str());
    tm.tm_isdst = -1;

    if (tm.tm_mon > 11 || tm.tm_mday < 1 || tm.tm_mday > 31 ||
        tm.tm_hour > 23 || tm.tm_min > 59 || tm.tm_sec > 60) {
        return std::nullopt;
    }

    std::time_t tt = std::mktime(&tm);
    if (tt == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }
    return std::chrono::system_clock::from_time_t(tt);
}

} // namespace BackupLens
