#include "time_util.hpp"
#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace BackupLens {

std::string formatLocalTime(std::chrono::system_clock::time_point time, const char* format) {
    std::time_t tt = std::chrono::system_clock::to_time_t(time);
    std::tm* tm = std::localtime(&tt);
    if (!tm) {
        return {};
    }

    std::ostringstream oss;
    oss << std::put_time(tm, format);
    return oss.str();
}

std::chrono::system_clock::time_point toSystemTime(std::filesystem::file_time_type time) {
    return std::chrono::time_point_cast<std::chrono::system_clock::duration>(
        time - std::filesystem::file_time_type::clock::now() + std::chrono::system_clock::now());
}

std::string toLowerAscii(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

} // namespace BackupLens
