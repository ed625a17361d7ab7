/**
 * @file text_reader.hpp
 * @brief Encoding-normalized text file reading.
 */

#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace BackupLens {

/**
 * @brief Reads backup files as UTF-8 text.
 *
 * All reads share one normalization:
 * - a leading UTF-8 byte-order mark is skipped
 * - the content must be valid UTF-8, otherwise the read fails
 * - `\r\n` and lone `\r` are treated as line separators, like `\n`
 *
 * Lines returned by readLines() keep a normalized `"\n"` terminator when
 * the line had one, so "abc" at end of file and "abc\n" compare unequal.
 *
 * All functions that touch the disk throw FileAccessError on failure.
 */
class TextReader {
public:
    /**
     * @brief Read the whole file with the BOM removed.
     * @param path File to read
     * @return Decoded file content
     */
    static std::string readAll(const std::filesystem::path& path);

    /**
     * @brief Read the file and split it into line records.
     * @param path File to read
     * @return Lines with normalized terminators
     */
    static std::vector<std::string> readLines(const std::filesystem::path& path);

    /**
     * @brief Count line records in a file.
     *
     * A final line without terminator still counts; an empty file has 0 lines.
     */
    static size_t countLines(const std::filesystem::path& path);

    /**
     * @brief Split text into line records (see readLines()).
     */
    static std::vector<std::string> splitLines(std::string_view text);

    /**
     * @brief Validate UTF-8 encoding (rejects overlongs and surrogates).
     */
    static bool isValidUtf8(std::string_view text);
};

} // namespace BackupLens
