/**
 * @file line_diff.hpp
 * @brief Line-based Myers diff with unified-diff output.
 */

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace BackupLens {

/**
 * @brief One hunk of a unified diff.
 *
 * `oldStart`/`newStart` are 0-based indices of the first line covered.
 */
struct DiffHunk {
    size_t oldStart = 0;
    size_t oldCount = 0;
    size_t newStart = 0;
    size_t newCount = 0;
    std::vector<std::pair<char, std::string>> lines; ///< ' ', '+' or '-' with line content
};

/**
 * @brief Shortest-edit-script diff over sequences of lines.
 *
 * Uses the linear-space variant of the Myers O((N+M)D) algorithm: each
 * range is split at the middle snake of its shortest edit path and the
 * halves are diffed recursively. Common prefixes and suffixes are
 * trimmed first, so mostly-identical backups are cheap to compare.
 * Within a run of changes, deletions are listed before insertions.
 *
 * @par Counting changed lines:
 * The number of `+` and `-` body lines of the unified diff equals the
 * edit distance, which changedLineCount() computes without building the
 * script (O(N+M) memory).
 */
class LineDiff {
public:
    using Lines = std::vector<std::string>;

    enum class Op {
        Equal,
        Insert,
        Delete
    };

    /**
     * @brief One step of the edit script.
     *
     * For Insert, `newIndex` is the inserted line and `oldIndex` the
     * position in the old sequence. For Delete, `oldIndex` is the removed
     * line and `newIndex` the position in the new sequence.
     */
    struct Edit {
        Op op;
        size_t oldIndex;
        size_t newIndex;
    };

    /**
     * @brief Compute a minimal edit script turning `oldLines` into `newLines`.
     */
    static std::vector<Edit> editScript(const Lines& oldLines, const Lines& newLines);

    /**
     * @brief Group an edit script into unified-diff hunks.
     * @param context Unchanged lines kept around each change (3 like `diff -u`)
     */
    static std::vector<DiffHunk> hunks(const Lines& oldLines, const Lines& newLines, size_t context = 3);

    /**
     * @brief Render a unified diff with `---`/`+++` headers and `@@` markers.
     * @return Empty string when both sequences are equal
     */
    static std::string unifiedDiff(const Lines& oldLines, const Lines& newLines,
                                   const std::string& oldLabel, const std::string& newLabel,
                                   size_t context = 3);

    /**
     * @brief Number of added plus removed lines in a minimal diff.
     */
    static size_t changedLineCount(const Lines& oldLines, const Lines& newLines);

    /**
     * @brief Count `+`/`-` body lines in already-built hunks.
     */
    static size_t changedLineCount(const std::vector<DiffHunk>& hunks);

private:
    static void diffRange(const Lines& a, const Lines& b, size_t aBegin, size_t aEnd,
                          size_t bBegin, size_t bEnd, std::vector<Edit>& out);

    /// Point where a shortest edit path of the two ranges crosses its middle,
    /// or std::nullopt if the ranges share no lines.
    static std::optional<std::pair<size_t, size_t>> middleSnake(const Lines& a, const Lines& b,
                                                               size_t aBegin, size_t aEnd,
                                                               size_t bBegin, size_t bEnd);
};

} // namespace BackupLens
