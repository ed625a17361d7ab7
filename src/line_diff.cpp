#include "line_diff.hpp"
#include <algorithm>
#include <sstream>

namespace BackupLens {

namespace {

/// Window of the two sequences left after trimming the common prefix and suffix.
struct Window {
    size_t prefix = 0;
    size_t oldEnd = 0;
    size_t newEnd = 0;
};

Window trimCommon(const LineDiff::Lines& a, const LineDiff::Lines& b) {
    Window w;
    while (w.prefix < a.size() && w.prefix < b.size() && a[w.prefix] == b[w.prefix]) {
        ++w.prefix;
    }

    w.oldEnd = a.size();
    w.newEnd = b.size();
    while (w.oldEnd > w.prefix && w.newEnd > w.prefix && a[w.oldEnd - 1] == b[w.newEnd - 1]) {
        --w.oldEnd;
        --w.newEnd;
    }
    return w;
}

std::string formatRange(size_t start, size_t count) {
    // Same convention as `diff -u`: an empty range names the line before it
    if (count == 0) return std::to_string(start) + ",0";
    if (count == 1) return std::to_string(start + 1);
    return std::to_string(start + 1) + "," + std::to_string(count);
}

void appendBody(std::ostringstream& out, char prefix, const std::string& line) {
    out << prefix;
    if (!line.empty() && line.back() == '\n') {
        out << line;
    } else {
        out << line << "\n\\ No newline at end of file\n";
    }
}

} // anonymous namespace

std::vector<LineDiff::Edit> LineDiff::editScript(const Lines& oldLines, const Lines& newLines) {
    std::vector<Edit> edits;
    edits.reserve(std::max(oldLines.size(), newLines.size()));
    diffRange(oldLines, newLines, 0, oldLines.size(), 0, newLines.size(), edits);

    // Within each run of changes, list the deletions before the insertions
    size_t i = 0;
    while (i < edits.size()) {
        if (edits[i].op == Op::Equal) {
            ++i;
            continue;
        }
        size_t runEnd = i;
        size_t deletes = 0;
        while (runEnd < edits.size() && edits[runEnd].op != Op::Equal) {
            if (edits[runEnd].op == Op::Delete) ++deletes;
            ++runEnd;
        }

        const size_t oldPos = edits[i].oldIndex;
        const size_t newPos = edits[i].newIndex;
        for (size_t j = i; j < runEnd; ++j) {
            size_t step = j - i;
            if (step < deletes) {
                edits[j] = {Op::Delete, oldPos + step, newPos};
            } else {
                edits[j] = {Op::Insert, oldPos + deletes, newPos + (step - deletes)};
            }
        }
        i = runEnd;
    }

    return edits;
}

void LineDiff::diffRange(const Lines& a, const Lines& b, size_t aBegin, size_t aEnd,
                         size_t bBegin, size_t bEnd, std::vector<Edit>& out) {
    while (aBegin < aEnd && bBegin < bEnd && a[aBegin] == b[bBegin]) {
        out.push_back({Op::Equal, aBegin++, bBegin++});
    }

    size_t suffix = 0;
    while (aEnd - suffix > aBegin && bEnd - suffix > bBegin && a[aEnd - 1 - suffix] == b[bEnd - 1 - suffix]) {
        ++suffix;
    }
    const size_t aStop = aEnd - suffix;
    const size_t bStop = bEnd - suffix;

    if (aBegin == aStop) {
        for (size_t j = bBegin; j < bStop; ++j) {
            out.push_back({Op::Insert, aBegin, j});
        }
    } else if (bBegin == bStop) {
        for (size_t i = aBegin; i < aStop; ++i) {
            out.push_back({Op::Delete, i, bBegin});
        }
    } else if (auto split = middleSnake(a, b, aBegin, aStop, bBegin, bStop)) {
        diffRange(a, b, aBegin, split->first, bBegin, split->second, out);
        diffRange(a, b, split->first, aStop, split->second, bStop, out);
    } else {
        for (size_t i = aBegin; i < aStop; ++i) {
            out.push_back({Op::Delete, i, bBegin});
        }
        for (size_t j = bBegin; j < bStop; ++j) {
            out.push_back({Op::Insert, aStop, j});
        }
    }

    for (size_t k = 0; k < suffix; ++k) {
        out.push_back({Op::Equal, aStop + k, bStop + k});
    }
}

std::optional<std::pair<size_t, size_t>> LineDiff::middleSnake(const Lines& a, const Lines& b,
                                                              size_t aBegin, size_t aEnd,
                                                              size_t bBegin, size_t bEnd) {
    const int n = static_cast<int>(aEnd - aBegin);
    const int m = static_cast<int>(bEnd - bBegin);
    const int maxD = (n + m + 1) / 2;
    const int offset = maxD;
    const int length = 2 * maxD + 2;

    auto A = [&](int x) -> const std::string& { return a[aBegin + x]; };
    auto B = [&](int y) -> const std::string& { return b[bBegin + y]; };
    auto splitAt = [&](int x, int y) {
        return std::make_pair(aBegin + static_cast<size_t>(x), bBegin + static_cast<size_t>(y));
    };

    // Furthest-reaching x per diagonal, forward from the start and backward
    // from the end; -1 means not reached yet. Pruned diagonals may hold
    // values past the edge, so overlaps are only taken inside the ranges.
    std::vector<int> forward(length, -1);
    std::vector<int> reverse(length, -1);
    forward[offset + 1] = 0;
    reverse[offset + 1] = 0;

    const int delta = n - m;
    const bool oddDelta = (delta % 2) != 0;
    int fStart = 0, fEnd = 0, rStart = 0, rEnd = 0;

    for (int d = 0; d < maxD; ++d) {
        for (int k = -d + fStart; k <= d - fEnd; k += 2) {
            const int idx = offset + k;
            int x = (k == -d || (k != d && forward[idx - 1] < forward[idx + 1])) ? forward[idx + 1]
                                                                             : forward[idx - 1] + 1;
            int y = x - k;
            while (x < n && y < m && A(x) == B(y)) {
                ++x;
                ++y;
            }
            forward[idx] = x;

            if (x > n) {
                fEnd += 2;
            } else if (y > m) {
                fStart += 2;
            } else if (oddDelta) {
                const int rIdx = offset + delta - k;
                if (rIdx >= 0 && rIdx < length && reverse[rIdx] != -1) {
                    const int rx = reverse[rIdx];
                    const int ry = rx - (rIdx - offset);
                    if (rx <= n && ry >= 0 && ry <= m && x >= n - rx) {
                        return splitAt(x, y);
                    }
                }
            }
        }

        for (int k = -d + rStart; k <= d - rEnd; k += 2) {
            const int idx = offset + k;
            int x = (k == -d || (k != d && reverse[idx - 1] < reverse[idx + 1])) ? reverse[idx + 1]
                                                                             : reverse[idx - 1] + 1;
            int y = x - k;
            while (x < n && y < m && A(n - x - 1) == B(m - y - 1)) {
                ++x;
                ++y;
            }
            reverse[idx] = x;

            if (x > n) {
                rEnd += 2;
            } else if (y > m) {
                rStart += 2;
            } else if (!oddDelta) {
                const int fIdx = offset + delta - k;
                if (fIdx >= 0 && fIdx < length && forward[fIdx] != -1) {
                    const int fx = forward[fIdx];
                    const int fy = fx - (fIdx - offset);
                    if (fx <= n && fy >= 0 && fy <= m && fx >= n - x) {
                        return splitAt(fx, fy);
                    }
                }
            }
        }
    }

    return std::nullopt;
}

std::vector<DiffHunk> LineDiff::hunks(const Lines& oldLines, const Lines& newLines, size_t context) {
    const auto edits = editScript(oldLines, newLines);

    // Spans of edit indices [begin, end) that contain changes, widened by context and merged
    std::vector<std::pair<size_t, size_t>> spans;
    for (size_t i = 0; i < edits.size(); ++i) {
        if (edits[i].op == Op::Equal) continue;

        size_t begin = i >= context ? i - context : 0;
        size_t end = std::min(edits.size(), i + 1 + context);

        if (!spans.empty() && begin <= spans.back().second) {
            spans.back().second = std::max(spans.back().second, end);
        } else {
            spans.emplace_back(begin, end);
        }
    }

    std::vector<DiffHunk> result;
    result.reserve(spans.size());

    for (const auto& [begin, end] : spans) {
        DiffHunk hunk;
        hunk.oldStart = edits[begin].oldIndex;
        hunk.newStart = edits[begin].newIndex;

        for (size_t i = begin; i < end; ++i) {
            const Edit& e = edits[i];
            switch (e.op) {
                case Op::Equal:
                    hunk.lines.emplace_back(' ', oldLines[e.oldIndex]);
                    ++hunk.oldCount;
                    ++hunk.newCount;
                    break;
                case Op::Delete:
                    hunk.lines.emplace_back('-', oldLines[e.oldIndex]);
                    ++hunk.oldCount;
                    break;
                case Op::Insert:
                    hunk.lines.emplace_back('+', newLines[e.newIndex]);
                    ++hunk.newCount;
                    break;
            }
        }
        result.push_back(std::move(hunk));
    }

    return result;
}

std::string LineDiff::unifiedDiff(const Lines& oldLines, const Lines& newLines,
                                  const std::string& oldLabel, const std::string& newLabel,
                                  size_t context) {
    auto diffHunks = hunks(oldLines, newLines, context);
    if (diffHunks.empty()) return "";

    std::ostringstream out;
    out << "--- " << oldLabel << "\n";
    out << "+++ " << newLabel << "\n";

    for (const auto& hunk : diffHunks) {
        out << "@@ -" << formatRange(hunk.oldStart, hunk.oldCount)
            << " +" << formatRange(hunk.newStart, hunk.newCount) << " @@\n";
        for (const auto& [prefix, line] : hunk.lines) {
            appendBody(out, prefix, line);
        }
    }

    return out.str();
}

size_t LineDiff::changedLineCount(const Lines& oldLines, const Lines& newLines) {
    const Window w = trimCommon(oldLines, newLines);
    const int n = static_cast<int>(w.oldEnd - w.prefix);
    const int m = static_cast<int>(w.newEnd - w.prefix);
    const int max = n + m;

    if (n == 0 || m == 0) {
        return static_cast<size_t>(max);
    }

    std::vector<int> v(2 * static_cast<size_t>(max) + 2, 0);
    for (int d = 0; d <= max; ++d) {
        for (int k = -d; k <= d; k += 2) {
            int x;
            if (k == -d || (k != d && v[k - 1 + max] < v[k + 1 + max])) {
                x = v[k + 1 + max];
            } else {
                x = v[k - 1 + max] + 1;
            }
            int y = x - k;

            while (x < n && y < m && oldLines[w.prefix + x] == newLines[w.prefix + y]) {
                ++x;
                ++y;
            }
            v[k + max] = x;

            if (x >= n && y >= m) {
                return static_cast<size_t>(d);
            }
        }
    }
    return static_cast<size_t>(max);
}

size_t LineDiff::changedLineCount(const std::vector<DiffHunk>& diffHunks) {
    size_t count = 0;
    for (const auto& hunk : diffHunks) {
        for (const auto& [prefix, line] : hunk.lines) {
            if (prefix == '+' || prefix == '-') ++count;
        }
    }
    return count;
}

} // namespace BackupLens
