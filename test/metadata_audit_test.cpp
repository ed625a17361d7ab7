// metadata_audit_test.cpp - Tag editing, audit dedup, set sync and failure fallbacks

#include "test_helper.h"
#include "test_fixtures.h"
#include "../src/database.hpp"
#include "../src/errors.hpp"
#include "../src/metadata_audit.hpp"
#include "../src/shadow_file_channel.hpp"

#include <algorithm>
#include <ctime>
#include <set>

using namespace BackupLens;

//=============================================================================
// Helper functions
//=============================================================================

static std::chrono::system_clock::time_point local_time(int year, int month, int day, int hour, int min, int sec) {
    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = min;
    tm.tm_sec = sec;
    tm.tm_isdst = -1;
    return std::chrono::system_clock::from_time_t(std::mktime(&tm));
}

// Wraps a real channel and fails a configurable number of calls
class FlakyChannel : public MetadataChannel {
public:
    explicit FlakyChannel(std::filesystem::path storeDir) : inner(std::move(storeDir)) {}

    std::optional<std::string> readSource(const std::filesystem::path& file) override {
        if (failSourceReads > 0) { --failSourceReads; throw ChannelError("source read refused"); }
        return inner.readSource(file);
    }
    void overwriteSource(const std::filesystem::path& file, const std::string& text) override {
        if (failSourceWrites) throw ChannelError("source write refused");
        inner.overwriteSource(file, text);
    }
    std::vector<std::string> readAudit(const std::filesystem::path& file) override {
        ++readCalls;
        if (failReads > 0) { --failReads; throw ChannelError("sharing violation"); }
        return inner.readAudit(file);
    }
    void appendAudit(const std::filesystem::path& file, const std::vector<std::string>& lines) override {
        ++appendCalls;
        if (failAppends > 0) { --failAppends; throw ChannelError("sharing violation"); }
        inner.appendAudit(file, lines);
    }
    void exportAudit(const std::filesystem::path& file, const std::filesystem::path& target) override {
        ++exportCalls;
        if (failExport) throw ChannelError("export refused");
        inner.exportAudit(file, target);
    }
    void importAudit(const std::filesystem::path& file, const std::filesystem::path& source) override {
        ++importCalls;
        if (failImport) throw ChannelError("import refused");
        inner.importAudit(file, source);
    }
    std::string describe() const override { return "flaky " + inner.describe(); }

    ShadowFileChannel inner;
    int failSourceReads = 0;
    bool failSourceWrites = false;
    int failReads = 0;
    int failAppends = 0;
    bool failExport = false;
    bool failImport = false;
    int readCalls = 0;
    int appendCalls = 0;
    int exportCalls = 0;
    int importCalls = 0;
};

static bool dir_is_empty(const std::filesystem::path& dir) {
    std::error_code ec;
    return !std::filesystem::exists(dir, ec) || std::filesystem::is_empty(dir, ec);
}

//=============================================================================
// Source channel
//=============================================================================

TEST(write_source_stores_trimmed_tag_and_one_audit_entry) {
    test::TempDir dir;
    auto file = dir / "report.txt.2024-01-02_100000.bak";
    test::write_lines(file, 3);

    ShadowFileChannel channel(dir / "store");
    MemoryLogger logger;
    MetadataAuditMerger merger(channel, logger, dir / "tmp");
    merger.setClock([] { return local_time(2024, 1, 2, 10, 0, 0); });

    auto before = merger.readAudit(file).size();
    ASSERT_TRUE(merger.writeSource(file, "  approved by legal \n"));

    ASSERT_EQ(merger.readSource(file), "approved by legal");
    auto audit = merger.readAudit(file);
    ASSERT_EQ(audit.size(), before + 1);
    ASSERT_EQ(audit.back(), "[2024-01-02 10:00:00] approved by legal");
}

TEST(rewriting_same_tag_records_each_edit) {
    test::TempDir dir;
    auto file = dir / "a.bak";
    test::write_lines(file, 1);

    ShadowFileChannel channel(dir / "store");
    MemoryLogger logger;
    MetadataAuditMerger merger(channel, logger, dir / "tmp");
    merger.setClock([] { return local_time(2024, 1, 2, 10, 0, 0); });

    ASSERT_TRUE(merger.writeSource(file, "draft"));
    auto before = merger.readAudit(file).size();
    ASSERT_TRUE(merger.writeSource(file, "draft"));

    auto audit = merger.readAudit(file);
    ASSERT_EQ(audit.size(), before + 1);
    ASSERT_EQ(audit[0], "[2024-01-02 10:00:00] draft");
    ASSERT_EQ(audit[1], "[2024-01-02 10:00:00] draft");
}

TEST(multi_line_tag_keeps_source_and_folds_audit) {
    test::TempDir dir;
    auto file = dir / "a.bak";
    test::write_lines(file, 1);

    ShadowFileChannel channel(dir / "store");
    MemoryLogger logger;
    MetadataAuditMerger merger(channel, logger, dir / "tmp");
    merger.setClock([] { return local_time(2024, 1, 2, 10, 0, 0); });

    ASSERT_TRUE(merger.writeSource(file, "sent to client\r\n  awaiting sign-off"));
    ASSERT_EQ(merger.readSource(file), "sent to client\r\n  awaiting sign-off");

    auto audit = merger.readAudit(file);
    ASSERT_EQ(audit.size(), 1u);
    ASSERT_EQ(audit[0], "[2024-01-02 10:00:00] sent to client awaiting sign-off");
}

TEST(tag_edit_falls_back_without_reading_history) {
    test::TempDir dir;
    auto file = dir / "a.bak";
    test::write_lines(file, 1);

    FlakyChannel channel(dir / "store");
    channel.failAppends = MetadataAuditMerger::kMaxAttempts;
    MemoryLogger logger;
    MetadataAuditMerger merger(channel, logger, dir / "tmp");
    merger.setClock([] { return local_time(2024, 1, 2, 10, 0, 0); });

    ASSERT_TRUE(merger.writeSource(file, "draft"));
    ASSERT_EQ(channel.readCalls, 0);
    ASSERT_EQ(channel.appendCalls, MetadataAuditMerger::kMaxAttempts);
    ASSERT_EQ(channel.importCalls, 1);

    auto audit = channel.inner.readAudit(file);
    ASSERT_EQ(audit.size(), 1u);
    ASSERT_EQ(audit[0], "[2024-01-02 10:00:00] draft");
    ASSERT_TRUE(dir_is_empty(dir / "tmp"));
}

TEST(read_source_without_tag_is_empty) {
    test::TempDir dir;
    auto file = dir / "a.bak";
    test::write_lines(file, 1);

    ShadowFileChannel channel(dir / "store");
    MemoryLogger logger;
    MetadataAuditMerger merger(channel, logger, dir / "tmp");
    ASSERT_EQ(merger.readSource(file), "");
    ASSERT_EQ(logger.count(Logger::Level::Error), 0u);
}

TEST(write_source_requires_existing_file) {
    test::TempDir dir;
    ShadowFileChannel channel(dir / "store");
    MemoryLogger logger;
    MetadataAuditMerger merger(channel, logger, dir / "tmp");

    ASSERT_FALSE(merger.writeSource(dir / "missing.bak", "tag"));
    ASSERT_FALSE(channel.readSource(dir / "missing.bak").has_value());
    ASSERT_TRUE(logger.contains("missing.bak"));
}

TEST(read_source_failure_degrades_to_empty) {
    test::TempDir dir;
    auto file = dir / "a.bak";
    test::write_lines(file, 1);

    FlakyChannel channel(dir / "store");
    channel.inner.overwriteSource(file, "tag");
    channel.failSourceReads = 1;

    MemoryLogger logger;
    MetadataAuditMerger merger(channel, logger, dir / "tmp");
    ASSERT_EQ(merger.readSource(file), "");
    ASSERT_EQ(logger.count(Logger::Level::Error), 1u);
    ASSERT_EQ(merger.readSource(file), "tag");
}

TEST(write_source_failure_returns_false) {
    test::TempDir dir;
    auto file = dir / "a.bak";
    test::write_lines(file, 1);

    FlakyChannel channel(dir / "store");
    channel.failSourceWrites = true;
    MemoryLogger logger;
    MetadataAuditMerger merger(channel, logger, dir / "tmp");

    ASSERT_FALSE(merger.writeSource(file, "tag"));
    ASSERT_EQ(channel.appendCalls, 0);
}

//=============================================================================
// Audit channel
//=============================================================================

TEST(append_is_idempotent) {
    test::TempDir dir;
    auto file = dir / "a.bak";
    test::write_lines(file, 1);

    ShadowFileChannel channel(dir / "store");
    MemoryLogger logger;
    MetadataAuditMerger merger(channel, logger, dir / "tmp");

    ASSERT_EQ(merger.appendAudit(file, {"[2024-01-01 09:00:00] x"}), 1u);
    ASSERT_EQ(merger.appendAudit(file, {"[2024-01-01 09:00:00] x"}), 0u);
    ASSERT_EQ(merger.readAudit(file).size(), 1u);
}

// Appends a two-line entry twice; the second append must change nothing
static void check_multi_line_append(MetadataChannel& channel, const test::TempDir& dir) {
    auto file = dir / "a.bak";
    test::write_lines(file, 1);

    MemoryLogger logger;
    MetadataAuditMerger merger(channel, logger, dir / "tmp");

    ASSERT_EQ(merger.appendAudit(file, {"[2024-01-01 09:00:00] a\nb"}), 1u);
    ASSERT_EQ(merger.appendAudit(file, {"[2024-01-01 09:00:00] a\nb"}), 0u);

    auto audit = merger.readAudit(file);
    ASSERT_EQ(audit.size(), 1u);
    ASSERT_EQ(audit[0], "[2024-01-01 09:00:00] a b");
}

TEST(multi_line_append_is_idempotent_on_shadow_files) {
    test::TempDir dir;
    ShadowFileChannel channel(dir / "store");
    check_multi_line_append(channel, dir);
}

TEST(multi_line_append_is_idempotent_on_sqlite) {
    test::TempDir dir;
    MemoryLogger dbLogger;
    Database db(dbLogger);
    ASSERT_TRUE(db.open(dir / "metadata.db"));
    check_multi_line_append(db, dir);
}

TEST(multi_line_entries_sync_as_one_entry) {
    test::TempDir dir;
    std::vector<std::filesystem::path> files = {dir / "a.bak", dir / "b.bak"};
    for (const auto& f : files) test::write_lines(f, 1);

    ShadowFileChannel channel(dir / "store");
    MemoryLogger logger;
    MetadataAuditMerger merger(channel, logger, dir / "tmp");
    merger.appendAudit(files[0], {"[2024-01-01 09:00:00] first\nsecond"});

    ASSERT_EQ(merger.syncAcrossSet(files), 1u);
    ASSERT_TRUE(merger.readAudit(files[1]) == merger.readAudit(files[0]));
    ASSERT_EQ(merger.readAudit(files[1]).size(), 1u);
}

TEST(append_dedupes_batch_and_skips_blanks) {
    test::TempDir dir;
    auto file = dir / "a.bak";
    test::write_lines(file, 1);

    ShadowFileChannel channel(dir / "store");
    MemoryLogger logger;
    MetadataAuditMerger merger(channel, logger, dir / "tmp");

    ASSERT_EQ(merger.appendAudit(file, {"a", "  a  ", "", "   ", "b"}), 2u);
    auto audit = merger.readAudit(file);
    ASSERT_EQ(audit.size(), 2u);
    ASSERT_EQ(audit[0], "a");
    ASSERT_EQ(audit[1], "b");
    ASSERT_EQ(merger.appendAudit(file, {}), 0u);
}

TEST(append_to_missing_file_is_skipped) {
    test::TempDir dir;
    ShadowFileChannel channel(dir / "store");
    MemoryLogger logger;
    MetadataAuditMerger merger(channel, logger, dir / "tmp");

    ASSERT_EQ(merger.appendAudit(dir / "gone.bak", {"x"}), 0u);
    ASSERT_TRUE(channel.readAudit(dir / "gone.bak").empty());
}

TEST(newest_first_is_reversed_history) {
    test::TempDir dir;
    auto file = dir / "a.bak";
    test::write_lines(file, 1);

    ShadowFileChannel channel(dir / "store");
    MemoryLogger logger;
    MetadataAuditMerger merger(channel, logger, dir / "tmp");
    merger.appendAudit(file, {"[2024-01-01 09:00:00] one", "[2024-01-02 09:00:00] two"});

    auto history = merger.readAuditNewestFirst(file);
    ASSERT_EQ(history.size(), 2u);
    ASSERT_EQ(history[0], "[2024-01-02 09:00:00] two");
    ASSERT_EQ(history[1], "[2024-01-01 09:00:00] one");
}

TEST(audit_entry_format) {
    ASSERT_EQ(MetadataAuditMerger::makeAuditEntry("text", local_time(2023, 12, 31, 23, 59, 58)),
              "[2023-12-31 23:59:58] text");
    ASSERT_EQ(MetadataAuditMerger::makeAuditEntry("one\ntwo", local_time(2023, 12, 31, 23, 59, 58)),
              "[2023-12-31 23:59:58] one two");
}

TEST(single_line_folds_breaks) {
    ASSERT_EQ(MetadataAuditMerger::singleLine("  plain  "), "plain");
    ASSERT_EQ(MetadataAuditMerger::singleLine("a \n\n  b\rc\r\nd"), "a b c d");
    ASSERT_EQ(MetadataAuditMerger::singleLine("a\tb"), "a\tb");
    ASSERT_EQ(MetadataAuditMerger::singleLine("\n\n"), "");
}

//=============================================================================
// Sync across a set
//=============================================================================

TEST(sync_converges_to_union) {
    test::TempDir dir;
    std::vector<std::filesystem::path> files = {dir / "a.bak", dir / "b.bak", dir / "c.bak"};
    for (const auto& f : files) test::write_lines(f, 1);

    ShadowFileChannel channel(dir / "store");
    MemoryLogger logger;
    MetadataAuditMerger merger(channel, logger, dir / "tmp");
    merger.appendAudit(files[0], {"[2024-01-02 10:00:00] e2"});
    merger.appendAudit(files[1], {"[2024-01-01 09:00:00] e1", "[2024-01-02 10:00:00] e2"});

    ASSERT_EQ(merger.syncAcrossSet(files), 3u);  // a gets e1, c gets both

    std::set<std::string> expected = {"[2024-01-01 09:00:00] e1", "[2024-01-02 10:00:00] e2"};
    for (const auto& f : files) {
        auto audit = merger.readAudit(f);
        ASSERT_EQ(audit.size(), 2u);
        ASSERT_TRUE(std::set<std::string>(audit.begin(), audit.end()) == expected);
    }

    // Newly synced file receives entries in sorted order
    auto c = merger.readAudit(files[2]);
    ASSERT_EQ(c[0], "[2024-01-01 09:00:00] e1");

    // Second run is a no-op
    ASSERT_EQ(merger.syncAcrossSet(files), 0u);
}

TEST(sync_without_history_is_noop) {
    test::TempDir dir;
    std::vector<std::filesystem::path> files = {dir / "a.bak", dir / "b.bak"};
    for (const auto& f : files) test::write_lines(f, 1);

    FlakyChannel channel(dir / "store");
    MemoryLogger logger;
    MetadataAuditMerger merger(channel, logger, dir / "tmp");

    ASSERT_EQ(merger.syncAcrossSet(files), 0u);
    ASSERT_EQ(channel.appendCalls, 0);
    ASSERT_EQ(merger.syncAcrossSet(std::vector<std::filesystem::path>{}), 0u);
}

TEST(sync_accepts_backup_set) {
    test::TempDir dir;
    BackupSet set(2);
    set[0].path = dir / "x.2024-01-02_100000.bak";
    set[1].path = dir / "x.2024-01-01_090000.bak";
    for (const auto& f : set) test::write_lines(f.path, 1);

    ShadowFileChannel channel(dir / "store");
    MemoryLogger logger;
    MetadataAuditMerger merger(channel, logger, dir / "tmp");
    merger.appendAudit(set[1].path, {"[2024-01-01 09:00:00] older tag"});

    ASSERT_EQ(merger.syncAcrossSet(set), 1u);
    ASSERT_EQ(merger.readAudit(set[0].path).size(), 1u);
}

//=============================================================================
// Retries and fallbacks
//=============================================================================

TEST(read_retries_transient_failures) {
    test::TempDir dir;
    auto file = dir / "a.bak";
    test::write_lines(file, 1);

    FlakyChannel channel(dir / "store");
    channel.inner.appendAudit(file, {"kept"});
    channel.failReads = 2;

    MemoryLogger logger;
    MetadataAuditMerger merger(channel, logger, dir / "tmp");
    auto audit = merger.readAudit(file);

    ASSERT_EQ(audit.size(), 1u);
    ASSERT_EQ(channel.readCalls, 3);
    ASSERT_EQ(channel.exportCalls, 0);
    ASSERT_EQ(logger.count(Logger::Level::Error), 2u);
}

TEST(read_falls_back_to_temp_file) {
    test::TempDir dir;
    auto file = dir / "a.bak";
    test::write_lines(file, 1);

    FlakyChannel channel(dir / "store");
    channel.inner.appendAudit(file, {"one", "two"});
    channel.failReads = MetadataAuditMerger::kMaxAttempts;

    MemoryLogger logger;
    MetadataAuditMerger merger(channel, logger, dir / "tmp");
    auto audit = merger.readAudit(file);

    ASSERT_EQ(audit.size(), 2u);
    ASSERT_EQ(audit[1], "two");
    ASSERT_EQ(channel.exportCalls, 1);
    ASSERT_TRUE(dir_is_empty(dir / "tmp"));
}

TEST(append_falls_back_to_temp_file) {
    test::TempDir dir;
    auto file = dir / "a.bak";
    test::write_lines(file, 1);

    FlakyChannel channel(dir / "store");
    channel.failAppends = MetadataAuditMerger::kMaxAttempts;

    MemoryLogger logger;
    MetadataAuditMerger merger(channel, logger, dir / "tmp");
    ASSERT_EQ(merger.appendAudit(file, {"entry"}), 1u);

    ASSERT_EQ(channel.importCalls, 1);
    auto audit = channel.inner.readAudit(file);
    ASSERT_EQ(audit.size(), 1u);
    ASSERT_EQ(audit[0], "entry");
    ASSERT_TRUE(dir_is_empty(dir / "tmp"));
}

TEST(unreadable_history_skips_append) {
    test::TempDir dir;
    auto file = dir / "a.bak";
    test::write_lines(file, 1);

    FlakyChannel channel(dir / "store");
    channel.failReads = 100;
    channel.failExport = true;

    MemoryLogger logger;
    MetadataAuditMerger merger(channel, logger, dir / "tmp");
    ASSERT_TRUE(merger.readAudit(file).empty());
    ASSERT_EQ(merger.appendAudit(file, {"entry"}), 0u);
    ASSERT_EQ(channel.appendCalls, 0);
    ASSERT_TRUE(channel.inner.readAudit(file).empty());
}

TEST(append_gives_up_when_fallback_fails) {
    test::TempDir dir;
    auto file = dir / "a.bak";
    test::write_lines(file, 1);

    FlakyChannel channel(dir / "store");
    channel.failAppends = 100;
    channel.failImport = true;

    MemoryLogger logger;
    MetadataAuditMerger merger(channel, logger, dir / "tmp");
    ASSERT_EQ(merger.appendAudit(file, {"entry"}), 0u);
    ASSERT_EQ(channel.appendCalls, MetadataAuditMerger::kMaxAttempts);
    ASSERT_TRUE(logger.contains("Fallback failed"));
    ASSERT_TRUE(dir_is_empty(dir / "tmp"));
}

int main() {
    return test::print_summary();
}
