// app_test.cpp - End-to-end commands through the application controller

#include "test_helper.h"
#include "test_fixtures.h"
#include "../src/app.hpp"
#include "../src/errors.hpp"
#include "../src/metadata_audit.hpp"

#include <memory>
#include <sstream>

using namespace BackupLens;

//=============================================================================
// Fixture
//=============================================================================

struct AppFixture {
    test::TempDir dir;
    std::ostringstream out;
    std::shared_ptr<MemoryLogger> log = std::make_shared<MemoryLogger>();
    std::unique_ptr<App> app;

    explicit AppFixture(StoreBackend backend = StoreBackend::Files) {
        AppConfig config = AppConfig::fromRoots(dir / "data", dir / "cache");
        config.storeBackend = backend;
        app = std::make_unique<App>(config, out);
        if (!app->init(log)) {
            throw std::runtime_error("App::init failed");
        }
    }

    std::filesystem::path backups() const { return dir / "backups"; }

    // Two backups of report.txt: 80 lines, then 85
    void addReportBackups() {
        test::write_lines(backups() / "report.txt.2024-01-01_090000.bak", 80);
        test::write_lines(backups() / "report.txt.2024-01-02_100000.bak", 85);
    }

    std::string take() {
        std::string s = out.str();
        out.str("");
        return s;
    }

    static bool has(const std::string& text, const std::string& fragment) {
        return text.find(fragment) != std::string::npos;
    }
};

//=============================================================================
// versions
//=============================================================================

TEST(versions_prints_table) {
    AppFixture f;
    f.addReportBackups();

    ASSERT_EQ(f.app->run("versions", {f.backups().string(), "report.txt"}), kExitOk);
    std::string text = f.take();

    ASSERT_TRUE(AppFixture::has(text, "Date/Time"));
    ASSERT_TRUE(AppFixture::has(text, "Meta Tag"));
    ASSERT_TRUE(AppFixture::has(text, "V2"));
    ASSERT_TRUE(AppFixture::has(text, "+5 lines"));
    ASSERT_TRUE(AppFixture::has(text, "85"));
    ASSERT_TRUE(AppFixture::has(text, "N/A"));
    // Newest row comes first
    ASSERT_LT(text.find("V2"), text.find("V1"));
}

TEST(load_versions_from_backup_name) {
    AppFixture f;
    f.addReportBackups();

    auto view = f.app->loadVersions(f.backups(), "report.txt.2024-01-01_090000.bak");
    ASSERT_EQ(view.baseName, "report.txt");
    ASSERT_EQ(view.rows.size(), 2u);
    ASSERT_EQ(view.rows[0].versionLabel(), "V2");
    ASSERT_EQ(view.rows[0].change.toString(), "+5 lines");
}

TEST(versions_with_no_backups) {
    AppFixture f;
    std::filesystem::create_directories(f.backups());
    ASSERT_EQ(f.app->run("versions", {f.backups().string(), "report.txt"}), kExitOk);
    ASSERT_TRUE(AppFixture::has(f.take(), "No backups found for 'report'"));
}

TEST(versions_missing_directory_throws) {
    AppFixture f;
    ASSERT_THROWS(f.app->run("versions", {(f.dir / "nowhere").string(), "report.txt"}), DirectoryUnavailable);
}

TEST(versions_writes_batch_log) {
    AppFixture f;
    f.addReportBackups();
    f.app->run("versions", {f.backups().string(), "report.txt"});

    auto logFile = f.dir / "data" / "logs" / "report_loghistory.txt";
    ASSERT_EQ(f.app->currentLogFile(), logFile);
    ASSERT_TRUE(std::filesystem::exists(logFile));
    ASSERT_TRUE(AppFixture::has(test::read_file(logFile), "Loaded versions for report"));
}

TEST(versions_syncs_history_across_set) {
    AppFixture f;
    f.addReportBackups();
    auto older = f.backups() / "report.txt.2024-01-01_090000.bak";
    auto newer = f.backups() / "report.txt.2024-01-02_100000.bak";

    ASSERT_EQ(f.app->run("tag", {older.string(), "reviewed"}), kExitOk);
    ASSERT_TRUE(f.app->merger().readAudit(newer).empty());

    f.app->run("versions", {f.backups().string(), "report.txt"});
    auto audit = f.app->merger().readAudit(newer);
    ASSERT_EQ(audit.size(), 1u);
    ASSERT_TRUE(AppFixture::has(audit[0], "] reviewed"));
    // Tags themselves are not copied
    ASSERT_EQ(f.app->merger().readSource(newer), "");
}

//=============================================================================
// Metadata commands
//=============================================================================

TEST(tag_show_and_history) {
    AppFixture f;
    auto file = f.dir / "doc.txt.2024-01-01_090000.bak";
    test::write_lines(file, 2);

    ASSERT_EQ(f.app->run("history", {file.string()}), kExitOk);
    ASSERT_EQ(f.take(), "No metadata history available.\n");

    ASSERT_EQ(f.app->run("tag", {file.string(), "first", "draft"}), kExitOk);
    ASSERT_TRUE(AppFixture::has(f.take(), "first draft"));

    ASSERT_EQ(f.app->run("show-tag", {file.string()}), kExitOk);
    ASSERT_EQ(f.take(), "first draft\n");

    f.app->merger().appendAudit(file, {"[2999-01-01 00:00:00] final"});
    ASSERT_EQ(f.app->run("history", {file.string()}), kExitOk);
    std::string history = f.take();
    ASSERT_EQ(history.find("[2999-01-01 00:00:00] final"), 0u);
    ASSERT_TRUE(AppFixture::has(history, "] first draft\n"));
}

TEST(tag_missing_file_fails) {
    AppFixture f;
    ASSERT_EQ(f.app->run("tag", {(f.dir / "absent.bak").string(), "x"}), kExitFailure);
    ASSERT_GE(f.log->count(Logger::Level::Error), 1u);
}

TEST(relative_and_absolute_paths_share_tags) {
    AppFixture f;
    auto file = f.dir / "rel.bak";
    test::write_lines(file, 1);
    auto spelled = f.dir / "sub" / ".." / "rel.bak";
    std::filesystem::create_directories(f.dir / "sub");

    f.app->run("tag", {spelled.string(), "same file"});
    f.take();
    f.app->run("show-tag", {file.string()});
    ASSERT_EQ(f.take(), "same file\n");
}

TEST(sqlite_backend_round_trip) {
    AppFixture f(StoreBackend::Sqlite);
    auto file = f.dir / "db.bak";
    test::write_lines(file, 1);

    ASSERT_EQ(f.app->run("tag", {file.string(), "stored in sqlite"}), kExitOk);
    f.take();
    f.app->run("show-tag", {file.string()});
    ASSERT_EQ(f.take(), "stored in sqlite\n");
    ASSERT_TRUE(std::filesystem::exists(f.dir / "data" / "metadata.db"));
}

//=============================================================================
// Documents, preview, diff
//=============================================================================

TEST(docs_lists_master_documents) {
    AppFixture f;
    f.addReportBackups();
    test::write_lines(f.dir / "production" / "report.txt", 85);

    ASSERT_EQ(f.app->run("docs", {(f.dir / "production").string(), f.backups().string()}), kExitOk);
    std::string text = f.take();
    ASSERT_TRUE(AppFixture::has(text, "Document"));
    ASSERT_TRUE(AppFixture::has(text, "report.txt"));
    ASSERT_TRUE(AppFixture::has(text, "2\n"));
}

TEST(preview_prints_content_or_error) {
    AppFixture f;
    auto file = f.dir / "p.bak";
    test::write_file(file, "hello");

    f.app->run("preview", {file.string()});
    ASSERT_EQ(f.take(), "hello\n");

    f.app->run("preview", {(f.dir / "missing.bak").string()});
    ASSERT_EQ(f.take().rfind("Error reading file: ", 0), 0u);
}

TEST(diff_prints_unified_diff_and_summary) {
    AppFixture f;
    f.addReportBackups();
    auto older = f.backups() / "report.txt.2024-01-01_090000.bak";
    auto newer = f.backups() / "report.txt.2024-01-02_100000.bak";

    ASSERT_EQ(f.app->run("diff", {older.string(), newer.string()}), kExitOk);
    std::string text = f.take();
    ASSERT_TRUE(AppFixture::has(text, "--- " + older.string() + "\n"));
    ASSERT_TRUE(AppFixture::has(text, "@@ -78,3 +78,8 @@\n"));
    ASSERT_TRUE(AppFixture::has(text, "+line 85\n"));
    ASSERT_TRUE(AppFixture::has(text, "Changes: +5 lines\n"));

    f.app->run("diff", {older.string(), older.string()});
    ASSERT_EQ(f.take(), "No differences.\nChanges: 0 lines\n");
}

TEST(diff_of_missing_file_throws) {
    AppFixture f;
    ASSERT_THROWS(f.app->run("diff", {(f.dir / "a").string(), (f.dir / "b").string()}), FileAccessError);
}

//=============================================================================
// Usage errors
//=============================================================================

TEST(unknown_command_and_bad_arity) {
    AppFixture f;
    ASSERT_THROWS(f.app->run("explode", {}), UsageError);
    ASSERT_THROWS(f.app->run("versions", {"only-one"}), UsageError);
    ASSERT_THROWS(f.app->run("tag", {"file-only"}), UsageError);
    ASSERT_THROWS(f.app->run("preview", {}), UsageError);
}

TEST(usage_lists_commands) {
    std::string text = App::usage("backuplens");
    for (const char* cmd : {"versions", "tag", "show-tag", "history", "docs", "preview", "diff"}) {
        ASSERT_TRUE(AppFixture::has(text, std::string("backuplens [options] ") + cmd + " "));
    }
}

int main() {
    return test::print_summary();
}
