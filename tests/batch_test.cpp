//! # Batch Tests
//!
//! File discovery, atomic writes and the parallel batch runner over a
//! temporary directory tree.

#include "pipeline/batch.hpp"
#include "pipeline/work_queue.hpp"

#include <algorithm>
#include <atomic>
#include <fstream>
#include <gtest/gtest.h>
#include <sstream>

using namespace docforge;
using namespace docforge::pipeline;

class BatchTest : public ::testing::Test {
protected:
    fs::path root_;
    config::Config config_;

    void SetUp() override {
        auto name = std::string("docforge_batch_") +
                    ::testing::UnitTest::GetInstance()->current_test_info()->name();
        root_ = fs::temp_directory_path() / name;
        fs::remove_all(root_);
        fs::create_directories(root_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    void write_file(const fs::path& relative, const std::string& content) {
        auto path = root_ / relative;
        fs::create_directories(path.parent_path());
        std::ofstream out(path, std::ios::binary);
        out << content;
    }

    auto read_file(const fs::path& relative) const -> std::string {
        std::ifstream in(root_ / relative, std::ios::binary);
        std::ostringstream oss;
        oss << in.rdbuf();
        return oss.str();
    }

    void write_tree() {
        write_file("a.py", "def add(a, b):\n    return a + b\n");
        write_file("bad.py", "def broken(:\n    pass\n");
        write_file("notes.txt", "def not_python():\n    pass\n");
        write_file("sub/c.py", "class Box:\n    pass\n");
        write_file(".hidden/d.py", "def hidden():\n    pass\n");
    }
};

// ============================================================================
// Discovery
// ============================================================================

TEST_F(BatchTest, DiscoverRecursiveSkipsHiddenDirectories) {
    write_tree();
    auto files = discover_files(root_, true, {".py"});
    ASSERT_EQ(files.size(), 3u);
    EXPECT_EQ(files[0], root_ / "a.py");
    EXPECT_EQ(files[1], root_ / "bad.py");
    EXPECT_EQ(files[2], root_ / "sub" / "c.py");
}

TEST_F(BatchTest, DiscoverFlat) {
    write_tree();
    auto files = discover_files(root_, false, {".py"});
    ASSERT_EQ(files.size(), 2u);
    EXPECT_EQ(files[0].filename(), "a.py");
    EXPECT_EQ(files[1].filename(), "bad.py");
}

TEST_F(BatchTest, DiscoverExtensionsAndSingleFile) {
    write_tree();
    EXPECT_EQ(discover_files(root_, true, {".txt"}).size(), 1u);

    auto single = discover_files(root_ / "notes.txt", true, {".py"});
    ASSERT_EQ(single.size(), 1u);
    EXPECT_EQ(single[0], root_ / "notes.txt");

    EXPECT_TRUE(discover_files(root_ / "missing", true, {".py"}).empty());
}

// ============================================================================
// Atomic Writes
// ============================================================================

TEST_F(BatchTest, WriteAtomicReplacesContent) {
    write_file("target.py", "old\n");
    auto written = write_atomic(root_ / "target.py", "new content\n");
    ASSERT_TRUE(is_ok(written));
    EXPECT_EQ(unwrap(written), 12u);
    EXPECT_EQ(read_file("target.py"), "new content\n");

    size_t entries = 0;
    for (const auto& entry : fs::directory_iterator(root_)) {
        (void)entry;
        ++entries;
    }
    EXPECT_EQ(entries, 1u);
}

TEST_F(BatchTest, WriteAtomicReportsMissingDirectory) {
    auto written = write_atomic(root_ / "no_such_dir" / "x.py", "text");
    ASSERT_TRUE(is_err(written));
    EXPECT_NE(unwrap_err(written).find("cannot create"), std::string::npos);
}

// ============================================================================
// Runner
// ============================================================================

TEST_F(BatchTest, RunWritesAndReportsFailures) {
    write_tree();
    FilePipeline pipeline(config_, {});
    BatchRunner runner(pipeline, BatchOptions{.jobs = 3});

    auto files = discover_files(root_, true, {".py"});
    std::reverse(files.begin(), files.end());
    auto reports = runner.run(files);

    ASSERT_EQ(reports.size(), 3u);
    EXPECT_EQ(reports[0].path, (root_ / "a.py").string());
    EXPECT_EQ(reports[1].path, (root_ / "bad.py").string());
    EXPECT_EQ(reports[2].path, (root_ / "sub" / "c.py").string());

    EXPECT_TRUE(reports[0].ok());
    EXPECT_TRUE(reports[0].written);
    ASSERT_FALSE(reports[1].ok());
    EXPECT_EQ(reports[1].error->kind, FileErrorKind::Parse);
    EXPECT_FALSE(reports[1].fingerprint.empty());
    EXPECT_TRUE(reports[2].written);
    EXPECT_TRUE(any_failed(reports));

    EXPECT_EQ(runner.stats().total_files.load(), 3);
    EXPECT_EQ(runner.stats().succeeded.load(), 2);
    EXPECT_EQ(runner.stats().failed.load(), 1);
    EXPECT_EQ(runner.stats().written.load(), 2);

    EXPECT_NE(read_file("a.py").find("\"\"\"Add operation."), std::string::npos);
    EXPECT_EQ(read_file("sub/c.py"), "class Box:\n    \"\"\"Box class.\"\"\"\n    pass\n");
    EXPECT_EQ(read_file("bad.py"), "def broken(:\n    pass\n");
}

TEST_F(BatchTest, DryRunLeavesFilesAlone) {
    write_tree();
    FilePipeline pipeline(config_, {});
    BatchRunner runner(pipeline, BatchOptions{.jobs = 2, .dry_run = true});

    auto reports = runner.run({root_ / "a.py", root_ / "sub" / "c.py"});
    ASSERT_EQ(reports.size(), 2u);
    EXPECT_FALSE(reports[0].written);
    EXPECT_EQ(reports[0].results.size(), 1u);
    EXPECT_FALSE(any_failed(reports));
    EXPECT_EQ(runner.stats().written.load(), 0);
    EXPECT_EQ(read_file("a.py"), "def add(a, b):\n    return a + b\n");
}

TEST_F(BatchTest, UnchangedFilesAreNotWritten) {
    write_file("done.py", "def f():\n    \"\"\"Already documented.\"\"\"\n");
    FilePipeline pipeline(config_, {});
    BatchRunner runner(pipeline, BatchOptions{.jobs = 1});

    auto reports = runner.run({root_ / "done.py"});
    ASSERT_EQ(reports.size(), 1u);
    EXPECT_TRUE(reports[0].ok());
    EXPECT_FALSE(reports[0].written);
    EXPECT_EQ(reports[0].skipped, std::vector<std::string>{"f"});
}

// ============================================================================
// Worker Pool
// ============================================================================

TEST(WorkQueueTest, PopAfterStop) {
    WorkQueue queue;
    queue.push(1);
    queue.push(2);
    queue.stop();
    EXPECT_EQ(queue.size(), 2u);
    EXPECT_EQ(queue.pop(), 1u);
    EXPECT_EQ(queue.pop(), 2u);
    EXPECT_FALSE(queue.pop());
    EXPECT_TRUE(queue.is_empty());
}

TEST(WorkQueueTest, ResolveJobs) {
    EXPECT_EQ(resolve_jobs(3), 3u);
    EXPECT_GE(resolve_jobs(0), 1u);
    EXPECT_LE(resolve_jobs(0), MAX_AUTO_JOBS);
}

TEST(WorkQueueTest, RunWorkersVisitsEveryIndexOnce) {
    std::vector<std::atomic<int>> hits(100);
    run_workers(hits.size(), 4, [&](size_t index) { hits[index]++; });
    for (const auto& hit : hits) {
        EXPECT_EQ(hit.load(), 1);
    }
}
