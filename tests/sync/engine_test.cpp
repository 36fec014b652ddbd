#include "psync/sync/engine.hpp"
#include "support/temp_tree.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <set>
#include <string>

using namespace psync::sync;
namespace fs = std::filesystem;

namespace {

psync::PlatformInfo test_host() {
    psync::PlatformInfo info;
    info.platform = psync::Platform::Linux;
    info.hardware_threads = 4;
    info.fd_soft_limit = 1024;
    return info;
}

std::set<std::string> tree_of(const fs::path& root) {
    std::set<std::string> paths;
    if (!fs::exists(root)) {
        return paths;
    }
    for (const auto& entry : fs::recursive_directory_iterator(root)) {
        paths.insert(fs::relative(entry.path(), root).generic_string());
    }
    return paths;
}

std::string patterned(std::size_t length) {
    std::string data(length, '\0');
    for (std::size_t i = 0; i < length; ++i) {
        data[i] = static_cast<char>((i * 31 + i / 7) & 0xff);
    }
    return data;
}

} // namespace

class EngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = psync::testing::create_temp_dir("engine");
        source_ = root_ / "src";
        destination_ = root_ / "dst";
        fs::create_directories(source_);

        options_.source = source_;
        options_.destination = destination_;
        options_.workers = 4;
        options_.retry_wait = std::chrono::milliseconds(0);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    SyncEnvironment environment() const {
        SyncEnvironment env;
        env.platform = test_host();
        env.worker_cap = psync::fixed_worker_cap(64);
        env.sleeper = [](std::chrono::milliseconds) {};
        return env;
    }

    psync::Result<RunSummary> run_once() {
        SyncEngine engine(options_, environment());
        return engine.run();
    }

    psync::Result<SyncPlan> plan_once() {
        SyncEngine engine(options_, environment());
        return engine.plan();
    }

    fs::path root_;
    fs::path source_;
    fs::path destination_;
    psync::SyncOptions options_;
};

TEST_F(EngineTest, FreshCopyOfSmallTree) {
    psync::testing::write_file(source_ / "a.txt", "alpha");
    psync::testing::write_file(source_ / "b.txt", "bravo");
    psync::testing::write_file(source_ / "c.txt", "charlie");
    fs::create_directories(source_ / "empty");
    options_.mirror = true;

    auto result = run_once();
    ASSERT_TRUE(result.is_ok()) << result.error().describe();

    const auto& summary = result.value();
    EXPECT_EQ(summary.files_copied, 3u);
    EXPECT_EQ(summary.dirs_created, 1u);
    EXPECT_EQ(summary.failed, 0u);
    EXPECT_EQ(summary.bytes_transferred, 17u);
    EXPECT_FALSE(summary.dry_run);

    EXPECT_EQ(psync::testing::read_file(destination_ / "c.txt"), "charlie");
    EXPECT_TRUE(fs::is_directory(destination_ / "empty"));
}

TEST_F(EngineTest, SecondRunHasNothingToCopy) {
    psync::testing::write_file(source_ / "one.txt", "1");
    psync::testing::write_file(source_ / "nested/two.txt", "22");
    psync::testing::write_file(source_ / "nested/deeper/three.txt", patterned(5000));

    ASSERT_TRUE(run_once().is_ok());

    auto again = plan_once();
    ASSERT_TRUE(again.is_ok()) << again.error().describe();
    EXPECT_EQ(again.value().count(TaskKind::CopyWhole), 0u);
    EXPECT_EQ(again.value().count(TaskKind::DeltaCopy), 0u);
    EXPECT_TRUE(again.value().empty());

    auto summary = run_once();
    ASSERT_TRUE(summary.is_ok());
    EXPECT_EQ(summary.value().total_tasks, 0u);
    EXPECT_EQ(summary.value().files_copied, 0u);
}

TEST_F(EngineTest, MirrorMakesTreesIdentical) {
    psync::testing::write_file(source_ / "keep.txt", "keep");
    psync::testing::write_file(source_ / "dir/inner.txt", "inner");
    psync::testing::write_file(destination_ / "keep.txt", "stale content");
    psync::testing::write_file(destination_ / "orphan.txt", "orphan");
    psync::testing::write_file(destination_ / "olddir/deep/file.txt", "old");
    psync::testing::write_file(destination_ / "dir", "file where a directory belongs");
    options_.mirror = true;

    auto result = run_once();
    ASSERT_TRUE(result.is_ok()) << result.error().describe();
    EXPECT_EQ(result.value().failed, 0u);

    EXPECT_EQ(tree_of(destination_), tree_of(source_));
    EXPECT_EQ(psync::testing::read_file(destination_ / "keep.txt"), "keep");
    EXPECT_EQ(psync::testing::read_file(destination_ / "dir/inner.txt"), "inner");
}

TEST_F(EngineTest, PurgedDirectoryCountsAsOneTask) {
    psync::testing::write_file(source_ / "keep.txt", "keep");
    psync::testing::write_file(destination_ / "keep.txt", "keep");
    fs::last_write_time(destination_ / "keep.txt", fs::last_write_time(source_ / "keep.txt"));
    psync::testing::write_file(destination_ / "old/a.txt", "a");
    psync::testing::write_file(destination_ / "old/b.txt", "b");
    psync::testing::write_file(destination_ / "old/nested/c.txt", "c");
    options_.mirror = true;

    auto result = run_once();
    ASSERT_TRUE(result.is_ok()) << result.error().describe();

    const auto& summary = result.value();
    EXPECT_EQ(summary.total_tasks, 1u);
    EXPECT_EQ(summary.succeeded, 1u);
    EXPECT_EQ(summary.failed, 0u);
    EXPECT_EQ(summary.total_tasks, summary.succeeded + summary.failed);
    EXPECT_EQ(summary.files_deleted, 5u);
    EXPECT_EQ(summary.skipped, 1u);
    EXPECT_EQ(tree_of(destination_), tree_of(source_));
}

TEST_F(EngineTest, WithoutPurgeOrphansSurvive) {
    psync::testing::write_file(source_ / "new.txt", "new");
    psync::testing::write_file(destination_ / "orphan.txt", "orphan");

    ASSERT_TRUE(run_once().is_ok());
    EXPECT_TRUE(fs::exists(destination_ / "orphan.txt"));
    EXPECT_TRUE(fs::exists(destination_ / "new.txt"));
}

TEST_F(EngineTest, DryRunWritesNothing) {
    psync::testing::write_file(source_ / "a.txt", "alpha");
    psync::testing::write_file(source_ / "sub/b.txt", "bravo");
    psync::testing::write_file(destination_ / "orphan.txt", "orphan");
    options_.dry_run = true;
    options_.purge = true;

    const auto before = tree_of(destination_);
    auto result = run_once();
    ASSERT_TRUE(result.is_ok()) << result.error().describe();
    EXPECT_TRUE(result.value().dry_run);
    EXPECT_EQ(result.value().total_tasks, 4u);
    EXPECT_EQ(result.value().succeeded, 0u);
    EXPECT_EQ(tree_of(destination_), before);
}

TEST_F(EngineTest, DeclinedConfirmationCancels) {
    psync::testing::write_file(source_ / "a.txt", "alpha");
    options_.confirm = true;

    auto env = environment();
    std::size_t offered = 0;
    env.confirm = [&offered](const SyncPlan& plan) {
        offered = plan.tasks.size();
        return false;
    };
    SyncEngine engine(options_, env);

    auto result = engine.run();
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, psync::ErrorKind::Cancellation);
    EXPECT_EQ(offered, 1u);
    EXPECT_FALSE(fs::exists(destination_));
}

TEST_F(EngineTest, AcceptedConfirmationRuns) {
    psync::testing::write_file(source_ / "a.txt", "alpha");
    options_.confirm = true;

    auto env = environment();
    env.confirm = [](const SyncPlan&) { return true; };
    SyncEngine engine(options_, env);

    auto result = engine.run();
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().files_copied, 1u);
}

TEST_F(EngineTest, ConfigurationErrorBeforeAnyWork) {
    psync::testing::write_file(source_ / "a.txt", "alpha");
    options_.destination = source_ / "inside";

    auto result = run_once();
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, psync::ErrorKind::ConfigurationError);
    EXPECT_FALSE(fs::exists(source_ / "inside"));
}

TEST_F(EngineTest, WorkerCountAboveCapRejected) {
    options_.workers = 65;
    auto result = run_once();
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, psync::ErrorKind::ConfigurationError);
    EXPECT_FALSE(fs::exists(destination_));
}

TEST_F(EngineTest, ModifiedLargeFileGoesThroughDelta) {
    const auto base = patterned(32 * 1024);
    auto changed = base;
    changed.replace(100, 10, "0123456789");

    psync::testing::write_file(destination_ / "big.bin", base);
    psync::testing::write_file(source_ / "big.bin", changed);
    fs::last_write_time(destination_ / "big.bin", fs::last_write_time(source_ / "big.bin") - std::chrono::hours(1));

    auto result = run_once();
    ASSERT_TRUE(result.is_ok()) << result.error().describe();
    EXPECT_EQ(result.value().delta_files, 1u);
    EXPECT_EQ(result.value().files_copied, 1u);
    EXPECT_LT(result.value().bytes_transferred, changed.size());
    EXPECT_EQ(psync::testing::read_file(destination_ / "big.bin"), changed);
}

TEST_F(EngineTest, ChecksumModeCatchesSameSizeEdits) {
    psync::testing::write_file(source_ / "f.txt", "version-b");
    psync::testing::write_file(destination_ / "f.txt", "version-a");
    fs::last_write_time(source_ / "f.txt", fs::last_write_time(destination_ / "f.txt") - std::chrono::hours(1));

    auto by_time = plan_once();
    ASSERT_TRUE(by_time.is_ok());
    EXPECT_TRUE(by_time.value().empty());

    options_.compare_mode = psync::CompareMode::Checksum;
    auto result = run_once();
    ASSERT_TRUE(result.is_ok()) << result.error().describe();
    EXPECT_EQ(result.value().files_copied, 1u);
    EXPECT_EQ(psync::testing::read_file(destination_ / "f.txt"), "version-b");
}

TEST_F(EngineTest, MoveRemovesSourceFiles) {
    psync::testing::write_file(source_ / "a.txt", "alpha");
    psync::testing::write_file(source_ / "sub/b.txt", "bravo");
    options_.move_files = true;

    auto result = run_once();
    ASSERT_TRUE(result.is_ok());
    EXPECT_FALSE(fs::exists(source_ / "a.txt"));
    EXPECT_FALSE(fs::exists(source_ / "sub/b.txt"));
    EXPECT_EQ(psync::testing::read_file(destination_ / "sub/b.txt"), "bravo");
}

TEST_F(EngineTest, ExcludedFilesAreNotCopied) {
    psync::testing::write_file(source_ / "keep.txt", "keep");
    psync::testing::write_file(source_ / "skip.tmp", "skip");
    psync::testing::write_file(source_ / "cache/blob", "blob");
    options_.exclude_files = {"*.tmp"};
    options_.exclude_dirs = {"cache"};

    ASSERT_TRUE(run_once().is_ok());
    EXPECT_EQ(tree_of(destination_), (std::set<std::string>{"keep.txt"}));
}

TEST_F(EngineTest, SymlinksAreRecreated) {
    psync::testing::write_file(source_ / "target.txt", "t");
    fs::create_symlink("target.txt", source_ / "link");

    auto result = run_once();
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().symlinks_created, 1u);
    ASSERT_TRUE(fs::is_symlink(destination_ / "link"));
    EXPECT_EQ(fs::read_symlink(destination_ / "link"), fs::path("target.txt"));
}
