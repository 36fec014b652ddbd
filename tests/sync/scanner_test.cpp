#include "psync/sync/scanner.hpp"

#include "support/temp_tree.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <map>

namespace fs = std::filesystem;
using psync::sync::EntryKind;
using psync::sync::FileEntry;
using psync::sync::ScanFilter;
using psync::sync::Scanner;
using psync::sync::matches_pattern;

namespace {

class ScannerTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = psync::testing::create_temp_dir("scanner");
        psync::testing::write_file(root_ / "a.txt", "alpha");
        psync::testing::write_file(root_ / "notes.tmp", "scratch");
        psync::testing::write_file(root_ / "docs" / "guide.md", std::string(2048, 'g'));
        psync::testing::write_file(root_ / ".git" / "HEAD", "ref");
        fs::create_directories(root_ / "empty");
        fs::create_symlink("a.txt", root_ / "link");
    }

    void TearDown() override {
        fs::remove_all(root_);
    }

    std::map<std::string, FileEntry> scan(const Scanner& scanner) {
        std::map<std::string, FileEntry> entries;
        auto result = scanner.scan(root_, [&entries](FileEntry entry) {
            auto path = entry.path;
            entries.emplace(std::move(path), std::move(entry));
        });
        EXPECT_TRUE(result.is_ok());
        if (result.is_ok()) {
            EXPECT_EQ(result.value(), entries.size());
        }
        return entries;
    }

    fs::path root_;
};

} // namespace

TEST(MatchesPattern, Wildcards) {
    EXPECT_TRUE(matches_pattern("*.tmp", "notes.tmp"));
    EXPECT_TRUE(matches_pattern("*", ""));
    EXPECT_TRUE(matches_pattern("file?.log", "file1.log"));
    EXPECT_TRUE(matches_pattern("a*b*c", "aXXbYYc"));
    EXPECT_FALSE(matches_pattern("*.tmp", "notes.txt"));
    EXPECT_FALSE(matches_pattern("file?.log", "file10.log"));
    EXPECT_FALSE(matches_pattern("abc", "ab"));
}

TEST_F(ScannerTest, ReportsEveryKindWithRelativePaths) {
    Scanner scanner;
    const auto entries = scan(scanner);

    ASSERT_EQ(entries.count("a.txt"), 1u);
    EXPECT_EQ(entries.at("a.txt").kind, EntryKind::File);
    EXPECT_EQ(entries.at("a.txt").size, 5u);

    ASSERT_EQ(entries.count("docs/guide.md"), 1u);
    EXPECT_EQ(entries.at("docs").kind, EntryKind::Directory);
    EXPECT_EQ(entries.at("empty").kind, EntryKind::Directory);

    ASSERT_EQ(entries.count("link"), 1u);
    EXPECT_EQ(entries.at("link").kind, EntryKind::Symlink);
    EXPECT_EQ(entries.at("link").symlink_target, "a.txt");

    EXPECT_FALSE(entries.at("a.txt").checksum.has_value());
}

TEST_F(ScannerTest, ExcludeFilePatterns) {
    ScanFilter filter;
    filter.exclude_files = {"*.tmp"};
    const auto entries = scan(Scanner(filter));

    EXPECT_EQ(entries.count("notes.tmp"), 0u);
    EXPECT_EQ(entries.count("a.txt"), 1u);
}

TEST_F(ScannerTest, ExcludedDirectoriesAreNotDescended) {
    ScanFilter filter;
    filter.exclude_dirs = {".git"};
    const auto entries = scan(Scanner(filter));

    EXPECT_EQ(entries.count(".git"), 0u);
    EXPECT_EQ(entries.count(".git/HEAD"), 0u);
    EXPECT_EQ(entries.count("docs/guide.md"), 1u);
}

TEST_F(ScannerTest, SizeBoundsOnlyApplyToFiles) {
    ScanFilter filter;
    filter.min_size = 6;
    filter.max_size = 4096;
    const auto entries = scan(Scanner(filter));

    EXPECT_EQ(entries.count("a.txt"), 0u);
    EXPECT_EQ(entries.count("notes.tmp"), 1u);
    EXPECT_EQ(entries.count("docs/guide.md"), 1u);
    EXPECT_EQ(entries.count("empty"), 1u);
    EXPECT_EQ(entries.count("link"), 1u);
}

TEST_F(ScannerTest, ChecksumModeFillsDigests) {
    psync::sync::OpenSslHashProvider hashes;
    const auto entries = scan(Scanner({}, &hashes));

    ASSERT_TRUE(entries.at("a.txt").checksum.has_value());
    const std::string alpha = "alpha";
    EXPECT_EQ(*entries.at("a.txt").checksum,
              hashes.strong(reinterpret_cast<const std::uint8_t*>(alpha.data()), alpha.size()));
    EXPECT_FALSE(entries.at("docs").checksum.has_value());
}

TEST(Scanner, MissingRootYieldsNothing) {
    Scanner scanner;
    auto collected = scanner.collect("/nonexistent/psync/root");
    ASSERT_TRUE(collected.is_ok());
    EXPECT_TRUE(collected.value().empty());
}
