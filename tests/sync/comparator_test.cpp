#include "psync/sync/comparator.hpp"

#include <gtest/gtest.h>

#include <chrono>

using namespace psync::sync;

namespace {

const auto kEpoch = std::filesystem::file_time_type::clock::now();

FileEntry file(const std::string& path, std::uint64_t size, int age_seconds = 0) {
    FileEntry entry;
    entry.path = path;
    entry.kind = EntryKind::File;
    entry.size = size;
    entry.modified = kEpoch - std::chrono::seconds(age_seconds);
    return entry;
}

FileEntry dir(const std::string& path) {
    FileEntry entry;
    entry.path = path;
    entry.kind = EntryKind::Directory;
    return entry;
}

FileEntry symlink_entry(const std::string& path, const std::string& target) {
    FileEntry entry;
    entry.path = path;
    entry.kind = EntryKind::Symlink;
    entry.symlink_target = target;
    return entry;
}

ComparatorSettings settings(bool purge = false, psync::CompareMode mode = psync::CompareMode::SizeAndTime) {
    ComparatorSettings s;
    s.purge = purge;
    s.mode = mode;
    s.delta_threshold = 1024;
    return s;
}

} // namespace

TEST(Comparator, MissingDestinationCopiesWhole) {
    Comparator comparator(settings(), {});
    const auto source = file("a", 10);
    EXPECT_EQ(comparator.decide(&source, nullptr).action, Action::CopyWhole);
}

TEST(Comparator, IdenticalSizeAndTimeSkips) {
    Comparator comparator(settings(), {});
    const auto source = file("a", 10, 5);
    const auto destination = file("a", 10, 5);
    EXPECT_EQ(comparator.decide(&source, &destination).action, Action::Skip);
}

TEST(Comparator, OlderSourceWithSameSizeSkips) {
    Comparator comparator(settings(), {});
    const auto source = file("a", 10, 50);
    const auto destination = file("a", 10, 5);
    EXPECT_EQ(comparator.decide(&source, &destination).action, Action::Skip);
}

TEST(Comparator, NewerSourceAboveThresholdUsesDelta) {
    Comparator comparator(settings(), {});
    const auto source = file("a", 5000, 0);
    const auto destination = file("a", 5000, 60);
    EXPECT_EQ(comparator.decide(&source, &destination).action, Action::DeltaCopy);
}

TEST(Comparator, SmallDestinationCopiesWhole) {
    Comparator comparator(settings(), {});
    const auto source = file("a", 5000);
    const auto destination = file("a", 1024);
    EXPECT_EQ(comparator.decide(&source, &destination).action, Action::CopyWhole);
}

TEST(Comparator, FilesAboveDeltaLimitCopyWhole) {
    auto limited = settings();
    limited.delta_max_size = 64 * 1024;
    Comparator comparator(limited, {});

    const auto big_source = file("a", 64 * 1024 + 1, 0);
    const auto destination = file("a", 8000, 60);
    EXPECT_EQ(comparator.decide(&big_source, &destination).action, Action::CopyWhole);

    const auto source = file("a", 8000, 0);
    const auto big_destination = file("a", 100 * 1024, 60);
    EXPECT_EQ(comparator.decide(&source, &big_destination).action, Action::CopyWhole);

    const auto at_limit = file("a", 64 * 1024, 0);
    EXPECT_EQ(comparator.decide(&at_limit, &destination).action, Action::DeltaCopy);
}

TEST(Comparator, DeltaLimitFollowsLargeFileThreshold) {
    psync::SyncOptions options;
    options.batching.large_file_threshold = 123456;
    EXPECT_EQ(ComparatorSettings::from_options(options).delta_max_size, 123456u);
}

TEST(Comparator, ZeroByteSourceAlwaysCopiesWhole) {
    Comparator comparator(settings(), {});
    const auto source = file("a", 0);
    const auto destination = file("a", 5000, 60);
    EXPECT_EQ(comparator.decide(&source, &destination).action, Action::CopyWhole);
}

TEST(Comparator, ChecksumModeIgnoresTimestamps) {
    Comparator comparator(settings(false, psync::CompareMode::Checksum), {});
    auto source = file("a", 5000, 0);
    auto destination = file("a", 5000, 60);
    source.checksum = "same";
    destination.checksum = "same";
    EXPECT_EQ(comparator.decide(&source, &destination).action, Action::Skip);

    destination.checksum = "different";
    EXPECT_EQ(comparator.decide(&source, &destination).action, Action::DeltaCopy);
}

TEST(Comparator, ChecksumModeFallsBackWithoutDigest) {
    Comparator comparator(settings(false, psync::CompareMode::Checksum), {});
    auto source = file("a", 5000, 0);
    auto destination = file("a", 5000, 60);
    source.checksum = "only-one-side";
    EXPECT_EQ(comparator.decide(&source, &destination).action, Action::DeltaCopy);
}

TEST(Comparator, SymlinksComparedByTarget) {
    Comparator comparator(settings(), {});
    const auto source = symlink_entry("l", "target-a");
    const auto same = symlink_entry("l", "target-a");
    const auto other = symlink_entry("l", "target-b");
    EXPECT_EQ(comparator.decide(&source, &same).action, Action::Skip);
    EXPECT_EQ(comparator.decide(&source, &other).action, Action::Symlink);
    EXPECT_FALSE(comparator.decide(&source, &other).replace_existing);
}

TEST(Comparator, KindChangeReplacesDestination) {
    Comparator comparator(settings(), {});
    const auto source = dir("x");
    const auto destination = file("x", 3);
    const auto decision = comparator.decide(&source, &destination);
    EXPECT_EQ(decision.action, Action::CreateDir);
    EXPECT_TRUE(decision.replace_existing);
}

TEST(Comparator, OrphanDeletedOnlyWhenPurging) {
    const auto destination = file("gone", 3);
    EXPECT_EQ(Comparator(settings(false), {}).decide(nullptr, &destination).action, Action::Skip);
    EXPECT_EQ(Comparator(settings(true), {}).decide(nullptr, &destination).action, Action::Delete);
}

TEST(Comparator, PlanCoversSourceAndOrphans) {
    DestinationIndex index;
    index.add(file("keep", 10, 5));
    index.add(file("stale", 5000, 60));
    index.add(file("orphan", 1));
    index.add(dir("old"));
    index.add(file("old/inner", 1));
    index.add(file("swap", 1));

    Comparator comparator(settings(true), std::move(index));
    comparator.add_source(file("keep", 10, 5));
    comparator.add_source(file("stale", 5000, 0));
    comparator.add_source(file("new", 7));
    comparator.add_source(dir("newdir"));
    comparator.add_source(dir("swap"));

    const auto plan = comparator.finish();
    EXPECT_EQ(plan.skipped, 1u);
    EXPECT_EQ(plan.count(TaskKind::DeltaCopy), 1u);
    EXPECT_EQ(plan.count(TaskKind::CopyWhole), 1u);
    EXPECT_EQ(plan.count(TaskKind::CreateDir), 2u);
    EXPECT_EQ(plan.count(TaskKind::Delete), 4u);   // swap, old, old/inner, orphan
    EXPECT_EQ(plan.total_bytes, 5007u);
}

TEST(Comparator, NoDeletesWithoutPurge) {
    DestinationIndex index;
    index.add(file("orphan", 1));
    Comparator comparator(settings(false), std::move(index));
    comparator.add_source(file("a", 1));

    const auto plan = comparator.finish();
    EXPECT_EQ(plan.count(TaskKind::Delete), 0u);
    EXPECT_EQ(plan.count(TaskKind::CopyWhole), 1u);
}

TEST(DestinationIndex, LookupByPath) {
    DestinationIndex index;
    index.add(file("a/b", 3));
    ASSERT_NE(index.find("a/b"), nullptr);
    EXPECT_EQ(index.find("a/b")->size, 3u);
    EXPECT_EQ(index.find("a/c"), nullptr);
    EXPECT_EQ(index.size(), 1u);
}
