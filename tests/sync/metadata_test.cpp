#include "psync/sync/metadata.hpp"
#include "support/temp_tree.hpp"

#include <gtest/gtest.h>

#include <chrono>

using namespace psync::sync;
namespace fs = std::filesystem;

namespace {

fs::perms perms_of(const fs::path& path) {
    return fs::status(path).permissions() & fs::perms::mask;
}

bool writable_by_owner(const fs::path& path) {
    return (perms_of(path) & fs::perms::owner_write) != fs::perms::none;
}

} // namespace

class MetadataTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = psync::testing::create_temp_dir("metadata");
        source_ = root_ / "source.txt";
        destination_ = root_ / "destination.txt";
        psync::testing::write_file(source_, "payload");
        psync::testing::write_file(destination_, "payload");
    }

    void TearDown() override {
        std::error_code ec;
        fs::permissions(destination_, fs::perms::owner_all, fs::perm_options::add, ec);
        fs::remove_all(root_, ec);
    }

    FileEntry source_entry() const {
        FileEntry entry;
        entry.path = "source.txt";
        entry.size = 7;
        entry.modified = fs::last_write_time(source_);
        entry.permissions = perms_of(source_);
        return entry;
    }

    fs::path root_;
    fs::path source_;
    fs::path destination_;
    PosixMetadataApplier applier_;
};

TEST_F(MetadataTest, CopiesModificationTime) {
    const auto stamp = fs::last_write_time(source_) - std::chrono::hours(48);
    fs::last_write_time(source_, stamp);

    auto result = applier_.apply(source_entry(), source_, destination_, psync::CopyFlags::parse("DT"));
    ASSERT_TRUE(result.is_ok()) << result.error().describe();
    EXPECT_EQ(fs::last_write_time(destination_), stamp);
}

TEST_F(MetadataTest, TimestampsLeftAloneWithoutFlag) {
    const auto before = fs::last_write_time(destination_);
    fs::last_write_time(source_, before - std::chrono::hours(1));

    ASSERT_TRUE(applier_.apply(source_entry(), source_, destination_, psync::CopyFlags::parse("D")).is_ok());
    EXPECT_EQ(fs::last_write_time(destination_), before);
}

TEST_F(MetadataTest, TimestampAppliedToReadOnlyDestination) {
    fs::permissions(destination_, fs::perms::owner_write | fs::perms::group_write | fs::perms::others_write,
                    fs::perm_options::remove);
    const auto stamp = fs::last_write_time(source_) - std::chrono::hours(3);
    fs::last_write_time(source_, stamp);

    ASSERT_TRUE(applier_.apply(source_entry(), source_, destination_, psync::CopyFlags::parse("DT")).is_ok());
    EXPECT_EQ(fs::last_write_time(destination_), stamp);
    EXPECT_FALSE(writable_by_owner(destination_));
}

TEST_F(MetadataTest, AttributesCarryReadOnlyBit) {
    fs::permissions(source_, fs::perms::owner_write, fs::perm_options::remove);

    ASSERT_TRUE(applier_.apply(source_entry(), source_, destination_, psync::CopyFlags::parse("DA")).is_ok());
    EXPECT_FALSE(writable_by_owner(destination_));

    fs::permissions(source_, fs::perms::owner_write, fs::perm_options::add);
    ASSERT_TRUE(applier_.apply(source_entry(), source_, destination_, psync::CopyFlags::parse("DA")).is_ok());
    EXPECT_TRUE(writable_by_owner(destination_));
}

TEST_F(MetadataTest, SecurityCopiesPermissionBits) {
    const auto wanted = fs::perms::owner_read | fs::perms::owner_write | fs::perms::group_read;
    fs::permissions(source_, wanted, fs::perm_options::replace);
    fs::permissions(destination_, fs::perms::owner_all | fs::perms::others_read, fs::perm_options::replace);

    ASSERT_TRUE(applier_.apply(source_entry(), source_, destination_, psync::CopyFlags::parse("DS")).is_ok());
    EXPECT_EQ(perms_of(destination_), wanted);
}

TEST_F(MetadataTest, OwnerFlagSucceedsUnprivileged) {
    auto result = applier_.apply(source_entry(), source_, destination_, psync::CopyFlags::parse("DO"));
    EXPECT_TRUE(result.is_ok()) << result.error().describe();
}

TEST_F(MetadataTest, MissingDestinationIsAnError) {
    fs::remove(destination_);
    auto result = applier_.apply(source_entry(), source_, destination_, psync::CopyFlags::parse("DT"));
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, psync::ErrorKind::PermanentIO);
}

TEST_F(MetadataTest, GuardRestoresReadOnlyOnScopeExit) {
    fs::permissions(destination_, fs::perms::owner_write, fs::perm_options::remove);
    {
        ReadOnlyGuard guard(destination_);
        ASSERT_FALSE(guard.error().has_value());
        EXPECT_TRUE(guard.was_read_only());
        EXPECT_TRUE(writable_by_owner(destination_));
    }
    EXPECT_FALSE(writable_by_owner(destination_));
}

TEST_F(MetadataTest, GuardLeavesWritableFileUntouched) {
    const auto before = perms_of(destination_);
    {
        ReadOnlyGuard guard(destination_);
        EXPECT_FALSE(guard.was_read_only());
    }
    EXPECT_EQ(perms_of(destination_), before);
}

TEST_F(MetadataTest, GuardRestoreToOverridesOriginal) {
    fs::permissions(destination_, fs::perms::owner_write, fs::perm_options::remove);
    ReadOnlyGuard guard(destination_);
    guard.restore_to(fs::perms::owner_read | fs::perms::owner_write);

    ASSERT_TRUE(guard.restore().is_ok());
    EXPECT_EQ(perms_of(destination_), fs::perms::owner_read | fs::perms::owner_write);
    // Second restore is a no-op
    EXPECT_TRUE(guard.restore().is_ok());
}

TEST_F(MetadataTest, GuardReportsMissingFile) {
    ReadOnlyGuard guard(root_ / "absent");
    ASSERT_TRUE(guard.error().has_value());
    EXPECT_EQ(guard.error()->kind, psync::ErrorKind::PermanentIO);
    EXPECT_TRUE(guard.restore().is_ok());
}
