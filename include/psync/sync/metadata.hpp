#pragma once

#include "psync/core/config.hpp"
#include "psync/core/result.hpp"
#include "psync/sync/types.hpp"

#include <atomic>
#include <filesystem>
#include <optional>

namespace psync::sync {

/**
 * @brief Finalizes attributes of a file whose data has just been written
 *
 * Called once per successful CopyWhole/DeltaCopy, after the rename into
 * place.
 */
class MetadataApplier {
public:
    virtual ~MetadataApplier() = default;

    virtual Result<void> apply(const FileEntry& source,
                               const std::filesystem::path& source_path,
                               const std::filesystem::path& destination_path,
                               const CopyFlags& flags) const = 0;
};

/**
 * @brief Clears the read-only bit of a file for the guard's lifetime
 *
 * The bit (or the permissions requested through restore_to) is put back
 * by restore() or, at the latest, by the destructor, even when the work
 * in between failed.
 */
class ReadOnlyGuard {
public:
    explicit ReadOnlyGuard(std::filesystem::path path);
    ~ReadOnlyGuard();

    ReadOnlyGuard(const ReadOnlyGuard&) = delete;
    ReadOnlyGuard& operator=(const ReadOnlyGuard&) = delete;

    [[nodiscard]] bool was_read_only() const noexcept { return was_read_only_; }

    /// Failure to read or clear the bit on construction
    [[nodiscard]] const std::optional<Error>& error() const noexcept { return error_; }

    /// Permissions to leave on the file instead of the original ones
    void restore_to(std::filesystem::perms permissions) { final_permissions_ = permissions; }

    Result<void> restore();

private:
    std::filesystem::path path_;
    std::filesystem::perms original_ = std::filesystem::perms::unknown;
    std::optional<std::filesystem::perms> final_permissions_;
    std::optional<Error> error_;
    bool was_read_only_ = false;
    bool restored_ = false;
};

/**
 * @brief CopyFlags on POSIX filesystems
 *
 * T sets the modification time, A carries the read-only bit, S copies all
 * permission bits, O copies uid/gid (EPERM is only a warning when not
 * running privileged). U has no POSIX counterpart and is reported once.
 */
class PosixMetadataApplier final : public MetadataApplier {
public:
    Result<void> apply(const FileEntry& source,
                       const std::filesystem::path& source_path,
                       const std::filesystem::path& destination_path,
                       const CopyFlags& flags) const override;

private:
    mutable std::atomic<bool> auditing_warned_{false};
};

} // namespace psync::sync
