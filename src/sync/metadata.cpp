#include "psync/sync/metadata.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <system_error>

#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace psync::sync {
namespace {

constexpr auto kPermissionMask = fs::perms::mask;

bool is_read_only(fs::perms permissions) {
    return (permissions & fs::perms::owner_write) == fs::perms::none;
}

} // namespace

ReadOnlyGuard::ReadOnlyGuard(fs::path path) : path_(std::move(path)) {
    std::error_code ec;
    const auto status = fs::status(path_, ec);
    if (ec) {
        error_ = io_error("Failed to stat " + path_.string(), ec);
        restored_ = true;
        return;
    }

    original_ = status.permissions() & kPermissionMask;
    was_read_only_ = is_read_only(original_);
    if (!was_read_only_) {
        return;
    }

    fs::permissions(path_, fs::perms::owner_write, fs::perm_options::add, ec);
    if (ec) {
        error_ = io_error("Failed to clear read-only on " + path_.string(), ec);
    }
}

ReadOnlyGuard::~ReadOnlyGuard() {
    if (auto result = restore(); result.is_error()) {
        spdlog::error("Could not restore permissions on {}: {}", path_.string(), result.error().describe());
    }
}

Result<void> ReadOnlyGuard::restore() {
    if (restored_) {
        return Ok();
    }
    restored_ = true;

    const auto target = final_permissions_.value_or(original_);
    if (!final_permissions_ && !was_read_only_) {
        return Ok();
    }

    std::error_code ec;
    fs::permissions(path_, target & kPermissionMask, fs::perm_options::replace, ec);
    if (ec) {
        return Err<void>(io_error("Failed to set permissions on " + path_.string(), ec));
    }
    return Ok();
}

Result<void> PosixMetadataApplier::apply(const FileEntry& source,
                                         const fs::path& source_path,
                                         const fs::path& destination_path,
                                         const CopyFlags& flags) const {
    ReadOnlyGuard guard(destination_path);
    if (guard.error()) {
        return Err<void>(*guard.error());
    }

    if (flags.timestamps) {
        std::error_code ec;
        fs::last_write_time(destination_path, source.modified, ec);
        if (ec) {
            return Err<void>(io_error("Failed to set timestamps on " + destination_path.string(), ec));
        }
    }

    if (flags.owner) {
        struct stat info {};
        if (::lstat(source_path.c_str(), &info) != 0) {
            return Err<void>(io_error("Failed to stat " + source_path.string(),
                                      std::error_code(errno, std::generic_category())));
        }
        if (::lchown(destination_path.c_str(), info.st_uid, info.st_gid) != 0) {
            const int err = errno;
            if (err != EPERM) {
                return Err<void>(io_error("Failed to set owner on " + destination_path.string(),
                                          std::error_code(err, std::generic_category())));
            }
            spdlog::warn("Owner not preserved on {} (insufficient privilege)", destination_path.string());
        }
    }

    if (flags.security) {
        guard.restore_to(source.permissions & kPermissionMask);
    } else if (flags.attributes) {
        std::error_code ec;
        auto current = fs::status(destination_path, ec).permissions() & kPermissionMask;
        if (ec) {
            return Err<void>(io_error("Failed to stat " + destination_path.string(), ec));
        }
        if (is_read_only(source.permissions)) {
            current &= ~fs::perms::owner_write;
        } else {
            current |= fs::perms::owner_write;
        }
        guard.restore_to(current);
    }

    if (flags.auditing && !auditing_warned_.exchange(true)) {
        spdlog::warn("Auditing information (U) cannot be preserved on this platform");
    }

    return guard.restore();
}

} // namespace psync::sync
