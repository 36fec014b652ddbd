#pragma once

#include "psync/core/config.hpp"
#include "psync/core/result.hpp"
#include "psync/events/progress.hpp"
#include "psync/sync/compression.hpp"
#include "psync/sync/delta.hpp"
#include "psync/sync/hash.hpp"
#include "psync/sync/metadata.hpp"
#include "psync/sync/types.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>

namespace psync::sync {

struct ExecutorSettings {
    std::filesystem::path source_root;
    std::filesystem::path destination_root;
    CopyFlags copy_flags;
    bool move_files = false;
    std::size_t block_size = 1024;
    std::uint64_t delta_max_size = 10 * 1024 * 1024;   ///< delta plans are built in memory up to this size

    static ExecutorSettings from_options(const SyncOptions& options);
};

/**
 * @brief Carries out one SyncTask against the filesystem
 *
 * File data is written to a staging file next to the target and renamed
 * into place, so a failed attempt never leaves a half-written file under
 * the real name. Safe to call from many workers at once as long as no two
 * calls target the same path.
 */
class TaskExecutor {
public:
    TaskExecutor(ExecutorSettings settings,
                 const HashProvider& hashes,
                 const MetadataApplier& metadata,
                 const CompressionProvider* compression,
                 events::ProgressReporter& reporter);

    Result<TaskOutcome> execute(const SyncTask& task, std::size_t buffer_size) const;

    [[nodiscard]] const ExecutorSettings& settings() const noexcept { return settings_; }

    static std::filesystem::path staging_path_for(const std::filesystem::path& target);

private:
    Result<TaskOutcome> copy_whole(const FileEntry& entry, std::size_t buffer_size) const;
    Result<TaskOutcome> delta_copy(const DeltaCopy& task, std::size_t buffer_size) const;
    Result<TaskOutcome> remove_path(const DeletePath& task) const;
    Result<TaskOutcome> create_dir(const CreateDir& task) const;
    Result<TaskOutcome> create_symlink(const CreateSymlink& task) const;

    Result<std::uint64_t> stream_copy(const std::filesystem::path& from,
                                      const std::filesystem::path& to,
                                      const FileEntry& entry,
                                      std::size_t buffer_size) const;

    /// Rename staging file into place, apply metadata, remove source in move mode
    Result<void> commit(const FileEntry& entry,
                        const std::filesystem::path& staging,
                        const std::filesystem::path& target) const;

    std::filesystem::path source_of(const std::string& relative) const;
    std::filesystem::path destination_of(const std::string& relative) const;

    ExecutorSettings settings_;
    const HashProvider& hashes_;
    const MetadataApplier& metadata_;
    const CompressionProvider* compression_;
    events::ProgressReporter& reporter_;
    DeltaEngine delta_;
};

} // namespace psync::sync
