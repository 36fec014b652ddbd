#pragma once

#include "psync/core/platform.hpp"
#include "psync/core/result.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace psync {

/**
 * @brief Which parts of a file are carried to the destination
 *
 * Letters follow the robocopy convention: D=Data, A=Attributes,
 * T=Timestamps, S=Security (permission bits), O=Owner, U=aUditing.
 * Archive mode selects all of them.
 */
struct CopyFlags {
    bool data = true;
    bool attributes = true;
    bool timestamps = true;
    bool security = false;
    bool owner = false;
    bool auditing = false;

    /// Case-insensitive; unknown letters are ignored
    static CopyFlags parse(std::string_view flags);
    static CopyFlags all() { return parse("DATSOU"); }

    [[nodiscard]] std::string to_string() const;

    bool operator==(const CopyFlags& other) const;
};

enum class CompareMode {
    SizeAndTime,
    Checksum
};

struct BatchingPolicy {
    std::uint64_t small_file_threshold = 1024 * 1024;        ///< below this a file joins a batch
    std::size_t batch_size = 100;                            ///< tasks per batch
    std::uint64_t large_file_threshold = 10 * 1024 * 1024;   ///< above this a file streams alone
    std::size_t large_buffer_size = 4 * 1024 * 1024;
    std::size_t default_buffer_size = 256 * 1024;
};

struct CompressionSettings {
    bool enabled = false;
    int level = 3;
    double max_ratio = 0.9;         ///< keep compressed literal only below this fraction
    std::size_t min_literal = 64;   ///< shorter literals are never compressed
};

struct SyncOptions {
    std::filesystem::path source;
    std::filesystem::path destination;

    bool purge = false;
    bool mirror = false;
    bool dry_run = false;
    bool confirm = false;
    bool move_files = false;
    CompareMode compare_mode = CompareMode::SizeAndTime;

    std::vector<std::string> exclude_files;
    std::vector<std::string> exclude_dirs;
    std::optional<std::uint64_t> min_size;
    std::optional<std::uint64_t> max_size;

    CopyFlags copy_flags;

    std::uint32_t retry_count = 0;
    std::chrono::milliseconds retry_wait{std::chrono::seconds(30)};

    std::size_t block_size = 1024;
    std::uint64_t delta_threshold = 1024;   ///< destination must be larger than this for delta

    std::size_t workers = 0;          ///< 0 picks the hardware thread count
    std::size_t queue_capacity = 0;   ///< 0 picks twice the worker count

    BatchingPolicy batching;
    CompressionSettings compression;

    int verbosity = 0;
    bool quiet = false;
    std::optional<std::filesystem::path> log_file;
    std::optional<std::filesystem::path> summary_json;

    [[nodiscard]] bool purge_enabled() const noexcept { return purge || mirror; }
};

/**
 * @brief Number of workers the run will use
 *
 * An explicit worker count is returned unchanged (validate_options rejects
 * it above the cap). The hardware-thread default is clamped to @p cap when
 * one is given.
 */
std::size_t resolve_worker_count(const SyncOptions& options, const PlatformInfo& platform, std::size_t cap = 0);

/**
 * @brief Reject option combinations that cannot run
 *
 * Every failure carries ErrorKind::ConfigurationError. Runs before any
 * scanning so a rejected run touches nothing.
 */
Result<void> validate_options(const SyncOptions& options,
                              const PlatformInfo& platform,
                              const WorkerCapPolicy& worker_cap);

/// Overlay keys from a JSON document onto @p options (unknown keys ignored)
Result<void> merge_options_json(std::string_view json_text, SyncOptions& options);

Result<void> load_options_file(const std::filesystem::path& path, SyncOptions& options);

/// Pretty-printed JSON of the effective options, for --verbose and logs
std::string options_to_json(const SyncOptions& options);

} // namespace psync
