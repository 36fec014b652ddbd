#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <variant>

namespace psync::sync {

enum class EntryKind {
    File,
    Directory,
    Symlink
};

/**
 * @brief One scanned filesystem entry, relative to its scan root
 *
 * Produced once per path per scan and never modified afterwards.
 */
struct FileEntry {
    std::string path;                        ///< Relative to scan root (POSIX style)
    EntryKind kind = EntryKind::File;
    std::uint64_t size = 0;
    std::filesystem::file_time_type modified{};
    std::filesystem::perms permissions = std::filesystem::perms::unknown;
    std::string symlink_target;              ///< Only for EntryKind::Symlink
    std::optional<std::string> checksum;     ///< Strong digest, filled in checksum mode

    [[nodiscard]] bool is_file() const noexcept { return kind == EntryKind::File; }
    [[nodiscard]] bool is_directory() const noexcept { return kind == EntryKind::Directory; }
    [[nodiscard]] bool is_symlink() const noexcept { return kind == EntryKind::Symlink; }
};

struct CopyWhole {
    FileEntry entry;
};

struct DeltaCopy {
    FileEntry entry;
    std::string base_path;   ///< Destination-relative path of the file to diff against
};

struct DeletePath {
    std::string path;
};

struct CreateDir {
    std::string path;
};

struct CreateSymlink {
    std::string path;
    std::string target;
};

/// One unit of work decided by the comparator and consumed once by the scheduler
using SyncTask = std::variant<CopyWhole, DeltaCopy, DeletePath, CreateDir, CreateSymlink>;

enum class TaskKind {
    CopyWhole,
    DeltaCopy,
    Delete,
    CreateDir,
    Symlink
};

TaskKind kind_of(const SyncTask& task) noexcept;

/// Destination-relative path the task writes or removes
const std::string& target_path(const SyncTask& task) noexcept;

/// Source bytes the task moves (0 for non-file tasks)
std::uint64_t payload_size(const SyncTask& task) noexcept;

const char* to_string(TaskKind kind) noexcept;

/**
 * @brief What a successfully executed task contributed
 */
struct TaskOutcome {
    TaskKind kind = TaskKind::CopyWhole;
    std::uint64_t bytes_transferred = 0;
    std::uint64_t entries_deleted = 0;
    std::uint64_t matched_bytes = 0;   ///< Reused from the base file (delta only)
    std::uint64_t literal_bytes = 0;   ///< Raw literal bytes before compression (delta only)
    bool used_delta = false;
    bool fell_back = false;            ///< Delta plan rejected, whole file copied instead
};

/**
 * @brief Totals reported at the end of a run
 */
struct RunSummary {
    std::uint64_t total_tasks = 0;
    std::uint64_t succeeded = 0;
    std::uint64_t failed = 0;
    std::uint64_t skipped = 0;
    std::uint64_t files_copied = 0;
    std::uint64_t delta_files = 0;
    std::uint64_t bytes_transferred = 0;
    std::uint64_t files_deleted = 0;
    std::uint64_t dirs_created = 0;
    std::uint64_t symlinks_created = 0;
    std::uint64_t retries = 0;
    std::uint64_t delta_fallbacks = 0;
    bool dry_run = false;
    std::chrono::milliseconds duration{0};

    [[nodiscard]] bool any_failures() const noexcept { return failed > 0; }
};

/// Summary as a JSON document (for --summary-json)
std::string summary_to_json(const RunSummary& summary);

} // namespace psync::sync
