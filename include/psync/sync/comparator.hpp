#pragma once

#include "psync/core/config.hpp"
#include "psync/sync/types.hpp"

#include <cstdint>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace psync::sync {

/**
 * @brief Destination scan keyed by relative path
 *
 * Built once before comparison so each lookup is O(1).
 */
class DestinationIndex {
public:
    void add(FileEntry entry);

    [[nodiscard]] const FileEntry* find(const std::string& path) const;
    [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }

    [[nodiscard]] const std::unordered_map<std::string, FileEntry>& entries() const noexcept {
        return entries_;
    }

private:
    std::unordered_map<std::string, FileEntry> entries_;
};

enum class Action {
    Skip,
    CopyWhole,
    DeltaCopy,
    Delete,
    CreateDir,
    Symlink
};

const char* to_string(Action action) noexcept;

struct Decision {
    Action action = Action::Skip;
    bool replace_existing = false;   ///< destination holds another kind of entry and must go first
};

struct ComparatorSettings {
    CompareMode mode = CompareMode::SizeAndTime;
    bool purge = false;
    std::uint64_t delta_threshold = 1024;
    std::uint64_t delta_max_size = 10 * 1024 * 1024;   ///< larger files are streamed whole

    static ComparatorSettings from_options(const SyncOptions& options);
};

/**
 * @brief Tasks produced by one comparison pass
 */
struct SyncPlan {
    std::vector<SyncTask> tasks;
    std::uint64_t skipped = 0;
    std::uint64_t total_bytes = 0;

    [[nodiscard]] std::size_t count(TaskKind kind) const;
    [[nodiscard]] bool empty() const noexcept { return tasks.empty(); }
};

/**
 * @brief Decides per path what the destination needs
 *
 * Source entries are fed one at a time while the source scan is still
 * running; finish() then adds deletes for destination entries that never
 * matched (purge only) and hands over the plan.
 */
class Comparator {
public:
    Comparator(ComparatorSettings settings, DestinationIndex destination);

    /// Pure decision for one path; either side may be null but not both
    [[nodiscard]] Decision decide(const FileEntry* source, const FileEntry* destination) const;

    void add_source(const FileEntry& source);

    SyncPlan finish();

    [[nodiscard]] const ComparatorSettings& settings() const noexcept { return settings_; }

private:
    [[nodiscard]] bool content_equal(const FileEntry& source, const FileEntry& destination) const;
    void push(SyncTask task);

    ComparatorSettings settings_;
    DestinationIndex destination_;
    std::unordered_set<std::string> matched_;
    SyncPlan plan_;
};

} // namespace psync::sync
