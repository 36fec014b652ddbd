#pragma once

#include "psync/sync/types.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>

namespace psync::sync {

/**
 * @brief Run-wide counters shared by every worker
 *
 * Created at run start and passed to the scheduler by reference. Each
 * counter is an independent relaxed atomic on its own cache line, so
 * workers never contend on a common lock and no increment is lost.
 */
class SyncStats {
public:
    SyncStats() = default;
    SyncStats(const SyncStats&) = delete;
    SyncStats& operator=(const SyncStats&) = delete;

    /// Fold in one successful task
    void record(const TaskOutcome& outcome);

    void record_failure() { bump(errors_); }
    void record_retry() { bump(retries_); }
    void record_skipped(std::uint64_t count) { bump(skipped_, count); }
    void add_total(std::uint64_t count) { bump(total_tasks_, count); }

    [[nodiscard]] std::uint64_t files_copied() const noexcept { return read(files_copied_); }
    [[nodiscard]] std::uint64_t bytes_transferred() const noexcept { return read(bytes_transferred_); }
    [[nodiscard]] std::uint64_t files_deleted() const noexcept { return read(files_deleted_); }
    [[nodiscard]] std::uint64_t dirs_created() const noexcept { return read(dirs_created_); }
    [[nodiscard]] std::uint64_t errors() const noexcept { return read(errors_); }
    [[nodiscard]] std::uint64_t succeeded() const noexcept { return read(succeeded_); }
    [[nodiscard]] std::uint64_t retries() const noexcept { return read(retries_); }

    /// Consistent once all workers have joined
    [[nodiscard]] RunSummary snapshot() const;

private:
    struct alignas(64) Counter {
        std::atomic<std::uint64_t> value{0};
    };

    static void bump(Counter& counter, std::uint64_t by = 1) {
        counter.value.fetch_add(by, std::memory_order_relaxed);
    }

    static std::uint64_t read(const Counter& counter) {
        return counter.value.load(std::memory_order_relaxed);
    }

    Counter total_tasks_;
    Counter succeeded_;
    Counter errors_;
    Counter skipped_;
    Counter files_copied_;
    Counter delta_files_;
    Counter bytes_transferred_;
    Counter files_deleted_;
    Counter dirs_created_;
    Counter symlinks_created_;
    Counter retries_;
    Counter delta_fallbacks_;
};

} // namespace psync::sync
