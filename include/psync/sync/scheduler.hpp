#pragma once

#include "psync/core/bounded_queue.hpp"
#include "psync/core/config.hpp"
#include "psync/events/progress.hpp"
#include "psync/sync/executor.hpp"
#include "psync/sync/retry.hpp"
#include "psync/sync/stats.hpp"
#include "psync/sync/types.hpp"

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <string>
#include <unordered_set>
#include <vector>

namespace psync::sync {

/**
 * @brief What one worker dispatch executes
 *
 * Either a batch of small tasks or a single task, with the I/O buffer
 * size to stream with.
 */
struct WorkUnit {
    std::vector<SyncTask> tasks;
    std::size_t buffer_size = 0;
};

/// Normalized form used to compare destination paths
std::string canonical_path(const std::string& path);

/**
 * @brief Delete set with duplicates and descendants of deleted directories removed
 *
 * A path listed twice, or lying under another listed path, is deleted once
 * by the remaining entry. Result is sorted.
 */
std::vector<DeletePath> deduplicate_deletes(const std::vector<DeletePath>& deletes);

/// CreateDir tasks grouped by depth, shallowest first, duplicates dropped
std::vector<std::vector<CreateDir>> group_by_depth(const std::vector<CreateDir>& dirs);

/// Apply the batching policy to file and symlink tasks
std::vector<WorkUnit> make_work_units(std::vector<SyncTask> tasks, const BatchingPolicy& policy);

/**
 * @brief Serializes tasks that target the same destination path
 */
class PathLocks {
public:
    void acquire(const std::string& path);
    void release(const std::string& path);

    class Lease {
    public:
        Lease(PathLocks& locks, std::string path) : locks_(locks), path_(std::move(path)) {
            locks_.acquire(path_);
        }
        ~Lease() { locks_.release(path_); }

        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;

    private:
        PathLocks& locks_;
        std::string path_;
    };

private:
    std::mutex mutex_;
    std::condition_variable released_;
    std::unordered_set<std::string> in_flight_;
};

struct SchedulerSettings {
    std::size_t workers = 1;
    std::size_t queue_capacity = 2;
    BatchingPolicy batching;
};

/**
 * @brief Fixed worker pool that executes a task list in safe order
 *
 * Tasks run in three phases, each finishing before the next starts:
 * deduplicated deletes, directory creation level by level, then files and
 * symlinks (batched). Within a phase work units go through a bounded queue,
 * so dispatch blocks while the pool is saturated. Every task is executed
 * through the RetryController; failures are counted and never stop sibling
 * tasks.
 */
class TransferScheduler {
public:
    TransferScheduler(SchedulerSettings settings,
                      const TaskExecutor& executor,
                      const RetryController& retry,
                      SyncStats& stats,
                      events::ProgressReporter& reporter);

    /// Blocks until every task has succeeded or failed. Adds the number of
    /// tasks actually dispatched (after delete and directory dedup) to the total.
    void run(std::vector<SyncTask> tasks);

private:
    /// Feed one phase to the pool and wait until all of it has run
    void dispatch_phase(BoundedQueue<WorkUnit>& queue, std::vector<WorkUnit> units);
    void worker_loop(BoundedQueue<WorkUnit>& queue);
    void execute_unit(const WorkUnit& unit);
    void execute_task(const SyncTask& task, std::size_t buffer_size);

    SchedulerSettings settings_;
    const TaskExecutor& executor_;
    const RetryController& retry_;
    SyncStats& stats_;
    events::ProgressReporter& reporter_;
    PathLocks locks_;

    std::mutex idle_mutex_;
    std::condition_variable idle_;
    std::size_t outstanding_ = 0;
};

} // namespace psync::sync
