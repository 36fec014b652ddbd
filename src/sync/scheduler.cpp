#include "psync/sync/scheduler.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <exception>
#include <filesystem>
#include <map>
#include <thread>
#include <unordered_set>

namespace fs = std::filesystem;

namespace psync::sync {
namespace {

/// True when some proper ancestor directory of @p path is in @p deleted
bool has_deleted_ancestor(const std::string& path, const std::unordered_set<std::string>& deleted) {
    for (auto slash = path.find('/'); slash != std::string::npos; slash = path.find('/', slash + 1)) {
        if (deleted.count(path.substr(0, slash)) != 0) {
            return true;
        }
    }
    return false;
}

std::size_t depth_of(const std::string& path) {
    return static_cast<std::size_t>(std::count(path.begin(), path.end(), '/'));
}

} // namespace

std::string canonical_path(const std::string& path) {
    auto normal = fs::path(path).lexically_normal().generic_string();
    while (normal.size() > 1 && normal.back() == '/') {
        normal.pop_back();
    }
    if (normal.rfind("./", 0) == 0) {
        normal.erase(0, 2);
    }
    return normal;
}

std::vector<DeletePath> deduplicate_deletes(const std::vector<DeletePath>& deletes) {
    std::vector<std::string> paths;
    paths.reserve(deletes.size());
    for (const auto& task : deletes) {
        paths.push_back(canonical_path(task.path));
    }
    std::sort(paths.begin(), paths.end());
    paths.erase(std::unique(paths.begin(), paths.end()), paths.end());

    // An ancestor sorts before its descendants, so it is already recorded
    std::vector<DeletePath> result;
    std::unordered_set<std::string> kept;
    for (auto& path : paths) {
        if (has_deleted_ancestor(path, kept)) {
            continue;
        }
        kept.insert(path);
        result.push_back(DeletePath{std::move(path)});
    }
    return result;
}

std::vector<std::vector<CreateDir>> group_by_depth(const std::vector<CreateDir>& dirs) {
    std::map<std::size_t, std::vector<std::string>> levels;
    for (const auto& dir : dirs) {
        auto path = canonical_path(dir.path);
        levels[depth_of(path)].push_back(std::move(path));
    }

    std::vector<std::vector<CreateDir>> result;
    for (auto& [depth, paths] : levels) {
        std::sort(paths.begin(), paths.end());
        paths.erase(std::unique(paths.begin(), paths.end()), paths.end());

        std::vector<CreateDir> level;
        level.reserve(paths.size());
        for (auto& path : paths) {
            level.push_back(CreateDir{std::move(path)});
        }
        result.push_back(std::move(level));
    }
    return result;
}

std::vector<WorkUnit> make_work_units(std::vector<SyncTask> tasks, const BatchingPolicy& policy) {
    std::vector<WorkUnit> units;
    WorkUnit batch;
    batch.buffer_size = policy.default_buffer_size;
    const std::size_t batch_size = std::max<std::size_t>(policy.batch_size, 1);

    for (auto& task : tasks) {
        const auto size = payload_size(task);

        if (size < policy.small_file_threshold) {
            batch.tasks.push_back(std::move(task));
            if (batch.tasks.size() == batch_size) {
                units.push_back(std::move(batch));
                batch = WorkUnit{};
                batch.buffer_size = policy.default_buffer_size;
            }
            continue;
        }

        WorkUnit single;
        single.buffer_size = size > policy.large_file_threshold ? policy.large_buffer_size
                                                               : policy.default_buffer_size;
        single.tasks.push_back(std::move(task));
        units.push_back(std::move(single));
    }

    if (!batch.tasks.empty()) {
        units.push_back(std::move(batch));
    }
    return units;
}

void PathLocks::acquire(const std::string& path) {
    std::unique_lock lock(mutex_);
    released_.wait(lock, [&]() { return in_flight_.count(path) == 0; });
    in_flight_.insert(path);
}

void PathLocks::release(const std::string& path) {
    {
        std::unique_lock lock(mutex_);
        in_flight_.erase(path);
    }
    released_.notify_all();
}

TransferScheduler::TransferScheduler(SchedulerSettings settings,
                                     const TaskExecutor& executor,
                                     const RetryController& retry,
                                     SyncStats& stats,
                                     events::ProgressReporter& reporter)
    : settings_(settings), executor_(executor), retry_(retry), stats_(stats), reporter_(reporter) {
    settings_.workers = std::max<std::size_t>(settings_.workers, 1);
    settings_.queue_capacity = std::max<std::size_t>(settings_.queue_capacity, 1);
}

void TransferScheduler::run(std::vector<SyncTask> tasks) {
    std::vector<DeletePath> deletes;
    std::vector<CreateDir> dirs;
    std::vector<SyncTask> transfers;

    for (auto& task : tasks) {
        if (auto* del = std::get_if<DeletePath>(&task)) {
            deletes.push_back(std::move(*del));
        } else if (auto* dir = std::get_if<CreateDir>(&task)) {
            dirs.push_back(std::move(*dir));
        } else {
            transfers.push_back(std::move(task));
        }
    }

    const auto unique_deletes = deduplicate_deletes(deletes);
    if (unique_deletes.size() != deletes.size()) {
        spdlog::debug("Collapsed {} delete(s) into {}", deletes.size(), unique_deletes.size());
    }

    std::vector<std::vector<WorkUnit>> phases;

    std::vector<WorkUnit> delete_units;
    for (const auto& del : unique_deletes) {
        delete_units.push_back(WorkUnit{{del}, settings_.batching.default_buffer_size});
    }
    phases.push_back(std::move(delete_units));

    for (auto& level : group_by_depth(dirs)) {
        std::vector<SyncTask> level_tasks(level.begin(), level.end());
        phases.push_back(make_work_units(std::move(level_tasks), settings_.batching));
    }

    phases.push_back(make_work_units(std::move(transfers), settings_.batching));

    // Collapsed deletes and repeated directories are not tasks of their own
    std::size_t widest = 0;
    std::uint64_t dispatched = 0;
    for (const auto& phase : phases) {
        widest = std::max(widest, phase.size());
        for (const auto& unit : phase) {
            dispatched += unit.tasks.size();
        }
    }
    stats_.add_total(dispatched);
    if (widest == 0) {
        return;
    }

    BoundedQueue<WorkUnit> queue(settings_.queue_capacity);
    const auto worker_count = std::min(settings_.workers, widest);

    std::vector<std::thread> workers;
    workers.reserve(worker_count);
    for (std::size_t i = 0; i < worker_count; ++i) {
        workers.emplace_back([this, &queue]() { worker_loop(queue); });
    }

    for (auto& phase : phases) {
        dispatch_phase(queue, std::move(phase));
    }

    queue.close();
    for (auto& worker : workers) {
        worker.join();
    }
}

void TransferScheduler::dispatch_phase(BoundedQueue<WorkUnit>& queue, std::vector<WorkUnit> units) {
    if (units.empty()) {
        return;
    }

    {
        std::unique_lock lock(idle_mutex_);
        outstanding_ += units.size();
    }
    for (auto& unit : units) {
        queue.push(std::move(unit));
    }

    std::unique_lock lock(idle_mutex_);
    idle_.wait(lock, [this]() { return outstanding_ == 0; });
}

void TransferScheduler::worker_loop(BoundedQueue<WorkUnit>& queue) {
    while (auto unit = queue.pop()) {
        execute_unit(*unit);
        {
            std::unique_lock lock(idle_mutex_);
            --outstanding_;
        }
        idle_.notify_all();
    }
}

void TransferScheduler::execute_unit(const WorkUnit& unit) {
    for (const auto& task : unit.tasks) {
        execute_task(task, unit.buffer_size);
    }
}

void TransferScheduler::execute_task(const SyncTask& task, std::size_t buffer_size) {
    const auto& path = target_path(task);
    const auto kind = kind_of(task);
    const auto bytes = payload_size(task);

    PathLocks::Lease lease(locks_, canonical_path(path));
    const auto started = std::chrono::steady_clock::now();

    auto result = retry_.run(
        [&](std::uint32_t attempt) -> Result<TaskOutcome> {
            reporter_.task_started(events::TaskStartedEvent{path, kind, bytes, attempt});
            try {
                return executor_.execute(task, buffer_size);
            } catch (const std::exception& ex) {
                return Err<TaskOutcome>(ErrorKind::PermanentIO, std::string("Unexpected failure: ") + ex.what());
            }
        },
        [&](const Error& error, std::uint32_t attempt, bool will_retry) {
            if (will_retry) {
                stats_.record_retry();
            }
            events::TaskFailedEvent event;
            event.path = path;
            event.kind = kind;
            event.message = error.describe();
            event.error_kind = error.kind;
            event.attempt = attempt;
            event.will_retry = will_retry;
            reporter_.task_failed(event);
        });

    if (!result.succeeded()) {
        stats_.record_failure();
        return;
    }

    stats_.record(result.outcome);
    events::TaskCompletedEvent done;
    done.path = path;
    done.outcome = result.outcome;
    done.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    reporter_.task_completed(done);
}

} // namespace psync::sync
