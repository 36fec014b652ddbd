/**
 * @file events.hpp
 * @brief Progress events published while a run executes
 *
 * WHY THIS FILE EXISTS:
 * Workers announce what they are doing without knowing who listens.
 * The console tally, the log sink and tests all consume the same events.
 *
 * NAMING CONVENTION:
 * - Events are past-tense or progressive: TaskStartedEvent, TaskFailedEvent
 */

#pragma once

#include "psync/core/error.hpp"
#include "psync/sync/types.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace psync::events {

// ════════════════════════════════════════════════════════
// Task Events
// ════════════════════════════════════════════════════════

/**
 * @brief A worker began an attempt at a task
 *
 * WHO EMITS: TransferScheduler worker, once per attempt
 * WHO SUBSCRIBES: Logger (debug), progress tally
 */
struct TaskStartedEvent {
    std::string path;
    sync::TaskKind kind = sync::TaskKind::CopyWhole;
    std::uint64_t total_bytes = 0;
    std::uint32_t attempt = 1;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief Bytes moved so far for one streaming copy
 *
 * Emitted per buffer for large files; dropped first when the channel is full.
 */
struct TaskProgressEvent {
    std::string path;
    std::uint64_t bytes_done = 0;
    std::uint64_t total_bytes = 0;
};

struct TaskCompletedEvent {
    std::string path;
    sync::TaskOutcome outcome;
    std::chrono::milliseconds duration{0};
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief An attempt failed
 *
 * will_retry distinguishes an intermediate transient failure from the
 * final one recorded in SyncStats.errors.
 */
struct TaskFailedEvent {
    std::string path;
    sync::TaskKind kind = sync::TaskKind::CopyWhole;
    std::string message;
    ErrorKind error_kind = ErrorKind::PermanentIO;
    std::uint32_t attempt = 1;
    bool will_retry = false;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

// ════════════════════════════════════════════════════════
// Run Events
// ════════════════════════════════════════════════════════

struct RunStartedEvent {
    std::uint64_t total_tasks = 0;
    std::uint64_t total_bytes = 0;
    bool dry_run = false;
};

struct RunCompletedEvent {
    sync::RunSummary summary;
};

} // namespace psync::events
