/**
 * @file components.hpp
 * @brief Subscribers that turn progress events into output
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * ProgressTallyComponent tally(bus);
 * AsyncProgressReporter reporter(bus);
 * // hand &reporter to the scheduler; both components react to every event
 */

#pragma once

#include "psync/events/event_bus.hpp"
#include "psync/events/events.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdint>

namespace psync::events {

/**
 * @brief Log sink for task events
 *
 * Starts and per-buffer progress go to debug/trace, completions to info,
 * intermediate failures to warn and final failures to error.
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus) {
        bus.subscribe<TaskStartedEvent>([](const TaskStartedEvent& e) {
            spdlog::debug("[Start] {} {} bytes={} attempt={}",
                          sync::to_string(e.kind), e.path, e.total_bytes, e.attempt);
        });

        bus.subscribe<TaskProgressEvent>([](const TaskProgressEvent& e) {
            spdlog::trace("[Progress] {} {}/{}", e.path, e.bytes_done, e.total_bytes);
        });

        bus.subscribe<TaskCompletedEvent>([](const TaskCompletedEvent& e) {
            if (e.outcome.used_delta) {
                spdlog::info("[Done] {} {} sent={} matched={} literal={} duration={}ms",
                             sync::to_string(e.outcome.kind), e.path, e.outcome.bytes_transferred,
                             e.outcome.matched_bytes, e.outcome.literal_bytes, e.duration.count());
                return;
            }
            spdlog::info("[Done] {} {} bytes={} duration={}ms",
                         sync::to_string(e.outcome.kind), e.path, e.outcome.bytes_transferred,
                         e.duration.count());
        });

        bus.subscribe<TaskFailedEvent>([](const TaskFailedEvent& e) {
            if (e.will_retry) {
                spdlog::warn("[Retry] {} {} attempt {} failed ({}): {}",
                             sync::to_string(e.kind), e.path, e.attempt, to_string(e.error_kind), e.message);
                return;
            }
            spdlog::error("[Failed] {} {} after {} attempt(s) ({}): {}",
                          sync::to_string(e.kind), e.path, e.attempt, to_string(e.error_kind), e.message);
        });

        bus.subscribe<RunStartedEvent>([](const RunStartedEvent& e) {
            spdlog::info("{} {} task(s), {} byte(s)",
                         e.dry_run ? "Planned" : "Dispatching", e.total_tasks, e.total_bytes);
        });
    }
};

/**
 * @brief Running totals with a periodic progress line
 *
 * Logs once per crossed 10% step of the task count announced by
 * RunStartedEvent.
 */
class ProgressTallyComponent {
public:
    struct Tally {
        std::atomic<std::uint64_t> total_tasks{0};
        std::atomic<std::uint64_t> completed{0};
        std::atomic<std::uint64_t> failed{0};
        std::atomic<std::uint64_t> retried{0};
        std::atomic<std::uint64_t> bytes{0};
    };

    explicit ProgressTallyComponent(EventBus& bus) {
        bus.subscribe<RunStartedEvent>([this](const RunStartedEvent& e) {
            tally_.total_tasks = e.total_tasks;
            last_decile_ = 0;
        });

        bus.subscribe<TaskCompletedEvent>([this](const TaskCompletedEvent& e) {
            tally_.completed++;
            tally_.bytes += e.outcome.bytes_transferred;
            report();
        });

        bus.subscribe<TaskFailedEvent>([this](const TaskFailedEvent& e) {
            if (e.will_retry) {
                tally_.retried++;
                return;
            }
            tally_.failed++;
            report();
        });
    }

    const Tally& tally() const { return tally_; }

private:
    void report() {
        const auto total = tally_.total_tasks.load();
        if (total == 0) {
            return;
        }
        const auto done = tally_.completed.load() + tally_.failed.load();
        const auto decile = done * 10 / total;
        if (decile <= last_decile_) {
            return;
        }
        last_decile_ = decile;
        spdlog::info("Progress: {}/{} task(s) ({}%), {} byte(s), {} failed",
                     done, total, decile * 10, tally_.bytes.load(), tally_.failed.load());
    }

    Tally tally_;
    std::uint64_t last_decile_ = 0;   // touched only on the bus drain thread
};

} // namespace psync::events
