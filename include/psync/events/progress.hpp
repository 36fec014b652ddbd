#pragma once

#include "psync/core/bounded_queue.hpp"
#include "psync/events/event_bus.hpp"
#include "psync/events/events.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <thread>
#include <variant>

namespace psync::events {

/**
 * @brief Receiver of task lifecycle events
 *
 * Implementations must return quickly: they are called from worker
 * threads in the middle of a transfer.
 */
class ProgressReporter {
public:
    virtual ~ProgressReporter() = default;

    virtual void task_started(const TaskStartedEvent& event) = 0;
    virtual void task_progress(const TaskProgressEvent& event) = 0;
    virtual void task_completed(const TaskCompletedEvent& event) = 0;
    virtual void task_failed(const TaskFailedEvent& event) = 0;

    virtual void run_started(const RunStartedEvent&) {}
    virtual void run_completed(const RunCompletedEvent&) {}
};

class NullProgressReporter final : public ProgressReporter {
public:
    void task_started(const TaskStartedEvent&) override {}
    void task_progress(const TaskProgressEvent&) override {}
    void task_completed(const TaskCompletedEvent&) override {}
    void task_failed(const TaskFailedEvent&) override {}
};

/**
 * @brief Reporter that hands events to a background thread
 *
 * Workers enqueue with try_push and never wait: when the channel is full
 * the event is counted in dropped() and discarded. Run-level events come
 * from the coordinating thread and are always delivered. The drain thread
 * re-emits every event on the EventBus, where components subscribe.
 */
class AsyncProgressReporter final : public ProgressReporter {
public:
    explicit AsyncProgressReporter(EventBus& bus, std::size_t capacity = 4096);
    ~AsyncProgressReporter() override;

    AsyncProgressReporter(const AsyncProgressReporter&) = delete;
    AsyncProgressReporter& operator=(const AsyncProgressReporter&) = delete;

    void task_started(const TaskStartedEvent& event) override;
    void task_progress(const TaskProgressEvent& event) override;
    void task_completed(const TaskCompletedEvent& event) override;
    void task_failed(const TaskFailedEvent& event) override;
    void run_started(const RunStartedEvent& event) override;
    void run_completed(const RunCompletedEvent& event) override;

    /// Block until every accepted event has been emitted
    void flush();

    [[nodiscard]] std::uint64_t dropped() const noexcept { return dropped_.load(); }

private:
    using Message = std::variant<TaskStartedEvent, TaskProgressEvent, TaskCompletedEvent,
                                 TaskFailedEvent, RunStartedEvent, RunCompletedEvent>;

    void offer(Message message);
    void deliver(Message message);
    void drain();

    EventBus& bus_;
    BoundedQueue<Message> queue_;
    std::atomic<std::uint64_t> dropped_{0};

    std::mutex pending_mutex_;
    std::condition_variable drained_;
    std::int64_t pending_ = 0;

    std::thread worker_;
};

} // namespace psync::events
