#include "psync/events/progress.hpp"

namespace psync::events {

AsyncProgressReporter::AsyncProgressReporter(EventBus& bus, std::size_t capacity)
    : bus_(bus), queue_(capacity) {
    worker_ = std::thread([this] { drain(); });
}

AsyncProgressReporter::~AsyncProgressReporter() {
    flush();
    queue_.close();
    if (worker_.joinable()) {
        worker_.join();
    }
}

void AsyncProgressReporter::task_started(const TaskStartedEvent& event) { offer(event); }
void AsyncProgressReporter::task_progress(const TaskProgressEvent& event) { offer(event); }
void AsyncProgressReporter::task_completed(const TaskCompletedEvent& event) { offer(event); }
void AsyncProgressReporter::task_failed(const TaskFailedEvent& event) { offer(event); }
void AsyncProgressReporter::run_started(const RunStartedEvent& event) { deliver(event); }
void AsyncProgressReporter::run_completed(const RunCompletedEvent& event) { deliver(event); }

void AsyncProgressReporter::offer(Message message) {
    {
        std::lock_guard lock(pending_mutex_);
        ++pending_;
    }
    if (!queue_.try_push(std::move(message))) {
        dropped_.fetch_add(1, std::memory_order_relaxed);
        std::lock_guard lock(pending_mutex_);
        --pending_;
        drained_.notify_all();
    }
}

void AsyncProgressReporter::deliver(Message message) {
    {
        std::lock_guard lock(pending_mutex_);
        ++pending_;
    }
    if (!queue_.push(std::move(message))) {
        std::lock_guard lock(pending_mutex_);
        --pending_;
        drained_.notify_all();
    }
}

void AsyncProgressReporter::flush() {
    std::unique_lock lock(pending_mutex_);
    drained_.wait(lock, [this] { return pending_ <= 0; });
}

void AsyncProgressReporter::drain() {
    while (auto message = queue_.pop()) {
        std::visit([this](const auto& event) { bus_.emit(event); }, *message);

        std::lock_guard lock(pending_mutex_);
        --pending_;
        drained_.notify_all();
    }
}

} // namespace psync::events
