#include "psync/sync/retry.hpp"

#include <algorithm>
#include <thread>
#include <unordered_map>
#include <vector>

namespace psync::sync {
namespace {

bool is_allowed(TaskState current, TaskState target) {
    static const std::unordered_map<TaskState, std::vector<TaskState>> transitions {
        {TaskState::Pending, {TaskState::Running}},
        {TaskState::Running, {TaskState::Done, TaskState::AwaitingRetry, TaskState::Failed}},
        {TaskState::AwaitingRetry, {TaskState::Running}},
    };

    const auto it = transitions.find(current);
    if (it == transitions.end()) {
        return false;
    }
    const auto& allowed_list = it->second;
    return std::find(allowed_list.begin(), allowed_list.end(), target) != allowed_list.end();
}

} // namespace

RetryPolicy RetryPolicy::from_options(const SyncOptions& options) {
    RetryPolicy policy;
    policy.max_attempts = options.retry_count + 1;
    policy.wait = options.retry_wait;
    return policy;
}

const char* to_string(TaskState state) noexcept {
    switch (state) {
        case TaskState::Pending: return "Pending";
        case TaskState::Running: return "Running";
        case TaskState::AwaitingRetry: return "AwaitingRetry";
        case TaskState::Failed: return "Failed";
        case TaskState::Done: return "Done";
    }
    return "Unknown";
}

TaskAttempt::TaskAttempt(RetryPolicy policy) : policy_(policy) {
    policy_.max_attempts = std::max<std::uint32_t>(policy_.max_attempts, 1);
}

Result<void> TaskAttempt::begin() {
    auto moved = transition_to(TaskState::Running);
    if (moved.is_ok()) {
        ++attempt_;
    }
    return moved;
}

Result<void> TaskAttempt::succeed() {
    auto moved = transition_to(TaskState::Done);
    if (moved.is_ok()) {
        last_error_.reset();
    }
    return moved;
}

Result<void> TaskAttempt::fail(Error error) {
    const bool retry = error.retryable() && attempt_ < policy_.max_attempts;
    auto moved = transition_to(retry ? TaskState::AwaitingRetry : TaskState::Failed);
    if (moved.is_ok()) {
        last_error_ = std::move(error);
    }
    return moved;
}

Result<void> TaskAttempt::transition_to(TaskState next) {
    if (!is_allowed(state_, next)) {
        return Err<void>(ErrorKind::ConfigurationError,
                         std::string("Illegal task state transition ") + to_string(state_) + " -> " + to_string(next));
    }
    state_ = next;
    return Ok();
}

RetryController::RetryController(RetryPolicy policy, Sleeper sleeper)
    : policy_(policy), sleeper_(std::move(sleeper)) {
    if (!sleeper_) {
        sleeper_ = [](std::chrono::milliseconds wait) { std::this_thread::sleep_for(wait); };
    }
}

RetryResult RetryController::run(const Operation& operation, const FailureCallback& on_failure) const {
    TaskAttempt attempt(policy_);
    RetryResult result;

    while (attempt.begin().is_ok()) {
        auto outcome = operation(attempt.attempt());
        if (outcome.is_ok()) {
            (void)attempt.succeed();
            result.outcome = std::move(outcome.value());
            break;
        }

        (void)attempt.fail(outcome.error());
        const bool will_retry = attempt.state() == TaskState::AwaitingRetry;
        if (on_failure) {
            on_failure(outcome.error(), attempt.attempt(), will_retry);
        }
        if (!will_retry) {
            break;
        }
        if (policy_.wait.count() > 0) {
            sleeper_(policy_.wait);
        }
    }

    result.state = attempt.state();
    result.attempts = attempt.attempt();
    result.error = attempt.last_error();
    return result;
}

} // namespace psync::sync
