#pragma once

#include "psync/core/config.hpp"
#include "psync/core/result.hpp"
#include "psync/sync/types.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>

namespace psync::sync {

struct RetryPolicy {
    std::uint32_t max_attempts = 1;              ///< total attempts, first one included
    std::chrono::milliseconds wait{0};           ///< fixed pause between attempts

    static RetryPolicy from_options(const SyncOptions& options);
};

enum class TaskState {
    Pending,
    Running,
    AwaitingRetry,
    Failed,
    Done
};

const char* to_string(TaskState state) noexcept;

/**
 * @brief Lifecycle of one task across its attempts
 *
 * Pending -> Running -> {Done | AwaitingRetry | Failed},
 * AwaitingRetry -> Running. Done and Failed are terminal.
 */
class TaskAttempt {
public:
    explicit TaskAttempt(RetryPolicy policy);

    [[nodiscard]] TaskState state() const noexcept { return state_; }
    [[nodiscard]] std::uint32_t attempt() const noexcept { return attempt_; }
    [[nodiscard]] const std::optional<Error>& last_error() const noexcept { return last_error_; }

    Result<void> begin();
    Result<void> succeed();

    /// Moves to AwaitingRetry when @p error is transient and attempts remain, else Failed
    Result<void> fail(Error error);

private:
    Result<void> transition_to(TaskState next);

    RetryPolicy policy_;
    TaskState state_ = TaskState::Pending;
    std::uint32_t attempt_ = 0;
    std::optional<Error> last_error_;
};

struct RetryResult {
    TaskState state = TaskState::Pending;
    std::uint32_t attempts = 0;
    std::optional<Error> error;
    TaskOutcome outcome;

    [[nodiscard]] bool succeeded() const noexcept { return state == TaskState::Done; }
};

/**
 * @brief Runs one task under a RetryPolicy
 *
 * Only TransientIO failures are retried. The wait goes through the injected
 * sleeper, which blocks the calling worker only.
 */
class RetryController {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;
    using Operation = std::function<Result<TaskOutcome>(std::uint32_t attempt)>;
    using FailureCallback = std::function<void(const Error& error, std::uint32_t attempt, bool will_retry)>;

    explicit RetryController(RetryPolicy policy, Sleeper sleeper = {});

    RetryResult run(const Operation& operation, const FailureCallback& on_failure = {}) const;

    [[nodiscard]] const RetryPolicy& policy() const noexcept { return policy_; }

private:
    RetryPolicy policy_;
    Sleeper sleeper_;
};

} // namespace psync::sync
