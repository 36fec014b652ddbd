#pragma once

#include <string>
#include <system_error>

namespace psync {

/**
 * @brief Failure taxonomy shared by every module
 *
 * TransientIO and PermanentIO are task-level and never abort a run.
 * VerificationFailure is always recovered locally (whole-file fallback).
 * Cancellation and ConfigurationError stop a run before any task runs.
 */
enum class ErrorKind {
    TransientIO,
    PermanentIO,
    VerificationFailure,
    Cancellation,
    ConfigurationError
};

struct Error {
    ErrorKind kind = ErrorKind::PermanentIO;
    std::string message;
    std::error_code code; ///< Underlying OS error, empty when not an I/O failure

    Error() = default;
    Error(ErrorKind k, std::string msg, std::error_code ec = {})
        : kind(k), message(std::move(msg)), code(ec) {}

    [[nodiscard]] bool retryable() const noexcept { return kind == ErrorKind::TransientIO; }

    /// "message: strerror" when an OS error is attached
    [[nodiscard]] std::string describe() const;
};

const char* to_string(ErrorKind kind) noexcept;

/**
 * @brief Map an OS error onto TransientIO / PermanentIO
 *
 * Busy files, interrupted calls, descriptor exhaustion and network hiccups
 * are worth retrying. Everything else (access denied, missing paths,
 * read-only filesystems, full disks) is permanent.
 */
ErrorKind classify_error_code(const std::error_code& ec) noexcept;

/// Build an I/O error whose kind is derived from @p ec
Error io_error(std::string message, const std::error_code& ec);

} // namespace psync
