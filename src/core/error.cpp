#include "psync/core/error.hpp"

#include <cerrno>

namespace psync {

std::string Error::describe() const {
    if (!code) {
        return message;
    }
    return message + ": " + code.message();
}

const char* to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::TransientIO: return "transient-io";
        case ErrorKind::PermanentIO: return "permanent-io";
        case ErrorKind::VerificationFailure: return "verification-failure";
        case ErrorKind::Cancellation: return "cancelled";
        case ErrorKind::ConfigurationError: return "configuration-error";
    }
    return "unknown";
}

ErrorKind classify_error_code(const std::error_code& ec) noexcept {
    if (!ec) {
        return ErrorKind::PermanentIO;
    }
    if (ec.category() != std::generic_category() && ec.category() != std::system_category()) {
        return ErrorKind::PermanentIO;
    }

    switch (ec.value()) {
        case EBUSY:
        case EAGAIN:
        case ETXTBSY:
        case EINTR:
        case ETIMEDOUT:
        case ECONNRESET:
        case ECONNABORTED:
        case EHOSTUNREACH:
        case ENETUNREACH:
        case ENFILE:
        case EMFILE:
        case EIO:
        case ESTALE:
            return ErrorKind::TransientIO;
        default:
            return ErrorKind::PermanentIO;
    }
}

Error io_error(std::string message, const std::error_code& ec) {
    return Error{classify_error_code(ec), std::move(message), ec};
}

} // namespace psync
