#include "error.hpp"
#include <cstdlib>
#include <fmt/core.h>

namespace cupload::infra {

bool Error::is_fatal() const {
    switch (code) {
        case ErrorCode::InvalidArgument:
        case ErrorCode::PermissionDenied:
        case ErrorCode::UnsupportedFeature:
            return true;
        default:
            return false;
    }
}

int Error::to_exit_code() const {
    if (is_fatal()) return EXIT_FAILURE;
    switch (code) {
        case ErrorCode::ReadError:        return 20;
        case ErrorCode::Conflict:         return 21;
        case ErrorCode::ChecksumMismatch: return 22;
        case ErrorCode::Transient:
        case ErrorCode::RateLimited:      return 23; // можно продолжить через --resume
        default:                          return EXIT_FAILURE;
    }
}

const char* Error::what() const {
    return message.c_str();
}

Error make_error(ErrorCode code, std::string_view message,
                 const std::source_location& loc) {
    return Error{code, message, loc};
}

Error make_rate_limited(std::chrono::seconds retry_after, std::string_view reason,
                        const std::source_location& loc) {
    Error err{ErrorCode::RateLimited, reason, loc};
    err.retry_after = retry_after;
    return err;
}

std::string_view to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::InvalidArgument:    return "invalid_argument";
        case ErrorCode::PermissionDenied:   return "permission_denied";
        case ErrorCode::UnsupportedFeature: return "unsupported";
        case ErrorCode::ReadError:          return "read_error";
        case ErrorCode::ApiError:           return "api_error";
        case ErrorCode::NotFound:           return "not_found";
        case ErrorCode::Conflict:           return "conflict";
        case ErrorCode::IncorrectOffset:    return "incorrect_offset";
        case ErrorCode::SessionClosed:      return "session_closed";
        case ErrorCode::ChecksumMismatch:   return "checksum_mismatch";
        case ErrorCode::Transient:          return "transient";
        case ErrorCode::RateLimited:        return "rate_limited";
        case ErrorCode::Interrupted:        return "interrupted";
        case ErrorCode::Unknown:            break;
    }
    return "unknown";
}

Error log_and_return(Error&& err) {
    auto level = err.is_fatal() ? spdlog::level::err : spdlog::level::warn;
    spdlog::log(level,
        "[{}:{} in {}] {}: {}",
        err.file, err.line, err.function,
        to_string(err.code), err.message
    );
    return std::move(err);
}

} // namespace cupload::infra
