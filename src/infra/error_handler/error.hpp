#pragma once

#include <chrono>
#include <string>
#include <string_view>
#include <system_error>
#include <source_location>
#include <expected>
#include <spdlog/spdlog.h>

namespace cupload::infra {

enum class ErrorCode {
    // Локальные ошибки (не повторяются)
    InvalidArgument,
    PermissionDenied,
    UnsupportedFeature,
    ReadError,          // ошибка чтения источника, прерывает диспетчер

    // Постоянные ошибки API (не повторяются)
    ApiError,
    NotFound,
    Conflict,
    IncorrectOffset,
    SessionClosed,
    ChecksumMismatch,

    // Временные (retry)
    Transient,          // сеть / 5xx
    RateLimited,        // сервер сообщил, когда повторить
    Interrupted,        // короткое чтение, повторяем само чтение

    Unknown,
};

struct Error {
    ErrorCode code;
    std::string message;
    std::string file;
    int line;
    std::string function;
    // Только для RateLimited: сколько ждать до повтора
    std::chrono::seconds retry_after{0};

    Error(ErrorCode c, std::string_view msg,
          const std::source_location& loc = std::source_location::current())
        : code(c)
        , message(msg)
        , file(loc.file_name())
        , line(static_cast<int>(loc.line()))
        , function(loc.function_name())
    {}

    [[nodiscard]] auto is_fatal() const -> bool;
    [[nodiscard]] auto to_exit_code() const -> int;
    [[nodiscard]] auto what() const -> const char*;

    [[nodiscard]] auto is_transient() const -> bool {
        return code == ErrorCode::Transient;
    }

    [[nodiscard]] auto is_rate_limited() const -> bool {
        return code == ErrorCode::RateLimited;
    }
};

template<typename T>
using Result = std::expected<T, Error>;

using VoidResult = Result<void>;

[[nodiscard]] auto make_error(
    ErrorCode code,
    std::string_view message,
    const std::source_location& loc = std::source_location::current()
) -> Error;

[[nodiscard]] auto make_rate_limited(
    std::chrono::seconds retry_after,
    std::string_view reason,
    const std::source_location& loc = std::source_location::current()
) -> Error;

[[nodiscard]] auto to_string(ErrorCode code) -> std::string_view;

// Логирование ошибки и возврат
[[nodiscard]] auto log_and_return(Error&& err) -> Error;

} // namespace cupload::infra
