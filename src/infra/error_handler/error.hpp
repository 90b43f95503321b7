#pragma once

#include <string>
#include <string_view>
#include <system_error>
#include <source_location>
#include <expected>
#include <spdlog/spdlog.h>

namespace antig::infra {

enum class ErrorCode {
    // Ошибки конфигурации (до начала копирования)
    InvalidArgument,
    NotADirectory,
    ConfigParse,

    // Ошибки ввода-вывода
    FileNotFound,
    PermissionDenied,
    AlreadyExists,
    DiskFull,
    ChecksumMismatch,
    Io,

    Unknown,
};

struct Error {
    ErrorCode code;
    std::string message;
    std::string file;
    int line;
    std::string function;

    // Конструктор с автоматическим захватом location
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
};

template<typename T>
using Result = std::expected<T, Error>;

using VoidResult = Result<void>;

[[nodiscard]] auto make_error(
    ErrorCode code,
    std::string_view message,
    const std::source_location& loc = std::source_location::current()
) -> Error;

/// Переводит std::error_code файловой системы в ErrorCode.
[[nodiscard]] auto code_from_errc(const std::error_code& ec) -> ErrorCode;

/// Ошибка ввода-вывода: сообщение плюс текст системной ошибки.
[[nodiscard]] auto error_from_code(
    const std::error_code& ec,
    std::string_view message,
    const std::source_location& loc = std::source_location::current()
) -> Error;

[[nodiscard]] auto to_string(ErrorCode code) -> std::string_view;

// Логирование ошибки и возврат
[[nodiscard]] auto log_and_return(Error&& err) -> Error;

} // namespace antig::infra
