#include "error.hpp"
#include <cstdlib>
#include <fmt/core.h>

namespace antig::infra {

bool Error::is_fatal() const {
    switch (code) {
        case ErrorCode::InvalidArgument:
        case ErrorCode::NotADirectory:
        case ErrorCode::ConfigParse:
        case ErrorCode::FileNotFound:
        case ErrorCode::PermissionDenied:
        case ErrorCode::DiskFull:
        case ErrorCode::ChecksumMismatch:
        case ErrorCode::Io:
            return true;
        default:
            return false;
    }
}

int Error::to_exit_code() const {
    switch (code) {
        case ErrorCode::DiskFull:         return 20;
        case ErrorCode::ChecksumMismatch: return 22;
        default:                          return EXIT_FAILURE;
    }
}

const char* Error::what() const {
    return message.c_str();
}

Error make_error(ErrorCode code, std::string_view message,
                 const std::source_location& loc) {
    return Error{code, std::string(message), loc};
}

ErrorCode code_from_errc(const std::error_code& ec) {
    if (ec == std::errc::no_such_file_or_directory) return ErrorCode::FileNotFound;
    if (ec == std::errc::permission_denied ||
        ec == std::errc::operation_not_permitted)   return ErrorCode::PermissionDenied;
    if (ec == std::errc::file_exists)               return ErrorCode::AlreadyExists;
    if (ec == std::errc::no_space_on_device)        return ErrorCode::DiskFull;
    if (ec == std::errc::not_a_directory)           return ErrorCode::NotADirectory;
    return ErrorCode::Io;
}

Error error_from_code(const std::error_code& ec, std::string_view message,
                      const std::source_location& loc) {
    return Error{code_from_errc(ec),
                 fmt::format("{}\nIOError: {}", message, ec.message()),
                 loc};
}

std::string_view to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::InvalidArgument:  return "invalid argument";
        case ErrorCode::NotADirectory:    return "not a directory";
        case ErrorCode::ConfigParse:      return "config parse error";
        case ErrorCode::FileNotFound:     return "file not found";
        case ErrorCode::PermissionDenied: return "permission denied";
        case ErrorCode::AlreadyExists:    return "already exists";
        case ErrorCode::DiskFull:         return "disk full";
        case ErrorCode::ChecksumMismatch: return "checksum mismatch";
        case ErrorCode::Io:               return "I/O error";
        case ErrorCode::Unknown:          break;
    }
    return "unknown error";
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

} // namespace antig::infra
