#pragma once

#include <expected>
#include <string>
#include <string_view>

namespace pricesched {

enum class ErrorCode {
    Unknown = 1,
    InvalidConfig,
    InvalidArgument,
    InvalidTime,
    NotFound,
    PrivilegeRequired,
    SchedulerUnavailable,
    RegistrationFailed,
    CommandFailed,
    IoError,
};

class Error {
public:
    Error(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    Error(ErrorCode code, std::string message, std::string detail)
        : code_(code), message_(std::move(message)), detail_(std::move(detail)) {}

    [[nodiscard]] auto code() const noexcept -> ErrorCode { return code_; }
    [[nodiscard]] auto message() const noexcept -> std::string_view { return message_; }
    [[nodiscard]] auto detail() const noexcept -> std::string_view { return detail_; }

    [[nodiscard]] auto what() const -> std::string {
        if (detail_.empty()) return message_;
        return message_ + ": " + detail_;
    }

    /// Fatal errors abort a reconciliation run instead of being recorded
    /// against a single identity.
    [[nodiscard]] auto is_fatal() const noexcept -> bool {
        return code_ == ErrorCode::PrivilegeRequired ||
               code_ == ErrorCode::SchedulerUnavailable;
    }

private:
    ErrorCode code_;
    std::string message_;
    std::string detail_;
};

template <typename T>
using Result = std::expected<T, Error>;

inline auto make_error(ErrorCode code, std::string message) -> Error {
    return Error(code, std::move(message));
}

inline auto make_error(ErrorCode code, std::string message, std::string detail) -> Error {
    return Error(code, std::move(message), std::move(detail));
}

inline auto error_code_to_string(ErrorCode code) -> std::string_view {
    switch (code) {
        case ErrorCode::Unknown: return "UNKNOWN";
        case ErrorCode::InvalidConfig: return "INVALID_CONFIG";
        case ErrorCode::InvalidArgument: return "INVALID_ARGUMENT";
        case ErrorCode::InvalidTime: return "INVALID_TIME";
        case ErrorCode::NotFound: return "NOT_FOUND";
        case ErrorCode::PrivilegeRequired: return "PRIVILEGE_REQUIRED";
        case ErrorCode::SchedulerUnavailable: return "SCHEDULER_UNAVAILABLE";
        case ErrorCode::RegistrationFailed: return "REGISTRATION_FAILED";
        case ErrorCode::CommandFailed: return "COMMAND_FAILED";
        case ErrorCode::IoError: return "IO_ERROR";
        default: return "UNKNOWN";
    }
}

} // namespace pricesched
