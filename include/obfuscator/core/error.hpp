#pragma once

#include <expected>
#include <string>
#include <string_view>

namespace obfuscator {

enum class ErrorCode {
    Unknown = 1,
    InvalidArgument,
    IoError,
    UnrecognizedFormat,
    InvalidDocument,
    SerializationError,
    WriteError,
    InternalError,
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

private:
    ErrorCode code_;
    std::string message_;
    std::string detail_;
};

template <typename T>
using Result = std::expected<T, Error>;

using VoidResult = std::expected<void, Error>;

inline auto make_error(ErrorCode code, std::string message) -> Error {
    return Error(code, std::move(message));
}

inline auto make_error(ErrorCode code, std::string message, std::string detail) -> Error {
    return Error(code, std::move(message), std::move(detail));
}

/// Convert ErrorCode to the upper snake case form used in log lines.
inline auto error_code_to_string(ErrorCode code) -> std::string_view {
    switch (code) {
        case ErrorCode::Unknown: return "UNKNOWN";
        case ErrorCode::InvalidArgument: return "INVALID_ARGUMENT";
        case ErrorCode::IoError: return "IO_ERROR";
        case ErrorCode::UnrecognizedFormat: return "UNRECOGNIZED_FORMAT";
        case ErrorCode::InvalidDocument: return "INVALID_DOCUMENT";
        case ErrorCode::SerializationError: return "SERIALIZATION_ERROR";
        case ErrorCode::WriteError: return "WRITE_ERROR";
        case ErrorCode::InternalError: return "INTERNAL_ERROR";
        default: return "UNKNOWN";
    }
}

inline auto ok_result() -> VoidResult { return {}; }

} // namespace obfuscator
