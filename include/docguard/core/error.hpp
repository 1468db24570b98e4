#pragma once

#include <expected>
#include <string>
#include <string_view>

namespace docguard {

enum class ErrorCode {
    Unknown = 1,
    InvalidArgument,
    SecurityDenial,
    IoFailure,
};

/// Why a SecurityDenial was issued. `None` for every other error code.
enum class DenialReason {
    None,
    TraversalDetected,
    AbsolutePathRejected,
    AccessDenied,
    SymlinkEscape,
};

class Error {
public:
    Error(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    Error(ErrorCode code, std::string message, std::string detail)
        : code_(code), message_(std::move(message)), detail_(std::move(detail)) {}

    Error(DenialReason reason, std::string message, std::string detail)
        : code_(ErrorCode::SecurityDenial), reason_(reason),
          message_(std::move(message)), detail_(std::move(detail)) {}

    [[nodiscard]] auto code() const noexcept -> ErrorCode { return code_; }
    [[nodiscard]] auto reason() const noexcept -> DenialReason { return reason_; }
    [[nodiscard]] auto message() const noexcept -> std::string_view { return message_; }
    [[nodiscard]] auto detail() const noexcept -> std::string_view { return detail_; }

    [[nodiscard]] auto is_denial() const noexcept -> bool {
        return code_ == ErrorCode::SecurityDenial;
    }

    [[nodiscard]] auto what() const -> std::string {
        if (detail_.empty()) return message_;
        return message_ + ": " + detail_;
    }

    /// Re-labels this error under `context` (e.g. "readText(docs/a.md)"),
    /// keeping code and reason and pushing the old text into the detail.
    [[nodiscard]] auto wrap(std::string context) const -> Error {
        Error wrapped(code_, std::move(context), what());
        wrapped.reason_ = reason_;
        return wrapped;
    }

private:
    ErrorCode code_;
    DenialReason reason_ = DenialReason::None;
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

inline auto make_denial(DenialReason reason, std::string message, std::string detail) -> Error {
    return Error(reason, std::move(message), std::move(detail));
}

inline auto error_code_to_string(ErrorCode code) -> std::string_view {
    switch (code) {
        case ErrorCode::Unknown: return "UNKNOWN";
        case ErrorCode::InvalidArgument: return "INVALID_ARGUMENT";
        case ErrorCode::SecurityDenial: return "SECURITY_DENIAL";
        case ErrorCode::IoFailure: return "IO_FAILURE";
        default: return "UNKNOWN";
    }
}

inline auto denial_reason_to_string(DenialReason reason) -> std::string_view {
    switch (reason) {
        case DenialReason::None: return "none";
        case DenialReason::TraversalDetected: return "traversal_detected";
        case DenialReason::AbsolutePathRejected: return "absolute_path_rejected";
        case DenialReason::AccessDenied: return "access_denied";
        case DenialReason::SymlinkEscape: return "symlink_escape";
        default: return "none";
    }
}

} // namespace docguard
