// Error.hpp - C++23 error handling with std::expected
//
// Rich error context with source location tracking. Every fallible engine
// operation returns Result<T>; asynchronous operations deliver Result<T> to
// their completion.
//
// Usage:
//   Result<int> ParsePort(std::string_view text) {
//       if (text.empty()) {
//           return FXN_ERROR_INVALID("port is empty");
//       }
//       ...
//   }
//
//   auto port = ParsePort(value);
//   if (!port) {
//       port.error().Log();
//       return std::unexpected(port.error());
//   }

#pragma once

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <utility>

namespace FXN {

// ============================================================================
// Source Location
// ============================================================================

/// Compile-time source location tracking via compiler builtins
struct SourceLocation {
    const char* file;
    const char* function;
    int line;

    constexpr SourceLocation(
        const char* f = __builtin_FILE(),
        const char* fn = __builtin_FUNCTION(),
        int l = __builtin_LINE()) noexcept
        : file(f), function(fn), line(l) {}

    /// Extract filename from full path (strips directory)
    [[nodiscard]] constexpr std::string_view FileName() const noexcept {
        std::string_view path(file);
        auto pos = path.find_last_of('/');
        return (pos != std::string_view::npos) ? path.substr(pos + 1) : path;
    }
};

// ============================================================================
// Error Severity / Code
// ============================================================================

enum class ErrorSeverity : uint8_t {
    /// Can retry or continue with degraded functionality
    Recoverable,
    /// Cannot continue, operation aborted
    Fatal,
    /// Logged, operation continues
    Warning
};

[[nodiscard]] constexpr const char* ToString(ErrorSeverity severity) noexcept {
    switch (severity) {
        case ErrorSeverity::Recoverable: return "RECOVERABLE";
        case ErrorSeverity::Fatal:       return "FATAL";
        case ErrorSeverity::Warning:     return "WARNING";
    }
    return "UNKNOWN";
}

enum class ErrorCode : uint8_t {
    kInvalidArgument,   ///< Validation failure, rejected before any network I/O
    kNotFound,          ///< Unknown unit id
    kTimeout,           ///< RPC guard expired
    kDenied,            ///< Device refused the write (or point is blocked)
    kTransport,         ///< Any other protocol/client failure
    kSocket,            ///< Local socket setup failure
    kAborted,           ///< Unit removed while the operation was queued
    kInternal,          ///< Broken invariant inside the engine
};

[[nodiscard]] constexpr const char* ToString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::kInvalidArgument: return "invalid-argument";
        case ErrorCode::kNotFound:        return "not-found";
        case ErrorCode::kTimeout:         return "timeout";
        case ErrorCode::kDenied:          return "denied";
        case ErrorCode::kTransport:       return "transport";
        case ErrorCode::kSocket:          return "socket";
        case ErrorCode::kAborted:         return "aborted";
        case ErrorCode::kInternal:        return "internal";
    }
    return "unknown";
}

// ============================================================================
// Error Type
// ============================================================================

struct Error {
    ErrorCode code;                ///< Engine error category
    SourceLocation location;       ///< Capture site (file, line, function)
    ErrorSeverity severity;        ///< Error severity level
    std::string message;           ///< Human-readable description

    /// Use the FXN_ERROR_* macros instead of calling this directly
    [[nodiscard]] static Error Make(
        ErrorCode code,
        ErrorSeverity sev,
        std::string msg,
        SourceLocation loc = SourceLocation())
    {
        return Error{code, loc, sev, std::move(msg)};
    }

    [[nodiscard]] constexpr bool IsRecoverable() const noexcept {
        return severity == ErrorSeverity::Recoverable;
    }

    [[nodiscard]] constexpr bool IsFatal() const noexcept {
        return severity == ErrorSeverity::Fatal;
    }

    [[nodiscard]] constexpr bool Is(ErrorCode c) const noexcept {
        return code == c;
    }

    /// Log error with full context (file, line, function, message)
    void Log() const;

    /// Log error at warning level (for non-fatal errors)
    void LogAsWarning() const;
};

// ============================================================================
// Result Type (std::expected alias)
// ============================================================================

template<typename T>
using Result = std::expected<T, Error>;

// ============================================================================
// Error Creation Macros (with automatic source location)
// ============================================================================

#define FXN_ERROR_RECOVERABLE(code, msg) \
    std::unexpected(::FXN::Error::Make((code), ::FXN::ErrorSeverity::Recoverable, (msg)))

#define FXN_ERROR_FATAL(code, msg) \
    std::unexpected(::FXN::Error::Make((code), ::FXN::ErrorSeverity::Fatal, (msg)))

#define FXN_ERROR_INVALID(msg) \
    FXN_ERROR_FATAL(::FXN::ErrorCode::kInvalidArgument, (msg))

#define FXN_ERROR_NOT_FOUND(msg) \
    FXN_ERROR_FATAL(::FXN::ErrorCode::kNotFound, (msg))

#define FXN_ERROR_TIMEOUT(msg) \
    FXN_ERROR_RECOVERABLE(::FXN::ErrorCode::kTimeout, (msg))

#define FXN_ERROR_DENIED(msg) \
    FXN_ERROR_FATAL(::FXN::ErrorCode::kDenied, (msg))

#define FXN_ERROR_TRANSPORT(msg) \
    FXN_ERROR_RECOVERABLE(::FXN::ErrorCode::kTransport, (msg))

#define FXN_ERROR_SOCKET(msg) \
    FXN_ERROR_RECOVERABLE(::FXN::ErrorCode::kSocket, (msg))

#define FXN_ERROR_ABORTED(msg) \
    FXN_ERROR_FATAL(::FXN::ErrorCode::kAborted, (msg))

#define FXN_ERROR_INTERNAL(msg) \
    FXN_ERROR_FATAL(::FXN::ErrorCode::kInternal, (msg))

// ============================================================================
// Error Propagation Helpers
// ============================================================================

/// Propagate error or extract value (GNU statement expression)
///
///   Result<Foo> CreateFoo() {
///       auto bar = FXN_TRY(CreateBar());
///       return Foo{bar};
///   }
#define FXN_TRY(expr) \
    ({ \
        auto&& _result = (expr); \
        if (!_result) { \
            return std::unexpected(_result.error()); \
        } \
        std::move(_result).value(); \
    })

} // namespace FXN
