/// @file error.hpp
/// @brief Error types for the changeset-cpp library.

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace changeset_cpp {

/// Categories of errors that can occur in the library.
enum class ErrorKind : std::uint8_t {
    invalid_path,           ///< A change path resolves outside the sandbox root.
    file_system_operation,  ///< A write or delete failed on disk.
    invalid_change,         ///< A change list could not be decoded.
    invalid_task,           ///< A task file is missing, malformed, or incomplete.
    invalid_config,         ///< A configuration file could not be decoded.
};

/// Convert an ErrorKind to its string representation.
constexpr auto to_string_view(ErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ErrorKind::invalid_path:          return "invalid_path";
        case ErrorKind::file_system_operation: return "file_system_operation";
        case ErrorKind::invalid_change:        return "invalid_change";
        case ErrorKind::invalid_task:          return "invalid_task";
        case ErrorKind::invalid_config:        return "invalid_config";
    }
    return "unknown";
}

/// A structured error with a category, a human-readable message, and
/// the context needed to report it.
struct Error {
    ErrorKind kind;         ///< The category of this error.
    std::string message;    ///< A human-readable description.
    std::string path;       ///< The offending path, if any.
    std::error_code cause;  ///< The underlying OS error, if any.

    /// Construct an Error with the given kind and message.
    Error(ErrorKind k, std::string msg)
        : kind{k}, message{std::move(msg)} {}

    /// Construct an Error that names the path it concerns.
    Error(ErrorKind k, std::string msg, std::string p, std::error_code ec = {})
        : kind{k}, message{std::move(msg)}, path{std::move(p)}, cause{ec} {}

    auto operator==(const Error& other) const -> bool = default;
};

/// Exception thrown by every library operation that fails.
///
/// Carries the structured Error so callers can branch on the kind
/// rather than on the message text.
class FileEngineError : public std::runtime_error {
public:
    explicit FileEngineError(Error error)
        : std::runtime_error{error.message}, error_{std::move(error)} {}

    FileEngineError(ErrorKind kind, std::string message)
        : FileEngineError{Error{kind, std::move(message)}} {}

    /// The structured error.
    auto error() const noexcept -> const Error& { return error_; }

    /// Shorthand for error().kind.
    auto kind() const noexcept -> ErrorKind { return error_.kind; }

private:
    Error error_;
};

}  // namespace changeset_cpp
