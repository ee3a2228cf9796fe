// =============================================================================
// cadvc - Error Handling Framework
// =============================================================================
// Error handling for the cadvc library and command-line tool.
//
// This module provides:
// - ErrorCode enum with one value per distinct failure kind
// - CadvcException hierarchy for unexpected, invocation-aborting failures
// - Result<T, E> type for expected domain conditions (using std::expected)
// - Error context and message support
//
// Exit Code Convention (non-hook subcommands):
// - 0: Success
// - 1: Usage/argument error
// - 2: I/O error
// - 3..12: the specific failure kinds below
//
// Lifecycle hooks do not use these values directly; they map every failure
// to allow / blocked / fatal (see lifecycle/lifecycle.h).
//
// Naming Conventions:
// - Enums: PascalCase with kConstant values
// - Classes: PascalCase
// - Functions: camelCase
// - Constants: kConstant
// =============================================================================

#ifndef CADVC_COMMON_ERROR_H
#define CADVC_COMMON_ERROR_H

#include <cstdint>
#include <exception>
#include <expected>
#include <filesystem>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>
#include <variant>

namespace cadvc {

// =============================================================================
// Error Code Enumeration
// =============================================================================

/// @brief Error codes, mutually exclusive by design of the callers.
/// @note These values are used as process exit codes by non-hook commands.
enum class ErrorCode : std::uint8_t {
    /// @brief Operation completed successfully.
    kSuccess = 0,

    /// @brief Usage or argument error.
    kUsageError = 1,

    /// @brief Generic I/O error (read/write failure, disk full, ...).
    kIOError = 2,

    /// @brief File or directory not found.
    kNotFound = 3,

    /// @brief Input exists but is not the expected kind of file.
    kWrongFileType = 4,

    /// @brief Input claims to be a ZIP container but cannot be read as one.
    kCorruptArchive = 5,

    /// @brief Access denied by the operating system.
    kPermissionDenied = 6,

    /// @brief An external command did not finish within its deadline.
    kTimeout = 7,

    /// @brief The lock is held by another actor.
    /// @note Error::lockOwner() carries the holder when it could be determined.
    kAlreadyLocked = 8,

    /// @brief Release requested for a lock that is not held.
    kNotLocked = 9,

    /// @brief A single file cannot fit into an empty chunk archive.
    kFileTooLarge = 10,

    /// @brief Configuration could not be used (defaults apply).
    kConfigInvalid = 11,

    /// @brief Unexpected internal failure.
    kInternal = 12
};

/// @brief Convert ErrorCode to its integer exit code value.
/// @param code The error code.
/// @return Integer exit code suitable for process exit.
[[nodiscard]] constexpr int toExitCode(ErrorCode code) noexcept {
    return static_cast<int>(code);
}

/// @brief Convert ErrorCode to string representation.
/// @param code The error code.
/// @return Human-readable string describing the error category.
[[nodiscard]] constexpr std::string_view errorCodeToString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::kSuccess:
            return "success";
        case ErrorCode::kUsageError:
            return "usage error";
        case ErrorCode::kIOError:
            return "I/O error";
        case ErrorCode::kNotFound:
            return "not found";
        case ErrorCode::kWrongFileType:
            return "wrong file type";
        case ErrorCode::kCorruptArchive:
            return "corrupt archive";
        case ErrorCode::kPermissionDenied:
            return "permission denied";
        case ErrorCode::kTimeout:
            return "timeout";
        case ErrorCode::kAlreadyLocked:
            return "already locked";
        case ErrorCode::kNotLocked:
            return "not locked";
        case ErrorCode::kFileTooLarge:
            return "file too large";
        case ErrorCode::kConfigInvalid:
            return "invalid configuration";
        case ErrorCode::kInternal:
            return "internal error";
    }
    return "unknown error";
}

/// @brief Check if an error code represents success.
[[nodiscard]] constexpr bool isSuccess(ErrorCode code) noexcept {
    return code == ErrorCode::kSuccess;
}

/// @brief Check if an error code represents an error.
[[nodiscard]] constexpr bool isError(ErrorCode code) noexcept {
    return code != ErrorCode::kSuccess;
}

// =============================================================================
// Error Context Structure
// =============================================================================

/// @brief Additional context information for errors.
struct ErrorContext {
    /// @brief File path associated with the error (if applicable).
    std::string filePath;

    /// @brief Archive member name associated with the error (if applicable).
    std::string memberName;

    /// @brief Chunk archive index where the error occurred (if applicable).
    std::optional<std::uint32_t> chunkIndex;

    /// @brief Source location where the error was created.
    std::source_location location;

    /// @brief Default constructor with current source location.
    ErrorContext(std::source_location loc = std::source_location::current()) : location(loc) {}

    /// @brief Construct with file path.
    explicit ErrorContext(std::string path,
                          std::source_location loc = std::source_location::current())
        : filePath(std::move(path)), location(loc) {}

    /// @brief Set the file path.
    /// @return Reference to this for method chaining.
    ErrorContext& withFile(std::string path) {
        filePath = std::move(path);
        return *this;
    }

    /// @brief Set the archive member name.
    /// @return Reference to this for method chaining.
    ErrorContext& withMember(std::string name) {
        memberName = std::move(name);
        return *this;
    }

    /// @brief Set the chunk archive index.
    /// @return Reference to this for method chaining.
    ErrorContext& withChunk(std::uint32_t index) {
        chunkIndex = index;
        return *this;
    }

    /// @brief Format context as a string for error messages.
    [[nodiscard]] std::string format() const;
};

// =============================================================================
// Base Exception Class
// =============================================================================

/// @brief Base exception class for all cadvc errors.
/// @note Thrown only for situations that abort the whole invocation; expected
///       domain conditions travel as Result<T> instead.
class CadvcException : public std::exception {
public:
    /// @brief Construct with error code and message.
    CadvcException(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {
        formatWhat();
    }

    /// @brief Construct with error code, message, and context.
    CadvcException(ErrorCode code, std::string message, ErrorContext context)
        : code_(code), message_(std::move(message)), context_(std::move(context)) {
        formatWhat();
    }

    ~CadvcException() override = default;

    CadvcException(const CadvcException&) = default;
    CadvcException(CadvcException&&) noexcept = default;
    CadvcException& operator=(const CadvcException&) = default;
    CadvcException& operator=(CadvcException&&) noexcept = default;

    /// @brief Get the error message.
    [[nodiscard]] const char* what() const noexcept override { return what_.c_str(); }

    /// @brief Get the error code.
    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    /// @brief Get the exit code for this error.
    [[nodiscard]] int exitCode() const noexcept { return toExitCode(code_); }

    /// @brief Get the error message (without context).
    [[nodiscard]] const std::string& message() const noexcept { return message_; }

    /// @brief Get the error context.
    [[nodiscard]] const std::optional<ErrorContext>& context() const noexcept { return context_; }

    /// @brief Check if this exception has context information.
    [[nodiscard]] bool hasContext() const noexcept { return context_.has_value(); }

protected:
    /// @brief Format the what() string from message and context.
    void formatWhat();

    ErrorCode code_;
    std::string message_;
    std::optional<ErrorContext> context_;
    std::string what_;
};

// =============================================================================
// Specific Exception Classes
// =============================================================================

/// @brief Exception for usage and argument errors.
class UsageError : public CadvcException {
public:
    explicit UsageError(std::string message)
        : CadvcException(ErrorCode::kUsageError, std::move(message)) {}

    UsageError(std::string message, ErrorContext context)
        : CadvcException(ErrorCode::kUsageError, std::move(message), std::move(context)) {}
};

/// @brief Exception for I/O errors.
/// @note Thrown for write failures, rename failures, disk full, etc.
class IOError : public CadvcException {
public:
    explicit IOError(std::string message)
        : CadvcException(ErrorCode::kIOError, std::move(message)) {}

    IOError(std::string message, ErrorContext context)
        : CadvcException(ErrorCode::kIOError, std::move(message), std::move(context)) {}

    /// @brief Construct from system error code.
    IOError(std::string message, std::error_code ec)
        : CadvcException(ErrorCode::kIOError, formatWithSystemError(message, ec)),
          systemError_(ec) {}

    /// @brief Construct from system error code with context.
    IOError(std::string message, std::error_code ec, ErrorContext context)
        : CadvcException(ErrorCode::kIOError, formatWithSystemError(message, ec),
                         std::move(context)),
          systemError_(ec) {}

    /// @brief Get the system error code (if available).
    [[nodiscard]] const std::optional<std::error_code>& systemError() const noexcept {
        return systemError_;
    }

private:
    static std::string formatWithSystemError(const std::string& message, std::error_code ec);

    std::optional<std::error_code> systemError_;
};

/// @brief Exception for malformed ZIP containers.
class FormatError : public CadvcException {
public:
    explicit FormatError(std::string message)
        : CadvcException(ErrorCode::kCorruptArchive, std::move(message)) {}

    FormatError(std::string message, ErrorContext context)
        : CadvcException(ErrorCode::kCorruptArchive, std::move(message), std::move(context)) {}
};

/// @brief Exception for lock primitive failures.
class LockError : public CadvcException {
public:
    LockError(ErrorCode code, std::string message)
        : CadvcException(code, std::move(message)) {}
};

// =============================================================================
// Result Type (using std::expected)
// =============================================================================

/// @brief Error type for Result, wrapping ErrorCode and message.
class Error {
public:
    /// @brief Construct with error code and message.
    Error(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    /// @brief Construct from a CadvcException.
    explicit Error(const CadvcException& ex) : code_(ex.code()), message_(ex.message()) {}

    /// @brief Get the error code.
    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    /// @brief Get the error message.
    [[nodiscard]] const std::string& message() const noexcept { return message_; }

    /// @brief Get the exit code.
    [[nodiscard]] int exitCode() const noexcept { return toExitCode(code_); }

    /// @brief Current holder of the lock, for kAlreadyLocked.
    [[nodiscard]] const std::optional<std::string>& lockOwner() const noexcept {
        return lockOwner_;
    }

    /// @brief Attach the current lock holder.
    /// @return Reference to this for method chaining.
    Error& withLockOwner(std::string owner) {
        lockOwner_ = std::move(owner);
        return *this;
    }

    /// @brief Convert to the appropriate exception type.
    [[nodiscard]] CadvcException toException() const;

    /// @brief Throw the appropriate exception.
    [[noreturn]] void throwException() const;

private:
    ErrorCode code_;
    std::string message_;
    std::optional<std::string> lockOwner_;
};

/// @brief Result type for operations that can fail.
/// @tparam T The success value type.
/// @tparam E The error type (defaults to Error).
template <typename T, typename E = Error>
using Result = std::expected<T, E>;

/// @brief Create a success result.
template <typename T>
[[nodiscard]] Result<T> makeSuccess(T value) {
    return Result<T>{std::move(value)};
}

/// @brief Create an error result.
template <typename T>
[[nodiscard]] Result<T> makeError(ErrorCode code, std::string message) {
    return std::unexpected(Error{code, std::move(message)});
}

/// @brief Create an error result from an Error object.
template <typename T>
[[nodiscard]] Result<T> makeError(Error error) {
    return std::unexpected(std::move(error));
}

/// @brief Create an error result from an exception.
template <typename T>
[[nodiscard]] Result<T> makeError(const CadvcException& ex) {
    return std::unexpected(Error{ex});
}

// =============================================================================
// Void Result Type
// =============================================================================

/// @brief Result type for operations that return nothing on success.
using VoidResult = Result<std::monostate>;

/// @brief Create a success void result.
[[nodiscard]] inline VoidResult makeVoidSuccess() {
    return VoidResult{std::monostate{}};
}

/// @brief Create an error void result.
[[nodiscard]] inline VoidResult makeVoidError(ErrorCode code, std::string message) {
    return std::unexpected(Error{code, std::move(message)});
}

// =============================================================================
// Utility Functions
// =============================================================================

/// @brief Map a filesystem/system error to the matching error kind.
/// @param ec The system error code.
/// @return kNotFound, kPermissionDenied or kIOError.
[[nodiscard]] ErrorCode errorCodeFromSystem(std::error_code ec) noexcept;

/// @brief Build an Error from a failed filesystem call.
/// @param what Description of the failed operation.
/// @param ec The system error code.
[[nodiscard]] Error errorFromSystem(std::string_view what, std::error_code ec);

/// @brief Convert a Result to an exception if it contains an error.
/// @throws CadvcException (or derived) if the result contains an error.
template <typename T>
[[nodiscard]] T unwrapOrThrow(Result<T> result) {
    if (result.has_value()) {
        return std::move(result.value());
    }
    result.error().throwException();
}

/// @brief Convert a Result to an exception if it contains an error (void version).
inline void unwrapOrThrow(VoidResult result) {
    if (!result.has_value()) {
        result.error().throwException();
    }
}

/// @brief Try to execute a function and convert exceptions to Result.
template <typename F>
[[nodiscard]] auto tryExecute(F&& func) -> Result<std::conditional_t<
    std::is_void_v<decltype(func())>, std::monostate, decltype(func())>> {
    using ReturnType = decltype(func());
    try {
        if constexpr (std::is_void_v<ReturnType>) {
            func();
            return std::monostate{};
        } else {
            return func();
        }
    } catch (const CadvcException& ex) {
        return std::unexpected(Error{ex});
    } catch (const std::filesystem::filesystem_error& ex) {
        return std::unexpected(Error{errorCodeFromSystem(ex.code()), ex.what()});
    } catch (const std::exception& ex) {
        return std::unexpected(Error{ErrorCode::kInternal, ex.what()});
    }
}

}  // namespace cadvc

#endif  // CADVC_COMMON_ERROR_H
