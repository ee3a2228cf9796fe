// =============================================================================
// cadvc - Error Handling Framework Implementation
// =============================================================================
// Implementation of error handling utilities and exception classes.
// =============================================================================

#include "cadvc/common/error.h"

#include <cerrno>
#include <sstream>

#include <fmt/format.h>

namespace cadvc {

// =============================================================================
// ErrorContext Implementation
// =============================================================================

std::string ErrorContext::format() const {
    std::ostringstream oss;
    bool hasContent = false;

    if (!filePath.empty()) {
        oss << "file: " << filePath;
        hasContent = true;
    }

    if (!memberName.empty()) {
        if (hasContent) {
            oss << ", ";
        }
        oss << "member: " << memberName;
        hasContent = true;
    }

    if (chunkIndex.has_value()) {
        if (hasContent) {
            oss << ", ";
        }
        oss << "chunk: " << *chunkIndex;
        hasContent = true;
    }

#ifndef NDEBUG
    if (hasContent) {
        oss << " (at " << location.file_name() << ":" << location.line() << ")";
    }
#endif

    return oss.str();
}

// =============================================================================
// CadvcException Implementation
// =============================================================================

void CadvcException::formatWhat() {
    std::ostringstream oss;
    oss << "[" << errorCodeToString(code_) << "] " << message_;

    if (context_.has_value()) {
        std::string contextStr = context_->format();
        if (!contextStr.empty()) {
            oss << " (" << contextStr << ")";
        }
    }

    what_ = oss.str();
}

// =============================================================================
// IOError Implementation
// =============================================================================

std::string IOError::formatWithSystemError(const std::string& message, std::error_code ec) {
    return fmt::format("{}: {} (error code: {})", message, ec.message(), ec.value());
}

// =============================================================================
// Error Implementation
// =============================================================================

CadvcException Error::toException() const {
    switch (code_) {
        case ErrorCode::kUsageError:
            return UsageError(message_);
        case ErrorCode::kIOError:
            return IOError(message_);
        case ErrorCode::kCorruptArchive:
            return FormatError(message_);
        case ErrorCode::kTimeout:
        case ErrorCode::kAlreadyLocked:
        case ErrorCode::kNotLocked:
            return LockError(code_, message_);
        default:
            break;
    }
    return CadvcException(code_, message_);
}

[[noreturn]] void Error::throwException() const {
    switch (code_) {
        case ErrorCode::kUsageError:
            throw UsageError(message_);
        case ErrorCode::kIOError:
            throw IOError(message_);
        case ErrorCode::kCorruptArchive:
            throw FormatError(message_);
        case ErrorCode::kTimeout:
        case ErrorCode::kAlreadyLocked:
        case ErrorCode::kNotLocked:
            throw LockError(code_, message_);
        default:
            break;
    }
    throw CadvcException(code_, message_);
}

// =============================================================================
// System Error Mapping
// =============================================================================

ErrorCode errorCodeFromSystem(std::error_code ec) noexcept {
    if (ec == std::errc::no_such_file_or_directory || ec == std::errc::not_a_directory) {
        return ErrorCode::kNotFound;
    }
    if (ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted ||
        ec == std::errc::read_only_file_system) {
        return ErrorCode::kPermissionDenied;
    }
    return ErrorCode::kIOError;
}

Error errorFromSystem(std::string_view what, std::error_code ec) {
    return Error{errorCodeFromSystem(ec), fmt::format("{}: {}", what, ec.message())};
}

}  // namespace cadvc
