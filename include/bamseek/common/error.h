// =============================================================================
// bamseek - Error Handling Framework
// =============================================================================
// Error handling for the bamseek library.
//
// This module provides:
// - ErrorCode enum for every failure category the library reports
// - BamseekException hierarchy for structured error handling
// - Result<T, E> type for functional error handling (using std::expected)
// - Error context (file, block address, chunk, virtual offset)
//
// Invariant violations (kInvariantViolation) are programming errors detected
// while walking chunk boundaries. They are never retried or swallowed inside
// the library; callers should abort the whole query when they see one.
//
// Naming Conventions:
// - Enums: PascalCase with kConstant values
// - Classes: PascalCase
// - Functions: camelCase
// - Constants: kConstant
// =============================================================================

#ifndef BAMSEEK_COMMON_ERROR_H
#define BAMSEEK_COMMON_ERROR_H

#include <cstddef>
#include <cstdint>
#include <exception>
#include <expected>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

namespace bamseek {

// =============================================================================
// Error Code Enumeration
// =============================================================================

/// @brief Error categories reported by the library.
enum class ErrorCode : std::uint8_t {
    /// @brief Operation completed successfully.
    kSuccess = 0,

    /// @brief I/O error.
    /// @note Read failure, short read, permission denied, etc.
    kIOError = 1,

    /// @brief Format error.
    /// @note Malformed BGZF header, chunk pointing outside the file, etc.
    kFormatError = 2,

    /// @brief Invalid argument value.
    kInvalidArgument = 3,

    /// @brief Failed to open file.
    kFileOpenFailed = 4,

    /// @brief Seek operation failed.
    kSeekFailed = 5,

    /// @brief Invalid state for operation.
    /// @note Includes a file position reported out of order to a tracker.
    kInvalidState = 6,

    /// @brief Internal invariant violated.
    /// @note Fatal. Distinct from data errors so callers can abort the query.
    kInvariantViolation = 7
};

/// @brief Convert ErrorCode to string representation.
/// @param code The error code.
/// @return Human-readable string describing the error category.
[[nodiscard]] constexpr std::string_view errorCodeToString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::kSuccess:
            return "success";
        case ErrorCode::kIOError:
            return "I/O error";
        case ErrorCode::kFormatError:
            return "format error";
        case ErrorCode::kInvalidArgument:
            return "invalid argument";
        case ErrorCode::kFileOpenFailed:
            return "file open failed";
        case ErrorCode::kSeekFailed:
            return "seek failed";
        case ErrorCode::kInvalidState:
            return "invalid state";
        case ErrorCode::kInvariantViolation:
            return "invariant violation";
    }
    return "unknown error";
}

/// @brief Check if an error code represents success.
[[nodiscard]] constexpr bool isSuccess(ErrorCode code) noexcept {
    return code == ErrorCode::kSuccess;
}

/// @brief Check if an error code represents a fatal programming error.
[[nodiscard]] constexpr bool isFatal(ErrorCode code) noexcept {
    return code == ErrorCode::kInvariantViolation;
}

// =============================================================================
// Error Context Structure
// =============================================================================

/// @brief Additional context information for errors.
struct ErrorContext {
    /// @brief File path associated with the error (if applicable).
    std::string filePath;

    /// @brief Compressed block address where the error occurred.
    std::optional<std::uint64_t> blockAddress;

    /// @brief Index of the chunk being processed.
    std::optional<std::size_t> chunkIndex;

    /// @brief Packed virtual offset associated with the error.
    std::optional<std::uint64_t> virtualOffset;

    /// @brief Source location where the error was created.
    std::source_location location;

    /// @brief Default constructor with current source location.
    ErrorContext(std::source_location loc = std::source_location::current()) : location(loc) {}

    /// @brief Construct with file path.
    explicit ErrorContext(std::string path,
                          std::source_location loc = std::source_location::current())
        : filePath(std::move(path)), location(loc) {}

    ErrorContext& withFile(std::string path) {
        filePath = std::move(path);
        return *this;
    }

    ErrorContext& withBlockAddress(std::uint64_t address) {
        blockAddress = address;
        return *this;
    }

    ErrorContext& withChunk(std::size_t index) {
        chunkIndex = index;
        return *this;
    }

    ErrorContext& withOffset(std::uint64_t packedOffset) {
        virtualOffset = packedOffset;
        return *this;
    }

    /// @brief Format context as a string for error messages.
    [[nodiscard]] std::string format() const;
};

// =============================================================================
// Base Exception Class
// =============================================================================

/// @brief Base exception class for all bamseek errors.
/// @note Provides error code, message, and optional context.
class BamseekException : public std::exception {
public:
    BamseekException(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {
        formatWhat();
    }

    BamseekException(ErrorCode code, std::string message, ErrorContext context)
        : code_(code), message_(std::move(message)), context_(std::move(context)) {
        formatWhat();
    }

    ~BamseekException() override = default;

    BamseekException(const BamseekException&) = default;
    BamseekException(BamseekException&&) noexcept = default;
    BamseekException& operator=(const BamseekException&) = default;
    BamseekException& operator=(BamseekException&&) noexcept = default;

    [[nodiscard]] const char* what() const noexcept override { return what_.c_str(); }

    /// @brief Get the error code.
    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

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

/// @brief Exception for I/O errors.
class IOError : public BamseekException {
public:
    explicit IOError(std::string message)
        : BamseekException(ErrorCode::kIOError, std::move(message)) {}

    IOError(std::string message, ErrorContext context)
        : BamseekException(ErrorCode::kIOError, std::move(message), std::move(context)) {}

    /// @brief Construct with a specific I/O-related code (open, seek).
    IOError(ErrorCode code, std::string message, ErrorContext context)
        : BamseekException(code, std::move(message), std::move(context)) {}
};

/// @brief Exception for malformed on-disk data.
/// @note Thrown for invalid BGZF headers and for chunks addressing blocks
///       beyond the end of the file.
class FormatError : public BamseekException {
public:
    explicit FormatError(std::string message)
        : BamseekException(ErrorCode::kFormatError, std::move(message)) {}

    FormatError(std::string message, ErrorContext context)
        : BamseekException(ErrorCode::kFormatError, std::move(message), std::move(context)) {}
};

/// @brief Exception for argument values outside their valid domain.
class InvalidArgumentError : public BamseekException {
public:
    explicit InvalidArgumentError(std::string message)
        : BamseekException(ErrorCode::kInvalidArgument, std::move(message)) {}

    InvalidArgumentError(std::string message, ErrorContext context)
        : BamseekException(ErrorCode::kInvalidArgument, std::move(message), std::move(context)) {}
};

/// @brief Exception for operations invoked in the wrong state or order.
class InvalidStateError : public BamseekException {
public:
    explicit InvalidStateError(std::string message)
        : BamseekException(ErrorCode::kInvalidState, std::move(message)) {}

    InvalidStateError(std::string message, ErrorContext context)
        : BamseekException(ErrorCode::kInvalidState, std::move(message), std::move(context)) {}
};

/// @brief Exception for violated internal invariants.
/// @note Not recoverable. Terminates the current read operation.
class InvariantViolationError : public BamseekException {
public:
    explicit InvariantViolationError(std::string message)
        : BamseekException(ErrorCode::kInvariantViolation, std::move(message)) {}

    InvariantViolationError(std::string message, ErrorContext context)
        : BamseekException(ErrorCode::kInvariantViolation, std::move(message),
                           std::move(context)) {}
};

// =============================================================================
// Result Type (using std::expected)
// =============================================================================

/// @brief Error type for Result, wrapping ErrorCode and message.
class Error {
public:
    Error(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    /// @brief Construct from a BamseekException.
    explicit Error(const BamseekException& ex) : code_(ex.code()), message_(ex.message()) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    [[nodiscard]] const std::string& message() const noexcept { return message_; }

    /// @brief Throw the exception type matching the error code.
    [[noreturn]] void throwException() const;

private:
    ErrorCode code_;
    std::string message_;
};

/// @brief Result type for operations that can fail.
template <typename T, typename E = Error>
using Result = std::expected<T, E>;

/// @brief Create an error result.
template <typename T>
[[nodiscard]] Result<T> makeError(ErrorCode code, std::string message) {
    return std::unexpected(Error{code, std::move(message)});
}

/// @brief Result type for operations that return nothing on success.
using VoidResult = Result<std::monostate>;

[[nodiscard]] inline VoidResult makeVoidSuccess() {
    return VoidResult{std::monostate{}};
}

// =============================================================================
// Utility Functions
// =============================================================================

/// @brief Return the value or throw the exception matching the error.
template <typename T>
[[nodiscard]] T unwrapOrThrow(Result<T> result) {
    if (result.has_value()) {
        return std::move(result.value());
    }
    result.error().throwException();
}

/// @brief Throw if the result contains an error (void version).
inline void unwrapOrThrow(VoidResult result) {
    if (!result.has_value()) {
        result.error().throwException();
    }
}

/// @brief Execute a function and convert library exceptions to Result.
/// @note Invariant violations are rethrown: they must never become data.
template <typename F>
[[nodiscard]] auto tryExecute(F&& func) -> Result<
    std::conditional_t<std::is_void_v<decltype(func())>, std::monostate, decltype(func())>> {
    using ReturnType = decltype(func());
    try {
        if constexpr (std::is_void_v<ReturnType>) {
            func();
            return std::monostate{};
        } else {
            return func();
        }
    } catch (const InvariantViolationError&) {
        throw;
    } catch (const BamseekException& ex) {
        return std::unexpected(Error{ex});
    } catch (const std::exception& ex) {
        return std::unexpected(Error{ErrorCode::kIOError, ex.what()});
    }
}

}  // namespace bamseek

#endif  // BAMSEEK_COMMON_ERROR_H
