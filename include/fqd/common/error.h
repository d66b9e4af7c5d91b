// =============================================================================
// fastq-detangler - Error Handling Framework
// =============================================================================
// Error handling for the fastq-detangler library.
//
// This module provides:
// - ErrorCode enum matching CLI exit codes
// - FQDException hierarchy for structured error handling
// - Result<T, E> type for functional error handling (using std::expected)
// - Error context (file, line, record, identifier)
//
// Exit Code Convention:
// - 0: Success
// - 1: Usage/argument error
// - 2: I/O error (file not found, read/write/rename failure)
// - 3: Malformed FASTQ record (framing violation)
// - 4: Unrecognized mate suffix in a header
// - 5: Duplicate mate for an identifier
// - 6: Input contains no records
// =============================================================================

#ifndef FQD_COMMON_ERROR_H
#define FQD_COMMON_ERROR_H

#include <cstdint>
#include <exception>
#include <expected>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>
#include <variant>

#include "fqd/common/types.h"

namespace fqd {

// =============================================================================
// Error Code Enumeration
// =============================================================================

/// @brief Error codes matching CLI exit codes.
/// @note These values are used as process exit codes.
enum class ErrorCode : std::uint8_t {
    /// @brief Operation completed successfully.
    kSuccess = 0,

    /// @brief Usage or argument error.
    kUsageError = 1,

    /// @brief I/O error.
    /// @note Input missing or unreadable, output unwritable, rename failure.
    kIOError = 2,

    /// @brief Structural violation of the four-line record framing.
    kMalformedRecord = 3,

    /// @brief Header lacks a parsable /1 or /2 suffix.
    kUnrecognizedMateSuffix = 4,

    /// @brief Same identifier and mate number seen twice.
    kDuplicateMate = 5,

    /// @brief Input file is empty or holds no records.
    kEmptyInput = 6
};

/// @brief Convert ErrorCode to its integer exit code value.
[[nodiscard]] constexpr int toExitCode(ErrorCode code) noexcept {
    return static_cast<int>(code);
}

/// @brief Convert ErrorCode to string representation.
[[nodiscard]] constexpr std::string_view errorCodeToString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::kSuccess:
            return "success";
        case ErrorCode::kUsageError:
            return "usage error";
        case ErrorCode::kIOError:
            return "I/O error";
        case ErrorCode::kMalformedRecord:
            return "malformed record";
        case ErrorCode::kUnrecognizedMateSuffix:
            return "unrecognized mate suffix";
        case ErrorCode::kDuplicateMate:
            return "duplicate mate";
        case ErrorCode::kEmptyInput:
            return "empty input";
    }
    return "unknown error";
}

// =============================================================================
// Error Context Structure
// =============================================================================

/// @brief Locates the offending input for an error.
struct ErrorContext {
    /// @brief File path associated with the error (if applicable).
    std::string filePath;

    /// @brief 1-based line number in the input (if applicable).
    std::optional<std::uint64_t> lineNumber;

    /// @brief 1-based record number in the input (if applicable).
    std::optional<RecordNumber> recordNumber;

    /// @brief Read identifier involved (if applicable).
    std::optional<std::string> identifier;

    /// @brief Source location where the error was created.
    std::source_location location;

    ErrorContext(std::source_location loc = std::source_location::current()) : location(loc) {}

    explicit ErrorContext(std::string path,
                          std::source_location loc = std::source_location::current())
        : filePath(std::move(path)), location(loc) {}

    ErrorContext& withLine(std::uint64_t line) {
        lineNumber = line;
        return *this;
    }

    ErrorContext& withRecord(RecordNumber number) {
        recordNumber = number;
        return *this;
    }

    ErrorContext& withIdentifier(std::string id) {
        identifier = std::move(id);
        return *this;
    }

    /// @brief Format context as a string for error messages.
    [[nodiscard]] std::string format() const;
};

// =============================================================================
// Base Exception Class
// =============================================================================

/// @brief Base exception class for all fastq-detangler errors.
class FQDException : public std::exception {
public:
    FQDException(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {
        formatWhat();
    }

    FQDException(ErrorCode code, std::string message, ErrorContext context)
        : code_(code), message_(std::move(message)), context_(std::move(context)) {
        formatWhat();
    }

    ~FQDException() override = default;

    FQDException(const FQDException&) = default;
    FQDException(FQDException&&) noexcept = default;
    FQDException& operator=(const FQDException&) = default;
    FQDException& operator=(FQDException&&) noexcept = default;

    /// @brief Message with error category and context.
    [[nodiscard]] const char* what() const noexcept override { return what_.c_str(); }

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    [[nodiscard]] int exitCode() const noexcept { return toExitCode(code_); }

    /// @brief Get the error message (without context).
    [[nodiscard]] const std::string& message() const noexcept { return message_; }

    [[nodiscard]] const std::optional<ErrorContext>& context() const noexcept { return context_; }

    [[nodiscard]] bool hasContext() const noexcept { return context_.has_value(); }

protected:
    void formatWhat();

    ErrorCode code_;
    std::string message_;
    std::optional<ErrorContext> context_;
    std::string what_;
};

// =============================================================================
// Specific Exception Classes
// =============================================================================

/// @brief Exception for usage and argument errors (exit code 1).
class UsageError : public FQDException {
public:
    explicit UsageError(std::string message)
        : FQDException(ErrorCode::kUsageError, std::move(message)) {}
};

/// @brief Exception for I/O errors (exit code 2).
/// @note Thrown for a missing or unreadable input, an output that cannot be
///       written, and a temporary file that cannot be renamed into place.
class IOError : public FQDException {
public:
    explicit IOError(std::string message)
        : FQDException(ErrorCode::kIOError, std::move(message)) {}

    IOError(std::string message, ErrorContext context)
        : FQDException(ErrorCode::kIOError, std::move(message), std::move(context)) {}

    IOError(std::string message, std::error_code ec)
        : FQDException(ErrorCode::kIOError, formatWithSystemError(message, ec)),
          systemError_(ec) {}

    IOError(std::string message, std::error_code ec, ErrorContext context)
        : FQDException(ErrorCode::kIOError, formatWithSystemError(message, ec),
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

/// @brief Base class for errors caused by the content of the input.
class FormatError : public FQDException {
protected:
    FormatError(ErrorCode code, std::string message, ErrorContext context)
        : FQDException(code, std::move(message), std::move(context)) {}
};

/// @brief Framing violation: truncated record, missing '@' or '+' marker,
///        or a header without a read name (exit code 3).
class MalformedRecordError : public FormatError {
public:
    MalformedRecordError(std::string message, ErrorContext context)
        : FormatError(ErrorCode::kMalformedRecord, std::move(message), std::move(context)) {}
};

/// @brief Header does not end in "/1" or "/2" (exit code 4).
class UnrecognizedMateSuffixError : public FormatError {
public:
    UnrecognizedMateSuffixError(std::string header, ErrorContext context)
        : FormatError(ErrorCode::kUnrecognizedMateSuffix,
                      formatUnrecognizedSuffix(header),
                      std::move(context)),
          header_(std::move(header)) {}

    /// @brief The offending header line.
    [[nodiscard]] const std::string& header() const noexcept { return header_; }

private:
    static std::string formatUnrecognizedSuffix(const std::string& header);

    std::string header_;
};

/// @brief The same identifier appeared twice with the same mate number
///        (exit code 5).
class DuplicateMateError : public FormatError {
public:
    DuplicateMateError(std::string identifier, MateNumber mate, ErrorContext context)
        : FormatError(ErrorCode::kDuplicateMate,
                      formatDuplicateMate(identifier, mate),
                      std::move(context.withIdentifier(identifier))),
          identifier_(std::move(identifier)),
          mate_(mate) {}

    [[nodiscard]] const std::string& identifier() const noexcept { return identifier_; }

    [[nodiscard]] MateNumber mate() const noexcept { return mate_; }

private:
    static std::string formatDuplicateMate(const std::string& identifier, MateNumber mate);

    std::string identifier_;
    MateNumber mate_;
};

/// @brief Input file is empty or contains no records (exit code 6).
class EmptyInputError : public FormatError {
public:
    EmptyInputError(std::string message, ErrorContext context)
        : FormatError(ErrorCode::kEmptyInput, std::move(message), std::move(context)) {}
};

// =============================================================================
// Result Type (using std::expected)
// =============================================================================

/// @brief Error type for Result, carrying the code and the formatted message
///        of the exception it was built from.
class Error {
public:
    Error(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    explicit Error(const FQDException& ex) : code_(ex.code()), message_(ex.what()) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    [[nodiscard]] const std::string& message() const noexcept { return message_; }

    [[nodiscard]] int exitCode() const noexcept { return toExitCode(code_); }

private:
    ErrorCode code_;
    std::string message_;
};

/// @brief Result type for operations that can fail.
template <typename T, typename E = Error>
using Result = std::expected<T, E>;

/// @brief Run a function and convert exceptions to Result.
/// @note Non-fqd exceptions map to kIOError; they come from the standard
///       library's stream and filesystem layers.
template <typename F>
[[nodiscard]] auto tryExecute(F&& func)
    -> Result<std::conditional_t<std::is_void_v<decltype(func())>, std::monostate,
                                 decltype(func())>> {
    using ReturnType = decltype(func());
    try {
        if constexpr (std::is_void_v<ReturnType>) {
            func();
            return std::monostate{};
        } else {
            return func();
        }
    } catch (const FQDException& ex) {
        return std::unexpected(Error{ex});
    } catch (const std::exception& ex) {
        return std::unexpected(Error{ErrorCode::kIOError, ex.what()});
    }
}

}  // namespace fqd

#endif  // FQD_COMMON_ERROR_H
