// =============================================================================
// fastq-detangler - Error Handling Framework Implementation
// =============================================================================

#include "fqd/common/error.h"

#include <format>
#include <sstream>

namespace fqd {

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

    if (lineNumber.has_value()) {
        if (hasContent) {
            oss << ", ";
        }
        oss << "line: " << *lineNumber;
        hasContent = true;
    }

    if (recordNumber.has_value()) {
        if (hasContent) {
            oss << ", ";
        }
        oss << "record: " << *recordNumber;
        hasContent = true;
    }

    if (identifier.has_value()) {
        if (hasContent) {
            oss << ", ";
        }
        oss << "read: " << *identifier;
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
// FQDException Implementation
// =============================================================================

void FQDException::formatWhat() {
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
    return std::format("{}: {} (error code: {})", message, ec.message(), ec.value());
}

// =============================================================================
// Format Error Implementations
// =============================================================================

std::string UnrecognizedMateSuffixError::formatUnrecognizedSuffix(const std::string& header) {
    return std::format("header '{}' does not end in a '/1' or '/2' mate suffix", header);
}

std::string DuplicateMateError::formatDuplicateMate(const std::string& identifier,
                                                    MateNumber mate) {
    return std::format("read '{}' appears more than once as {} (/{})", identifier,
                       mateNumberToString(mate), mateDigit(mate));
}

}  // namespace fqd
