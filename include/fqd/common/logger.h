// =============================================================================
// fastq-detangler - Logger Module
// =============================================================================
// Low-latency asynchronous logging using Quill library.
//
// This module provides a global logger instance with support for:
// - Multiple log levels (trace, debug, info, warning, error, critical)
// - Console and file output
//
// Usage:
//   fqd::log::init({.logFile = "detangle.log", .level = fqd::log::Level::kDebug});
//   FQD_LOG_INFO("Parsed {} reads", count);
//
// The FQD_LOG_* macros do nothing until init() has been called, so library
// code can log unconditionally.
// =============================================================================

#ifndef FQD_COMMON_LOGGER_H
#define FQD_COMMON_LOGGER_H

#include <optional>
#include <string>
#include <string_view>

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/LogMacros.h>
#include <quill/Logger.h>
#include <quill/sinks/ConsoleSink.h>
#include <quill/sinks/FileSink.h>

namespace fqd::log {

// =============================================================================
// Log Level Enumeration
// =============================================================================

/// @brief Log level enumeration matching Quill's log levels.
enum class Level {
    kTrace = 0,
    kDebug,
    kInfo,
    kWarning,
    kError,
    kCritical
};

// =============================================================================
// Logger Configuration
// =============================================================================

/// @brief Configuration options for logger initialization.
struct Config {
    /// @brief Log file path. Empty string disables file logging.
    std::string logFile;

    /// @brief Minimum log level to output.
    Level level = Level::kInfo;

    /// @brief Enable console output.
    bool enableConsole = true;

    /// @brief Logger name for identification.
    std::string loggerName = "fqd";
};

// =============================================================================
// Logger Initialization and Access
// =============================================================================

/// @brief Initialize the global logger with the specified configuration.
/// @note Later calls are ignored until shutdown(). With neither console nor
///       file output the logger stays disabled.
void init(const Config& config);

/// @brief Get the global logger instance.
/// @return Pointer to the global Quill logger, or nullptr before init().
[[nodiscard]] quill::Logger* logger() noexcept;

/// @brief True while a logger is installed.
[[nodiscard]] bool isInitialized() noexcept;

/// @brief Flush all pending log messages.
void flush();

/// @brief Flush and stop the backend thread.
void shutdown();

// =============================================================================
// Level Conversion Utilities
// =============================================================================

/// @brief Convert fqd::log::Level to Quill's LogLevel.
[[nodiscard]] quill::LogLevel toQuillLevel(Level level) noexcept;

/// @brief Parse a level name such as "debug" or "WARN".
/// @return std::nullopt for an unknown name.
[[nodiscard]] std::optional<Level> levelFromString(std::string_view levelStr);

/// @brief Convert log level to string.
[[nodiscard]] std::string_view levelToString(Level level) noexcept;

}  // namespace fqd::log

// =============================================================================
// Convenience Macros
// =============================================================================

#define FQD_LOG_IMPL(quillMacro, fmt, ...)                                        \
    do {                                                                          \
        if (quill::Logger* fqdLogger_ = ::fqd::log::logger(); fqdLogger_ != nullptr) { \
            quillMacro(fqdLogger_, fmt __VA_OPT__(, ) __VA_ARGS__);               \
        }                                                                         \
    } while (false)

/// @brief Log a trace message.
#define FQD_LOG_TRACE(fmt, ...) FQD_LOG_IMPL(LOG_TRACE_L1, fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log a debug message.
#define FQD_LOG_DEBUG(fmt, ...) FQD_LOG_IMPL(LOG_DEBUG, fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log an info message.
#define FQD_LOG_INFO(fmt, ...) FQD_LOG_IMPL(LOG_INFO, fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log a warning message.
#define FQD_LOG_WARNING(fmt, ...) FQD_LOG_IMPL(LOG_WARNING, fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log an error message.
#define FQD_LOG_ERROR(fmt, ...) FQD_LOG_IMPL(LOG_ERROR, fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log a critical message.
#define FQD_LOG_CRITICAL(fmt, ...) FQD_LOG_IMPL(LOG_CRITICAL, fmt __VA_OPT__(, ) __VA_ARGS__)

#endif  // FQD_COMMON_LOGGER_H
