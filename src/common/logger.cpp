// =============================================================================
// fastq-detangler - Logger Module Implementation
// =============================================================================
// One quill logger shared by the whole process. The pointer stays null until
// init() succeeds and returns to null at shutdown(), which is what lets the
// FQD_LOG_* macros skip work in library code and tests.
// =============================================================================

#include "fqd/common/logger.h"

#include <array>
#include <atomic>
#include <cctype>
#include <memory>
#include <mutex>
#include <vector>

namespace fqd::log {

namespace {

// =============================================================================
// Level Names
// =============================================================================

struct LevelEntry {
    std::string_view name;
    Level level;
    quill::LogLevel quillLevel;
};

/// @brief Canonical name first for each level; later rows are aliases.
constexpr std::array<LevelEntry, 7> kLevels{{
    {"trace", Level::kTrace, quill::LogLevel::TraceL1},
    {"debug", Level::kDebug, quill::LogLevel::Debug},
    {"info", Level::kInfo, quill::LogLevel::Info},
    {"warning", Level::kWarning, quill::LogLevel::Warning},
    {"error", Level::kError, quill::LogLevel::Error},
    {"critical", Level::kCritical, quill::LogLevel::Critical},
    {"warn", Level::kWarning, quill::LogLevel::Warning},
}};

[[nodiscard]] const LevelEntry& entryFor(Level level) noexcept {
    for (const auto& entry : kLevels) {
        if (entry.level == level) {
            return entry;
        }
    }
    return kLevels[2];
}

[[nodiscard]] bool equalsIgnoreCase(std::string_view lhs, std::string_view rhs) noexcept {
    if (lhs.size() != rhs.size()) {
        return false;
    }
    for (std::size_t i = 0; i < lhs.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(lhs[i])) !=
            std::tolower(static_cast<unsigned char>(rhs[i]))) {
            return false;
        }
    }
    return true;
}

// =============================================================================
// Global State
// =============================================================================

std::atomic<quill::Logger*> gLogger{nullptr};

/// @brief Serializes init() against shutdown().
std::mutex gLifecycleMutex;

[[nodiscard]] std::shared_ptr<quill::Sink> makeFileSink(const std::string& path) {
    quill::FileSinkConfig fileConfig;
    // Each run starts a fresh log
    fileConfig.set_open_mode('w');
    return quill::Frontend::create_or_get_sink<quill::FileSink>(path, fileConfig,
                                                                quill::FileEventNotifier{});
}

}  // namespace

// =============================================================================
// Level Conversion
// =============================================================================

quill::LogLevel toQuillLevel(Level level) noexcept {
    return entryFor(level).quillLevel;
}

std::optional<Level> levelFromString(std::string_view levelStr) {
    for (const auto& entry : kLevels) {
        if (equalsIgnoreCase(entry.name, levelStr)) {
            return entry.level;
        }
    }
    return std::nullopt;
}

std::string_view levelToString(Level level) noexcept {
    return entryFor(level).name;
}

// =============================================================================
// Lifecycle
// =============================================================================

void init(const Config& config) {
    std::lock_guard<std::mutex> lock(gLifecycleMutex);
    if (gLogger.load(std::memory_order_acquire) != nullptr) {
        return;
    }

    std::vector<std::shared_ptr<quill::Sink>> sinks;
    if (config.enableConsole) {
        sinks.push_back(quill::Frontend::create_or_get_sink<quill::ConsoleSink>("console"));
    }
    if (!config.logFile.empty()) {
        sinks.push_back(makeFileSink(config.logFile));
    }
    if (sinks.empty()) {
        // Nothing to write to; leave the macros disabled
        return;
    }

    quill::Backend::start(quill::BackendOptions{});

    quill::Logger* created = quill::Frontend::create_or_get_logger(config.loggerName,
                                                                   std::move(sinks));
    created->set_log_level(toQuillLevel(config.level));
    gLogger.store(created, std::memory_order_release);
}

quill::Logger* logger() noexcept {
    return gLogger.load(std::memory_order_acquire);
}

bool isInitialized() noexcept {
    return logger() != nullptr;
}

void flush() {
    if (quill::Logger* current = logger(); current != nullptr) {
        current->flush_log();
    }
}

void shutdown() {
    std::lock_guard<std::mutex> lock(gLifecycleMutex);
    quill::Logger* current = gLogger.exchange(nullptr, std::memory_order_acq_rel);
    if (current == nullptr) {
        return;
    }
    current->flush_log();
    quill::Backend::stop();
}

}  // namespace fqd::log
