// =============================================================================
// fastq-detangler - Detangle Command
// =============================================================================
// Command handler behind the fastq-detangler executable.
//
// This module provides:
// - DetangleOptions: Resolved command-line options
// - DetangleCommand: Runs the pipeline, prints the summary, maps errors to
//   exit codes
// =============================================================================

#ifndef FQD_COMMANDS_DETANGLE_COMMAND_H
#define FQD_COMMANDS_DETANGLE_COMMAND_H

#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>

#include "fqd/common/error.h"
#include "fqd/pipeline/detangle_pipeline.h"

namespace fqd::commands {

// =============================================================================
// Detangle Options
// =============================================================================

/// @brief Configuration options for the detangle command.
struct DetangleOptions {
    /// @brief Interleaved input FASTQ file.
    std::filesystem::path inputPath;

    /// @brief Prefix for the four output files.
    std::string outputPrefix;

    /// @brief Print the created files and per-bucket counts on success.
    bool showSummary = true;

    /// @brief Sort the four buckets concurrently.
    bool parallelSort = true;
};

// =============================================================================
// DetangleCommand Class
// =============================================================================

/// @brief Command handler for detangling one interleaved file.
class DetangleCommand {
public:
    explicit DetangleCommand(DetangleOptions options);

    ~DetangleCommand();

    DetangleCommand(const DetangleCommand&) = delete;
    DetangleCommand& operator=(const DetangleCommand&) = delete;
    DetangleCommand(DetangleCommand&&) noexcept;
    DetangleCommand& operator=(DetangleCommand&&) noexcept;

    /// @brief Execute the command.
    /// @return Exit code (0 = success, otherwise the error's exit code).
    [[nodiscard]] int execute();

    /// @brief Run the pipeline without printing.
    [[nodiscard]] Result<pipeline::DetangleSummary> run() const;

    [[nodiscard]] const DetangleOptions& options() const noexcept { return options_; }

    /// @brief Summary of the last successful execute().
    [[nodiscard]] const std::optional<pipeline::DetangleSummary>& summary() const noexcept {
        return summary_;
    }

private:
    /// @brief Print the created files and per-bucket counts.
    void printSummary(std::ostream& os) const;

    DetangleOptions options_;
    std::optional<pipeline::DetangleSummary> summary_;
};

}  // namespace fqd::commands

#endif  // FQD_COMMANDS_DETANGLE_COMMAND_H
