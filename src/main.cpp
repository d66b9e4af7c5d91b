// =============================================================================
// fastq-detangler - Interleaved FASTQ Detangler
// =============================================================================
// Main entry point for the fastq-detangler command-line tool.
//
// This file implements the CLI using CLI11, providing:
// - Positional arguments: input file, output prefix
// - Logging options: verbose, quiet, log level, log file
// - Sorting option: serial bucket sort
// =============================================================================

#include <CLI/CLI.hpp>

#include <cstdlib>
#include <iostream>
#include <string>

#include "fqd/common/error.h"
#include "fqd/common/logger.h"

#include "commands/detangle_command.h"

namespace {

// =============================================================================
// Version Information
// =============================================================================

constexpr const char* kVersion = "0.1.0";
constexpr const char* kDescription =
    "fastq-detangler: Detangle an interleaved FASTQ file into separate R1/R2 files\n\n"
    "Reads whose headers end in /1 or /2 are split into four files sorted by read name:\n"
    "  {prefix}_R1_ordered_with_missing_R2.fastq\n"
    "  {prefix}_R2_ordered_with_missing_R1.fastq\n"
    "  {prefix}_R1_paired.fastq\n"
    "  {prefix}_R2_paired.fastq\n"
    "The Nth reads of the two paired files are mates.";

// =============================================================================
// CLI Options
// =============================================================================

struct CliOptions {
    std::string input;
    std::string outputPrefix;
    int verbosity = 0;  // 0 = info, 1+ = debug
    bool quiet = false;
    std::string logFile;
    std::string logLevel;
    bool serialSort = false;
};

}  // namespace

// =============================================================================
// Main Entry Point
// =============================================================================

int main(int argc, char* argv[]) {
    CliOptions opts;

    CLI::App app{kDescription};
    app.set_version_flag("-V,--version", kVersion);

    app.add_option("input", opts.input, "Input interleaved FASTQ file")
        ->required()
        ->check(CLI::ExistingFile);

    app.add_option("output_prefix", opts.outputPrefix,
                   "Output file prefix (four files are created with this prefix)")
        ->required();

    app.add_flag("-v,--verbose", opts.verbosity, "Increase verbosity (debug logging)");

    app.add_flag("-q,--quiet", opts.quiet, "Suppress non-error output");

    app.add_option("--log-file", opts.logFile, "Also write the log to this file");

    app.add_option("--log-level", opts.logLevel, "Log level (overrides -v and -q)")
        ->check(CLI::IsMember({"trace", "debug", "info", "warning", "warn", "error", "critical"},
                              CLI::ignore_case));

    app.add_flag("--serial-sort", opts.serialSort, "Sort the output buckets one at a time");

    CLI11_PARSE(app, argc, argv);

    try {
        fqd::log::Config logConfig;
        logConfig.logFile = opts.logFile;
        if (auto level = fqd::log::levelFromString(opts.logLevel)) {
            logConfig.level = *level;
        } else if (opts.quiet) {
            logConfig.level = fqd::log::Level::kError;
        } else if (opts.verbosity >= 1) {
            logConfig.level = fqd::log::Level::kDebug;
        }
        fqd::log::init(logConfig);
        FQD_LOG_DEBUG("Log level: {}", fqd::log::levelToString(logConfig.level));
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize logger: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    fqd::commands::DetangleOptions detangleOpts;
    detangleOpts.inputPath = opts.input;
    detangleOpts.outputPrefix = opts.outputPrefix;
    detangleOpts.showSummary = !opts.quiet;
    detangleOpts.parallelSort = !opts.serialSort;

    fqd::commands::DetangleCommand command(std::move(detangleOpts));
    const int exitCode = command.execute();

    fqd::log::shutdown();
    return exitCode;
}
