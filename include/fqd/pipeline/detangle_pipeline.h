// =============================================================================
// fastq-detangler - Detangle Pipeline
// =============================================================================
// End-to-end run: validate input -> parse -> detangle -> write four outputs.
//
// Either all four output files are committed or none are: parse and pairing
// errors abort before any output is opened, and write errors discard the
// temporary files.
//
// Usage:
//   auto summary = fqd::pipeline::detangleFile("in.fastq", "out/sample");
//   summary.count(OutputBucket::kPairedR1);
// =============================================================================

#ifndef FQD_PIPELINE_DETANGLE_PIPELINE_H
#define FQD_PIPELINE_DETANGLE_PIPELINE_H

#include <array>
#include <cstdint>
#include <filesystem>
#include <string_view>

#include "fqd/algo/detangler.h"
#include "fqd/common/error.h"
#include "fqd/common/types.h"
#include "fqd/io/fastq_writer.h"

namespace fqd::pipeline {

// =============================================================================
// Detangle Summary
// =============================================================================

/// @brief Counts and timings from one run.
struct DetangleSummary {
    /// @brief Records read from the input.
    std::uint64_t totalRecords = 0;

    /// @brief Records carrying "/1".
    std::uint64_t firstMates = 0;

    /// @brief Records carrying "/2".
    std::uint64_t secondMates = 0;

    /// @brief Identifiers with both mates present.
    std::uint64_t pairs = 0;

    /// @brief Records written per bucket, indexed by bucketIndex().
    std::array<std::uint64_t, kBucketCount> bucketCounts{};

    /// @brief Final output file per bucket.
    io::OutputPaths outputPaths;

    /// @brief Input size in bytes.
    std::uint64_t inputBytes = 0;

    /// @brief Time spent parsing, indexing, classifying and sorting.
    double detangleSeconds = 0.0;

    /// @brief Time spent writing and committing the outputs.
    double writeSeconds = 0.0;

    [[nodiscard]] std::uint64_t count(OutputBucket bucket) const noexcept {
        return bucketCounts[bucketIndex(bucket)];
    }

    [[nodiscard]] double totalSeconds() const noexcept {
        return detangleSeconds + writeSeconds;
    }

    /// @brief Reads processed per second over the whole run.
    [[nodiscard]] double readsPerSecond() const noexcept {
        const double total = totalSeconds();
        return total > 0.0 ? static_cast<double>(totalRecords) / total : 0.0;
    }
};

// =============================================================================
// Pipeline Entry Point
// =============================================================================

/// @brief Detangle an interleaved FASTQ file into four output files.
/// @param inputPath Interleaved input.
/// @param outputPrefix Prefix the four output file suffixes are appended to.
/// @param config Detangler configuration.
/// @return Per-bucket counts.
/// @throws UsageError if the output prefix is empty.
/// @throws IOError if the input is missing, not a regular file, unreadable,
///         or an output cannot be written.
/// @throws EmptyInputError if the input has no records.
/// @throws MalformedRecordError, UnrecognizedMateSuffixError,
///         DuplicateMateError for invalid content.
[[nodiscard]] DetangleSummary detangleFile(const std::filesystem::path& inputPath,
                                           std::string_view outputPrefix,
                                           const algo::DetanglerConfig& config = {});

/// @brief Write already-detangled reads to the four outputs of a prefix.
/// @throws IOError if an output cannot be written; nothing is committed then.
void writeOutputs(const algo::DetangledReads& reads, const io::OutputPaths& paths);

}  // namespace fqd::pipeline

#endif  // FQD_PIPELINE_DETANGLE_PIPELINE_H
