// =============================================================================
// fastq-detangler - Detangle Pipeline Implementation
// =============================================================================

#include "fqd/pipeline/detangle_pipeline.h"

#include <chrono>
#include <system_error>

#include "fqd/common/logger.h"
#include "fqd/io/fastq_parser.h"

namespace fqd::pipeline {

namespace {

using Clock = std::chrono::steady_clock;

[[nodiscard]] double secondsSince(Clock::time_point start) {
    return std::chrono::duration<double>(Clock::now() - start).count();
}

/// @brief Reject inputs that cannot hold reads before opening them.
/// @return Input size in bytes.
std::uint64_t validateInput(const std::filesystem::path& inputPath) {
    std::error_code ec;
    const auto status = std::filesystem::status(inputPath, ec);
    if (ec || !std::filesystem::exists(status)) {
        throw IOError("Input file not found", ErrorContext(inputPath.string()));
    }
    if (!std::filesystem::is_regular_file(status)) {
        throw IOError("Input path is not a file", ErrorContext(inputPath.string()));
    }

    const auto size = std::filesystem::file_size(inputPath, ec);
    if (ec) {
        throw IOError("Failed to stat input file", ec, ErrorContext(inputPath.string()));
    }
    if (size == 0) {
        throw EmptyInputError("Input file is empty", ErrorContext(inputPath.string()));
    }
    return static_cast<std::uint64_t>(size);
}

}  // namespace

DetangleSummary detangleFile(const std::filesystem::path& inputPath,
                             std::string_view outputPrefix,
                             const algo::DetanglerConfig& config) {
    if (outputPrefix.empty()) {
        throw UsageError("Output prefix must not be empty");
    }

    DetangleSummary summary;
    summary.outputPaths = io::outputPathsForPrefix(outputPrefix);

    FQD_LOG_INFO("Starting FASTQ detangling");
    FQD_LOG_INFO("Input file: {}", inputPath.string());
    FQD_LOG_INFO("Output prefix: {}", std::string(outputPrefix));

    summary.inputBytes = validateInput(inputPath);
    FQD_LOG_INFO("Input file size: {} bytes", summary.inputBytes);

    // Parse and index in a single read of the input
    auto start = Clock::now();
    io::FastqParser parser(inputPath);
    parser.open();
    algo::DetangledReads reads = algo::Detangler(config).detangle(parser);
    summary.detangleSeconds = secondsSince(start);

    const auto& stats = parser.stats();
    summary.totalRecords = stats.totalRecords;
    summary.firstMates = stats.firstMates;
    summary.secondMates = stats.secondMates;
    summary.pairs = reads.pairCount;

    if (summary.totalRecords == 0) {
        throw EmptyInputError("Input file contains no reads", ErrorContext(inputPath.string()));
    }

    FQD_LOG_INFO("Detangled {} reads in {:.2f} seconds ({} R1, {} R2)", summary.totalRecords,
                 summary.detangleSeconds, summary.firstMates, summary.secondMates);

    for (OutputBucket bucket : kAllBuckets) {
        summary.bucketCounts[bucketIndex(bucket)] = reads.bucket(bucket).size();
    }
    FQD_LOG_INFO("R1 reads with missing pairs: {}", summary.count(OutputBucket::kUnpairedR1));
    FQD_LOG_INFO("R2 reads with missing pairs: {}", summary.count(OutputBucket::kUnpairedR2));
    FQD_LOG_INFO("Paired reads: {} pairs", summary.pairs);

    start = Clock::now();
    writeOutputs(reads, summary.outputPaths);
    summary.writeSeconds = secondsSince(start);

    FQD_LOG_INFO("File writing completed in {:.2f} seconds", summary.writeSeconds);
    FQD_LOG_INFO("Total processing time: {:.2f} seconds ({:.0f} reads/second)",
                 summary.totalSeconds(), summary.readsPerSecond());
    return summary;
}

void writeOutputs(const algo::DetangledReads& reads, const io::OutputPaths& paths) {
    io::BucketWriterSet writers(paths);
    writers.writeAll(reads);

    for (OutputBucket bucket : kAllBuckets) {
        const auto& writer = writers.writer(bucket);
        FQD_LOG_INFO("Written: {} ({} reads)", writer.outputPath().string(),
                     writer.recordsWritten());
    }
}

}  // namespace fqd::pipeline
