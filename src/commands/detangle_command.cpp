// =============================================================================
// fastq-detangler - Detangle Command Implementation
// =============================================================================

#include "detangle_command.h"

#include <iostream>

#include <fmt/format.h>
#include <fmt/ostream.h>

#include "fqd/common/logger.h"

namespace fqd::commands {

DetangleCommand::DetangleCommand(DetangleOptions options) : options_(std::move(options)) {}

DetangleCommand::~DetangleCommand() = default;

DetangleCommand::DetangleCommand(DetangleCommand&&) noexcept = default;
DetangleCommand& DetangleCommand::operator=(DetangleCommand&&) noexcept = default;

int DetangleCommand::execute() {
    auto result = run();
    if (!result) {
        FQD_LOG_ERROR("Detangling failed: {}", result.error().message());
        std::cerr << "Error: " << result.error().message() << std::endl;
        return result.error().exitCode();
    }

    summary_ = std::move(*result);
    if (options_.showSummary) {
        printSummary(std::cout);
    }
    return 0;
}

Result<pipeline::DetangleSummary> DetangleCommand::run() const {
    algo::DetanglerConfig config;
    config.parallelSort = options_.parallelSort;

    return tryExecute(
        [&] { return pipeline::detangleFile(options_.inputPath, options_.outputPrefix, config); });
}

void DetangleCommand::printSummary(std::ostream& os) const {
    if (!summary_) {
        return;
    }

    fmt::print(os, "Successfully detangled {}\n", options_.inputPath.string());
    fmt::print(os, "Output files created with prefix: {}\n", options_.outputPrefix);
    fmt::print(os, "Files created:\n");
    for (OutputBucket bucket : kAllBuckets) {
        fmt::print(os, "  {} ({} reads, {})\n",
                   summary_->outputPaths[bucketIndex(bucket)].string(), summary_->count(bucket),
                   bucketToString(bucket));
    }
}

}  // namespace fqd::commands
