// =============================================================================
// fastq-detangler - FASTQ Writer Implementation
// =============================================================================
// Atomic output using the temporary file + rename strategy.
// =============================================================================

#include "fqd/io/fastq_writer.h"

#include <cerrno>
#include <system_error>

#include <fmt/format.h>

#include "fqd/algo/detangler.h"
#include "fqd/common/logger.h"

namespace fqd::io {

std::filesystem::path backupPathFor(const std::filesystem::path& outputPath) {
    return std::filesystem::path(outputPath.string() + std::string(kBackupSuffix));
}

OutputPaths outputPathsForPrefix(std::string_view prefix) {
    OutputPaths paths;
    for (OutputBucket bucket : kAllBuckets) {
        paths[bucketIndex(bucket)] =
            std::filesystem::path(fmt::format("{}{}", prefix, bucketFileSuffix(bucket)));
    }
    return paths;
}

// =============================================================================
// FastqWriter Implementation
// =============================================================================

FastqWriter::FastqWriter(std::filesystem::path outputPath)
    : outputPath_(std::move(outputPath)),
      tempPath_(outputPath_.string() + std::string(kTempSuffix)) {
    stream_.open(tempPath_, std::ios::binary | std::ios::trunc);
    if (!stream_.is_open()) {
        throw IOError("Failed to create temporary file",
                      std::error_code(errno, std::generic_category()),
                      ErrorContext(tempPath_.string()));
    }

    FQD_LOG_DEBUG("FastqWriter created: output={}, temp={}", outputPath_.string(),
                  tempPath_.string());
}

FastqWriter::~FastqWriter() {
    if (!committed_ && !aborted_) {
        abort();
    }
}

void FastqWriter::write(const ReadRecord& record) {
    ensureWritable();

    stream_ << record;
    if (!stream_.good()) {
        throw IOError("Failed to write to file", ErrorContext(tempPath_.string()));
    }

    ++recordsWritten_;
    bytesWritten_ += record.formattedSize();
}

void FastqWriter::writeAll(std::span<const ReadRecord> records) {
    for (const auto& record : records) {
        write(record);
    }
}

void FastqWriter::close() {
    if (closed_) {
        return;
    }
    ensureWritable();

    stream_.flush();
    if (!stream_.good()) {
        throw IOError("Failed to flush output file", ErrorContext(tempPath_.string()));
    }
    stream_.close();
    if (stream_.fail()) {
        throw IOError("Failed to close output file", ErrorContext(tempPath_.string()));
    }
    closed_ = true;
}

void FastqWriter::commit() {
    if (committed_) {
        return;
    }
    close();

    std::error_code ec;
    std::filesystem::rename(tempPath_, outputPath_, ec);
    if (ec) {
        throw IOError("Failed to rename temporary file to final output", ec,
                      ErrorContext(outputPath_.string()));
    }

    committed_ = true;
    FQD_LOG_DEBUG("Committed {} ({} reads, {} bytes)", outputPath_.string(), recordsWritten_,
                  bytesWritten_);
}

void FastqWriter::abort() noexcept {
    if (committed_ || aborted_) {
        return;
    }
    aborted_ = true;
    cleanupTempFile();
    FQD_LOG_DEBUG("FastqWriter aborted: {}", tempPath_.string());
}

void FastqWriter::ensureWritable() const {
    if (closed_ || committed_ || aborted_) {
        throw IOError("Writer is closed", ErrorContext(outputPath_.string()));
    }
}

void FastqWriter::cleanupTempFile() noexcept {
    if (stream_.is_open()) {
        stream_.close();
    }

    std::error_code ec;
    if (std::filesystem::exists(tempPath_, ec)) {
        std::filesystem::remove(tempPath_, ec);
        if (ec) {
            FQD_LOG_WARNING("Failed to remove temporary file: {}", tempPath_.string());
        }
    }
}

// =============================================================================
// BucketWriterSet Implementation
// =============================================================================

BucketWriterSet::BucketWriterSet(const OutputPaths& paths) {
    for (std::size_t i = 0; i < kBucketCount; ++i) {
        writers_[i] = std::make_unique<FastqWriter>(paths[i]);
    }
}

BucketWriterSet::~BucketWriterSet() { abort(); }

void BucketWriterSet::writeAll(const algo::DetangledReads& reads) {
    try {
        for (OutputBucket bucket : kAllBuckets) {
            writers_[bucketIndex(bucket)]->writeAll(reads.bucket(bucket));
        }
        for (auto& writer : writers_) {
            writer->close();
        }
    } catch (const FQDException&) {
        abort();
        throw;
    }

    commitAll();
}

void BucketWriterSet::commitAll() {
    backupExistingOutputs();

    for (std::size_t i = 0; i < kBucketCount; ++i) {
        try {
            writers_[i]->commit();
        } catch (const IOError&) {
            // Take back the new outputs already renamed, then put the previous ones back
            for (std::size_t j = 0; j < i; ++j) {
                std::error_code ec;
                std::filesystem::remove(writers_[j]->outputPath(), ec);
                if (ec) {
                    FQD_LOG_WARNING("Failed to remove committed output: {}",
                                    writers_[j]->outputPath().string());
                }
            }
            restoreBackups();
            abort();
            throw;
        }
    }

    discardBackups();
}

void BucketWriterSet::backupExistingOutputs() {
    for (std::size_t i = 0; i < kBucketCount; ++i) {
        const auto& output = writers_[i]->outputPath();
        std::error_code ec;
        if (!std::filesystem::is_regular_file(output, ec)) {
            continue;
        }

        std::filesystem::rename(output, backupPathFor(output), ec);
        if (ec) {
            restoreBackups();
            abort();
            throw IOError("Failed to move previous output aside", ec,
                          ErrorContext(output.string()));
        }
        hasBackup_[i] = true;
        FQD_LOG_DEBUG("Moved previous output aside: {}", output.string());
    }
}

void BucketWriterSet::restoreBackups() noexcept {
    for (std::size_t i = 0; i < kBucketCount; ++i) {
        if (!hasBackup_[i]) {
            continue;
        }
        const auto& output = writers_[i]->outputPath();
        const auto backup = backupPathFor(output);

        std::error_code ec;
        std::filesystem::rename(backup, output, ec);
        if (ec) {
            FQD_LOG_WARNING("Failed to restore previous output {} (left at {})", output.string(),
                            backup.string());
        }
        hasBackup_[i] = false;
    }
}

void BucketWriterSet::discardBackups() noexcept {
    for (std::size_t i = 0; i < kBucketCount; ++i) {
        if (!hasBackup_[i]) {
            continue;
        }
        const auto backup = backupPathFor(writers_[i]->outputPath());

        std::error_code ec;
        std::filesystem::remove(backup, ec);
        if (ec) {
            FQD_LOG_WARNING("Failed to remove previous output: {}", backup.string());
        }
        hasBackup_[i] = false;
    }
}

void BucketWriterSet::abort() noexcept {
    for (auto& writer : writers_) {
        if (writer) {
            writer->abort();
        }
    }
}

}  // namespace fqd::io
