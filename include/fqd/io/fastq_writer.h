// =============================================================================
// fastq-detangler - FASTQ Writer
// =============================================================================
// Writes FASTQ records to "<path>.tmp" and moves the file into place on
// commit, so a failed run never leaves a partially written output.
//
// This module provides:
// - FastqWriter: One output file, temporary file + rename
// - BucketWriterSet: The four bucket outputs, committed together
// - outputPathsForPrefix(): Output file names for a prefix
//
// Usage:
//   BucketWriterSet writers(outputPathsForPrefix("sample"));
//   writers.writeAll(reads);   // writes, closes and commits all four
// =============================================================================

#ifndef FQD_IO_FASTQ_WRITER_H
#define FQD_IO_FASTQ_WRITER_H

#include <array>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "fqd/common/error.h"
#include "fqd/common/types.h"
#include "fqd/io/fastq_parser.h"

namespace fqd::algo {
struct DetangledReads;
}  // namespace fqd::algo

namespace fqd::io {

/// @brief Suffix of the temporary file written before commit.
inline constexpr std::string_view kTempSuffix = ".tmp";

/// @brief Suffix a previous output is moved to while a new set commits.
inline constexpr std::string_view kBackupSuffix = ".bak";

/// @brief Output path per bucket, indexed by bucketIndex().
using OutputPaths = std::array<std::filesystem::path, kBucketCount>;

/// @brief Output file names for a prefix ("{prefix}_R1_paired.fastq", ...).
[[nodiscard]] OutputPaths outputPathsForPrefix(std::string_view prefix);

/// @brief Where an existing output is kept until the new set has committed.
[[nodiscard]] std::filesystem::path backupPathFor(const std::filesystem::path& outputPath);

// =============================================================================
// FastqWriter Class
// =============================================================================

/// @brief Writes one FASTQ file through a temporary path.
///
/// Lifecycle: write*() -> close() -> commit(). An uncommitted writer removes
/// its temporary file on abort() or destruction.
class FastqWriter {
public:
    /// @brief Open "<outputPath>.tmp" for writing.
    /// @throws IOError if the temporary file cannot be created.
    explicit FastqWriter(std::filesystem::path outputPath);

    ~FastqWriter();

    FastqWriter(const FastqWriter&) = delete;
    FastqWriter& operator=(const FastqWriter&) = delete;
    FastqWriter(FastqWriter&&) = delete;
    FastqWriter& operator=(FastqWriter&&) = delete;

    /// @brief Append one record (header rebuilt from identifier and mate).
    /// @throws IOError on write failure.
    void write(const ReadRecord& record);

    /// @brief Append records in order.
    /// @throws IOError on write failure.
    void writeAll(std::span<const ReadRecord> records);

    /// @brief Flush and close the temporary file.
    /// @throws IOError if buffered data cannot be written.
    void close();

    /// @brief Rename the temporary file to the output path.
    /// @note Calls close() first if needed.
    /// @throws IOError if the rename fails.
    void commit();

    /// @brief Discard the temporary file. No-op after commit().
    void abort() noexcept;

    [[nodiscard]] bool isCommitted() const noexcept { return committed_; }

    [[nodiscard]] const std::filesystem::path& outputPath() const noexcept { return outputPath_; }

    [[nodiscard]] const std::filesystem::path& tempPath() const noexcept { return tempPath_; }

    [[nodiscard]] std::uint64_t recordsWritten() const noexcept { return recordsWritten_; }

    [[nodiscard]] std::uint64_t bytesWritten() const noexcept { return bytesWritten_; }

private:
    void ensureWritable() const;

    void cleanupTempFile() noexcept;

    std::filesystem::path outputPath_;
    std::filesystem::path tempPath_;
    std::ofstream stream_;
    bool closed_ = false;
    bool committed_ = false;
    bool aborted_ = false;
    std::uint64_t recordsWritten_ = 0;
    std::uint64_t bytesWritten_ = 0;
};

// =============================================================================
// BucketWriterSet Class
// =============================================================================

/// @brief The four bucket outputs of one run, committed all-or-nothing.
///
/// Every bucket is written and closed before the first rename. Existing
/// outputs are moved to their backup paths first. If a rename fails, the new
/// outputs already in place are removed, the backups are moved back and the
/// remaining temporary files are discarded; on success the backups are
/// deleted.
class BucketWriterSet {
public:
    /// @throws IOError if any temporary file cannot be created.
    explicit BucketWriterSet(const OutputPaths& paths);

    ~BucketWriterSet();

    BucketWriterSet(const BucketWriterSet&) = delete;
    BucketWriterSet& operator=(const BucketWriterSet&) = delete;

    /// @brief Write every bucket, then commit all four files.
    /// @throws IOError on any write, close or rename failure.
    void writeAll(const algo::DetangledReads& reads);

    /// @brief Discard all uncommitted output.
    void abort() noexcept;

    [[nodiscard]] const FastqWriter& writer(OutputBucket bucket) const noexcept {
        return *writers_[bucketIndex(bucket)];
    }

private:
    void commitAll();

    /// @throws IOError if an existing output cannot be moved aside.
    void backupExistingOutputs();

    void restoreBackups() noexcept;

    void discardBackups() noexcept;

    std::array<std::unique_ptr<FastqWriter>, kBucketCount> writers_;
    std::array<bool, kBucketCount> hasBackup_{};
};

}  // namespace fqd::io

#endif  // FQD_IO_FASTQ_WRITER_H
