// =============================================================================
// fastq-detangler - FASTQ Writer Tests
// =============================================================================

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include "fqd/algo/detangler.h"
#include "fqd/io/fastq_writer.h"

namespace fqd::io::test {
namespace {

namespace fs = std::filesystem;

// =============================================================================
// Test Fixture
// =============================================================================

class FastqWriterTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir_ = fs::temp_directory_path() /
               (std::string("fqd_writer_") + info->test_suite_name() + "_" + info->name());
        fs::remove_all(dir_);
        fs::create_directories(dir_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    [[nodiscard]] static std::string readFile(const fs::path& path) {
        std::ifstream in(path, std::ios::binary);
        std::ostringstream oss;
        oss << in.rdbuf();
        return oss.str();
    }

    [[nodiscard]] static ReadRecord makeRecord(const std::string& id, MateNumber mate) {
        ReadRecord record;
        record.identifier = id;
        record.mate = mate;
        record.rawHeader = record.header();
        record.sequence = "ACGT";
        record.separator = "+";
        record.quality = "IIII";
        return record;
    }

    fs::path dir_;
};

// =============================================================================
// Output Naming
// =============================================================================

TEST(OutputPathsTest, AppendsBucketSuffixes) {
    auto paths = outputPathsForPrefix("out/sample");
    EXPECT_EQ(paths[bucketIndex(OutputBucket::kUnpairedR1)],
              fs::path("out/sample_R1_ordered_with_missing_R2.fastq"));
    EXPECT_EQ(paths[bucketIndex(OutputBucket::kUnpairedR2)],
              fs::path("out/sample_R2_ordered_with_missing_R1.fastq"));
    EXPECT_EQ(paths[bucketIndex(OutputBucket::kPairedR1)], fs::path("out/sample_R1_paired.fastq"));
    EXPECT_EQ(paths[bucketIndex(OutputBucket::kPairedR2)], fs::path("out/sample_R2_paired.fastq"));
}

// =============================================================================
// FastqWriter
// =============================================================================

TEST_F(FastqWriterTest, CommitRenamesTempFile) {
    const auto path = dir_ / "out.fastq";
    {
        FastqWriter writer(path);
        EXPECT_TRUE(fs::exists(writer.tempPath()));
        EXPECT_FALSE(fs::exists(path));

        writer.write(makeRecord("a", MateNumber::kFirst));
        writer.write(makeRecord("b", MateNumber::kSecond));
        writer.commit();

        EXPECT_TRUE(writer.isCommitted());
        EXPECT_EQ(writer.recordsWritten(), 2u);
        EXPECT_EQ(writer.bytesWritten(), 34u);
        EXPECT_FALSE(fs::exists(writer.tempPath()));
    }

    EXPECT_EQ(readFile(path), "@a/1\nACGT\n+\nIIII\n@b/2\nACGT\n+\nIIII\n");
}

TEST_F(FastqWriterTest, EmptyOutputIsCreated) {
    const auto path = dir_ / "empty.fastq";
    FastqWriter writer(path);
    writer.commit();

    ASSERT_TRUE(fs::exists(path));
    EXPECT_EQ(fs::file_size(path), 0u);
}

TEST_F(FastqWriterTest, DestructorDiscardsUncommittedOutput) {
    const auto path = dir_ / "out.fastq";
    fs::path tempPath;
    {
        FastqWriter writer(path);
        tempPath = writer.tempPath();
        writer.write(makeRecord("a", MateNumber::kFirst));
    }

    EXPECT_FALSE(fs::exists(path));
    EXPECT_FALSE(fs::exists(tempPath));
}

TEST_F(FastqWriterTest, AbortDiscardsTempFile) {
    const auto path = dir_ / "out.fastq";
    FastqWriter writer(path);
    writer.write(makeRecord("a", MateNumber::kFirst));
    writer.abort();

    EXPECT_FALSE(fs::exists(writer.tempPath()));
    EXPECT_FALSE(fs::exists(path));
    EXPECT_THROW(writer.write(makeRecord("b", MateNumber::kFirst)), IOError);
}

TEST_F(FastqWriterTest, CommitReplacesExistingFile) {
    const auto path = dir_ / "out.fastq";
    {
        std::ofstream out(path);
        out << "stale contents\n";
    }

    FastqWriter writer(path);
    writer.write(makeRecord("a", MateNumber::kSecond));
    writer.commit();

    EXPECT_EQ(readFile(path), "@a/2\nACGT\n+\nIIII\n");
}

TEST_F(FastqWriterTest, MissingDirectoryFailsToOpen) {
    EXPECT_THROW(FastqWriter(dir_ / "no_such_dir" / "out.fastq"), IOError);
}

TEST_F(FastqWriterTest, WriteAfterCloseFails) {
    FastqWriter writer(dir_ / "out.fastq");
    writer.close();
    EXPECT_THROW(writer.write(makeRecord("a", MateNumber::kFirst)), IOError);
}

// =============================================================================
// BucketWriterSet
// =============================================================================

TEST_F(FastqWriterTest, BucketWriterSetWritesAllFour) {
    algo::DetangledReads reads;
    reads.bucket(OutputBucket::kUnpairedR1).push_back(makeRecord("c", MateNumber::kFirst));
    reads.bucket(OutputBucket::kUnpairedR2).push_back(makeRecord("b", MateNumber::kSecond));
    reads.bucket(OutputBucket::kPairedR1).push_back(makeRecord("a", MateNumber::kFirst));
    reads.bucket(OutputBucket::kPairedR2).push_back(makeRecord("a", MateNumber::kSecond));

    const auto paths = outputPathsForPrefix((dir_ / "sample").string());
    {
        BucketWriterSet writers(paths);
        writers.writeAll(reads);
        for (OutputBucket bucket : kAllBuckets) {
            EXPECT_TRUE(writers.writer(bucket).isCommitted());
            EXPECT_EQ(writers.writer(bucket).recordsWritten(), 1u);
        }
    }

    EXPECT_EQ(readFile(paths[bucketIndex(OutputBucket::kUnpairedR1)]), "@c/1\nACGT\n+\nIIII\n");
    EXPECT_EQ(readFile(paths[bucketIndex(OutputBucket::kUnpairedR2)]), "@b/2\nACGT\n+\nIIII\n");
    EXPECT_EQ(readFile(paths[bucketIndex(OutputBucket::kPairedR1)]), "@a/1\nACGT\n+\nIIII\n");
    EXPECT_EQ(readFile(paths[bucketIndex(OutputBucket::kPairedR2)]), "@a/2\nACGT\n+\nIIII\n");
}

TEST_F(FastqWriterTest, BucketWriterSetLeavesNothingWhenAbandoned) {
    const auto paths = outputPathsForPrefix((dir_ / "sample").string());
    {
        BucketWriterSet writers(paths);
    }

    for (const auto& path : paths) {
        EXPECT_FALSE(fs::exists(path));
        EXPECT_FALSE(fs::exists(path.string() + std::string(kTempSuffix)));
    }
}

TEST_F(FastqWriterTest, BucketWriterSetRollsBackOnRenameFailure) {
    const auto paths = outputPathsForPrefix((dir_ / "sample").string());

    // A directory at the last output name makes its rename fail
    const auto blocked = paths[kBucketCount - 1];
    fs::create_directories(blocked / "occupied");

    algo::DetangledReads reads;
    reads.bucket(OutputBucket::kPairedR1).push_back(makeRecord("a", MateNumber::kFirst));

    {
        BucketWriterSet writers(paths);
        EXPECT_THROW(writers.writeAll(reads), IOError);
    }

    for (std::size_t i = 0; i + 1 < kBucketCount; ++i) {
        EXPECT_FALSE(fs::exists(paths[i])) << paths[i];
        EXPECT_FALSE(fs::exists(paths[i].string() + std::string(kTempSuffix))) << paths[i];
    }
    EXPECT_TRUE(fs::is_directory(blocked));
}

TEST_F(FastqWriterTest, BucketWriterSetKeepsPreviousOutputsOnRenameFailure) {
    const auto paths = outputPathsForPrefix((dir_ / "sample").string());
    for (const auto& path : paths) {
        std::ofstream out(path, std::ios::binary);
        out << "previous run\n";
    }

    // Replace the last previous output with a directory its rename cannot overwrite
    const auto blocked = paths[kBucketCount - 1];
    fs::remove(blocked);
    fs::create_directories(blocked / "occupied");

    algo::DetangledReads reads;
    reads.bucket(OutputBucket::kUnpairedR1).push_back(makeRecord("c", MateNumber::kFirst));
    reads.bucket(OutputBucket::kPairedR1).push_back(makeRecord("a", MateNumber::kFirst));

    {
        BucketWriterSet writers(paths);
        EXPECT_THROW(writers.writeAll(reads), IOError);
    }

    for (std::size_t i = 0; i + 1 < kBucketCount; ++i) {
        EXPECT_EQ(readFile(paths[i]), "previous run\n") << paths[i];
        EXPECT_FALSE(fs::exists(backupPathFor(paths[i]))) << paths[i];
        EXPECT_FALSE(fs::exists(paths[i].string() + std::string(kTempSuffix))) << paths[i];
    }
    EXPECT_TRUE(fs::is_directory(blocked / "occupied"));
}

TEST_F(FastqWriterTest, BucketWriterSetReplacesPreviousOutputs) {
    const auto paths = outputPathsForPrefix((dir_ / "sample").string());
    for (const auto& path : paths) {
        std::ofstream out(path, std::ios::binary);
        out << "previous run\n";
    }

    algo::DetangledReads reads;
    reads.bucket(OutputBucket::kPairedR2).push_back(makeRecord("a", MateNumber::kSecond));

    {
        BucketWriterSet writers(paths);
        writers.writeAll(reads);
    }

    EXPECT_EQ(readFile(paths[bucketIndex(OutputBucket::kPairedR2)]), "@a/2\nACGT\n+\nIIII\n");
    EXPECT_EQ(fs::file_size(paths[bucketIndex(OutputBucket::kUnpairedR1)]), 0u);
    for (const auto& path : paths) {
        EXPECT_FALSE(fs::exists(backupPathFor(path))) << path;
    }
}

TEST_F(FastqWriterTest, WriteCountsFormattedBytes) {
    auto record = makeRecord("frag", MateNumber::kFirst);
    record.separator = "+frag/1";

    const auto path = dir_ / "out.fastq";
    FastqWriter writer(path);
    writer.write(record);
    writer.commit();

    EXPECT_EQ(writer.bytesWritten(), record.formattedSize());
    EXPECT_EQ(fs::file_size(path), record.formattedSize());
}

}  // namespace
}  // namespace fqd::io::test
