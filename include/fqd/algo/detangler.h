// =============================================================================
// fastq-detangler - Detangler
// =============================================================================
// Splits interleaved reads into four buckets by mate number and by whether
// the opposite mate is present, then sorts each bucket by identifier.
//
// Algorithm:
// 1. Index pass: buffer every record and build the PairingIndex
// 2. Classification pass: route each record to its bucket
// 3. Ordering: sort each bucket by identifier (byte-wise lexicographic)
//
// Identifiers are unique within a bucket (duplicates fail the index pass), so
// the sorted order is total. Sorting Paired-R1 and Paired-R2 by the same key
// puts the Nth records of the two buckets in the same pair.
// =============================================================================

#ifndef FQD_ALGO_DETANGLER_H
#define FQD_ALGO_DETANGLER_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

#include "fqd/common/error.h"
#include "fqd/common/types.h"
#include "fqd/io/fastq_parser.h"

namespace fqd::algo {

// =============================================================================
// Detangled Reads
// =============================================================================

/// @brief The four sorted output buckets of one detangle run.
struct DetangledReads {
    /// @brief Records per bucket, indexed by bucketIndex().
    std::array<std::vector<io::ReadRecord>, kBucketCount> buckets;

    /// @brief Distinct identifiers in the input.
    std::size_t identifierCount = 0;

    /// @brief Identifiers holding both mates.
    std::size_t pairCount = 0;

    [[nodiscard]] std::vector<io::ReadRecord>& bucket(OutputBucket which) noexcept {
        return buckets[bucketIndex(which)];
    }

    [[nodiscard]] const std::vector<io::ReadRecord>& bucket(OutputBucket which) const noexcept {
        return buckets[bucketIndex(which)];
    }

    /// @brief Records across all buckets.
    [[nodiscard]] std::size_t totalRecords() const noexcept {
        std::size_t total = 0;
        for (const auto& records : buckets) {
            total += records.size();
        }
        return total;
    }
};

// =============================================================================
// Detangler Configuration
// =============================================================================

struct DetanglerConfig {
    /// @brief Sort the four buckets concurrently.
    bool parallelSort = true;
};

// =============================================================================
// Detangler Class
// =============================================================================

/// @brief Classifies and orders interleaved reads.
///
/// Holds no state between calls; each detangle() is a pure function of its
/// input.
///
/// Usage:
/// @code
/// FastqParser parser(path);
/// parser.open();
/// auto reads = Detangler{}.detangle(parser);
/// for (const auto& record : reads.bucket(OutputBucket::kPairedR1)) { ... }
/// @endcode
class Detangler {
public:
    explicit Detangler(DetanglerConfig config = {});

    /// @brief Consume all records from a parser and detangle them.
    /// @throws MalformedRecordError, UnrecognizedMateSuffixError from parsing.
    /// @throws DuplicateMateError if an identifier repeats with the same mate.
    [[nodiscard]] DetangledReads detangle(io::FastqParser& parser) const;

    /// @brief Detangle an already-buffered record sequence.
    /// @throws DuplicateMateError if an identifier repeats with the same mate.
    [[nodiscard]] DetangledReads detangle(std::vector<io::ReadRecord> records) const;

    [[nodiscard]] const DetanglerConfig& config() const noexcept { return config_; }

private:
    void sortBuckets(DetangledReads& reads) const;

    DetanglerConfig config_;
};

/// @brief Sort records by identifier, ascending, byte-wise.
/// @note Returns without sorting if the records are already in order.
void sortByIdentifier(std::vector<io::ReadRecord>& records);

/// @brief Check that a bucket is ordered by identifier.
[[nodiscard]] bool isSortedByIdentifier(const std::vector<io::ReadRecord>& records) noexcept;

}  // namespace fqd::algo

#endif  // FQD_ALGO_DETANGLER_H
