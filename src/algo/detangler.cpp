// =============================================================================
// fastq-detangler - Detangler Implementation
// =============================================================================

#include "fqd/algo/detangler.h"

#include <algorithm>
#include <utility>

#include <tbb/parallel_invoke.h>

#include "fqd/algo/pairing_index.h"
#include "fqd/common/logger.h"

namespace fqd::algo {

namespace {

/// @brief Route buffered records to buckets using a completed index.
DetangledReads distribute(std::vector<io::ReadRecord>& records, const PairingIndex& index) {
    DetangledReads reads;
    reads.identifierCount = index.size();
    reads.pairCount = index.pairCount();

    // Paired buckets hold exactly pairCount records each
    reads.bucket(OutputBucket::kPairedR1).reserve(index.pairCount());
    reads.bucket(OutputBucket::kPairedR2).reserve(index.pairCount());

    for (auto& record : records) {
        const OutputBucket target = classify(record.mate, index.hasPartner(record));
        reads.bucket(target).push_back(std::move(record));
    }
    records.clear();

    return reads;
}

}  // namespace

// =============================================================================
// Detangler Implementation
// =============================================================================

Detangler::Detangler(DetanglerConfig config) : config_(config) {}

DetangledReads Detangler::detangle(io::FastqParser& parser) const {
    std::vector<io::ReadRecord> records;
    PairingIndex index;

    // Index pass: buffer and index together so the input is read once
    parser.forEach([&](io::ReadRecord& record) {
        ErrorContext context(parser.sourceName());
        context.withLine(record.lineNumber).withRecord(parser.recordNumber());
        index.insert(record.identifier, record.mate, context);
        records.push_back(std::move(record));
        return true;
    });

    FQD_LOG_DEBUG("Indexed {} records: {} identifiers, {} pairs", records.size(), index.size(),
                  index.pairCount());

    DetangledReads reads = distribute(records, index);
    sortBuckets(reads);
    return reads;
}

DetangledReads Detangler::detangle(std::vector<io::ReadRecord> records) const {
    PairingIndex index;
    index.reserve(records.size());

    RecordNumber recordNumber = 0;
    for (const auto& record : records) {
        ErrorContext context;
        context.withRecord(++recordNumber);
        if (record.lineNumber != 0) {
            context.withLine(record.lineNumber);
        }
        index.insert(record.identifier, record.mate, context);
    }

    FQD_LOG_DEBUG("Indexed {} records: {} identifiers, {} pairs", records.size(), index.size(),
                  index.pairCount());

    DetangledReads reads = distribute(records, index);
    sortBuckets(reads);
    return reads;
}

void Detangler::sortBuckets(DetangledReads& reads) const {
    auto& buckets = reads.buckets;
    if (config_.parallelSort) {
        tbb::parallel_invoke([&] { sortByIdentifier(buckets[0]); },
                             [&] { sortByIdentifier(buckets[1]); },
                             [&] { sortByIdentifier(buckets[2]); },
                             [&] { sortByIdentifier(buckets[3]); });
    } else {
        for (auto& bucket : buckets) {
            sortByIdentifier(bucket);
        }
    }
}

// =============================================================================
// Ordering Utilities
// =============================================================================

void sortByIdentifier(std::vector<io::ReadRecord>& records) {
    // Already in order
    if (isSortedByIdentifier(records)) {
        return;
    }
    std::stable_sort(records.begin(), records.end(),
                     [](const io::ReadRecord& a, const io::ReadRecord& b) {
                         return a.identifier < b.identifier;
                     });
}

bool isSortedByIdentifier(const std::vector<io::ReadRecord>& records) noexcept {
    return std::is_sorted(records.begin(), records.end(),
                          [](const io::ReadRecord& a, const io::ReadRecord& b) {
                              return a.identifier < b.identifier;
                          });
}

}  // namespace fqd::algo
