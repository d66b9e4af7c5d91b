// =============================================================================
// fastq-detangler - Common Type Definitions
// =============================================================================
// Core type definitions for the fastq-detangler library.
//
// This module defines:
// - MateNumber: Which read of a pair a record is (R1 or R2)
// - OutputBucket: The four output categories
// - RecordNumber: Type alias for 1-based record positions
// - FASTQ framing constants
//
// Naming Conventions:
// - Enums: PascalCase with kConstant values
// - Classes/Structs: PascalCase
// - Member variables: camelCase with trailing _
// - Constants: kConstant
// =============================================================================

#ifndef FQD_COMMON_TYPES_H
#define FQD_COMMON_TYPES_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace fqd {

// =============================================================================
// Type Aliases
// =============================================================================

/// @brief Type alias for record positions in the input.
/// @note 1-based, consistent with line numbers.
using RecordNumber = std::uint64_t;

// =============================================================================
// Constants
// =============================================================================

/// @brief First character of a header line.
inline constexpr char kRecordStartMarker = '@';

/// @brief First character of the separator (third) line.
inline constexpr char kSeparatorMarker = '+';

/// @brief Character separating the read name from the mate digit.
inline constexpr char kMateDelimiter = '/';

/// @brief Length of a mate suffix ("/1" or "/2").
inline constexpr std::size_t kMateSuffixLength = 2;

/// @brief Number of lines per FASTQ record.
inline constexpr std::size_t kLinesPerRecord = 4;

// =============================================================================
// Mate Number Enumeration
// =============================================================================

/// @brief Which read of a fragment a record is.
enum class MateNumber : std::uint8_t {
    /// @brief First in pair, header suffix "/1".
    kFirst = 0,

    /// @brief Second in pair, header suffix "/2".
    kSecond = 1
};

/// @brief The opposite mate number.
[[nodiscard]] constexpr MateNumber partnerOf(MateNumber mate) noexcept {
    return mate == MateNumber::kFirst ? MateNumber::kSecond : MateNumber::kFirst;
}

/// @brief The digit written after the delimiter for this mate.
[[nodiscard]] constexpr char mateDigit(MateNumber mate) noexcept {
    return mate == MateNumber::kFirst ? '1' : '2';
}

/// @brief Map a suffix digit back to a mate number.
[[nodiscard]] constexpr std::optional<MateNumber> mateFromDigit(char digit) noexcept {
    switch (digit) {
        case '1':
            return MateNumber::kFirst;
        case '2':
            return MateNumber::kSecond;
        default:
            return std::nullopt;
    }
}

[[nodiscard]] constexpr std::string_view mateNumberToString(MateNumber mate) noexcept {
    switch (mate) {
        case MateNumber::kFirst:
            return "R1";
        case MateNumber::kSecond:
            return "R2";
    }
    return "unknown";
}

// =============================================================================
// Output Bucket Enumeration
// =============================================================================

/// @brief Destination category of a record.
/// @note Values index DetangledReads::buckets.
enum class OutputBucket : std::uint8_t {
    /// @brief R1 reads whose R2 is absent.
    kUnpairedR1 = 0,

    /// @brief R2 reads whose R1 is absent.
    kUnpairedR2 = 1,

    /// @brief R1 reads whose R2 is present.
    kPairedR1 = 2,

    /// @brief R2 reads whose R1 is present.
    kPairedR2 = 3
};

inline constexpr std::size_t kBucketCount = 4;

/// @brief All buckets, in output file order.
inline constexpr std::array<OutputBucket, kBucketCount> kAllBuckets = {
    OutputBucket::kUnpairedR1, OutputBucket::kUnpairedR2, OutputBucket::kPairedR1,
    OutputBucket::kPairedR2};

[[nodiscard]] constexpr std::size_t bucketIndex(OutputBucket bucket) noexcept {
    return static_cast<std::size_t>(bucket);
}

/// @brief Bucket for a record given its mate and whether its partner exists.
[[nodiscard]] constexpr OutputBucket classify(MateNumber mate, bool hasPartner) noexcept {
    if (mate == MateNumber::kFirst) {
        return hasPartner ? OutputBucket::kPairedR1 : OutputBucket::kUnpairedR1;
    }
    return hasPartner ? OutputBucket::kPairedR2 : OutputBucket::kUnpairedR2;
}

[[nodiscard]] constexpr std::string_view bucketToString(OutputBucket bucket) noexcept {
    switch (bucket) {
        case OutputBucket::kUnpairedR1:
            return "unpaired R1";
        case OutputBucket::kUnpairedR2:
            return "unpaired R2";
        case OutputBucket::kPairedR1:
            return "paired R1";
        case OutputBucket::kPairedR2:
            return "paired R2";
    }
    return "unknown";
}

/// @brief File name suffix appended to the output prefix.
[[nodiscard]] constexpr std::string_view bucketFileSuffix(OutputBucket bucket) noexcept {
    switch (bucket) {
        case OutputBucket::kUnpairedR1:
            return "_R1_ordered_with_missing_R2.fastq";
        case OutputBucket::kUnpairedR2:
            return "_R2_ordered_with_missing_R1.fastq";
        case OutputBucket::kPairedR1:
            return "_R1_paired.fastq";
        case OutputBucket::kPairedR2:
            return "_R2_paired.fastq";
    }
    return "";
}

}  // namespace fqd

#endif  // FQD_COMMON_TYPES_H
