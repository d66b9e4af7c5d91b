// =============================================================================
// fastq-detangler - FASTQ Parser
// =============================================================================
// Streaming parser for interleaved FASTQ input whose headers carry a "/1" or
// "/2" mate suffix.
//
// This module provides:
// - ReadRecord: One four-line record, tagged with its mate number
// - FastqParser: Framing and structural validation of the input
// - parseHeader(): Identifier and mate extraction from a header line
//
// Usage:
//   FastqParser parser("/path/to/interleaved.fastq");
//   parser.open();
//   while (auto record = parser.readRecord()) {
//       // record->identifier, record->mate ...
//   }
// =============================================================================

#ifndef FQD_IO_FASTQ_PARSER_H
#define FQD_IO_FASTQ_PARSER_H

#include <cstdint>
#include <filesystem>
#include <functional>
#include <istream>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

#include "fqd/common/error.h"
#include "fqd/common/types.h"

namespace fqd::io {

// =============================================================================
// Read Record
// =============================================================================

/// @brief A single FASTQ record from an interleaved file.
/// @note Created once by FastqParser; downstream stages only read it.
struct ReadRecord {
    /// @brief Read name with '@' and mate suffix removed (the pairing key).
    std::string identifier;

    /// @brief Full header line as read, including '@' and the mate suffix.
    std::string rawHeader;

    /// @brief Base calls, opaque.
    std::string sequence;

    /// @brief Third line as read (starts with '+').
    std::string separator;

    /// @brief Quality line, opaque.
    std::string quality;

    /// @brief Mate number taken from the header suffix.
    MateNumber mate = MateNumber::kFirst;

    /// @brief 1-based line number of the header in the input.
    std::uint64_t lineNumber = 0;

    /// @brief Header rebuilt from identifier and mate ("@id/1" or "@id/2").
    [[nodiscard]] std::string header() const;

    /// @brief Number of bases.
    [[nodiscard]] std::size_t length() const noexcept { return sequence.size(); }

    /// @brief Bytes written by operator<<, newlines included.
    [[nodiscard]] std::size_t formattedSize() const noexcept {
        return 1 + identifier.size() + kMateSuffixLength + sequence.size() + separator.size() +
               quality.size() + kLinesPerRecord;
    }
};

/// @brief Write a record in four-line FASTQ form with a reconstructed header.
std::ostream& operator<<(std::ostream& os, const ReadRecord& record);

// =============================================================================
// Header Parsing
// =============================================================================

/// @brief Identifier and mate number extracted from a header line.
struct ParsedHeader {
    std::string identifier;
    MateNumber mate = MateNumber::kFirst;
};

/// @brief Split a header line into identifier and mate number.
/// @param header Header line including the leading '@'.
/// @param context Location of the header, attached to thrown errors.
/// @throws MalformedRecordError if the line lacks '@' or a read name.
/// @throws UnrecognizedMateSuffixError if the line does not end in "/1" or "/2".
[[nodiscard]] ParsedHeader parseHeader(std::string_view header, const ErrorContext& context = {});

// =============================================================================
// Parser Statistics
// =============================================================================

/// @brief Statistics collected during parsing.
struct ParserStats {
    /// @brief Total records parsed.
    std::uint64_t totalRecords = 0;

    /// @brief Records carrying "/1".
    std::uint64_t firstMates = 0;

    /// @brief Records carrying "/2".
    std::uint64_t secondMates = 0;

    /// @brief Total bases parsed.
    std::uint64_t totalBases = 0;

    void update(const ReadRecord& record) noexcept {
        ++totalRecords;
        totalBases += record.length();
        if (record.mate == MateNumber::kFirst) {
            ++firstMates;
        } else {
            ++secondMates;
        }
    }

    void reset() noexcept { *this = ParserStats{}; }
};

// =============================================================================
// FastqParser Class
// =============================================================================

/// @brief Four-line FASTQ parser with mate suffix extraction.
///
/// Blank lines between records are skipped. Trailing whitespace (including
/// '\r') is trimmed from every line. Any framing violation throws; there is
/// no resynchronization.
///
/// Thread Safety: not thread-safe.
class FastqParser {
public:
    /// @brief Receives each record; may move from it. Return false to stop.
    using RecordCallback = std::function<bool(ReadRecord&)>;

    // =========================================================================
    // Construction / Destruction
    // =========================================================================

    /// @brief Construct a parser for the specified file.
    explicit FastqParser(std::filesystem::path filePath);

    /// @brief Construct a parser from an input stream (already open).
    /// @param stream Input stream to read from.
    /// @param sourceName Name reported in error context.
    explicit FastqParser(std::unique_ptr<std::istream> stream,
                         std::string sourceName = "<stream>");

    ~FastqParser();

    FastqParser(const FastqParser&) = delete;
    FastqParser& operator=(const FastqParser&) = delete;
    FastqParser(FastqParser&&) noexcept;
    FastqParser& operator=(FastqParser&&) noexcept;

    // =========================================================================
    // Opening and Closing
    // =========================================================================

    /// @brief Open the file for parsing.
    /// @throws IOError if the file cannot be opened.
    void open();

    void close() noexcept;

    [[nodiscard]] bool isOpen() const noexcept { return isOpen_; }

    [[nodiscard]] bool eof() const noexcept { return eof_; }

    // =========================================================================
    // Parsing Methods
    // =========================================================================

    /// @brief Read a single record.
    /// @return The parsed record, or nullopt at end of input.
    /// @throws MalformedRecordError, UnrecognizedMateSuffixError, IOError.
    [[nodiscard]] std::optional<ReadRecord> readRecord();

    /// @brief Process all records with a callback. Return false to stop.
    /// @return Number of records passed to the callback.
    std::uint64_t forEach(const RecordCallback& callback);

    // =========================================================================
    // Statistics and State
    // =========================================================================

    [[nodiscard]] const ParserStats& stats() const noexcept { return stats_; }

    /// @brief Lines consumed so far.
    [[nodiscard]] std::uint64_t lineNumber() const noexcept { return lineNumber_; }

    /// @brief Records returned so far.
    [[nodiscard]] RecordNumber recordNumber() const noexcept { return recordNumber_; }

    [[nodiscard]] const std::string& sourceName() const noexcept { return sourceName_; }

private:
    [[nodiscard]] bool readLine(std::string& line);

    [[nodiscard]] bool parseRecord(ReadRecord& record);

    /// @brief Context for an error in the record currently being parsed.
    [[nodiscard]] ErrorContext recordContext(std::uint64_t line) const;

    static void trimRight(std::string& str);

    std::filesystem::path filePath_;
    std::string sourceName_;
    std::unique_ptr<std::istream> stream_;
    bool isOpen_ = false;
    bool eof_ = false;
    std::uint64_t lineNumber_ = 0;
    RecordNumber recordNumber_ = 0;
    ParserStats stats_;
};

}  // namespace fqd::io

#endif  // FQD_IO_FASTQ_PARSER_H
