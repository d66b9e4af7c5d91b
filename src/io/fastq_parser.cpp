// =============================================================================
// fastq-detangler - FASTQ Parser Implementation
// =============================================================================

#include "fqd/io/fastq_parser.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <fstream>
#include <system_error>

#include <fmt/format.h>

#include "fqd/common/logger.h"

namespace fqd::io {

// =============================================================================
// ReadRecord Implementation
// =============================================================================

std::string ReadRecord::header() const {
    std::string result;
    result.reserve(identifier.size() + 1 + kMateSuffixLength);
    result += kRecordStartMarker;
    result += identifier;
    result += kMateDelimiter;
    result += mateDigit(mate);
    return result;
}

std::ostream& operator<<(std::ostream& os, const ReadRecord& record) {
    os << record.header() << '\n'
       << record.sequence << '\n'
       << record.separator << '\n'
       << record.quality << '\n';
    return os;
}

// =============================================================================
// Header Parsing
// =============================================================================

ParsedHeader parseHeader(std::string_view header, const ErrorContext& context) {
    if (header.empty() || header.front() != kRecordStartMarker) {
        throw MalformedRecordError(
            fmt::format("expected '{}' at start of header line", kRecordStartMarker), context);
    }

    std::string_view name = header.substr(1);
    if (name.empty()) {
        throw MalformedRecordError("header has no read name", context);
    }

    if (name.size() < kMateSuffixLength || name[name.size() - 2] != kMateDelimiter) {
        throw UnrecognizedMateSuffixError(std::string(header), context);
    }

    auto mate = mateFromDigit(name.back());
    if (!mate) {
        throw UnrecognizedMateSuffixError(std::string(header), context);
    }

    name.remove_suffix(kMateSuffixLength);
    if (name.empty()) {
        throw MalformedRecordError("header has no read name before the mate suffix", context);
    }

    return ParsedHeader{std::string(name), *mate};
}

// =============================================================================
// FastqParser Implementation
// =============================================================================

FastqParser::FastqParser(std::filesystem::path filePath)
    : filePath_(std::move(filePath)), sourceName_(filePath_.string()) {}

FastqParser::FastqParser(std::unique_ptr<std::istream> stream, std::string sourceName)
    : sourceName_(std::move(sourceName)), stream_(std::move(stream)) {
    if (stream_) {
        isOpen_ = true;
    }
}

FastqParser::~FastqParser() { close(); }

FastqParser::FastqParser(FastqParser&&) noexcept = default;
FastqParser& FastqParser::operator=(FastqParser&&) noexcept = default;

void FastqParser::open() {
    if (isOpen_) {
        return;
    }

    auto fileStream = std::make_unique<std::ifstream>(filePath_, std::ios::binary);
    if (!fileStream->is_open()) {
        throw IOError("Failed to open FASTQ file", std::error_code(errno, std::generic_category()),
                      ErrorContext(filePath_.string()));
    }
    stream_ = std::move(fileStream);
    FQD_LOG_DEBUG("Opened FASTQ file: {}", filePath_.string());

    isOpen_ = true;
    eof_ = false;
    lineNumber_ = 0;
    recordNumber_ = 0;
    stats_.reset();
}

void FastqParser::close() noexcept {
    if (!isOpen_) {
        return;
    }

    stream_.reset();
    isOpen_ = false;
    eof_ = true;
}

std::optional<ReadRecord> FastqParser::readRecord() {
    if (!isOpen_ || eof_) {
        return std::nullopt;
    }

    ReadRecord record;
    if (!parseRecord(record)) {
        return std::nullopt;
    }

    ++recordNumber_;
    stats_.update(record);
    return record;
}

std::uint64_t FastqParser::forEach(const RecordCallback& callback) {
    std::uint64_t count = 0;
    while (auto record = readRecord()) {
        ++count;
        if (!callback(*record)) {
            break;
        }
    }
    return count;
}

bool FastqParser::readLine(std::string& line) {
    if (!stream_ || !*stream_) {
        eof_ = true;
        return false;
    }

    if (!std::getline(*stream_, line)) {
        if (stream_->bad()) {
            throw IOError("Failed to read input",
                          ErrorContext(sourceName_).withLine(lineNumber_ + 1));
        }
        eof_ = true;
        return false;
    }

    ++lineNumber_;
    trimRight(line);
    return true;
}

bool FastqParser::parseRecord(ReadRecord& record) {
    // Line 1: header, after any blank lines separating records
    do {
        if (!readLine(record.rawHeader)) {
            return false;
        }
    } while (record.rawHeader.empty());

    const std::uint64_t headerLine = lineNumber_;
    record.lineNumber = headerLine;

    auto parsed = parseHeader(record.rawHeader, recordContext(headerLine));
    record.identifier = std::move(parsed.identifier);
    record.mate = parsed.mate;

    // Lines 2-4: sequence, separator, quality
    std::size_t linesRead = 1;
    auto readRequired = [&](std::string& line) {
        if (!readLine(line)) {
            throw MalformedRecordError(
                fmt::format("truncated record: expected {} lines, got {}", kLinesPerRecord,
                            linesRead),
                recordContext(headerLine).withIdentifier(record.identifier));
        }
        ++linesRead;
    };

    readRequired(record.sequence);
    readRequired(record.separator);

    if (record.separator.empty() || record.separator.front() != kSeparatorMarker) {
        throw MalformedRecordError(
            fmt::format("expected '{}' at start of separator line", kSeparatorMarker),
            recordContext(lineNumber_).withIdentifier(record.identifier));
    }

    readRequired(record.quality);
    return true;
}

ErrorContext FastqParser::recordContext(std::uint64_t line) const {
    ErrorContext context(sourceName_);
    context.withLine(line).withRecord(recordNumber_ + 1);
    return context;
}

void FastqParser::trimRight(std::string& str) {
    auto it = std::find_if(str.rbegin(), str.rend(),
                           [](unsigned char c) { return !std::isspace(c); });
    str.erase(it.base(), str.end());
}

}  // namespace fqd::io
