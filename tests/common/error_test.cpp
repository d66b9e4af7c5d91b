// =============================================================================
// fastq-detangler - Error Handling Tests
// =============================================================================

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <system_error>

#include "fqd/common/error.h"

namespace fqd::test {
namespace {

[[nodiscard]] bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

TEST(ErrorCodeTest, ExitCodesAreDistinct) {
    EXPECT_EQ(toExitCode(ErrorCode::kSuccess), 0);
    EXPECT_EQ(toExitCode(ErrorCode::kUsageError), 1);
    EXPECT_EQ(toExitCode(ErrorCode::kIOError), 2);
    EXPECT_EQ(toExitCode(ErrorCode::kMalformedRecord), 3);
    EXPECT_EQ(toExitCode(ErrorCode::kUnrecognizedMateSuffix), 4);
    EXPECT_EQ(toExitCode(ErrorCode::kDuplicateMate), 5);
    EXPECT_EQ(toExitCode(ErrorCode::kEmptyInput), 6);
}

TEST(ErrorContextTest, FormatsAllFields) {
    ErrorContext context("reads.fastq");
    context.withLine(17).withRecord(5).withIdentifier("frag42");

    const auto text = context.format();
    EXPECT_TRUE(contains(text, "file: reads.fastq"));
    EXPECT_TRUE(contains(text, "line: 17"));
    EXPECT_TRUE(contains(text, "record: 5"));
    EXPECT_TRUE(contains(text, "read: frag42"));
}

TEST(ErrorContextTest, EmptyContextFormatsEmpty) {
    EXPECT_TRUE(ErrorContext().format().empty());
}

TEST(ExceptionTest, WhatIncludesCategoryAndContext) {
    MalformedRecordError error("truncated record", ErrorContext("in.fastq").withLine(9));

    const std::string what = error.what();
    EXPECT_TRUE(contains(what, "[malformed record]"));
    EXPECT_TRUE(contains(what, "truncated record"));
    EXPECT_TRUE(contains(what, "line: 9"));
    EXPECT_EQ(error.message(), "truncated record");
    EXPECT_EQ(error.exitCode(), 3);
}

TEST(ExceptionTest, FormatErrorsShareBase) {
    try {
        throw EmptyInputError("Input file is empty", ErrorContext("in.fastq"));
    } catch (const FormatError& e) {
        EXPECT_EQ(e.code(), ErrorCode::kEmptyInput);
        EXPECT_EQ(e.exitCode(), 6);
    }
}

TEST(ExceptionTest, UnrecognizedSuffixNamesHeader) {
    UnrecognizedMateSuffixError error("@x/3", ErrorContext{});
    EXPECT_EQ(error.header(), "@x/3");
    EXPECT_TRUE(contains(error.what(), "'@x/3'"));
    EXPECT_EQ(error.exitCode(), 4);
}

TEST(ExceptionTest, DuplicateMateNamesReadAndMate) {
    DuplicateMateError error("a", MateNumber::kSecond, ErrorContext{});
    EXPECT_TRUE(contains(error.what(), "'a'"));
    EXPECT_TRUE(contains(error.what(), "/2"));
    ASSERT_TRUE(error.hasContext());
    EXPECT_EQ(error.context()->identifier, "a");
}

TEST(ExceptionTest, IOErrorKeepsSystemError) {
    const auto ec = std::make_error_code(std::errc::no_such_file_or_directory);
    IOError error("Failed to open FASTQ file", ec, ErrorContext("missing.fastq"));

    ASSERT_TRUE(error.systemError().has_value());
    EXPECT_EQ(*error.systemError(), ec);
    EXPECT_TRUE(contains(error.message(), "Failed to open FASTQ file"));
    EXPECT_EQ(error.exitCode(), 2);
}

TEST(TryExecuteTest, ReturnsValue) {
    auto result = tryExecute([] { return 42; });
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, 42);
}

TEST(TryExecuteTest, VoidReturnsMonostate) {
    bool ran = false;
    auto result = tryExecute([&] { ran = true; });
    EXPECT_TRUE(result.has_value());
    EXPECT_TRUE(ran);
}

TEST(TryExecuteTest, ConvertsFqdExceptions) {
    auto result = tryExecute([]() -> int {
        throw DuplicateMateError("a", MateNumber::kFirst, ErrorContext{});
    });
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kDuplicateMate);
    EXPECT_EQ(result.error().exitCode(), 5);
    EXPECT_TRUE(contains(result.error().message(), "[duplicate mate]"));
}

TEST(TryExecuteTest, MapsOtherExceptionsToIOError) {
    auto result = tryExecute([]() -> int { throw std::runtime_error("disk gone"); });
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kIOError);
    EXPECT_EQ(result.error().message(), "disk gone");
}

}  // namespace
}  // namespace fqd::test
