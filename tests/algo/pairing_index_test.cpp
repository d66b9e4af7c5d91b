// =============================================================================
// fastq-detangler - Pairing Index Tests
// =============================================================================

#include <gtest/gtest.h>

#include <string>

#include "fqd/algo/pairing_index.h"

namespace fqd::algo::test {
namespace {

TEST(MateSetTest, StartsEmpty) {
    MateSet set;
    EXPECT_FALSE(set.contains(MateNumber::kFirst));
    EXPECT_FALSE(set.contains(MateNumber::kSecond));
    EXPECT_FALSE(set.isPair());
}

TEST(MateSetTest, InsertReportsDuplicates) {
    MateSet set;
    EXPECT_TRUE(set.insert(MateNumber::kSecond));
    EXPECT_FALSE(set.insert(MateNumber::kSecond));
    EXPECT_TRUE(set.contains(MateNumber::kSecond));
    EXPECT_FALSE(set.isPair());

    EXPECT_TRUE(set.insert(MateNumber::kFirst));
    EXPECT_TRUE(set.isPair());
}

TEST(PairingIndexTest, TracksMatesPerIdentifier) {
    PairingIndex index;
    EXPECT_TRUE(index.empty());

    index.insert("a", MateNumber::kFirst);
    index.insert("b", MateNumber::kSecond);
    index.insert("a", MateNumber::kSecond);

    EXPECT_EQ(index.size(), 2u);
    EXPECT_EQ(index.pairCount(), 1u);
    EXPECT_TRUE(index.contains("a", MateNumber::kFirst));
    EXPECT_TRUE(index.contains("a", MateNumber::kSecond));
    EXPECT_FALSE(index.contains("b", MateNumber::kFirst));
    EXPECT_FALSE(index.contains("missing", MateNumber::kFirst));
}

TEST(PairingIndexTest, HasPartnerLooksAtOppositeMate) {
    PairingIndex index;
    index.insert("a", MateNumber::kFirst);
    index.insert("a", MateNumber::kSecond);
    index.insert("c", MateNumber::kFirst);

    io::ReadRecord a1;
    a1.identifier = "a";
    a1.mate = MateNumber::kFirst;
    io::ReadRecord c1;
    c1.identifier = "c";
    c1.mate = MateNumber::kFirst;

    EXPECT_TRUE(index.hasPartner(a1));
    EXPECT_FALSE(index.hasPartner(c1));
}

TEST(PairingIndexTest, IdentifiersAreCaseSensitive) {
    PairingIndex index;
    index.insert("Read", MateNumber::kFirst);
    index.insert("read", MateNumber::kSecond);
    EXPECT_EQ(index.size(), 2u);
    EXPECT_EQ(index.pairCount(), 0u);
}

TEST(PairingIndexTest, DuplicateMateThrows) {
    PairingIndex index;
    index.insert("a", MateNumber::kFirst);

    try {
        index.insert("a", MateNumber::kFirst, ErrorContext("in.fastq").withLine(9));
        FAIL() << "expected DuplicateMateError";
    } catch (const DuplicateMateError& e) {
        EXPECT_EQ(e.code(), ErrorCode::kDuplicateMate);
        EXPECT_EQ(e.exitCode(), 5);
        EXPECT_EQ(e.identifier(), "a");
        EXPECT_EQ(e.mate(), MateNumber::kFirst);
        ASSERT_TRUE(e.hasContext());
        EXPECT_EQ(e.context()->filePath, "in.fastq");
        EXPECT_EQ(e.context()->lineNumber, 9u);
        EXPECT_EQ(e.context()->identifier, "a");
    }

    // Failed insert leaves the index unchanged
    EXPECT_EQ(index.size(), 1u);
    EXPECT_EQ(index.pairCount(), 0u);
}

TEST(PairingIndexTest, DuplicateCarriesCallerContext) {
    PairingIndex index;
    ErrorContext context("reads.fastq");
    context.withLine(13).withRecord(4);

    index.insert("x", MateNumber::kSecond, context);
    try {
        index.insert("x", MateNumber::kSecond, context);
        FAIL() << "expected DuplicateMateError";
    } catch (const DuplicateMateError& e) {
        ASSERT_TRUE(e.hasContext());
        EXPECT_EQ(e.context()->lineNumber, 13u);
        EXPECT_EQ(e.context()->recordNumber, 4u);
    }
}

}  // namespace
}  // namespace fqd::algo::test
