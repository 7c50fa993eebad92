#include <gtest/gtest.h>
#include <codesim/analysis/fingerprinter.hpp>
#include <codesim/util/sha1.hpp>

using namespace codesim;
using namespace codesim::analysis;

class FingerprinterTest : public ::testing::Test {
protected:
    Fingerprinter make(int k) {
        auto result = Fingerprinter::create(k);
        EXPECT_TRUE(result.ok()) << result.error().to_string();
        return std::move(result).value();
    }

    FingerprintSet run(const Fingerprinter& fp, const CanonicalSequence& seq) {
        auto result = fp.fingerprint(seq);
        EXPECT_TRUE(result.ok()) << result.error().to_string();
        return std::move(result).value();
    }
};

// ============================================================================
// SHA-1
// ============================================================================

TEST_F(FingerprinterTest, Sha1KnownVectors) {
    Sha1Hasher hasher;

    auto abc = hasher.digest("abc");
    ASSERT_TRUE(abc.ok());
    EXPECT_EQ(Sha1Hasher::to_hex(abc.value()), "a9993e364706816aba3e25717850c26c9cd0d89d");

    auto empty = hasher.digest("");
    ASSERT_TRUE(empty.ok());
    EXPECT_EQ(Sha1Hasher::to_hex(empty.value()), "da39a3ee5e6b4b0d3255bfef95601890afd80709");
}

TEST_F(FingerprinterTest, HasherIsReusable) {
    Sha1Hasher hasher;
    auto first = hasher.digest("abc");
    hasher.digest("something else");
    auto again = hasher.digest("abc");
    ASSERT_TRUE(first.ok());
    ASSERT_TRUE(again.ok());
    EXPECT_EQ(first.value(), again.value());
}

// ============================================================================
// Configuration
// ============================================================================

TEST_F(FingerprinterTest, RejectsNonPositiveK) {
    EXPECT_EQ(Fingerprinter::create(0).error_code(), ErrorCode::INVALID_CONFIG);
    EXPECT_EQ(Fingerprinter::create(-3).error_code(), ErrorCode::INVALID_CONFIG);
}

// ============================================================================
// Shingle Count
// ============================================================================

TEST_F(FingerprinterTest, EmptySequenceHasNoFingerprints) {
    EXPECT_TRUE(run(make(5), {}).empty());
}

TEST_F(FingerprinterTest, ShortSequenceHasOneFingerprint) {
    auto fps = run(make(5), {"return", "NUM", ";"});
    EXPECT_EQ(fps.size(), 1u);
}

TEST_F(FingerprinterTest, ShortSequenceHashesWholeJoinedSequence) {
    auto fps = run(make(5), {"abc"});
    ASSERT_EQ(fps.size(), 1u);
    EXPECT_EQ(Sha1Hasher::to_hex(*fps.begin()), "a9993e364706816aba3e25717850c26c9cd0d89d");
}

TEST_F(FingerprinterTest, LengthSevenWithKFive) {
    CanonicalSequence seq = {"class", "ID1", "{", "return", "NUM", ";", "}"};
    auto fps = run(make(5), seq);
    EXPECT_LE(fps.size(), 3u);
    EXPECT_EQ(fps.size(), 3u);   // all windows differ here
}

TEST_F(FingerprinterTest, SequenceExactlyK) {
    EXPECT_EQ(run(make(3), {"a", "b", "c"}).size(), 1u);
}

TEST_F(FingerprinterTest, RepeatedWindowsCollapse) {
    CanonicalSequence seq(10, "ID1");
    EXPECT_EQ(run(make(2), seq).size(), 1u);
}

TEST_F(FingerprinterTest, CountNeverExceedsWindowCount) {
    CanonicalSequence seq;
    for (int i = 0; i < 40; ++i) {
        seq.push_back(i % 3 == 0 ? "ID1" : (i % 3 == 1 ? "=" : "NUM"));
    }
    for (int k = 1; k <= 10; ++k) {
        EXPECT_LE(run(make(k), seq).size(), seq.size() - k + 1) << "k=" << k;
    }
}

// ============================================================================
// Separator
// ============================================================================

TEST_F(FingerprinterTest, SeparatorKeepsTokenBoundaries) {
    // "ab"+"c" and "a"+"bc" would collide if tokens were concatenated directly
    auto lhs = run(make(2), {"ab", "c"});
    auto rhs = run(make(2), {"a", "bc"});
    EXPECT_NE(lhs, rhs);
}

TEST_F(FingerprinterTest, JoinWindowUsesSeparator) {
    CanonicalSequence seq = {"a", "b", "c"};
    EXPECT_EQ(Fingerprinter::join_window(seq, 0, 3),
              std::string("a") + SHINGLE_SEPARATOR + "b" + SHINGLE_SEPARATOR + "c");
    EXPECT_EQ(Fingerprinter::join_window(seq, 1, 2), "b");
}

TEST_F(FingerprinterTest, Deterministic) {
    CanonicalSequence seq = {"if", "(", "ID1", ")", "{", "ID2", "(", ")", ";", "}"};
    auto fp = make(4);
    EXPECT_EQ(run(fp, seq), run(fp, seq));
}
