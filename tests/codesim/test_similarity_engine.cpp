#include <gtest/gtest.h>
#include <codesim/similarity/similarity_engine.hpp>
#include <codesim/util/set_operations.hpp>
#include <codesim/util/thread_pool.hpp>

#include <algorithm>
#include <random>

using namespace codesim;
using namespace codesim::similarity;

namespace {

Fingerprint fp(uint8_t tag) {
    Fingerprint f{};
    f[0] = tag;
    return f;
}

FingerprintSet make_set(std::initializer_list<int> tags) {
    FingerprintSet set;
    for (int t : tags) {
        set.insert(fp(static_cast<uint8_t>(t)));
    }
    return set;
}

}  // namespace

class SimilarityEngineTest : public ::testing::Test {
protected:
    FileFingerprints file(const std::string& path, const FingerprintSet& set, size_t tokens) {
        FileFingerprints f;
        f.path = path;
        f.fingerprints = &set;
        f.normalized_token_count = tokens;
        return f;
    }
};

// ============================================================================
// Jaccard
// ============================================================================

TEST_F(SimilarityEngineTest, SetOperationCounts) {
    auto a = make_set({1, 2, 3, 4});
    auto b = make_set({3, 4, 5});
    size_t inter = SetOperations::intersection_size(a, b);
    EXPECT_EQ(inter, 2u);
    EXPECT_EQ(SetOperations::union_size(a, b, inter), 5u);
}

TEST_F(SimilarityEngineTest, JaccardPartialOverlap) {
    EXPECT_DOUBLE_EQ(jaccard_similarity(make_set({1, 2, 3, 4}), make_set({3, 4, 5})), 2.0 / 5.0);
}

TEST_F(SimilarityEngineTest, SelfSimilarityIsOne) {
    auto a = make_set({7, 8, 9});
    EXPECT_DOUBLE_EQ(jaccard_similarity(a, a), 1.0);
}

TEST_F(SimilarityEngineTest, DisjointIsZero) {
    EXPECT_DOUBLE_EQ(jaccard_similarity(make_set({1, 2}), make_set({3, 4})), 0.0);
}

TEST_F(SimilarityEngineTest, JaccardIsSymmetricAndBounded) {
    std::mt19937 rng(42);
    for (int trial = 0; trial < 50; ++trial) {
        FingerprintSet x, y;
        for (int i = 0; i < 20; ++i) {
            if (rng() % 2) x.insert(fp(static_cast<uint8_t>(rng() % 30)));
            if (rng() % 2) y.insert(fp(static_cast<uint8_t>(rng() % 30)));
        }
        const double xy = jaccard_similarity(x, y);
        EXPECT_DOUBLE_EQ(xy, jaccard_similarity(y, x));
        EXPECT_GE(xy, 0.0);
        EXPECT_LE(xy, 1.0);
    }
}

TEST_F(SimilarityEngineTest, EmptySetPolicy) {
    FingerprintSet empty;
    auto a = make_set({1});
    EXPECT_DOUBLE_EQ(jaccard_similarity(empty, empty), EMPTY_SET_SIMILARITY);
    EXPECT_DOUBLE_EQ(jaccard_similarity(empty, a), EMPTY_SET_SIMILARITY);
    EXPECT_DOUBLE_EQ(jaccard_similarity(a, empty), EMPTY_SET_SIMILARITY);
    EXPECT_DOUBLE_EQ(EMPTY_SET_SIMILARITY, 0.0);
}

// ============================================================================
// Engine
// ============================================================================

TEST_F(SimilarityEngineTest, EmptyCollectionIsUndefined) {
    auto a = make_set({1});
    SimilarityEngine engine;

    auto report = engine.compare({file("a.java", a, 3)}, {});
    EXPECT_TRUE(report.pairs.empty());
    EXPECT_FALSE(report.aggregate.defined);
    EXPECT_DOUBLE_EQ(report.aggregate.score, 0.0);
}

TEST_F(SimilarityEngineTest, IdenticalSingleFiles) {
    auto a = make_set({1, 2, 3});
    auto b = make_set({1, 2, 3});
    SimilarityEngine engine;

    auto report = engine.compare({file("x.java", a, 7)}, {file("y.java", b, 7)});
    ASSERT_EQ(report.pairs.size(), 1u);
    EXPECT_DOUBLE_EQ(report.pairs[0].jaccard, 1.0);
    EXPECT_TRUE(report.aggregate.defined);
    EXPECT_DOUBLE_EQ(report.aggregate.score, 1.0);
}

TEST_F(SimilarityEngineTest, NoSharedShinglesScoresZero) {
    auto a = make_set({1});
    auto b = make_set({2, 3});
    SimilarityEngine engine;

    auto report = engine.compare({file("a.js", a, 3)}, {file("b.js", b, 9)});
    EXPECT_DOUBLE_EQ(report.pairs[0].jaccard, 0.0);
    EXPECT_DOUBLE_EQ(report.aggregate.score, 0.0);
}

TEST_F(SimilarityEngineTest, PairsSortedByScoreThenPath) {
    auto a1 = make_set({1, 2});
    auto a2 = make_set({5});
    auto b1 = make_set({1, 2});
    auto b2 = make_set({1, 9});
    SimilarityEngine engine;

    auto report = engine.compare({file("a2", a2, 1), file("a1", a1, 1)},
                                 {file("b2", b2, 1), file("b1", b1, 1)});
    ASSERT_EQ(report.pairs.size(), 4u);
    EXPECT_EQ(report.pairs[0].file_a, "a1");
    EXPECT_EQ(report.pairs[0].file_b, "b1");
    EXPECT_DOUBLE_EQ(report.pairs[1].jaccard, 1.0 / 3.0);

    // The two zero-score pairs are ordered by fileA then fileB
    EXPECT_EQ(report.pairs[2].file_a, "a2");
    EXPECT_EQ(report.pairs[2].file_b, "b1");
    EXPECT_EQ(report.pairs[3].file_b, "b2");
}

TEST_F(SimilarityEngineTest, WeightedDirectionalScores) {
    // a1 matches b1 fully, a2 matches nothing
    auto a1 = make_set({1, 2});
    auto a2 = make_set({7});
    auto b1 = make_set({1, 2});
    SimilarityEngine engine;

    auto report = engine.compare({file("a1", a1, 30), file("a2", a2, 10)},
                                 {file("b1", b1, 20)});
    EXPECT_DOUBLE_EQ(report.aggregate.a_to_b, (1.0 * 30 + 0.0 * 10) / 40.0);
    EXPECT_DOUBLE_EQ(report.aggregate.b_to_a, 1.0);
    EXPECT_DOUBLE_EQ(report.aggregate.score, (0.75 + 1.0) / 2.0);
}

TEST_F(SimilarityEngineTest, ZeroTokenFileHasUnitWeight) {
    EXPECT_DOUBLE_EQ(SimilarityEngine::weight(0), 1.0);
    EXPECT_DOUBLE_EQ(SimilarityEngine::weight(12), 12.0);
}

TEST_F(SimilarityEngineTest, AggregateIndependentOfFileOrder) {
    std::vector<FingerprintSet> sets_a, sets_b;
    for (int i = 0; i < 6; ++i) {
        sets_a.push_back(make_set({i, i + 1, i + 2}));
        sets_b.push_back(make_set({i * 2, i + 3}));
    }

    std::vector<FileFingerprints> a, b;
    for (int i = 0; i < 6; ++i) {
        a.push_back(file("a" + std::to_string(i), sets_a[i], 10 + i * 7));
        b.push_back(file("b" + std::to_string(i), sets_b[i], 3 + i));
    }

    SimilarityEngine engine;
    auto baseline = engine.compare(a, b);

    std::mt19937 rng(7);
    for (int trial = 0; trial < 5; ++trial) {
        std::shuffle(a.begin(), a.end(), rng);
        std::shuffle(b.begin(), b.end(), rng);
        auto shuffled = engine.compare(a, b);
        EXPECT_EQ(shuffled.aggregate.score, baseline.aggregate.score);
        EXPECT_EQ(shuffled.aggregate.a_to_b, baseline.aggregate.a_to_b);
        ASSERT_EQ(shuffled.pairs.size(), baseline.pairs.size());
        for (size_t i = 0; i < baseline.pairs.size(); ++i) {
            EXPECT_EQ(shuffled.pairs[i].file_a, baseline.pairs[i].file_a);
            EXPECT_EQ(shuffled.pairs[i].file_b, baseline.pairs[i].file_b);
        }
    }
}

TEST_F(SimilarityEngineTest, PooledMatchesSequential) {
    std::vector<FingerprintSet> sets;
    for (int i = 0; i < 8; ++i) {
        sets.push_back(make_set({i, i + 1, (i * 3) % 11}));
    }
    std::vector<FileFingerprints> a, b;
    for (int i = 0; i < 8; ++i) {
        a.push_back(file("a" + std::to_string(i), sets[i], 5));
        b.push_back(file("b" + std::to_string(i), sets[7 - i], 5));
    }

    ThreadPool pool(4);
    auto sequential = SimilarityEngine().compare(a, b);
    auto pooled = SimilarityEngine(&pool).compare(a, b);

    EXPECT_EQ(pooled.aggregate.score, sequential.aggregate.score);
    ASSERT_EQ(pooled.pairs.size(), sequential.pairs.size());
    for (size_t i = 0; i < pooled.pairs.size(); ++i) {
        EXPECT_EQ(pooled.pairs[i].jaccard, sequential.pairs[i].jaccard);
        EXPECT_EQ(pooled.pairs[i].file_a, sequential.pairs[i].file_a);
    }
}

TEST_F(SimilarityEngineTest, TopPairs) {
    auto a = make_set({1});
    auto b = make_set({1});
    SimilarityEngine engine;
    auto report = engine.compare({file("a", a, 1)}, {file("b", b, 1), file("c", a, 1)});
    EXPECT_EQ(report.top_pairs(1).size(), 1u);
    EXPECT_EQ(report.top_pairs(10).size(), 2u);
}
