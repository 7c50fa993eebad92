#pragma once

#include <codesim/core_types.hpp>

#include <string>
#include <vector>

namespace codesim {
class ThreadPool;
}

namespace codesim::similarity {

/**
 * Score assigned when either fingerprint set is empty, including when both
 * are. An empty file carries no evidence of copying, so it never matches.
 */
constexpr double EMPTY_SET_SIMILARITY = 0.0;

/**
 * Jaccard similarity |X ∩ Y| / |X ∪ Y|.
 * Returns EMPTY_SET_SIMILARITY if either set is empty.
 */
double jaccard_similarity(const FingerprintSet& x, const FingerprintSet& y);

// Scoring input for one file
struct FileFingerprints {
    std::string path;
    const FingerprintSet* fingerprints = nullptr;   // owned by the caller
    size_t normalized_token_count = 0;
};

struct PairwiseResult {
    std::string file_a;
    std::string file_b;
    double jaccard = 0.0;
    size_t fingerprints_a = 0;
    size_t fingerprints_b = 0;
    size_t tokens_a = 0;
    size_t tokens_b = 0;
};

struct AggregateScore {
    double score = 0.0;        // mean of both directions
    double a_to_b = 0.0;
    double b_to_a = 0.0;
    bool defined = false;      // false when either collection is empty
};

struct SimilarityReport {
    // Sorted by score (desc), then file_a, then file_b
    std::vector<PairwiseResult> pairs;
    AggregateScore aggregate;

    std::vector<PairwiseResult> top_pairs(size_t n) const;
};

/**
 * All-pairs Jaccard between two collections plus the repo-level score.
 *
 * Directional score A->B: every file in A contributes its best match in B,
 * weighted by max(1, normalized token count). The final score averages A->B
 * and B->A so that neither side's file sizes dominate.
 */
class SimilarityEngine {
public:
    // pool may be null, in which case scoring runs on the calling thread
    explicit SimilarityEngine(ThreadPool* pool = nullptr);

    SimilarityReport compare(const std::vector<FileFingerprints>& a,
                             const std::vector<FileFingerprints>& b) const;

    /**
     * Weighted mean of best-match scores.
     * Folded in path order, so the result does not depend on input order.
     *
     * @param files The source side of the direction
     * @param best_scores best_scores[i] belongs to files[i]
     */
    static double directional_score(const std::vector<FileFingerprints>& files,
                                     const std::vector<double>& best_scores);

    static double weight(size_t normalized_token_count);

private:
    ThreadPool* pool_;
};

}  // namespace codesim::similarity
