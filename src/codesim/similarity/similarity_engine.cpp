#include <codesim/similarity/similarity_engine.hpp>
#include <codesim/util/set_operations.hpp>
#include <codesim/util/thread_pool.hpp>

#include <algorithm>
#include <numeric>

namespace codesim::similarity {

double jaccard_similarity(const FingerprintSet& x, const FingerprintSet& y) {
    if (x.empty() || y.empty()) {
        return EMPTY_SET_SIMILARITY;
    }

    const size_t intersection = SetOperations::intersection_size(x, y);
    const size_t union_size = SetOperations::union_size(x, y, intersection);

    return static_cast<double>(intersection) / static_cast<double>(union_size);
}

std::vector<PairwiseResult> SimilarityReport::top_pairs(size_t n) const {
    const size_t count = std::min(n, pairs.size());
    return std::vector<PairwiseResult>(pairs.begin(), pairs.begin() + count);
}

SimilarityEngine::SimilarityEngine(ThreadPool* pool)
    : pool_(pool) {}

double SimilarityEngine::weight(size_t normalized_token_count) {
    return static_cast<double>(std::max<size_t>(1, normalized_token_count));
}

double SimilarityEngine::directional_score(const std::vector<FileFingerprints>& files,
                                           const std::vector<double>& best_scores) {
    if (files.empty()) {
        return 0.0;
    }

    std::vector<size_t> order(files.size());
    std::iota(order.begin(), order.end(), 0);
    std::sort(order.begin(), order.end(), [&](size_t lhs, size_t rhs) {
        if (files[lhs].path != files[rhs].path) {
            return files[lhs].path < files[rhs].path;
        }
        if (files[lhs].normalized_token_count != files[rhs].normalized_token_count) {
            return files[lhs].normalized_token_count < files[rhs].normalized_token_count;
        }
        return best_scores[lhs] < best_scores[rhs];
    });

    double weighted_sum = 0.0;
    double total_weight = 0.0;
    for (size_t idx : order) {
        const double w = weight(files[idx].normalized_token_count);
        weighted_sum += best_scores[idx] * w;
        total_weight += w;
    }

    return total_weight > 0.0 ? weighted_sum / total_weight : 0.0;
}

SimilarityReport SimilarityEngine::compare(const std::vector<FileFingerprints>& a,
                                           const std::vector<FileFingerprints>& b) const {
    SimilarityReport report;

    const size_t n = a.size();
    const size_t m = b.size();
    if (n == 0 || m == 0) {
        return report;   // aggregate stays undefined at 0.0
    }

    // Row-major n x m score matrix; each row is written by one task
    std::vector<double> scores(n * m, 0.0);
    auto score_row = [&](size_t i) {
        for (size_t j = 0; j < m; ++j) {
            scores[i * m + j] = jaccard_similarity(*a[i].fingerprints, *b[j].fingerprints);
        }
    };

    if (pool_ != nullptr && n > 1) {
        pool_->parallel_for(n, score_row);
    } else {
        for (size_t i = 0; i < n; ++i) {
            score_row(i);
        }
    }

    std::vector<double> best_a(n, 0.0);
    std::vector<double> best_b(m, 0.0);
    report.pairs.reserve(n * m);

    for (size_t i = 0; i < n; ++i) {
        for (size_t j = 0; j < m; ++j) {
            const double s = scores[i * m + j];
            best_a[i] = std::max(best_a[i], s);
            best_b[j] = std::max(best_b[j], s);

            PairwiseResult pair;
            pair.file_a = a[i].path;
            pair.file_b = b[j].path;
            pair.jaccard = s;
            pair.fingerprints_a = a[i].fingerprints->size();
            pair.fingerprints_b = b[j].fingerprints->size();
            pair.tokens_a = a[i].normalized_token_count;
            pair.tokens_b = b[j].normalized_token_count;
            report.pairs.push_back(std::move(pair));
        }
    }

    std::sort(report.pairs.begin(), report.pairs.end(),
        [](const PairwiseResult& lhs, const PairwiseResult& rhs) {
            if (lhs.jaccard != rhs.jaccard) return lhs.jaccard > rhs.jaccard;
            if (lhs.file_a != rhs.file_a) return lhs.file_a < rhs.file_a;
            return lhs.file_b < rhs.file_b;
        });

    report.aggregate.a_to_b = directional_score(a, best_a);
    report.aggregate.b_to_a = directional_score(b, best_b);
    report.aggregate.score = (report.aggregate.a_to_b + report.aggregate.b_to_a) / 2.0;
    report.aggregate.defined = true;

    return report;
}

}  // namespace codesim::similarity
