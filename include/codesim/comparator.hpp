#pragma once

#include <codesim/analysis/file_analyzer.hpp>
#include <codesim/result.hpp>
#include <codesim/similarity/similarity_engine.hpp>
#include <codesim/types.hpp>
#include <codesim/util/logger.hpp>

#include <functional>
#include <string>
#include <vector>

namespace codesim {

// A file that was skipped or only partially analyzed
struct Diagnostic {
    Collection collection = Collection::A;
    std::string path;
    std::string message;
};

struct ComparisonResult {
    // Analyzed files of each side, sorted by path
    std::vector<analysis::FileAnalysis> files_a;
    std::vector<analysis::FileAnalysis> files_b;

    similarity::SimilarityReport similarity;
    std::vector<Diagnostic> warnings;

    int shingle_size = DEFAULT_SHINGLE_SIZE;
    size_t threads = 0;
};

/**
 * Comparator - runs one comparison between two collections.
 *
 * Files are read and analyzed on a worker pool; each task owns its file's
 * text and normalization context. Files that cannot be read are skipped with
 * a warning instead of failing the run. Configuration problems are reported
 * before any file is touched.
 */
class Comparator {
public:
    explicit Comparator(ComparisonConfig config, Logger* logger = nullptr);

    /**
     * Compare two in-memory collections.
     *
     * @param a Files of collection A
     * @param b Files of collection B
     * @return Per-file analyses, pairwise scores and the aggregate, or error
     */
    Result<ComparisonResult> compare(const std::vector<SourceFile>& a,
                                     const std::vector<SourceFile>& b);

    /**
     * Compare two collections read from disk. Each file is read inside its
     * worker task and its text dropped once fingerprinted.
     */
    Result<ComparisonResult> compare_locations(const std::vector<SourceLocation>& a,
                                               const std::vector<SourceLocation>& b);

    const ComparisonConfig& config() const { return config_; }

private:
    struct Job {
        std::string path;
        Collection collection = Collection::A;
        std::function<Result<std::string>()> load;
    };

    struct JobOutcome {
        bool analyzed = false;
        analysis::FileAnalysis analysis;
        std::vector<Diagnostic> diagnostics;
    };

    Result<ComparisonResult> run(std::vector<Job> jobs_a, std::vector<Job> jobs_b);

    JobOutcome process(const analysis::FileAnalyzer& analyzer, const Job& job) const;

    ComparisonConfig config_;
    Logger* logger_;
};

}  // namespace codesim
