#pragma once

#include <codesim/analysis/fingerprinter.hpp>
#include <codesim/analysis/normalizer.hpp>
#include <codesim/analysis/tokenizer.hpp>
#include <codesim/result.hpp>
#include <codesim/types.hpp>

#include <string>
#include <utility>
#include <vector>

namespace codesim::analysis {

/**
 * Everything the pipeline keeps about one file once its text is gone.
 */
struct FileAnalysis {
    std::string path;
    Collection collection = Collection::A;
    std::string language;

    size_t raw_token_count = 0;
    size_t normalized_token_count = 0;   // normCount, the aggregation weight
    bool truncated = false;

    // Bounded previews for the report
    std::vector<std::string> raw_token_preview;
    std::vector<std::string> canonical_preview;

    // Identifier -> IDn, first-occurrence order
    std::vector<std::pair<std::string, std::string>> identifier_map;

    FingerprintSet fingerprints;
};

/**
 * Tokenize -> normalize -> fingerprint for a single file.
 *
 * Stateless between calls; one analyzer can serve every worker.
 */
class FileAnalyzer {
public:
    static Result<FileAnalyzer> create(const ComparisonConfig& config);

    Result<FileAnalysis> analyze(const SourceFile& file) const;

    const Tokenizer& tokenizer() const { return tokenizer_; }
    const Normalizer& normalizer() const { return normalizer_; }
    const Fingerprinter& fingerprinter() const { return fingerprinter_; }

private:
    FileAnalyzer(Tokenizer tokenizer, Normalizer normalizer,
                 Fingerprinter fingerprinter, size_t preview_limit);

    Tokenizer tokenizer_;
    Normalizer normalizer_;
    Fingerprinter fingerprinter_;
    size_t preview_limit_;
};

}  // namespace codesim::analysis
