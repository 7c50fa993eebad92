#pragma once

#include <codesim/analysis/keyword_set.hpp>
#include <codesim/core_types.hpp>

#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace codesim::analysis {

/**
 * Identifier renaming table for one file.
 *
 * Symbolic names are handed out in first-occurrence order (ID1, ID2, ...).
 * A fresh context is created per file and never shared.
 */
class NormalizationContext {
public:
    // Symbolic name for identifier, allocating the next one on first sight
    const std::string& rename(const std::string& identifier);

    // Mapping in first-occurrence order
    const std::vector<std::pair<std::string, std::string>>& mappings() const {
        return entries_;
    }

    size_t size() const { return entries_.size(); }
    int next_id() const { return next_id_; }

private:
    std::unordered_map<std::string, size_t> index_;
    std::vector<std::pair<std::string, std::string>> entries_;
    int next_id_ = 1;
};

struct NormalizedFile {
    CanonicalSequence sequence;
    NormalizationContext context;
};

/**
 * Rewrites a token stream into its identifier-blind canonical form.
 *
 * Rules, applied per token in order:
 *   string/template literal -> STR
 *   reserved keyword        -> unchanged
 *   numeric literal         -> NUM
 *   identifier              -> IDn from the file's context
 *   anything else           -> unchanged
 */
class Normalizer {
public:
    explicit Normalizer(KeywordSet keywords);

    NormalizedFile normalize(const std::vector<Token>& tokens) const;

    // Normalize into a caller-owned context
    CanonicalSequence normalize(const std::vector<Token>& tokens,
                                NormalizationContext& context) const;

    static bool is_numeric(const std::string& text);
    static bool is_identifier(const std::string& text);

private:
    KeywordSet keywords_;
};

}  // namespace codesim::analysis
