#pragma once

#include <codesim/analysis/keyword_set.hpp>
#include <codesim/analysis/tokenizer.hpp>
#include <codesim/core_types.hpp>
#include <codesim/result.hpp>

#include <filesystem>
#include <string>
#include <vector>

namespace codesim {

namespace fs = std::filesystem;

/**
 * One input file. Text is held only until the file has been analyzed.
 */
struct SourceFile {
    std::string path;           // Relative, '/' separated
    Collection collection = Collection::A;
    std::string text;
};

/**
 * A file that still has to be read from disk.
 */
struct SourceLocation {
    std::string path;           // Relative, used in results
    fs::path full_path;
    Collection collection = Collection::A;
};

/**
 * Configuration for one comparison run.
 */
struct ComparisonConfig {
    int shingle_size = DEFAULT_SHINGLE_SIZE;
    analysis::KeywordSet keywords = analysis::KeywordSet::java_and_javascript();
    analysis::TokenizerConfig tokenizer;

    // Files larger than this are skipped with a warning
    size_t max_file_bytes = 8u * 1024u * 1024u;

    // Token streams are truncated past this count
    size_t max_tokens_per_file = 200000;

    // 0 => unlimited
    size_t max_pairwise_comparisons = 0;

    // 0 => hardware concurrency, at most MAX_THREADS
    size_t threads = 0;

    // Report previews
    size_t token_preview_limit = 100;
    size_t fingerprint_preview_limit = 20;

    bool verbose = false;

    /**
     * Reject settings that make a run meaningless.
     * Called before any file is processed.
     */
    Result<void> validate() const;

    size_t resolved_threads() const;
};

}  // namespace codesim
