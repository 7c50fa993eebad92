#include <codesim/analysis/file_analyzer.hpp>
#include <codesim/language_detector.hpp>

#include <algorithm>

namespace codesim::analysis {

FileAnalyzer::FileAnalyzer(Tokenizer tokenizer, Normalizer normalizer,
                           Fingerprinter fingerprinter, size_t preview_limit)
    : tokenizer_(std::move(tokenizer))
    , normalizer_(std::move(normalizer))
    , fingerprinter_(std::move(fingerprinter))
    , preview_limit_(preview_limit) {}

Result<FileAnalyzer> FileAnalyzer::create(const ComparisonConfig& config) {
    auto valid = config.validate();
    if (!valid.ok()) {
        return valid.error();
    }

    auto fingerprinter = Fingerprinter::create(config.shingle_size);
    if (!fingerprinter.ok()) {
        return fingerprinter.error();
    }

    TokenizerConfig tokenizer_config = config.tokenizer;
    tokenizer_config.max_tokens = config.max_tokens_per_file;

    return FileAnalyzer(Tokenizer(config.keywords, std::move(tokenizer_config)),
                        Normalizer(config.keywords),
                        std::move(fingerprinter).value(),
                        config.token_preview_limit);
}

Result<FileAnalysis> FileAnalyzer::analyze(const SourceFile& file) const {
    FileAnalysis analysis;
    analysis.path = file.path;
    analysis.collection = file.collection;

    Grammar grammar = LanguageDetector::grammar_for_file(file.text, file.path);
    analysis.language = grammar.language;

    TokenStream stream = tokenizer_.tokenize(file.text, grammar);
    analysis.raw_token_count = stream.tokens.size();
    analysis.truncated = stream.truncated;

    NormalizedFile normalized = normalizer_.normalize(stream.tokens);
    analysis.normalized_token_count = normalized.sequence.size();
    analysis.identifier_map = normalized.context.mappings();

    const size_t raw_preview = std::min(preview_limit_, stream.tokens.size());
    analysis.raw_token_preview.reserve(raw_preview);
    for (size_t i = 0; i < raw_preview; ++i) {
        analysis.raw_token_preview.push_back(stream.tokens[i].text);
    }

    const size_t canonical_preview = std::min(preview_limit_, normalized.sequence.size());
    analysis.canonical_preview.assign(normalized.sequence.begin(),
                                      normalized.sequence.begin() + canonical_preview);

    auto fingerprints = fingerprinter_.fingerprint(normalized.sequence);
    if (!fingerprints.ok()) {
        return Error(fingerprints.error().code(),
                     file.path + ": " + fingerprints.error().message());
    }
    analysis.fingerprints = std::move(fingerprints).value();

    return analysis;
}

}  // namespace codesim::analysis
