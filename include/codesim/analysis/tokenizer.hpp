#pragma once

#include <codesim/analysis/keyword_set.hpp>
#include <codesim/core_types.hpp>
#include <codesim/language_detector.hpp>

#include <string>
#include <vector>

namespace codesim::analysis {

struct TokenizerConfig {
    // Matched longest first; order here does not matter
    std::vector<std::string> multi_char_operators = default_operators();

    // Characters emitted as one-character symbol tokens
    std::string single_char_symbols = "~!%^&*()+={}[]|\\:;<>,.?/-";

    // 0 = unlimited
    size_t max_tokens = 0;

    static std::vector<std::string> default_operators() {
        return {
            "===", "!==", "...",
            "==", "!=", "<=", ">=", "&&", "||", "++", "--", "->", "=>", ":=",
            "::", "<<", ">>", "+=", "-=", "*=", "/=", "%=", "**", "??"
        };
    }
};

struct TokenStream {
    std::vector<Token> tokens;
    bool truncated = false;   // max_tokens was reached
};

/**
 * Lexer shared by every supported language.
 *
 * Comments are folded into the token grammar and dropped during the scan.
 * String and template literals come out as single opaque tokens, so their
 * contents never reach the normalizer. Scanning is one left-to-right pass:
 * at each position the first matching rule consumes its longest match.
 */
class Tokenizer {
public:
    explicit Tokenizer(KeywordSet keywords, TokenizerConfig config = {});

    // Tokenize source text using the given grammar's comment markers
    TokenStream tokenize(const std::string& text, const Grammar& grammar = {}) const;

    const KeywordSet& keywords() const { return keywords_; }
    const TokenizerConfig& config() const { return config_; }

    static bool is_identifier_start(char c);
    static bool is_identifier_char(char c);

private:
    KeywordSet keywords_;
    TokenizerConfig config_;
    std::vector<std::string> operators_;   // sorted longest first

    size_t skip_block_comment(const std::string& text, size_t pos) const;
    size_t skip_line(const std::string& text, size_t pos) const;
    size_t scan_quoted(const std::string& text, size_t pos) const;
    size_t scan_template(const std::string& text, size_t pos) const;
    size_t scan_identifier(const std::string& text, size_t pos) const;
    size_t scan_number(const std::string& text, size_t pos) const;
    size_t match_operator(const std::string& text, size_t pos) const;

    bool starts_line_comment(const std::string& text, size_t pos,
                             const Grammar& grammar) const;
};

}  // namespace codesim::analysis
