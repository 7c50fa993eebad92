#include <codesim/analysis/tokenizer.hpp>
#include <codesim/util/utf8.hpp>

#include <algorithm>
#include <cctype>

namespace codesim::analysis {

namespace {

inline bool is_digit(char c) {
    return c >= '0' && c <= '9';
}

inline bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

}  // namespace

Tokenizer::Tokenizer(KeywordSet keywords, TokenizerConfig config)
    : keywords_(std::move(keywords))
    , config_(std::move(config))
    , operators_(config_.multi_char_operators) {
    operators_.erase(
        std::remove_if(operators_.begin(), operators_.end(),
                       [](const std::string& op) { return op.empty(); }),
        operators_.end());

    // Longest first so that "===" wins over "=="
    std::stable_sort(operators_.begin(), operators_.end(),
        [](const std::string& a, const std::string& b) {
            return a.size() > b.size();
        });
}

bool Tokenizer::is_identifier_start(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
}

bool Tokenizer::is_identifier_char(char c) {
    return is_identifier_start(c) || is_digit(c);
}

size_t Tokenizer::skip_block_comment(const std::string& text, size_t pos) const {
    // pos points at "/*"; an unterminated comment runs to end of input
    size_t end = text.find("*/", pos + 2);
    if (end == std::string::npos) {
        return text.size();
    }
    return end + 2;
}

size_t Tokenizer::skip_line(const std::string& text, size_t pos) const {
    size_t end = text.find('\n', pos);
    if (end == std::string::npos) {
        return text.size();
    }
    return end;
}

bool Tokenizer::starts_line_comment(const std::string& text, size_t pos,
                                    const Grammar& grammar) const {
    if (text.compare(pos, 2, "//") == 0) {
        return true;
    }
    for (const auto& marker : grammar.line_comment_markers) {
        if (!marker.empty() && text.compare(pos, marker.size(), marker) == 0) {
            return true;
        }
    }
    return false;
}

size_t Tokenizer::scan_quoted(const std::string& text, size_t pos) const {
    const char quote = text[pos];
    size_t i = pos + 1;

    while (i < text.size()) {
        char c = text[i];
        if (c == '\\') {
            // Escaped delimiter or line continuation
            i = std::min(i + 2, text.size());
            continue;
        }
        if (c == quote) {
            return i + 1;
        }
        if (c == '\n') {
            // Unterminated on this line: close before the newline
            return i;
        }
        ++i;
    }

    return text.size();
}

size_t Tokenizer::scan_template(const std::string& text, size_t pos) const {
    size_t i = pos + 1;

    while (i < text.size()) {
        char c = text[i];
        if (c == '\\') {
            i = std::min(i + 2, text.size());
            continue;
        }
        if (c == '`') {
            return i + 1;
        }
        ++i;
    }

    return text.size();
}

size_t Tokenizer::scan_identifier(const std::string& text, size_t pos) const {
    size_t i = pos + 1;
    while (i < text.size() && is_identifier_char(text[i])) {
        ++i;
    }
    return i;
}

size_t Tokenizer::scan_number(const std::string& text, size_t pos) const {
    size_t i = pos;
    while (i < text.size() && is_digit(text[i])) {
        ++i;
    }

    // Decimal part only when a digit follows the dot
    if (i + 1 < text.size() && text[i] == '.' && is_digit(text[i + 1])) {
        i += 1;
        while (i < text.size() && is_digit(text[i])) {
            ++i;
        }
    }
    return i;
}

size_t Tokenizer::match_operator(const std::string& text, size_t pos) const {
    for (const auto& op : operators_) {
        if (text.compare(pos, op.size(), op) == 0) {
            return op.size();
        }
    }
    return 0;
}

TokenStream Tokenizer::tokenize(const std::string& raw, const Grammar& grammar) const {
    TokenStream stream;

    const std::string text = sanitize_utf8(raw);
    const size_t n = text.size();
    size_t i = 0;

    auto emit = [&](TokenKind kind, size_t start, size_t end) {
        if (config_.max_tokens > 0 && stream.tokens.size() >= config_.max_tokens) {
            stream.truncated = true;
            return false;
        }
        stream.tokens.push_back(Token{kind, text.substr(start, end - start)});
        return true;
    };

    while (i < n) {
        const char c = text[i];

        if (is_space(c)) {
            ++i;
            continue;
        }

        // Comments take precedence over the '/' operator forms
        if (text.compare(i, 2, "/*") == 0) {
            i = skip_block_comment(text, i);
            continue;
        }
        if (starts_line_comment(text, i, grammar)) {
            i = skip_line(text, i);
            continue;
        }

        size_t end = i;
        TokenKind kind = TokenKind::OPERATOR;

        if (c == '`') {
            end = scan_template(text, i);
            kind = TokenKind::STRING;
        } else if (c == '"' || c == '\'') {
            end = scan_quoted(text, i);
            kind = TokenKind::STRING;
        } else if (is_identifier_start(c)) {
            end = scan_identifier(text, i);
            kind = keywords_.contains(text.substr(i, end - i))
                ? TokenKind::KEYWORD : TokenKind::IDENTIFIER;
        } else if (is_digit(c)) {
            end = scan_number(text, i);
            kind = TokenKind::NUMBER;
        } else if (size_t len = match_operator(text, i); len > 0) {
            end = i + len;
        } else if (config_.single_char_symbols.find(c) != std::string::npos) {
            end = i + 1;
        } else {
            // No rule starts here ('@', '$', non-ASCII text outside literals)
            ++i;
            continue;
        }

        if (!emit(kind, i, end)) {
            break;
        }
        i = end;
    }

    return stream;
}

}  // namespace codesim::analysis
