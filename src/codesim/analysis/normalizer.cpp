#include <codesim/analysis/normalizer.hpp>
#include <codesim/analysis/tokenizer.hpp>

namespace codesim::analysis {

const std::string& NormalizationContext::rename(const std::string& identifier) {
    auto it = index_.find(identifier);
    if (it != index_.end()) {
        return entries_[it->second].second;
    }

    std::string symbol = CANONICAL_IDENTIFIER_PREFIX + std::to_string(next_id_++);
    index_.emplace(identifier, entries_.size());
    entries_.emplace_back(identifier, std::move(symbol));
    return entries_.back().second;
}

Normalizer::Normalizer(KeywordSet keywords)
    : keywords_(std::move(keywords)) {}

bool Normalizer::is_numeric(const std::string& text) {
    // \d+ or \d+\.\d+
    if (text.empty()) return false;

    size_t i = 0;
    while (i < text.size() && text[i] >= '0' && text[i] <= '9') ++i;
    if (i == 0) return false;
    if (i == text.size()) return true;

    if (text[i] != '.' || i + 1 == text.size()) return false;
    ++i;
    while (i < text.size() && text[i] >= '0' && text[i] <= '9') ++i;
    return i == text.size();
}

bool Normalizer::is_identifier(const std::string& text) {
    if (text.empty() || !Tokenizer::is_identifier_start(text[0])) {
        return false;
    }
    for (size_t i = 1; i < text.size(); ++i) {
        if (!Tokenizer::is_identifier_char(text[i])) {
            return false;
        }
    }
    return true;
}

CanonicalSequence Normalizer::normalize(const std::vector<Token>& tokens,
                                        NormalizationContext& context) const {
    CanonicalSequence sequence;
    sequence.reserve(tokens.size());

    for (const auto& token : tokens) {
        if (token.kind == TokenKind::STRING) {
            sequence.emplace_back(CANONICAL_STRING);
        } else if (keywords_.contains(token.text)) {
            sequence.push_back(token.text);
        } else if (is_numeric(token.text)) {
            sequence.emplace_back(CANONICAL_NUMBER);
        } else if (is_identifier(token.text)) {
            sequence.push_back(context.rename(token.text));
        } else {
            sequence.push_back(token.text);
        }
    }

    return sequence;
}

NormalizedFile Normalizer::normalize(const std::vector<Token>& tokens) const {
    NormalizedFile result;
    result.sequence = normalize(tokens, result.context);
    return result;
}

}  // namespace codesim::analysis
