#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <set>
#include <string>
#include <vector>

namespace codesim {

// Which side of a comparison a file belongs to
enum class Collection : uint8_t {
    A = 0,
    B = 1
};

inline const char* collection_label(Collection c) {
    return c == Collection::A ? "A" : "B";
}

// Lexical category assigned by the tokenizer
enum class TokenKind : uint8_t {
    KEYWORD,
    IDENTIFIER,
    NUMBER,
    STRING,     // Quoted string or template literal, kept opaque
    OPERATOR    // Multi-character operator or single symbol
};

struct Token {
    TokenKind kind = TokenKind::OPERATOR;
    std::string text;

    bool operator==(const Token& other) const {
        return kind == other.kind && text == other.text;
    }
};

// Canonical placeholders emitted by the normalizer
constexpr const char* CANONICAL_NUMBER = "NUM";
constexpr const char* CANONICAL_STRING = "STR";
constexpr const char* CANONICAL_IDENTIFIER_PREFIX = "ID";

using CanonicalSequence = std::vector<std::string>;

// SHA-1 digest of one shingle
constexpr size_t FINGERPRINT_SIZE = 20;
using Fingerprint = std::array<uint8_t, FINGERPRINT_SIZE>;

// Ordered so that intersections are a linear merge
using FingerprintSet = std::set<Fingerprint>;

// Default shingle window
constexpr int DEFAULT_SHINGLE_SIZE = 5;

// Upper bound on configured worker threads
constexpr size_t MAX_THREADS = 256;

}  // namespace codesim
