#pragma once

#include <codesim/core_types.hpp>
#include <codesim/result.hpp>

#include <string>

namespace codesim::analysis {

// U+241F SYMBOL FOR UNIT SEPARATOR; never produced by the normalizer
constexpr const char* SHINGLE_SEPARATOR = "\xE2\x90\x9F";

/**
 * Turns a canonical sequence into a set of k-gram shingle digests.
 *
 * Each window of k consecutive tokens is joined with SHINGLE_SEPARATOR and
 * hashed with SHA-1. A sequence shorter than k (but not empty) yields exactly
 * one digest over the whole sequence; an empty sequence yields none.
 */
class Fingerprinter {
public:
    // Rejects k < 1
    static Result<Fingerprinter> create(int shingle_size);

    Result<FingerprintSet> fingerprint(const CanonicalSequence& sequence) const;

    int shingle_size() const { return k_; }

    // Joined text of tokens [begin, end), the digest input
    static std::string join_window(const CanonicalSequence& sequence,
                                   size_t begin, size_t end);

private:
    explicit Fingerprinter(int k) : k_(k) {}

    int k_;
};

}  // namespace codesim::analysis
