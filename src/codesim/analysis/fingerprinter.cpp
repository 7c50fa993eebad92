#include <codesim/analysis/fingerprinter.hpp>
#include <codesim/util/sha1.hpp>

namespace codesim::analysis {

Result<Fingerprinter> Fingerprinter::create(int shingle_size) {
    if (shingle_size < 1) {
        return Error(ErrorCode::INVALID_CONFIG,
                     "Shingle size must be >= 1, got " + std::to_string(shingle_size));
    }
    return Fingerprinter(shingle_size);
}

std::string Fingerprinter::join_window(const CanonicalSequence& sequence,
                                       size_t begin, size_t end) {
    std::string joined;
    for (size_t i = begin; i < end; ++i) {
        if (i > begin) {
            joined += SHINGLE_SEPARATOR;
        }
        joined += sequence[i];
    }
    return joined;
}

Result<FingerprintSet> Fingerprinter::fingerprint(const CanonicalSequence& sequence) const {
    FingerprintSet fingerprints;
    if (sequence.empty()) {
        return fingerprints;
    }

    Sha1Hasher hasher;
    const size_t n = sequence.size();
    const size_t k = static_cast<size_t>(k_);

    if (n < k) {
        auto digest = hasher.digest(join_window(sequence, 0, n));
        if (!digest.ok()) {
            return digest.error();
        }
        fingerprints.insert(digest.value());
        return fingerprints;
    }

    for (size_t i = 0; i + k <= n; ++i) {
        auto digest = hasher.digest(join_window(sequence, i, i + k));
        if (!digest.ok()) {
            return digest.error();
        }
        fingerprints.insert(digest.value());
    }

    return fingerprints;
}

}  // namespace codesim::analysis
