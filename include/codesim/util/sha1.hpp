#pragma once

#include <codesim/core_types.hpp>
#include <codesim/result.hpp>

#include <memory>
#include <string>
#include <string_view>

// Forward declaration keeps OpenSSL out of public headers
typedef struct evp_md_ctx_st EVP_MD_CTX;

namespace codesim {

/**
 * SHA-1 digests through the OpenSSL EVP interface.
 *
 * Holds one digest context that is reset for every call, so a hasher can be
 * reused across all shingles of a file. Not thread-safe: use one per task.
 */
class Sha1Hasher {
public:
    Sha1Hasher();

    Sha1Hasher(const Sha1Hasher&) = delete;
    Sha1Hasher& operator=(const Sha1Hasher&) = delete;
    Sha1Hasher(Sha1Hasher&&) noexcept = default;
    Sha1Hasher& operator=(Sha1Hasher&&) noexcept = default;

    Result<Fingerprint> digest(std::string_view data);

    static std::string to_hex(const Fingerprint& fp);

private:
    struct ContextDeleter {
        void operator()(EVP_MD_CTX* ctx) const;
    };

    std::unique_ptr<EVP_MD_CTX, ContextDeleter> ctx_;
};

}  // namespace codesim
