#include <codesim/util/sha1.hpp>

#include <openssl/evp.h>

#include <cstdio>

namespace codesim {

void Sha1Hasher::ContextDeleter::operator()(EVP_MD_CTX* ctx) const {
    EVP_MD_CTX_free(ctx);
}

Sha1Hasher::Sha1Hasher()
    : ctx_(EVP_MD_CTX_new()) {}

Result<Fingerprint> Sha1Hasher::digest(std::string_view data) {
    if (!ctx_) {
        return Error(ErrorCode::INTERNAL_ERROR, "Failed to allocate digest context");
    }

    if (EVP_DigestInit_ex(ctx_.get(), EVP_sha1(), nullptr) != 1) {
        return Error(ErrorCode::INTERNAL_ERROR, "EVP_DigestInit_ex failed");
    }
    if (EVP_DigestUpdate(ctx_.get(), data.data(), data.size()) != 1) {
        return Error(ErrorCode::INTERNAL_ERROR, "EVP_DigestUpdate failed");
    }

    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int md_len = 0;
    if (EVP_DigestFinal_ex(ctx_.get(), md, &md_len) != 1) {
        return Error(ErrorCode::INTERNAL_ERROR, "EVP_DigestFinal_ex failed");
    }
    if (md_len != FINGERPRINT_SIZE) {
        return Error(ErrorCode::INTERNAL_ERROR,
                     "Unexpected digest length: " + std::to_string(md_len));
    }

    Fingerprint fp{};
    for (size_t i = 0; i < FINGERPRINT_SIZE; ++i) {
        fp[i] = static_cast<uint8_t>(md[i]);
    }
    return fp;
}

std::string Sha1Hasher::to_hex(const Fingerprint& fp) {
    std::string result;
    result.reserve(FINGERPRINT_SIZE * 2);
    for (uint8_t byte : fp) {
        char buf[3];
        std::snprintf(buf, sizeof(buf), "%02x", byte);
        result += buf;
    }
    return result;
}

}  // namespace codesim
