#include <idforge/digest.hpp>
#include <idforge/log.hpp>
#include <openssl/evp.h>
#include <cctype>

namespace idforge {

static const EVP_MD* evp_md_for(HashAlgorithm alg) {
    switch (alg) {
        case HashAlgorithm::Md5:    return EVP_md5();
        case HashAlgorithm::Sha1:   return EVP_sha1();
        case HashAlgorithm::Sha256: return EVP_sha256();
        case HashAlgorithm::Sha384: return EVP_sha384();
        case HashAlgorithm::Sha512: return EVP_sha512();
    }
    return nullptr;
}

const char* hash_algorithm_name(HashAlgorithm alg) {
    switch (alg) {
        case HashAlgorithm::Md5:    return "MD5";
        case HashAlgorithm::Sha1:   return "SHA1";
        case HashAlgorithm::Sha256: return "SHA256";
        case HashAlgorithm::Sha384: return "SHA384";
        case HashAlgorithm::Sha512: return "SHA512";
    }
    return "unknown";
}

Result<HashAlgorithm> parse_hash_algorithm(std::string_view name) {
    std::string key;
    key.reserve(name.size());
    for (size_t i = 0; i < name.size(); ++i) {
        char c = static_cast<char>(std::toupper(static_cast<unsigned char>(name[i])));
        // "SHA-256" -> "SHA256"
        if (c == '-' && i == 3) continue;
        key += c;
    }

    for (HashAlgorithm alg : {HashAlgorithm::Md5, HashAlgorithm::Sha1,
                              HashAlgorithm::Sha256, HashAlgorithm::Sha384,
                              HashAlgorithm::Sha512}) {
        if (key == hash_algorithm_name(alg)) {
            return Result<HashAlgorithm>::ok(alg);
        }
    }
    return IdError{IdError::InvalidArg,
        "unrecognized hash algorithm '" + std::string(name) + "'",
        "expected one of: MD5, SHA1, SHA256, SHA384, SHA512"};
}

size_t digest_size(HashAlgorithm alg) {
    switch (alg) {
        case HashAlgorithm::Md5:    return 16;
        case HashAlgorithm::Sha1:   return 20;
        case HashAlgorithm::Sha256: return 32;
        case HashAlgorithm::Sha384: return 48;
        case HashAlgorithm::Sha512: return 64;
    }
    return 0;
}

void Digest::CtxDeleter::operator()(evp_md_ctx_st* ctx) const {
    EVP_MD_CTX_free(ctx);
}

Digest::Digest(HashAlgorithm alg)
    : alg_(alg), ctx_(EVP_MD_CTX_new()) {
    if (!ctx_ || EVP_DigestInit_ex(ctx_.get(), evp_md_for(alg), nullptr) != 1) {
        log::error("cannot initialize %s digest", hash_algorithm_name(alg));
        failed_ = true;
    }
}

void Digest::update(const uint8_t* data, size_t len) {
    if (failed_ || len == 0) return;
    if (EVP_DigestUpdate(ctx_.get(), data, len) != 1) {
        log::error("%s digest update failed", hash_algorithm_name(alg_));
        failed_ = true;
    }
}

void Digest::update(std::string_view s) {
    update(reinterpret_cast<const uint8_t*>(s.data()), s.size());
}

Result<std::vector<uint8_t>> Digest::finalize() {
    if (failed_) {
        return IdError{IdError::Digest,
            std::string(hash_algorithm_name(alg_)) + " digest failed",
            "see earlier log output for the OpenSSL failure"};
    }

    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int md_len = 0;
    if (EVP_DigestFinal_ex(ctx_.get(), md, &md_len) != 1) {
        failed_ = true;
        return IdError{IdError::Digest,
            std::string(hash_algorithm_name(alg_)) + " digest finalization failed"};
    }
    return Result<std::vector<uint8_t>>::ok(std::vector<uint8_t>(md, md + md_len));
}

Result<std::vector<uint8_t>> Digest::compute(HashAlgorithm alg,
                                             const uint8_t* data, size_t len) {
    Digest ctx(alg);
    ctx.update(data, len);
    return ctx.finalize();
}

std::string Digest::bytes_to_hex(const std::vector<uint8_t>& bytes) {
    static const char hex_chars[] = "0123456789abcdef";
    std::string out;
    out.reserve(bytes.size() * 2);
    for (uint8_t b : bytes) {
        out += hex_chars[b >> 4];
        out += hex_chars[b & 0x0f];
    }
    return out;
}

} // namespace idforge
