#pragma once

#include <idforge/result.hpp>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

struct evp_md_ctx_st;

namespace idforge {

enum class HashAlgorithm { Md5, Sha1, Sha256, Sha384, Sha512 };

// Canonical upper-case name: "MD5", "SHA1", "SHA256", "SHA384", "SHA512".
const char* hash_algorithm_name(HashAlgorithm alg);

// Case-insensitive; a hyphen after "SHA" is accepted ("sha-256").
Result<HashAlgorithm> parse_hash_algorithm(std::string_view name);

// Digest length in bytes.
size_t digest_size(HashAlgorithm alg);

// Incremental message digest backed by OpenSSL EVP.
class Digest {
public:
    explicit Digest(HashAlgorithm alg);

    // Feed data in chunks
    void update(const uint8_t* data, size_t len);
    void update(std::string_view s);

    // Finalize and return the digest. The object should not be reused
    // after this call.
    Result<std::vector<uint8_t>> finalize();

    HashAlgorithm algorithm() const { return alg_; }

    // One-shot helpers
    static Result<std::vector<uint8_t>> compute(HashAlgorithm alg,
                                                const uint8_t* data, size_t len);
    static std::string bytes_to_hex(const std::vector<uint8_t>& bytes);

private:
    struct CtxDeleter {
        void operator()(evp_md_ctx_st* ctx) const;
    };

    HashAlgorithm alg_;
    std::unique_ptr<evp_md_ctx_st, CtxDeleter> ctx_;
    bool failed_ = false;
};

} // namespace idforge
