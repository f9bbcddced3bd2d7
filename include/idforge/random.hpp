#pragma once

#include <idforge/result.hpp>
#include <cstddef>
#include <cstdint>

namespace idforge {

// Source of the random bits in v4, v6 and v7 identifiers. Every call must
// produce fresh bytes; implementations used from several threads must be
// safe for concurrent use.
class RandomSource {
public:
    virtual ~RandomSource() = default;
    virtual Status fill(uint8_t* buf, size_t len) = 0;
};

// Cryptographically secure bytes from OpenSSL RAND_bytes.
class SystemRandom : public RandomSource {
public:
    Status fill(uint8_t* buf, size_t len) override;
};

// Process-wide SystemRandom instance.
RandomSource& system_random();

} // namespace idforge
