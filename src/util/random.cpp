#include <idforge/random.hpp>
#include <idforge/log.hpp>
#include <openssl/err.h>
#include <openssl/rand.h>
#include <climits>
#include <string>

namespace idforge {

Status SystemRandom::fill(uint8_t* buf, size_t len) {
    if (len > static_cast<size_t>(INT_MAX)) {
        return IdError{IdError::InvalidArg,
            "random request of " + std::to_string(len) + " bytes is too large"};
    }
    if (RAND_bytes(buf, static_cast<int>(len)) != 1) {
        char reason[256];
        ERR_error_string_n(ERR_get_error(), reason, sizeof(reason));
        log::error("RAND_bytes failed: %s", reason);
        return IdError{IdError::Entropy,
            "secure random source failed",
            reason};
    }
    return ok_status();
}

RandomSource& system_random() {
    static SystemRandom random;
    return random;
}

} // namespace idforge
