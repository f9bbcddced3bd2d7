#include <idforge/ulid.hpp>

namespace idforge {

static const char crockford_chars[] = "0123456789ABCDEFGHJKMNPQRSTVWXYZ";

// Divide a big-endian byte array (in-place) by 32, return the remainder.
static uint8_t div_by_32(uint8_t* num, size_t len) {
    uint32_t carry = 0;
    for (size_t i = 0; i < len; ++i) {
        uint32_t cur = (carry << 8) | num[i];
        num[i] = static_cast<uint8_t>(cur >> 5);
        carry = cur & 0x1F;
    }
    return static_cast<uint8_t>(carry);
}

bool try_format_ulid(const Uuid& u, char* dest, size_t capacity, size_t& written) {
    written = 0;
    if (dest == nullptr || capacity < ulid_length) {
        return false;
    }

    // 26 digits hold 130 bits; the leading digit only ever carries 3.
    std::array<uint8_t, 16> work = u.bytes;
    for (size_t i = ulid_length; i-- > 0; ) {
        dest[i] = crockford_chars[div_by_32(work.data(), work.size())];
    }
    written = ulid_length;
    return true;
}

std::string to_ulid_string(const Uuid& u) {
    char buf[ulid_length];
    size_t written = 0;
    if (!try_format_ulid(u, buf, sizeof(buf), written)) {
        return std::string();
    }
    return std::string(buf, written);
}

} // namespace idforge
