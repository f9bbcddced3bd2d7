#include <idforge/uuid.hpp>
#include <idforge/byte_order.hpp>

namespace idforge {

// ---- Hex helpers ----

static const char hex_chars[] = "0123456789abcdef";

static int hex_val(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

static bool is_dash_position(size_t i) {
    return i == 8 || i == 13 || i == 18 || i == 23;
}

bool Uuid::is_nil() const {
    for (uint8_t b : bytes) {
        if (b != 0) return false;
    }
    return true;
}

// ---- to_string: xxxxxxxx-xxxx-Vxxx-yxxx-xxxxxxxxxxxx ----

std::string Uuid::to_string() const {
    std::string out;
    out.reserve(36);
    for (int i = 0; i < 16; ++i) {
        out += hex_chars[bytes[i] >> 4];
        out += hex_chars[bytes[i] & 0x0F];
        if (i == 3 || i == 5 || i == 7 || i == 9) {
            out += '-';
        }
    }
    return out;
}

// ---- from_string ----

Result<Uuid> Uuid::from_string(std::string_view s) {
    if (s.size() != 36) {
        return IdError(IdError::Parse,
            "UUID string must be 36 characters",
            "Expected format: xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx");
    }

    Uuid u{};
    size_t byte_idx = 0;
    for (size_t i = 0; i < 36; ) {
        if (is_dash_position(i)) {
            if (s[i] != '-') {
                return IdError(IdError::Parse,
                    "UUID string has invalid dash positions",
                    "Expected dashes at positions 8, 13, 18, 23");
            }
            ++i;
            continue;
        }
        int hi = hex_val(s[i]);
        int lo = hex_val(s[i + 1]);
        if (hi < 0 || lo < 0) {
            return IdError(IdError::Parse,
                "UUID string contains invalid hex character",
                "Invalid char at position " + std::to_string(hi < 0 ? i : i + 1));
        }
        u.bytes[byte_idx++] = static_cast<uint8_t>((hi << 4) | lo);
        i += 2;
    }
    return Result<Uuid>::ok(u);
}

// ---- GUID layout ----

std::array<uint8_t, 16> Uuid::to_guid_bytes() const {
    std::array<uint8_t, 16> guid = bytes;
    swap_byte_order(guid);
    return guid;
}

Uuid Uuid::from_guid_bytes(const std::array<uint8_t, 16>& guid) {
    Uuid u{guid};
    swap_byte_order(u.bytes);
    return u;
}

// ---- Comparison ----

bool Uuid::operator==(const Uuid& other) const {
    return bytes == other.bytes;
}

bool Uuid::operator!=(const Uuid& other) const {
    return bytes != other.bytes;
}

// Network order makes this the RFC 9562 sort order, so v6 and v7 values
// compare by creation time.
bool Uuid::operator<(const Uuid& other) const {
    return bytes < other.bytes;
}

} // namespace idforge
