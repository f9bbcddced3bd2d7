#pragma once

#include <idforge/result.hpp>
#include <array>
#include <cstdint>
#include <string>
#include <string_view>

namespace idforge {

// A 128-bit identifier. bytes holds the RFC 4122 fields in network order:
//
//   0-3   time_low
//   4-5   time_mid
//   6-7   time_hi_and_version   (high nibble of byte 6 = version)
//   8     clock_seq_hi_and_reserved (top bits = variant)
//   9     clock_seq_low
//   10-15 node
struct Uuid {
    std::array<uint8_t, 16> bytes;

    // Version nibble (upper 4 bits of byte 6).
    int version() const { return bytes[6] >> 4; }

    // True when the top two bits of byte 8 are 10 (RFC 4122 variant).
    bool is_rfc_variant() const { return (bytes[8] & 0xC0) == 0x80; }

    bool is_nil() const;

    // Lowercase xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx
    std::string to_string() const;
    static Result<Uuid> from_string(std::string_view s);

    // Mixed-endian GUID layout: the first three fields little-endian.
    std::array<uint8_t, 16> to_guid_bytes() const;
    static Uuid from_guid_bytes(const std::array<uint8_t, 16>& guid);

    bool operator==(const Uuid& other) const;
    bool operator!=(const Uuid& other) const;
    bool operator<(const Uuid& other) const;
};

// Name space IDs from RFC 4122 Appendix C.
inline constexpr Uuid dns_namespace{{
    0x6b, 0xa7, 0xb8, 0x10, 0x9d, 0xad, 0x11, 0xd1,
    0x80, 0xb4, 0x00, 0xc0, 0x4f, 0xd4, 0x30, 0xc8}};
inline constexpr Uuid url_namespace{{
    0x6b, 0xa7, 0xb8, 0x11, 0x9d, 0xad, 0x11, 0xd1,
    0x80, 0xb4, 0x00, 0xc0, 0x4f, 0xd4, 0x30, 0xc8}};
inline constexpr Uuid iso_oid_namespace{{
    0x6b, 0xa7, 0xb8, 0x12, 0x9d, 0xad, 0x11, 0xd1,
    0x80, 0xb4, 0x00, 0xc0, 0x4f, 0xd4, 0x30, 0xc8}};

} // namespace idforge
