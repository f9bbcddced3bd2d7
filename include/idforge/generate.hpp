#pragma once

#include <idforge/clock.hpp>
#include <idforge/digest.hpp>
#include <idforge/random.hpp>
#include <idforge/result.hpp>
#include <idforge/uuid.hpp>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace idforge {

// ---- Name-based (RFC 4122 section 4.3) ----

// Version 3 (MD5) or 5 (SHA-1) identifier for name within namespace_id.
// Deterministic: the same inputs always yield the same identifier.
// Fails with InvalidArg for any other version or a null name pointer.
Result<Uuid> create_from_name(const Uuid& namespace_id, std::string_view name,
                              int version = 5);
Result<Uuid> create_from_name(const Uuid& namespace_id,
                              const uint8_t* name, size_t len, int version = 5);

// ---- Random ----

Result<Uuid> create_v4(RandomSource& random = system_random());

// ---- Time-based ----

// Version 6: 60-bit Gregorian timestamp stored most significant bits
// first, followed by 64 random bits. Uses clock.now() when ts is empty.
// Fails with OutOfRange before 1582-10-15 or past the 60-bit range.
Result<Uuid> create_v6(std::optional<Timestamp> ts = std::nullopt);
Result<Uuid> create_v6(std::optional<Timestamp> ts, const Clock& clock,
                       RandomSource& random);

// Reorders a version 1 identifier into version 6, keeping its clock
// sequence and node. Fails with Malformed unless v1.version() == 1.
Result<Uuid> create_v6_from_v1(const Uuid& v1);

// 100-ns ticks since 1582-10-15 stored in a version 6 identifier.
uint64_t v6_ticks(const Uuid& v6);

// Version 7: 48-bit Unix millisecond timestamp then 74 random bits.
// Fails with OutOfRange before 1970-01-01 or past the 48-bit range.
Result<Uuid> create_v7(std::optional<Timestamp> ts = std::nullopt);
Result<Uuid> create_v7(std::optional<Timestamp> ts, const Clock& clock,
                       RandomSource& random);

// Unix milliseconds stored in the first 48 bits of a version 7 identifier.
uint64_t v7_unix_ms(const Uuid& v7);

// ---- Free-form (version 8) ----

// The first 16 of data's bytes (most significant first) with the version
// and variant bits overwritten. Fails with InvalidArg if data is null or
// shorter than 16 bytes.
Result<Uuid> create_v8(const uint8_t* data, size_t len);
Result<Uuid> create_v8(const std::vector<uint8_t>& data);

// Name-based version 8 using SHA-256, SHA-384 or SHA-512. Only the
// namespace and name are hashed; no hash space ID is prepended.
Result<Uuid> create_v8_from_name(HashAlgorithm alg, const Uuid& namespace_id,
                                 const uint8_t* name, size_t len);
Result<Uuid> create_v8_from_name(HashAlgorithm alg, const Uuid& namespace_id,
                                 std::string_view name);
Result<Uuid> create_v8_from_name(std::string_view alg_name,
                                 const Uuid& namespace_id, std::string_view name);

} // namespace idforge
