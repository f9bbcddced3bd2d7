#include <idforge/generate.hpp>
#include <idforge/log.hpp>
#include <cstring>
#include <limits>
#include <string>

namespace idforge {

// Overwrite the version nibble (byte 6) and the variant bits (byte 8).
static void stamp_version(std::array<uint8_t, 16>& b, int version) {
    b[6] = static_cast<uint8_t>((b[6] & 0x0F) | (version << 4));
    b[8] = static_cast<uint8_t>((b[8] & 0x3F) | 0x80);
}

// Never null, even for a default-constructed view.
static const uint8_t* name_bytes(std::string_view name) {
    static const uint8_t empty = 0;
    if (name.data() == nullptr) return &empty;
    return reinterpret_cast<const uint8_t*>(name.data());
}

// Hash namespace_id (network order) followed by name and keep the first
// 16 bytes of the digest.
static Result<Uuid> hash_name(HashAlgorithm alg, const Uuid& namespace_id,
                              const uint8_t* name, size_t len, int version) {
    Digest ctx(alg);
    ctx.update(namespace_id.bytes.data(), namespace_id.bytes.size());
    ctx.update(name, len);
    auto digest = ctx.finalize();
    IDFORGE_TRY(digest);

    Uuid u{};
    std::memcpy(u.bytes.data(), digest.value().data(), 16);
    stamp_version(u.bytes, version);
    return Result<Uuid>::ok(u);
}

// ---- Name-based ----

Result<Uuid> create_from_name(const Uuid& namespace_id, std::string_view name,
                              int version) {
    return create_from_name(namespace_id, name_bytes(name), name.size(), version);
}

Result<Uuid> create_from_name(const Uuid& namespace_id,
                              const uint8_t* name, size_t len, int version) {
    if (version != 3 && version != 5) {
        log::debug("rejected name-based version %d", version);
        return IdError{IdError::InvalidArg,
            "unsupported name-based version " + std::to_string(version),
            "version must be either 3 (MD5) or 5 (SHA-1)"};
    }
    if (name == nullptr) {
        return IdError{IdError::InvalidArg, "name is required"};
    }

    HashAlgorithm alg = version == 3 ? HashAlgorithm::Md5 : HashAlgorithm::Sha1;
    return hash_name(alg, namespace_id, name, len, version);
}

// ---- Random ----

Result<Uuid> create_v4(RandomSource& random) {
    Uuid u{};
    IDFORGE_TRY(random.fill(u.bytes.data(), u.bytes.size()));
    stamp_version(u.bytes, 4);
    return Result<Uuid>::ok(u);
}

// ---- Version 6 ----

static constexpr uint64_t max_v6_ticks = (uint64_t(1) << 60) - 1;

// Lays out a 60-bit tick count as time_high (32), time_mid (16),
// version + time_low (4 + 12).
static void write_v6_time(std::array<uint8_t, 16>& b, uint64_t ticks) {
    uint64_t high48 = ticks >> 12;
    for (int i = 0; i < 6; ++i) {
        b[i] = static_cast<uint8_t>(high48 >> (40 - 8 * i));
    }
    b[6] = static_cast<uint8_t>(0x60 | ((ticks >> 8) & 0x0F));
    b[7] = static_cast<uint8_t>(ticks & 0xFF);
}

Result<Uuid> create_v6(std::optional<Timestamp> ts) {
    return create_v6(ts, system_clock(), system_random());
}

Result<Uuid> create_v6(std::optional<Timestamp> ts, const Clock& clock,
                       RandomSource& random) {
    int64_t unix_ticks = (ts ? *ts : clock.now()).time_since_epoch().count();

    if (unix_ticks > std::numeric_limits<int64_t>::max() - gregorian_to_unix_ticks) {
        return IdError{IdError::OutOfRange,
            "timestamp is too late for a version 6 UUID"};
    }
    int64_t ticks = unix_ticks + gregorian_to_unix_ticks;
    if (ticks < 0) {
        log::debug("rejected v6 timestamp %lld ticks before the Gregorian epoch",
                   static_cast<long long>(-ticks));
        return IdError{IdError::OutOfRange,
            "timestamp precedes 1582-10-15T00:00:00Z",
            "version 6 counts 100-ns intervals from the Gregorian calendar reform"};
    }
    if (static_cast<uint64_t>(ticks) > max_v6_ticks) {
        return IdError{IdError::OutOfRange,
            "timestamp does not fit in 60 bits"};
    }

    Uuid u{};
    IDFORGE_TRY(random.fill(u.bytes.data() + 8, 8));
    write_v6_time(u.bytes, static_cast<uint64_t>(ticks));
    stamp_version(u.bytes, 6);
    return Result<Uuid>::ok(u);
}

Result<Uuid> create_v6_from_v1(const Uuid& v1) {
    if (v1.version() != 1) {
        log::debug("rejected v6 conversion of version %d UUID %s",
                   v1.version(), v1.to_string().c_str());
        return IdError{IdError::Malformed,
            "UUID " + v1.to_string() + " is not version 1",
            "only version 1 UUIDs can be converted to version 6"};
    }

    const auto& b = v1.bytes;
    uint64_t time_low = (uint64_t(b[0]) << 24) | (uint64_t(b[1]) << 16)
                      | (uint64_t(b[2]) << 8) | uint64_t(b[3]);
    uint64_t time_mid = (uint64_t(b[4]) << 8) | uint64_t(b[5]);
    uint64_t time_hi = ((uint64_t(b[6]) & 0x0F) << 8) | uint64_t(b[7]);
    uint64_t ticks = (time_hi << 48) | (time_mid << 32) | time_low;

    // Bytes 8..15 (clock sequence and node) carry over unchanged.
    Uuid u = v1;
    write_v6_time(u.bytes, ticks);
    return Result<Uuid>::ok(u);
}

uint64_t v6_ticks(const Uuid& v6) {
    uint64_t high48 = 0;
    for (int i = 0; i < 6; ++i) {
        high48 = (high48 << 8) | v6.bytes[i];
    }
    return (high48 << 12) | (uint64_t(v6.bytes[6] & 0x0F) << 8) | v6.bytes[7];
}

// ---- Version 7 ----

static constexpr uint64_t max_v7_ms = (uint64_t(1) << 48) - 1;

Result<Uuid> create_v7(std::optional<Timestamp> ts) {
    return create_v7(ts, system_clock(), system_random());
}

Result<Uuid> create_v7(std::optional<Timestamp> ts, const Clock& clock,
                       RandomSource& random) {
    Ticks since_epoch = (ts ? *ts : clock.now()).time_since_epoch();
    if (since_epoch.count() < 0) {
        log::debug("rejected pre-1970 v7 timestamp");
        return IdError{IdError::OutOfRange,
            "timestamp precedes 1970-01-01T00:00:00Z",
            "version 7 stores Unix milliseconds"};
    }
    auto ms = static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(since_epoch).count());
    if (ms > max_v7_ms) {
        return IdError{IdError::OutOfRange,
            "timestamp does not fit in 48 bits of milliseconds"};
    }

    Uuid u{};
    IDFORGE_TRY(random.fill(u.bytes.data() + 6, 10));
    for (int i = 0; i < 6; ++i) {
        u.bytes[i] = static_cast<uint8_t>(ms >> (40 - 8 * i));
    }
    stamp_version(u.bytes, 7);
    return Result<Uuid>::ok(u);
}

uint64_t v7_unix_ms(const Uuid& v7) {
    uint64_t ms = 0;
    for (int i = 0; i < 6; ++i) {
        ms = (ms << 8) | v7.bytes[i];
    }
    return ms;
}

// ---- Version 8 ----

Result<Uuid> create_v8(const uint8_t* data, size_t len) {
    if (data == nullptr) {
        return IdError{IdError::InvalidArg, "bytes are required"};
    }
    if (len < 16) {
        log::debug("rejected %zu-byte v8 input", len);
        return IdError{IdError::InvalidArg,
            "version 8 needs at least 16 bytes, got " + std::to_string(len)};
    }

    Uuid u{};
    std::memcpy(u.bytes.data(), data, 16);
    stamp_version(u.bytes, 8);
    return Result<Uuid>::ok(u);
}

Result<Uuid> create_v8(const std::vector<uint8_t>& data) {
    return create_v8(data.data(), data.size());
}

Result<Uuid> create_v8_from_name(HashAlgorithm alg, const Uuid& namespace_id,
                                 const uint8_t* name, size_t len) {
    if (alg != HashAlgorithm::Sha256 && alg != HashAlgorithm::Sha384 &&
        alg != HashAlgorithm::Sha512) {
        log::debug("rejected %s for name-based v8", hash_algorithm_name(alg));
        return IdError{IdError::InvalidArg,
            std::string(hash_algorithm_name(alg)) +
                " is not supported for name-based version 8",
            "use SHA256, SHA384 or SHA512"};
    }
    if (name == nullptr) {
        return IdError{IdError::InvalidArg, "name is required"};
    }
    return hash_name(alg, namespace_id, name, len, 8);
}

Result<Uuid> create_v8_from_name(HashAlgorithm alg, const Uuid& namespace_id,
                                 std::string_view name) {
    return create_v8_from_name(alg, namespace_id, name_bytes(name), name.size());
}

Result<Uuid> create_v8_from_name(std::string_view alg_name,
                                 const Uuid& namespace_id, std::string_view name) {
    auto alg = parse_hash_algorithm(alg_name);
    IDFORGE_TRY(alg);
    return create_v8_from_name(alg.value(), namespace_id, name);
}

} // namespace idforge
