#pragma once

#include <idforge/clock.hpp>
#include <idforge/config.hpp>
#include <idforge/generate.hpp>
#include <idforge/random.hpp>
#include <idforge/uuid.hpp>
#include <cstdint>
#include <string_view>
#include <vector>

namespace idforge {

// Binds the generators to one clock, one random source and the defaults
// from a FactoryConfig. The clock and random source must outlive the
// factory.
class IdFactory {
public:
    explicit IdFactory(FactoryConfig cfg = {},
                       const Clock& clock = system_clock(),
                       RandomSource& random = system_random());

    const FactoryConfig& config() const { return cfg_; }

    // Uses the configured name-based version.
    Result<Uuid> from_name(const Uuid& namespace_id, std::string_view name) const;
    Result<Uuid> from_name(const Uuid& namespace_id, std::string_view name,
                           int version) const;

    Result<Uuid> v4() const;
    Result<Uuid> v6() const;
    Result<Uuid> v6(Timestamp ts) const;
    Result<Uuid> v7() const;
    Result<Uuid> v7(Timestamp ts) const;
    Result<Uuid> v8(const std::vector<uint8_t>& data) const;

    // Uses the configured v8 hash.
    Result<Uuid> v8_from_name(const Uuid& namespace_id, std::string_view name) const;

private:
    FactoryConfig cfg_;
    const Clock& clock_;
    RandomSource& random_;
};

} // namespace idforge
