#pragma once

#include <chrono>
#include <cstdint>
#include <ratio>

namespace idforge {

// 100-nanosecond ticks: the resolution of RFC 4122 timestamps. A 64-bit
// count reaches back past the Gregorian epoch, which nanosecond
// system_clock time points cannot.
using Ticks = std::chrono::duration<int64_t, std::ratio<1, 10000000>>;
using Timestamp = std::chrono::time_point<std::chrono::system_clock, Ticks>;

// Ticks between 1582-10-15T00:00:00Z and 1970-01-01T00:00:00Z.
constexpr int64_t gregorian_to_unix_ticks = 122192928000000000LL;

class Clock {
public:
    virtual ~Clock() = default;
    virtual Timestamp now() const = 0;
};

// Wall-clock UTC time from std::chrono::system_clock.
class SystemClock : public Clock {
public:
    Timestamp now() const override;
};

// Always reports the same instant.
class FixedClock : public Clock {
public:
    explicit FixedClock(Timestamp at) : at_(at) {}
    Timestamp now() const override { return at_; }

private:
    Timestamp at_;
};

// Process-wide SystemClock instance.
const Clock& system_clock();

// Builds a Timestamp from Unix milliseconds.
Timestamp from_unix_ms(int64_t ms);

} // namespace idforge
