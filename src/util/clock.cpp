#include <idforge/clock.hpp>

namespace idforge {

Timestamp SystemClock::now() const {
    return std::chrono::time_point_cast<Ticks>(std::chrono::system_clock::now());
}

const Clock& system_clock() {
    static const SystemClock clock;
    return clock;
}

Timestamp from_unix_ms(int64_t ms) {
    return Timestamp(std::chrono::duration_cast<Ticks>(std::chrono::milliseconds(ms)));
}

} // namespace idforge
