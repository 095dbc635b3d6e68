#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace bastion {

using MonoClock = std::chrono::steady_clock;
using MonoTime  = MonoClock::time_point;

// Audit rows carry wall-clock instants. Latency math uses MonoClock only.
using WallClock = std::chrono::system_clock;
using WallTime  = WallClock::time_point;

inline MonoTime monoNow() noexcept {
    return MonoClock::now();
}

inline WallTime wallNow() noexcept {
    return WallClock::now();
}

inline double elapsedMs(MonoTime start) noexcept {
    return std::chrono::duration<double, std::milli>(MonoClock::now() - start).count();
}

inline uint64_t to_ms(WallTime t) noexcept {
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            t.time_since_epoch()
        ).count()
    );
}

inline WallTime from_ms(uint64_t ms) noexcept {
    return WallTime(std::chrono::milliseconds(ms));
}

// 2026-10-17T04:10:22.123Z
std::string toIso8601(WallTime t);

} // namespace bastion
