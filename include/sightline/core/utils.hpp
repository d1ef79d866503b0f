#pragma once

#include <chrono>
#include <cstdint>
#include <numbers>

namespace sightline::core {

inline uint64_t monotonic_ns() {
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::nanoseconds>(
            std::chrono::steady_clock::now().time_since_epoch())
            .count());
}

constexpr double deg2rad(double degrees) {
    return degrees * std::numbers::pi / 180.0;
}

} // namespace sightline::core
