#pragma once

#include <array>
#include <cstdint>
#include <expected>
#include <optional>
#include <system_error>

namespace sightline::compositor {

// Lookup id for a compositor-owned object. The compositor owns the lifetime;
// a handle may refer to an object that no longer exists.
struct TargetHandle {
    uint64_t id{};

    bool operator==(const TargetHandle &) const = default;
};

struct Pose {
    std::array<float, 3> position{0.0f, 0.0f, 0.0f};
    std::array<float, 4> orientation{0.0f, 0.0f, 0.0f, 1.0f}; // x, y, z, w
};

// Request/response calls exposed by the spatial compositor. All calls block
// until the compositor answers; retry policy, if any, belongs to the
// implementation.
struct ICompositor {
    virtual std::expected<std::optional<TargetHandle>, std::error_code>
    queryGazeTarget() = 0;

    virtual std::error_code sendKeyEvent(TargetHandle target, uint32_t keycode,
                                         bool pressed) = 0;

    virtual std::error_code sendPointerEvent(TargetHandle target, double dx,
                                             double dy) = 0;

    virtual std::error_code sendButtonEvent(TargetHandle target, uint8_t button,
                                            bool pressed) = 0;

    virtual std::expected<TargetHandle, std::error_code>
    registerPointerObject() = 0;

    virtual std::error_code updatePointerPose(TargetHandle pointer,
                                              const Pose &pose) = 0;

    virtual ~ICompositor() = default;
};

} // namespace sightline::compositor
