#pragma once

#include "sightline/compositor/compositor.hpp"
#include "sightline/core/error.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Records every effect call. Gaze queries are counted separately so tests
// can check that exactly one effect call was made per event.
struct FakeCompositor : sightline::compositor::ICompositor {
    struct Call {
        std::string kind; // "key", "pointer", "button", "pose"
        uint64_t target{};
        uint32_t code{};
        bool pressed{};
        double dx{};
        double dy{};
        sightline::compositor::Pose pose{};
    };

    std::optional<sightline::compositor::TargetHandle> gaze;
    bool unavailable = false;
    bool refuse_effects = false; // gaze queries still answer
    int failed_registrations = 0; // registrations to refuse before accepting
    uint64_t next_pointer_id = 0x100;

    int gaze_queries = 0;
    int registrations = 0;
    std::vector<Call> calls;

    std::expected<std::optional<sightline::compositor::TargetHandle>,
                  std::error_code>
    queryGazeTarget() override {
        ++gaze_queries;
        if (unavailable)
            return std::unexpected(make_error_code(
                sightline::core::Errc::compositor_unavailable));
        return gaze;
    }

    std::error_code sendKeyEvent(sightline::compositor::TargetHandle target,
                                 uint32_t keycode, bool pressed) override {
        if (unavailable || refuse_effects)
            return sightline::core::Errc::compositor_unavailable;
        calls.push_back(Call{"key", target.id, keycode, pressed});
        return {};
    }

    std::error_code sendPointerEvent(sightline::compositor::TargetHandle target,
                                     double dx, double dy) override {
        if (unavailable || refuse_effects)
            return sightline::core::Errc::compositor_unavailable;
        Call call{"pointer", target.id};
        call.dx = dx;
        call.dy = dy;
        calls.push_back(call);
        return {};
    }

    std::error_code sendButtonEvent(sightline::compositor::TargetHandle target,
                                    uint8_t button, bool pressed) override {
        if (unavailable || refuse_effects)
            return sightline::core::Errc::compositor_unavailable;
        calls.push_back(Call{"button", target.id, button, pressed});
        return {};
    }

    std::expected<sightline::compositor::TargetHandle, std::error_code>
    registerPointerObject() override {
        ++registrations;
        if (unavailable || failed_registrations > 0) {
            if (failed_registrations > 0)
                --failed_registrations;
            return std::unexpected(make_error_code(
                sightline::core::Errc::compositor_unavailable));
        }
        return sightline::compositor::TargetHandle{next_pointer_id++};
    }

    std::error_code updatePointerPose(sightline::compositor::TargetHandle pointer,
                                      const sightline::compositor::Pose &pose) override {
        if (unavailable || refuse_effects)
            return sightline::core::Errc::compositor_unavailable;
        Call call{"pose", pointer.id};
        call.pose = pose;
        calls.push_back(call);
        return {};
    }
};
