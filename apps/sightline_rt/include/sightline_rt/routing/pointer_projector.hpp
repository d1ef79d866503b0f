#pragma once

#include "sightline/compositor/compositor.hpp"
#include "sightline/core/event.hpp"
#include "sightline/core/session.hpp"
#include <optional>

namespace sightline_rt::routing {

// Drives one compositor-owned 3D pointer from the accumulated pointer
// motion. Keys and buttons are delivered to the pointer object itself.
class PointerProjector {
  public:
    PointerProjector(sightline::compositor::ICompositor &compositor,
                     double sensitivity);

    // Registers the pointer object. A failure here is retried before the
    // next event.
    void Start(sightline::core::SessionState &session);

    void Apply(const sightline::core::Event &event,
               sightline::core::SessionState &session);

    std::optional<sightline::compositor::TargetHandle> Pointer() const {
        return pointer_;
    }

    // Pointer direction in degrees
    struct Orientation {
        double yaw = 0.0;
        double pitch = 0.0;

        bool operator==(const Orientation &) const = default;
    };

    Orientation Direction() const { return orientation_; }

    // Adds dx * sensitivity to yaw and dy * sensitivity to pitch. Pitch is
    // clamped to +-90 after every step, so motion back from the limit takes
    // effect immediately.
    static Orientation Turn(Orientation orientation,
                            const sightline::core::PointerMotion &motion,
                            double sensitivity);

    // Yaw about +Y followed by pitch about +X, with positive angles turning
    // the pointer right and down.
    static sightline::compositor::Pose Project(const Orientation &orientation);

  private:
    bool ensureRegistered_();

    void publishPose_();

    struct EventVisitor {
        PointerProjector &projector;
        sightline::core::SessionState &session;

        void operator()(const sightline::core::KeyEvent &event);
        void operator()(const sightline::core::PointerMotion &event);
        void operator()(const sightline::core::PointerAbsolute &event);
        void operator()(const sightline::core::PointerButton &event);
    };

    sightline::compositor::ICompositor *compositor_;
    double sensitivity_;
    std::optional<sightline::compositor::TargetHandle> pointer_;
    Orientation orientation_;
};

} // namespace sightline_rt::routing
