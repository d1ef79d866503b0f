#pragma once

#include "sightline/compositor/compositor.hpp"
#include "sightline/core/event.hpp"
#include "sightline/core/session.hpp"
#include <optional>

namespace sightline_rt::routing {

// Forwards every event to the object the viewer is looking at. The gaze
// target is queried again for each event.
class FocusRouter {
  public:
    explicit FocusRouter(sightline::compositor::ICompositor &compositor);

    void Start(sightline::core::SessionState &session);

    void Apply(const sightline::core::Event &event,
               sightline::core::SessionState &session);

  private:
    // False when the compositor could not be asked
    bool refreshFocus_(sightline::core::SessionState &session);

    // Target for a release: the current focus, else whoever saw the press
    template <typename Code, typename Map>
    std::optional<sightline::compositor::TargetHandle>
    releaseTarget_(Code code, Map &delivered,
                   const sightline::core::SessionState &session);

    struct EventVisitor {
        FocusRouter &router;
        sightline::core::SessionState &session;
        bool deliver; // false when the gaze target could not be queried

        void operator()(const sightline::core::KeyEvent &event);
        void operator()(const sightline::core::PointerMotion &event);
        void operator()(const sightline::core::PointerAbsolute &event);
        void operator()(const sightline::core::PointerButton &event);
    };

    sightline::compositor::ICompositor *compositor_;
};

} // namespace sightline_rt::routing
