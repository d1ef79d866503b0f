#include "sightline_rt/routing/pointer_projector.hpp"
#include "sightline/core/utils.hpp"
#include <algorithm>
#include <raylib.h>
#include <raymath.h>
#include <spdlog/spdlog.h>

namespace sightline_rt::routing {

using namespace sightline::core;
using sightline::compositor::Pose;

PointerProjector::PointerProjector(
    sightline::compositor::ICompositor &compositor, double sensitivity)
    : compositor_(&compositor), sensitivity_(sensitivity) {}

void PointerProjector::Start(SessionState &) {
    orientation_ = {};
    if (ensureRegistered_())
        publishPose_();
}

void PointerProjector::Apply(const Event &event, SessionState &session) {
    std::visit(EventVisitor{*this, session}, event);
}

PointerProjector::Orientation
PointerProjector::Turn(Orientation orientation, const PointerMotion &motion,
                       double sensitivity) {
    orientation.yaw += motion.dx * sensitivity;
    orientation.pitch =
        std::clamp(orientation.pitch + motion.dy * sensitivity, -90.0, 90.0);
    return orientation;
}

Pose PointerProjector::Project(const Orientation &orientation) {
    Quaternion rot_y = QuaternionFromAxisAngle(
        Vector3{0.0f, 1.0f, 0.0f}, static_cast<float>(deg2rad(-orientation.yaw)));
    Quaternion rot_x = QuaternionFromAxisAngle(
        Vector3{1.0f, 0.0f, 0.0f},
        static_cast<float>(deg2rad(-orientation.pitch)));
    Quaternion q = QuaternionMultiply(rot_y, rot_x);

    Pose pose{};
    pose.orientation = {q.x, q.y, q.z, q.w};
    return pose;
}

bool PointerProjector::ensureRegistered_() {
    if (pointer_)
        return true;

    auto handle = compositor_->registerPointerObject();
    if (!handle) {
        spdlog::warn("Pointer registration failed: {}", handle.error().message());
        return false;
    }
    pointer_ = *handle;
    spdlog::info("Registered pointer object {:#x}", pointer_->id);
    return true;
}

void PointerProjector::publishPose_() {
    auto pose = Project(orientation_);
    if (auto ec = compositor_->updatePointerPose(*pointer_, pose))
        spdlog::debug("Pose update dropped: {}", ec.message());
}

void PointerProjector::EventVisitor::operator()(const KeyEvent &event) {
    if (auto change = session.applyKey(event))
        spdlog::debug("Modifiers changed to {:#x}", change->mask);

    if (!projector.ensureRegistered_())
        return;
    if (auto ec = projector.compositor_->sendKeyEvent(*projector.pointer_,
                                                      event.keycode,
                                                      event.pressed))
        spdlog::debug("Dropped key {}: {}", event.keycode, ec.message());
}

void PointerProjector::EventVisitor::operator()(const PointerMotion &event) {
    session.accumulate(event);
    projector.orientation_ =
        Turn(projector.orientation_, event, projector.sensitivity_);

    if (!projector.ensureRegistered_())
        return;
    projector.publishPose_();
}

void PointerProjector::EventVisitor::operator()(const PointerAbsolute &event) {
    auto motion = session.toMotion(event);
    if (motion.dx == 0.0 && motion.dy == 0.0)
        return;
    (*this)(motion);
}

void PointerProjector::EventVisitor::operator()(const PointerButton &event) {
    if (!projector.ensureRegistered_())
        return;
    if (auto ec = projector.compositor_->sendButtonEvent(*projector.pointer_,
                                                         event.button,
                                                         event.pressed))
        spdlog::debug("Dropped button {}: {}", event.button, ec.message());
}

} // namespace sightline_rt::routing
