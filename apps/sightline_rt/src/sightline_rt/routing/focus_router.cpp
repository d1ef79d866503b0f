#include "sightline_rt/routing/focus_router.hpp"
#include <spdlog/spdlog.h>

namespace sightline_rt::routing {

using namespace sightline::core;
using sightline::compositor::TargetHandle;

FocusRouter::FocusRouter(sightline::compositor::ICompositor &compositor)
    : compositor_(&compositor) {}

void FocusRouter::Start(SessionState &session) {
    session.focus_target.reset();
    spdlog::info("Routing input to the gaze target");
}

void FocusRouter::Apply(const Event &event, SessionState &session) {
    // Session state follows the stream even when nothing can be delivered
    const bool deliver = refreshFocus_(session);
    if (!deliver)
        spdlog::debug("Dropped {}: gaze target unknown", to_string(event));
    std::visit(EventVisitor{*this, session, deliver}, event);
}

bool FocusRouter::refreshFocus_(SessionState &session) {
    auto target = compositor_->queryGazeTarget();
    if (!target)
        return false;

    if (*target != session.focus_target) {
        if (*target)
            spdlog::info("Focus moved to object {:#x}", (*target)->id);
        else
            spdlog::info("Focus lost");
        session.focus_target = *target;
    }
    return true;
}

template <typename Code, typename Map>
std::optional<TargetHandle>
FocusRouter::releaseTarget_(Code code, Map &delivered,
                            const SessionState &session) {
    // Only codes whose press reached some target are released
    auto it = delivered.find(code);
    if (it == delivered.end())
        return std::nullopt;

    TargetHandle target = session.focus_target.value_or(it->second);
    delivered.erase(it);
    return target;
}

void FocusRouter::EventVisitor::operator()(const KeyEvent &event) {
    if (auto change = session.applyKey(event))
        spdlog::debug("Modifiers changed to {:#x}", change->mask);
    if (!deliver)
        return;

    if (event.pressed) {
        if (!session.focus_target) {
            spdlog::debug("Dropped key {} press: no focus", event.keycode);
            return;
        }
        auto target = *session.focus_target;
        if (auto ec = router.compositor_->sendKeyEvent(target, event.keycode, true)) {
            spdlog::debug("Dropped key {} press: {}", event.keycode, ec.message());
            return;
        }
        session.delivered_keys.insert_or_assign(event.keycode, target);
        return;
    }

    auto target =
        router.releaseTarget_(event.keycode, session.delivered_keys, session);
    if (!target) {
        spdlog::debug("Dropped key {} release: never delivered", event.keycode);
        return;
    }
    if (auto ec = router.compositor_->sendKeyEvent(*target, event.keycode, false))
        spdlog::debug("Dropped key {} release: {}", event.keycode, ec.message());
}

void FocusRouter::EventVisitor::operator()(const PointerMotion &event) {
    session.accumulate(event);
    if (!deliver)
        return;
    if (!session.focus_target) {
        spdlog::debug("Dropped pointer motion: no focus");
        return;
    }
    if (auto ec = router.compositor_->sendPointerEvent(*session.focus_target,
                                                       event.dx, event.dy))
        spdlog::debug("Dropped pointer motion: {}", ec.message());
}

void FocusRouter::EventVisitor::operator()(const PointerAbsolute &event) {
    auto motion = session.toMotion(event);
    if (motion.dx == 0.0 && motion.dy == 0.0)
        return;
    (*this)(motion);
}

void FocusRouter::EventVisitor::operator()(const PointerButton &event) {
    if (!deliver)
        return;

    if (event.pressed) {
        if (!session.focus_target) {
            spdlog::debug("Dropped button {} press: no focus", event.button);
            return;
        }
        auto target = *session.focus_target;
        if (auto ec = router.compositor_->sendButtonEvent(target, event.button, true)) {
            spdlog::debug("Dropped button {} press: {}", event.button, ec.message());
            return;
        }
        session.delivered_buttons.insert_or_assign(event.button, target);
        return;
    }

    auto target =
        router.releaseTarget_(event.button, session.delivered_buttons, session);
    if (!target) {
        spdlog::debug("Dropped button {} release: never delivered",
                      event.button);
        return;
    }
    if (auto ec = router.compositor_->sendButtonEvent(*target, event.button, false))
        spdlog::debug("Dropped button {} release: {}", event.button, ec.message());
}

} // namespace sightline_rt::routing
