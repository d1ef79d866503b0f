#include "sightline_rt/compositor/nng_compositor.hpp"
#include "sightline/core/error.hpp"
#include <glaze/glaze.hpp>
#include <spdlog/spdlog.h>

namespace sightline_rt::compositor {

using sightline::compositor::Pose;
using sightline::compositor::TargetHandle;
using sightline::core::Errc;

namespace msg = net::message;

std::error_code NngCompositor::Connect(const std::string &address,
                                       int timeout_ms) {
    if (auto ec = req_.Init(timeout_ms))
        return ec;
    if (auto ec = req_.Connect(address))
        return ec;
    spdlog::info("Compositor client dialing {}", address);
    return {};
}

void NngCompositor::Shutdown() { req_.Shutdown(); }

NngCompositor::~NngCompositor() { Shutdown(); }

std::expected<std::string, std::error_code>
NngCompositor::call_(const msg::Request &request) {
    if (auto err = glz::write_json(request, send_buffer_)) {
        spdlog::warn("Failed to serialize compositor request");
        return std::unexpected(make_error_code(Errc::compositor_unavailable));
    }

    if (auto ec = req_.Request(send_buffer_, recv_buffer_)) {
        spdlog::warn("Compositor request failed: {}", ec.message());
        return std::unexpected(make_error_code(Errc::compositor_unavailable));
    }

    auto response = glz::read_json<msg::Response>(recv_buffer_);
    if (!response) {
        spdlog::warn("Failed to parse compositor response: {}",
                     glz::format_error(response.error(), recv_buffer_));
        return std::unexpected(make_error_code(Errc::compositor_unavailable));
    }

    if (!response->success) {
        spdlog::warn("Compositor refused request ({}): {}",
                     response->error_code, response->error_message);
        return std::unexpected(make_error_code(Errc::compositor_unavailable));
    }

    return std::move(response->payload);
}

std::expected<std::optional<uint64_t>, std::error_code>
NngCompositor::callForTarget_(const msg::Request &request) {
    auto payload = call_(request);
    if (!payload)
        return std::unexpected(payload.error());

    auto reply = glz::read_json<msg::TargetReply>(*payload);
    if (!reply) {
        spdlog::warn("Failed to parse compositor target: {}",
                     glz::format_error(reply.error(), *payload));
        return std::unexpected(make_error_code(Errc::compositor_unavailable));
    }
    return reply->target;
}

std::expected<std::optional<TargetHandle>, std::error_code>
NngCompositor::queryGazeTarget() {
    auto target = callForTarget_(msg::QueryGazeTarget{});
    if (!target)
        return std::unexpected(target.error());
    if (!*target)
        return std::nullopt;
    return TargetHandle{**target};
}

std::error_code NngCompositor::sendKeyEvent(TargetHandle target,
                                            uint32_t keycode, bool pressed) {
    auto result = call_(msg::SendKeyEvent{target.id, keycode, pressed});
    return result ? std::error_code{} : result.error();
}

std::error_code NngCompositor::sendPointerEvent(TargetHandle target, double dx,
                                                double dy) {
    auto result = call_(msg::SendPointerEvent{target.id, dx, dy});
    return result ? std::error_code{} : result.error();
}

std::error_code NngCompositor::sendButtonEvent(TargetHandle target,
                                               uint8_t button, bool pressed) {
    auto result = call_(msg::SendButtonEvent{target.id, button, pressed});
    return result ? std::error_code{} : result.error();
}

std::expected<TargetHandle, std::error_code>
NngCompositor::registerPointerObject() {
    auto target = callForTarget_(msg::RegisterPointerObject{});
    if (!target)
        return std::unexpected(target.error());
    if (!*target) {
        spdlog::warn("Compositor registered a pointer without a handle");
        return std::unexpected(make_error_code(Errc::compositor_unavailable));
    }
    return TargetHandle{**target};
}

std::error_code NngCompositor::updatePointerPose(TargetHandle pointer,
                                                 const Pose &pose) {
    auto result = call_(
        msg::UpdatePointerPose{pointer.id, pose.position, pose.orientation});
    return result ? std::error_code{} : result.error();
}

} // namespace sightline_rt::compositor
