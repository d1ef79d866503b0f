#pragma once

#include "sightline/compositor/compositor.hpp"
#include "sightline_rt/net/message_types.hpp"
#include "sightline_rt/net/request_socket.hpp"
#include <expected>
#include <string>
#include <system_error>

namespace sightline_rt::compositor {

// ICompositor over an nng REQ socket speaking JSON. Every failure, whether
// transport, encoding or a refusal from the compositor, is reported as
// compositor_unavailable after being logged.
class NngCompositor : public sightline::compositor::ICompositor {
  public:
    NngCompositor() = default;

    // Starts dialing address. The compositor does not have to be up yet.
    std::error_code Connect(const std::string &address, int timeout_ms);

    void Shutdown();

    std::expected<std::optional<sightline::compositor::TargetHandle>,
                  std::error_code>
    queryGazeTarget() override;

    std::error_code sendKeyEvent(sightline::compositor::TargetHandle target,
                                 uint32_t keycode, bool pressed) override;

    std::error_code sendPointerEvent(sightline::compositor::TargetHandle target,
                                     double dx, double dy) override;

    std::error_code sendButtonEvent(sightline::compositor::TargetHandle target,
                                    uint8_t button, bool pressed) override;

    std::expected<sightline::compositor::TargetHandle, std::error_code>
    registerPointerObject() override;

    std::error_code updatePointerPose(sightline::compositor::TargetHandle pointer,
                                      const sightline::compositor::Pose &pose) override;

    ~NngCompositor() override;

  private:
    // Sends one request and returns the payload of a successful response
    std::expected<std::string, std::error_code>
    call_(const net::message::Request &request);

    std::expected<std::optional<uint64_t>, std::error_code>
    callForTarget_(const net::message::Request &request);

    net::RequestSocket req_;
    std::string send_buffer_;
    std::string recv_buffer_;
};

} // namespace sightline_rt::compositor
