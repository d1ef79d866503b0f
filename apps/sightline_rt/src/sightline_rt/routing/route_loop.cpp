#include "sightline_rt/routing/route_loop.hpp"
#include "sightline/core/error.hpp"
#include <spdlog/spdlog.h>

namespace sightline_rt::routing {

RouteLoop::RouteLoop(Router router, transport::PipeReader reader)
    : router_(std::move(router)), reader_(std::move(reader)) {}

void RouteLoop::Init() {
    stream_.Attach(std::move(reader_));
    std::visit([this](auto &router) { router.Start(session_); }, router_);
}

void RouteLoop::Run() {
    auto next = stream_.Next();
    if (!next) {
        if (next.error() == std::errc::interrupted)
            spdlog::info("Interrupted, stopping");
        else
            result_ = next.error();
        RequestStop();
        return;
    }
    if (!next->has_value()) {
        RequestStop();
        return;
    }

    const auto &captured = **next;
    spdlog::trace("{} (t={}ns)", sightline::core::to_string(captured.event),
                  captured.timestamp_ns);
    std::visit([&](auto &router) { router.Apply(captured.event, session_); },
               router_);
    ++applied_;
}

void RouteLoop::Shutdown() {
    if (result_ && !sightline::core::is_clean_termination(result_)) {
        spdlog::error("Event stream failed: {}", result_.message());
    } else {
        spdlog::info("Event stream ended after {} event(s)", applied_);
    }
    spdlog::debug("Cumulative pointer ({}, {})", session_.cumulative_pointer.x,
                  session_.cumulative_pointer.y);
}

} // namespace sightline_rt::routing
