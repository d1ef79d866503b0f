#pragma once

#include "sightline/core/session.hpp"
#include "sightline_rt/routing/focus_router.hpp"
#include "sightline_rt/routing/pointer_projector.hpp"
#include "sightline_rt/stream/event_stream.hpp"
#include "sightline_rt/threading/loop.hpp"
#include "sightline_rt/transport/pipe.hpp"
#include <cstdint>
#include <system_error>
#include <variant>

namespace sightline_rt::routing {

using Router = std::variant<FocusRouter, PointerProjector>;

// Reads, decodes and applies events until the stream ends or a stop is
// requested. Result() tells how the stream ended.
class RouteLoop : public threading::Loop<RouteLoop> {
  public:
    RouteLoop(Router router, transport::PipeReader reader);

    void Init();
    void Run();
    void Shutdown();

    std::error_code Result() const { return result_; }

    const sightline::core::SessionState &Session() const { return session_; }

    stream::State StreamState() const { return stream_.GetState(); }

    ~RouteLoop() = default;

  private:
    Router router_;
    transport::PipeReader reader_;
    stream::EventStream stream_;
    sightline::core::SessionState session_;
    std::error_code result_;
    uint64_t applied_ = 0;
};

} // namespace sightline_rt::routing
