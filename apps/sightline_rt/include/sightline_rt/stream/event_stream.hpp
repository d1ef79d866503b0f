#pragma once

#include "sightline/core/codec.hpp"
#include "sightline/core/event.hpp"
#include "sightline_rt/transport/pipe.hpp"
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <system_error>

namespace sightline_rt::stream {

enum class State : uint8_t {
    IDLE,      // No transport attached
    STREAMING, // Decoding frames as bytes arrive
    DRAINING,  // Transport closed, checking for a partial frame
    STOPPED,   // Terminal
};

// Decoded view of an incoming frame stream. Every path to STOPPED goes
// through DRAINING when the transport closes, so a clean end after the last
// full frame is distinguished from a close in the middle of one.
class EventStream {
  public:
    EventStream() = default;

    void Attach(transport::PipeReader reader);

    // Blocks until the next event is decoded. An empty optional means the
    // stream ended cleanly; an error means it ended badly.
    std::expected<std::optional<sightline::core::CapturedEvent>, std::error_code>
    Next();

    State GetState() const { return state_; }

  private:
    std::error_code drain_();

    std::optional<transport::PipeReader> reader_;
    sightline::core::wire::Decoder decoder_;
    std::string recv_buffer_;
    State state_ = State::IDLE;
};

} // namespace sightline_rt::stream
