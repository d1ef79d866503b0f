#include "sightline_rt/stream/event_stream.hpp"
#include "sightline/core/error.hpp"
#include "sightline/core/utils.hpp"
#include <spdlog/spdlog.h>

namespace sightline_rt::stream {

using sightline::core::CapturedEvent;
using sightline::core::Errc;

void EventStream::Attach(transport::PipeReader reader) {
    reader_.emplace(std::move(reader));
    state_ = State::STREAMING;
}

std::expected<std::optional<CapturedEvent>, std::error_code> EventStream::Next() {
    switch (state_) {
    case State::IDLE:
        return std::unexpected(std::make_error_code(std::errc::not_connected));
    case State::STOPPED:
        return std::nullopt;
    case State::STREAMING:
    case State::DRAINING:
        break;
    }

    while (true) {
        auto decoded = decoder_.next();
        if (!decoded) {
            state_ = State::STOPPED;
            return std::unexpected(decoded.error());
        }
        if (decoded->has_value()) {
            return CapturedEvent{std::move(**decoded),
                                 sightline::core::monotonic_ns()};
        }

        recv_buffer_.clear();
        auto ec = reader_->Read(recv_buffer_);
        if (ec == Errc::end_of_stream) {
            if (auto drain_ec = drain_())
                return std::unexpected(drain_ec);
            return std::nullopt;
        }
        if (ec) {
            state_ = State::STOPPED;
            return std::unexpected(ec);
        }
        decoder_.feed(recv_buffer_);
    }
}

std::error_code EventStream::drain_() {
    state_ = State::DRAINING;
    auto ec = decoder_.finish();
    if (ec) {
        spdlog::error("Input stream closed with {} undecoded byte(s): {}",
                      decoder_.buffered(), ec.message());
    } else {
        spdlog::debug("Input stream closed after last frame");
    }
    state_ = State::STOPPED;
    return ec;
}

} // namespace sightline_rt::stream
