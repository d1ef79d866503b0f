#include "sightline_rt/producers/capture_loop.hpp"
#include "sightline/core/codec.hpp"
#include "sightline/core/error.hpp"
#include <format>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace sightline_rt::producers {

using sightline::core::Errc;

CaptureLoop::CaptureLoop(Producer &producer, transport::PipeWriter writer)
    : producer_(&producer), writer_(std::move(writer)) {}

void CaptureLoop::Init() {
    auto ec = std::visit([](auto &producer) { return producer.Open(); },
                         *producer_);
    if (ec)
        throw std::runtime_error(
            std::format("Failed to open input source: {}", ec.message()));
}

void CaptureLoop::Run() {
    batch_.clear();
    auto ec = std::visit(
        [this](auto &producer) { return producer.Capture(batch_); }, *producer_);

    // Whatever was captured goes out first, including releases emitted on
    // the way down
    if (!flush_())
        return;

    if (!ec)
        return;

    if (ec == Errc::host_source_lost) {
        spdlog::info("Input source closed");
    } else {
        spdlog::error("Capture failed: {}", ec.message());
    }
    result_ = ec;
    RequestStop();
}

bool CaptureLoop::flush_() {
    for (const auto &captured : batch_) {
        send_buffer_.clear();
        sightline::core::wire::encode(captured.event, send_buffer_);

        if (auto ec = writer_.Write(send_buffer_)) {
            if (ec == Errc::broken_pipe)
                spdlog::info("Consumer closed the stream");
            else
                spdlog::error("Failed to write event: {}", ec.message());
            result_ = ec;
            RequestStop();
            return false;
        }

        spdlog::trace("{} (t={}ns)", sightline::core::to_string(captured.event),
                      captured.timestamp_ns);
        ++written_;
    }
    return true;
}

void CaptureLoop::Shutdown() {
    std::visit([](auto &producer) { producer.Close(); }, *producer_);
    writer_.Close();
    spdlog::info("Capture stopped after {} event(s)", written_);
}

} // namespace sightline_rt::producers
