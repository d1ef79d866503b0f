#pragma once

#include "sightline/core/event.hpp"
#include "sightline_rt/producers/device_capture.hpp"
#include "sightline_rt/producers/window_capture.hpp"
#include "sightline_rt/threading/loop.hpp"
#include "sightline_rt/transport/pipe.hpp"
#include <cstdint>
#include <string>
#include <system_error>
#include <variant>
#include <vector>

namespace sightline_rt::producers {

using Producer = std::variant<WindowCapture, DeviceCapture>;

// Captures, encodes and writes events until the host source or the consumer
// goes away. Each event is written as soon as its batch is captured.
class CaptureLoop : public threading::Loop<CaptureLoop> {
  public:
    CaptureLoop(Producer &producer, transport::PipeWriter writer);

    void Init();
    void Run();
    void Shutdown();

    std::error_code Result() const { return result_; }

    ~CaptureLoop() = default;

  private:
    // Writes the batch; false once the consumer is gone
    bool flush_();

    Producer *producer_;
    transport::PipeWriter writer_;
    std::vector<sightline::core::CapturedEvent> batch_;
    std::string send_buffer_;
    std::error_code result_;
    uint64_t written_ = 0;
};

} // namespace sightline_rt::producers
