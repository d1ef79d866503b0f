#pragma once

#include "sightline/core/event.hpp"
#include <cstdint>
#include <vector>

namespace sightline_rt::producers {

// Turns raw evdev events from one device into Event IR. Relative motion is
// held back until the device ends its report (or sends something that is not
// relative motion) so a diagonal move becomes a single PointerMotion.
// Events are stamped with the kernel time of the input_event they came from.
class EvdevTranslator {
  public:
    void Translate(uint16_t type, uint16_t code, int32_t value, uint64_t time_ns,
                   std::vector<sightline::core::CapturedEvent> &out);

    bool HasPendingMotion() const { return has_pending_; }

  private:
    void flushMotion_(std::vector<sightline::core::CapturedEvent> &out);

    sightline::core::PointerMotion pending_{};
    uint64_t pending_time_ns_ = 0;
    bool has_pending_ = false;
};

// Puts events read from several devices back into the order the kernel saw
// them. Events with equal times keep their relative order.
void OrderByTime(std::vector<sightline::core::CapturedEvent> &events);

} // namespace sightline_rt::producers
