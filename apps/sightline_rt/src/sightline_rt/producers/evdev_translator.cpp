#include "sightline_rt/producers/evdev_translator.hpp"
#include "sightline/core/keycodes.hpp"
#include <algorithm>
#include <linux/input-event-codes.h>

namespace sightline_rt::producers {

using namespace sightline::core;

void EvdevTranslator::Translate(uint16_t type, uint16_t code, int32_t value,
                                uint64_t time_ns,
                                std::vector<CapturedEvent> &out) {
    switch (type) {
    case EV_SYN:
        if (code == SYN_REPORT)
            flushMotion_(out);
        return;

    case EV_REL:
        if (code == REL_X) {
            pending_.dx += value;
        } else if (code == REL_Y) {
            pending_.dy += value;
        } else {
            return;
        }
        pending_time_ns_ = time_ns;
        has_pending_ = true;
        return;

    case EV_KEY:
        // 2 is autorepeat
        if (value == 2)
            return;
        flushMotion_(out);
        if (is_mouse_button(code)) {
            out.push_back(CapturedEvent{
                PointerButton{static_cast<uint8_t>(code - evdev::BtnMouse),
                              value != 0},
                time_ns});
        } else {
            out.push_back(
                CapturedEvent{KeyEvent{code, value != 0}, time_ns});
        }
        return;

    default:
        flushMotion_(out);
        return;
    }
}

void EvdevTranslator::flushMotion_(std::vector<CapturedEvent> &out) {
    if (!has_pending_)
        return;
    if (pending_.dx != 0.0 || pending_.dy != 0.0)
        out.push_back(CapturedEvent{pending_, pending_time_ns_});
    pending_ = {};
    has_pending_ = false;
}

void OrderByTime(std::vector<CapturedEvent> &events) {
    std::stable_sort(events.begin(), events.end(),
                     [](const CapturedEvent &a, const CapturedEvent &b) {
                         return a.timestamp_ns < b.timestamp_ns;
                     });
}

} // namespace sightline_rt::producers
