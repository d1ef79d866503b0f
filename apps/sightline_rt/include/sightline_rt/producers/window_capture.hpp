#pragma once

#include "sightline/core/event.hpp"
#include "sightline_rt/config/config.hpp"
#include <cstdarg>
#include <cstdint>
#include <raylib.h>
#include <system_error>
#include <utility>
#include <vector>

namespace sightline_rt::producers {

// Captures input delivered to a raylib window. Clicking the window grabs the
// cursor (relative motion), Super+Q lets go. While not grabbed the cursor
// position over the window is reported instead.
class WindowCapture {
  public:
    explicit WindowCapture(config::WindowConfig config);

    std::error_code Open();

    // Draws one frame, polls the window and appends the actions of that poll
    // in the order motion, releases, presses. Returns host_source_lost when
    // the window is closed.
    std::error_code Capture(std::vector<sightline::core::CapturedEvent> &out);

    void Close();

  private:
    void setGrab_(bool grabbed);

    // Reports every key and button still held as released
    void releaseHeld_(std::vector<sightline::core::CapturedEvent> &out);

    void emit_(std::vector<sightline::core::CapturedEvent> &out,
               sightline::core::Event event);

    void draw_() const;

    static bool superHeld_();

    static void traceLogCallback_(int level, const char *fmt, va_list args);

    config::WindowConfig config_;
    bool open_ = false;
    bool grabbed_ = false;
    bool focused_ = false;
    // First delta after a grab change is the cursor warp, not motion
    bool skip_delta_ = false;
    uint64_t surface_id_ = 0;

    std::vector<std::pair<int, uint32_t>> held_keys_; // raylib key, evdev code
    std::vector<int> held_buttons_;
    bool has_position_ = false;
    Vector2 last_position_{};
    Vector2 last_delta_{};
};

} // namespace sightline_rt::producers
