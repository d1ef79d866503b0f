#include "sightline_rt/producers/window_capture.hpp"
#include "sightline/core/error.hpp"
#include "sightline/core/utils.hpp"
#include "sightline_rt/producers/keymap.hpp"
#include "sightline_rt/utils/utils.hpp"
#include <algorithm>
#include <cstdint>
#include <format>
#include <spdlog/spdlog.h>

namespace sightline_rt::producers {

using namespace sightline::core;

WindowCapture::WindowCapture(config::WindowConfig config)
    : config_(std::move(config)) {}

void WindowCapture::traceLogCallback_(int level, const char *fmt,
                                      va_list args) {
    auto message = utils::vprintf_to_string(fmt, args);
    switch (level) {
    case TraceLogLevel::LOG_TRACE:
        spdlog::trace(message);
        break;
    case TraceLogLevel::LOG_DEBUG:
        spdlog::debug(message);
        break;
    case TraceLogLevel::LOG_INFO:
        spdlog::info(message);
        break;
    case TraceLogLevel::LOG_WARNING:
        spdlog::warn(message);
        break;
    case TraceLogLevel::LOG_ERROR:
    case TraceLogLevel::LOG_FATAL:
        spdlog::error(message);
        break;
    default:
        break;
    }
}

std::error_code WindowCapture::Open() {
    SetTraceLogCallback(&WindowCapture::traceLogCallback_);
    SetTraceLogLevel(spdlog::should_log(spdlog::level::debug) ? LOG_DEBUG
                                                              : LOG_WARNING);
    SetConfigFlags(FLAG_WINDOW_RESIZABLE);
    InitWindow(config_.width, config_.height, config_.title.c_str());
    if (!IsWindowReady())
        return std::make_error_code(std::errc::no_such_device);

    // Escape is input like any other key
    SetExitKey(KEY_NULL);
    SetTargetFPS(config_.target_fps);

    surface_id_ = reinterpret_cast<uintptr_t>(GetWindowHandle());
    // Platforms without a native handle still need a stable non-zero id
    if (surface_id_ == 0)
        surface_id_ = 1;

    open_ = true;
    focused_ = IsWindowFocused();
    setGrab_(false);
    return {};
}

void WindowCapture::Close() {
    if (!open_)
        return;
    CloseWindow();
    open_ = false;
}

void WindowCapture::setGrab_(bool grabbed) {
    if (grabbed)
        DisableCursor();
    else
        EnableCursor();

    grabbed_ = grabbed;
    skip_delta_ = true;
    has_position_ = false;
    last_delta_ = Vector2{0.0f, 0.0f};

    auto title = std::format("{} ({})", config_.title,
                             grabbed ? "super+q to release cursor"
                                     : "click to grab cursor");
    SetWindowTitle(title.c_str());
    spdlog::debug("Cursor {}", grabbed ? "grabbed" : "released");
}

bool WindowCapture::superHeld_() {
    return IsKeyDown(KEY_LEFT_SUPER) || IsKeyDown(KEY_RIGHT_SUPER);
}

void WindowCapture::emit_(std::vector<CapturedEvent> &out, Event event) {
    out.push_back(CapturedEvent{std::move(event), monotonic_ns()});
}

void WindowCapture::releaseHeld_(std::vector<CapturedEvent> &out) {
    for (const auto &[key, code] : held_keys_)
        emit_(out, KeyEvent{code, false});
    for (int button : held_buttons_)
        emit_(out, PointerButton{static_cast<uint8_t>(button), false});
    held_keys_.clear();
    held_buttons_.clear();
}

void WindowCapture::draw_() const {
    const Vector2 center{GetScreenWidth() / 2.0f, GetScreenHeight() / 2.0f};

    ClearBackground(BLACK);
    if (grabbed_ && (last_delta_.x != 0.0f || last_delta_.y != 0.0f)) {
        const Vector2 end{center.x + last_delta_.x * 4.0f,
                          center.y + last_delta_.y * 4.0f};
        DrawLineEx(center, end, 10.0f, WHITE);
    }
    DrawCircleV(center, 5.0f, grabbed_ ? GREEN : RED);
}

std::error_code WindowCapture::Capture(std::vector<CapturedEvent> &out) {
    if (WindowShouldClose()) {
        releaseHeld_(out);
        return Errc::host_source_lost;
    }

    // EndDrawing polls the window for the next batch of input
    BeginDrawing();
    draw_();
    EndDrawing();

    if (!IsWindowFocused()) {
        if (focused_) {
            spdlog::debug("Window lost focus");
            focused_ = false;
            if (grabbed_)
                setGrab_(false);
            if (config_.release_held_on_focus_loss)
                releaseHeld_(out);
        }
        return {};
    }
    if (!focused_) {
        spdlog::debug("Window gained focus");
        focused_ = true;
    }

    if (grabbed_) {
        last_delta_ = GetMouseDelta();
        if (skip_delta_) {
            skip_delta_ = false;
            last_delta_ = Vector2{0.0f, 0.0f};
        }
        if (last_delta_.x != 0.0f || last_delta_.y != 0.0f)
            emit_(out, PointerMotion{last_delta_.x, last_delta_.y});
    } else if (IsCursorOnScreen()) {
        const Vector2 position = GetMousePosition();
        if (!has_position_ || position.x != last_position_.x ||
            position.y != last_position_.y) {
            emit_(out, PointerAbsolute{position.x, position.y, surface_id_});
            last_position_ = position;
            has_position_ = true;
        }
    }

    std::erase_if(held_keys_, [&](const std::pair<int, uint32_t> &held) {
        if (IsKeyDown(held.first))
            return false;
        emit_(out, KeyEvent{held.second, false});
        return true;
    });
    std::erase_if(held_buttons_, [&](int button) {
        if (IsMouseButtonDown(button))
            return false;
        emit_(out, PointerButton{static_cast<uint8_t>(button), false});
        return true;
    });

    for (int key = GetKeyPressed(); key != KEY_NULL; key = GetKeyPressed()) {
        if (key == KEY_Q && grabbed_ && superHeld_()) {
            setGrab_(false);
            continue;
        }

        auto code = EvdevFromRaylibKey(key);
        if (!code) {
            spdlog::debug("No evdev code for raylib key {}", key);
            continue;
        }
        const bool already_held =
            std::any_of(held_keys_.begin(), held_keys_.end(),
                        [&](const auto &held) { return held.first == key; });
        if (already_held)
            continue;

        emit_(out, KeyEvent{*code, true});
        held_keys_.emplace_back(key, *code);
    }

    for (int button = MOUSE_BUTTON_LEFT; button <= MOUSE_BUTTON_BACK; ++button) {
        if (!IsMouseButtonPressed(button))
            continue;
        // The click that grabs the cursor is not forwarded
        if (!grabbed_) {
            if (button == MOUSE_BUTTON_LEFT)
                setGrab_(true);
            continue;
        }
        emit_(out, PointerButton{static_cast<uint8_t>(button), true});
        held_buttons_.push_back(button);
    }

    return {};
}

} // namespace sightline_rt::producers
