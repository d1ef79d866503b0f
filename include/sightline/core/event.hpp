#pragma once

#include <cstdint>
#include <format>
#include <string>
#include <type_traits>
#include <variant>

namespace sightline::core {

struct KeyEvent {
    uint32_t keycode{}; // evdev key code
    bool pressed{};

    bool operator==(const KeyEvent &) const = default;
};

struct PointerMotion {
    double dx{};
    double dy{};

    bool operator==(const PointerMotion &) const = default;
};

// Window-local position, only produced by window capture
struct PointerAbsolute {
    double x{};
    double y{};
    uint64_t surface_id{};

    bool operator==(const PointerAbsolute &) const = default;
};

// Button index is the offset from evdev BTN_MOUSE (0 = left, 1 = right, ...)
struct PointerButton {
    uint8_t button{};
    bool pressed{};

    bool operator==(const PointerButton &) const = default;
};

// Derived by the consumer from the KeyEvent sequence, never transmitted.
struct ModifierChange {
    uint32_t mask{};

    bool operator==(const ModifierChange &) const = default;
};

// Order of alternatives is not the wire tag order; see codec.hpp.
using Event = std::variant<KeyEvent, PointerMotion, PointerAbsolute, PointerButton>;

struct CapturedEvent {
    Event event;
    uint64_t timestamp_ns{}; // monotonic capture time
};

template <class... Ts> struct overloaded : Ts... {
    using Ts::operator()...;
};

inline std::string to_string(const Event &event) {
    return std::visit(
        overloaded{
            [](const KeyEvent &e) {
                return std::format("{} key {}", e.pressed ? "Pressed" : "Released",
                                   e.keycode);
            },
            [](const PointerMotion &e) {
                return std::format("Pointer moved by ({}, {})", e.dx, e.dy);
            },
            [](const PointerAbsolute &e) {
                return std::format("Pointer at ({}, {}) on surface {:#x}", e.x,
                                   e.y, e.surface_id);
            },
            [](const PointerButton &e) {
                return std::format("{} button {}",
                                   e.pressed ? "Pressed" : "Released", e.button);
            },
        },
        event);
}

} // namespace sightline::core
