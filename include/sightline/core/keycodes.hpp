#pragma once

#include <cstdint>

// Values from linux/input-event-codes.h. Named in CamelCase so this header can
// share a translation unit with the kernel header (whose KEY_* macros would
// otherwise clobber the names) or with raylib (which has its own KEY_* enum).
namespace sightline::core::evdev {

inline constexpr uint32_t LeftCtrl = 29;
inline constexpr uint32_t LeftShift = 42;
inline constexpr uint32_t RightShift = 54;
inline constexpr uint32_t LeftAlt = 56;
inline constexpr uint32_t RightCtrl = 97;
inline constexpr uint32_t RightAlt = 100;
inline constexpr uint32_t LeftMeta = 125;
inline constexpr uint32_t RightMeta = 126;

inline constexpr uint32_t BtnMouse = 0x110;
inline constexpr uint32_t BtnJoystick = 0x120;

} // namespace sightline::core::evdev

namespace sightline::core {

// xkb real modifier positions
enum ModifierBit : uint32_t {
    MOD_SHIFT = 1u << 0,
    MOD_CTRL = 1u << 2,
    MOD_ALT = 1u << 3,
    MOD_SUPER = 1u << 6,
};

constexpr uint32_t modifier_bit(uint32_t keycode) {
    switch (keycode) {
    case evdev::LeftShift:
    case evdev::RightShift:
        return MOD_SHIFT;
    case evdev::LeftCtrl:
    case evdev::RightCtrl:
        return MOD_CTRL;
    case evdev::LeftAlt:
    case evdev::RightAlt:
        return MOD_ALT;
    case evdev::LeftMeta:
    case evdev::RightMeta:
        return MOD_SUPER;
    default:
        return 0;
    }
}

constexpr bool is_modifier(uint32_t keycode) { return modifier_bit(keycode) != 0; }

constexpr bool is_mouse_button(uint32_t code) {
    return code >= evdev::BtnMouse && code < evdev::BtnJoystick;
}

} // namespace sightline::core
