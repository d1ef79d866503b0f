#include "sightline_rt/producers/keymap.hpp"
#include <array>
#include <linux/input-event-codes.h>
#include <utility>

// raylib.h is deliberately not included here: its KeyboardKey enumerators
// share names with the kernel's KEY_* macros. raylib key values are GLFW
// key codes, printable keys use their ASCII value.
namespace sightline_rt::producers {

namespace {

constexpr std::array<uint32_t, 26> kLetters = {
    KEY_A, KEY_B, KEY_C, KEY_D, KEY_E, KEY_F, KEY_G, KEY_H, KEY_I,
    KEY_J, KEY_K, KEY_L, KEY_M, KEY_N, KEY_O, KEY_P, KEY_Q, KEY_R,
    KEY_S, KEY_T, KEY_U, KEY_V, KEY_W, KEY_X, KEY_Y, KEY_Z,
};

constexpr std::array<uint32_t, 10> kDigits = {
    KEY_0, KEY_1, KEY_2, KEY_3, KEY_4, KEY_5, KEY_6, KEY_7, KEY_8, KEY_9,
};

constexpr std::array<uint32_t, 12> kFunctionKeys = {
    KEY_F1, KEY_F2, KEY_F3, KEY_F4,  KEY_F5,  KEY_F6,
    KEY_F7, KEY_F8, KEY_F9, KEY_F10, KEY_F11, KEY_F12,
};

constexpr std::array<uint32_t, 10> kKeypadDigits = {
    KEY_KP0, KEY_KP1, KEY_KP2, KEY_KP3, KEY_KP4,
    KEY_KP5, KEY_KP6, KEY_KP7, KEY_KP8, KEY_KP9,
};

constexpr std::pair<int, uint32_t> kNamedKeys[] = {
    {32, KEY_SPACE},
    {39, KEY_APOSTROPHE},
    {44, KEY_COMMA},
    {45, KEY_MINUS},
    {46, KEY_DOT},
    {47, KEY_SLASH},
    {59, KEY_SEMICOLON},
    {61, KEY_EQUAL},
    {91, KEY_LEFTBRACE},
    {92, KEY_BACKSLASH},
    {93, KEY_RIGHTBRACE},
    {96, KEY_GRAVE},
    {256, KEY_ESC},
    {257, KEY_ENTER},
    {258, KEY_TAB},
    {259, KEY_BACKSPACE},
    {260, KEY_INSERT},
    {261, KEY_DELETE},
    {262, KEY_RIGHT},
    {263, KEY_LEFT},
    {264, KEY_DOWN},
    {265, KEY_UP},
    {266, KEY_PAGEUP},
    {267, KEY_PAGEDOWN},
    {268, KEY_HOME},
    {269, KEY_END},
    {280, KEY_CAPSLOCK},
    {281, KEY_SCROLLLOCK},
    {282, KEY_NUMLOCK},
    {283, KEY_SYSRQ},
    {284, KEY_PAUSE},
    {330, KEY_KPDOT},
    {331, KEY_KPSLASH},
    {332, KEY_KPASTERISK},
    {333, KEY_KPMINUS},
    {334, KEY_KPPLUS},
    {335, KEY_KPENTER},
    {336, KEY_KPEQUAL},
    {340, KEY_LEFTSHIFT},
    {341, KEY_LEFTCTRL},
    {342, KEY_LEFTALT},
    {343, KEY_LEFTMETA},
    {344, KEY_RIGHTSHIFT},
    {345, KEY_RIGHTCTRL},
    {346, KEY_RIGHTALT},
    {347, KEY_RIGHTMETA},
    {348, KEY_COMPOSE},
};

} // namespace

std::optional<uint32_t> EvdevFromRaylibKey(int key) {
    if (key >= 'A' && key <= 'Z')
        return kLetters[key - 'A'];
    if (key >= '0' && key <= '9')
        return kDigits[key - '0'];
    if (key >= 290 && key <= 301)
        return kFunctionKeys[key - 290];
    if (key >= 320 && key <= 329)
        return kKeypadDigits[key - 320];

    for (const auto &[raylib_key, evdev_key] : kNamedKeys) {
        if (raylib_key == key)
            return evdev_key;
    }
    return std::nullopt;
}

} // namespace sightline_rt::producers
