#pragma once

#include <cstdint>
#include <optional>

namespace sightline_rt::producers {

// Translate a raylib KeyboardKey value to the evdev code for the same
// physical key. Keys without an evdev equivalent yield nullopt.
std::optional<uint32_t> EvdevFromRaylibKey(int key);

} // namespace sightline_rt::producers
