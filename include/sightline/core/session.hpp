#pragma once

#include "sightline/compositor/compositor.hpp"
#include "sightline/core/event.hpp"
#include "sightline/core/keycodes.hpp"
#include <cstdint>
#include <optional>
#include <unordered_map>
#include <unordered_set>

namespace sightline::core {

struct PointerPosition {
    double x{};
    double y{};

    bool operator==(const PointerPosition &) const = default;
};

struct AbsoluteAnchor {
    double x{};
    double y{};
    uint64_t surface_id{};
};

// Per-consumer accumulated state. One instance per router, created at
// startup and threaded through every apply call.
struct SessionState {
    uint32_t modifier_mask{};
    PointerPosition cumulative_pointer{};
    std::optional<compositor::TargetHandle> focus_target;

    std::unordered_set<uint32_t> held_modifiers;
    // Which target saw the press of a key/button that is still down
    std::unordered_map<uint32_t, compositor::TargetHandle> delivered_keys;
    std::unordered_map<uint8_t, compositor::TargetHandle> delivered_buttons;
    std::optional<AbsoluteAnchor> absolute_anchor;

    // Returns the new mask if this key changed it. Repeated presses of a held
    // modifier leave the mask unchanged.
    std::optional<ModifierChange> applyKey(const KeyEvent &event) {
        const uint32_t bit = modifier_bit(event.keycode);
        if (bit == 0)
            return std::nullopt;

        if (event.pressed)
            held_modifiers.insert(event.keycode);
        else
            held_modifiers.erase(event.keycode);

        uint32_t mask = 0;
        for (auto keycode : held_modifiers)
            mask |= modifier_bit(keycode);

        if (mask == modifier_mask)
            return std::nullopt;
        modifier_mask = mask;
        return ModifierChange{mask};
    }

    bool isModifierHeld(uint32_t keycode) const {
        return held_modifiers.contains(keycode);
    }

    void accumulate(const PointerMotion &motion) {
        cumulative_pointer.x += motion.dx;
        cumulative_pointer.y += motion.dy;
    }

    // Delta against the previous sample on the same surface. The first sample
    // on a surface only anchors.
    PointerMotion toMotion(const PointerAbsolute &event) {
        PointerMotion motion{};
        if (absolute_anchor && absolute_anchor->surface_id == event.surface_id) {
            motion.dx = event.x - absolute_anchor->x;
            motion.dy = event.y - absolute_anchor->y;
        }
        absolute_anchor = AbsoluteAnchor{event.x, event.y, event.surface_id};
        return motion;
    }
};

} // namespace sightline::core
