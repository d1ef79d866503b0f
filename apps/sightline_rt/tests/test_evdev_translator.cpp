#include "sightline_rt/producers/evdev_translator.hpp"
#include "sightline_rt/producers/keymap.hpp"
#include <cassert>
#include <iostream>
#include <linux/input-event-codes.h>
#include <vector>

using namespace sightline::core;
using sightline_rt::producers::EvdevFromRaylibKey;
using sightline_rt::producers::EvdevTranslator;
using sightline_rt::producers::OrderByTime;

namespace {

std::vector<Event> eventsOf(const std::vector<CapturedEvent> &captured) {
    std::vector<Event> events;
    for (const auto &c : captured)
        events.push_back(c.event);
    return events;
}

} // namespace

int main() {
    std::cout << "=== Testing evdev translation ===" << std::endl;

    std::cout << "\n[Test 1] Relative motion waits for the report to end..." << std::endl;
    EvdevTranslator translator;
    std::vector<CapturedEvent> out;
    translator.Translate(EV_REL, REL_X, 3, 1000, out);
    translator.Translate(EV_REL, REL_Y, -2, 2000, out);
    assert(out.empty() && translator.HasPendingMotion());
    translator.Translate(EV_SYN, SYN_REPORT, 0, 3000, out);
    assert((eventsOf(out) == std::vector<Event>{PointerMotion{3.0, -2.0}}));
    assert(!translator.HasPendingMotion());
    std::cout << "  ✓ REL_X + REL_Y + SYN_REPORT gives one motion" << std::endl;

    std::cout << "\n[Test 2] Keys flush pending motion first..." << std::endl;
    out.clear();
    translator.Translate(EV_REL, REL_X, 1, 4000, out);
    translator.Translate(EV_KEY, BTN_LEFT, 1, 5000, out);
    translator.Translate(EV_SYN, SYN_REPORT, 0, 6000, out);
    assert((eventsOf(out) == std::vector<Event>{PointerMotion{1.0, 0.0},
                                                PointerButton{0, true}}));
    std::cout << "  ✓ Motion is emitted before the button that followed it"
              << std::endl;

    std::cout << "\n[Test 3] Buttons and keys..." << std::endl;
    out.clear();
    translator.Translate(EV_KEY, BTN_RIGHT, 1, 7000, out);
    translator.Translate(EV_KEY, BTN_RIGHT, 0, 8000, out);
    translator.Translate(EV_KEY, KEY_A, 1, 9000, out);
    translator.Translate(EV_KEY, KEY_A, 2, 10000, out);
    translator.Translate(EV_KEY, KEY_A, 0, 11000, out);
    assert((eventsOf(out) == std::vector<Event>{
                                 PointerButton{1, true},
                                 PointerButton{1, false},
                                 KeyEvent{KEY_A, true},
                                 KeyEvent{KEY_A, false},
                             }));
    std::cout << "  ✓ BTN_RIGHT is button 1, autorepeat is ignored" << std::endl;

    std::cout << "\n[Test 4] Scroll and zero motion produce nothing..." << std::endl;
    out.clear();
    translator.Translate(EV_REL, REL_WHEEL, 1, 12000, out);
    translator.Translate(EV_SYN, SYN_REPORT, 0, 13000, out);
    translator.Translate(EV_REL, REL_X, 2, 14000, out);
    translator.Translate(EV_REL, REL_X, -2, 15000, out);
    translator.Translate(EV_SYN, SYN_REPORT, 0, 16000, out);
    assert(out.empty());
    std::cout << "  ✓ No event for a wheel tick or a net-zero report" << std::endl;

    std::cout << "\n[Test 5] Kernel times stamp the events..." << std::endl;
    out.clear();
    translator.Translate(EV_REL, REL_X, 4, 50'000, out);
    translator.Translate(EV_REL, REL_Y, 1, 50'000, out);
    translator.Translate(EV_SYN, SYN_REPORT, 0, 50'000, out);
    translator.Translate(EV_KEY, KEY_B, 1, 70'000, out);
    assert(out.size() == 2);
    assert(out[0].timestamp_ns == 50'000 && out[1].timestamp_ns == 70'000);
    std::cout << "  ✓ Motion and key carry their input_event time" << std::endl;

    std::cout << "\n[Test 6] Batches from several devices merge by time..." << std::endl;
    {
        // The mouse is drained first, but the keyboard's Ctrl came earlier
        EvdevTranslator mouse;
        EvdevTranslator keyboard;
        std::vector<CapturedEvent> batch;
        mouse.Translate(EV_KEY, BTN_LEFT, 1, 2'000, batch);
        mouse.Translate(EV_SYN, SYN_REPORT, 0, 2'000, batch);
        mouse.Translate(EV_KEY, BTN_LEFT, 0, 4'000, batch);
        keyboard.Translate(EV_KEY, KEY_LEFTCTRL, 1, 1'000, batch);
        keyboard.Translate(EV_KEY, KEY_C, 1, 3'000, batch);
        keyboard.Translate(EV_KEY, KEY_C, 0, 4'000, batch);

        OrderByTime(batch);
        assert((eventsOf(batch) == std::vector<Event>{
                                       KeyEvent{KEY_LEFTCTRL, true},
                                       PointerButton{0, true},
                                       KeyEvent{KEY_C, true},
                                       PointerButton{0, false},
                                       KeyEvent{KEY_C, false},
                                   }));
        std::cout << "  ✓ Ctrl precedes the click, equal times keep device order"
                  << std::endl;
    }

    std::cout << "\n[Test 7] raylib keys map to evdev codes..." << std::endl;
    assert(EvdevFromRaylibKey('A') == KEY_A);
    assert(EvdevFromRaylibKey('Q') == KEY_Q);
    assert(EvdevFromRaylibKey('0') == KEY_0);
    assert(EvdevFromRaylibKey(256) == KEY_ESC);
    assert(EvdevFromRaylibKey(290) == KEY_F1);
    assert(EvdevFromRaylibKey(301) == KEY_F12);
    assert(EvdevFromRaylibKey(340) == KEY_LEFTSHIFT);
    assert(EvdevFromRaylibKey(343) == KEY_LEFTMETA);
    assert(EvdevFromRaylibKey(320) == KEY_KP0);
    assert(!EvdevFromRaylibKey(0));
    assert(!EvdevFromRaylibKey(9999));
    std::cout << "  ✓ Letters, digits, function keys and modifiers map"
              << std::endl;

    std::cout << "\n=== All tests passed! ===" << std::endl;
    return 0;
}
