#include "sightline/core/codec.hpp"
#include "sightline/core/error.hpp"
#include "sightline_rt/stream/event_stream.hpp"
#include "sightline_rt/transport/pipe.hpp"
#include <cassert>
#include <iostream>
#include <string>
#include <unistd.h>

using namespace sightline_rt;
using namespace sightline::core;

namespace {

// Writes data into a fresh pipe, closes the write end and returns the reader
transport::PipeReader pipeWith(const std::string &data) {
    int fds[2];
    assert(::pipe(fds) == 0);
    transport::PipeWriter writer(fds[1]);
    auto ec = writer.Write(data);
    assert(!ec);
    writer.Close();
    return transport::PipeReader(fds[0]);
}

} // namespace

int main() {
    std::cout << "=== Testing event stream state machine ===" << std::endl;

    std::cout << "\n[Test 1] Idle until a transport is attached..." << std::endl;
    stream::EventStream idle;
    assert(idle.GetState() == stream::State::IDLE);
    auto not_attached = idle.Next();
    assert(!not_attached &&
           not_attached.error() == std::errc::not_connected);
    std::cout << "  ✓ Next() on an idle stream fails" << std::endl;

    std::cout << "\n[Test 2] Streaming to stopped on a clean end..." << std::endl;
    std::string frames;
    wire::encode(KeyEvent{30, true}, frames);
    wire::encode(PointerMotion{1.0, 2.0}, frames);

    stream::EventStream clean;
    clean.Attach(pipeWith(frames));
    assert(clean.GetState() == stream::State::STREAMING);

    auto first = clean.Next();
    assert(first && first->has_value());
    assert(std::get<KeyEvent>((*first)->event) == (KeyEvent{30, true}));
    assert((*first)->timestamp_ns != 0 && "Events are stamped on decode");

    auto second = clean.Next();
    assert(second && second->has_value());
    assert(std::get<PointerMotion>((*second)->event) == (PointerMotion{1.0, 2.0}));
    assert(clean.GetState() == stream::State::STREAMING);

    auto end = clean.Next();
    assert(end && !end->has_value() && "Clean EOF is not an error");
    assert(clean.GetState() == stream::State::STOPPED);

    auto after = clean.Next();
    assert(after && !after->has_value() && "Stopped stays stopped");
    std::cout << "  ✓ IDLE -> STREAMING -> DRAINING -> STOPPED" << std::endl;

    std::cout << "\n[Test 3] Truncated frame at end of stream..." << std::endl;
    std::string cut;
    wire::encode(PointerButton{0, true}, cut);
    auto partial = wire::encode(PointerAbsolute{1.0, 1.0, 9});
    cut += partial.substr(0, partial.size() - 1);

    stream::EventStream truncated;
    truncated.Attach(pipeWith(cut));
    auto button = truncated.Next();
    assert(button && button->has_value() && "Frames before the cut are delivered");
    auto failure = truncated.Next();
    assert(!failure && failure.error() == Errc::truncated_frame);
    assert(truncated.GetState() == stream::State::STOPPED);
    std::cout << "  ✓ " << failure.error().message() << std::endl;

    std::cout << "\n[Test 4] Version mismatch stops the stream..." << std::endl;
    stream::EventStream mismatched;
    mismatched.Attach(pipeWith(std::string("\x02\x00\x01\x00\x00\x00\x01", 7)));
    auto rejected = mismatched.Next();
    assert(!rejected && rejected.error() == Errc::protocol_version_mismatch);
    assert(mismatched.GetState() == stream::State::STOPPED);
    assert(!is_clean_termination(rejected.error()));
    std::cout << "  ✓ Stopped with " << rejected.error().message() << std::endl;

    std::cout << "\n[Test 5] Empty stream..." << std::endl;
    stream::EventStream empty;
    empty.Attach(pipeWith(""));
    auto nothing = empty.Next();
    assert(nothing && !nothing->has_value());
    assert(empty.GetState() == stream::State::STOPPED);
    std::cout << "  ✓ Immediate EOF ends cleanly" << std::endl;

    std::cout << "\n=== All tests passed! ===" << std::endl;
    return 0;
}
