#include "sightline/core/error.hpp"
#include "sightline_rt/compositor/nng_compositor.hpp"
#include "sightline_rt/net/message_types.hpp"
#include "sightline_rt/net/reply_socket.hpp"
#include <cassert>
#include <glaze/glaze.hpp>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace sightline_rt;
using sightline::compositor::Pose;
using sightline::compositor::TargetHandle;
using sightline::core::Errc;
namespace msg = sightline_rt::net::message;

namespace {

// Minimal compositor: answers every request and records the effect calls
struct CompositorStub {
    net::ReplySocket rep;
    std::mutex mutex;
    std::vector<msg::Request> received;

    msg::Response handle(const msg::Request &request) {
        {
            std::lock_guard lock(mutex);
            received.push_back(request);
        }

        msg::Response response{true, 0, "", ""};
        std::visit(
            [&](const auto &r) {
                using T = std::decay_t<decltype(r)>;
                if constexpr (std::is_same_v<T, msg::QueryGazeTarget>) {
                    auto err = glz::write_json(msg::TargetReply{42}, response.payload);
                    assert(!err);
                } else if constexpr (std::is_same_v<T, msg::RegisterPointerObject>) {
                    auto err = glz::write_json(msg::TargetReply{77}, response.payload);
                    assert(!err);
                } else if constexpr (std::is_same_v<T, msg::SendButtonEvent>) {
                    if (r.button == 9)
                        response = msg::Response{false, 22, "no such button", ""};
                }
            },
            request);
        return response;
    }

    void serve(std::stop_token stop) {
        std::string request;
        std::string reply;
        while (!stop.stop_requested()) {
            // Times out every 100 ms so the stop token is seen
            if (rep.Receive(request))
                continue;

            auto parsed = glz::read_json<msg::Request>(request);
            msg::Response response =
                parsed ? handle(*parsed)
                       : msg::Response{false, 74, "bad message", ""};
            auto err = glz::write_json(response, reply);
            assert(!err);
            auto ec = rep.Send(reply);
            assert(!ec);
        }
    }
};

} // namespace

int main() {
    std::cout << "=== Testing nng compositor client ===" << std::endl;

    std::cout << "\n[Test 1] Requests are tagged by type..." << std::endl;
    std::string json;
    auto err = glz::write_json(msg::Request{msg::SendKeyEvent{5, 30, true}}, json);
    assert(!err);
    assert(json.find("\"type\":\"send_key_event\"") != std::string::npos);
    assert(json.find("\"keycode\":30") != std::string::npos);
    auto back = glz::read_json<msg::Request>(json);
    assert(back && std::holds_alternative<msg::SendKeyEvent>(*back));
    assert(std::get<msg::SendKeyEvent>(*back).target == 5);
    std::cout << "  ✓ " << json << std::endl;

    const std::string address = "inproc://sightline-compositor-test";
    CompositorStub stub;
    assert(!stub.rep.Init());
    assert(!stub.rep.Bind(address));
    std::jthread server([&](std::stop_token stop) { stub.serve(stop); });

    compositor::NngCompositor client;
    assert(!client.Connect(address, 1000));

    std::cout << "\n[Test 2] Gaze query and pointer registration..." << std::endl;
    auto gaze = client.queryGazeTarget();
    assert(gaze && *gaze && (*gaze)->id == 42);
    auto pointer = client.registerPointerObject();
    assert(pointer && pointer->id == 77);
    std::cout << "  ✓ Gaze target 42, pointer 77" << std::endl;

    std::cout << "\n[Test 3] Effect calls reach the compositor..." << std::endl;
    assert(!client.sendKeyEvent(TargetHandle{42}, 30, true));
    assert(!client.sendPointerEvent(TargetHandle{42}, 1.5, -2.0));
    Pose pose;
    pose.orientation = {0.0f, 1.0f, 0.0f, 0.0f};
    assert(!client.updatePointerPose(TargetHandle{77}, pose));
    {
        std::lock_guard lock(stub.mutex);
        assert(stub.received.size() == 5);
        auto &key = std::get<msg::SendKeyEvent>(stub.received[2]);
        assert(key.target == 42 && key.keycode == 30 && key.pressed);
        auto &motion = std::get<msg::SendPointerEvent>(stub.received[3]);
        assert(motion.dx == 1.5 && motion.dy == -2.0);
        auto &update = std::get<msg::UpdatePointerPose>(stub.received[4]);
        assert(update.target == 77 && update.orientation[1] == 1.0f);
    }
    std::cout << "  ✓ Key, pointer and pose requests decoded by the stub" << std::endl;

    std::cout << "\n[Test 4] Refusals map to compositor_unavailable..." << std::endl;
    auto refused = client.sendButtonEvent(TargetHandle{42}, 9, true);
    assert(refused == Errc::compositor_unavailable);
    assert(!client.sendButtonEvent(TargetHandle{42}, 0, true));
    std::cout << "  ✓ " << refused.message() << std::endl;

    server.request_stop();
    server.join();
    client.Shutdown();
    stub.rep.Shutdown();

    std::cout << "\n[Test 5] No compositor listening..." << std::endl;
    compositor::NngCompositor orphan;
    assert(!orphan.Connect("inproc://sightline-nobody-home", 50));
    auto missing = orphan.queryGazeTarget();
    assert(!missing && missing.error() == Errc::compositor_unavailable);
    assert(orphan.sendKeyEvent(TargetHandle{1}, 30, true) ==
           Errc::compositor_unavailable);
    std::cout << "  ✓ Requests time out as compositor_unavailable" << std::endl;

    std::cout << "\n=== All tests passed! ===" << std::endl;
    return 0;
}
