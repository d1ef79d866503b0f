#pragma once

#include <array>
#include <cstdint>
#include <glaze/glaze.hpp>
#include <optional>
#include <string>
#include <variant>

namespace sightline_rt::net::message {

struct QueryGazeTarget {};

struct SendKeyEvent {
    uint64_t target{};
    uint32_t keycode{};
    bool pressed{};
};

struct SendPointerEvent {
    uint64_t target{};
    double dx{};
    double dy{};
};

struct SendButtonEvent {
    uint64_t target{};
    uint8_t button{};
    bool pressed{};
};

struct RegisterPointerObject {};

struct UpdatePointerPose {
    uint64_t target{};
    std::array<float, 3> position{};
    std::array<float, 4> orientation{0.0f, 0.0f, 0.0f, 1.0f};
};

using Request =
    std::variant<QueryGazeTarget, SendKeyEvent, SendPointerEvent,
                 SendButtonEvent, RegisterPointerObject, UpdatePointerPose>;

struct Response {
    bool success{};
    int error_code{0};
    std::string error_message;
    std::string payload;
};

// Payload of QueryGazeTarget and RegisterPointerObject replies
struct TargetReply {
    std::optional<uint64_t> target{};
};

} // namespace sightline_rt::net::message

template <>
struct glz::meta<sightline_rt::net::message::Request> {
    static constexpr std::string_view tag = "type";
    static constexpr auto ids =
        std::array{"query_gaze_target",     "send_key_event",
                   "send_pointer_event",    "send_button_event",
                   "register_pointer_object", "update_pointer_pose"};
};
