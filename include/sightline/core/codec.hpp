#pragma once

#include "sightline/core/error.hpp"
#include "sightline/core/event.hpp"
#include <bit>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

// Frame layout: [version:u8][tag:u8][fixed-size little-endian payload]
// There is no length prefix; the tag alone determines the frame size.
namespace sightline::core::wire {

inline constexpr uint8_t VERSION = 1;
inline constexpr size_t HEADER_SIZE = 2;

enum class Tag : uint8_t {
    KEY = 0,
    POINTER_MOTION = 1,
    POINTER_ABSOLUTE = 2,
    POINTER_BUTTON = 3,
};

constexpr std::optional<size_t> payload_size(uint8_t tag) {
    switch (static_cast<Tag>(tag)) {
    case Tag::KEY:
        return 4 + 1;
    case Tag::POINTER_MOTION:
        return 8 + 8;
    case Tag::POINTER_ABSOLUTE:
        return 8 + 8 + 8;
    case Tag::POINTER_BUTTON:
        return 1 + 1;
    }
    return std::nullopt;
}

namespace detail {

inline void put_u8(std::string &out, uint8_t v) {
    out.push_back(static_cast<char>(v));
}

inline void put_u32(std::string &out, uint32_t v) {
    for (int i = 0; i < 4; ++i)
        out.push_back(static_cast<char>((v >> (8 * i)) & 0xFF));
}

inline void put_u64(std::string &out, uint64_t v) {
    for (int i = 0; i < 8; ++i)
        out.push_back(static_cast<char>((v >> (8 * i)) & 0xFF));
}

inline void put_f64(std::string &out, double v) {
    put_u64(out, std::bit_cast<uint64_t>(v));
}

inline void put_header(std::string &out, Tag tag) {
    put_u8(out, VERSION);
    put_u8(out, static_cast<uint8_t>(tag));
}

inline uint8_t get_u8(const char *p) { return static_cast<uint8_t>(*p); }

inline uint32_t get_u32(const char *p) {
    uint32_t v = 0;
    for (int i = 0; i < 4; ++i)
        v |= static_cast<uint32_t>(static_cast<uint8_t>(p[i])) << (8 * i);
    return v;
}

inline uint64_t get_u64(const char *p) {
    uint64_t v = 0;
    for (int i = 0; i < 8; ++i)
        v |= static_cast<uint64_t>(static_cast<uint8_t>(p[i])) << (8 * i);
    return v;
}

inline double get_f64(const char *p) { return std::bit_cast<double>(get_u64(p)); }

} // namespace detail

// Appends exactly one frame to out
inline void encode(const Event &event, std::string &out) {
    using namespace detail;
    std::visit(overloaded{
                   [&](const KeyEvent &e) {
                       put_header(out, Tag::KEY);
                       put_u32(out, e.keycode);
                       put_u8(out, e.pressed ? 1 : 0);
                   },
                   [&](const PointerMotion &e) {
                       put_header(out, Tag::POINTER_MOTION);
                       put_f64(out, e.dx);
                       put_f64(out, e.dy);
                   },
                   [&](const PointerAbsolute &e) {
                       put_header(out, Tag::POINTER_ABSOLUTE);
                       put_f64(out, e.x);
                       put_f64(out, e.y);
                       put_u64(out, e.surface_id);
                   },
                   [&](const PointerButton &e) {
                       put_header(out, Tag::POINTER_BUTTON);
                       put_u8(out, e.button);
                       put_u8(out, e.pressed ? 1 : 0);
                   },
               },
               event);
}

inline std::string encode(const Event &event) {
    std::string out;
    encode(event, out);
    return out;
}

// Incremental decoder. Bytes are fed as they arrive from the transport;
// next() yields complete events in byte order and reports "need more" as an
// empty optional. A version or tag error is sticky: once reported, no further
// bytes are consumed.
class Decoder {
  public:
    void feed(std::string_view bytes) {
        if (failure_)
            return;
        compact_();
        buffer_.append(bytes.data(), bytes.size());
    }

    std::expected<std::optional<Event>, std::error_code> next() {
        if (failure_)
            return std::unexpected(failure_);

        const size_t available = buffer_.size() - offset_;
        if (available < 1)
            return std::nullopt;

        const char *frame = buffer_.data() + offset_;
        if (detail::get_u8(frame) != VERSION) {
            failure_ = make_error_code(Errc::protocol_version_mismatch);
            return std::unexpected(failure_);
        }
        if (available < HEADER_SIZE)
            return std::nullopt;

        const uint8_t tag = detail::get_u8(frame + 1);
        auto size = payload_size(tag);
        if (!size) {
            failure_ = make_error_code(Errc::unknown_variant);
            return std::unexpected(failure_);
        }
        if (available < HEADER_SIZE + *size)
            return std::nullopt;

        const char *p = frame + HEADER_SIZE;
        Event event;
        switch (static_cast<Tag>(tag)) {
        case Tag::KEY:
            event = KeyEvent{detail::get_u32(p), detail::get_u8(p + 4) != 0};
            break;
        case Tag::POINTER_MOTION:
            event = PointerMotion{detail::get_f64(p), detail::get_f64(p + 8)};
            break;
        case Tag::POINTER_ABSOLUTE:
            event = PointerAbsolute{detail::get_f64(p), detail::get_f64(p + 8),
                                    detail::get_u64(p + 16)};
            break;
        case Tag::POINTER_BUTTON:
            event = PointerButton{detail::get_u8(p), detail::get_u8(p + 1) != 0};
            break;
        }

        offset_ += HEADER_SIZE + *size;
        return event;
    }

    // Called once the transport reports end-of-stream
    std::error_code finish() const {
        if (failure_)
            return failure_;
        if (buffered() != 0)
            return make_error_code(Errc::truncated_frame);
        return {};
    }

    size_t buffered() const { return buffer_.size() - offset_; }

  private:
    void compact_() {
        if (offset_ == 0)
            return;
        buffer_.erase(0, offset_);
        offset_ = 0;
    }

    std::string buffer_;
    size_t offset_ = 0;
    std::error_code failure_;
};

} // namespace sightline::core::wire
