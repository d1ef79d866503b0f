#pragma once

#include <string>
#include <system_error>

namespace sightline::core {

enum class Errc : int {
    protocol_version_mismatch = 1,
    unknown_variant,
    truncated_frame,
    end_of_stream,
    broken_pipe,
    host_source_lost,
    compositor_unavailable,
    terminal_pipe,
};

} // namespace sightline::core

template <> struct std::is_error_code_enum<sightline::core::Errc> : std::true_type {};

namespace sightline::core {

// Error category for the event pipeline
class sightline_error_category : public std::error_category {
  public:
    const char *name() const noexcept override { return "sightline"; }

    std::string message(int ev) const override {
        switch (static_cast<Errc>(ev)) {
        case Errc::protocol_version_mismatch:
            return "protocol version mismatch";
        case Errc::unknown_variant:
            return "unknown event variant tag";
        case Errc::truncated_frame:
            return "stream ended in the middle of a frame";
        case Errc::end_of_stream:
            return "end of stream";
        case Errc::broken_pipe:
            return "reader closed the pipe";
        case Errc::host_source_lost:
            return "input source is no longer available";
        case Errc::compositor_unavailable:
            return "compositor request failed";
        case Errc::terminal_pipe:
            return "stream endpoint is a terminal, not a pipe";
        }
        return "unknown sightline error";
    }
};

inline const std::error_category &sightline_category() {
    static sightline_error_category instance;
    return instance;
}

inline std::error_code make_error_code(Errc e) {
    return std::error_code(static_cast<int>(e), sightline_category());
}

// Conditions that end a session without being failures
inline bool is_clean_termination(const std::error_code &ec) {
    return !ec || ec == Errc::end_of_stream || ec == Errc::broken_pipe ||
           ec == Errc::host_source_lost;
}

} // namespace sightline::core
