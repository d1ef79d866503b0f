#include "sightline/core/error.hpp"
#include "sightline/core/session.hpp"
#include "sightline_rt/logging/logging.hpp"
#include "sightline_rt/stream/event_stream.hpp"
#include "sightline_rt/threading/signals.hpp"
#include "sightline_rt/transport/pipe.hpp"
#include <cstdio>
#include <cstdlib>
#include <print>
#include <spdlog/spdlog.h>

// Prints the decoded stream, one line per event, for debugging a producer:
// `sightline-capture | sightline-monitor`
int main(int argc, char **argv) {
    using namespace sightline_rt;

    logging::Init("monitor", argc > 1 ? argv[1] : "info");

    transport::PipeReader reader;
    if (reader.IsTerminal()) {
        spdlog::error("stdin: {}",
                      make_error_code(sightline::core::Errc::terminal_pipe)
                          .message());
        return EXIT_FAILURE;
    }
    threading::signals::Install();

    stream::EventStream events;
    events.Attach(std::move(reader));
    sightline::core::SessionState session;

    while (true) {
        auto next = events.Next();
        if (!next) {
            if (next.error() == std::errc::interrupted)
                return EXIT_SUCCESS;
            spdlog::error("Event stream failed: {}", next.error().message());
            return EXIT_FAILURE;
        }
        if (!next->has_value())
            break;

        const auto &event = (*next)->event;
        std::println("{}", sightline::core::to_string(event));
        if (auto key = std::get_if<sightline::core::KeyEvent>(&event)) {
            if (auto change = session.applyKey(*key))
                std::println("Modifiers changed to {:#x}", change->mask);
        }
        std::fflush(stdout);
    }

    return EXIT_SUCCESS;
}
