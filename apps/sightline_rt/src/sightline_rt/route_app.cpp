#include "sightline_rt/route_app.hpp"
#include "sightline/core/error.hpp"
#include "sightline_rt/logging/logging.hpp"
#include "sightline_rt/threading/signals.hpp"
#include "sightline_rt/transport/pipe.hpp"
#include <cstdlib>
#include <format>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace sightline_rt {

using sightline::core::Errc;

RouteApp::RouteApp(int argc, char **argv) {
    logging::Init("route", "info");
    config_ = config::FromArgs<config::RouteConfig>(argc, argv);
    logging::Init("route", config_.log_level);
}

routing::Router RouteApp::makeRouter_() {
    if (config_.router == "focus")
        return routing::Router{std::in_place_type<routing::FocusRouter>,
                               compositor_};
    if (config_.router == "pointer")
        return routing::Router{std::in_place_type<routing::PointerProjector>,
                               compositor_, config_.sensitivity};
    throw std::runtime_error(std::format(
        "Unknown router '{}', expected focus or pointer", config_.router));
}

int RouteApp::Launch() {
    transport::PipeReader reader;
    if (reader.IsTerminal()) {
        spdlog::error("stdin: {}. Feed it from a producer, for example "
                      "`sightline-capture | sightline-route`",
                      make_error_code(Errc::terminal_pipe).message());
        return EXIT_FAILURE;
    }

    threading::signals::Install();

    if (auto ec = compositor_.Connect(config_.compositor.address,
                                      config_.compositor.timeout_ms))
        throw std::runtime_error(std::format(
            "Failed to set up compositor client: {}", ec.message()));

    routing::RouteLoop loop(makeRouter_(), std::move(reader));
    loop.Exec();
    compositor_.Shutdown();

    return sightline::core::is_clean_termination(loop.Result()) ? EXIT_SUCCESS
                                                                : EXIT_FAILURE;
}

RouteApp::~RouteApp() {}

} // namespace sightline_rt
