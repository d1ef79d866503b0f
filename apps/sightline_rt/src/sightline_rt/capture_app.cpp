#include "sightline_rt/capture_app.hpp"
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

CaptureApp::CaptureApp(int argc, char **argv) {
    logging::Init("capture", "info");
    config_ = config::FromArgs<config::CaptureConfig>(argc, argv);
    logging::Init("capture", config_.log_level);
}

producers::Producer CaptureApp::makeProducer_() const {
    if (config_.producer == "window")
        return producers::Producer{std::in_place_type<producers::WindowCapture>,
                                   config_.window};
    if (config_.producer == "device")
        return producers::Producer{std::in_place_type<producers::DeviceCapture>,
                                   config_.device};
    throw std::runtime_error(
        std::format("Unknown producer '{}', expected window or device",
                    config_.producer));
}

int CaptureApp::Launch() {
    transport::PipeWriter writer;
    if (writer.IsTerminal()) {
        spdlog::error("stdout: {}. Pipe it into a consumer, for example "
                      "`sightline-capture | sightline-route`",
                      make_error_code(Errc::terminal_pipe).message());
        return EXIT_FAILURE;
    }

    threading::signals::Install();

    auto producer = makeProducer_();
    producers::CaptureLoop loop(producer, std::move(writer));
    loop.Exec();

    return sightline::core::is_clean_termination(loop.Result()) ? EXIT_SUCCESS
                                                                : EXIT_FAILURE;
}

CaptureApp::~CaptureApp() {}

} // namespace sightline_rt
