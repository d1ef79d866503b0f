#include "sightline_rt/threading/signals.hpp"
#include <csignal>
#include <signal.h>
#include <spdlog/spdlog.h>

namespace sightline_rt::threading::signals {

namespace {
volatile std::sig_atomic_t stop_requested = 0;

void handleStop_(int) { stop_requested = 1; }
} // namespace

void Install() {
    struct sigaction action {};
    action.sa_handler = &handleStop_;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;

    if (sigaction(SIGINT, &action, nullptr) != 0 ||
        sigaction(SIGTERM, &action, nullptr) != 0) {
        spdlog::warn("Failed to install stop signal handlers");
    }

    if (std::signal(SIGPIPE, SIG_IGN) == SIG_ERR) {
        spdlog::warn("Failed to ignore SIGPIPE");
    }
}

bool StopRequested() { return stop_requested != 0; }

} // namespace sightline_rt::threading::signals
