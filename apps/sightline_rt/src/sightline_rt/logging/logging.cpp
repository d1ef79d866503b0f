#include "sightline_rt/logging/logging.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace sightline_rt::logging {

void Init(const std::string &name, std::string_view level) {
    auto logger = spdlog::get(name);
    if (!logger)
        logger = spdlog::stderr_color_mt(name);

    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%H:%M:%S.%e] [%n] [%^%l%$] %v");

    auto parsed = spdlog::level::from_str(std::string(level));
    // from_str falls back to "off" for names it does not know
    if (parsed == spdlog::level::off && level != "off") {
        spdlog::warn("Unknown log level '{}', using info", level);
        parsed = spdlog::level::info;
    }
    spdlog::set_level(parsed);
}

} // namespace sightline_rt::logging
