#pragma once

#include <expected>
#include <format>
#include <glaze/glaze.hpp>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace sightline_rt::config {

struct WindowConfig {
    int width{320};
    int height{240};
    std::string title{"Sightline Input"};
    int target_fps{250};
    bool release_held_on_focus_loss{true};
};

struct DeviceConfig {
    std::string input_dir{"/dev/input"};
    // Explicit device nodes; empty means every event* node under input_dir
    std::vector<std::string> devices{};
    bool grab{false};
};

struct CaptureConfig {
    std::string producer{"window"}; // "window" | "device"
    std::string log_level{"info"};
    WindowConfig window{};
    DeviceConfig device{};
};

struct CompositorConfig {
    std::string address{"ipc:///tmp/sightline-compositor.sock"};
    int timeout_ms{100};
};

struct RouteConfig {
    std::string router{"focus"}; // "focus" | "pointer"
    std::string log_level{"info"};
    double sensitivity{0.01}; // degrees per pointer unit
    CompositorConfig compositor{};
};

template <typename TConfig>
std::expected<TConfig, std::error_code> Parse(std::string_view json) {
    glz::expected<TConfig, glz::error_ctx> config =
        glz::read_json<TConfig>(std::string(json));
    if (!config) {
        spdlog::error("Invalid configuration: {}",
                      glz::format_error(config.error(), json));
        return std::unexpected(std::make_error_code(std::errc::invalid_argument));
    }
    return config.value();
}

// Reads the configuration file at path. A missing file yields the defaults;
// a file that exists but does not parse is an error.
template <typename TConfig>
std::expected<TConfig, std::error_code> Load(const std::string &path) {
    TConfig config{};
    std::string buffer;
    auto err = glz::read_file_json(config, path, buffer);
    if (!err)
        return config;

    if (err.ec == glz::error_code::file_open_failure) {
        spdlog::warn("Configuration file {} not found, using defaults", path);
        return TConfig{};
    }

    spdlog::error("Invalid configuration in {}: {}", path,
                  glz::format_error(err, buffer));
    return std::unexpected(std::make_error_code(std::errc::invalid_argument));
}

// Loads the file named by argv[1], or the defaults without one. Throws when
// the file exists but is not valid.
template <typename TConfig> TConfig FromArgs(int argc, char **argv) {
    if (argc < 2) {
        spdlog::debug("No configuration file given, using defaults");
        return TConfig{};
    }

    auto config = Load<TConfig>(argv[1]);
    if (!config)
        throw std::runtime_error(
            std::format("Failed to load configuration {}", argv[1]));
    return *config;
}

} // namespace sightline_rt::config
