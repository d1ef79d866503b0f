#pragma once

#include "sightline/core/event.hpp"
#include "sightline_rt/config/config.hpp"
#include "sightline_rt/producers/evdev_translator.hpp"
#include <memory>
#include <string>
#include <system_error>
#include <vector>

struct libevdev;

namespace sightline_rt::producers {

// Reads evdev devices directly. Not tied to a window, so it captures until
// the last device goes away.
class DeviceCapture {
  public:
    explicit DeviceCapture(config::DeviceConfig config);

    std::error_code Open();

    // Blocks until at least one device has input, then appends everything
    // read. Returns host_source_lost once no device is left.
    std::error_code Capture(std::vector<sightline::core::CapturedEvent> &out);

    void Close();

  private:
    struct DeviceDeleter {
        void operator()(libevdev *dev) const;
    };

    struct Device {
        std::string path;
        std::unique_ptr<libevdev, DeviceDeleter> dev;
        EvdevTranslator translator;
    };

    std::vector<std::string> candidatePaths_() const;

    std::error_code openDevice_(const std::string &path);

    // False once the device is gone
    bool drain_(Device &device,
                std::vector<sightline::core::CapturedEvent> &out);

    config::DeviceConfig config_;
    std::vector<Device> devices_;
};

} // namespace sightline_rt::producers
