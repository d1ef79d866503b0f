#include "sightline_rt/producers/device_capture.hpp"
#include "sightline/core/error.hpp"
#include <algorithm>
#include <cerrno>
#include <fcntl.h>
#include <filesystem>
#include <iterator>
#include <libevdev/libevdev.h>
#include <poll.h>
#include <time.h>
#include <spdlog/spdlog.h>
#include <unistd.h>

namespace sightline_rt::producers {

using sightline::core::CapturedEvent;
using sightline::core::Errc;

namespace {

uint64_t eventTimeNs(const input_event &ev) {
    return static_cast<uint64_t>(ev.input_event_sec) * 1'000'000'000ull +
           static_cast<uint64_t>(ev.input_event_usec) * 1'000ull;
}

} // namespace

void DeviceCapture::DeviceDeleter::operator()(libevdev *dev) const {
    int fd = libevdev_get_fd(dev);
    libevdev_free(dev);
    if (fd >= 0)
        ::close(fd);
}

DeviceCapture::DeviceCapture(config::DeviceConfig config)
    : config_(std::move(config)) {}

std::vector<std::string> DeviceCapture::candidatePaths_() const {
    if (!config_.devices.empty())
        return config_.devices;

    std::vector<std::string> paths;
    std::error_code ec;
    for (const auto &entry :
         std::filesystem::directory_iterator(config_.input_dir, ec)) {
        if (entry.path().filename().string().starts_with("event"))
            paths.push_back(entry.path().string());
    }
    if (ec)
        spdlog::error("Cannot list {}: {}", config_.input_dir, ec.message());

    std::sort(paths.begin(), paths.end());
    return paths;
}

std::error_code DeviceCapture::openDevice_(const std::string &path) {
    int fd = ::open(path.c_str(), O_RDONLY | O_NONBLOCK | O_CLOEXEC);
    if (fd < 0)
        return std::error_code(errno, std::generic_category());

    libevdev *raw = nullptr;
    int rc = libevdev_new_from_fd(fd, &raw);
    if (rc < 0) {
        ::close(fd);
        return std::error_code(-rc, std::generic_category());
    }
    std::unique_ptr<libevdev, DeviceDeleter> dev(raw);

    const bool has_keys = libevdev_has_event_type(raw, EV_KEY);
    const bool has_motion = libevdev_has_event_code(raw, EV_REL, REL_X) ||
                            libevdev_has_event_code(raw, EV_REL, REL_Y);
    if (!has_keys && !has_motion)
        return std::make_error_code(std::errc::not_supported);

    // Same clock as monotonic_ns, so batches from several devices can be
    // merged by time
    rc = libevdev_set_clock_id(raw, CLOCK_MONOTONIC);
    if (rc < 0)
        return std::error_code(-rc, std::generic_category());

    if (config_.grab) {
        rc = libevdev_grab(raw, LIBEVDEV_GRAB);
        if (rc < 0)
            return std::error_code(-rc, std::generic_category());
    }

    spdlog::info("Capturing {} ({})", path, libevdev_get_name(raw));
    devices_.push_back(Device{path, std::move(dev), {}});
    return {};
}

std::error_code DeviceCapture::Open() {
    for (const auto &path : candidatePaths_()) {
        if (auto ec = openDevice_(path)) {
            spdlog::debug("Skipping {}: {}", path, ec.message());
        }
    }

    if (devices_.empty()) {
        spdlog::error("No readable keyboard or pointer device under {}",
                      config_.input_dir);
        return std::make_error_code(std::errc::no_such_device);
    }
    return {};
}

bool DeviceCapture::drain_(Device &device, std::vector<CapturedEvent> &out) {
    input_event ev{};
    while (true) {
        int rc = libevdev_next_event(device.dev.get(), LIBEVDEV_READ_FLAG_NORMAL,
                                     &ev);
        if (rc == LIBEVDEV_READ_STATUS_SUCCESS) {
            device.translator.Translate(ev.type, ev.code, ev.value,
                                        eventTimeNs(ev), out);
            continue;
        }

        if (rc == LIBEVDEV_READ_STATUS_SYNC) {
            spdlog::warn("{} dropped events, resynchronizing", device.path);
            while (rc == LIBEVDEV_READ_STATUS_SYNC) {
                device.translator.Translate(ev.type, ev.code, ev.value,
                                            eventTimeNs(ev), out);
                rc = libevdev_next_event(device.dev.get(),
                                         LIBEVDEV_READ_FLAG_SYNC, &ev);
            }
            if (rc == -EAGAIN)
                continue;
        }

        if (rc == -EAGAIN)
            return true;

        if (rc == -ENODEV) {
            spdlog::warn("Input device {} removed", device.path);
        } else {
            spdlog::warn("Reading {} failed: {}", device.path,
                         std::error_code(-rc, std::generic_category()).message());
        }
        return false;
    }
}

std::error_code DeviceCapture::Capture(std::vector<CapturedEvent> &out) {
    if (devices_.empty())
        return Errc::host_source_lost;

    std::vector<pollfd> fds;
    fds.reserve(devices_.size());
    for (const auto &device : devices_)
        fds.push_back(pollfd{libevdev_get_fd(device.dev.get()), POLLIN, 0});

    if (::poll(fds.data(), fds.size(), -1) < 0) {
        // Interrupted polls hand control back so the loop can see a stop
        if (errno == EINTR)
            return {};
        return std::error_code(errno, std::generic_category());
    }

    std::vector<CapturedEvent> batch;
    std::vector<bool> lost(devices_.size(), false);
    for (size_t i = 0; i < devices_.size(); ++i) {
        const bool hangup = fds[i].revents & (POLLERR | POLLHUP | POLLNVAL);
        if (!hangup && !(fds[i].revents & POLLIN))
            continue;

        // A hung up device may still have queued events to deliver
        const bool alive =
            !(fds[i].revents & POLLNVAL) && drain_(devices_[i], batch);
        if (alive && hangup)
            spdlog::warn("Input device {} hung up", devices_[i].path);
        lost[i] = !alive || hangup;
    }

    // Devices are drained one after another; restore the order across them
    OrderByTime(batch);
    out.insert(out.end(), std::make_move_iterator(batch.begin()),
               std::make_move_iterator(batch.end()));

    for (size_t i = devices_.size(); i-- > 0;) {
        if (lost[i])
            devices_.erase(devices_.begin() + static_cast<std::ptrdiff_t>(i));
    }

    if (devices_.empty()) {
        spdlog::warn("No input devices left");
        return Errc::host_source_lost;
    }
    return {};
}

void DeviceCapture::Close() { devices_.clear(); }

} // namespace sightline_rt::producers
