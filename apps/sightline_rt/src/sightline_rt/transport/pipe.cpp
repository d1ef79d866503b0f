#include "sightline_rt/transport/pipe.hpp"
#include "sightline/core/error.hpp"
#include "sightline_rt/threading/signals.hpp"
#include <cerrno>
#include <spdlog/spdlog.h>
#include <unistd.h>
#include <utility>

namespace sightline_rt::transport {

PipeReader::PipeReader(int fd) : fd_(fd) {}

PipeReader::~PipeReader() { Close(); }

PipeReader::PipeReader(PipeReader &&other) noexcept
    : fd_(std::exchange(other.fd_, -1)) {}

PipeReader &PipeReader::operator=(PipeReader &&other) noexcept {
    if (this != &other) {
        Close();
        fd_ = std::exchange(other.fd_, -1);
    }
    return *this;
}

std::error_code PipeReader::Read(std::string &data) {
    if (fd_ < 0) {
        return std::make_error_code(std::errc::bad_file_descriptor);
    }

    while (true) {
        ssize_t n = ::read(fd_, chunk_.data(), chunk_.size());
        if (n > 0) {
            data.append(chunk_.data(), static_cast<size_t>(n));
            return {};
        }
        if (n == 0) {
            return sightline::core::Errc::end_of_stream;
        }
        if (errno == EINTR) {
            if (threading::signals::StopRequested())
                return std::make_error_code(std::errc::interrupted);
            continue;
        }
        return std::error_code(errno, std::generic_category());
    }
}

bool PipeReader::IsTerminal() const { return fd_ >= 0 && ::isatty(fd_) == 1; }

void PipeReader::Close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

PipeWriter::PipeWriter(int fd) : fd_(fd) {}

PipeWriter::~PipeWriter() { Close(); }

PipeWriter::PipeWriter(PipeWriter &&other) noexcept
    : fd_(std::exchange(other.fd_, -1)) {}

PipeWriter &PipeWriter::operator=(PipeWriter &&other) noexcept {
    if (this != &other) {
        Close();
        fd_ = std::exchange(other.fd_, -1);
    }
    return *this;
}

std::error_code PipeWriter::Write(std::string_view data) {
    if (fd_ < 0) {
        return sightline::core::Errc::broken_pipe;
    }

    size_t written = 0;
    while (written < data.size()) {
        ssize_t n = ::write(fd_, data.data() + written, data.size() - written);
        if (n >= 0) {
            written += static_cast<size_t>(n);
            continue;
        }
        // A frame is always finished, even when a stop was requested
        if (errno == EINTR)
            continue;
        if (errno == EPIPE)
            return sightline::core::Errc::broken_pipe;
        return std::error_code(errno, std::generic_category());
    }
    return {};
}

bool PipeWriter::IsTerminal() const { return fd_ >= 0 && ::isatty(fd_) == 1; }

void PipeWriter::Close() {
    if (fd_ < 0)
        return;
    if (::close(fd_) != 0) {
        spdlog::warn("Failed to close output stream: {}",
                     std::error_code(errno, std::generic_category()).message());
    }
    fd_ = -1;
}

} // namespace sightline_rt::transport
