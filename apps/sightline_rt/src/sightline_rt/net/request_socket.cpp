#include "sightline_rt/net/request_socket.hpp"

namespace sightline_rt::net {

RequestSocket::RequestSocket() = default;

std::error_code RequestSocket::Init(int timeout_ms) {
    auto ec = base_.Init(detail::SocketType::REQ);
    if (ec) return ec;

    ec = base_.SetDurationOption(NNG_OPT_SENDTIMEO, timeout_ms);
    if (ec) return ec;

    return base_.SetDurationOption(NNG_OPT_RECVTIMEO, timeout_ms);
}

std::error_code RequestSocket::Connect(const std::string& address) {
    return base_.Connect(address, NNG_FLAG_NONBLOCK);
}

std::error_code RequestSocket::Request(const std::string& request,
                                       std::string& reply) {
    auto ec = base_.Send(request);
    if (ec) {
        return ec;
    }

    return base_.Receive(reply);
}

void RequestSocket::Shutdown() {
    base_.Close();
}

RequestSocket::~RequestSocket() = default;

} // namespace sightline_rt::net
