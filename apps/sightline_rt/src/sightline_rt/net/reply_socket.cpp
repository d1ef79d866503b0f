#include "sightline_rt/net/reply_socket.hpp"
#include <string>
#include <system_error>

namespace sightline_rt::net {

ReplySocket::ReplySocket() = default;

std::error_code ReplySocket::Init(int receive_timeout_ms) {
    auto ec = base_.Init(detail::SocketType::REP);
    if (ec) return ec;

    return base_.SetDurationOption(NNG_OPT_RECVTIMEO, receive_timeout_ms);
}

std::error_code ReplySocket::Bind(const std::string& address) {
    return base_.Bind(address);
}

std::error_code ReplySocket::Receive(std::string& data) {
    return base_.Receive(data);
}

std::error_code ReplySocket::Send(const std::string& data) {
    return base_.Send(data);
}

void ReplySocket::Shutdown() {
    base_.Close();
}

ReplySocket::~ReplySocket() = default;

} // namespace sightline_rt::net
