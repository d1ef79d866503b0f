#pragma once

#include "detail/socket_base.hpp"
#include <string>
#include <system_error>

namespace sightline_rt::net {

// Server-side socket for REP (reply) pattern
// Receives requests and sends replies
class ReplySocket {
public:
    ReplySocket();

    // Initialize REP socket. Receive gives up after receive_timeout_ms.
    std::error_code Init(int receive_timeout_ms = 100);

    // Bind to address and listen for connections
    std::error_code Bind(const std::string& address);

    // Receive a request
    std::error_code Receive(std::string& data);

    // Send a reply to the request
    std::error_code Send(const std::string& data);

    void Shutdown();

    ~ReplySocket();

private:
    detail::SocketBase base_;
};

} // namespace sightline_rt::net
