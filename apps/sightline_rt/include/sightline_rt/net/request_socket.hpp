#pragma once

#include "detail/socket_base.hpp"
#include <string>
#include <system_error>

namespace sightline_rt::net {

// Client-side socket for REQ (request) pattern
// Sends requests and receives replies
class RequestSocket {
public:
    RequestSocket();

    // Initialize REQ socket with the same timeout for send and receive
    std::error_code Init(int timeout_ms);

    // Start dialing the server. Does not wait for the server to be up.
    std::error_code Connect(const std::string& address);

    // Send a request and receive a reply
    std::error_code Request(const std::string& request,
                           std::string& reply);

    void Shutdown();

    ~RequestSocket();

private:
    detail::SocketBase base_;
};

} // namespace sightline_rt::net
