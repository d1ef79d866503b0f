#pragma once

#include <cstddef>
#include <nng/nng.h>
#include <string>
#include <system_error>

namespace sightline_rt::net::detail {

enum class SocketType {
    REP, // Compositor side of REQ/REP
    REQ, // Router side of REQ/REP
};

// Owns an nng_msg until it is handed to nng_sendmsg
class MessagePtr {
public:
    explicit MessagePtr(nng_msg* msg = nullptr) : msg_(msg) {}

    ~MessagePtr() { reset(); }

    MessagePtr(const MessagePtr&) = delete;
    MessagePtr& operator=(const MessagePtr&) = delete;

    MessagePtr(MessagePtr&& other) noexcept : msg_(other.release()) {}
    MessagePtr& operator=(MessagePtr&& other) noexcept {
        reset(other.release());
        return *this;
    }

    nng_msg* get() const { return msg_; }

    nng_msg* release() {
        auto ptr = msg_;
        msg_ = nullptr;
        return ptr;
    }

    void reset(nng_msg* msg = nullptr) {
        if (msg_) {
            nng_msg_free(msg_);
        }
        msg_ = msg;
    }

private:
    nng_msg* msg_ = nullptr;
};

class SocketBase {
public:
    SocketBase();
    ~SocketBase();

    SocketBase(const SocketBase&) = delete;
    SocketBase& operator=(const SocketBase&) = delete;
    SocketBase(SocketBase&&) = delete;
    SocketBase& operator=(SocketBase&&) = delete;

    std::error_code Init(SocketType type);

    std::error_code Bind(const std::string& address);

    // With NNG_FLAG_NONBLOCK the dialer keeps retrying in the background and
    // requests fail with a timeout until the peer shows up.
    std::error_code Connect(const std::string& address, int flags = 0);

    std::error_code Send(const std::string& data);

    std::error_code Receive(std::string& data);

    void Close();

    bool IsOpen() const;

    // Timeouts (NNG_OPT_RECVTIMEO, NNG_OPT_SENDTIMEO) in milliseconds
    std::error_code SetDurationOption(const char* name, int milliseconds);

private:
    nng_socket socket_ = NNG_SOCKET_INITIALIZER;
    nng_listener listener_ = NNG_LISTENER_INITIALIZER;
    nng_dialer dialer_ = NNG_DIALER_INITIALIZER;
    bool is_open_ = false;
};

class nng_error_category : public std::error_category {
public:
    const char* name() const noexcept override {
        return "nng";
    }

    std::string message(int ev) const override {
        return nng_strerror(ev);
    }
};

inline const std::error_category& nng_category() {
    static nng_error_category instance;
    return instance;
}

inline std::error_code make_error_code(int nng_errno) {
    return std::error_code(nng_errno, nng_category());
}

} // namespace sightline_rt::net::detail
