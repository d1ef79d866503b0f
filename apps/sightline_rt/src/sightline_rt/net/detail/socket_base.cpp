#include "sightline_rt/net/detail/socket_base.hpp"
#include <nng/nng.h>
#include <nng/protocol/reqrep0/rep.h>
#include <nng/protocol/reqrep0/req.h>
#include <spdlog/spdlog.h>

namespace sightline_rt::net::detail {

SocketBase::SocketBase() = default;

SocketBase::~SocketBase() { Close(); }

std::error_code SocketBase::Init(SocketType type) {
    int ret = 0;

    switch (type) {
    case SocketType::REP:
        ret = nng_rep0_open(&socket_);
        break;
    case SocketType::REQ:
        ret = nng_req0_open(&socket_);
        break;
    }

    if (ret != 0) {
        spdlog::error("Failed to open socket: {}", nng_strerror(ret));
        return make_error_code(ret);
    }

    is_open_ = true;
    return {};
}

std::error_code SocketBase::Bind(const std::string &address) {
    if (!is_open_) {
        return make_error_code(NNG_ECLOSED);
    }

    int ret = nng_listen(socket_, address.c_str(), &listener_, 0);
    if (ret != 0) {
        return make_error_code(ret);
    }

    return {};
}

std::error_code SocketBase::Connect(const std::string &address, int flags) {
    if (!is_open_) {
        return make_error_code(NNG_ECLOSED);
    }

    int ret = nng_dial(socket_, address.c_str(), &dialer_, flags);
    if (ret != 0) {
        return make_error_code(ret);
    }

    return {};
}

std::error_code SocketBase::Send(const std::string &data) {
    if (!is_open_) {
        return make_error_code(NNG_ECLOSED);
    }

    nng_msg *raw = nullptr;
    int ret = nng_msg_alloc(&raw, 0);
    if (ret != 0) {
        return make_error_code(ret);
    }
    MessagePtr msg(raw);

    ret = nng_msg_append(msg.get(), static_cast<const void *>(data.data()),
                         data.size());
    if (ret != 0) {
        return make_error_code(ret);
    }

    // nng_sendmsg only takes ownership on success
    ret = nng_sendmsg(socket_, msg.get(), 0);
    if (ret != 0) {
        return make_error_code(ret);
    }
    msg.release();

    return {};
}

std::error_code SocketBase::Receive(std::string &data) {
    if (!is_open_) {
        return make_error_code(NNG_ECLOSED);
    }

    nng_msg *raw = nullptr;
    int ret = nng_recvmsg(socket_, &raw, 0);
    if (ret != 0) {
        return make_error_code(ret);
    }
    MessagePtr msg(raw);

    auto len = nng_msg_len(msg.get());
    auto beg = reinterpret_cast<char *>(nng_msg_body(msg.get()));
    data.assign(beg, beg + len);

    return {};
}

void SocketBase::Close() {
    if (listener_.id != 0) {
        nng_listener_close(listener_);
        listener_ = NNG_LISTENER_INITIALIZER;
    }

    if (dialer_.id != 0) {
        nng_dialer_close(dialer_);
        dialer_ = NNG_DIALER_INITIALIZER;
    }

    if (is_open_) {
        nng_close(socket_);
        socket_ = NNG_SOCKET_INITIALIZER;
        is_open_ = false;
    }
}

bool SocketBase::IsOpen() const { return is_open_; }

std::error_code SocketBase::SetDurationOption(const char *name,
                                              int milliseconds) {
    if (!is_open_) {
        return make_error_code(NNG_ECLOSED);
    }

    int ret = nng_socket_set_ms(socket_, name, milliseconds);
    if (ret != 0) {
        return make_error_code(ret);
    }

    return {};
}

} // namespace sightline_rt::net::detail
