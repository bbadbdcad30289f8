/*
 * Signaling Socket Implementation (libdatachannel)
 */

#include "signaling_socket.h"
#include "../../common/utils/debug_flags.h"
#include <rtc/rtc.hpp>
#include <cstdio>

namespace session {

struct RtcSignalingSocket::Impl {
    std::shared_ptr<rtc::WebSocket> ws;
};

RtcSignalingSocket::RtcSignalingSocket()
    : impl_(new Impl)
{}

RtcSignalingSocket::~RtcSignalingSocket() {
    close();
}

void RtcSignalingSocket::open(const std::string& url, const SocketCallbacks& callbacks) {
    close();

    auto ws = std::make_shared<rtc::WebSocket>();

    ws->onOpen([cb = callbacks.on_open]() {
        if (cb) cb();
    });

    ws->onMessage([cb = callbacks.on_message](auto data) {
        if (std::holds_alternative<std::string>(data)) {
            if (cb) cb(std::get<std::string>(data));
        } else if (g_debug_connection) {
            fprintf(stderr, "Client: Ignoring binary frame from server\n");
        }
    });

    ws->onClosed([cb = callbacks.on_closed]() {
        if (cb) cb();
    });

    ws->onError([cb = callbacks.on_error](std::string error) {
        if (cb) cb(error);
    });

    impl_->ws = ws;
    try {
        ws->open(url);
    } catch (const std::exception& e) {
        fprintf(stderr, "Client: Failed to open %s: %s\n", url.c_str(), e.what());
        if (callbacks.on_error) callbacks.on_error(e.what());
        if (callbacks.on_closed) callbacks.on_closed();
    }
}

bool RtcSignalingSocket::send(const std::string& text) {
    auto ws = impl_->ws;
    if (!ws || !ws->isOpen()) {
        return false;
    }
    try {
        return ws->send(text);
    } catch (const std::exception& e) {
        fprintf(stderr, "Client: WebSocket send failed: %s\n", e.what());
        return false;
    }
}

void RtcSignalingSocket::close() {
    auto ws = std::move(impl_->ws);
    if (!ws) return;

    ws->resetCallbacks();
    try {
        ws->close();
    } catch (const std::exception& e) {
        fprintf(stderr, "Client: WebSocket close failed: %s\n", e.what());
    }
}

SocketFactory rtc_socket_factory() {
    return []() { return std::make_shared<RtcSignalingSocket>(); };
}

} // namespace session
