/*
 * WebSocket Listener
 *
 * libdatachannel WebSocketServer front end for SignalingServer.
 * Each accepted socket gets a client ID and an rtc::WebSocket backed
 * signaling::Connection; open/message/close callbacks (delivered on
 * libdatachannel threads) are forwarded to the server.
 */

#ifndef WEBSOCKET_LISTENER_H
#define WEBSOCKET_LISTENER_H

#include "signaling_server.h"
#include <rtc/rtc.hpp>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace signaling {

class WebSocketListener {
public:
    explicit WebSocketListener(SignalingServer& server);
    ~WebSocketListener();

    bool start(int port);
    void stop();

    size_t connection_count() const;

private:
    void on_client(std::shared_ptr<rtc::WebSocket> ws);

    SignalingServer& server_;
    std::unique_ptr<rtc::WebSocketServer> ws_server_;

    // Keep sockets alive until their close callback
    mutable std::mutex connections_mutex_;
    std::map<std::string, std::shared_ptr<rtc::WebSocket>> connections_;
};

// "1.2.3.4:5678" -> "1.2.3.4"
std::string strip_port(const std::string& address);

} // namespace signaling

#endif // WEBSOCKET_LISTENER_H
