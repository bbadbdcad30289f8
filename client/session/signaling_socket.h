/*
 * Signaling Socket
 *
 * Client side of the WebSocket to the relay server. The state machine
 * only sees this interface; RtcSignalingSocket implements it with
 * rtc::WebSocket and tests substitute an in-memory socket.
 */

#ifndef SIGNALING_SOCKET_H
#define SIGNALING_SOCKET_H

#include <functional>
#include <memory>
#include <string>

namespace session {

struct SocketCallbacks {
    std::function<void()> on_open;
    std::function<void(const std::string&)> on_message;
    std::function<void()> on_closed;
    std::function<void(const std::string&)> on_error;
};

class SignalingSocket {
public:
    virtual ~SignalingSocket() = default;

    // Start connecting. Callbacks may fire on another thread.
    virtual void open(const std::string& url, const SocketCallbacks& callbacks) = 0;

    // Returns false if the socket is not open
    virtual bool send(const std::string& text) = 0;

    virtual void close() = 0;
};

using SocketFactory = std::function<std::shared_ptr<SignalingSocket>()>;

/**
 * rtc::WebSocket implementation
 */
class RtcSignalingSocket : public SignalingSocket {
public:
    RtcSignalingSocket();
    ~RtcSignalingSocket() override;

    void open(const std::string& url, const SocketCallbacks& callbacks) override;
    bool send(const std::string& text) override;
    void close() override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

SocketFactory rtc_socket_factory();

} // namespace session

#endif // SIGNALING_SOCKET_H
