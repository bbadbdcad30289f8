/*
 * Signaling Connection
 *
 * Socket handle as seen by the relay logic. The production
 * implementation wraps an rtc::WebSocket; tests use an in-memory fake.
 */

#ifndef SIGNALING_CONNECTION_H
#define SIGNALING_CONNECTION_H

#include <memory>
#include <string>

namespace signaling {

class Connection {
public:
    virtual ~Connection() = default;

    // Send one text frame. Returns false if the socket is not open.
    virtual bool send(const std::string& text) = 0;

    // Close the socket. The close callback still runs afterwards.
    virtual void close(int code, const std::string& reason) = 0;

    virtual std::string remote_ip() const = 0;
};

using ConnectionPtr = std::shared_ptr<Connection>;

// Application close codes
constexpr int CLOSE_ADMIN_DISCONNECT = 4001;
constexpr int CLOSE_SESSION_TIMEOUT = 4002;
constexpr int CLOSE_IP_BLOCKED = 4003;
constexpr int CLOSE_EVICTED = 4004;

} // namespace signaling

#endif // SIGNALING_CONNECTION_H
