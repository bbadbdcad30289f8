/*
 * Signaling and Relay Server
 *
 * Admits sockets, registers peers under connection IDs, brokers
 * password-gated sessions between a viewer and a host, and forwards
 * signaling and payload messages between linked partners.
 *
 * This class is transport-agnostic: the WebSocket listener feeds it
 * open/message/close events for signaling::Connection handles. Every
 * handler catches its own errors; a bad message from one socket never
 * affects another.
 */

#ifndef SIGNALING_SERVER_H
#define SIGNALING_SERVER_H

#include "access_log.h"
#include "connection.h"
#include "lockout_policy.h"
#include "registry.h"
#include "../../common/protocol/messages.h"
#include "../../common/utils/scheduler.h"
#include <chrono>
#include <cstdint>
#include <string>

namespace signaling {

struct ServerOptions {
    int64_t session_timeout_ms = 30 * 60 * 1000;
    int64_t sweep_interval_ms = 60 * 1000;
    int max_failed_attempts = 5;
    int64_t lockout_window_ms = 15 * 60 * 1000;
    int pbkdf2_iterations = 100000;
};

// Close reasons sent with the socket close
extern const char* const REASON_SESSION_TIMEOUT;
extern const char* const REASON_ADMIN_DISCONNECT;

class SignalingServer {
public:
    SignalingServer(const ServerOptions& options, scheduler::Scheduler& scheduler);
    ~SignalingServer();

    SignalingServer(const SignalingServer&) = delete;
    SignalingServer& operator=(const SignalingServer&) = delete;

    // Start/stop the periodic idle-timeout sweep
    void start();
    void stop();

    /**
     * New socket. Rejected (closed, logged) if its IP is blocked or
     * locked out.
     * @return false if the socket was rejected
     */
    bool on_open(const std::string& client_id, ConnectionPtr connection);

    void on_message(const std::string& client_id, const std::string& text);

    void on_close(const std::string& client_id);

    // Close sockets idle past the session timeout
    void sweep();

    /**
     * Administrative disconnect
     * @return false if no peer holds the connection ID
     */
    bool disconnect_peer(const std::string& connection_id);

    Registry& registry() { return registry_; }
    LockoutPolicy& lockout() { return lockout_; }
    AccessLog& access_log() { return access_log_; }

private:
    struct Dispatcher;
    friend struct Dispatcher;

    void handle_register(const PeerSession& peer, const protocol::Register& msg);
    void handle_connect(const PeerSession& peer, const protocol::Connect& msg);
    void handle_disconnect(const PeerSession& peer);
    void handle_relay(const PeerSession& peer, const protocol::Relay& msg);
    void forward(const PeerSession& peer, const std::string& text, const char* type);

    // Unlink, notify the partner, release the socket, then close it
    void drop_client(const std::string& client_id, int code, const char* reason);

    void notify_partner_disconnected(const PeerSession& partner);
    void send_to(const PeerSession& peer, const protocol::Message& msg);
    void send_connect_error(const PeerSession& peer, const std::string& error);

    ServerOptions options_;
    scheduler::Scheduler& scheduler_;
    Registry registry_;
    LockoutPolicy lockout_;
    AccessLog access_log_;
    scheduler::TimerId sweep_timer_;
};

} // namespace signaling

#endif // SIGNALING_SERVER_H
