/*
 * Connection State Machine
 *
 * Owns the signaling socket of a host or viewer and drives
 *
 *   disconnected -> connecting -> connected -> authenticating -> session-active
 *
 * with error as a non-terminal side state after a rejected connect.
 * An unexpected socket close triggers reconnects with linear backoff
 * (attempt x base delay) up to a maximum attempt count. An explicit
 * disconnect() never reconnects.
 *
 * Socket callbacks carry the generation of the socket they belong to;
 * callbacks from a torn-down socket are ignored.
 */

#ifndef CONNECTION_STATE_MACHINE_H
#define CONNECTION_STATE_MACHINE_H

#include "signaling_socket.h"
#include "../../common/protocol/messages.h"
#include "../../common/utils/scheduler.h"
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace session {

enum class ConnectionState {
    DISCONNECTED,
    CONNECTING,
    CONNECTED,
    AUTHENTICATING,
    SESSION_ACTIVE,
    ERROR
};

const char* state_name(ConnectionState state);

struct SessionOptions {
    std::string server_url = "ws://localhost:8080";
    std::string connection_id;
    std::string password;           // Host only
    bool is_host = false;
    std::string public_key;
    int max_reconnect_attempts = 5;
    int reconnect_delay_ms = 1000;
    int heartbeat_interval_ms = 30000;
};

class ConnectionStateMachine {
public:
    using ObserverId = uint64_t;
    using StateObserver = std::function<void(ConnectionState state, const std::string& detail)>;
    using MessageObserver = std::function<void(const protocol::Message& msg)>;

    ConnectionStateMachine(scheduler::Scheduler& scheduler, SocketFactory factory);
    ~ConnectionStateMachine();

    ConnectionStateMachine(const ConnectionStateMachine&) = delete;
    ConnectionStateMachine& operator=(const ConnectionStateMachine&) = delete;

    /**
     * Open the signaling socket and register. Ignored unless disconnected.
     */
    void connect(const SessionOptions& options);

    /**
     * Viewer: ask the server for a session with a host.
     * Allowed from connected or error.
     * @return false if the request was not sent
     */
    bool connect_to_host(const std::string& target_id, const std::string& password);

    // Leave the session but keep the server link (sends disconnect)
    void end_session();

    // Send disconnect, tear down the socket, no reconnect
    void disconnect();

    // Non-blocking best effort. False if the socket is not open.
    bool send(const protocol::Message& msg);

    ConnectionState state() const;
    bool is_host() const;
    std::string session_id() const;
    std::string partner_id() const;
    std::string partner_public_key() const;
    int reconnect_attempts() const;

    ObserverId add_state_observer(StateObserver observer);
    void remove_state_observer(ObserverId id);
    ObserverId add_message_observer(MessageObserver observer);
    void remove_message_observer(ObserverId id);

private:
    void open_socket();
    void handle_open(uint64_t generation);
    void handle_message(uint64_t generation, const std::string& text);
    void handle_closed(uint64_t generation);
    void apply(const protocol::Message& msg);

    void set_state(ConnectionState state, const std::string& detail = "");
    void notify_state(ConnectionState state, const std::string& detail);

    scheduler::Scheduler& scheduler_;
    SocketFactory factory_;

    mutable std::mutex mutex_;
    SessionOptions options_;
    ConnectionState state_;
    std::shared_ptr<SignalingSocket> socket_;
    bool socket_open_;
    uint64_t generation_;
    bool explicit_disconnect_;
    int reconnect_attempts_;
    scheduler::TimerId reconnect_timer_;
    scheduler::TimerId heartbeat_timer_;

    std::string session_id_;
    std::string partner_id_;
    std::string partner_public_key_;

    std::mutex observers_mutex_;
    ObserverId next_observer_id_;
    std::map<ObserverId, StateObserver> state_observers_;
    std::map<ObserverId, MessageObserver> message_observers_;
};

} // namespace session

#endif // CONNECTION_STATE_MACHINE_H
