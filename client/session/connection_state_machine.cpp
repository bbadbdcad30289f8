/*
 * Connection State Machine Implementation
 */

#include "connection_state_machine.h"
#include "../../common/utils/debug_flags.h"
#include <chrono>
#include <cstdio>
#include <vector>

namespace session {

const char* state_name(ConnectionState state) {
    switch (state) {
        case ConnectionState::DISCONNECTED:   return "disconnected";
        case ConnectionState::CONNECTING:     return "connecting";
        case ConnectionState::CONNECTED:      return "connected";
        case ConnectionState::AUTHENTICATING: return "authenticating";
        case ConnectionState::SESSION_ACTIVE: return "session-active";
        case ConnectionState::ERROR:          return "error";
    }
    return "unknown";
}

ConnectionStateMachine::ConnectionStateMachine(scheduler::Scheduler& scheduler, SocketFactory factory)
    : scheduler_(scheduler)
    , factory_(std::move(factory))
    , state_(ConnectionState::DISCONNECTED)
    , socket_open_(false)
    , generation_(0)
    , explicit_disconnect_(false)
    , reconnect_attempts_(0)
    , reconnect_timer_(scheduler::INVALID_TIMER)
    , heartbeat_timer_(scheduler::INVALID_TIMER)
    , next_observer_id_(1)
{}

ConnectionStateMachine::~ConnectionStateMachine() {
    disconnect();
}

void ConnectionStateMachine::connect(const SessionOptions& options) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != ConnectionState::DISCONNECTED) {
            fprintf(stderr, "Client: connect() ignored in state %s\n", state_name(state_));
            return;
        }
        options_ = options;
        explicit_disconnect_ = false;
        reconnect_attempts_ = 0;
    }

    set_state(ConnectionState::CONNECTING);
    open_socket();
}

void ConnectionStateMachine::open_socket() {
    std::shared_ptr<SignalingSocket> sock;
    uint64_t gen;
    std::string url;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        reconnect_timer_ = scheduler::INVALID_TIMER;
        if (explicit_disconnect_) {
            return;
        }
        gen = ++generation_;
        sock = factory_();
        socket_ = sock;
        socket_open_ = false;
        url = options_.server_url;
    }

    if (g_debug_connection) {
        fprintf(stderr, "Client: Connecting to %s\n", url.c_str());
    }

    SocketCallbacks callbacks;
    callbacks.on_open = [this, gen]() { handle_open(gen); };
    callbacks.on_message = [this, gen](const std::string& text) { handle_message(gen, text); };
    callbacks.on_closed = [this, gen]() { handle_closed(gen); };
    callbacks.on_error = [](const std::string& error) {
        fprintf(stderr, "Client: WebSocket error: %s\n", error.c_str());
    };
    sock->open(url, callbacks);
}

void ConnectionStateMachine::handle_open(uint64_t generation) {
    std::shared_ptr<SignalingSocket> sock;
    protocol::Register reg;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (generation != generation_ || !socket_) {
            return;
        }
        socket_open_ = true;
        reconnect_attempts_ = 0;
        sock = socket_;

        heartbeat_timer_ = scheduler_.schedule_every(
            std::chrono::milliseconds(options_.heartbeat_interval_ms),
            [this, generation]() {
                std::shared_ptr<SignalingSocket> s;
                {
                    std::lock_guard<std::mutex> l(mutex_);
                    if (generation != generation_ || !socket_open_) return;
                    s = socket_;
                }
                s->send(protocol::encode(protocol::Ping{}));
            });

        reg.connection_id = options_.connection_id;
        reg.password = options_.password;
        reg.is_host = options_.is_host;
        reg.public_key = options_.public_key;
    }

    if (g_debug_connection) {
        fprintf(stderr, "Client: Socket open, registering %s\n", reg.connection_id.c_str());
    }
    if (!sock->send(protocol::encode(reg))) {
        fprintf(stderr, "Client: Failed to send register\n");
    }
}

void ConnectionStateMachine::handle_message(uint64_t generation, const std::string& text) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (generation != generation_) {
            return;
        }
    }

    protocol::Message msg;
    std::string error;
    if (!protocol::decode(text, msg, error)) {
        fprintf(stderr, "Client: Ignoring message: %s\n", error.c_str());
        return;
    }

    apply(msg);

    std::vector<MessageObserver> observers;
    {
        std::lock_guard<std::mutex> lock(observers_mutex_);
        for (const auto& entry : message_observers_) {
            observers.push_back(entry.second);
        }
    }
    for (const auto& observer : observers) {
        observer(msg);
    }
}

void ConnectionStateMachine::apply(const protocol::Message& msg) {
    std::visit(protocol::overloaded{
        [this](const protocol::Registered& m) {
            if (state() == ConnectionState::CONNECTING) {
                fprintf(stderr, "Client: Registered as %s\n", m.connection_id.c_str());
                set_state(ConnectionState::CONNECTED);
            }
        },
        [this](const protocol::ConnectSuccess& m) {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                session_id_ = m.session_id;
                partner_id_ = m.target_connection_id;
                partner_public_key_ = m.target_public_key;
            }
            set_state(ConnectionState::SESSION_ACTIVE, m.target_connection_id);
        },
        [this](const protocol::ConnectError& m) {
            set_state(ConnectionState::ERROR, m.error);
        },
        [this](const protocol::IncomingConnection& m) {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                session_id_ = m.session_id;
                partner_id_ = m.from_connection_id;
                partner_public_key_ = m.from_public_key;
            }
            set_state(ConnectionState::SESSION_ACTIVE, m.from_connection_id);
        },
        [this](const protocol::Disconnected& m) {
            if (m.reason == protocol::REASON_REGISTERED_ELSEWHERE) {
                // Another client took our ID; reconnecting would evict it in turn
                fprintf(stderr, "Client: %s\n", m.reason.c_str());
                disconnect();
                return;
            }
            {
                std::lock_guard<std::mutex> lock(mutex_);
                session_id_.clear();
                partner_id_.clear();
                partner_public_key_.clear();
            }
            if (state() == ConnectionState::SESSION_ACTIVE) {
                set_state(ConnectionState::CONNECTED, m.reason);
            }
        },
        [](const auto&) {},
    }, msg);
}

void ConnectionStateMachine::handle_closed(uint64_t generation) {
    std::shared_ptr<SignalingSocket> old_socket;
    scheduler::TimerId heartbeat;
    int attempt = 0;
    int max_attempts = 0;
    int delay_ms = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (generation != generation_) {
            return;
        }
        ++generation_;
        old_socket = std::move(socket_);
        socket_open_ = false;
        heartbeat = heartbeat_timer_;
        heartbeat_timer_ = scheduler::INVALID_TIMER;
        session_id_.clear();
        partner_id_.clear();
        partner_public_key_.clear();

        if (explicit_disconnect_) {
            return;
        }

        max_attempts = options_.max_reconnect_attempts;
        if (reconnect_attempts_ < max_attempts) {
            attempt = ++reconnect_attempts_;
            delay_ms = attempt * options_.reconnect_delay_ms;
            reconnect_timer_ = scheduler_.schedule_after(
                std::chrono::milliseconds(delay_ms), [this]() { open_socket(); });
        }
    }

    scheduler_.cancel(heartbeat);

    if (attempt > 0) {
        fprintf(stderr, "Client: Connection lost, reconnecting in %d ms (%d/%d)\n",
                delay_ms, attempt, max_attempts);
        set_state(ConnectionState::CONNECTING, "Reconnecting");
    } else {
        fprintf(stderr, "Client: Connection lost, giving up after %d attempts\n", max_attempts);
        set_state(ConnectionState::DISCONNECTED, "Reconnect failed");
    }
}

bool ConnectionStateMachine::connect_to_host(const std::string& target_id, const std::string& password) {
    ConnectionState current = state();
    if (current != ConnectionState::CONNECTED && current != ConnectionState::ERROR) {
        fprintf(stderr, "Client: Cannot connect to host in state %s\n", state_name(current));
        return false;
    }

    set_state(ConnectionState::AUTHENTICATING, target_id);

    protocol::Connect msg;
    msg.target_connection_id = target_id;
    msg.password = password;
    if (!send(msg)) {
        set_state(ConnectionState::ERROR, "Not connected to server");
        return false;
    }
    return true;
}

void ConnectionStateMachine::end_session() {
    if (state() != ConnectionState::SESSION_ACTIVE) {
        return;
    }
    send(protocol::Disconnect{});
    {
        std::lock_guard<std::mutex> lock(mutex_);
        session_id_.clear();
        partner_id_.clear();
        partner_public_key_.clear();
    }
    set_state(ConnectionState::CONNECTED, "Session ended");
}

void ConnectionStateMachine::disconnect() {
    std::shared_ptr<SignalingSocket> sock;
    bool was_open;
    scheduler::TimerId heartbeat;
    scheduler::TimerId reconnect;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        explicit_disconnect_ = true;
        if (state_ == ConnectionState::DISCONNECTED && !socket_ &&
            reconnect_timer_ == scheduler::INVALID_TIMER) {
            return;
        }
        ++generation_;
        sock = std::move(socket_);
        was_open = socket_open_;
        socket_open_ = false;
        heartbeat = heartbeat_timer_;
        reconnect = reconnect_timer_;
        heartbeat_timer_ = scheduler::INVALID_TIMER;
        reconnect_timer_ = scheduler::INVALID_TIMER;
        session_id_.clear();
        partner_id_.clear();
        partner_public_key_.clear();
    }

    // Timers are cancelled before the socket goes away
    scheduler_.cancel(heartbeat);
    scheduler_.cancel(reconnect);

    if (sock) {
        if (was_open) {
            sock->send(protocol::encode(protocol::Disconnect{}));
        }
        sock->close();
    }

    set_state(ConnectionState::DISCONNECTED);
}

bool ConnectionStateMachine::send(const protocol::Message& msg) {
    std::shared_ptr<SignalingSocket> sock;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!socket_open_) {
            return false;
        }
        sock = socket_;
    }
    return sock->send(protocol::encode(msg));
}

ConnectionState ConnectionStateMachine::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

bool ConnectionStateMachine::is_host() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return options_.is_host;
}

std::string ConnectionStateMachine::session_id() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return session_id_;
}

std::string ConnectionStateMachine::partner_id() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return partner_id_;
}

std::string ConnectionStateMachine::partner_public_key() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return partner_public_key_;
}

int ConnectionStateMachine::reconnect_attempts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return reconnect_attempts_;
}

ConnectionStateMachine::ObserverId ConnectionStateMachine::add_state_observer(StateObserver observer) {
    std::lock_guard<std::mutex> lock(observers_mutex_);
    ObserverId id = next_observer_id_++;
    state_observers_[id] = std::move(observer);
    return id;
}

void ConnectionStateMachine::remove_state_observer(ObserverId id) {
    std::lock_guard<std::mutex> lock(observers_mutex_);
    state_observers_.erase(id);
}

ConnectionStateMachine::ObserverId ConnectionStateMachine::add_message_observer(MessageObserver observer) {
    std::lock_guard<std::mutex> lock(observers_mutex_);
    ObserverId id = next_observer_id_++;
    message_observers_[id] = std::move(observer);
    return id;
}

void ConnectionStateMachine::remove_message_observer(ObserverId id) {
    std::lock_guard<std::mutex> lock(observers_mutex_);
    message_observers_.erase(id);
}

void ConnectionStateMachine::set_state(ConnectionState state, const std::string& detail) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == state && detail.empty()) {
            return;
        }
        state_ = state;
    }

    if (g_debug_connection) {
        fprintf(stderr, "Client: State -> %s%s%s\n", state_name(state),
                detail.empty() ? "" : ": ", detail.c_str());
    }
    notify_state(state, detail);
}

void ConnectionStateMachine::notify_state(ConnectionState state, const std::string& detail) {
    std::vector<StateObserver> observers;
    {
        std::lock_guard<std::mutex> lock(observers_mutex_);
        for (const auto& entry : state_observers_) {
            observers.push_back(entry.second);
        }
    }
    for (const auto& observer : observers) {
        observer(state, detail);
    }
}

} // namespace session
