/*
 * Signaling and Relay Server Implementation
 */

#include "signaling_server.h"
#include "../../common/errors.h"
#include "../../common/utils/crypto_utils.h"
#include "../../common/utils/debug_flags.h"
#include <cstdio>
#include <exception>

namespace signaling {

const char* const REASON_SESSION_TIMEOUT = "Session timeout";
const char* const REASON_ADMIN_DISCONNECT = "Disconnected by admin";

/*
 * Per-message dispatch. One overload per message kind, so adding a
 * kind to protocol::Message without handling it here fails to compile.
 */
struct SignalingServer::Dispatcher {
    SignalingServer& server;
    const PeerSession& peer;
    const std::string& text;

    // Session control
    void operator()(const protocol::Register& m) { server.handle_register(peer, m); }
    void operator()(const protocol::Connect& m) { server.handle_connect(peer, m); }
    void operator()(const protocol::Disconnect&) { server.handle_disconnect(peer); }
    void operator()(const protocol::Ping&) { server.send_to(peer, protocol::Pong{}); }
    void operator()(const protocol::Relay& m) { server.handle_relay(peer, m); }

    // Forwarded verbatim to the partner
    void operator()(const protocol::Offer&) { forward(protocol::Offer::TYPE); }
    void operator()(const protocol::Answer&) { forward(protocol::Answer::TYPE); }
    void operator()(const protocol::IceCandidate&) { forward(protocol::IceCandidate::TYPE); }
    void operator()(const protocol::KeyExchange&) { forward(protocol::KeyExchange::TYPE); }
    void operator()(const protocol::ScreenFrame&) { forward(protocol::ScreenFrame::TYPE); }
    void operator()(const protocol::MouseEvent&) { forward(protocol::MouseEvent::TYPE); }
    void operator()(const protocol::KeyboardEvent&) { forward(protocol::KeyboardEvent::TYPE); }
    void operator()(const protocol::ClipboardSync&) { forward(protocol::ClipboardSync::TYPE); }
    void operator()(const protocol::FileStart&) { forward(protocol::FileStart::TYPE); }
    void operator()(const protocol::FileReady&) { forward(protocol::FileReady::TYPE); }
    void operator()(const protocol::FileChunk&) { forward(protocol::FileChunk::TYPE); }
    void operator()(const protocol::FileChunkAck&) { forward(protocol::FileChunkAck::TYPE); }
    void operator()(const protocol::FileChunkRetry&) { forward(protocol::FileChunkRetry::TYPE); }
    void operator()(const protocol::FileComplete&) { forward(protocol::FileComplete::TYPE); }
    void operator()(const protocol::FileCancel&) { forward(protocol::FileCancel::TYPE); }

    // Server-to-client kinds are not accepted from clients
    void operator()(const protocol::Registered&) { ignore(protocol::Registered::TYPE); }
    void operator()(const protocol::ConnectSuccess&) { ignore(protocol::ConnectSuccess::TYPE); }
    void operator()(const protocol::ConnectError&) { ignore(protocol::ConnectError::TYPE); }
    void operator()(const protocol::IncomingConnection&) { ignore(protocol::IncomingConnection::TYPE); }
    void operator()(const protocol::Disconnected&) { ignore(protocol::Disconnected::TYPE); }
    void operator()(const protocol::Pong&) {}
    void operator()(const protocol::Relayed&) { ignore(protocol::Relayed::TYPE); }

    void forward(const char* type) { server.forward(peer, text, type); }

    void ignore(const char* type) {
        if (g_debug_relay) {
            fprintf(stderr, "Relay: Ignoring '%s' from client %s\n", type, peer.client_id.c_str());
        }
    }
};

SignalingServer::SignalingServer(const ServerOptions& options, scheduler::Scheduler& scheduler)
    : options_(options)
    , scheduler_(scheduler)
    , lockout_(options.max_failed_attempts, options.lockout_window_ms)
    , sweep_timer_(scheduler::INVALID_TIMER)
{}

SignalingServer::~SignalingServer() {
    stop();
}

void SignalingServer::start() {
    if (sweep_timer_ != scheduler::INVALID_TIMER) return;
    sweep_timer_ = scheduler_.schedule_every(
        std::chrono::milliseconds(options_.sweep_interval_ms), [this]() { sweep(); });
}

void SignalingServer::stop() {
    scheduler_.cancel(sweep_timer_);
    sweep_timer_ = scheduler::INVALID_TIMER;
}

bool SignalingServer::on_open(const std::string& client_id, ConnectionPtr connection) {
    std::string ip = connection->remote_ip();

    if (lockout_.is_rejected(ip, scheduler_.now_ms())) {
        access_log_.record("connection_blocked", client_id, "", ip, false);
        connection->close(CLOSE_IP_BLOCKED, "IP blocked");
        return false;
    }

    registry_.attach(client_id, std::move(connection), ip, scheduler_.now_ms());
    if (g_debug_connection) {
        fprintf(stderr, "Relay: Client connected: %s from %s\n", client_id.c_str(), ip.c_str());
    }
    return true;
}

void SignalingServer::on_message(const std::string& client_id, const std::string& text) {
    try {
        if (!registry_.touch(client_id, scheduler_.now_ms())) {
            return;
        }

        protocol::Message msg;
        std::string error;
        if (!protocol::decode(text, msg, error)) {
            fprintf(stderr, "Relay: Bad message from client %s: %s\n", client_id.c_str(), error.c_str());
            return;
        }

        std::optional<PeerSession> peer = registry_.find(client_id);
        if (!peer) {
            return;
        }

        std::visit(Dispatcher{*this, *peer, text}, msg);
    } catch (const std::exception& e) {
        std::optional<PeerSession> peer = registry_.find(client_id);
        fprintf(stderr, "Relay: Error handling message from client %s (connection %s): %s\n",
                client_id.c_str(), peer ? peer->connection_id.c_str() : "-", e.what());
    }
}

void SignalingServer::on_close(const std::string& client_id) {
    try {
        UnlinkResult result = registry_.remove(client_id);
        if (!result.peer) {
            return;
        }

        if (result.partner) {
            notify_partner_disconnected(*result.partner);
        }
        if (result.peer->is_registered()) {
            access_log_.record("disconnect", result.peer->connection_id, "", result.peer->ip, true);
        }
        if (g_debug_connection) {
            fprintf(stderr, "Relay: Client disconnected: %s\n", client_id.c_str());
        }
    } catch (const std::exception& e) {
        fprintf(stderr, "Relay: Error closing client %s: %s\n", client_id.c_str(), e.what());
    }
}

void SignalingServer::sweep() {
    int64_t now = scheduler_.now_ms();
    for (const PeerSession& peer : registry_.idle_clients(now, options_.session_timeout_ms)) {
        access_log_.record("session_timeout",
                           peer.is_registered() ? peer.connection_id : peer.client_id,
                           "", peer.ip, true);
        drop_client(peer.client_id, CLOSE_SESSION_TIMEOUT, REASON_SESSION_TIMEOUT);
    }
}

bool SignalingServer::disconnect_peer(const std::string& connection_id) {
    std::optional<PeerSession> peer = registry_.find_by_connection_id(connection_id);
    if (!peer) {
        return false;
    }
    drop_client(peer->client_id, CLOSE_ADMIN_DISCONNECT, REASON_ADMIN_DISCONNECT);
    return true;
}

void SignalingServer::handle_register(const PeerSession& peer, const protocol::Register& msg) {
    if (msg.connection_id.empty()) {
        throw errors::ProtocolError("empty connection ID");
    }

    // Salted with the connection ID; the plaintext is not kept
    std::string hash = crypto_utils::hash_password(msg.password, msg.connection_id,
                                                   options_.pbkdf2_iterations);

    std::optional<RegisterResult> result = registry_.register_peer(
        peer.client_id, msg.connection_id, hash, msg.is_host, msg.public_key, scheduler_.now_ms());
    if (!result) {
        return;
    }

    if (result->evicted) {
        const PeerSession& evicted = *result->evicted;
        if (result->evicted_partner) {
            notify_partner_disconnected(*result->evicted_partner);
        }
        send_to(evicted, protocol::Disconnected{protocol::REASON_REGISTERED_ELSEWHERE});
        access_log_.record("register_evicted", msg.connection_id, "", evicted.ip, true);
        evicted.connection->close(CLOSE_EVICTED, protocol::REASON_REGISTERED_ELSEWHERE);
    }

    access_log_.record("register", msg.connection_id, "", peer.ip, true);

    protocol::Registered reply;
    reply.connection_id = msg.connection_id;
    reply.client_id = peer.client_id;
    send_to(result->session, reply);

    fprintf(stderr, "Relay: Client registered: %s (%s)\n",
            msg.connection_id.c_str(), msg.is_host ? "Host" : "Viewer");
}

void SignalingServer::handle_connect(const PeerSession& peer, const protocol::Connect& msg) {
    // Lockout is checked before any lookup
    if (lockout_.is_locked_out(peer.ip, scheduler_.now_ms())) {
        send_connect_error(peer, "Too many failed attempts");
        access_log_.record("auth_blocked", peer.connection_id, msg.target_connection_id, peer.ip, false);
        return;
    }

    if (!peer.is_registered()) {
        send_connect_error(peer, "Not registered");
        return;
    }

    std::optional<PeerSession> target = registry_.find_by_connection_id(msg.target_connection_id);
    if (!target) {
        send_connect_error(peer, "Connection ID not found");
        access_log_.record("connect_attempt", peer.connection_id, msg.target_connection_id, peer.ip, false);
        return;
    }

    if (target->client_id == peer.client_id || target->is_linked()) {
        send_connect_error(peer, "Target busy");
        access_log_.record("connect_attempt", peer.connection_id, msg.target_connection_id, peer.ip, false);
        return;
    }

    std::string hash = crypto_utils::hash_password(msg.password, msg.target_connection_id,
                                                   options_.pbkdf2_iterations);
    if (!crypto_utils::constant_time_equals(hash, target->password_hash)) {
        int count = lockout_.record_failure(peer.ip, scheduler_.now_ms());
        send_connect_error(peer, "Invalid password");
        access_log_.record("auth_failed", peer.connection_id, msg.target_connection_id, peer.ip, false);
        if (count >= options_.max_failed_attempts) {
            fprintf(stderr, "Relay: IP %s locked out after %d failed attempts\n", peer.ip.c_str(), count);
        }
        return;
    }

    std::string session_id = crypto_utils::uuid_v4();
    LinkResult link = registry_.link(peer.client_id, msg.target_connection_id, session_id);

    // The target may have changed while the password was being checked
    switch (link.status) {
        case LinkStatus::OK:
            break;
        case LinkStatus::TARGET_NOT_FOUND:
            send_connect_error(peer, "Connection ID not found");
            return;
        case LinkStatus::TARGET_BUSY:
            send_connect_error(peer, "Target busy");
            return;
        case LinkStatus::REQUESTER_UNKNOWN:
            return;
    }

    if (link.previous_partner) {
        notify_partner_disconnected(*link.previous_partner);
    }

    access_log_.record("connect_success", peer.connection_id, msg.target_connection_id, peer.ip, true);

    protocol::ConnectSuccess success;
    success.session_id = session_id;
    success.target_connection_id = link.target->connection_id;
    success.target_public_key = link.target->public_key;
    send_to(*link.requester, success);

    protocol::IncomingConnection incoming;
    incoming.session_id = session_id;
    incoming.from_connection_id = link.requester->connection_id;
    incoming.from_public_key = link.requester->public_key;
    send_to(*link.target, incoming);

    fprintf(stderr, "Relay: Session created: %s between %s and %s\n",
            session_id.c_str(), peer.connection_id.c_str(), msg.target_connection_id.c_str());
}

void SignalingServer::handle_disconnect(const PeerSession& peer) {
    UnlinkResult result = registry_.unlink(peer.client_id);
    if (!result.partner) {
        return;
    }

    notify_partner_disconnected(*result.partner);
    access_log_.record("session_end", peer.connection_id, result.partner->connection_id, peer.ip, true);
}

void SignalingServer::handle_relay(const PeerSession& peer, const protocol::Relay& msg) {
    std::optional<PeerSession> partner = registry_.partner_of(peer.client_id);
    if (!partner) {
        return;
    }
    send_to(*partner, protocol::Relayed{msg.data});
}

void SignalingServer::forward(const PeerSession& peer, const std::string& text, const char* type) {
    std::optional<PeerSession> partner = registry_.partner_of(peer.client_id);
    if (!partner) {
        if (g_debug_relay) {
            fprintf(stderr, "Relay: Dropping '%s' from %s (not linked)\n", type, peer.connection_id.c_str());
        }
        return;
    }

    if (!partner->connection->send(text)) {
        fprintf(stderr, "Relay: Failed to forward '%s' to %s\n", type, partner->connection_id.c_str());
        return;
    }

    if (g_debug_relay) {
        fprintf(stderr, "Relay: %s %s -> %s (%zu bytes)\n", type,
                peer.connection_id.c_str(), partner->connection_id.c_str(), text.size());
    }
}

void SignalingServer::drop_client(const std::string& client_id, int code, const char* reason) {
    UnlinkResult result = registry_.remove(client_id);
    if (!result.peer) {
        return;
    }

    if (result.partner) {
        notify_partner_disconnected(*result.partner);
    }
    result.peer->connection->close(code, reason);
    fprintf(stderr, "Relay: Closed client %s: %s\n",
            result.peer->is_registered() ? result.peer->connection_id.c_str() : client_id.c_str(),
            reason);
}

void SignalingServer::notify_partner_disconnected(const PeerSession& partner) {
    send_to(partner, protocol::Disconnected{protocol::REASON_PARTNER_DISCONNECTED});
}

void SignalingServer::send_to(const PeerSession& peer, const protocol::Message& msg) {
    if (!peer.connection) return;
    if (!peer.connection->send(protocol::encode(msg)) && g_debug_connection) {
        fprintf(stderr, "Relay: Send of '%s' to client %s failed (socket closed)\n",
                protocol::type_name(msg), peer.client_id.c_str());
    }
}

void SignalingServer::send_connect_error(const PeerSession& peer, const std::string& error) {
    send_to(peer, protocol::ConnectError{error});
}

} // namespace signaling
