/*
 * Peer Registry
 *
 * In-memory table of accepted sockets (keyed by client ID) and of
 * registered connection IDs. Linking two peers into a session and
 * breaking that link are single critical sections covering both
 * sides, so connected_to is always symmetric.
 *
 * Lookups return copies. Callers send on the copied connection
 * handles after the registry lock has been released.
 */

#ifndef REGISTRY_H
#define REGISTRY_H

#include "connection.h"
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace signaling {

struct PeerSession {
    std::string client_id;          // One per accepted socket
    std::string connection_id;      // Empty until registered
    std::string password_hash;
    bool is_host = false;
    std::string public_key;
    ConnectionPtr connection;
    std::string connected_to;       // Partner client ID, empty when unlinked
    std::string session_id;
    std::string ip;
    int64_t connected_at = 0;       // ms, socket accepted
    int64_t registered_at = 0;      // ms
    int64_t last_activity = 0;      // ms

    bool is_registered() const { return !connection_id.empty(); }
    bool is_linked() const { return !connected_to.empty(); }
};

/**
 * Result of a link attempt
 */
enum class LinkStatus {
    OK,
    REQUESTER_UNKNOWN,      // Requester socket gone or not registered
    TARGET_NOT_FOUND,
    TARGET_BUSY             // Target already linked, or is the requester
};

struct LinkResult {
    LinkStatus status = LinkStatus::TARGET_NOT_FOUND;
    std::optional<PeerSession> requester;
    std::optional<PeerSession> target;
    std::optional<PeerSession> previous_partner;   // Requester's old partner, now unlinked
};

struct RegisterResult {
    PeerSession session;                        // The newly registered peer
    std::optional<PeerSession> evicted;         // Previous holder of the connection ID
    std::optional<PeerSession> evicted_partner; // Evicted peer's partner, now unlinked
};

// Session of a peer and its former partner after an unlink or removal
struct UnlinkResult {
    std::optional<PeerSession> peer;
    std::optional<PeerSession> partner;
};

class Registry {
public:
    Registry() = default;

    Registry(const Registry&) = delete;
    Registry& operator=(const Registry&) = delete;

    // New socket accepted
    void attach(const std::string& client_id, ConnectionPtr connection,
                const std::string& ip, int64_t now_ms);

    /**
     * Register a connection ID for a socket
     *
     * If another socket holds the ID it is evicted: unlinked from its
     * partner and stripped of the ID. The caller notifies and closes it.
     * A socket re-registering under a new ID releases its old one.
     *
     * @return nullopt if the client is not attached
     */
    std::optional<RegisterResult> register_peer(const std::string& client_id,
                                                const std::string& connection_id,
                                                const std::string& password_hash,
                                                bool is_host,
                                                const std::string& public_key,
                                                int64_t now_ms);

    // Refresh last-activity. Returns false for unknown clients.
    bool touch(const std::string& client_id, int64_t now_ms);

    /**
     * Link requester and target symmetrically under session_id
     *
     * The target must be registered, must not be the requester and must
     * not be linked already. A linked requester is unlinked from its
     * previous partner first.
     */
    LinkResult link(const std::string& requester_client_id,
                    const std::string& target_connection_id,
                    const std::string& session_id);

    // Break the client's link (both sides). partner is empty if it was not linked.
    UnlinkResult unlink(const std::string& client_id);

    // Drop the socket entirely, releasing its connection ID and link
    UnlinkResult remove(const std::string& client_id);

    std::optional<PeerSession> find(const std::string& client_id) const;
    std::optional<PeerSession> find_by_connection_id(const std::string& connection_id) const;

    // Partner of a linked client, if any
    std::optional<PeerSession> partner_of(const std::string& client_id) const;

    std::vector<PeerSession> snapshot() const;

    // Clients idle for longer than timeout_ms
    std::vector<PeerSession> idle_clients(int64_t now_ms, int64_t timeout_ms) const;

    size_t size() const;

private:
    // Caller holds mutex_
    std::optional<PeerSession> unlink_locked(PeerSession& peer);

    mutable std::mutex mutex_;
    std::map<std::string, PeerSession> clients_;            // client ID -> session
    std::map<std::string, std::string> connection_ids_;     // connection ID -> client ID
};

} // namespace signaling

#endif // REGISTRY_H
