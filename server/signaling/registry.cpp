/*
 * Peer Registry Implementation
 */

#include "registry.h"

namespace signaling {

void Registry::attach(const std::string& client_id, ConnectionPtr connection,
                      const std::string& ip, int64_t now_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    PeerSession& peer = clients_[client_id];
    peer.client_id = client_id;
    peer.connection = std::move(connection);
    peer.ip = ip;
    peer.connected_at = now_ms;
    peer.last_activity = now_ms;
}

std::optional<RegisterResult> Registry::register_peer(const std::string& client_id,
                                                      const std::string& connection_id,
                                                      const std::string& password_hash,
                                                      bool is_host,
                                                      const std::string& public_key,
                                                      int64_t now_ms) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto self = clients_.find(client_id);
    if (self == clients_.end()) {
        return std::nullopt;
    }

    RegisterResult result;

    // Evict the previous holder of this connection ID
    auto holder = connection_ids_.find(connection_id);
    if (holder != connection_ids_.end() && holder->second != client_id) {
        auto old = clients_.find(holder->second);
        if (old != clients_.end()) {
            result.evicted_partner = unlink_locked(old->second);
            old->second.connection_id.clear();
            old->second.password_hash.clear();
            result.evicted = old->second;
        }
        connection_ids_.erase(holder);
    }

    // Release our own previous ID
    PeerSession& peer = self->second;
    if (!peer.connection_id.empty() && peer.connection_id != connection_id) {
        connection_ids_.erase(peer.connection_id);
    }

    peer.connection_id = connection_id;
    peer.password_hash = password_hash;
    peer.is_host = is_host;
    peer.public_key = public_key;
    peer.registered_at = now_ms;
    peer.last_activity = now_ms;
    connection_ids_[connection_id] = client_id;

    result.session = peer;
    return result;
}

bool Registry::touch(const std::string& client_id, int64_t now_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = clients_.find(client_id);
    if (it == clients_.end()) {
        return false;
    }
    it->second.last_activity = now_ms;
    return true;
}

LinkResult Registry::link(const std::string& requester_client_id,
                          const std::string& target_connection_id,
                          const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    LinkResult result;

    auto req = clients_.find(requester_client_id);
    if (req == clients_.end() || !req->second.is_registered()) {
        result.status = LinkStatus::REQUESTER_UNKNOWN;
        return result;
    }

    auto id_it = connection_ids_.find(target_connection_id);
    if (id_it == connection_ids_.end()) {
        result.status = LinkStatus::TARGET_NOT_FOUND;
        return result;
    }

    auto tgt = clients_.find(id_it->second);
    if (tgt == clients_.end()) {
        result.status = LinkStatus::TARGET_NOT_FOUND;
        return result;
    }

    if (tgt == req || tgt->second.is_linked()) {
        result.status = LinkStatus::TARGET_BUSY;
        result.target = tgt->second;
        return result;
    }

    if (req->second.is_linked()) {
        result.previous_partner = unlink_locked(req->second);
    }

    req->second.connected_to = tgt->first;
    req->second.session_id = session_id;
    tgt->second.connected_to = req->first;
    tgt->second.session_id = session_id;

    result.status = LinkStatus::OK;
    result.requester = req->second;
    result.target = tgt->second;
    return result;
}

std::optional<PeerSession> Registry::unlink_locked(PeerSession& peer) {
    if (!peer.is_linked()) {
        return std::nullopt;
    }

    std::optional<PeerSession> partner;
    auto it = clients_.find(peer.connected_to);
    if (it != clients_.end() && it->second.connected_to == peer.client_id) {
        it->second.connected_to.clear();
        it->second.session_id.clear();
        partner = it->second;
    }

    peer.connected_to.clear();
    peer.session_id.clear();
    return partner;
}

UnlinkResult Registry::unlink(const std::string& client_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    UnlinkResult result;

    auto it = clients_.find(client_id);
    if (it == clients_.end()) {
        return result;
    }

    result.partner = unlink_locked(it->second);
    result.peer = it->second;
    return result;
}

UnlinkResult Registry::remove(const std::string& client_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    UnlinkResult result;

    auto it = clients_.find(client_id);
    if (it == clients_.end()) {
        return result;
    }

    result.partner = unlink_locked(it->second);
    result.peer = it->second;

    auto id_it = connection_ids_.find(it->second.connection_id);
    if (id_it != connection_ids_.end() && id_it->second == client_id) {
        connection_ids_.erase(id_it);
    }
    clients_.erase(it);
    return result;
}

std::optional<PeerSession> Registry::find(const std::string& client_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = clients_.find(client_id);
    if (it == clients_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<PeerSession> Registry::find_by_connection_id(const std::string& connection_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto id_it = connection_ids_.find(connection_id);
    if (id_it == connection_ids_.end()) {
        return std::nullopt;
    }
    auto it = clients_.find(id_it->second);
    if (it == clients_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<PeerSession> Registry::partner_of(const std::string& client_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = clients_.find(client_id);
    if (it == clients_.end() || !it->second.is_linked()) {
        return std::nullopt;
    }
    auto partner = clients_.find(it->second.connected_to);
    if (partner == clients_.end()) {
        return std::nullopt;
    }
    return partner->second;
}

std::vector<PeerSession> Registry::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<PeerSession> result;
    result.reserve(clients_.size());
    for (const auto& entry : clients_) {
        result.push_back(entry.second);
    }
    return result;
}

std::vector<PeerSession> Registry::idle_clients(int64_t now_ms, int64_t timeout_ms) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<PeerSession> result;
    for (const auto& entry : clients_) {
        if (now_ms - entry.second.last_activity > timeout_ms) {
            result.push_back(entry.second);
        }
    }
    return result;
}

size_t Registry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return clients_.size();
}

} // namespace signaling
