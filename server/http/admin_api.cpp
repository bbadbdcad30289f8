/*
 * Admin API Module
 *
 * Implementation of /health and the /admin/ endpoints
 */

#include "admin_api.h"
#include "../../common/errors.h"
#include "../../common/utils/crypto_utils.h"
#include "../../common/utils/json_utils.h"
#include <cstdio>

namespace http {

using json_utils::json;

static Response error_response(int code, const std::string& message) {
    return Response::json(json_utils::to_string(json{{"error", message}}), code);
}

static Response success_response() {
    return Response::json(json_utils::to_string(json{{"success", true}}));
}

// Body field as a string, empty if the body is not a JSON object
static std::string body_field(const Request& req, const std::string& key) {
    try {
        return json_utils::get_string(json_utils::parse(req.body), key);
    } catch (const errors::ProtocolError&) {
        return "";
    }
}

AdminRouter::AdminRouter(signaling::SignalingServer& server, const std::string& api_key)
    : server_(server)
    , api_key_(api_key)
{}

Response AdminRouter::handle(const Request& req) {
    if (req.path == "/health") {
        if (req.method != "GET") return error_response(405, "Method not allowed");
        return handle_health(req);
    }

    if (req.path.rfind("/admin/", 0) != 0) {
        return Response::not_found();
    }

    if (!authorized(req)) {
        server_.access_log().record("admin_auth_failed", "admin", "", req.remote_ip, false);
        return error_response(401, "Unauthorized: Invalid API key");
    }

    if (req.path == "/admin/clients" && req.method == "GET") {
        return handle_clients(req);
    }
    if (req.path == "/admin/logs" && req.method == "GET") {
        return handle_logs(req);
    }
    if (req.path == "/admin/block-ip" && req.method == "POST") {
        return handle_block_ip(req);
    }
    if (req.path == "/admin/block-ip" && req.method == "DELETE") {
        return handle_unblock_ip(req);
    }
    if (req.path == "/admin/disconnect" && req.method == "POST") {
        return handle_disconnect(req);
    }

    return error_response(404, "Unknown admin endpoint");
}

bool AdminRouter::authorized(const Request& req) {
    std::string key = req.header("x-api-key");
    if (key.empty()) {
        key = req.query_param("apiKey");
    }
    return !key.empty() && !api_key_.empty() && crypto_utils::constant_time_equals(key, api_key_);
}

Response AdminRouter::handle_health(const Request&) {
    json body = {
        {"status", "ok"},
        {"clients", server_.registry().size()},
        {"timestamp", signaling::format_timestamp(signaling::wall_clock_ms())}
    };
    return Response::json(json_utils::to_string(body));
}

Response AdminRouter::handle_clients(const Request&) {
    json list = json::array();
    for (const auto& peer : server_.registry().snapshot()) {
        if (!peer.is_registered()) continue;

        json entry = {
            {"connectionId", peer.connection_id},
            {"isHost", peer.is_host},
            {"ipAddress", peer.ip},
            {"registeredAt", peer.registered_at},
            {"lastActivity", peer.last_activity}
        };
        std::optional<signaling::PeerSession> partner = server_.registry().partner_of(peer.client_id);
        entry["connectedTo"] = partner ? json(partner->connection_id) : json(nullptr);
        entry["sessionId"] = peer.session_id.empty() ? json(nullptr) : json(peer.session_id);
        list.push_back(entry);
    }
    return Response::json(json_utils::to_string(list));
}

Response AdminRouter::handle_logs(const Request&) {
    json list = json::array();
    for (const auto& entry : server_.access_log().latest(ADMIN_LOG_LIMIT)) {
        list.push_back(signaling::AccessLog::to_json(entry));
    }
    return Response::json(json_utils::to_string(list));
}

Response AdminRouter::handle_block_ip(const Request& req) {
    std::string ip = body_field(req, "ip");
    if (ip.empty()) {
        return error_response(400, "IP required");
    }

    server_.lockout().block(ip);
    server_.access_log().record("ip_blocked", "admin", ip, req.remote_ip, true);
    return success_response();
}

Response AdminRouter::handle_unblock_ip(const Request& req) {
    std::string ip = body_field(req, "ip");
    if (ip.empty() || !server_.lockout().unblock(ip)) {
        return error_response(400, "IP not found in blocklist");
    }

    server_.access_log().record("ip_unblocked", "admin", ip, req.remote_ip, true);
    return success_response();
}

Response AdminRouter::handle_disconnect(const Request& req) {
    std::string connection_id = body_field(req, "connectionId");
    if (connection_id.empty()) {
        return error_response(400, "connectionId required");
    }

    if (!server_.disconnect_peer(connection_id)) {
        return error_response(404, "Client not found");
    }

    server_.access_log().record("admin_disconnect", "admin", connection_id, req.remote_ip, true);
    return success_response();
}

} // namespace http
