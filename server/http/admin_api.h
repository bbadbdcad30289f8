/*
 * Admin API Module
 *
 * Health check and administrative endpoints of the relay server.
 * Everything under /admin/ requires the API key, passed in the
 * X-API-Key header or the apiKey query parameter.
 */

#ifndef ADMIN_API_H
#define ADMIN_API_H

#include "http_server.h"
#include "../signaling/signaling_server.h"
#include <string>

namespace http {

// Latest entries returned by GET /admin/logs
constexpr size_t ADMIN_LOG_LIMIT = 100;

/**
 * Admin Router
 *
 * Routes /health and /admin/ requests to their handlers
 */
class AdminRouter {
public:
    AdminRouter(signaling::SignalingServer& server, const std::string& api_key);

    Response handle(const Request& req);

private:
    bool authorized(const Request& req);

    Response handle_health(const Request& req);             // GET /health
    Response handle_clients(const Request& req);            // GET /admin/clients
    Response handle_logs(const Request& req);               // GET /admin/logs
    Response handle_block_ip(const Request& req);           // POST /admin/block-ip
    Response handle_unblock_ip(const Request& req);         // DELETE /admin/block-ip
    Response handle_disconnect(const Request& req);         // POST /admin/disconnect

    signaling::SignalingServer& server_;
    std::string api_key_;
};

} // namespace http

#endif // ADMIN_API_H
