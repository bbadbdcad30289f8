/*
 * WebSocket Listener Implementation
 */

#include "websocket_listener.h"
#include "../../common/utils/crypto_utils.h"
#include "../../common/utils/debug_flags.h"
#include <cstdio>

namespace signaling {

namespace {

class WebSocketConnection : public Connection {
public:
    explicit WebSocketConnection(std::weak_ptr<rtc::WebSocket> ws, std::string ip)
        : ws_(std::move(ws)), ip_(std::move(ip)) {}

    bool send(const std::string& text) override {
        auto ws = ws_.lock();
        if (!ws || !ws->isOpen()) {
            return false;
        }
        try {
            return ws->send(text);
        } catch (const std::exception& e) {
            fprintf(stderr, "Relay: WebSocket send failed: %s\n", e.what());
            return false;
        }
    }

    void close(int code, const std::string& reason) override {
        auto ws = ws_.lock();
        if (!ws) return;
        if (g_debug_connection) {
            fprintf(stderr, "Relay: Closing %s (%d %s)\n", ip_.c_str(), code, reason.c_str());
        }
        try {
            ws->close();
        } catch (const std::exception& e) {
            fprintf(stderr, "Relay: WebSocket close failed: %s\n", e.what());
        }
    }

    std::string remote_ip() const override { return ip_; }

private:
    std::weak_ptr<rtc::WebSocket> ws_;
    std::string ip_;
};

} // namespace

std::string strip_port(const std::string& address) {
    size_t colon = address.rfind(':');
    if (colon == std::string::npos) {
        return address;
    }
    std::string host = address.substr(0, colon);
    if (host.size() >= 2 && host.front() == '[' && host.back() == ']') {
        host = host.substr(1, host.size() - 2);
    }
    return host;
}

WebSocketListener::WebSocketListener(SignalingServer& server)
    : server_(server)
{}

WebSocketListener::~WebSocketListener() {
    stop();
}

bool WebSocketListener::start(int port) {
    try {
        rtc::WebSocketServer::Configuration config;
        config.port = static_cast<uint16_t>(port);
        config.enableTls = false;

        ws_server_ = std::make_unique<rtc::WebSocketServer>(config);
        ws_server_->onClient([this](std::shared_ptr<rtc::WebSocket> ws) {
            on_client(ws);
        });
    } catch (const std::exception& e) {
        fprintf(stderr, "Relay: Failed to start WebSocket server: %s\n", e.what());
        return false;
    }

    fprintf(stderr, "Relay: WebSocket server on port %d\n", port);
    return true;
}

void WebSocketListener::stop() {
    if (ws_server_) {
        ws_server_->stop();
        ws_server_.reset();
    }

    std::map<std::string, std::shared_ptr<rtc::WebSocket>> remaining;
    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        remaining.swap(connections_);
    }
    for (auto& entry : remaining) {
        entry.second->close();
    }
}

size_t WebSocketListener::connection_count() const {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    return connections_.size();
}

void WebSocketListener::on_client(std::shared_ptr<rtc::WebSocket> ws) {
    std::string client_id = crypto_utils::uuid_v4();
    std::string ip = strip_port(ws->remoteAddress().value_or("unknown"));

    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        connections_[client_id] = ws;
    }

    std::weak_ptr<rtc::WebSocket> weak_ws = ws;

    ws->onOpen([this, client_id, weak_ws, ip]() {
        auto conn = std::make_shared<WebSocketConnection>(weak_ws, ip);
        server_.on_open(client_id, conn);
    });

    ws->onMessage([this, client_id](auto data) {
        if (std::holds_alternative<std::string>(data)) {
            server_.on_message(client_id, std::get<std::string>(data));
        } else if (g_debug_connection) {
            fprintf(stderr, "Relay: Ignoring binary frame from client %s\n", client_id.c_str());
        }
    });

    ws->onError([client_id](std::string error) {
        fprintf(stderr, "Relay: WebSocket error for client %s: %s\n", client_id.c_str(), error.c_str());
    });

    ws->onClosed([this, client_id]() {
        server_.on_close(client_id);
        std::lock_guard<std::mutex> lock(connections_mutex_);
        connections_.erase(client_id);
    });
}

} // namespace signaling
