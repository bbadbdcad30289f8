/*
 * LunarView Relay Server
 *
 * WebSocket signaling/relay endpoint plus the admin HTTP API.
 */

#include "config/server_config.h"
#include "http/admin_api.h"
#include "http/http_server.h"
#include "signaling/signaling_server.h"
#include "signaling/websocket_listener.h"
#include "../common/utils/scheduler.h"
#include <rtc/rtc.hpp>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <thread>

static std::atomic<bool> g_running(true);

static void signal_handler(int sig) {
    (void)sig;
    g_running = false;
}

int main(int argc, char* argv[]) {
    server_config::ServerConfig config;
    config.load_from_env();
    config.parse_command_line(argc, argv);
    config.apply_debug_flags();

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);
    signal(SIGPIPE, SIG_IGN);

    rtc::InitLogger(config.debug_connection ? rtc::LogLevel::Info : rtc::LogLevel::Error);

    config.print_summary();

    scheduler::TimerThread timers;
    signaling::SignalingServer server(config.signaling_options(), timers);

    signaling::WebSocketListener listener(server);
    if (!listener.start(config.signaling_port)) {
        fprintf(stderr, "Failed to start signaling server\n");
        return 1;
    }

    http::AdminRouter admin(server, config.admin_api_key);
    http::Server http_server;
    if (!http_server.start(config.admin_port, [&admin](const http::Request& req) {
            return admin.handle(req);
        })) {
        fprintf(stderr, "Failed to start admin HTTP server\n");
        listener.stop();
        return 1;
    }

    server.start();

    while (g_running) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    fprintf(stderr, "\nServer: Shutting down...\n");
    server.stop();
    http_server.stop();
    listener.stop();
    timers.stop();
    rtc::Cleanup();

    fprintf(stderr, "Server: Stopped\n");
    return 0;
}
