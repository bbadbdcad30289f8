/*
 * Relay Server Configuration Implementation
 */

#include "server_config.h"
#include "../../common/utils/debug_flags.h"
#include "../../common/utils/json_utils.h"
#include <cstdlib>
#include <cstring>
#include <cstdio>
#include <getopt.h>

namespace server_config {

void ServerConfig::parse_command_line(int argc, char* argv[]) {
    static struct option long_options[] = {
        {"help",                no_argument,       0, 'h'},
        {"port",                required_argument, 0, 'p'},
        {"admin-port",          required_argument, 0, 'a'},
        {"api-key",             required_argument, 0, 'k'},
        {"config",              required_argument, 0, 'c'},
        {"session-timeout",     required_argument, 0,  0 },
        {"sweep-interval",      required_argument, 0,  0 },
        {"max-failed-attempts", required_argument, 0,  0 },
        {"lockout",             required_argument, 0,  0 },
        {"debug-connection",    no_argument,       0,  0 },
        {"debug-relay",         no_argument,       0,  0 },
        {0, 0, 0, 0}
    };

    int option_index = 0;
    int c;

    while ((c = getopt_long(argc, argv, "hp:a:k:c:", long_options, &option_index)) != -1) {
        switch (c) {
            case 0:
                // Long option
                if (strcmp(long_options[option_index].name, "session-timeout") == 0) {
                    session_timeout_min = atoi(optarg);
                } else if (strcmp(long_options[option_index].name, "sweep-interval") == 0) {
                    sweep_interval_sec = atoi(optarg);
                } else if (strcmp(long_options[option_index].name, "max-failed-attempts") == 0) {
                    max_failed_attempts = atoi(optarg);
                } else if (strcmp(long_options[option_index].name, "lockout") == 0) {
                    lockout_min = atoi(optarg);
                } else if (strcmp(long_options[option_index].name, "debug-connection") == 0) {
                    debug_connection = true;
                } else if (strcmp(long_options[option_index].name, "debug-relay") == 0) {
                    debug_relay = true;
                }
                break;

            case 'h':
                print_usage(argv[0]);
                exit(0);

            case 'p':
                signaling_port = atoi(optarg);
                break;

            case 'a':
                admin_port = atoi(optarg);
                break;

            case 'k':
                admin_api_key = optarg;
                break;

            case 'c':
                // Options after --config override the file
                config_file = optarg;
                if (!load_from_file(config_file)) {
                    exit(1);
                }
                break;

            case '?':
                // Error message already printed by getopt_long
                exit(1);

            default:
                fprintf(stderr, "Unknown option\n");
                exit(1);
        }
    }
}

void ServerConfig::load_from_env() {
    if (const char* v = getenv("PORT")) {
        signaling_port = atoi(v);
    }
    if (const char* v = getenv("ADMIN_PORT")) {
        admin_port = atoi(v);
    }
    if (const char* v = getenv("ADMIN_API_KEY")) {
        admin_api_key = v;
    }

    // Debug flags from environment
    if (getenv("LUNARVIEW_DEBUG_CONNECTION")) {
        debug_connection = true;
    }
    if (getenv("LUNARVIEW_DEBUG_RELAY")) {
        debug_relay = true;
    }
}

bool ServerConfig::load_from_file(const std::string& path) {
    try {
        auto j = json_utils::parse_file(path);

        signaling_port = json_utils::get_int(j, "port", signaling_port);
        admin_port = json_utils::get_int(j, "admin-port", admin_port);
        admin_api_key = json_utils::get_string(j, "api-key", admin_api_key);
        session_timeout_min = json_utils::get_int(j, "session-timeout", session_timeout_min);
        sweep_interval_sec = json_utils::get_int(j, "sweep-interval", sweep_interval_sec);
        max_failed_attempts = json_utils::get_int(j, "max-failed-attempts", max_failed_attempts);
        lockout_min = json_utils::get_int(j, "lockout", lockout_min);
        pbkdf2_iterations = json_utils::get_int(j, "pbkdf2-iterations", pbkdf2_iterations);
        debug_connection = json_utils::get_bool(j, "debug-connection", debug_connection);
        debug_relay = json_utils::get_bool(j, "debug-relay", debug_relay);

        fprintf(stderr, "Config: Loaded from %s\n", path.c_str());
        return true;
    } catch (const std::exception& e) {
        fprintf(stderr, "Config: Failed to load %s: %s\n", path.c_str(), e.what());
        return false;
    }
}

void ServerConfig::apply_debug_flags() const {
    g_debug_connection = debug_connection;
    g_debug_relay = debug_relay;
}

signaling::ServerOptions ServerConfig::signaling_options() const {
    signaling::ServerOptions options;
    options.session_timeout_ms = static_cast<int64_t>(session_timeout_min) * 60 * 1000;
    options.sweep_interval_ms = static_cast<int64_t>(sweep_interval_sec) * 1000;
    options.max_failed_attempts = max_failed_attempts;
    options.lockout_window_ms = static_cast<int64_t>(lockout_min) * 60 * 1000;
    options.pbkdf2_iterations = pbkdf2_iterations;
    return options;
}

void ServerConfig::print_summary() const {
    fprintf(stderr, "\n=== LunarView Relay Server ===\n");
    fprintf(stderr, "Signaling:        ws://0.0.0.0:%d\n", signaling_port);
    fprintf(stderr, "Admin API:        http://0.0.0.0:%d\n", admin_port);
    fprintf(stderr, "Session timeout:  %d min (sweep every %d s)\n", session_timeout_min, sweep_interval_sec);
    fprintf(stderr, "Lockout:          %d failures, %d min\n", max_failed_attempts, lockout_min);
    if (!config_file.empty()) {
        fprintf(stderr, "Config file:      %s\n", config_file.c_str());
    }
    if (admin_api_key == "default-admin-key-change-me") {
        fprintf(stderr, "WARNING: Using the default admin API key, set ADMIN_API_KEY\n");
    }

    // Show active debug flags
    if (debug_connection || debug_relay) {
        fprintf(stderr, "\nDebug flags:\n");
        if (debug_connection) fprintf(stderr, "  - Connection (WebSocket accept/close)\n");
        if (debug_relay)      fprintf(stderr, "  - Relay (per-message forwarding)\n");
    }

    fprintf(stderr, "\n");
}

void ServerConfig::print_usage(const char* program_name) const {
    fprintf(stderr, "Usage: %s [options]\n\n", program_name);
    fprintf(stderr, "Options:\n");
    fprintf(stderr, "  -h, --help                  Show this help\n");
    fprintf(stderr, "  -p, --port PORT             WebSocket signaling port (default: %d)\n", signaling_port);
    fprintf(stderr, "  -a, --admin-port PORT       Admin HTTP port (default: %d)\n", admin_port);
    fprintf(stderr, "  -k, --api-key KEY           Admin API key\n");
    fprintf(stderr, "  -c, --config FILE           JSON config file\n");
    fprintf(stderr, "      --session-timeout MIN   Idle session timeout (default: %d)\n", session_timeout_min);
    fprintf(stderr, "      --sweep-interval SEC    Idle sweep period (default: %d)\n", sweep_interval_sec);
    fprintf(stderr, "      --max-failed-attempts N Failures before lockout (default: %d)\n", max_failed_attempts);
    fprintf(stderr, "      --lockout MIN           Lockout window (default: %d)\n", lockout_min);
    fprintf(stderr, "      --debug-connection      Log socket accept/close and libdatachannel info\n");
    fprintf(stderr, "      --debug-relay           Log every forwarded message\n");
    fprintf(stderr, "\nEnvironment variables:\n");
    fprintf(stderr, "  PORT, ADMIN_PORT, ADMIN_API_KEY\n");
    fprintf(stderr, "  LUNARVIEW_DEBUG_CONNECTION    Enable connection debug logs\n");
    fprintf(stderr, "  LUNARVIEW_DEBUG_RELAY         Enable relay debug logs\n");
    fprintf(stderr, "\n");
}

} // namespace server_config
