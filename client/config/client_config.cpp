/*
 * Peer Client Configuration Implementation
 */

#include "client_config.h"
#include "../../common/utils/debug_flags.h"
#include "../../common/utils/json_utils.h"
#include <cstdlib>
#include <cstring>
#include <cstdio>
#include <getopt.h>

namespace client_config {

static const char* role_name(Role role) {
    return role == Role::HOST ? "host" : "viewer";
}

static bool parse_role(const std::string& name, Role& out) {
    if (name == "host") { out = Role::HOST; return true; }
    if (name == "viewer") { out = Role::VIEWER; return true; }
    return false;
}

void ClientConfig::parse_command_line(int argc, char* argv[]) {
    static struct option long_options[] = {
        {"help",               no_argument,       0, 'h'},
        {"role",               required_argument, 0, 'r'},
        {"server",             required_argument, 0, 's'},
        {"id",                 required_argument, 0, 'i'},
        {"password",           required_argument, 0, 'p'},
        {"target",             required_argument, 0, 't'},
        {"target-password",    required_argument, 0, 'P'},
        {"quality",            required_argument, 0, 'q'},
        {"config",             required_argument, 0, 'c'},
        {"plan",               required_argument, 0,  0 },
        {"game-mode",          no_argument,       0,  0 },
        {"no-auto-quality",    no_argument,       0,  0 },
        {"view-only",          no_argument,       0,  0 },
        {"clipboard",          required_argument, 0,  0 },
        {"download-dir",       required_argument, 0,  0 },
        {"send-file",          required_argument, 0,  0 },
        {"stun",               required_argument, 0,  0 },
        {"p2p-grace",          required_argument, 0,  0 },
        {"reconnect-attempts", required_argument, 0,  0 },
        {"reconnect-delay",    required_argument, 0,  0 },
        {"debug-connection",   no_argument,       0,  0 },
        {"debug-stream",       no_argument,       0,  0 },
        {"debug-transfer",     no_argument,       0,  0 },
        {0, 0, 0, 0}
    };

    int option_index = 0;
    int c;

    while ((c = getopt_long(argc, argv, "hr:s:i:p:t:P:q:c:", long_options, &option_index)) != -1) {
        switch (c) {
            case 0: {
                // Long option
                const char* name = long_options[option_index].name;
                if (strcmp(name, "plan") == 0) {
                    plan = optarg;
                } else if (strcmp(name, "game-mode") == 0) {
                    game_mode = true;
                } else if (strcmp(name, "no-auto-quality") == 0) {
                    auto_quality = false;
                } else if (strcmp(name, "view-only") == 0) {
                    allow_control = false;
                } else if (strcmp(name, "clipboard") == 0) {
                    clipboard_direction = optarg;
                } else if (strcmp(name, "download-dir") == 0) {
                    download_dir = optarg;
                } else if (strcmp(name, "send-file") == 0) {
                    send_file = optarg;
                } else if (strcmp(name, "stun") == 0) {
                    stun_servers.push_back(optarg);
                } else if (strcmp(name, "p2p-grace") == 0) {
                    p2p_grace_sec = atoi(optarg);
                } else if (strcmp(name, "reconnect-attempts") == 0) {
                    max_reconnect_attempts = atoi(optarg);
                } else if (strcmp(name, "reconnect-delay") == 0) {
                    reconnect_delay_ms = atoi(optarg);
                } else if (strcmp(name, "debug-connection") == 0) {
                    debug_connection = true;
                } else if (strcmp(name, "debug-stream") == 0) {
                    debug_stream = true;
                } else if (strcmp(name, "debug-transfer") == 0) {
                    debug_transfer = true;
                }
                break;
            }

            case 'h':
                print_usage(argv[0]);
                exit(0);

            case 'r':
                if (!parse_role(optarg, role)) {
                    fprintf(stderr, "Invalid role '%s' (host or viewer)\n", optarg);
                    exit(1);
                }
                break;

            case 's':
                server_url = optarg;
                break;

            case 'i':
                connection_id = optarg;
                break;

            case 'p':
                password = optarg;
                break;

            case 't':
                target_id = optarg;
                break;

            case 'P':
                target_password = optarg;
                break;

            case 'q':
                quality = optarg;
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

void ClientConfig::load_from_env() {
    if (const char* v = getenv("LUNARVIEW_SERVER")) {
        server_url = v;
    }
    if (const char* v = getenv("LUNARVIEW_PLAN")) {
        plan = v;
    }

    // Debug flags from environment
    if (getenv("LUNARVIEW_DEBUG_CONNECTION")) {
        debug_connection = true;
    }
    if (getenv("LUNARVIEW_DEBUG_STREAM")) {
        debug_stream = true;
    }
    if (getenv("LUNARVIEW_DEBUG_TRANSFER")) {
        debug_transfer = true;
    }
}

bool ClientConfig::load_from_file(const std::string& path) {
    try {
        auto j = json_utils::parse_file(path);

        std::string role_str = json_utils::get_string(j, "role", role_name(role));
        if (!parse_role(role_str, role)) {
            fprintf(stderr, "Config: Invalid role '%s' in %s\n", role_str.c_str(), path.c_str());
            return false;
        }
        server_url = json_utils::get_string(j, "server", server_url);
        connection_id = json_utils::get_string(j, "id", connection_id);
        password = json_utils::get_string(j, "password", password);
        target_id = json_utils::get_string(j, "target", target_id);
        target_password = json_utils::get_string(j, "target-password", target_password);
        plan = json_utils::get_string(j, "plan", plan);
        quality = json_utils::get_string(j, "quality", quality);
        auto_quality = json_utils::get_bool(j, "auto-quality", auto_quality);
        game_mode = json_utils::get_bool(j, "game-mode", game_mode);
        allow_control = json_utils::get_bool(j, "allow-control", allow_control);
        clipboard_direction = json_utils::get_string(j, "clipboard", clipboard_direction);
        download_dir = json_utils::get_string(j, "download-dir", download_dir);
        p2p_grace_sec = json_utils::get_int(j, "p2p-grace", p2p_grace_sec);
        max_reconnect_attempts = json_utils::get_int(j, "reconnect-attempts", max_reconnect_attempts);
        reconnect_delay_ms = json_utils::get_int(j, "reconnect-delay", reconnect_delay_ms);
        debug_connection = json_utils::get_bool(j, "debug-connection", debug_connection);
        debug_stream = json_utils::get_bool(j, "debug-stream", debug_stream);
        debug_transfer = json_utils::get_bool(j, "debug-transfer", debug_transfer);

        std::vector<std::string> stun = json_utils::get_string_array(j, "stun");
        if (!stun.empty()) {
            stun_servers = stun;
        }

        fprintf(stderr, "Config: Loaded from %s\n", path.c_str());
        return true;
    } catch (const std::exception& e) {
        fprintf(stderr, "Config: Failed to load %s: %s\n", path.c_str(), e.what());
        return false;
    }
}

bool ClientConfig::validate() {
    streaming::Quality q;
    if (!streaming::parse_quality(quality, q)) {
        fprintf(stderr, "Config: Invalid quality '%s' (low, medium, high)\n", quality.c_str());
        return false;
    }
    if (q == streaming::Quality::GAME || q == streaming::Quality::GAME_LOW) {
        fprintf(stderr, "Config: Use --game-mode instead of quality '%s'\n", quality.c_str());
        return false;
    }

    clipboard::SyncDirection direction;
    if (!clipboard::parse_direction(clipboard_direction, direction)) {
        fprintf(stderr, "Config: Invalid clipboard direction '%s' (both, send, receive)\n",
                clipboard_direction.c_str());
        return false;
    }

    if (role == Role::VIEWER && target_id.empty()) {
        fprintf(stderr, "Config: Viewer needs --target\n");
        return false;
    }
    if (max_reconnect_attempts < 0 || reconnect_delay_ms <= 0 || p2p_grace_sec < 0) {
        fprintf(stderr, "Config: Reconnect and grace values must not be negative\n");
        return false;
    }

    if (connection_id.empty()) {
        connection_id = session::generate_connection_id();
    }
    if (role == Role::HOST && password.empty()) {
        password = session::generate_password();
    }
    return true;
}

void ClientConfig::apply_debug_flags() const {
    g_debug_connection = debug_connection;
    g_debug_stream = debug_stream;
    g_debug_transfer = debug_transfer;
}

session::SessionOptions ClientConfig::session_options() const {
    session::SessionOptions options;
    options.server_url = server_url;
    options.connection_id = connection_id;
    options.password = role == Role::HOST ? password : std::string();
    options.is_host = role == Role::HOST;
    options.max_reconnect_attempts = max_reconnect_attempts;
    options.reconnect_delay_ms = reconnect_delay_ms;
    return options;
}

webrtc::P2POptions ClientConfig::p2p_options() const {
    webrtc::P2POptions options;
    if (!stun_servers.empty()) {
        options.ice_servers = stun_servers;
    }
    return options;
}

transfer::TransferOptions ClientConfig::transfer_options() const {
    transfer::TransferOptions options;
    options.download_dir = download_dir;
    return options;
}

session::HostOptions ClientConfig::host_options() const {
    session::HostOptions options;
    options.session = session_options();
    options.p2p = p2p_options();
    options.transfer = transfer_options();
    options.allow_control = allow_control;
    options.p2p_grace_ms = p2p_grace_sec * 1000;
    streaming::parse_quality(quality, options.quality);
    options.auto_quality = auto_quality;
    options.game_mode = game_mode;
    clipboard::parse_direction(clipboard_direction, options.clipboard_direction);
    return options;
}

session::ViewerOptions ClientConfig::viewer_options() const {
    session::ViewerOptions options;
    options.session = session_options();
    options.p2p = p2p_options();
    options.transfer = transfer_options();
    options.target_id = target_id;
    options.target_password = target_password;
    clipboard::parse_direction(clipboard_direction, options.clipboard_direction);
    return options;
}

void ClientConfig::print_summary() const {
    fprintf(stderr, "\n=== LunarView Peer (%s) ===\n", role_name(role));
    fprintf(stderr, "Server:           %s\n", server_url.c_str());
    fprintf(stderr, "Connection ID:    %s\n", connection_id.c_str());
    if (role == Role::HOST) {
        fprintf(stderr, "Password:         %s\n", password.c_str());
        fprintf(stderr, "Quality:          %s%s%s\n", quality.c_str(),
                auto_quality ? " (auto)" : "", game_mode ? ", game mode" : "");
        fprintf(stderr, "Remote control:   %s\n", allow_control ? "allowed" : "view only");
    } else {
        fprintf(stderr, "Target:           %s\n", target_id.c_str());
        fprintf(stderr, "Download dir:     %s\n", download_dir.c_str());
    }
    fprintf(stderr, "Plan:             %s\n", plan.c_str());
    fprintf(stderr, "Clipboard:        %s\n", clipboard_direction.c_str());
    if (!stun_servers.empty()) {
        for (const auto& server : stun_servers) {
            fprintf(stderr, "STUN:             %s\n", server.c_str());
        }
    }
    if (!config_file.empty()) {
        fprintf(stderr, "Config file:      %s\n", config_file.c_str());
    }

    // Show active debug flags
    if (debug_connection || debug_stream || debug_transfer) {
        fprintf(stderr, "\nDebug flags:\n");
        if (debug_connection) fprintf(stderr, "  - Connection (WebSocket, WebRTC, ICE)\n");
        if (debug_stream)     fprintf(stderr, "  - Stream (frame timing, quality)\n");
        if (debug_transfer)   fprintf(stderr, "  - Transfer (per-chunk)\n");
    }

    fprintf(stderr, "\n");
}

void ClientConfig::print_usage(const char* program_name) const {
    fprintf(stderr, "Usage: %s [options]\n\n", program_name);
    fprintf(stderr, "Options:\n");
    fprintf(stderr, "  -h, --help                   Show this help\n");
    fprintf(stderr, "  -r, --role ROLE              host or viewer (default: %s)\n", role_name(role));
    fprintf(stderr, "  -s, --server URL             Relay server (default: %s)\n", server_url.c_str());
    fprintf(stderr, "  -i, --id ID                  Connection ID (default: random 9 digits)\n");
    fprintf(stderr, "  -p, --password PW            Host password (default: random)\n");
    fprintf(stderr, "  -t, --target ID              Viewer: host connection ID\n");
    fprintf(stderr, "  -P, --target-password PW     Viewer: host password\n");
    fprintf(stderr, "  -q, --quality Q              low, medium, high (default: %s)\n", quality.c_str());
    fprintf(stderr, "  -c, --config FILE            JSON config file\n");
    fprintf(stderr, "      --plan NAME              free, personal_pro, business, team\n");
    fprintf(stderr, "      --game-mode              Host: 60 fps game presets\n");
    fprintf(stderr, "      --no-auto-quality        Host: keep the chosen quality\n");
    fprintf(stderr, "      --view-only              Host: ignore remote input\n");
    fprintf(stderr, "      --clipboard DIR          both, send, receive (default: %s)\n",
            clipboard_direction.c_str());
    fprintf(stderr, "      --download-dir DIR       Where received files are saved\n");
    fprintf(stderr, "      --send-file PATH         Viewer: send a file once connected\n");
    fprintf(stderr, "      --stun URL               STUN server (repeatable)\n");
    fprintf(stderr, "      --p2p-grace SEC          Relay fallback delay (default: %d)\n", p2p_grace_sec);
    fprintf(stderr, "      --reconnect-attempts N   (default: %d)\n", max_reconnect_attempts);
    fprintf(stderr, "      --reconnect-delay MS     Base backoff delay (default: %d)\n", reconnect_delay_ms);
    fprintf(stderr, "      --debug-connection       Log WebSocket/WebRTC and libdatachannel info\n");
    fprintf(stderr, "      --debug-stream           Log frame timing and quality changes\n");
    fprintf(stderr, "      --debug-transfer         Log every file chunk\n");
    fprintf(stderr, "\nEnvironment variables:\n");
    fprintf(stderr, "  LUNARVIEW_SERVER, LUNARVIEW_PLAN\n");
    fprintf(stderr, "  LUNARVIEW_DEBUG_CONNECTION    Enable connection debug logs\n");
    fprintf(stderr, "  LUNARVIEW_DEBUG_STREAM        Enable stream debug logs\n");
    fprintf(stderr, "  LUNARVIEW_DEBUG_TRANSFER      Enable transfer debug logs\n");
    fprintf(stderr, "\n");
}

} // namespace client_config
