/*
 * Peer Client Configuration
 *
 * Defaults, overridden by environment variables, an optional JSON
 * config file and then the command line, in that order.
 */

#ifndef CLIENT_CONFIG_H
#define CLIENT_CONFIG_H

#include "../session/host_session.h"
#include "../session/viewer_session.h"
#include <string>
#include <vector>

namespace client_config {

enum class Role {
    HOST,
    VIEWER
};

struct ClientConfig {
    Role role = Role::HOST;

    // Server and identity
    std::string server_url = "ws://localhost:8080";
    std::string connection_id;      // Generated when empty
    std::string password;           // Host only, generated when empty

    // Viewer target
    std::string target_id;
    std::string target_password;

    // Plan and features
    std::string plan = "free";
    std::string quality = "medium";
    bool auto_quality = true;
    bool game_mode = false;
    bool allow_control = true;
    std::string clipboard_direction = "both";
    std::string download_dir = ".";
    std::string send_file;          // Viewer: file sent once the session is up

    // Network
    std::vector<std::string> stun_servers;
    int p2p_grace_sec = 10;
    int max_reconnect_attempts = 5;
    int reconnect_delay_ms = 1000;

    std::string config_file;

    // Debug flags
    bool debug_connection = false;   // WebSocket, WebRTC, ICE, libdatachannel logs
    bool debug_stream = false;       // Frame timing, quality changes
    bool debug_transfer = false;     // Per-chunk file transfer logs

    /**
     * Parse command-line arguments
     * @param argc Argument count
     * @param argv Argument values
     */
    void parse_command_line(int argc, char* argv[]);

    /**
     * Load configuration from environment variables
     * LUNARVIEW_SERVER, LUNARVIEW_PLAN and LUNARVIEW_DEBUG_*
     */
    void load_from_env();

    /**
     * Load a JSON config file. Keys match the long option names.
     * @return false if the file could not be read or parsed
     */
    bool load_from_file(const std::string& path);

    /**
     * Check option values and fill in generated ids
     * @return false (after printing why) if the configuration is unusable
     */
    bool validate();

    // Copy debug flags to the process-wide g_debug_* flags
    void apply_debug_flags() const;

    session::HostOptions host_options() const;
    session::ViewerOptions viewer_options() const;

    /**
     * Print configuration summary
     */
    void print_summary() const;

private:
    session::SessionOptions session_options() const;
    webrtc::P2POptions p2p_options() const;
    transfer::TransferOptions transfer_options() const;

    void print_usage(const char* program_name) const;
};

} // namespace client_config

#endif // CLIENT_CONFIG_H
