/*
 * Relay Server Configuration
 *
 * Defaults, overridden by environment variables, an optional JSON
 * config file and then the command line, in that order.
 */

#ifndef SERVER_CONFIG_H
#define SERVER_CONFIG_H

#include "../signaling/signaling_server.h"
#include <string>

namespace server_config {

struct ServerConfig {
    // Network configuration
    int signaling_port = 8080;
    int admin_port = 8081;
    std::string admin_api_key = "default-admin-key-change-me";

    // Sessions and lockout
    int session_timeout_min = 30;
    int sweep_interval_sec = 60;
    int max_failed_attempts = 5;
    int lockout_min = 15;
    int pbkdf2_iterations = 100000;

    std::string config_file;

    // Debug flags
    bool debug_connection = false;   // WebSocket accept/close, libdatachannel logs
    bool debug_relay = false;        // Per-message forwarding

    /**
     * Parse command-line arguments
     * @param argc Argument count
     * @param argv Argument values
     */
    void parse_command_line(int argc, char* argv[]);

    /**
     * Load configuration from environment variables
     * PORT, ADMIN_PORT, ADMIN_API_KEY and LUNARVIEW_DEBUG_*
     */
    void load_from_env();

    /**
     * Load a JSON config file. Keys match the long option names.
     * @return false if the file could not be read or parsed
     */
    bool load_from_file(const std::string& path);

    // Copy debug flags to the process-wide g_debug_* flags
    void apply_debug_flags() const;

    signaling::ServerOptions signaling_options() const;

    /**
     * Print configuration summary
     */
    void print_summary() const;

private:
    void print_usage(const char* program_name) const;
};

} // namespace server_config

#endif // SERVER_CONFIG_H
