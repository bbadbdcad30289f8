/*
 * Configuration Tests
 *
 * Command line, JSON file and validation for the peer client, and the
 * relay server's option conversion.
 */

#include "test_support.h"
#include "../client/config/client_config.h"
#include "../server/config/server_config.h"
#include <getopt.h>
#include <unistd.h>
#include <cstdlib>
#include <fstream>
#include <string>
#include <vector>

/*
 * argv built from strings; getopt state is reset for each parse
 */
class Args {
public:
    Args(std::initializer_list<std::string> args) : storage_(args) {
        for (auto& s : storage_) {
            argv_.push_back(&s[0]);
        }
        argv_.push_back(nullptr);
        optind = 0;
    }

    int argc() const { return static_cast<int>(storage_.size()); }
    char** argv() { return argv_.data(); }

private:
    std::vector<std::string> storage_;
    std::vector<char*> argv_;
};

static std::string write_temp(const std::string& content) {
    char path[] = "/tmp/lunarview-config-XXXXXX";
    int fd = mkstemp(path);
    if (fd < 0) {
        return "";
    }
    close(fd);
    std::ofstream out(path, std::ios::trunc);
    out << content;
    return path;
}

static bool test_viewer_command_line() {
    client_config::ClientConfig config;
    Args args{"lunarview-peer", "-r", "viewer", "-s", "ws://relay.example:9000",
              "-t", "123456789", "-P", "AB12",
              "--stun", "stun:a.example:3478", "--stun", "stun:b.example:3478",
              "--clipboard", "receive", "--download-dir", "/tmp/downloads",
              "--reconnect-attempts", "3", "--reconnect-delay", "250"};
    config.parse_command_line(args.argc(), args.argv());

    TEST_ASSERT(config.role == client_config::Role::VIEWER, "viewer role");
    TEST_ASSERT(config.validate(), "valid");
    TEST_ASSERT(config.connection_id.size() == 9, "connection ID generated");
    TEST_ASSERT(config.password.empty(), "viewer has no password");

    session::ViewerOptions options = config.viewer_options();
    TEST_ASSERT(options.session.server_url == "ws://relay.example:9000", "server url");
    TEST_ASSERT(!options.session.is_host, "not a host");
    TEST_ASSERT(options.target_id == "123456789" && options.target_password == "AB12", "target");
    TEST_ASSERT(options.p2p.ice_servers.size() == 2 && options.p2p.ice_servers[1] == "stun:b.example:3478",
                "STUN servers replace the defaults");
    TEST_ASSERT(options.transfer.download_dir == "/tmp/downloads", "download dir");
    TEST_ASSERT(options.clipboard_direction == clipboard::SyncDirection::RECEIVE, "clipboard direction");
    TEST_ASSERT(options.session.max_reconnect_attempts == 3 && options.session.reconnect_delay_ms == 250,
                "reconnect policy");
    return true;
}

static bool test_host_command_line() {
    client_config::ClientConfig config;
    Args args{"lunarview-peer", "--role", "host", "-q", "high", "--game-mode", "--view-only",
              "--p2p-grace", "5", "--no-auto-quality", "--plan", "personal_pro"};
    config.parse_command_line(args.argc(), args.argv());

    TEST_ASSERT(config.validate(), "valid");
    TEST_ASSERT(config.password.size() == 4, "password generated");
    TEST_ASSERT(config.plan == "personal_pro", "plan");

    session::HostOptions options = config.host_options();
    TEST_ASSERT(options.session.is_host && options.session.password == config.password, "host credentials");
    TEST_ASSERT(options.quality == streaming::Quality::HIGH, "quality");
    TEST_ASSERT(options.game_mode && !options.auto_quality, "game mode, manual quality");
    TEST_ASSERT(!options.allow_control, "view only");
    TEST_ASSERT(options.p2p_grace_ms == 5000, "grace in ms");
    TEST_ASSERT(options.p2p.ice_servers == webrtc::P2POptions().ice_servers, "default STUN servers");
    return true;
}

static bool test_explicit_credentials_kept() {
    client_config::ClientConfig config;
    Args args{"lunarview-peer", "-r", "host", "-i", "555555555", "-p", "ZZ99"};
    config.parse_command_line(args.argc(), args.argv());
    TEST_ASSERT(config.validate(), "valid");
    TEST_ASSERT(config.connection_id == "555555555" && config.password == "ZZ99", "not regenerated");
    return true;
}

static bool test_validation_failures() {
    client_config::ClientConfig bad_quality;
    bad_quality.quality = "ultra";
    TEST_ASSERT(!bad_quality.validate(), "unknown quality");

    client_config::ClientConfig game_quality;
    game_quality.quality = "game";
    TEST_ASSERT(!game_quality.validate(), "game preset only through game mode");

    client_config::ClientConfig bad_clipboard;
    bad_clipboard.clipboard_direction = "sideways";
    TEST_ASSERT(!bad_clipboard.validate(), "unknown clipboard direction");

    client_config::ClientConfig no_target;
    no_target.role = client_config::Role::VIEWER;
    TEST_ASSERT(!no_target.validate(), "viewer needs a target");

    client_config::ClientConfig negative;
    negative.max_reconnect_attempts = -1;
    TEST_ASSERT(!negative.validate(), "negative attempts");

    client_config::ClientConfig host;
    TEST_ASSERT(host.validate(), "defaults are a valid host");
    return true;
}

static bool test_client_config_file() {
    std::string path = write_temp(R"({
        "role": "viewer",
        "server": "wss://relay.example",
        "target": "111222333",
        "target-password": "QW12",
        "auto-quality": false,
        "clipboard": "send",
        "stun": ["stun:c.example:3478"],
        "reconnect-attempts": 7,
        "debug-transfer": true
    })");
    TEST_ASSERT(!path.empty(), "temp file");

    client_config::ClientConfig config;
    bool loaded = config.load_from_file(path);
    unlink(path.c_str());
    TEST_ASSERT(loaded, "loaded");
    TEST_ASSERT(config.role == client_config::Role::VIEWER, "role");
    TEST_ASSERT(config.server_url == "wss://relay.example", "server");
    TEST_ASSERT(config.target_id == "111222333" && config.target_password == "QW12", "target");
    TEST_ASSERT(!config.auto_quality && config.clipboard_direction == "send", "flags");
    TEST_ASSERT(config.stun_servers.size() == 1, "stun list");
    TEST_ASSERT(config.max_reconnect_attempts == 7 && config.debug_transfer, "numbers and debug flags");
    TEST_ASSERT(config.quality == "medium", "absent keys keep defaults");

    // Command line after --config wins
    std::string path2 = write_temp(R"({"role": "viewer", "target": "111222333", "quality": "low"})");
    client_config::ClientConfig layered;
    Args args{"lunarview-peer", "-c", path2, "-q", "high"};
    layered.parse_command_line(args.argc(), args.argv());
    unlink(path2.c_str());
    TEST_ASSERT(layered.target_id == "111222333", "file applied");
    TEST_ASSERT(layered.quality == "high", "command line overrides the file");
    return true;
}

static bool test_bad_config_files() {
    client_config::ClientConfig config;
    TEST_ASSERT(!config.load_from_file("/nonexistent/lunarview.json"), "missing file");

    std::string broken = write_temp("{not json");
    TEST_ASSERT(!config.load_from_file(broken), "invalid JSON");
    unlink(broken.c_str());

    std::string bad_role = write_temp(R"({"role": "spectator"})");
    TEST_ASSERT(!config.load_from_file(bad_role), "invalid role");
    unlink(bad_role.c_str());
    return true;
}

static bool test_client_env() {
    setenv("LUNARVIEW_SERVER", "ws://env.example:8080", 1);
    setenv("LUNARVIEW_PLAN", "business", 1);
    setenv("LUNARVIEW_DEBUG_STREAM", "1", 1);

    client_config::ClientConfig config;
    config.load_from_env();
    unsetenv("LUNARVIEW_SERVER");
    unsetenv("LUNARVIEW_PLAN");
    unsetenv("LUNARVIEW_DEBUG_STREAM");

    TEST_ASSERT(config.server_url == "ws://env.example:8080", "server from environment");
    TEST_ASSERT(config.plan == "business", "plan from environment");
    TEST_ASSERT(config.debug_stream && !config.debug_connection, "only the named debug flag");
    return true;
}

static bool test_server_config() {
    server_config::ServerConfig config;
    signaling::ServerOptions defaults = config.signaling_options();
    TEST_ASSERT(defaults.session_timeout_ms == 30LL * 60 * 1000, "30 minute session timeout");
    TEST_ASSERT(defaults.lockout_window_ms == 15LL * 60 * 1000, "15 minute lockout");
    TEST_ASSERT(defaults.max_failed_attempts == 5, "five attempts");

    std::string path = write_temp(R"({"port": 9000, "api-key": "from-file", "session-timeout": 10,
                                      "lockout": 1, "pbkdf2-iterations": 1000})");
    TEST_ASSERT(config.load_from_file(path), "loaded");
    unlink(path.c_str());

    Args args{"lunarview-relay", "-a", "9001", "--max-failed-attempts", "3", "--sweep-interval", "5"};
    config.parse_command_line(args.argc(), args.argv());

    TEST_ASSERT(config.signaling_port == 9000 && config.admin_port == 9001, "ports");
    TEST_ASSERT(config.admin_api_key == "from-file", "api key");

    signaling::ServerOptions options = config.signaling_options();
    TEST_ASSERT(options.session_timeout_ms == 10LL * 60 * 1000, "timeout in ms");
    TEST_ASSERT(options.lockout_window_ms == 60LL * 1000, "lockout in ms");
    TEST_ASSERT(options.sweep_interval_ms == 5000, "sweep in ms");
    TEST_ASSERT(options.max_failed_attempts == 3, "attempts");
    TEST_ASSERT(options.pbkdf2_iterations == 1000, "iterations");

    setenv("ADMIN_API_KEY", "from-env", 1);
    setenv("PORT", "7000", 1);
    server_config::ServerConfig env_config;
    env_config.load_from_env();
    unsetenv("ADMIN_API_KEY");
    unsetenv("PORT");
    TEST_ASSERT(env_config.admin_api_key == "from-env" && env_config.signaling_port == 7000, "environment");
    return true;
}

int main() {
    fprintf(stderr, "=== Configuration tests ===\n");

    RUN_TEST(test_viewer_command_line);
    RUN_TEST(test_host_command_line);
    RUN_TEST(test_explicit_credentials_kept);
    RUN_TEST(test_validation_failures);
    RUN_TEST(test_client_config_file);
    RUN_TEST(test_bad_config_files);
    RUN_TEST(test_client_env);
    RUN_TEST(test_server_config);

    if (tests_failed > 0) {
        fprintf(stderr, "%d test(s) failed\n", tests_failed);
        return 1;
    }
    fprintf(stderr, "All configuration tests passed\n");
    return 0;
}
