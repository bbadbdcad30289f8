/*
 * LunarView Peer
 *
 * Runs as host (streams a test pattern, logs injected input) or viewer
 * (connects to a host, counts received frames, optionally sends a file).
 */

#include "config/client_config.h"
#include "entitlement/entitlements.h"
#include "session/host_session.h"
#include "session/viewer_session.h"
#include "streaming/test_pattern.h"
#include "streaming/webp_encoder.h"
#include "../common/errors.h"
#include "../common/utils/debug_flags.h"
#include "../common/utils/scheduler.h"
#include <rtc/rtc.hpp>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <memory>
#include <mutex>
#include <thread>

static std::atomic<bool> g_running(true);

static void signal_handler(int sig) {
    (void)sig;
    g_running = false;
}

/*
 * No desktop backend: input is logged instead of injected
 */
class LogInjector : public input::InputInjector {
public:
    LogInjector(int width, int height) : width_(width), height_(height) {}

    void screen_size(int& width, int& height) const override {
        width = width_;
        height = height_;
    }

    void move_mouse(int x, int y) override {
        if (g_debug_connection) {
            fprintf(stderr, "Input: Mouse move %d,%d\n", x, y);
        }
    }

    void mouse_button(input::MouseButton button, bool down) override {
        static const char* names[] = {"left", "middle", "right"};
        fprintf(stderr, "Input: Mouse %s %s\n", names[static_cast<int>(button)], down ? "down" : "up");
    }

    void scroll(int amount) override {
        fprintf(stderr, "Input: Scroll %d\n", amount);
    }

    void key(const std::string& key, bool down, const input::Modifiers& modifiers) override {
        fprintf(stderr, "Input: Key %s %s%s%s%s%s\n", key.c_str(), down ? "down" : "up",
                modifiers.ctrl ? " +ctrl" : "", modifiers.alt ? " +alt" : "",
                modifiers.shift ? " +shift" : "", modifiers.meta ? " +meta" : "");
    }

private:
    int width_;
    int height_;
};

/*
 * Process-local clipboard
 */
class MemoryClipboard : public clipboard::ClipboardProvider {
public:
    std::string read_text() override {
        std::lock_guard<std::mutex> lock(mutex_);
        return text_;
    }

    void write_text(const std::string& text) override {
        std::lock_guard<std::mutex> lock(mutex_);
        text_ = text;
        fprintf(stderr, "Clipboard: Received %zu bytes\n", text.size());
    }

private:
    std::mutex mutex_;
    std::string text_;
};

static void log_progress(const transfer::TransferProgress& progress) {
    if (progress.status == transfer::TransferStatus::TRANSFERRING && !g_debug_transfer) {
        return;
    }
    fprintf(stderr, "Transfer: %s %s %.0f%% (%s)%s%s\n",
            progress.direction == transfer::Direction::SEND ? "send" : "receive",
            progress.file_name.c_str(), progress.percent,
            transfer::status_name(progress.status),
            progress.error.empty() ? "" : " ", progress.error.c_str());
}

static int run_host(client_config::ClientConfig& config, scheduler::TimerThread& timers,
                    entitlement::PlanEntitlements& entitlements) {
    streaming::TestPatternCapturer capturer;
    streaming::WebPEncoder encoder;
    const streaming::QualityPreset& largest = streaming::preset(streaming::Quality::HIGH);
    LogInjector injector(largest.width, largest.height);
    MemoryClipboard clipboard;

    session::HostServices services{capturer, encoder, injector, clipboard, entitlements};
    session::HostSession host(timers, session::rtc_socket_factory(), services, config.host_options());
    host.transfers().add_progress_observer(log_progress);

    host.start();

    while (g_running) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    fprintf(stderr, "\nClient: Shutting down...\n");
    host.stop();
    return 0;
}

static int run_viewer(client_config::ClientConfig& config, scheduler::TimerThread& timers,
                      entitlement::PlanEntitlements& entitlements) {
    MemoryClipboard clipboard;
    session::ViewerServices services{clipboard, entitlements};
    session::ViewerSession viewer(timers, session::rtc_socket_factory(), services, config.viewer_options());
    viewer.transfers().add_progress_observer(log_progress);

    std::atomic<uint64_t> frames(0);
    std::atomic<uint64_t> bytes(0);
    viewer.add_frame_observer([&frames, &bytes](const std::vector<uint8_t>& frame) {
        frames++;
        bytes += frame.size();
    });

    viewer.start();

    bool file_sent = config.send_file.empty();
    auto last_report = std::chrono::steady_clock::now();

    while (g_running) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));

        if (!file_sent && viewer.in_session()) {
            file_sent = true;
            try {
                std::string id = viewer.send_file(config.send_file);
                fprintf(stderr, "Transfer: Sending %s (%s)\n", config.send_file.c_str(), id.c_str());
            } catch (const errors::Error& e) {
                fprintf(stderr, "Transfer: Cannot send %s: %s\n", config.send_file.c_str(), e.what());
            }
        }

        auto now = std::chrono::steady_clock::now();
        if (now - last_report >= std::chrono::seconds(5)) {
            last_report = now;
            uint64_t count = frames.exchange(0);
            uint64_t total = bytes.exchange(0);
            if (count > 0) {
                fprintf(stderr, "Stream: %.1f fps, %llu KB/s (%s)\n", count / 5.0,
                        (unsigned long long)(total / 5 / 1024),
                        viewer.router().is_p2p() ? "p2p" : "relay");
            }
        }
    }

    fprintf(stderr, "\nClient: Shutting down...\n");
    viewer.stop();
    return 0;
}

int main(int argc, char* argv[]) {
    client_config::ClientConfig config;
    config.load_from_env();
    config.parse_command_line(argc, argv);
    if (!config.validate()) {
        return 1;
    }
    config.apply_debug_flags();

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);
    signal(SIGPIPE, SIG_IGN);

    rtc::InitLogger(config.debug_connection ? rtc::LogLevel::Info : rtc::LogLevel::Error);

    config.print_summary();

    scheduler::TimerThread timers;
    entitlement::PlanEntitlements entitlements(config.plan, timers);

    int result;
    if (config.role == client_config::Role::HOST) {
        result = run_host(config, timers, entitlements);
    } else {
        result = run_viewer(config, timers, entitlements);
    }

    timers.stop();
    rtc::Cleanup();

    fprintf(stderr, "Client: Stopped\n");
    return result;
}
