/*
 * Host and Viewer Session Tests
 *
 * Both roles against a scripted signaling server. P2P never connects
 * (no ICE servers, no remote peer), so all payload goes through the
 * relay path.
 */

#include "test_support.h"
#include "../client/entitlement/entitlements.h"
#include "../client/session/host_session.h"
#include "../client/session/viewer_session.h"
#include "../common/utils/crypto_utils.h"
#include "../common/utils/json_utils.h"
#include <rtc/rtc.hpp>
#include <cctype>
#include <memory>
#include <vector>

using protocol::json;
using session::HostSession;
using session::ViewerSession;

class FlatCapturer : public streaming::FrameCapturer {
public:
    bool capture(int width, int height, streaming::RawFrame& frame) override {
        frame.width = width;
        frame.height = height;
        frame.rgba.assign(static_cast<size_t>(width) * height * 4, 0);
        return true;
    }
};

// Eight-byte frames keep the relay traffic small
class TinyEncoder : public streaming::FrameEncoder {
public:
    const char* name() const override { return "tiny"; }

    bool encode(const streaming::RawFrame&, int, std::vector<uint8_t>& output) override {
        output.assign(8, 0x42);
        return true;
    }
};

class RecordingInjector : public input::InputInjector {
public:
    void screen_size(int& width, int& height) const override {
        width = 1920;
        height = 1080;
    }

    void move_mouse(int x, int y) override {
        moves.emplace_back(x, y);
    }

    void mouse_button(input::MouseButton button, bool down) override {
        buttons.emplace_back(button, down);
    }

    void scroll(int amount) override {
        scrolls.push_back(amount);
    }

    void key(const std::string& key, bool down, const input::Modifiers& modifiers) override {
        keys.push_back(key);
        last_key_down = down;
        last_modifiers = modifiers;
    }

    std::vector<std::pair<int, int>> moves;
    std::vector<std::pair<input::MouseButton, bool>> buttons;
    std::vector<int> scrolls;
    std::vector<std::string> keys;
    bool last_key_down = false;
    input::Modifiers last_modifiers;
};

class MemoryClipboard : public clipboard::ClipboardProvider {
public:
    std::string read_text() override { return text; }
    void write_text(const std::string& value) override { text = value; }

    std::string text;
};

static webrtc::P2POptions offline_p2p() {
    webrtc::P2POptions options;
    options.ice_servers.clear();
    return options;
}

struct HostHarness {
    ManualScheduler clock;
    std::vector<std::shared_ptr<FakeSocket>> sockets;
    FlatCapturer capturer;
    TinyEncoder encoder;
    RecordingInjector injector;
    MemoryClipboard clipboard;
    entitlement::PlanEntitlements plan;
    std::unique_ptr<HostSession> host;

    explicit HostHarness(const std::string& plan_name, bool allow_control = true)
        : plan(plan_name, clock)
    {
        session::HostOptions options;
        options.session.server_url = "ws://relay.test:8080";
        options.session.connection_id = "123456789";
        options.session.password = "AB12";
        options.p2p = offline_p2p();
        options.allow_control = allow_control;
        options.p2p_grace_ms = 10000;

        session::HostServices services{capturer, encoder, injector, clipboard, plan};
        host.reset(new HostSession(clock, [this]() {
            auto sock = std::make_shared<FakeSocket>();
            sockets.push_back(sock);
            return sock;
        }, services, options));
    }

    FakeSocket& socket() { return *sockets.back(); }

    void register_host() {
        host->start();
        socket().server_open();
        protocol::Registered reply;
        reply.connection_id = "123456789";
        socket().server_send(reply);
    }

    void viewer_joins(const std::string& session_id) {
        protocol::IncomingConnection incoming;
        incoming.session_id = session_id;
        incoming.from_connection_id = "987654321";
        socket().server_send(incoming);
    }
};

static protocol::MouseEvent mouse(const json& event) {
    protocol::MouseEvent msg;
    msg.event = event;
    return msg;
}

static protocol::KeyboardEvent keyboard(const json& event) {
    protocol::KeyboardEvent msg;
    msg.event = event;
    return msg;
}

static protocol::ClipboardSync clipboard_text(const std::string& text) {
    protocol::ClipboardSync msg;
    msg.content.data = text;
    return msg;
}

static bool test_generated_credentials() {
    for (int i = 0; i < 20; i++) {
        std::string id = session::generate_connection_id();
        TEST_ASSERT(id.size() == 9, "nine characters");
        for (char c : id) {
            TEST_ASSERT(std::isdigit(static_cast<unsigned char>(c)), "digits only");
        }
        std::string password = session::generate_password();
        TEST_ASSERT(password.size() == 4, "four characters");
        for (char c : password) {
            TEST_ASSERT(std::isupper(static_cast<unsigned char>(c)) || std::isdigit(static_cast<unsigned char>(c)),
                        "A-Z and 0-9 only");
        }
    }
    return true;
}

static bool test_host_registers_and_admits_viewer() {
    HostHarness h("personal_pro");
    h.register_host();

    auto regs = sent_of<protocol::Register>(h.socket().messages());
    TEST_ASSERT(regs.size() == 1 && regs[0].is_host && regs[0].password == "AB12", "registered as host");
    TEST_ASSERT(!h.host->in_session(), "idle until a viewer joins");

    h.viewer_joins("s-1");
    TEST_ASSERT(h.host->in_session(), "session started");
    TEST_ASSERT(h.plan.connections_today() == 1, "connection counted");
    TEST_ASSERT(h.host->connection().partner_id() == "987654321", "viewer recorded");
    return true;
}

static bool test_host_applies_relayed_input() {
    HostHarness h("personal_pro");
    h.register_host();
    h.viewer_joins("s-1");

    h.socket().server_send(mouse(json{{"type", "move"}, {"x", 0.5}, {"y", 0.25}}));
    TEST_ASSERT(h.injector.moves.size() == 1, "mouse move applied");
    TEST_ASSERT(h.injector.moves[0].first == 960 && h.injector.moves[0].second == 270, "scaled to the screen");

    h.socket().server_send(mouse(json{{"type", "down"}, {"button", 2}}));
    TEST_ASSERT(h.injector.buttons.size() == 1 && h.injector.buttons[0].first == input::MouseButton::RIGHT &&
                h.injector.buttons[0].second, "right button down");

    h.socket().server_send(mouse(json{{"type", "scroll"}, {"deltaY", 120}}));
    TEST_ASSERT(h.injector.scrolls.size() == 1 && h.injector.scrolls[0] < 0, "positive deltaY scrolls down");

    // Wrapped in relayed{data}
    protocol::Relayed relayed;
    relayed.data = json_utils::parse(protocol::encode(
        keyboard(json{{"type", "down"}, {"key", "A"}, {"ctrlKey", true}})));
    h.socket().server_send(relayed);
    TEST_ASSERT(h.injector.keys.size() == 1 && h.injector.keys[0] == "a", "key lowercased");
    TEST_ASSERT(h.injector.last_key_down && h.injector.last_modifiers.ctrl, "modifiers carried");

    h.socket().server_send(keyboard(json{{"type", "up"}, {"key", "ArrowUp"}}));
    TEST_ASSERT(h.injector.keys.back() == "up" && !h.injector.last_key_down, "special key mapped");

    h.socket().server_send(keyboard(json{{"type", "down"}, {"key", "Unidentified"}}));
    TEST_ASSERT(h.injector.keys.size() == 2, "unmapped key dropped");
    return true;
}

static bool test_view_only_host_ignores_input() {
    HostHarness h("personal_pro", false);
    h.register_host();
    h.viewer_joins("s-1");

    h.socket().server_send(mouse(json{{"type", "move"}, {"x", 0.1}, {"y", 0.1}}));
    h.socket().server_send(keyboard(json{{"type", "down"}, {"key", "x"}}));
    TEST_ASSERT(h.injector.moves.empty() && h.injector.keys.empty(), "input dropped");
    return true;
}

static bool test_host_clipboard_sync() {
    HostHarness h("personal_pro");
    h.clipboard.text = "before the session";
    h.register_host();
    h.viewer_joins("s-1");

    h.clock.advance(500);
    TEST_ASSERT(sent_of<protocol::ClipboardSync>(h.socket().messages()).empty(), "existing content not sent");

    h.socket().server_send(clipboard_text("from viewer"));
    TEST_ASSERT(h.clipboard.text == "from viewer", "remote content applied");
    h.clock.advance(500);
    TEST_ASSERT(sent_of<protocol::ClipboardSync>(h.socket().messages()).empty(), "remote content not echoed");

    h.clipboard.text = "copied on host";
    h.clock.advance(500);
    auto syncs = sent_of<protocol::ClipboardSync>(h.socket().messages());
    TEST_ASSERT(syncs.size() == 1 && syncs[0].content.data == "copied on host", "local change sent");
    return true;
}

static bool test_host_streams_over_relay_after_grace() {
    HostHarness h("personal_pro");
    h.register_host();
    h.viewer_joins("s-1");

    h.clock.advance(9999);
    TEST_ASSERT(!h.host->streamer().is_running(), "waiting for P2P");
    TEST_ASSERT(sent_of<protocol::ScreenFrame>(h.socket().messages()).empty(), "no frames yet");

    h.clock.advance(1001);
    TEST_ASSERT(h.host->streamer().is_running(), "streaming after the grace period");
    auto frames = sent_of<protocol::ScreenFrame>(h.socket().messages());
    TEST_ASSERT(!frames.empty(), "frames sent through the relay");

    std::vector<uint8_t> decoded;
    TEST_ASSERT(crypto_utils::base64_decode(frames[0].frame, decoded), "frame is base64");
    TEST_ASSERT(decoded.size() == 8 && decoded[0] == 0x42, "encoder output carried");

    h.socket().server_send(protocol::Disconnected{protocol::REASON_PARTNER_DISCONNECTED});
    TEST_ASSERT(!h.host->in_session(), "session over when the viewer leaves");
    TEST_ASSERT(!h.host->streamer().is_running(), "streaming stopped");
    return true;
}

static bool test_free_plan_session_limit() {
    HostHarness h("free");
    h.register_host();
    h.viewer_joins("s-1");
    TEST_ASSERT(h.host->in_session(), "session started");

    h.clock.advance(30 * 60 * 1000 - 1);
    TEST_ASSERT(h.host->in_session(), "still inside the limit");
    h.clock.advance(1);
    TEST_ASSERT(!h.host->in_session(), "ended at the limit");
    TEST_ASSERT(sent_of<protocol::Disconnect>(h.socket().messages()).size() == 1, "disconnect sent");
    TEST_ASSERT(h.host->connection().state() == session::ConnectionState::CONNECTED, "server link kept");
    TEST_ASSERT(!h.host->streamer().is_running(), "streaming stopped");
    return true;
}

static bool test_free_plan_daily_limit() {
    HostHarness h("free");
    h.register_host();

    for (int i = 0; i < 5; i++) {
        h.viewer_joins("s-" + std::to_string(i));
        TEST_ASSERT(h.host->in_session(), "session within the daily limit");
        h.socket().server_send(protocol::Disconnected{protocol::REASON_PARTNER_DISCONNECTED});
    }
    TEST_ASSERT(h.plan.connections_today() == 5, "five sessions counted");

    h.viewer_joins("s-5");
    TEST_ASSERT(!h.host->in_session(), "sixth session refused");
    TEST_ASSERT(sent_of<protocol::Disconnect>(h.socket().messages()).size() == 1, "viewer dropped");
    TEST_ASSERT(h.plan.connections_today() == 5, "refused session not counted");
    return true;
}

struct ViewerHarness {
    ManualScheduler clock;
    std::vector<std::shared_ptr<FakeSocket>> sockets;
    MemoryClipboard clipboard;
    entitlement::PlanEntitlements plan{"personal_pro", clock};
    std::unique_ptr<ViewerSession> viewer;

    ViewerHarness() {
        session::ViewerOptions options;
        options.session.server_url = "ws://relay.test:8080";
        options.session.connection_id = "987654321";
        options.p2p = offline_p2p();
        options.target_id = "123456789";
        options.target_password = "AB12";

        session::ViewerServices services{clipboard, plan};
        viewer.reset(new ViewerSession(clock, [this]() {
            auto sock = std::make_shared<FakeSocket>();
            sockets.push_back(sock);
            return sock;
        }, services, options));
    }

    FakeSocket& socket() { return *sockets.back(); }
};

static bool test_viewer_session_flow() {
    ViewerHarness h;
    h.viewer->start();
    h.socket().server_open();

    auto regs = sent_of<protocol::Register>(h.socket().messages());
    TEST_ASSERT(regs.size() == 1 && !regs[0].is_host && regs[0].password.empty(), "registered as viewer");

    protocol::Registered registered;
    registered.connection_id = "987654321";
    h.socket().server_send(registered);
    auto connects = sent_of<protocol::Connect>(h.socket().messages());
    TEST_ASSERT(connects.size() == 1 && connects[0].target_connection_id == "123456789" &&
                connects[0].password == "AB12", "host requested after registering");
    TEST_ASSERT(!h.viewer->send_mouse(json{{"type", "move"}, {"x", 0.5}, {"y", 0.5}}), "no input before the session");

    protocol::ConnectSuccess success;
    success.session_id = "s-1";
    success.target_connection_id = "123456789";
    h.socket().server_send(success);
    TEST_ASSERT(h.viewer->in_session(), "session active");
    TEST_ASSERT(h.plan.connections_today() == 1, "connection counted");

    auto offers = sent_of<protocol::Offer>(h.socket().messages());
    TEST_ASSERT(offers.size() == 1 && offers[0].offer.type == "offer", "P2P offer sent");

    // The host never answers, so payload stays on the relay
    TEST_ASSERT(!h.viewer->router().is_p2p(), "relay until the channel opens");

    std::vector<std::vector<uint8_t>> frames;
    h.viewer->add_frame_observer([&frames](const std::vector<uint8_t>& frame) { frames.push_back(frame); });
    protocol::ScreenFrame frame;
    frame.frame = crypto_utils::base64_encode(std::vector<uint8_t>{1, 2, 3});
    h.socket().server_send(frame);
    TEST_ASSERT(frames.size() == 1 && frames[0].size() == 3, "relayed frame delivered");

    TEST_ASSERT(h.viewer->send_mouse(json{{"type", "move"}, {"x", 0.5}, {"y", 0.5}}), "mouse sent");
    TEST_ASSERT(h.viewer->send_keyboard(json{{"type", "down"}, {"key", "a"}}), "key sent");
    TEST_ASSERT(sent_of<protocol::MouseEvent>(h.socket().messages()).size() == 1, "mouse through the relay");
    TEST_ASSERT(sent_of<protocol::KeyboardEvent>(h.socket().messages()).size() == 1, "key through the relay");

    h.socket().server_send(clipboard_text("from host"));
    TEST_ASSERT(h.clipboard.text == "from host", "host clipboard applied");

    h.socket().server_send(protocol::Disconnected{protocol::REASON_PARTNER_DISCONNECTED});
    TEST_ASSERT(!h.viewer->in_session(), "session over");
    TEST_ASSERT(h.viewer->p2p().state() == webrtc::TransportState::CLOSED, "peer connection closed");

    h.viewer->stop();
    return true;
}

static bool test_viewer_connect_error() {
    ViewerHarness h;
    h.viewer->start();
    h.socket().server_open();
    protocol::Registered registered;
    registered.connection_id = "987654321";
    h.socket().server_send(registered);

    h.socket().server_send(protocol::ConnectError{"Invalid password"});
    TEST_ASSERT(!h.viewer->in_session(), "no session");
    TEST_ASSERT(h.viewer->connection().state() == session::ConnectionState::ERROR, "error surfaced");
    TEST_ASSERT(sent_of<protocol::Offer>(h.socket().messages()).empty(), "no offer without a session");
    return true;
}

int main() {
    fprintf(stderr, "=== Session tests ===\n");
    rtc::InitLogger(rtc::LogLevel::Error);

    RUN_TEST(test_generated_credentials);
    RUN_TEST(test_host_registers_and_admits_viewer);
    RUN_TEST(test_host_applies_relayed_input);
    RUN_TEST(test_view_only_host_ignores_input);
    RUN_TEST(test_host_clipboard_sync);
    RUN_TEST(test_host_streams_over_relay_after_grace);
    RUN_TEST(test_free_plan_session_limit);
    RUN_TEST(test_free_plan_daily_limit);
    RUN_TEST(test_viewer_session_flow);
    RUN_TEST(test_viewer_connect_error);

    rtc::Cleanup();

    if (tests_failed > 0) {
        fprintf(stderr, "%d test(s) failed\n", tests_failed);
        return 1;
    }
    fprintf(stderr, "All session tests passed\n");
    return 0;
}
