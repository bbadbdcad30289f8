/*
 * Signaling Server Tests
 *
 * Registration, password-gated sessions, lockout, relay forwarding,
 * eviction and the idle sweep, driven through in-memory connections.
 */

#include "test_support.h"
#include "../server/signaling/signaling_server.h"
#include <memory>

using signaling::SignalingServer;

static signaling::ServerOptions test_options() {
    signaling::ServerOptions options;
    options.pbkdf2_iterations = 10;
    options.session_timeout_ms = 1000;
    options.sweep_interval_ms = 500;
    options.lockout_window_ms = 60 * 1000;
    return options;
}

static void register_peer(SignalingServer& server, const std::string& client_id,
                          const std::string& connection_id, const std::string& password, bool is_host) {
    protocol::Register reg;
    reg.connection_id = connection_id;
    reg.password = password;
    reg.is_host = is_host;
    server.on_message(client_id, protocol::encode(reg));
}

static void connect_peer(SignalingServer& server, const std::string& client_id,
                         const std::string& target, const std::string& password) {
    protocol::Connect msg;
    msg.target_connection_id = target;
    msg.password = password;
    server.on_message(client_id, protocol::encode(msg));
}

/*
 * Host and viewer linked into one session
 */
struct Linked {
    ManualScheduler clock;
    SignalingServer server{test_options(), clock};
    std::shared_ptr<FakeConnection> host = std::make_shared<FakeConnection>("10.0.0.1");
    std::shared_ptr<FakeConnection> viewer = std::make_shared<FakeConnection>("10.0.0.2");

    Linked() {
        server.on_open("c-host", host);
        register_peer(server, "c-host", "123456789", "AB12", true);
        server.on_open("c-viewer", viewer);
        register_peer(server, "c-viewer", "987654321", "", false);
        connect_peer(server, "c-viewer", "123456789", "AB12");
    }
};

static bool test_register_replies() {
    ManualScheduler clock;
    SignalingServer server(test_options(), clock);
    auto conn = std::make_shared<FakeConnection>();

    TEST_ASSERT(server.on_open("c1", conn), "socket accepted");
    register_peer(server, "c1", "123456789", "AB12", true);

    auto replies = sent_of<protocol::Registered>(conn->sent);
    TEST_ASSERT(replies.size() == 1, "one registered reply");
    TEST_ASSERT(replies[0].connection_id == "123456789", "registered echoes the connection ID");
    TEST_ASSERT(replies[0].client_id == "c1", "registered carries the client ID");

    auto peer = server.registry().find_by_connection_id("123456789");
    TEST_ASSERT(peer && peer->is_host, "host registered");
    TEST_ASSERT(peer->password_hash != "AB12" && !peer->password_hash.empty(), "password stored hashed");
    return true;
}

static bool test_session_scenario() {
    Linked t;

    auto success = sent_of<protocol::ConnectSuccess>(t.viewer->sent);
    auto incoming = sent_of<protocol::IncomingConnection>(t.host->sent);
    TEST_ASSERT(success.size() == 1, "viewer gets connect-success");
    TEST_ASSERT(incoming.size() == 1, "host gets incoming-connection");
    TEST_ASSERT(!success[0].session_id.empty(), "session id set");
    TEST_ASSERT(success[0].session_id == incoming[0].session_id, "both sides share the session id");
    TEST_ASSERT(success[0].target_connection_id == "123456789", "success names the host");
    TEST_ASSERT(incoming[0].from_connection_id == "987654321", "incoming names the viewer");

    auto host = t.server.registry().find("c-host");
    auto viewer = t.server.registry().find("c-viewer");
    TEST_ASSERT(host && viewer, "both peers present");
    TEST_ASSERT(host->connected_to == "c-viewer", "host linked to viewer");
    TEST_ASSERT(viewer->connected_to == "c-host", "viewer linked to host");

    std::string mouse = R"({"type":"mouse-event","event":{"type":"move","x":0.25,"y":0.75}})";
    size_t before = t.host->sent.size();
    t.server.on_message("c-viewer", mouse);
    TEST_ASSERT(t.host->sent.size() == before + 1, "mouse event forwarded");
    TEST_ASSERT(t.host->sent.back() == mouse, "mouse event forwarded verbatim");
    return true;
}

static bool test_wrong_password() {
    ManualScheduler clock;
    SignalingServer server(test_options(), clock);
    auto host = std::make_shared<FakeConnection>("10.0.0.1");
    auto viewer = std::make_shared<FakeConnection>("10.0.0.2");
    server.on_open("h", host);
    register_peer(server, "h", "123456789", "AB12", true);
    server.on_open("v", viewer);
    register_peer(server, "v", "987654321", "", false);

    connect_peer(server, "v", "123456789", "XXXX");
    auto errors = sent_of<protocol::ConnectError>(viewer->sent);
    TEST_ASSERT(errors.size() == 1 && errors[0].error == "Invalid password", "invalid password reported");
    TEST_ASSERT(sent_of<protocol::IncomingConnection>(host->sent).empty(), "host not notified");

    connect_peer(server, "v", "555555555", "AB12");
    errors = sent_of<protocol::ConnectError>(viewer->sent);
    TEST_ASSERT(errors.size() == 2 && errors[1].error == "Connection ID not found", "unknown target reported");

    auto logs = server.access_log().latest(10);
    bool found = false;
    for (const auto& entry : logs) {
        if (entry.event == "auth_failed" && !entry.success) found = true;
    }
    TEST_ASSERT(found, "auth failure logged");
    return true;
}

static bool test_lockout_after_five_failures() {
    ManualScheduler clock;
    SignalingServer server(test_options(), clock);
    auto host = std::make_shared<FakeConnection>("10.0.0.1");
    server.on_open("h", host);
    register_peer(server, "h", "123456789", "AB12", true);

    auto viewer = std::make_shared<FakeConnection>("10.9.9.9");
    server.on_open("v", viewer);
    register_peer(server, "v", "987654321", "", false);
    for (int i = 0; i < 5; i++) {
        connect_peer(server, "v", "123456789", "BAD" + std::to_string(i));
    }

    // Even the right password is refused now
    connect_peer(server, "v", "123456789", "AB12");
    auto errors = sent_of<protocol::ConnectError>(viewer->sent);
    TEST_ASSERT(errors.size() == 6, "six connect errors");
    TEST_ASSERT(errors[5].error == "Too many failed attempts", "locked out on existing socket");

    auto again = std::make_shared<FakeConnection>("10.9.9.9");
    TEST_ASSERT(!server.on_open("v2", again), "new socket from locked IP rejected");
    TEST_ASSERT(again->closed && again->close_code == signaling::CLOSE_IP_BLOCKED, "rejected socket closed");

    auto other = std::make_shared<FakeConnection>("10.9.9.10");
    TEST_ASSERT(server.on_open("v3", other), "other IPs unaffected");

    clock.advance(60 * 1000);
    auto later = std::make_shared<FakeConnection>("10.9.9.9");
    TEST_ASSERT(server.on_open("v4", later), "lockout expires with the window");
    return true;
}

static bool test_disconnect_notifies_once() {
    Linked t;
    t.server.on_message("c-viewer", protocol::encode(protocol::Disconnect{}));
    t.server.on_close("c-viewer");

    auto notices = sent_of<protocol::Disconnected>(t.host->sent);
    TEST_ASSERT(notices.size() == 1, "partner notified exactly once");
    TEST_ASSERT(notices[0].reason == protocol::REASON_PARTNER_DISCONNECTED, "partner reason");

    auto host = t.server.registry().find("c-host");
    TEST_ASSERT(host && host->connected_to.empty(), "host unlinked");
    TEST_ASSERT(!t.server.registry().find("c-viewer"), "viewer removed");
    TEST_ASSERT(!t.server.registry().find_by_connection_id("987654321"), "viewer ID released");
    return true;
}

static bool test_socket_close_notifies_partner() {
    Linked t;
    t.server.on_close("c-host");

    auto notices = sent_of<protocol::Disconnected>(t.viewer->sent);
    TEST_ASSERT(notices.size() == 1, "viewer notified once");
    auto viewer = t.server.registry().find("c-viewer");
    TEST_ASSERT(viewer && !viewer->is_linked(), "viewer unlinked");
    return true;
}

static bool test_target_busy() {
    Linked t;
    auto third = std::make_shared<FakeConnection>("10.0.0.3");
    t.server.on_open("c-third", third);
    register_peer(t.server, "c-third", "111222333", "", false);
    connect_peer(t.server, "c-third", "123456789", "AB12");

    auto errors = sent_of<protocol::ConnectError>(third->sent);
    TEST_ASSERT(errors.size() == 1 && errors[0].error == "Target busy", "linked host is busy");
    auto viewer = t.server.registry().find("c-viewer");
    TEST_ASSERT(viewer && viewer->connected_to == "c-host", "existing session intact");
    return true;
}

static bool test_reregister_evicts() {
    Linked t;
    auto usurper = std::make_shared<FakeConnection>("10.0.0.7");
    t.server.on_open("c-new", usurper);
    register_peer(t.server, "c-new", "123456789", "ZZ99", true);

    auto evicted = sent_of<protocol::Disconnected>(t.host->sent);
    TEST_ASSERT(evicted.size() == 1 && evicted[0].reason == protocol::REASON_REGISTERED_ELSEWHERE,
                "old holder told why");
    TEST_ASSERT(t.host->closed && t.host->close_code == signaling::CLOSE_EVICTED, "old holder closed");

    auto partner = sent_of<protocol::Disconnected>(t.viewer->sent);
    TEST_ASSERT(partner.size() == 1 && partner[0].reason == protocol::REASON_PARTNER_DISCONNECTED,
                "old partner notified");

    auto holder = t.server.registry().find_by_connection_id("123456789");
    TEST_ASSERT(holder && holder->client_id == "c-new", "ID now held by the new socket");
    TEST_ASSERT(!sent_of<protocol::Registered>(usurper->sent).empty(), "new holder registered");

    // The close callback of the evicted socket must not disturb the new holder
    t.server.on_close("c-host");
    holder = t.server.registry().find_by_connection_id("123456789");
    TEST_ASSERT(holder && holder->client_id == "c-new", "ID survives the old socket closing");
    return true;
}

static bool test_relay_wraps_payload() {
    Linked t;
    t.server.on_message("c-viewer", R"({"type":"relay","data":{"x":1,"nested":[1,2]}})");

    auto relayed = sent_of<protocol::Relayed>(t.host->sent);
    TEST_ASSERT(relayed.size() == 1, "relayed delivered");
    TEST_ASSERT(relayed[0].data["x"] == 1 && relayed[0].data["nested"].size() == 2, "data preserved");
    return true;
}

static bool test_unlinked_messages_dropped() {
    ManualScheduler clock;
    SignalingServer server(test_options(), clock);
    auto a = std::make_shared<FakeConnection>("10.0.0.1");
    auto b = std::make_shared<FakeConnection>("10.0.0.2");
    server.on_open("a", a);
    register_peer(server, "a", "123456789", "AB12", true);
    server.on_open("b", b);
    register_peer(server, "b", "987654321", "", false);

    size_t before = a->sent.size();
    server.on_message("b", R"({"type":"keyboard-event","event":{"type":"down","key":"a"}})");
    server.on_message("b", "not json");
    server.on_message("b", R"({"type":"no-such-type"})");
    TEST_ASSERT(a->sent.size() == before, "nothing forwarded without a session");

    server.on_message("b", protocol::encode(protocol::Ping{}));
    TEST_ASSERT(sent_of<protocol::Pong>(b->sent).size() == 1, "ping answered with pong");
    return true;
}

static bool test_idle_sweep() {
    ManualScheduler clock;
    SignalingServer server(test_options(), clock);
    auto active = std::make_shared<FakeConnection>("10.0.0.1");
    auto idle = std::make_shared<FakeConnection>("10.0.0.2");
    server.on_open("active", active);
    server.on_open("idle", idle);
    server.start();

    clock.advance(800);
    server.on_message("active", protocol::encode(protocol::Ping{}));
    clock.advance(700);

    TEST_ASSERT(idle->closed && idle->close_code == signaling::CLOSE_SESSION_TIMEOUT, "idle socket closed");
    TEST_ASSERT(!active->closed, "active socket kept");
    TEST_ASSERT(server.registry().size() == 1, "idle socket removed");

    server.stop();
    clock.advance(10000);
    TEST_ASSERT(!active->closed, "no sweep after stop");
    return true;
}

static bool test_admin_disconnect_and_block() {
    Linked t;
    TEST_ASSERT(t.server.disconnect_peer("123456789"), "known ID disconnected");
    TEST_ASSERT(t.host->closed && t.host->close_code == signaling::CLOSE_ADMIN_DISCONNECT, "closed by admin");
    TEST_ASSERT(sent_of<protocol::Disconnected>(t.viewer->sent).size() == 1, "partner notified");
    TEST_ASSERT(!t.server.disconnect_peer("123456789"), "unknown ID rejected");

    t.server.lockout().block("10.0.0.5");
    auto blocked = std::make_shared<FakeConnection>("10.0.0.5");
    TEST_ASSERT(!t.server.on_open("c-blocked", blocked), "blocked IP rejected");
    TEST_ASSERT(t.server.lockout().unblock("10.0.0.5"), "unblocked");
    auto allowed = std::make_shared<FakeConnection>("10.0.0.5");
    TEST_ASSERT(t.server.on_open("c-allowed", allowed), "unblocked IP accepted");
    return true;
}

int main() {
    fprintf(stderr, "=== Signaling server tests ===\n");

    RUN_TEST(test_register_replies);
    RUN_TEST(test_session_scenario);
    RUN_TEST(test_wrong_password);
    RUN_TEST(test_lockout_after_five_failures);
    RUN_TEST(test_disconnect_notifies_once);
    RUN_TEST(test_socket_close_notifies_partner);
    RUN_TEST(test_target_busy);
    RUN_TEST(test_reregister_evicts);
    RUN_TEST(test_relay_wraps_payload);
    RUN_TEST(test_unlinked_messages_dropped);
    RUN_TEST(test_idle_sweep);
    RUN_TEST(test_admin_disconnect_and_block);

    if (tests_failed > 0) {
        fprintf(stderr, "%d test(s) failed\n", tests_failed);
        return 1;
    }
    fprintf(stderr, "All signaling server tests passed\n");
    return 0;
}
