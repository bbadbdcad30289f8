/*
 * Connection State Machine Tests
 *
 * Registration, session setup, heartbeat and the reconnect backoff,
 * with fake sockets and a manual clock.
 */

#include "test_support.h"
#include "../client/session/connection_state_machine.h"
#include <memory>
#include <utility>
#include <vector>

using session::ConnectionState;
using session::ConnectionStateMachine;

struct Harness {
    ManualScheduler clock;
    std::vector<std::shared_ptr<FakeSocket>> sockets;
    std::vector<std::pair<ConnectionState, std::string>> states;
    ConnectionStateMachine machine{clock, [this]() {
        auto sock = std::make_shared<FakeSocket>();
        sockets.push_back(sock);
        return sock;
    }};

    Harness() {
        machine.add_state_observer([this](ConnectionState state, const std::string& detail) {
            states.emplace_back(state, detail);
        });
    }

    session::SessionOptions options(bool is_host) {
        session::SessionOptions o;
        o.server_url = "ws://relay.test:8080";
        o.connection_id = is_host ? "123456789" : "987654321";
        o.password = is_host ? "AB12" : "";
        o.is_host = is_host;
        o.max_reconnect_attempts = 5;
        o.reconnect_delay_ms = 1000;
        o.heartbeat_interval_ms = 30000;
        return o;
    }

    FakeSocket& socket() { return *sockets.back(); }

    // Connect, open the socket and answer the register
    void connect_registered(bool is_host) {
        machine.connect(options(is_host));
        socket().server_open();
        protocol::Registered reply;
        reply.connection_id = options(is_host).connection_id;
        socket().server_send(reply);
    }
};

static bool test_connect_registers() {
    Harness h;
    h.machine.connect(h.options(true));
    TEST_ASSERT(h.machine.state() == ConnectionState::CONNECTING, "connecting");
    TEST_ASSERT(h.sockets.size() == 1 && h.socket().url == "ws://relay.test:8080", "socket opened to server");

    h.socket().server_open();
    auto regs = sent_of<protocol::Register>(h.socket().messages());
    TEST_ASSERT(regs.size() == 1, "register sent on open");
    TEST_ASSERT(regs[0].connection_id == "123456789" && regs[0].password == "AB12" && regs[0].is_host,
                "register fields");
    TEST_ASSERT(h.machine.state() == ConnectionState::CONNECTING, "still connecting until registered");

    protocol::Registered reply;
    reply.connection_id = "123456789";
    h.socket().server_send(reply);
    TEST_ASSERT(h.machine.state() == ConnectionState::CONNECTED, "connected after registered");

    h.machine.connect(h.options(true));
    TEST_ASSERT(h.sockets.size() == 1, "connect ignored unless disconnected");
    return true;
}

static bool test_viewer_session_flow() {
    Harness h;
    h.connect_registered(false);

    TEST_ASSERT(h.machine.connect_to_host("123456789", "AB12"), "connect request sent");
    TEST_ASSERT(h.machine.state() == ConnectionState::AUTHENTICATING, "authenticating");
    auto connects = sent_of<protocol::Connect>(h.socket().messages());
    TEST_ASSERT(connects.size() == 1 && connects[0].target_connection_id == "123456789" &&
                connects[0].password == "AB12", "connect fields");

    protocol::ConnectSuccess success;
    success.session_id = "sess-1";
    success.target_connection_id = "123456789";
    success.target_public_key = "pk";
    h.socket().server_send(success);
    TEST_ASSERT(h.machine.state() == ConnectionState::SESSION_ACTIVE, "session active");
    TEST_ASSERT(h.machine.session_id() == "sess-1" && h.machine.partner_id() == "123456789", "session recorded");
    TEST_ASSERT(h.machine.partner_public_key() == "pk", "partner key recorded");

    h.socket().server_send(protocol::Disconnected{protocol::REASON_PARTNER_DISCONNECTED});
    TEST_ASSERT(h.machine.state() == ConnectionState::CONNECTED, "back to connected when partner leaves");
    TEST_ASSERT(h.machine.session_id().empty(), "session cleared");
    TEST_ASSERT(h.states.back().second == protocol::REASON_PARTNER_DISCONNECTED, "reason surfaced");
    return true;
}

static bool test_connect_error_is_recoverable() {
    Harness h;
    h.connect_registered(false);
    h.machine.connect_to_host("123456789", "WRONG");
    h.socket().server_send(protocol::ConnectError{"Invalid password"});

    TEST_ASSERT(h.machine.state() == ConnectionState::ERROR, "error state");
    TEST_ASSERT(h.states.back().second == "Invalid password", "error detail surfaced");
    TEST_ASSERT(h.machine.connect_to_host("123456789", "AB12"), "retry allowed from error");
    TEST_ASSERT(h.machine.state() == ConnectionState::AUTHENTICATING, "authenticating again");
    return true;
}

static bool test_connect_to_host_requires_connection() {
    Harness h;
    TEST_ASSERT(!h.machine.connect_to_host("123456789", "AB12"), "refused while disconnected");
    TEST_ASSERT(h.machine.state() == ConnectionState::DISCONNECTED, "state unchanged");
    return true;
}

static bool test_host_incoming_and_end_session() {
    Harness h;
    h.connect_registered(true);

    protocol::IncomingConnection incoming;
    incoming.session_id = "sess-2";
    incoming.from_connection_id = "987654321";
    h.socket().server_send(incoming);
    TEST_ASSERT(h.machine.state() == ConnectionState::SESSION_ACTIVE, "host session active");
    TEST_ASSERT(h.machine.partner_id() == "987654321", "viewer recorded");

    h.machine.end_session();
    TEST_ASSERT(sent_of<protocol::Disconnect>(h.socket().messages()).size() == 1, "disconnect sent");
    TEST_ASSERT(h.machine.state() == ConnectionState::CONNECTED, "server link kept");
    TEST_ASSERT(!h.socket().closed, "socket still open");
    return true;
}

static bool test_heartbeat() {
    Harness h;
    h.connect_registered(true);

    h.clock.advance(30000);
    TEST_ASSERT(sent_of<protocol::Ping>(h.socket().messages()).size() == 1, "one ping per interval");
    h.clock.advance(60000);
    TEST_ASSERT(sent_of<protocol::Ping>(h.socket().messages()).size() == 3, "pings keep coming");

    h.machine.disconnect();
    TEST_ASSERT(h.clock.pending_count() == 0, "no timers after disconnect");
    return true;
}

static bool test_reconnect_backoff() {
    Harness h;
    h.connect_registered(true);
    h.clock.one_shot_delays.clear();

    // Server goes away and never comes back
    h.socket().server_close();
    TEST_ASSERT(h.machine.state() == ConnectionState::CONNECTING, "reconnecting");
    TEST_ASSERT(h.clock.pending_count() == 1, "heartbeat gone, one reconnect timer");

    for (int attempt = 1; attempt <= 5; attempt++) {
        TEST_ASSERT(h.clock.one_shot_delays.size() == static_cast<size_t>(attempt), "one timer per attempt");
        TEST_ASSERT(h.clock.one_shot_delays.back() == attempt * 1000, "linear backoff");
        size_t before = h.sockets.size();
        h.clock.advance(attempt * 1000);
        TEST_ASSERT(h.sockets.size() == before + 1, "new socket after the delay");
        h.socket().server_close();
    }

    TEST_ASSERT(h.machine.state() == ConnectionState::DISCONNECTED, "gave up after the cap");
    TEST_ASSERT(h.states.back().second == "Reconnect failed", "failure detail");
    TEST_ASSERT(h.clock.pending_count() == 0, "no timers left");
    TEST_ASSERT(h.sockets.size() == 6, "five reconnect attempts");
    return true;
}

static bool test_successful_reconnect_resets_attempts() {
    Harness h;
    h.connect_registered(true);
    h.socket().server_close();
    h.clock.advance(1000);
    h.socket().server_close();
    TEST_ASSERT(h.machine.reconnect_attempts() == 2, "two attempts so far");

    h.clock.advance(2000);
    h.socket().server_open();
    TEST_ASSERT(h.machine.reconnect_attempts() == 0, "attempts reset on open");
    TEST_ASSERT(sent_of<protocol::Register>(h.socket().messages()).size() == 1, "re-registered");
    return true;
}

static bool test_explicit_disconnect_never_reconnects() {
    Harness h;
    h.connect_registered(true);
    h.machine.disconnect();

    TEST_ASSERT(h.machine.state() == ConnectionState::DISCONNECTED, "disconnected");
    TEST_ASSERT(h.socket().closed, "socket closed");
    TEST_ASSERT(sent_of<protocol::Disconnect>(h.socket().messages()).size() == 1, "disconnect sent");

    // A late close callback from the old socket changes nothing
    h.socket().server_close();
    h.clock.advance(60000);
    TEST_ASSERT(h.sockets.size() == 1, "no reconnect");
    TEST_ASSERT(h.machine.state() == ConnectionState::DISCONNECTED, "still disconnected");
    TEST_ASSERT(!h.machine.send(protocol::Ping{}), "send fails when disconnected");
    return true;
}

static bool test_disconnect_during_backoff() {
    Harness h;
    h.connect_registered(true);
    h.socket().server_close();
    TEST_ASSERT(h.clock.pending_count() == 1, "reconnect pending");

    h.machine.disconnect();
    TEST_ASSERT(h.clock.pending_count() == 0, "reconnect timer cancelled");
    h.clock.advance(10000);
    TEST_ASSERT(h.sockets.size() == 1, "no new socket");
    return true;
}

static bool test_registered_elsewhere_stops() {
    Harness h;
    h.connect_registered(true);
    h.socket().server_send(protocol::Disconnected{protocol::REASON_REGISTERED_ELSEWHERE});
    h.socket().server_close();
    h.clock.advance(60000);

    TEST_ASSERT(h.machine.state() == ConnectionState::DISCONNECTED, "disconnected");
    TEST_ASSERT(h.sockets.size() == 1, "evicted client does not reconnect");
    return true;
}

static bool test_message_observers() {
    Harness h;
    std::vector<std::string> types;
    h.machine.add_message_observer([&types](const protocol::Message& msg) {
        types.push_back(protocol::type_name(msg));
    });
    h.connect_registered(false);
    h.socket().callbacks.on_message("{broken");
    h.socket().server_send(protocol::Pong{});

    TEST_ASSERT(types.size() == 2 && types[0] == "registered" && types[1] == "pong", "decoded messages observed");
    return true;
}

int main() {
    fprintf(stderr, "=== Connection state machine tests ===\n");

    RUN_TEST(test_connect_registers);
    RUN_TEST(test_viewer_session_flow);
    RUN_TEST(test_connect_error_is_recoverable);
    RUN_TEST(test_connect_to_host_requires_connection);
    RUN_TEST(test_host_incoming_and_end_session);
    RUN_TEST(test_heartbeat);
    RUN_TEST(test_reconnect_backoff);
    RUN_TEST(test_successful_reconnect_resets_attempts);
    RUN_TEST(test_explicit_disconnect_never_reconnects);
    RUN_TEST(test_disconnect_during_backoff);
    RUN_TEST(test_registered_elsewhere_stops);
    RUN_TEST(test_message_observers);

    if (tests_failed > 0) {
        fprintf(stderr, "%d test(s) failed\n", tests_failed);
        return 1;
    }
    fprintf(stderr, "All connection state machine tests passed\n");
    return 0;
}
