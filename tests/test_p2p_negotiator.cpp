/*
 * P2P Negotiator Tests
 *
 * Offer/answer and candidate buffering against real libdatachannel
 * peer connections. No ICE servers are configured and the channel is
 * never expected to open, so nothing here needs the network.
 */

#include "test_support.h"
#include "../client/webrtc/p2p_negotiator.h"
#include "../common/errors.h"
#include <rtc/rtc.hpp>
#include <vector>

using webrtc::P2PNegotiator;
using webrtc::TransportState;

static webrtc::P2POptions local_options() {
    webrtc::P2POptions options;
    options.ice_servers.clear();
    return options;
}

static protocol::IceCandidate host_candidate(const std::string& ip, int port) {
    protocol::IceCandidate c;
    c.candidate = "candidate:1 1 UDP 2122317823 " + ip + " " + std::to_string(port) + " typ host";
    c.sdp_mid = "0";
    return c;
}

static bool test_answer_before_offer_throws() {
    P2PNegotiator negotiator(local_options());
    bool threw = false;
    try {
        negotiator.handle_answer(protocol::SessionDescription{"answer", "v=0\r\n"});
    } catch (const errors::TransportError&) {
        threw = true;
    }
    TEST_ASSERT(threw, "handle_answer without a peer connection throws TransportError");
    TEST_ASSERT(negotiator.state() == TransportState::NEW, "state untouched");
    return true;
}

static bool test_candidates_buffered_until_remote_description() {
    P2PNegotiator negotiator(local_options());
    negotiator.add_ice_candidate(host_candidate("192.168.1.10", 50000));
    negotiator.add_ice_candidate(host_candidate("192.168.1.11", 50001));
    TEST_ASSERT(negotiator.pending_candidate_count() == 2, "buffered before any peer connection");

    protocol::SessionDescription offer = negotiator.create_offer();
    TEST_ASSERT(offer.type == "offer", "offer type");
    TEST_ASSERT(offer.sdp.find("m=application") != std::string::npos, "offer carries a data channel");
    TEST_ASSERT(negotiator.state() == TransportState::CONNECTING, "connecting after offer");

    negotiator.add_ice_candidate(host_candidate("192.168.1.12", 50002));
    TEST_ASSERT(negotiator.pending_candidate_count() == 3, "still buffered without a remote answer");

    P2PNegotiator answerer(local_options());
    protocol::SessionDescription answer = answerer.handle_offer(offer);
    TEST_ASSERT(answer.type == "answer", "answer type");
    TEST_ASSERT(!answer.sdp.empty(), "answer sdp");

    negotiator.handle_answer(answer);
    TEST_ASSERT(negotiator.pending_candidate_count() == 0, "buffer drained by the answer");

    answerer.disconnect();
    negotiator.disconnect();
    return true;
}

static bool test_answerer_drains_on_offer() {
    P2PNegotiator offerer(local_options());
    P2PNegotiator answerer(local_options());

    answerer.add_ice_candidate(host_candidate("10.0.0.5", 40000));
    TEST_ASSERT(answerer.pending_candidate_count() == 1, "early candidate held");

    answerer.handle_offer(offerer.create_offer());
    TEST_ASSERT(answerer.pending_candidate_count() == 0, "drained once the offer is applied");

    // Applied directly now that the remote description is set
    answerer.add_ice_candidate(host_candidate("10.0.0.6", 40001));
    TEST_ASSERT(answerer.pending_candidate_count() == 0, "later candidate not buffered");
    return true;
}

static bool test_bad_offer_throws() {
    P2PNegotiator negotiator(local_options());
    bool threw = false;
    try {
        negotiator.handle_offer(protocol::SessionDescription{"offer", "not an sdp"});
    } catch (const errors::TransportError&) {
        threw = true;
    }
    TEST_ASSERT(threw, "malformed offer throws TransportError");
    negotiator.disconnect();
    return true;
}

static bool test_send_on_closed_channel() {
    P2PNegotiator negotiator(local_options());
    const uint8_t bytes[] = {1, 2, 3};
    TEST_ASSERT(!negotiator.send("hello"), "no channel");
    TEST_ASSERT(!negotiator.send_binary(bytes, sizeof(bytes)), "no channel (binary)");

    negotiator.create_offer();
    TEST_ASSERT(!negotiator.send("hello"), "channel not open yet");
    TEST_ASSERT(!negotiator.is_connected(), "not connected");

    negotiator.disconnect();
    TEST_ASSERT(!negotiator.send("hello"), "channel closed");
    return true;
}

static bool test_disconnect_idempotent() {
    P2PNegotiator negotiator(local_options());
    std::vector<TransportState> states;
    negotiator.add_state_observer([&states](TransportState s) { states.push_back(s); });

    negotiator.disconnect();
    TEST_ASSERT(states.empty(), "nothing to close");

    negotiator.create_offer();
    negotiator.add_ice_candidate(host_candidate("192.168.1.10", 50000));
    negotiator.disconnect();
    TEST_ASSERT(negotiator.state() == TransportState::CLOSED, "closed");
    TEST_ASSERT(negotiator.pending_candidate_count() == 0, "buffer cleared");

    size_t seen = states.size();
    negotiator.disconnect();
    negotiator.disconnect();
    TEST_ASSERT(states.size() == seen, "repeat disconnects are no-ops");
    TEST_ASSERT(negotiator.state() == TransportState::CLOSED, "still closed");
    return true;
}

static bool test_renegotiation_replaces_connection() {
    P2PNegotiator negotiator(local_options());
    negotiator.add_ice_candidate(host_candidate("192.168.1.10", 50000));
    protocol::SessionDescription first = negotiator.create_offer();
    protocol::SessionDescription second = negotiator.create_offer();
    TEST_ASSERT(first.sdp != second.sdp, "fresh offer for the new connection");
    TEST_ASSERT(negotiator.pending_candidate_count() == 1, "buffered candidates survive");
    negotiator.disconnect();
    return true;
}

int main() {
    fprintf(stderr, "=== P2P negotiator tests ===\n");
    rtc::InitLogger(rtc::LogLevel::Error);

    RUN_TEST(test_answer_before_offer_throws);
    RUN_TEST(test_candidates_buffered_until_remote_description);
    RUN_TEST(test_answerer_drains_on_offer);
    RUN_TEST(test_bad_offer_throws);
    RUN_TEST(test_send_on_closed_channel);
    RUN_TEST(test_disconnect_idempotent);
    RUN_TEST(test_renegotiation_replaces_connection);

    rtc::Cleanup();

    if (tests_failed > 0) {
        fprintf(stderr, "%d test(s) failed\n", tests_failed);
        return 1;
    }
    fprintf(stderr, "All P2P negotiator tests passed\n");
    return 0;
}
