/*
 * P2P Transport Negotiator
 *
 * Negotiates a direct WebRTC data channel between host and viewer.
 * SDP and ICE candidates travel through the signaling server; this
 * class only produces and consumes them.
 *
 * The viewer is the initiator: create_offer() opens the data channel
 * locally. The host answers with handle_offer() and receives the
 * channel through onDataChannel. Remote candidates that arrive before
 * the remote description are held and applied once it is set.
 */

#ifndef P2P_NEGOTIATOR_H
#define P2P_NEGOTIATOR_H

#include "../../common/protocol/messages.h"
#include <rtc/rtc.hpp>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace webrtc {

enum class TransportState {
    NEW,
    CONNECTING,
    CONNECTED,      // Data channel open
    DISCONNECTED,
    FAILED,
    CLOSED
};

const char* transport_state_name(TransportState state);

struct P2POptions {
    std::vector<std::string> ice_servers = {
        "stun:stun.l.google.com:19302",
        "stun:stun1.l.google.com:19302",
        "stun:stun2.l.google.com:19302"
    };
    std::string channel_label = "remote-desktop";
    size_t max_message_size = 16 * 1024 * 1024;
};

class P2PNegotiator {
public:
    using ObserverId = uint64_t;
    using CandidateObserver = std::function<void(const protocol::IceCandidate& candidate)>;
    using StateObserver = std::function<void(TransportState state)>;
    using TextObserver = std::function<void(const std::string& text)>;
    using BinaryObserver = std::function<void(const uint8_t* data, size_t size)>;

    explicit P2PNegotiator(const P2POptions& options);
    ~P2PNegotiator();

    P2PNegotiator(const P2PNegotiator&) = delete;
    P2PNegotiator& operator=(const P2PNegotiator&) = delete;

    /**
     * Initiator: create the peer connection and data channel, set and
     * return the local offer
     * @throws errors::TransportError if libdatachannel rejects it
     */
    protocol::SessionDescription create_offer();

    /**
     * Answerer: create the peer connection, apply the remote offer,
     * set and return the local answer
     * @throws errors::TransportError
     */
    protocol::SessionDescription handle_offer(const protocol::SessionDescription& offer);

    /**
     * Initiator: apply the remote answer
     * @throws errors::TransportError("No peer connection") before create_offer()
     */
    void handle_answer(const protocol::SessionDescription& answer);

    // Applied now if the remote description is set, otherwise held
    void add_ice_candidate(const protocol::IceCandidate& candidate);

    // False if the data channel is not open
    bool send(const std::string& text);
    bool send_binary(const uint8_t* data, size_t size);

    bool is_connected() const;
    TransportState state() const;
    size_t pending_candidate_count() const;

    // Close the data channel, then the peer connection. Safe to repeat.
    void disconnect();

    ObserverId add_candidate_observer(CandidateObserver observer);
    ObserverId add_state_observer(StateObserver observer);
    ObserverId add_text_observer(TextObserver observer);
    ObserverId add_binary_observer(BinaryObserver observer);
    void remove_observer(ObserverId id);

private:
    std::shared_ptr<rtc::PeerConnection> create_peer_connection();
    void attach_channel(std::shared_ptr<rtc::DataChannel> channel);
    void replace_peer_connection(std::shared_ptr<rtc::PeerConnection> pc);
    void drain_candidates(std::shared_ptr<rtc::PeerConnection> pc);
    static void close_transport(std::shared_ptr<rtc::PeerConnection> pc,
                                std::shared_ptr<rtc::DataChannel> channel);
    protocol::SessionDescription local_description(std::shared_ptr<rtc::PeerConnection> pc);
    void set_state(TransportState state);

    P2POptions options_;

    mutable std::mutex mutex_;
    std::shared_ptr<rtc::PeerConnection> pc_;
    std::shared_ptr<rtc::DataChannel> channel_;
    bool has_remote_description_;
    std::vector<protocol::IceCandidate> pending_candidates_;
    TransportState state_;

    std::mutex observers_mutex_;
    ObserverId next_observer_id_;
    std::map<ObserverId, CandidateObserver> candidate_observers_;
    std::map<ObserverId, StateObserver> state_observers_;
    std::map<ObserverId, TextObserver> text_observers_;
    std::map<ObserverId, BinaryObserver> binary_observers_;
};

} // namespace webrtc

#endif // P2P_NEGOTIATOR_H
