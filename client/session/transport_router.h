/*
 * Transport Router
 *
 * Picks the live transport for payload traffic: the P2P data channel
 * when it is open, otherwise the relay through the signaling server.
 * Inbound payload from either path is delivered to the same observers,
 * so streaming, input, clipboard and file transfer never see which
 * transport carried it.
 */

#ifndef TRANSPORT_ROUTER_H
#define TRANSPORT_ROUTER_H

#include "connection_state_machine.h"
#include "../webrtc/p2p_negotiator.h"
#include "../../common/protocol/messages.h"
#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <vector>

namespace session {

class TransportRouter {
public:
    using ObserverId = uint64_t;
    using PayloadObserver = std::function<void(const protocol::Message& msg)>;
    using FrameObserver = std::function<void(const std::vector<uint8_t>& frame)>;

    TransportRouter(ConnectionStateMachine& signaling, webrtc::P2PNegotiator& p2p);
    ~TransportRouter();

    TransportRouter(const TransportRouter&) = delete;
    TransportRouter& operator=(const TransportRouter&) = delete;

    /**
     * Send a payload message. Falls back to the relay when the data
     * channel is closed or the send fails.
     * @return false if neither path accepted it
     */
    bool send(const protocol::Message& msg);

    // Encoded frame: binary over P2P, screen-frame{base64} over the relay
    bool send_frame(const std::vector<uint8_t>& frame);

    bool is_p2p() const;

    ObserverId add_payload_observer(PayloadObserver observer);
    ObserverId add_frame_observer(FrameObserver observer);
    void remove_observer(ObserverId id);

private:
    void deliver(const protocol::Message& msg);
    void deliver_frame(const std::vector<uint8_t>& frame);

    ConnectionStateMachine& signaling_;
    webrtc::P2PNegotiator& p2p_;
    ConnectionStateMachine::ObserverId signaling_observer_;
    webrtc::P2PNegotiator::ObserverId text_observer_;
    webrtc::P2PNegotiator::ObserverId binary_observer_;
    std::atomic<bool> logged_fallback_;

    std::mutex observers_mutex_;
    ObserverId next_observer_id_;
    std::map<ObserverId, PayloadObserver> payload_observers_;
    std::map<ObserverId, FrameObserver> frame_observers_;
};

} // namespace session

#endif // TRANSPORT_ROUTER_H
