/*
 * Transport Router Implementation
 */

#include "transport_router.h"
#include "../../common/utils/crypto_utils.h"
#include "../../common/utils/debug_flags.h"
#include <cstdio>

namespace session {

namespace {

// Signaling kinds are handled by the sessions, never routed as payload
bool is_signaling(const protocol::Message& msg) {
    return std::holds_alternative<protocol::Offer>(msg) ||
           std::holds_alternative<protocol::Answer>(msg) ||
           std::holds_alternative<protocol::IceCandidate>(msg) ||
           std::holds_alternative<protocol::KeyExchange>(msg);
}

} // namespace

TransportRouter::TransportRouter(ConnectionStateMachine& signaling, webrtc::P2PNegotiator& p2p)
    : signaling_(signaling)
    , p2p_(p2p)
    , logged_fallback_(false)
    , next_observer_id_(1)
{
    signaling_observer_ = signaling_.add_message_observer([this](const protocol::Message& msg) {
        if (std::holds_alternative<protocol::ScreenFrame>(msg)) {
            std::vector<uint8_t> frame;
            if (!crypto_utils::base64_decode(std::get<protocol::ScreenFrame>(msg).frame, frame)) {
                fprintf(stderr, "Client: Dropping relayed frame with bad base64\n");
                return;
            }
            deliver_frame(frame);
            return;
        }

        if (std::holds_alternative<protocol::Relayed>(msg)) {
            protocol::Message inner;
            std::string error;
            if (!protocol::decode(json_utils::to_string(std::get<protocol::Relayed>(msg).data), inner, error)) {
                fprintf(stderr, "Client: Ignoring relayed payload: %s\n", error.c_str());
                return;
            }
            if (protocol::is_forwarded(inner) && !is_signaling(inner)) {
                deliver(inner);
            }
            return;
        }

        if (protocol::is_forwarded(msg) && !is_signaling(msg)) {
            deliver(msg);
        }
    });

    text_observer_ = p2p_.add_text_observer([this](const std::string& text) {
        protocol::Message msg;
        std::string error;
        if (!protocol::decode(text, msg, error)) {
            fprintf(stderr, "P2P: Ignoring message: %s\n", error.c_str());
            return;
        }
        if (std::holds_alternative<protocol::ScreenFrame>(msg)) {
            std::vector<uint8_t> frame;
            if (crypto_utils::base64_decode(std::get<protocol::ScreenFrame>(msg).frame, frame)) {
                deliver_frame(frame);
            }
            return;
        }
        if (protocol::is_forwarded(msg) && !is_signaling(msg)) {
            deliver(msg);
        }
    });

    binary_observer_ = p2p_.add_binary_observer([this](const uint8_t* data, size_t size) {
        deliver_frame(std::vector<uint8_t>(data, data + size));
    });
}

TransportRouter::~TransportRouter() {
    signaling_.remove_message_observer(signaling_observer_);
    p2p_.remove_observer(text_observer_);
    p2p_.remove_observer(binary_observer_);
}

bool TransportRouter::send(const protocol::Message& msg) {
    if (p2p_.is_connected()) {
        if (p2p_.send(protocol::encode(msg))) {
            logged_fallback_ = false;
            return true;
        }
    }

    if (!logged_fallback_.exchange(true) && g_debug_connection) {
        fprintf(stderr, "Client: Routing payload through relay\n");
    }
    return signaling_.send(msg);
}

bool TransportRouter::send_frame(const std::vector<uint8_t>& frame) {
    if (p2p_.is_connected()) {
        if (p2p_.send_binary(frame.data(), frame.size())) {
            return true;
        }
    }

    protocol::ScreenFrame msg;
    msg.frame = crypto_utils::base64_encode(frame);
    return signaling_.send(msg);
}

bool TransportRouter::is_p2p() const {
    return p2p_.is_connected();
}

TransportRouter::ObserverId TransportRouter::add_payload_observer(PayloadObserver observer) {
    std::lock_guard<std::mutex> lock(observers_mutex_);
    ObserverId id = next_observer_id_++;
    payload_observers_[id] = std::move(observer);
    return id;
}

TransportRouter::ObserverId TransportRouter::add_frame_observer(FrameObserver observer) {
    std::lock_guard<std::mutex> lock(observers_mutex_);
    ObserverId id = next_observer_id_++;
    frame_observers_[id] = std::move(observer);
    return id;
}

void TransportRouter::remove_observer(ObserverId id) {
    std::lock_guard<std::mutex> lock(observers_mutex_);
    payload_observers_.erase(id);
    frame_observers_.erase(id);
}

void TransportRouter::deliver(const protocol::Message& msg) {
    if (g_debug_relay) {
        fprintf(stderr, "Client: Payload '%s'\n", protocol::type_name(msg));
    }

    std::vector<PayloadObserver> observers;
    {
        std::lock_guard<std::mutex> lock(observers_mutex_);
        for (const auto& entry : payload_observers_) {
            observers.push_back(entry.second);
        }
    }
    for (const auto& observer : observers) {
        observer(msg);
    }
}

void TransportRouter::deliver_frame(const std::vector<uint8_t>& frame) {
    std::vector<FrameObserver> observers;
    {
        std::lock_guard<std::mutex> lock(observers_mutex_);
        for (const auto& entry : frame_observers_) {
            observers.push_back(entry.second);
        }
    }
    for (const auto& observer : observers) {
        observer(frame);
    }
}

} // namespace session
