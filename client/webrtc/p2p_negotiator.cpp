/*
 * P2P Transport Negotiator Implementation
 */

#include "p2p_negotiator.h"
#include "../../common/errors.h"
#include "../../common/utils/debug_flags.h"
#include <cstdio>

namespace webrtc {

const char* transport_state_name(TransportState state) {
    switch (state) {
        case TransportState::NEW:          return "new";
        case TransportState::CONNECTING:   return "connecting";
        case TransportState::CONNECTED:    return "connected";
        case TransportState::DISCONNECTED: return "disconnected";
        case TransportState::FAILED:       return "failed";
        case TransportState::CLOSED:       return "closed";
    }
    return "unknown";
}

P2PNegotiator::P2PNegotiator(const P2POptions& options)
    : options_(options)
    , has_remote_description_(false)
    , state_(TransportState::NEW)
    , next_observer_id_(1)
{}

P2PNegotiator::~P2PNegotiator() {
    disconnect();
}

std::shared_ptr<rtc::PeerConnection> P2PNegotiator::create_peer_connection() {
    rtc::Configuration config;
    for (const auto& server : options_.ice_servers) {
        config.iceServers.emplace_back(server);
    }
    config.maxMessageSize = options_.max_message_size;
    // Offers and answers are produced explicitly and returned to the caller
    config.disableAutoNegotiation = true;

    auto pc = std::make_shared<rtc::PeerConnection>(config);

    pc->onLocalCandidate([this](rtc::Candidate cand) {
        protocol::IceCandidate candidate;
        candidate.candidate = std::string(cand);
        candidate.sdp_mid = cand.mid();

        if (g_debug_connection) {
            fprintf(stderr, "P2P: Local ICE candidate (mid=%s)\n", candidate.sdp_mid.c_str());
        }

        std::vector<CandidateObserver> observers;
        {
            std::lock_guard<std::mutex> lock(observers_mutex_);
            for (const auto& entry : candidate_observers_) {
                observers.push_back(entry.second);
            }
        }
        for (const auto& observer : observers) {
            observer(candidate);
        }
    });

    pc->onStateChange([this](rtc::PeerConnection::State state) {
        const char* state_str = "unknown";
        switch (state) {
            case rtc::PeerConnection::State::New: state_str = "New"; break;
            case rtc::PeerConnection::State::Connecting: state_str = "Connecting"; break;
            case rtc::PeerConnection::State::Connected: state_str = "Connected"; break;
            case rtc::PeerConnection::State::Disconnected: state_str = "Disconnected"; break;
            case rtc::PeerConnection::State::Failed: state_str = "Failed"; break;
            case rtc::PeerConnection::State::Closed: state_str = "Closed"; break;
        }
        if (g_debug_connection) {
            fprintf(stderr, "P2P: Peer connection state: %s\n", state_str);
        }

        switch (state) {
            case rtc::PeerConnection::State::Connecting:
                set_state(TransportState::CONNECTING);
                break;
            case rtc::PeerConnection::State::Disconnected:
                set_state(TransportState::DISCONNECTED);
                break;
            case rtc::PeerConnection::State::Failed:
                set_state(TransportState::FAILED);
                break;
            default:
                // Connected is reported when the data channel opens
                break;
        }
    });

    pc->onDataChannel([this](std::shared_ptr<rtc::DataChannel> dc) {
        if (g_debug_connection) {
            fprintf(stderr, "P2P: Incoming data channel '%s'\n", dc->label().c_str());
        }
        attach_channel(dc);
    });

    return pc;
}

void P2PNegotiator::attach_channel(std::shared_ptr<rtc::DataChannel> channel) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        channel_ = channel;
    }

    channel->onOpen([this]() {
        fprintf(stderr, "P2P: Data channel open\n");
        set_state(TransportState::CONNECTED);
    });

    channel->onClosed([this]() {
        if (g_debug_connection) {
            fprintf(stderr, "P2P: Data channel closed\n");
        }
        TransportState current = state();
        if (current == TransportState::CONNECTED) {
            set_state(TransportState::DISCONNECTED);
        }
    });

    channel->onError([](std::string error) {
        fprintf(stderr, "P2P: Data channel error: %s\n", error.c_str());
    });

    channel->onMessage([this](rtc::message_variant data) {
        if (std::holds_alternative<std::string>(data)) {
            const std::string& text = std::get<std::string>(data);
            std::vector<TextObserver> observers;
            {
                std::lock_guard<std::mutex> lock(observers_mutex_);
                for (const auto& entry : text_observers_) {
                    observers.push_back(entry.second);
                }
            }
            for (const auto& observer : observers) {
                observer(text);
            }
        } else if (std::holds_alternative<rtc::binary>(data)) {
            const rtc::binary& bin = std::get<rtc::binary>(data);
            std::vector<BinaryObserver> observers;
            {
                std::lock_guard<std::mutex> lock(observers_mutex_);
                for (const auto& entry : binary_observers_) {
                    observers.push_back(entry.second);
                }
            }
            for (const auto& observer : observers) {
                observer(reinterpret_cast<const uint8_t*>(bin.data()), bin.size());
            }
        }
    });
}

protocol::SessionDescription P2PNegotiator::local_description(std::shared_ptr<rtc::PeerConnection> pc) {
    auto desc = pc->localDescription();
    if (!desc) {
        throw errors::TransportError("No local description");
    }
    protocol::SessionDescription out;
    out.type = desc->typeString();
    out.sdp = std::string(*desc);
    return out;
}

// Buffered remote candidates are kept for the new connection
void P2PNegotiator::replace_peer_connection(std::shared_ptr<rtc::PeerConnection> pc) {
    std::shared_ptr<rtc::PeerConnection> old_pc;
    std::shared_ptr<rtc::DataChannel> old_channel;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        old_pc = std::move(pc_);
        old_channel = std::move(channel_);
        pc_ = pc;
        has_remote_description_ = false;
    }
    if (old_pc || old_channel) {
        fprintf(stderr, "P2P: Replacing previous peer connection\n");
        close_transport(old_pc, old_channel);
    }
}

protocol::SessionDescription P2PNegotiator::create_offer() {
    std::shared_ptr<rtc::PeerConnection> pc;
    try {
        pc = create_peer_connection();
        replace_peer_connection(pc);
        set_state(TransportState::CONNECTING);

        attach_channel(pc->createDataChannel(options_.channel_label));
        pc->setLocalDescription(rtc::Description::Type::Offer);
    } catch (const std::exception& e) {
        fprintf(stderr, "P2P: Failed to create offer: %s\n", e.what());
        throw errors::TransportError(e.what());
    }

    protocol::SessionDescription offer = local_description(pc);
    if (g_debug_connection) {
        fprintf(stderr, "P2P: Created offer (sdp length=%zu)\n", offer.sdp.size());
    }
    return offer;
}

protocol::SessionDescription P2PNegotiator::handle_offer(const protocol::SessionDescription& offer) {
    std::shared_ptr<rtc::PeerConnection> pc;
    try {
        pc = create_peer_connection();
        replace_peer_connection(pc);
        set_state(TransportState::CONNECTING);

        pc->setRemoteDescription(rtc::Description(offer.sdp, "offer"));
        {
            std::lock_guard<std::mutex> lock(mutex_);
            has_remote_description_ = true;
        }
        pc->setLocalDescription(rtc::Description::Type::Answer);
    } catch (const std::exception& e) {
        fprintf(stderr, "P2P: Failed to answer offer: %s\n", e.what());
        throw errors::TransportError(e.what());
    }

    drain_candidates(pc);

    protocol::SessionDescription answer = local_description(pc);
    if (g_debug_connection) {
        fprintf(stderr, "P2P: Created answer (sdp length=%zu)\n", answer.sdp.size());
    }
    return answer;
}

void P2PNegotiator::handle_answer(const protocol::SessionDescription& answer) {
    std::shared_ptr<rtc::PeerConnection> pc;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pc = pc_;
    }
    if (!pc) {
        throw errors::TransportError("No peer connection");
    }

    try {
        pc->setRemoteDescription(rtc::Description(answer.sdp, "answer"));
    } catch (const std::exception& e) {
        fprintf(stderr, "P2P: Failed to set remote answer: %s\n", e.what());
        throw errors::TransportError(e.what());
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        has_remote_description_ = true;
    }
    if (g_debug_connection) {
        fprintf(stderr, "P2P: Remote answer set\n");
    }

    drain_candidates(pc);
}

void P2PNegotiator::add_ice_candidate(const protocol::IceCandidate& candidate) {
    std::shared_ptr<rtc::PeerConnection> pc;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!pc_ || !has_remote_description_) {
            pending_candidates_.push_back(candidate);
            if (g_debug_connection) {
                fprintf(stderr, "P2P: Buffered remote candidate (%zu pending)\n",
                        pending_candidates_.size());
            }
            return;
        }
        pc = pc_;
    }

    try {
        pc->addRemoteCandidate(rtc::Candidate(candidate.candidate, candidate.sdp_mid));
    } catch (const std::exception& e) {
        fprintf(stderr, "P2P: Failed to add candidate: %s\n", e.what());
    }
}

void P2PNegotiator::drain_candidates(std::shared_ptr<rtc::PeerConnection> pc) {
    std::vector<protocol::IceCandidate> pending;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pending.swap(pending_candidates_);
    }
    if (g_debug_connection && !pending.empty()) {
        fprintf(stderr, "P2P: Applying %zu buffered candidates\n", pending.size());
    }
    for (const auto& candidate : pending) {
        try {
            pc->addRemoteCandidate(rtc::Candidate(candidate.candidate, candidate.sdp_mid));
        } catch (const std::exception& e) {
            fprintf(stderr, "P2P: Failed to add candidate: %s\n", e.what());
        }
    }
}

bool P2PNegotiator::send(const std::string& text) {
    std::shared_ptr<rtc::DataChannel> channel;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        channel = channel_;
    }
    if (!channel || !channel->isOpen()) {
        return false;
    }
    try {
        return channel->send(text);
    } catch (const std::exception& e) {
        fprintf(stderr, "P2P: Send failed: %s\n", e.what());
        return false;
    }
}

bool P2PNegotiator::send_binary(const uint8_t* data, size_t size) {
    std::shared_ptr<rtc::DataChannel> channel;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        channel = channel_;
    }
    if (!channel || !channel->isOpen()) {
        return false;
    }
    try {
        return channel->send(reinterpret_cast<const std::byte*>(data), size);
    } catch (const std::exception& e) {
        fprintf(stderr, "P2P: Binary send failed: %s\n", e.what());
        return false;
    }
}

bool P2PNegotiator::is_connected() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_ == TransportState::CONNECTED && channel_ && channel_->isOpen();
}

TransportState P2PNegotiator::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

size_t P2PNegotiator::pending_candidate_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_candidates_.size();
}

void P2PNegotiator::disconnect() {
    std::shared_ptr<rtc::PeerConnection> pc;
    std::shared_ptr<rtc::DataChannel> channel;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pc = std::move(pc_);
        channel = std::move(channel_);
        has_remote_description_ = false;
        pending_candidates_.clear();
    }
    if (!pc && !channel) {
        return;
    }

    close_transport(pc, channel);

    if (g_debug_connection) {
        fprintf(stderr, "P2P: Disconnected\n");
    }
    set_state(TransportState::CLOSED);
}

void P2PNegotiator::close_transport(std::shared_ptr<rtc::PeerConnection> pc,
                                    std::shared_ptr<rtc::DataChannel> channel) {
    try {
        if (channel) {
            channel->resetCallbacks();
            channel->close();
        }
        if (pc) {
            pc->resetCallbacks();
            pc->close();
        }
    } catch (const std::exception& e) {
        fprintf(stderr, "P2P: Error during close: %s\n", e.what());
    }
}

P2PNegotiator::ObserverId P2PNegotiator::add_candidate_observer(CandidateObserver observer) {
    std::lock_guard<std::mutex> lock(observers_mutex_);
    ObserverId id = next_observer_id_++;
    candidate_observers_[id] = std::move(observer);
    return id;
}

P2PNegotiator::ObserverId P2PNegotiator::add_state_observer(StateObserver observer) {
    std::lock_guard<std::mutex> lock(observers_mutex_);
    ObserverId id = next_observer_id_++;
    state_observers_[id] = std::move(observer);
    return id;
}

P2PNegotiator::ObserverId P2PNegotiator::add_text_observer(TextObserver observer) {
    std::lock_guard<std::mutex> lock(observers_mutex_);
    ObserverId id = next_observer_id_++;
    text_observers_[id] = std::move(observer);
    return id;
}

P2PNegotiator::ObserverId P2PNegotiator::add_binary_observer(BinaryObserver observer) {
    std::lock_guard<std::mutex> lock(observers_mutex_);
    ObserverId id = next_observer_id_++;
    binary_observers_[id] = std::move(observer);
    return id;
}

void P2PNegotiator::remove_observer(ObserverId id) {
    std::lock_guard<std::mutex> lock(observers_mutex_);
    candidate_observers_.erase(id);
    state_observers_.erase(id);
    text_observers_.erase(id);
    binary_observers_.erase(id);
}

void P2PNegotiator::set_state(TransportState state) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == state) {
            return;
        }
        state_ = state;
    }

    if (g_debug_connection) {
        fprintf(stderr, "P2P: Transport %s\n", transport_state_name(state));
    }

    std::vector<StateObserver> observers;
    {
        std::lock_guard<std::mutex> lock(observers_mutex_);
        for (const auto& entry : state_observers_) {
            observers.push_back(entry.second);
        }
    }
    for (const auto& observer : observers) {
        observer(state);
    }
}

} // namespace webrtc
