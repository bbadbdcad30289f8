/*
 * Host Session Implementation
 */

#include "host_session.h"
#include "../../common/errors.h"
#include "../../common/utils/crypto_utils.h"
#include <chrono>
#include <cstdio>
#include <cstdlib>

namespace session {

std::string generate_connection_id() {
    unsigned long long value = strtoull(crypto_utils::random_hex(8).c_str(), nullptr, 16);
    char buf[16];
    snprintf(buf, sizeof(buf), "%09llu", value % 1000000000ULL);
    return buf;
}

std::string generate_password() {
    static const char alphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789";
    std::string bytes = crypto_utils::random_hex(4);
    std::string password;
    for (size_t i = 0; i < 4; i++) {
        unsigned long byte = strtoul(bytes.substr(i * 2, 2).c_str(), nullptr, 16);
        password += alphabet[byte % 36];
    }
    return password;
}

HostSession::HostSession(scheduler::Scheduler& scheduler,
                         SocketFactory factory,
                         const HostServices& services,
                         const HostOptions& options)
    : scheduler_(scheduler)
    , services_(services)
    , options_(options)
    , connection_(scheduler, std::move(factory))
    , p2p_(options.p2p)
    , router_(connection_, p2p_)
    , streamer_(scheduler, services.capturer, services.encoder,
                [this](const std::vector<uint8_t>& frame) { return router_.send_frame(frame); },
                &services.entitlements)
    , transfers_(scheduler,
                 [this](const protocol::Message& msg) { return router_.send(msg); },
                 options.transfer, &services.entitlements)
    , input_(services.injector)
    , clipboard_(scheduler, services.clipboard,
                 [this](const protocol::Message& msg) { return router_.send(msg); },
                 &services.entitlements)
    , in_session_(false)
    , grace_timer_(scheduler::INVALID_TIMER)
    , limit_timer_(scheduler::INVALID_TIMER)
{
    options_.session.is_host = true;
    input_.set_enabled(options.allow_control);
    clipboard_.set_direction(options.clipboard_direction);
    streamer_.set_quality(options.quality);
    streamer_.set_auto_quality(options.auto_quality);
    if (options.game_mode) {
        streamer_.set_game_mode(true);
    }

    state_observer_ = connection_.add_state_observer(
        [this](ConnectionState state, const std::string& detail) { on_state(state, detail); });
    signal_observer_ = connection_.add_message_observer(
        [this](const protocol::Message& msg) { on_signal(msg); });
    candidate_observer_ = p2p_.add_candidate_observer(
        [this](const protocol::IceCandidate& candidate) { connection_.send(candidate); });
    transport_observer_ = p2p_.add_state_observer(
        [this](webrtc::TransportState state) { on_transport(state); });
    payload_observer_ = router_.add_payload_observer(
        [this](const protocol::Message& msg) { on_payload(msg); });
}

HostSession::~HostSession() {
    stop();
    router_.remove_observer(payload_observer_);
    p2p_.remove_observer(transport_observer_);
    p2p_.remove_observer(candidate_observer_);
    connection_.remove_message_observer(signal_observer_);
    connection_.remove_state_observer(state_observer_);
}

void HostSession::start() {
    fprintf(stderr, "Client: Hosting as %s\n", options_.session.connection_id.c_str());
    transfers_.start();
    connection_.connect(options_.session);
}

void HostSession::stop() {
    connection_.disconnect();
    end_session();
    transfers_.stop();
}

bool HostSession::in_session() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_session_;
}

void HostSession::on_state(ConnectionState state, const std::string& detail) {
    if (state == ConnectionState::SESSION_ACTIVE) {
        begin_session();
    } else {
        if (!detail.empty()) {
            fprintf(stderr, "Client: %s (%s)\n", state_name(state), detail.c_str());
        }
        end_session();
    }
}

void HostSession::begin_session() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (in_session_) {
            return;
        }
        in_session_ = true;
    }

    if (!services_.entitlements.can_start_connection()) {
        fprintf(stderr, "Client: Connection limit reached, ending session\n");
        connection_.end_session();
        return;
    }
    services_.entitlements.start_session();

    fprintf(stderr, "Client: Viewer %s connected (session %s)\n",
            connection_.partner_id().c_str(), connection_.session_id().c_str());

    scheduler::TimerId grace = scheduler_.schedule_after(
        std::chrono::milliseconds(options_.p2p_grace_ms), [this]() {
            if (!p2p_.is_connected()) {
                start_streaming("P2P not ready, using relay");
            }
        });

    scheduler::TimerId limit = scheduler::INVALID_TIMER;
    int64_t remaining = services_.entitlements.remaining_session_ms();
    if (remaining != entitlement::UNLIMITED) {
        fprintf(stderr, "Client: Session limited to %lld s by plan\n", (long long)(remaining / 1000));
        limit = scheduler_.schedule_after(std::chrono::milliseconds(remaining), [this]() {
            fprintf(stderr, "Client: Session time limit reached\n");
            connection_.end_session();
        });
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        grace_timer_ = grace;
        limit_timer_ = limit;
    }

    clipboard_.start();
}

void HostSession::end_session() {
    scheduler::TimerId grace, limit;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!in_session_) {
            return;
        }
        in_session_ = false;
        grace = grace_timer_;
        limit = limit_timer_;
        grace_timer_ = scheduler::INVALID_TIMER;
        limit_timer_ = scheduler::INVALID_TIMER;
    }

    scheduler_.cancel(grace);
    scheduler_.cancel(limit);
    streamer_.stop();
    clipboard_.stop();
    p2p_.disconnect();
    services_.entitlements.end_session();
    fprintf(stderr, "Client: Session ended\n");
}

void HostSession::start_streaming(const char* reason) {
    if (!in_session() || streamer_.is_running()) {
        return;
    }
    fprintf(stderr, "Client: %s\n", reason);
    streamer_.start();
}

void HostSession::on_signal(const protocol::Message& msg) {
    if (const auto* offer = std::get_if<protocol::Offer>(&msg)) {
        if (!in_session()) {
            return;
        }
        try {
            protocol::Answer answer;
            answer.answer = p2p_.handle_offer(offer->offer);
            connection_.send(answer);
        } catch (const errors::TransportError& e) {
            fprintf(stderr, "P2P: %s, falling back to relay\n", e.what());
            start_streaming("Streaming over relay");
        }
    } else if (const auto* candidate = std::get_if<protocol::IceCandidate>(&msg)) {
        p2p_.add_ice_candidate(*candidate);
    }
}

void HostSession::on_transport(webrtc::TransportState state) {
    switch (state) {
        case webrtc::TransportState::CONNECTED:
            start_streaming("P2P connected, streaming");
            break;
        case webrtc::TransportState::FAILED:
        case webrtc::TransportState::DISCONNECTED:
            // Router already sends through the relay
            start_streaming("P2P lost, streaming over relay");
            break;
        default:
            break;
    }
}

void HostSession::on_payload(const protocol::Message& msg) {
    if (std::holds_alternative<protocol::MouseEvent>(msg) ||
        std::holds_alternative<protocol::KeyboardEvent>(msg)) {
        input_.apply(msg);
    } else if (const auto* clip = std::get_if<protocol::ClipboardSync>(&msg)) {
        clipboard_.apply_remote(*clip);
    } else {
        transfers_.handle_message(msg);
    }
}

} // namespace session
