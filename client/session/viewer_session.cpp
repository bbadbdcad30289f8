/*
 * Viewer Session Implementation
 */

#include "viewer_session.h"
#include "../../common/errors.h"
#include <cstdio>

namespace session {

ViewerSession::ViewerSession(scheduler::Scheduler& scheduler,
                             SocketFactory factory,
                             const ViewerServices& services,
                             const ViewerOptions& options)
    : scheduler_(scheduler)
    , services_(services)
    , options_(options)
    , connection_(scheduler, std::move(factory))
    , p2p_(options.p2p)
    , router_(connection_, p2p_)
    , transfers_(scheduler,
                 [this](const protocol::Message& msg) { return router_.send(msg); },
                 options.transfer, &services.entitlements)
    , clipboard_(scheduler, services.clipboard,
                 [this](const protocol::Message& msg) { return router_.send(msg); },
                 &services.entitlements)
    , in_session_(false)
{
    options_.session.is_host = false;
    options_.session.password.clear();
    clipboard_.set_direction(options.clipboard_direction);

    state_observer_ = connection_.add_state_observer(
        [this](ConnectionState state, const std::string& detail) { on_state(state, detail); });
    signal_observer_ = connection_.add_message_observer(
        [this](const protocol::Message& msg) { on_signal(msg); });
    candidate_observer_ = p2p_.add_candidate_observer(
        [this](const protocol::IceCandidate& candidate) { connection_.send(candidate); });
    payload_observer_ = router_.add_payload_observer(
        [this](const protocol::Message& msg) { on_payload(msg); });
}

ViewerSession::~ViewerSession() {
    stop();
    router_.remove_observer(payload_observer_);
    p2p_.remove_observer(candidate_observer_);
    connection_.remove_message_observer(signal_observer_);
    connection_.remove_state_observer(state_observer_);
}

void ViewerSession::start() {
    fprintf(stderr, "Client: Viewer %s connecting to host %s\n",
            options_.session.connection_id.c_str(), options_.target_id.c_str());
    transfers_.start();
    connection_.connect(options_.session);
}

void ViewerSession::stop() {
    connection_.disconnect();
    end_session();
    transfers_.stop();
}

bool ViewerSession::in_session() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_session_;
}

void ViewerSession::on_state(ConnectionState state, const std::string& detail) {
    switch (state) {
        case ConnectionState::SESSION_ACTIVE:
            begin_session();
            break;
        case ConnectionState::ERROR:
            fprintf(stderr, "Client: Connection to host failed: %s\n", detail.c_str());
            end_session();
            break;
        default:
            if (!detail.empty()) {
                fprintf(stderr, "Client: %s (%s)\n", state_name(state), detail.c_str());
            }
            end_session();
            break;
    }
}

void ViewerSession::begin_session() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (in_session_) {
            return;
        }
        in_session_ = true;
    }
    services_.entitlements.start_session();

    fprintf(stderr, "Client: Session %s with host %s\n",
            connection_.session_id().c_str(), connection_.partner_id().c_str());

    clipboard_.start();

    try {
        protocol::Offer offer;
        offer.offer = p2p_.create_offer();
        connection_.send(offer);
    } catch (const errors::TransportError& e) {
        fprintf(stderr, "P2P: %s, staying on relay\n", e.what());
    }
}

void ViewerSession::end_session() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!in_session_) {
            return;
        }
        in_session_ = false;
    }
    clipboard_.stop();
    p2p_.disconnect();
    services_.entitlements.end_session();
    fprintf(stderr, "Client: Session ended\n");
}

void ViewerSession::on_signal(const protocol::Message& msg) {
    if (std::holds_alternative<protocol::Registered>(msg)) {
        // Every (re)registration asks for the host again
        if (!services_.entitlements.can_start_connection()) {
            fprintf(stderr, "Client: Connection limit reached\n");
            return;
        }
        connection_.connect_to_host(options_.target_id, options_.target_password);
    } else if (const auto* answer = std::get_if<protocol::Answer>(&msg)) {
        try {
            p2p_.handle_answer(answer->answer);
        } catch (const errors::TransportError& e) {
            fprintf(stderr, "P2P: %s, staying on relay\n", e.what());
        }
    } else if (const auto* candidate = std::get_if<protocol::IceCandidate>(&msg)) {
        p2p_.add_ice_candidate(*candidate);
    }
}

void ViewerSession::on_payload(const protocol::Message& msg) {
    if (const auto* clip = std::get_if<protocol::ClipboardSync>(&msg)) {
        clipboard_.apply_remote(*clip);
    } else {
        transfers_.handle_message(msg);
    }
}

bool ViewerSession::send_mouse(const protocol::json& event) {
    if (!in_session()) {
        return false;
    }
    protocol::MouseEvent msg;
    msg.event = event;
    return router_.send(msg);
}

bool ViewerSession::send_keyboard(const protocol::json& event) {
    if (!in_session()) {
        return false;
    }
    protocol::KeyboardEvent msg;
    msg.event = event;
    return router_.send(msg);
}

std::string ViewerSession::send_file(const std::string& path) {
    return transfers_.start_send(path);
}

TransportRouter::ObserverId ViewerSession::add_frame_observer(FrameObserver observer) {
    return router_.add_frame_observer(std::move(observer));
}

} // namespace session
