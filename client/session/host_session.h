/*
 * Host Session
 *
 * Registers the host under its connection ID and, once a viewer is
 * admitted, answers its P2P offer and streams the screen. Streaming
 * starts when the data channel opens, or over the relay when P2P fails
 * or does not come up within the grace period. Input, clipboard and
 * file transfer payloads from the viewer are applied here.
 */

#ifndef HOST_SESSION_H
#define HOST_SESSION_H

#include "connection_state_machine.h"
#include "transport_router.h"
#include "../clipboard/clipboard_sync.h"
#include "../entitlement/entitlements.h"
#include "../input/input_router.h"
#include "../streaming/adaptive_streamer.h"
#include "../transfer/file_transfer.h"
#include "../webrtc/p2p_negotiator.h"
#include "../../common/utils/scheduler.h"
#include <memory>
#include <mutex>
#include <string>

namespace session {

// 9-digit connection ID
std::string generate_connection_id();

// 4-character session password (A-Z, 0-9)
std::string generate_password();

struct HostOptions {
    SessionOptions session;
    webrtc::P2POptions p2p;
    transfer::TransferOptions transfer;
    bool allow_control = true;
    int p2p_grace_ms = 10000;
    streaming::Quality quality = streaming::Quality::MEDIUM;
    bool auto_quality = true;
    bool game_mode = false;
    clipboard::SyncDirection clipboard_direction = clipboard::SyncDirection::BOTH;
};

struct HostServices {
    streaming::FrameCapturer& capturer;
    streaming::FrameEncoder& encoder;
    input::InputInjector& injector;
    clipboard::ClipboardProvider& clipboard;
    entitlement::EntitlementService& entitlements;
};

class HostSession {
public:
    HostSession(scheduler::Scheduler& scheduler,
                SocketFactory factory,
                const HostServices& services,
                const HostOptions& options);
    ~HostSession();

    HostSession(const HostSession&) = delete;
    HostSession& operator=(const HostSession&) = delete;

    void start();
    void stop();

    bool in_session() const;

    ConnectionStateMachine& connection() { return connection_; }
    webrtc::P2PNegotiator& p2p() { return p2p_; }
    TransportRouter& router() { return router_; }
    streaming::AdaptiveStreamer& streamer() { return streamer_; }
    transfer::FileTransferManager& transfers() { return transfers_; }
    input::InputRouter& input() { return input_; }

private:
    void on_state(ConnectionState state, const std::string& detail);
    void on_signal(const protocol::Message& msg);
    void on_payload(const protocol::Message& msg);
    void on_transport(webrtc::TransportState state);

    void begin_session();
    void end_session();
    void start_streaming(const char* reason);

    scheduler::Scheduler& scheduler_;
    HostServices services_;
    HostOptions options_;

    ConnectionStateMachine connection_;
    webrtc::P2PNegotiator p2p_;
    TransportRouter router_;
    streaming::AdaptiveStreamer streamer_;
    transfer::FileTransferManager transfers_;
    input::InputRouter input_;
    clipboard::ClipboardSync clipboard_;

    ConnectionStateMachine::ObserverId state_observer_;
    ConnectionStateMachine::ObserverId signal_observer_;
    webrtc::P2PNegotiator::ObserverId candidate_observer_;
    webrtc::P2PNegotiator::ObserverId transport_observer_;
    TransportRouter::ObserverId payload_observer_;

    mutable std::mutex mutex_;
    bool in_session_;
    scheduler::TimerId grace_timer_;
    scheduler::TimerId limit_timer_;
};

} // namespace session

#endif // HOST_SESSION_H
