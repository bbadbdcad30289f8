/*
 * Viewer Session
 *
 * Registers the viewer, asks the server for a session with the target
 * host and, once admitted, offers a P2P data channel. Frames arrive
 * from either transport; input, clipboard and files go out through
 * the transport router.
 */

#ifndef VIEWER_SESSION_H
#define VIEWER_SESSION_H

#include "connection_state_machine.h"
#include "transport_router.h"
#include "../clipboard/clipboard_sync.h"
#include "../entitlement/entitlements.h"
#include "../transfer/file_transfer.h"
#include "../webrtc/p2p_negotiator.h"
#include "../../common/utils/scheduler.h"
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace session {

struct ViewerOptions {
    SessionOptions session;
    webrtc::P2POptions p2p;
    transfer::TransferOptions transfer;
    std::string target_id;
    std::string target_password;
    clipboard::SyncDirection clipboard_direction = clipboard::SyncDirection::BOTH;
};

struct ViewerServices {
    clipboard::ClipboardProvider& clipboard;
    entitlement::EntitlementService& entitlements;
};

class ViewerSession {
public:
    using FrameObserver = TransportRouter::FrameObserver;

    ViewerSession(scheduler::Scheduler& scheduler,
                  SocketFactory factory,
                  const ViewerServices& services,
                  const ViewerOptions& options);
    ~ViewerSession();

    ViewerSession(const ViewerSession&) = delete;
    ViewerSession& operator=(const ViewerSession&) = delete;

    void start();
    void stop();

    bool in_session() const;

    // Input from the local UI, forwarded to the host
    bool send_mouse(const protocol::json& event);
    bool send_keyboard(const protocol::json& event);

    /**
     * @throws errors::CapacityError, errors::NotFoundError, errors::Error
     */
    std::string send_file(const std::string& path);

    TransportRouter::ObserverId add_frame_observer(FrameObserver observer);

    ConnectionStateMachine& connection() { return connection_; }
    webrtc::P2PNegotiator& p2p() { return p2p_; }
    TransportRouter& router() { return router_; }
    transfer::FileTransferManager& transfers() { return transfers_; }

private:
    void on_state(ConnectionState state, const std::string& detail);
    void on_signal(const protocol::Message& msg);
    void on_payload(const protocol::Message& msg);

    void begin_session();
    void end_session();

    scheduler::Scheduler& scheduler_;
    ViewerServices services_;
    ViewerOptions options_;

    ConnectionStateMachine connection_;
    webrtc::P2PNegotiator p2p_;
    TransportRouter router_;
    transfer::FileTransferManager transfers_;
    clipboard::ClipboardSync clipboard_;

    ConnectionStateMachine::ObserverId state_observer_;
    ConnectionStateMachine::ObserverId signal_observer_;
    webrtc::P2PNegotiator::ObserverId candidate_observer_;
    TransportRouter::ObserverId payload_observer_;

    mutable std::mutex mutex_;
    bool in_session_;
};

} // namespace session

#endif // VIEWER_SESSION_H
