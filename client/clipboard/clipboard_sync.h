/*
 * Clipboard Sync
 *
 * Polls the local clipboard and sends clipboard-sync on change;
 * applies clipboard-sync from the partner. Remote content becomes the
 * last seen value so the next poll does not echo it back.
 */

#ifndef CLIPBOARD_SYNC_H
#define CLIPBOARD_SYNC_H

#include "../entitlement/entitlements.h"
#include "../../common/protocol/messages.h"
#include "../../common/utils/scheduler.h"
#include <functional>
#include <mutex>
#include <string>

namespace clipboard {

class ClipboardProvider {
public:
    virtual ~ClipboardProvider() = default;

    virtual std::string read_text() = 0;
    virtual void write_text(const std::string& text) = 0;
};

enum class SyncDirection {
    BOTH,
    SEND,       // Local changes go out, remote content is ignored
    RECEIVE     // Remote content is applied, local changes stay local
};

const char* direction_name(SyncDirection direction);
bool parse_direction(const std::string& name, SyncDirection& out);

class ClipboardSync {
public:
    using MessageSender = std::function<bool(const protocol::Message& msg)>;

    ClipboardSync(scheduler::Scheduler& scheduler,
                  ClipboardProvider& provider,
                  MessageSender sender,
                  entitlement::EntitlementService* entitlements = nullptr,
                  int poll_interval_ms = 500);
    ~ClipboardSync();

    ClipboardSync(const ClipboardSync&) = delete;
    ClipboardSync& operator=(const ClipboardSync&) = delete;

    // False if the plan does not include clipboard sync
    bool start();
    void stop();
    bool is_syncing() const;

    void set_direction(SyncDirection direction);
    SyncDirection direction() const;

    // Apply partner content. False if ignored (direction, empty, not syncing).
    bool apply_remote(const protocol::ClipboardSync& msg);

    // One poll of the local clipboard; runs on the timer
    void poll();

private:
    scheduler::Scheduler& scheduler_;
    ClipboardProvider& provider_;
    MessageSender sender_;
    entitlement::EntitlementService* entitlements_;
    int poll_interval_ms_;

    mutable std::mutex mutex_;
    scheduler::TimerId timer_;
    SyncDirection direction_;
    std::string last_content_;
};

} // namespace clipboard

#endif // CLIPBOARD_SYNC_H
