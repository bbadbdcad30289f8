/*
 * Clipboard Sync Implementation
 */

#include "clipboard_sync.h"
#include "../../common/utils/debug_flags.h"
#include <chrono>
#include <cstdio>

namespace clipboard {

const char* direction_name(SyncDirection direction) {
    switch (direction) {
        case SyncDirection::BOTH:    return "both";
        case SyncDirection::SEND:    return "send";
        case SyncDirection::RECEIVE: return "receive";
    }
    return "unknown";
}

bool parse_direction(const std::string& name, SyncDirection& out) {
    if (name == "both") { out = SyncDirection::BOTH; return true; }
    if (name == "send") { out = SyncDirection::SEND; return true; }
    if (name == "receive") { out = SyncDirection::RECEIVE; return true; }
    return false;
}

ClipboardSync::ClipboardSync(scheduler::Scheduler& scheduler,
                             ClipboardProvider& provider,
                             MessageSender sender,
                             entitlement::EntitlementService* entitlements,
                             int poll_interval_ms)
    : scheduler_(scheduler)
    , provider_(provider)
    , sender_(std::move(sender))
    , entitlements_(entitlements)
    , poll_interval_ms_(poll_interval_ms)
    , timer_(scheduler::INVALID_TIMER)
    , direction_(SyncDirection::BOTH)
{}

ClipboardSync::~ClipboardSync() {
    stop();
}

bool ClipboardSync::start() {
    if (entitlements_ && !entitlements_->can_use_feature(entitlement::FEATURE_CLIPBOARD)) {
        fprintf(stderr, "Client: Clipboard sync not available on this plan\n");
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (timer_ != scheduler::INVALID_TIMER) {
            return true;
        }
        // Content already on the clipboard is not sent
        last_content_ = provider_.read_text();
    }

    scheduler::TimerId id = scheduler_.schedule_every(
        std::chrono::milliseconds(poll_interval_ms_), [this]() { poll(); });
    {
        std::lock_guard<std::mutex> lock(mutex_);
        timer_ = id;
    }
    fprintf(stderr, "Client: Clipboard sync started (%s)\n", direction_name(direction()));
    return true;
}

void ClipboardSync::stop() {
    scheduler::TimerId id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        id = timer_;
        timer_ = scheduler::INVALID_TIMER;
    }
    if (id == scheduler::INVALID_TIMER) {
        return;
    }
    scheduler_.cancel(id);
    fprintf(stderr, "Client: Clipboard sync stopped\n");
}

bool ClipboardSync::is_syncing() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return timer_ != scheduler::INVALID_TIMER;
}

void ClipboardSync::set_direction(SyncDirection direction) {
    std::lock_guard<std::mutex> lock(mutex_);
    direction_ = direction;
}

SyncDirection ClipboardSync::direction() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return direction_;
}

bool ClipboardSync::apply_remote(const protocol::ClipboardSync& msg) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (timer_ == scheduler::INVALID_TIMER || direction_ == SyncDirection::SEND) {
        return false;
    }
    if (msg.content.type != "text" || msg.content.data.empty()) {
        return false;
    }

    last_content_ = msg.content.data;
    provider_.write_text(msg.content.data);
    if (g_debug_connection) {
        fprintf(stderr, "Client: Clipboard content received (%zu bytes)\n", msg.content.data.size());
    }
    return true;
}

void ClipboardSync::poll() {
    protocol::ClipboardSync msg;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (timer_ == scheduler::INVALID_TIMER) {
            return;
        }

        std::string current = provider_.read_text();
        if (current.empty() || current == last_content_) {
            return;
        }
        last_content_ = current;

        if (direction_ == SyncDirection::RECEIVE) {
            return;
        }

        msg.content.type = "text";
        msg.content.data = current;
        msg.content.timestamp = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
    }

    if (!sender_(msg)) {
        fprintf(stderr, "Client: Failed to send clipboard content\n");
    }
}

} // namespace clipboard
