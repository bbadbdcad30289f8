/*
 * IP Lockout Policy Implementation
 */

#include "lockout_policy.h"

namespace signaling {

LockoutPolicy::LockoutPolicy(int max_attempts, int64_t window_ms)
    : max_attempts_(max_attempts)
    , window_ms_(window_ms)
{}

bool LockoutPolicy::is_rejected(const std::string& ip, int64_t now_ms) {
    if (is_blocked(ip)) {
        return true;
    }
    return is_locked_out(ip, now_ms);
}

bool LockoutPolicy::is_locked_out(const std::string& ip, int64_t now_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = failures_.find(ip);
    if (it == failures_.end()) {
        return false;
    }

    if (now_ms - it->second.last_attempt >= window_ms_) {
        failures_.erase(it);
        return false;
    }
    return it->second.count >= max_attempts_;
}

int LockoutPolicy::record_failure(const std::string& ip, int64_t now_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    FailedAttemptRecord& rec = failures_[ip];

    // Failures older than the window no longer count
    if (rec.count > 0 && now_ms - rec.last_attempt >= window_ms_) {
        rec.count = 0;
    }
    rec.count++;
    rec.last_attempt = now_ms;
    return rec.count;
}

void LockoutPolicy::block(const std::string& ip) {
    std::lock_guard<std::mutex> lock(mutex_);
    blocked_.insert(ip);
}

bool LockoutPolicy::unblock(const std::string& ip) {
    std::lock_guard<std::mutex> lock(mutex_);
    bool was_blocked = blocked_.erase(ip) > 0;
    failures_.erase(ip);
    return was_blocked;
}

bool LockoutPolicy::is_blocked(const std::string& ip) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return blocked_.count(ip) > 0;
}

std::vector<std::string> LockoutPolicy::blocked_ips() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<std::string>(blocked_.begin(), blocked_.end());
}

} // namespace signaling
