/*
 * IP Lockout Policy
 *
 * Counts failed password attempts per source IP. An IP with
 * max_attempts failures, the last one inside the lockout window, is
 * rejected until the window elapses. Administratively blocked IPs are
 * rejected until unblocked.
 */

#ifndef LOCKOUT_POLICY_H
#define LOCKOUT_POLICY_H

#include <cstdint>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace signaling {

class LockoutPolicy {
public:
    LockoutPolicy(int max_attempts, int64_t window_ms);

    // Blocked or locked out. Expired lockouts are forgotten here.
    bool is_rejected(const std::string& ip, int64_t now_ms);
    bool is_locked_out(const std::string& ip, int64_t now_ms);

    // Returns the failure count for this IP after recording
    int record_failure(const std::string& ip, int64_t now_ms);

    void block(const std::string& ip);
    // Also clears failures. Returns false if the IP was not blocked.
    bool unblock(const std::string& ip);
    bool is_blocked(const std::string& ip) const;
    std::vector<std::string> blocked_ips() const;

private:
    struct FailedAttemptRecord {
        int count = 0;
        int64_t last_attempt = 0;
    };

    int max_attempts_;
    int64_t window_ms_;

    mutable std::mutex mutex_;
    std::map<std::string, FailedAttemptRecord> failures_;
    std::set<std::string> blocked_;
};

} // namespace signaling

#endif // LOCKOUT_POLICY_H
