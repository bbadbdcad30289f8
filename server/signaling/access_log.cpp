/*
 * Access Log Implementation
 */

#include "access_log.h"
#include <algorithm>
#include <chrono>
#include <cstdio>
#include <ctime>

namespace signaling {

AccessLog::AccessLog(size_t capacity)
    : capacity_(capacity)
{}

void AccessLog::record(const std::string& event, const std::string& source_id,
                       const std::string& target_id, const std::string& ip, bool success) {
    AccessLogEntry entry;
    entry.timestamp = wall_clock_ms();
    entry.event = event;
    entry.source_id = source_id;
    entry.target_id = target_id;
    entry.ip = ip;
    entry.success = success;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.push_front(entry);
        while (entries_.size() > capacity_) {
            entries_.pop_back();
        }
    }

    fprintf(stderr, "Relay: [%s] %s: %s%s%s\n",
            success ? "OK" : "FAIL", event.c_str(), source_id.c_str(),
            target_id.empty() ? "" : " -> ", target_id.c_str());
}

std::vector<AccessLogEntry> AccessLog::latest(size_t limit) const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t n = std::min(limit, entries_.size());
    return std::vector<AccessLogEntry>(entries_.begin(), entries_.begin() + n);
}

size_t AccessLog::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

json_utils::json AccessLog::to_json(const AccessLogEntry& entry) {
    json_utils::json j = {
        {"timestamp", format_timestamp(entry.timestamp)},
        {"event", entry.event},
        {"sourceId", entry.source_id},
        {"success", entry.success}
    };
    if (!entry.target_id.empty()) j["targetId"] = entry.target_id;
    if (!entry.ip.empty()) j["ipAddress"] = entry.ip;
    return j;
}

std::string format_timestamp(int64_t ms) {
    time_t secs = static_cast<time_t>(ms / 1000);
    struct tm tm_utc;
    gmtime_r(&secs, &tm_utc);

    char buf[32];
    size_t n = strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm_utc);
    snprintf(buf + n, sizeof(buf) - n, ".%03dZ", static_cast<int>(ms % 1000));
    return std::string(buf);
}

int64_t wall_clock_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

} // namespace signaling
