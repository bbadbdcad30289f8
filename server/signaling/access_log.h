/*
 * Access Log
 *
 * Bounded in-memory log of authentication, session and admin events.
 * Newest entries first; the oldest entry is dropped at capacity.
 */

#ifndef ACCESS_LOG_H
#define ACCESS_LOG_H

#include "../../common/utils/json_utils.h"
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

namespace signaling {

struct AccessLogEntry {
    int64_t timestamp = 0;      // ms since epoch
    std::string event;
    std::string source_id;
    std::string target_id;      // Optional
    std::string ip;             // Optional
    bool success = false;
};

class AccessLog {
public:
    static constexpr size_t DEFAULT_CAPACITY = 1000;

    explicit AccessLog(size_t capacity = DEFAULT_CAPACITY);

    // Appends and prints a one-line summary to stderr
    void record(const std::string& event, const std::string& source_id,
                const std::string& target_id, const std::string& ip, bool success);

    // Up to limit entries, newest first
    std::vector<AccessLogEntry> latest(size_t limit) const;
    size_t size() const;

    static json_utils::json to_json(const AccessLogEntry& entry);

private:
    size_t capacity_;
    mutable std::mutex mutex_;
    std::deque<AccessLogEntry> entries_;
};

// Milliseconds since epoch as ISO-8601 UTC
std::string format_timestamp(int64_t ms);

// Wall clock, ms since epoch
int64_t wall_clock_ms();

} // namespace signaling

#endif // ACCESS_LOG_H
