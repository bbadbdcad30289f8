/*
 * Entitlements
 *
 * Per-plan feature gates and session limits. Plan assignment comes
 * from the account service; this module only answers what the current
 * plan allows.
 */

#ifndef ENTITLEMENTS_H
#define ENTITLEMENTS_H

#include "../../common/utils/scheduler.h"
#include <cstdint>
#include <mutex>
#include <string>

namespace entitlement {

// Feature names accepted by can_use_feature()
constexpr const char* FEATURE_FILE_TRANSFER = "fileTransfer";
constexpr const char* FEATURE_GAME_MODE = "gameMode";
constexpr const char* FEATURE_CLIPBOARD = "clipboard";
constexpr const char* FEATURE_MULTI_MONITOR = "multiMonitor";
constexpr const char* FEATURE_AUDIO_STREAM = "audioStream";

constexpr int64_t UNLIMITED = -1;

struct PlanLimits {
    const char* name;
    int64_t session_duration_ms;    // UNLIMITED or a positive duration
    int max_daily_connections;      // 0 = unlimited
    int max_resolution;             // Vertical lines
    bool file_transfer;
    bool multi_monitor;
    bool clipboard;
    bool audio_stream;
    bool game_mode;
};

// Unknown plan names fall back to "free"
const PlanLimits& plan_limits(const std::string& plan);

class EntitlementService {
public:
    virtual ~EntitlementService() = default;

    virtual bool can_start_connection() = 0;
    virtual bool can_use_feature(const std::string& feature) const = 0;

    // Milliseconds left in the running session, or UNLIMITED
    virtual int64_t remaining_session_ms() const = 0;

    virtual void start_session() = 0;
    virtual void end_session() = 0;
};

/**
 * Static plan table: free, personal_pro, business, team
 */
class PlanEntitlements : public EntitlementService {
public:
    PlanEntitlements(const std::string& plan, scheduler::Scheduler& clock);

    bool can_start_connection() override;
    bool can_use_feature(const std::string& feature) const override;
    int64_t remaining_session_ms() const override;
    void start_session() override;
    void end_session() override;

    const PlanLimits& limits() const { return limits_; }
    int connections_today() const;

private:
    void roll_day_locked();

    const PlanLimits& limits_;
    scheduler::Scheduler& clock_;

    mutable std::mutex mutex_;
    int64_t session_start_ms_;      // -1 when no session
    int connections_today_;
    int64_t day_;
};

} // namespace entitlement

#endif // ENTITLEMENTS_H
