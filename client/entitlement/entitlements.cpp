/*
 * Entitlements Implementation
 */

#include "entitlements.h"
#include <chrono>
#include <cstdio>

namespace entitlement {

static const PlanLimits PLAN_FREE = {
    "free", 30 * 60 * 1000, 5, 720,
    false, false, true, false, false
};

static const PlanLimits PLAN_PERSONAL_PRO = {
    "personal_pro", UNLIMITED, 0, 1080,
    true, true, true, true, true
};

static const PlanLimits PLAN_BUSINESS = {
    "business", UNLIMITED, 0, 2160,
    true, true, true, true, true
};

static const PlanLimits PLAN_TEAM = {
    "team", UNLIMITED, 0, 2160,
    true, true, true, true, true
};

const PlanLimits& plan_limits(const std::string& plan) {
    if (plan == PLAN_PERSONAL_PRO.name) return PLAN_PERSONAL_PRO;
    if (plan == PLAN_BUSINESS.name) return PLAN_BUSINESS;
    if (plan == PLAN_TEAM.name) return PLAN_TEAM;
    return PLAN_FREE;
}

static int64_t current_day() {
    auto now = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration_cast<std::chrono::hours>(now).count() / 24;
}

PlanEntitlements::PlanEntitlements(const std::string& plan, scheduler::Scheduler& clock)
    : limits_(plan_limits(plan))
    , clock_(clock)
    , session_start_ms_(-1)
    , connections_today_(0)
    , day_(current_day())
{
    if (plan != limits_.name) {
        fprintf(stderr, "Client: Unknown plan '%s', using %s\n", plan.c_str(), limits_.name);
    }
}

void PlanEntitlements::roll_day_locked() {
    int64_t today = current_day();
    if (today != day_) {
        day_ = today;
        connections_today_ = 0;
    }
}

bool PlanEntitlements::can_start_connection() {
    std::lock_guard<std::mutex> lock(mutex_);
    roll_day_locked();
    if (limits_.max_daily_connections > 0 && connections_today_ >= limits_.max_daily_connections) {
        fprintf(stderr, "Client: Daily connection limit (%d) reached on plan %s\n",
                limits_.max_daily_connections, limits_.name);
        return false;
    }
    return true;
}

bool PlanEntitlements::can_use_feature(const std::string& feature) const {
    if (feature == FEATURE_FILE_TRANSFER) return limits_.file_transfer;
    if (feature == FEATURE_GAME_MODE) return limits_.game_mode;
    if (feature == FEATURE_CLIPBOARD) return limits_.clipboard;
    if (feature == FEATURE_MULTI_MONITOR) return limits_.multi_monitor;
    if (feature == FEATURE_AUDIO_STREAM) return limits_.audio_stream;
    return true;
}

int64_t PlanEntitlements::remaining_session_ms() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (limits_.session_duration_ms == UNLIMITED || session_start_ms_ < 0) {
        return UNLIMITED;
    }
    int64_t elapsed = clock_.now_ms() - session_start_ms_;
    int64_t remaining = limits_.session_duration_ms - elapsed;
    return remaining > 0 ? remaining : 0;
}

void PlanEntitlements::start_session() {
    std::lock_guard<std::mutex> lock(mutex_);
    roll_day_locked();
    session_start_ms_ = clock_.now_ms();
    connections_today_++;
}

void PlanEntitlements::end_session() {
    std::lock_guard<std::mutex> lock(mutex_);
    session_start_ms_ = -1;
}

int PlanEntitlements::connections_today() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connections_today_;
}

} // namespace entitlement
