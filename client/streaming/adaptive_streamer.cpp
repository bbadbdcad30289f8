/*
 * Adaptive Streamer Implementation
 */

#include "adaptive_streamer.h"
#include "../../common/utils/debug_flags.h"
#include <chrono>
#include <cstdio>

namespace streaming {

static const int64_t SAMPLE_INTERVAL_MS = 1000;

AdaptiveStreamer::AdaptiveStreamer(scheduler::Scheduler& scheduler,
                                   FrameCapturer& capturer,
                                   FrameEncoder& encoder,
                                   FrameSink sink,
                                   entitlement::EntitlementService* entitlements)
    : scheduler_(scheduler)
    , capturer_(capturer)
    , encoder_(encoder)
    , sink_(std::move(sink))
    , entitlements_(entitlements)
    , running_(false)
    , timer_(scheduler::INVALID_TIMER)
    , armed_period_ms_(0)
    , last_frame_size_(0)
    , frames_sent_(0)
    , frames_dropped_(0)
    , window_frames_(0)
    , window_start_ms_(0)
    , fps_(0.0)
{}

AdaptiveStreamer::~AdaptiveStreamer() {
    stop();
}

int AdaptiveStreamer::period_ms_locked() const {
    int fps = preset(controller_.quality()).fps;
    return fps > 0 ? 1000 / fps : 1000;
}

void AdaptiveStreamer::start() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (running_) {
            return;
        }
        running_ = true;
        window_frames_ = 0;
        window_start_ms_ = scheduler_.now_ms();
        fps_ = 0.0;
    }

    rearm();

    std::lock_guard<std::mutex> lock(mutex_);
    Quality q = controller_.quality();
    const QualityPreset& p = preset(q);
    fprintf(stderr, "Stream: Started with %s (%s, %dx%d @ %d fps)\n",
            encoder_.name(), quality_name(q), p.width, p.height, p.fps);
}

void AdaptiveStreamer::stop() {
    scheduler::TimerId timer;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) {
            return;
        }
        running_ = false;
        timer = timer_;
        timer_ = scheduler::INVALID_TIMER;
        armed_period_ms_ = 0;
    }
    scheduler_.cancel(timer);
    fprintf(stderr, "Stream: Stopped\n");
}

bool AdaptiveStreamer::is_running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_;
}

void AdaptiveStreamer::rearm() {
    int period;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) {
            return;
        }
        period = period_ms_locked();
        if (period == armed_period_ms_ && timer_ != scheduler::INVALID_TIMER) {
            return;
        }
    }

    // Never cancel with mutex_ held: cancel waits for a running tick
    scheduler::TimerId fresh = scheduler_.schedule_every(
        std::chrono::milliseconds(period), [this]() { tick(); });

    scheduler::TimerId old;
    bool keep;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        keep = running_;
        if (keep) {
            old = timer_;
            timer_ = fresh;
            armed_period_ms_ = period;
        } else {
            old = fresh;
        }
    }
    scheduler_.cancel(old);

    if (keep && g_debug_stream) {
        fprintf(stderr, "Stream: Frame period %d ms\n", period);
    }
}

void AdaptiveStreamer::tick() {
    Quality q;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) {
            return;
        }
        q = controller_.quality();
    }
    const QualityPreset& p = preset(q);

    bool sent = false;
    size_t size = 0;
    if (capturer_.capture(p.width, p.height, raw_) &&
        encoder_.encode(raw_, p.encoder_quality, encoded_)) {
        size = encoded_.size();
        sent = sink_(encoded_);
    }

    bool period_changed = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (size > 0) {
            last_frame_size_ = size;
        }
        if (sent) {
            frames_sent_++;
            window_frames_++;
        } else {
            frames_dropped_++;
        }

        int64_t now = scheduler_.now_ms();
        int64_t elapsed = now - window_start_ms_;
        if (elapsed >= SAMPLE_INTERVAL_MS) {
            fps_ = window_frames_ * 1000.0 / static_cast<double>(elapsed);
            window_frames_ = 0;
            window_start_ms_ = now;

            Quality before = controller_.quality();
            if (controller_.sample(last_frame_size_)) {
                Quality after = controller_.quality();
                fprintf(stderr, "Stream: Auto quality %s -> %s (frame %zu bytes)\n",
                        quality_name(before), quality_name(after), last_frame_size_);
                period_changed = period_ms_locked() != armed_period_ms_;
            }

            if (g_debug_stream) {
                fprintf(stderr, "Stream: %.1f fps, %s, last frame %zu bytes, sent=%llu dropped=%llu\n",
                        fps_, quality_name(controller_.quality()), last_frame_size_,
                        (unsigned long long)frames_sent_, (unsigned long long)frames_dropped_);
            }
        }
    }

    if (period_changed) {
        rearm();
    }
}

bool AdaptiveStreamer::set_quality(Quality quality) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!controller_.set_quality(quality)) {
            return false;
        }
    }
    fprintf(stderr, "Stream: Quality set to %s\n", quality_name(quality));
    rearm();
    return true;
}

bool AdaptiveStreamer::set_game_mode(bool enabled) {
    if (enabled && entitlements_ &&
        !entitlements_->can_use_feature(entitlement::FEATURE_GAME_MODE)) {
        fprintf(stderr, "Stream: Game mode not available on this plan\n");
        return false;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        controller_.set_game_mode(enabled);
    }
    fprintf(stderr, "Stream: Game mode %s\n", enabled ? "ON" : "OFF");
    rearm();
    return true;
}

void AdaptiveStreamer::set_auto_quality(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    controller_.set_auto_quality(enabled);
    fprintf(stderr, "Stream: Auto quality %s\n", enabled ? "ON" : "OFF");
}

StreamStats AdaptiveStreamer::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    StreamStats s;
    s.fps = fps_;
    s.quality = controller_.quality();
    s.last_frame_size = last_frame_size_;
    s.game_mode = controller_.game_mode();
    s.auto_quality = controller_.auto_quality();
    s.frames_sent = frames_sent_;
    s.frames_dropped = frames_dropped_;
    return s;
}

} // namespace streaming
