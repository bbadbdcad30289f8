/*
 * Adaptive Streamer
 *
 * Capture -> encode -> send loop on a scheduler timer whose period is
 * 1000 / fps of the active preset. Once per second the FPS counter is
 * rolled over and the quality controller samples the last frame size;
 * a quality change that alters the frame period re-arms the timer.
 *
 * Frames are handed to a sink (the transport router). A frame the sink
 * refuses is dropped; nothing is queued.
 */

#ifndef ADAPTIVE_STREAMER_H
#define ADAPTIVE_STREAMER_H

#include "codec.h"
#include "quality.h"
#include "../entitlement/entitlements.h"
#include "../../common/utils/scheduler.h"
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <vector>

namespace streaming {

struct StreamStats {
    double fps = 0.0;
    Quality quality = Quality::MEDIUM;
    size_t last_frame_size = 0;
    bool game_mode = false;
    bool auto_quality = true;
    uint64_t frames_sent = 0;
    uint64_t frames_dropped = 0;
};

class AdaptiveStreamer {
public:
    // Returns false if the frame could not be sent
    using FrameSink = std::function<bool(const std::vector<uint8_t>& frame)>;

    AdaptiveStreamer(scheduler::Scheduler& scheduler,
                     FrameCapturer& capturer,
                     FrameEncoder& encoder,
                     FrameSink sink,
                     entitlement::EntitlementService* entitlements = nullptr);
    ~AdaptiveStreamer();

    AdaptiveStreamer(const AdaptiveStreamer&) = delete;
    AdaptiveStreamer& operator=(const AdaptiveStreamer&) = delete;

    void start();
    void stop();
    bool is_running() const;

    bool set_quality(Quality quality);

    // False if the plan does not include game mode
    bool set_game_mode(bool enabled);

    void set_auto_quality(bool enabled);

    StreamStats stats() const;

private:
    void tick();
    void rearm();
    int period_ms_locked() const;

    scheduler::Scheduler& scheduler_;
    FrameCapturer& capturer_;
    FrameEncoder& encoder_;
    FrameSink sink_;
    entitlement::EntitlementService* entitlements_;

    mutable std::mutex mutex_;
    QualityController controller_;
    bool running_;
    scheduler::TimerId timer_;
    int armed_period_ms_;

    RawFrame raw_;
    std::vector<uint8_t> encoded_;
    size_t last_frame_size_;
    uint64_t frames_sent_;
    uint64_t frames_dropped_;
    uint64_t window_frames_;
    int64_t window_start_ms_;
    double fps_;
};

} // namespace streaming

#endif // ADAPTIVE_STREAMER_H
