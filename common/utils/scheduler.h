/*
 * Scheduler
 *
 * One-shot and repeating timers for heartbeats, reconnect backoff,
 * the capture loop, clipboard polling and stale-transfer sweeps.
 *
 * cancel() is synchronous: once it returns, the callback will not be
 * started again, and a repeating timer cancelled from inside its own
 * callback is not re-armed.
 */

#ifndef SCHEDULER_H
#define SCHEDULER_H

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <thread>

namespace scheduler {

using TimerId = uint64_t;
using Callback = std::function<void()>;

constexpr TimerId INVALID_TIMER = 0;

class Scheduler {
public:
    virtual ~Scheduler() = default;

    virtual TimerId schedule_after(std::chrono::milliseconds delay, Callback fn) = 0;
    virtual TimerId schedule_every(std::chrono::milliseconds period, Callback fn) = 0;

    // Unknown or already-fired ids are ignored
    virtual void cancel(TimerId id) = 0;

    // Monotonic milliseconds
    virtual int64_t now_ms() const = 0;
};

/**
 * Scheduler backed by a single worker thread
 *
 * Callbacks run on the worker thread one at a time. Exceptions thrown
 * from a callback are logged and do not stop the thread.
 */
class TimerThread : public Scheduler {
public:
    TimerThread();
    ~TimerThread() override;

    TimerThread(const TimerThread&) = delete;
    TimerThread& operator=(const TimerThread&) = delete;

    TimerId schedule_after(std::chrono::milliseconds delay, Callback fn) override;
    TimerId schedule_every(std::chrono::milliseconds period, Callback fn) override;
    void cancel(TimerId id) override;
    int64_t now_ms() const override;

    // Cancel all timers and join the worker
    void stop();

private:
    using Clock = std::chrono::steady_clock;

    struct Timer {
        Clock::time_point due;
        std::chrono::milliseconds period;   // zero for one-shot
        Callback fn;
    };

    TimerId add(std::chrono::milliseconds delay, std::chrono::milliseconds period, Callback fn);
    void run();

    std::mutex mutex_;
    std::condition_variable wake_cv_;
    std::condition_variable idle_cv_;
    std::map<TimerId, Timer> timers_;
    TimerId next_id_ = 1;
    TimerId running_id_ = INVALID_TIMER;
    std::atomic<bool> running_;
    std::thread thread_;
};

} // namespace scheduler

#endif // SCHEDULER_H
