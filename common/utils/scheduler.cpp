/*
 * Scheduler Implementation
 */

#include "scheduler.h"
#include <cstdio>
#include <exception>

namespace scheduler {

TimerThread::TimerThread()
    : running_(true)
{
    thread_ = std::thread(&TimerThread::run, this);
}

TimerThread::~TimerThread() {
    stop();
}

TimerId TimerThread::schedule_after(std::chrono::milliseconds delay, Callback fn) {
    return add(delay, std::chrono::milliseconds(0), std::move(fn));
}

TimerId TimerThread::schedule_every(std::chrono::milliseconds period, Callback fn) {
    return add(period, period, std::move(fn));
}

TimerId TimerThread::add(std::chrono::milliseconds delay, std::chrono::milliseconds period,
                         Callback fn) {
    std::lock_guard<std::mutex> lock(mutex_);
    TimerId id = next_id_++;
    timers_[id] = Timer{Clock::now() + delay, period, std::move(fn)};
    wake_cv_.notify_one();
    return id;
}

void TimerThread::cancel(TimerId id) {
    if (id == INVALID_TIMER) return;

    std::unique_lock<std::mutex> lock(mutex_);
    timers_.erase(id);

    // Wait for an in-flight run of this timer, unless we are that run
    if (std::this_thread::get_id() != thread_.get_id()) {
        idle_cv_.wait(lock, [this, id]() { return running_id_ != id; });
    }
}

int64_t TimerThread::now_ms() const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        Clock::now().time_since_epoch()).count();
}

void TimerThread::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) return;
        running_ = false;
        timers_.clear();
        wake_cv_.notify_one();
    }
    if (thread_.joinable() && std::this_thread::get_id() != thread_.get_id()) {
        thread_.join();
    }
}

void TimerThread::run() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (running_) {
        if (timers_.empty()) {
            wake_cv_.wait(lock);
            continue;
        }

        auto next = timers_.begin();
        for (auto it = timers_.begin(); it != timers_.end(); ++it) {
            if (it->second.due < next->second.due) next = it;
        }

        if (Clock::now() < next->second.due) {
            wake_cv_.wait_until(lock, next->second.due);
            continue;
        }

        TimerId id = next->first;
        Callback fn = next->second.fn;
        if (next->second.period.count() > 0) {
            next->second.due += next->second.period;
        } else {
            timers_.erase(next);
        }

        running_id_ = id;
        lock.unlock();
        try {
            fn();
        } catch (const std::exception& e) {
            fprintf(stderr, "Scheduler: Timer %llu callback failed: %s\n",
                    static_cast<unsigned long long>(id), e.what());
        }
        lock.lock();
        running_id_ = INVALID_TIMER;
        idle_cv_.notify_all();
    }
}

} // namespace scheduler
