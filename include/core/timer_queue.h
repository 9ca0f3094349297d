#pragma once

/**
 * @file timer_queue.h
 * @brief Delayed task execution on a single background thread
 *
 * Used for:
 * - Reconnection backoff timers
 */

#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <mutex>
#include <thread>

namespace rtvoice {

/**
 * @brief Runs a task after a delay
 *
 * Injected into the realtime client so tests can fire timers by hand.
 */
using DelayScheduler = std::function<void(std::chrono::milliseconds delay, std::function<void()> task)>;

/**
 * @brief One worker thread executing tasks at their deadlines, in deadline order
 *
 * Tasks still pending at destruction are dropped.
 */
class TimerQueue {
public:
    TimerQueue();
    ~TimerQueue();

    TimerQueue(const TimerQueue&) = delete;
    TimerQueue& operator=(const TimerQueue&) = delete;

    void schedule(std::chrono::milliseconds delay, std::function<void()> task);

    /// Number of tasks not yet run
    size_t pending() const;

    /// Scheduler bound to this queue (the queue must outlive it)
    DelayScheduler scheduler();

private:
    void run();

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::multimap<std::chrono::steady_clock::time_point, std::function<void()>> tasks_;
    bool running_;
    std::thread worker_;
};

} // namespace rtvoice
