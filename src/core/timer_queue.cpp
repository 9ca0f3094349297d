#include "core/timer_queue.h"
#include "logger.h"
#include <exception>

namespace rtvoice {

TimerQueue::TimerQueue() : running_(true) {
    worker_ = std::thread(&TimerQueue::run, this);
}

TimerQueue::~TimerQueue() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        running_ = false;
        tasks_.clear();
    }
    cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
}

void TimerQueue::schedule(std::chrono::milliseconds delay, std::function<void()> task) {
    if (!task) return;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) return;
        tasks_.emplace(std::chrono::steady_clock::now() + delay, std::move(task));
    }
    cv_.notify_all();
}

size_t TimerQueue::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
}

DelayScheduler TimerQueue::scheduler() {
    return [this](std::chrono::milliseconds delay, std::function<void()> task) {
        schedule(delay, std::move(task));
    };
}

void TimerQueue::run() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (running_) {
        if (tasks_.empty()) {
            cv_.wait(lock, [this] { return !running_ || !tasks_.empty(); });
            continue;
        }

        auto next = tasks_.begin()->first;
        if (std::chrono::steady_clock::now() < next) {
            cv_.wait_until(lock, next);
            continue;
        }

        auto task = std::move(tasks_.begin()->second);
        tasks_.erase(tasks_.begin());
        lock.unlock();
        try {
            task();
        } catch (const std::exception& e) {
            Logger::error(std::string("Timer task failed: ") + e.what());
        }
        lock.lock();
    }
}

} // namespace rtvoice
