#include "tool_executor.h"
#include "logger.h"

namespace rtvoice {

ToolExecutor::ToolExecutor(size_t max_concurrent)
    : queue_(std::make_shared<WorkQueue>()) {
    if (max_concurrent == 0) {
        max_concurrent = 1;
    }
    for (size_t i = 0; i < max_concurrent; ++i) {
        worker_threads_.emplace_back(&ToolExecutor::worker_thread, queue_);
    }
}

ToolExecutor::~ToolExecutor() {
    shutdown();

    for (auto& thread : worker_threads_) {
        if (!thread.joinable()) {
            continue;
        }
        // A completion callback may drop the last owner on a worker
        if (thread.get_id() == std::this_thread::get_id()) {
            thread.detach();
        } else {
            thread.join();
        }
    }
}

bool ToolExecutor::execute_async(const std::string& call_id,
                                 ToolJob job,
                                 ToolExecutionCallback callback,
                                 int timeout_ms) {
    std::string rejection;
    if (!job) {
        rejection = "No tool job";
    } else {
        ExecutionTask task;
        task.call_id = call_id;
        task.job = std::move(job);
        task.callback = callback;
        task.timeout_ms = timeout_ms;
        task.start_time = std::chrono::steady_clock::now();

        std::lock_guard<std::mutex> lock(queue_->mutex);
        if (queue_->running) {
            queue_->tasks.push(std::move(task));
        } else {
            rejection = "Tool executor is shut down";
        }
    }

    if (rejection.empty()) {
        queue_->work_cv.notify_one();
        return true;
    }

    Logger::warn("ToolExecutor cannot accept call " + call_id);
    if (callback) {
        ToolExecutionResult result;
        result.call_id = call_id;
        result.result = ToolResult::error_result(rejection);
        callback(result);
    }
    return false;
}

ToolExecutionResult ToolExecutor::execute_sync(const std::string& call_id, ToolJob job, int timeout_ms) {
    // Shared so a late callback after a timeout writes into live state
    struct SyncState {
        std::mutex mutex;
        std::condition_variable cv;
        bool completed = false;
        ToolExecutionResult result;
    };
    auto state = std::make_shared<SyncState>();

    auto callback = [state](const ToolExecutionResult& res) {
        std::lock_guard<std::mutex> lock(state->mutex);
        state->result = res;
        state->completed = true;
        state->cv.notify_one();
    };

    if (!execute_async(call_id, std::move(job), callback, timeout_ms)) {
        std::lock_guard<std::mutex> lock(state->mutex);
        return state->result;
    }

    std::unique_lock<std::mutex> lock(state->mutex);
    if (timeout_ms > 0) {
        state->cv.wait_for(lock, std::chrono::milliseconds(timeout_ms), [&] { return state->completed; });
        if (!state->completed) {
            ToolExecutionResult timed_out;
            timed_out.call_id = call_id;
            timed_out.result = ToolResult::error_result("Tool execution timeout");
            return timed_out;
        }
    } else {
        state->cv.wait(lock, [&] { return state->completed; });
    }

    return state->result;
}

bool ToolExecutor::is_idle() const {
    std::lock_guard<std::mutex> lock(queue_->mutex);
    return queue_->tasks.empty() && queue_->active_executions == 0;
}

size_t ToolExecutor::pending_count() const {
    std::lock_guard<std::mutex> lock(queue_->mutex);
    return queue_->tasks.size() + queue_->active_executions;
}

bool ToolExecutor::wait_for_completion(int timeout_ms) {
    std::unique_lock<std::mutex> lock(queue_->mutex);
    WorkQueue& q = *queue_;
    auto idle = [&q] { return q.tasks.empty() && q.active_executions == 0; };
    if (timeout_ms > 0) {
        return q.idle_cv.wait_for(lock, std::chrono::milliseconds(timeout_ms), idle);
    }
    q.idle_cv.wait(lock, idle);
    return true;
}

void ToolExecutor::shutdown() {
    {
        std::lock_guard<std::mutex> lock(queue_->mutex);
        queue_->running = false;
    }
    queue_->work_cv.notify_all();
}

void ToolExecutor::worker_thread(std::shared_ptr<WorkQueue> queue) {
    while (true) {
        ExecutionTask task;

        {
            std::unique_lock<std::mutex> lock(queue->mutex);
            queue->work_cv.wait(lock, [&queue] {
                return !queue->tasks.empty() || !queue->running;
            });

            if (queue->tasks.empty()) {
                break;
            }

            task = std::move(queue->tasks.front());
            queue->tasks.pop();
            queue->active_executions++;
        }

        run_task(task);

        {
            std::lock_guard<std::mutex> lock(queue->mutex);
            queue->active_executions--;
        }
        queue->idle_cv.notify_all();
    }
}

void ToolExecutor::run_task(ExecutionTask& task) {
    ToolExecutionResult result;
    result.call_id = task.call_id;

    bool expired = false;
    if (task.timeout_ms > 0) {
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - task.start_time).count();
        expired = elapsed >= task.timeout_ms;
    }

    if (expired) {
        result.result = ToolResult::error_result("Tool execution timeout");
    } else {
        try {
            result.result = task.job();
        } catch (const std::exception& e) {
            Logger::error("Tool execution exception for " + task.call_id + ": " + e.what());
            result.result = ToolResult::error_result("Tool execution exception: " + std::string(e.what()));
        } catch (...) {
            Logger::error("Unknown exception during tool execution: " + task.call_id);
            result.result = ToolResult::error_result("Unknown tool execution error");
        }
    }

    if (task.callback) {
        try {
            task.callback(result);
        } catch (const std::exception& e) {
            Logger::error("Tool completion callback failed for " + task.call_id + ": " + e.what());
        }
    }
    task.job = nullptr;
    task.callback = nullptr;
}

} // namespace rtvoice
