#pragma once

#include "tool.h"
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

namespace rtvoice {

/**
 * @brief Tool execution result with call ID
 */
struct ToolExecutionResult {
    std::string call_id;
    ToolResult result;
};

/// Work for one tool call (reconcile + dispatch); runs on a worker thread
using ToolJob = std::function<ToolResult()>;

/**
 * @brief Callback type for tool execution completion (called on the worker thread)
 */
using ToolExecutionCallback = std::function<void(const ToolExecutionResult&)>;

/**
 * @brief Async tool execution engine
 *
 * Runs tool calls on a fixed pool of worker threads so neither the network
 * read loop nor the audio task blocks on a remote call. Every accepted call
 * gets exactly one callback, including calls still queued at shutdown.
 */
class ToolExecutor {
public:
    /**
     * @param max_concurrent Number of worker threads
     */
    explicit ToolExecutor(size_t max_concurrent = 1);

    /**
     * @brief Drains the queue, then joins the workers
     */
    ~ToolExecutor();

    // Non-copyable
    ToolExecutor(const ToolExecutor&) = delete;
    ToolExecutor& operator=(const ToolExecutor&) = delete;

    /**
     * @brief Queue a tool call
     * @param call_id Reported back in the result
     * @param timeout_ms Fail without running if the call waited this long in the queue (0 = no limit)
     * @return false if the executor is shut down (callback is still invoked with an error)
     */
    bool execute_async(const std::string& call_id,
                       ToolJob job,
                       ToolExecutionCallback callback,
                       int timeout_ms = 0);

    /**
     * @brief Queue a call and block until it completes or timeout_ms elapses
     */
    ToolExecutionResult execute_sync(const std::string& call_id, ToolJob job, int timeout_ms = 0);

    bool is_idle() const;

    /**
     * @brief Count of queued and executing calls
     */
    size_t pending_count() const;

    /**
     * @brief Wait for all pending executions to complete
     * @param timeout_ms Maximum time to wait (0 = wait indefinitely)
     * @return true if all completed, false if timeout
     */
    bool wait_for_completion(int timeout_ms = 0);

    /**
     * @brief Stop accepting new calls; queued calls still run
     */
    void shutdown();

private:
    struct ExecutionTask {
        std::string call_id;
        ToolJob job;
        ToolExecutionCallback callback;
        int timeout_ms = 0;
        std::chrono::steady_clock::time_point start_time;
    };

    // Owned jointly with the workers so a worker that releases the last
    // reference to the executor can still leave its loop
    struct WorkQueue {
        bool running = true;
        size_t active_executions = 0;
        std::queue<ExecutionTask> tasks;
        std::mutex mutex;
        std::condition_variable work_cv;
        std::condition_variable idle_cv;
    };

    static void worker_thread(std::shared_ptr<WorkQueue> queue);
    static void run_task(ExecutionTask& task);

    std::shared_ptr<WorkQueue> queue_;
    std::vector<std::thread> worker_threads_;
};

} // namespace rtvoice
