#pragma once

#include "common.h"
#include "session_log.h"
#include "tool.h"
#include "tool_registry.h"
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

namespace rtvoice {

using ExecutionRecordSink = std::function<void(const ToolExecutionRecord&)>;

/**
 * @brief Turns a model-issued function call into a backend invocation
 *
 * For each call:
 * - Parse the raw argument text (invalid JSON becomes {})
 * - Require an originating session
 * - Reconcile arguments against the tool's schema, then any nested invocations
 *   against their own schemas
 * - Dispatch to the backend for the tool's execution type
 * - Report the outcome to the record sink
 *
 * Every failure, including reconciliation, comes back as an error ToolResult
 * for the caller to send upstream; nothing is thrown.
 */
class ToolMediator {
public:
    ToolMediator(std::shared_ptr<const ToolRegistry> registry,
                 std::vector<std::shared_ptr<ToolBackend>> backends,
                 ExecutionRecordSink record_sink = nullptr);

    /**
     * @brief Atomically replace the registry; calls in flight keep their snapshot
     */
    void set_registry(std::shared_ptr<const ToolRegistry> registry);

    std::shared_ptr<const ToolRegistry> registry() const;

    /**
     * @brief Reconcile raw arguments for a tool without dispatching
     */
    Result<json> reconcile(const ToolDefinition& tool, const json& raw_args, const ToolRegistry& registry) const;

    /**
     * @brief Run one call to completion (blocking)
     */
    ToolResult execute(const ToolCallRequest& request);

private:
    Result<json> dispatch(const ToolDefinition& tool, const json& args, const ToolContext& context);

    mutable std::mutex registry_mutex_;
    std::shared_ptr<const ToolRegistry> registry_;
    std::vector<std::shared_ptr<ToolBackend>> backends_;
    ExecutionRecordSink record_sink_;
};

} // namespace rtvoice
