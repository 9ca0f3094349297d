#include "tool_mediator.h"
#include "tools/argument_normalizer.h"
#include "logger.h"
#include "utils.h"

namespace rtvoice {

ToolMediator::ToolMediator(std::shared_ptr<const ToolRegistry> registry,
                           std::vector<std::shared_ptr<ToolBackend>> backends,
                           ExecutionRecordSink record_sink)
    : registry_(registry ? std::move(registry) : std::make_shared<const ToolRegistry>())
    , backends_(std::move(backends))
    , record_sink_(std::move(record_sink)) {}

void ToolMediator::set_registry(std::shared_ptr<const ToolRegistry> registry) {
    if (!registry) {
        registry = std::make_shared<const ToolRegistry>();
    }
    std::lock_guard<std::mutex> lock(registry_mutex_);
    LOG_TOOL("Tool registry version " + std::to_string(registry->version()) + " (" +
             std::to_string(registry->size()) + " tools)");
    registry_ = std::move(registry);
}

std::shared_ptr<const ToolRegistry> ToolMediator::registry() const {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    return registry_;
}

Result<json> ToolMediator::reconcile(const ToolDefinition& tool,
                                     const json& raw_args,
                                     const ToolRegistry& registry) const {
    json prepared = tool.name == "execute_sql" ? tools::prepare_sql_arguments(raw_args) : raw_args;

    Result<json> normalized = tools::normalize_arguments(tool.name, tool.parameters, prepared);
    if (!normalized) {
        return normalized;
    }

    const json& args = normalized.value();
    if (args.is_object() && ((args.contains("tools") && args["tools"].is_array()) ||
                             (args.contains("tool_calls") && args["tool_calls"].is_array()))) {
        return tools::normalize_nested_calls(tool.name, args, [&registry](const std::string& slug) {
            return registry.schema_for_slug(slug);
        });
    }
    return normalized;
}

Result<json> ToolMediator::dispatch(const ToolDefinition& tool, const json& args, const ToolContext& context) {
    for (const auto& backend : backends_) {
        if (backend && backend->type() == tool.execution_type) {
            return backend->execute(tool, args, context);
        }
    }
    return Error(ErrorType::ExecutorFailure,
                 std::string("No backend for ") + to_string(tool.execution_type) + " tools");
}

ToolResult ToolMediator::execute(const ToolCallRequest& request) {
    if (request.name.empty()) {
        return ToolResult::error_result("Function call is missing a tool name");
    }

    json raw_args = json::object();
    if (!utils::is_empty_or_whitespace(request.arguments)) {
        raw_args = json::parse(request.arguments, nullptr, false);
        if (raw_args.is_discarded()) {
            LOG_WARN("[Tool] Failed to parse arguments for " + request.name + ", using {}");
            raw_args = json::object();
        }
    }

    if (request.session_id.empty()) {
        return ToolResult::error_result("Voice session missing for tool execution");
    }

    std::shared_ptr<const ToolRegistry> snapshot = registry();
    const ToolDefinition* tool = snapshot->get_tool(request.name);
    if (!tool) {
        Logger::error("Tool not found: " + request.name);
        return ToolResult::error_result("Tool not found: " + request.name);
    }

    ToolContext context;
    context.session_id = request.session_id;

    ToolExecutionRecord record;
    record.tool_name = request.name;
    record.execution_type = tool->execution_type;
    record.session_id = request.session_id;
    record.started_at = utils::iso_timestamp_now();
    auto start = std::chrono::steady_clock::now();

    LOG_TOOL("Executing " + tool->name + " (" + to_string(tool->execution_type) + ")");
    Result<json> reconciled = reconcile(*tool, raw_args, *snapshot);
    Result<json> output = reconciled ? dispatch(*tool, reconciled.value(), context) : Result<json>(reconciled.error());
    if (reconciled) {
        record.input_params = reconciled.value();
    }

    ToolResult result = output ? ToolResult::success_result(output.value())
                               : ToolResult::error_result(output.error().message);

    record.execution_time_ms = ms_since(start);
    record.finished_at = utils::iso_timestamp_now();
    record.output_result = result.output;
    record.status = result.success ? "success" : "error";
    record.error_message = result.error;

    if (result.success) {
        LOG_TOOL(tool->name + " completed in " + std::to_string(record.execution_time_ms) + "ms");
    } else {
        LOG_WARN("[Tool] " + tool->name + " failed (" + describe(output.error().type) + "): " + result.error);
    }

    if (record_sink_) {
        record_sink_(record);
    }
    return result;
}

} // namespace rtvoice
