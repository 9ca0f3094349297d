#pragma once

#include "common.h"
#include "errors.h"
#include <string>

namespace rtvoice {

/**
 * @brief Which backend executes a tool
 */
enum class ExecutionType {
    Mcp,      ///< Remote procedure connector
    Webhook   ///< Workflow trigger through the webhook proxy
};

const char* to_string(ExecutionType type);

/**
 * @brief Parse "mcp" / "webhook"; anything else is Mcp
 */
ExecutionType parse_execution_type(const std::string& name);

/**
 * @brief Tool as registered from the broker payload
 */
struct ToolDefinition {
    std::string name;
    std::string description;
    json parameters;        // Declared schema (possibly wrapped; see resolve_schema)
    ExecutionType execution_type = ExecutionType::Mcp;
    std::string connection_id;
    std::string owner_user_id;
    json metadata = json::object();

    /// metadata.integrationId (webhook tools), empty if absent
    std::string integration_id() const;
};

/**
 * @brief Result of one tool call, as reported upstream
 */
struct ToolResult {
    bool success = false;
    json output;          // Sent upstream as the function output
    std::string error;    // Error message if failed

    static ToolResult success_result(const json& output) {
        ToolResult result;
        result.success = true;
        result.output = output;
        return result;
    }

    static ToolResult error_result(const std::string& error_msg) {
        ToolResult result;
        result.success = false;
        result.error = error_msg;
        result.output = json{{"error", error_msg}};
        return result;
    }
};

/**
 * @brief Per-call execution context
 */
struct ToolContext {
    std::string session_id;
};

/**
 * @brief Uniform execute(tool, args) capability of one backend kind
 *
 * Implementations block until the remote call completes; the caller runs
 * them off the audio and network threads.
 */
class ToolBackend {
public:
    virtual ~ToolBackend() = default;

    virtual ExecutionType type() const = 0;

    /**
     * @brief Run the tool with already reconciled arguments
     * @return The backend's result payload, or ExecutorFailure / NetworkError
     */
    virtual Result<json> execute(const ToolDefinition& tool,
                                 const json& args,
                                 const ToolContext& context) = 0;
};

} // namespace rtvoice
