#include "tools/mcp_tool.h"
#include "logger.h"
#include "utils.h"

namespace rtvoice {
namespace tools {

namespace {

bool is_set(const json& obj, const char* key) {
    if (!obj.is_object() || !obj.contains(key)) return false;
    const json& value = obj[key];
    if (value.is_null()) return false;
    if (value.is_boolean()) return value.get<bool>();
    if (value.is_string()) return !value.get<std::string>().empty();
    if (value.is_number()) return value.get<double>() != 0.0;
    return true;
}

} // namespace

McpBackend::McpBackend(std::shared_ptr<HttpClient> http,
                       const std::string& base_url,
                       const std::string& auth_token,
                       int timeout_ms)
    : http_(std::move(http)), auth_token_(auth_token), timeout_ms_(timeout_ms) {
    std::string base = base_url;
    while (!base.empty() && base.back() == '/') {
        base.pop_back();
    }
    endpoint_ = base + "/api/mcp/execute";
}

Result<json> McpBackend::execute(const ToolDefinition& tool,
                                 const json& args,
                                 const ToolContext& context) {
    if (tool.connection_id.empty()) {
        return Error(ErrorType::ExecutorFailure, "MCP tool is missing connection information");
    }
    if (!http_) {
        return Error(ErrorType::ExecutorFailure, "MCP connector is not configured");
    }

    std::string user_id = tool.owner_user_id;
    if (user_id.empty() && tool.metadata.is_object()) {
        for (const char* key : {"userId", "user_id"}) {
            if (tool.metadata.contains(key) && tool.metadata[key].is_string()) {
                user_id = tool.metadata[key].get<std::string>();
                break;
            }
        }
    }

    json body = json::object();
    body["connection_id"] = tool.connection_id;
    body["tool_name"] = tool.name;
    body["parameters"] = args;
    body["user_id"] = user_id;

    std::map<std::string, std::string> headers;
    if (!auth_token_.empty()) {
        headers["Authorization"] = "Bearer " + auth_token_;
    }

    LOG_TOOL("Executing " + tool.name + " via connection " + tool.connection_id +
             (context.session_id.empty() ? "" : " (session " + context.session_id + ")"));
    Result<HttpResponse> response = http_->post_json(endpoint_, body.dump(), headers, timeout_ms_);
    if (!response) {
        return response.error();
    }

    const HttpResponse& http_response = response.value();
    json parsed = json::parse(http_response.body, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        if (!http_response.ok()) {
            return Error(ErrorType::ExecutorFailure,
                         "MCP request failed with status " + std::to_string(http_response.status));
        }
        return make_parse_error("Invalid MCP response");
    }

    if (!http_response.ok() || (parsed.contains("success") && parsed["success"].is_boolean() &&
                                !parsed["success"].get<bool>())) {
        std::string message = "MCP tool execution failed";
        if (parsed.contains("error") && parsed["error"].is_string() &&
            !parsed["error"].get<std::string>().empty()) {
            message = parsed["error"].get<std::string>();
        }
        return Error(ErrorType::ExecutorFailure, message);
    }

    if (is_set(parsed, "data")) return parsed["data"];
    if (parsed.contains("result")) return parsed["result"];
    return json();
}

} // namespace tools
} // namespace rtvoice
