#include "tools/webhook_tool.h"
#include "logger.h"
#include "utils.h"

namespace rtvoice {
namespace tools {

std::string build_webhook_tool_name(const std::string& name, const std::string& id) {
    std::string normalized = utils::normalize_identifier(name);
    if (normalized.empty()) {
        normalized = "n8n";
    }

    std::string compact;
    for (char c : id) {
        if (c != '-') compact.push_back(c);
    }
    std::string suffix = compact.size() > 8 ? compact.substr(compact.size() - 8) : compact;

    return "trigger_n8n_" + normalized.substr(0, 30) + "_" + suffix;
}

json build_webhook_schema(const json& payload_parameters) {
    json payload = json::object();
    payload["type"] = "object";
    payload["properties"] = json::object();
    payload["additionalProperties"] = true;

    if (payload_parameters.is_array() && !payload_parameters.empty()) {
        json properties = json::object();
        json required = json::array();
        for (const auto& param : payload_parameters) {
            if (!param.is_object() || !param.contains("key") || !param["key"].is_string()) continue;
            const std::string key = param["key"].get<std::string>();
            if (key.empty()) continue;

            json prop = json::object();
            prop["type"] = param.contains("type") && param["type"].is_string() ? param["type"] : json("string");
            if (param.contains("description") && param["description"].is_string()) {
                prop["description"] = param["description"];
            } else if (param.contains("label") && param["label"].is_string()) {
                prop["description"] = param["label"];
            }
            if (param.contains("example") && param["example"].is_string() &&
                !param["example"].get<std::string>().empty()) {
                prop["examples"] = json::array({param["example"]});
            }
            properties[key] = prop;

            if (param.contains("required") && param["required"].is_boolean() && param["required"].get<bool>()) {
                required.push_back(key);
            }
        }
        payload["properties"] = properties;
        if (!required.empty()) {
            payload["required"] = required;
        }
    }

    json properties = json::object();
    properties["summary"] = {
        {"type", "string"},
        {"description", "Short description of what needs to happen so n8n can branch correctly"}
    };
    properties["severity"] = {
        {"type", "string"},
        {"enum", json::array({"low", "medium", "high", "critical"})},
        {"description", "How urgent or important the trigger is"}
    };
    properties["payload"] = payload;
    properties["metadata"] = {
        {"type", "object"},
        {"description", "Optional metadata such as related ticket IDs or human-friendly notes"}
    };

    json schema = json::object();
    schema["type"] = "object";
    schema["properties"] = properties;
    schema["required"] = json::array({"payload"});
    return schema;
}

WebhookBackend::WebhookBackend(std::shared_ptr<HttpClient> http,
                               const std::string& proxy_url,
                               const std::string& auth_token,
                               int timeout_ms)
    : http_(std::move(http)), proxy_url_(proxy_url), auth_token_(auth_token), timeout_ms_(timeout_ms) {}

Result<json> WebhookBackend::execute(const ToolDefinition& tool,
                                     const json& args,
                                     const ToolContext& context) {
    const std::string integration_id = tool.integration_id();
    if (integration_id.empty()) {
        return Error(ErrorType::ExecutorFailure, "Missing integration metadata for webhook tool");
    }
    if (!http_ || proxy_url_.empty()) {
        return Error(ErrorType::ExecutorFailure, "Webhook proxy is not configured");
    }

    json body = json::object();
    body["integration_id"] = integration_id;
    body["payload"] = args.contains("payload") && !args["payload"].is_null() ? args["payload"] : args;
    body["summary"] = args.contains("summary") ? args["summary"] : json();
    body["severity"] = args.contains("severity") ? args["severity"] : json();
    body["session_id"] = context.session_id.empty() ? json() : json(context.session_id);
    body["metadata"] = args.contains("metadata") && !args["metadata"].is_null() ? args["metadata"] : json::object();

    std::map<std::string, std::string> headers;
    if (!auth_token_.empty()) {
        headers["Authorization"] = "Bearer " + auth_token_;
    }

    LOG_TOOL("Triggering webhook " + tool.name + " (integration " + integration_id + ")");
    Result<HttpResponse> response = http_->post_json(proxy_url_, body.dump(), headers, timeout_ms_);
    if (!response) {
        return response.error();
    }

    const HttpResponse& http_response = response.value();
    json parsed = json::parse(http_response.body, nullptr, false);
    if (!http_response.ok()) {
        std::string message = "Failed to trigger n8n webhook";
        if (!parsed.is_discarded() && parsed.is_object()) {
            if (parsed.contains("error") && parsed["error"].is_string()) {
                message = parsed["error"].get<std::string>();
            } else if (parsed.contains("message") && parsed["message"].is_string()) {
                message = parsed["message"].get<std::string>();
            }
        }
        Logger::error("Webhook trigger failed (" + std::to_string(http_response.status) + "): " + message);
        return Error(ErrorType::ExecutorFailure, message);
    }

    if (parsed.is_discarded()) {
        return json(http_response.body);
    }
    return parsed;
}

} // namespace tools
} // namespace rtvoice
