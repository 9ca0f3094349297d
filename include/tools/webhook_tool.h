#pragma once

#include "tool.h"
#include "http_client.h"
#include <memory>
#include <string>

namespace rtvoice {
namespace tools {

/**
 * @brief Registered name of a webhook trigger tool
 *
 * "trigger_n8n_<normalized name, at most 30 chars>_<last 8 id chars without dashes>";
 * an empty normalized name becomes "n8n".
 */
std::string build_webhook_tool_name(const std::string& name, const std::string& id);

/**
 * @brief Trigger schema: {summary, severity (low|medium|high|critical), payload (required), metadata}
 * @param payload_parameters Optional [{key, label, description, type, required, example}]
 *        describing the payload's own properties
 */
json build_webhook_schema(const json& payload_parameters);

/**
 * @brief Triggers workflows through the webhook proxy
 *
 * POSTs {integration_id, payload, summary, severity, session_id, metadata}.
 * The tool must carry metadata.integrationId.
 */
class WebhookBackend : public ToolBackend {
public:
    /**
     * @param proxy_url Full proxy endpoint
     * @param auth_token Sent as a bearer token when non-empty
     */
    WebhookBackend(std::shared_ptr<HttpClient> http,
                   const std::string& proxy_url,
                   const std::string& auth_token,
                   int timeout_ms);

    ExecutionType type() const override { return ExecutionType::Webhook; }

    Result<json> execute(const ToolDefinition& tool,
                         const json& args,
                         const ToolContext& context) override;

private:
    std::shared_ptr<HttpClient> http_;
    std::string proxy_url_;
    std::string auth_token_;
    int timeout_ms_;
};

} // namespace tools
} // namespace rtvoice
