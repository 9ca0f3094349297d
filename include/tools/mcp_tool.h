#pragma once

#include "tool.h"
#include "http_client.h"
#include <memory>
#include <string>

namespace rtvoice {
namespace tools {

/**
 * @brief Remote procedure connector backend
 *
 * POSTs {connection_id, tool_name, parameters, user_id} to
 * <base_url>/api/mcp/execute and returns the response's data (or result).
 * A response with success:false is an ExecutorFailure.
 */
class McpBackend : public ToolBackend {
public:
    McpBackend(std::shared_ptr<HttpClient> http,
               const std::string& base_url,
               const std::string& auth_token,
               int timeout_ms);

    ExecutionType type() const override { return ExecutionType::Mcp; }

    Result<json> execute(const ToolDefinition& tool,
                         const json& args,
                         const ToolContext& context) override;

private:
    std::shared_ptr<HttpClient> http_;
    std::string endpoint_;
    std::string auth_token_;
    int timeout_ms_;
};

} // namespace tools
} // namespace rtvoice
