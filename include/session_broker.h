#pragma once

/**
 * @file session_broker.h
 * @brief Client for the service that mints short-lived realtime credentials
 */

#include "common.h"
#include "errors.h"
#include "http_client.h"
#include <memory>
#include <string>

namespace rtvoice {

/**
 * @brief Agent profile returned with a grant
 */
struct AgentProfile {
    std::string id;
    std::string name = "Voice Agent";
    std::string summary;
    std::string model = "gpt-4o-realtime-preview";
    std::string voice = "alloy";
    std::string instructions = "You are a helpful AI voice assistant.";
};

/**
 * @brief Ephemeral credential plus everything needed to configure the session
 */
struct SessionGrant {
    std::string token;
    std::string session_id;
    AgentProfile agent;
    json tools = json::array();
    bool rtc_enabled = true;
    json appearance;
};

/**
 * @brief <base>/functions/v1/<name>, without doubling an existing /functions/v1 suffix
 */
std::string build_embed_function_url(const std::string& api_base, const std::string& function_name);

/**
 * @brief Supported upstream voice, or "alloy"
 */
std::string sanitize_voice(const std::string& voice);

class SessionBroker {
public:
    SessionBroker(std::shared_ptr<HttpClient> http, const std::string& api_base, int timeout_ms = 10000);

    /**
     * @brief Request a grant for a public agent id
     * @param client_session_id Stable per-client token; omitted when empty
     */
    Result<SessionGrant> create_session(const std::string& public_id,
                                        const std::string& client_session_id);

    /**
     * @brief Parse a broker response body (exposed for tests)
     */
    static Result<SessionGrant> parse_grant(const json& body);

    const std::string& api_base() const { return api_base_; }

private:
    std::shared_ptr<HttpClient> http_;
    std::string api_base_;
    int timeout_ms_;
};

} // namespace rtvoice
