#include "session_broker.h"
#include "logger.h"
#include "utils.h"
#include <array>

namespace rtvoice {

namespace {

constexpr std::array<const char*, 10> kSupportedVoices = {
    "alloy", "ash", "ballad", "coral", "echo", "sage", "shimmer", "verse", "marin", "cedar"};

// Non-empty string field or fallback
std::string string_or(const json& obj, const char* key, const std::string& fallback) {
    if (obj.is_object() && obj.contains(key) && obj[key].is_string()) {
        const std::string& value = obj[key].get_ref<const std::string&>();
        if (!value.empty()) return value;
    }
    return fallback;
}

} // namespace

std::string build_embed_function_url(const std::string& api_base, const std::string& function_name) {
    if (api_base.empty()) return "";
    std::string base = api_base;
    if (base.back() == '/') base.pop_back();
    if (utils::ends_with(base, "/functions/v1")) {
        return base + "/" + function_name;
    }
    return base + "/functions/v1/" + function_name;
}

std::string sanitize_voice(const std::string& voice) {
    std::string lowered = utils::to_lower_copy(utils::trim_copy(voice));
    for (const char* supported : kSupportedVoices) {
        if (lowered == supported) return lowered;
    }
    return "alloy";
}

SessionBroker::SessionBroker(std::shared_ptr<HttpClient> http, const std::string& api_base, int timeout_ms)
    : http_(std::move(http)), api_base_(api_base), timeout_ms_(timeout_ms) {}

Result<SessionGrant> SessionBroker::parse_grant(const json& body) {
    if (!body.is_object()) {
        return make_parse_error("Broker response is not an object");
    }

    SessionGrant grant;
    grant.token = string_or(body, "token", "");
    if (grant.token.empty()) {
        return make_parse_error("Broker response has no token");
    }
    grant.session_id = string_or(body, "session_id", "");

    json agent = body.contains("agent") ? body["agent"] : json::object();
    AgentProfile defaults;
    grant.agent.id = string_or(agent, "id", "");
    grant.agent.name = string_or(agent, "name", defaults.name);
    grant.agent.summary = string_or(agent, "summary", "");
    grant.agent.model = string_or(agent, "model", defaults.model);
    grant.agent.voice = sanitize_voice(string_or(agent, "voice", defaults.voice));
    grant.agent.instructions = string_or(agent, "instructions", defaults.instructions);

    if (body.contains("tools") && body["tools"].is_array()) {
        grant.tools = body["tools"];
    }

    if (body.contains("settings") && body["settings"].is_object()) {
        const json& settings = body["settings"];
        if (settings.contains("rtc_enabled") && settings["rtc_enabled"].is_boolean()) {
            grant.rtc_enabled = settings["rtc_enabled"].get<bool>();
        }
        if (settings.contains("appearance")) {
            grant.appearance = settings["appearance"];
        }
    }
    return grant;
}

Result<SessionGrant> SessionBroker::create_session(const std::string& public_id,
                                                   const std::string& client_session_id) {
    std::string url = build_embed_function_url(api_base_, "voice-ephemeral-key");
    if (url.empty()) {
        return Error(ErrorType::InvalidState, "Embed API base is missing");
    }

    json request = json::object();
    request["public_id"] = public_id;
    if (!client_session_id.empty()) {
        request["client_session_id"] = client_session_id;
    }

    LOG_BROKER("Requesting session for " + public_id);
    auto response = http_->post_json(url, request.dump(), {}, timeout_ms_);
    if (!response) {
        Logger::error("[Broker] " + response.error().message);
        return response.error();
    }

    json body = json::parse(response.value().body, nullptr, false);
    if (!response.value().ok()) {
        std::string message = "Failed to create realtime session";
        if (!body.is_discarded()) {
            message = string_or(body, "error", message);
        }
        Logger::error("[Broker] HTTP " + std::to_string(response.value().status) + ": " + message);
        return Error(ErrorType::ConnectionFailed, message);
    }
    if (body.is_discarded()) {
        return make_parse_error("Broker response is not valid JSON");
    }

    auto grant = parse_grant(body);
    if (grant) {
        LOG_BROKER("Session " + grant.value().session_id + " for agent '" + grant.value().agent.name +
                   "' (" + std::to_string(grant.value().tools.size()) + " tools)");
    }
    return grant;
}

} // namespace rtvoice
