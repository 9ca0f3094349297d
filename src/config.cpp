#include "config.h"
#include "logger.h"
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace rtvoice {

namespace {

const char* env_or_null(const char* name) {
    const char* v = std::getenv(name);
    return (v && *v) ? v : nullptr;
}

void load_turn_detection(const json& t, TurnDetectionConfig& td) {
    if (t.is_null()) {
        td.type = "none";
        return;
    }
    if (!t.is_object()) return;
    if (t.contains("type")) td.type = t["type"].get<std::string>();
    if (t.contains("threshold")) td.threshold = t["threshold"];
    if (t.contains("prefix_padding_ms")) td.prefix_padding_ms = t["prefix_padding_ms"];
    if (t.contains("silence_duration_ms")) td.silence_duration_ms = t["silence_duration_ms"];
}

void load_json(const json& j, Config& cfg) {
    // Audio config
    if (j.contains("audio")) {
        auto& a = j["audio"];
        if (a.contains("input_device")) cfg.audio.input_device = a["input_device"];
        if (a.contains("output_device")) cfg.audio.output_device = a["output_device"];
        if (a.contains("target_sample_rate")) cfg.audio.target_sample_rate = a["target_sample_rate"];
        if (a.contains("frame_ms")) cfg.audio.frame_ms = a["frame_ms"];
        if (a.contains("input_sample_rate")) cfg.audio.input_sample_rate = a["input_sample_rate"];
        if (a.contains("output_sample_rate")) cfg.audio.output_sample_rate = a["output_sample_rate"];
        if (a.contains("channel_capacity")) cfg.audio.channel_capacity = a["channel_capacity"];
    }

    // Realtime config
    if (j.contains("realtime")) {
        auto& r = j["realtime"];
        if (r.contains("url")) cfg.realtime.url = r["url"];
        if (r.contains("api_key")) cfg.realtime.api_key = r["api_key"];
        if (r.contains("model")) cfg.realtime.model = r["model"];
        if (r.contains("voice")) cfg.realtime.voice = r["voice"];
        if (r.contains("instructions")) cfg.realtime.instructions = r["instructions"];
        if (r.contains("temperature")) cfg.realtime.temperature = r["temperature"];
        if (r.contains("max_response_output_tokens")) cfg.realtime.max_response_output_tokens = r["max_response_output_tokens"];
        if (r.contains("turn_detection")) load_turn_detection(r["turn_detection"], cfg.realtime.turn_detection);
        if (r.contains("transcription")) {
            auto& t = r["transcription"];
            if (t.contains("model")) cfg.realtime.transcription.model = t["model"];
            if (t.contains("language")) cfg.realtime.transcription.language = t["language"];
        }
        if (r.contains("allow_interruptions")) cfg.realtime.allow_interruptions = r["allow_interruptions"];
        if (r.contains("guardrail_mode")) cfg.realtime.guardrail_mode = r["guardrail_mode"];
        if (r.contains("rag_instructions")) cfg.realtime.rag_instructions = r["rag_instructions"];
        if (r.contains("commit_threshold_samples")) cfg.realtime.commit_threshold_samples = r["commit_threshold_samples"];
        if (r.contains("connect_timeout_ms")) cfg.realtime.connect_timeout_ms = r["connect_timeout_ms"];
    }

    if (j.contains("reconnect")) {
        auto& rc = j["reconnect"];
        if (rc.contains("max_attempts")) cfg.reconnect.max_attempts = rc["max_attempts"];
        if (rc.contains("base_delay_ms")) cfg.reconnect.base_delay_ms = rc["base_delay_ms"];
    }

    if (j.contains("broker")) {
        auto& b = j["broker"];
        if (b.contains("api_base")) cfg.broker.api_base = b["api_base"];
        if (b.contains("public_id")) cfg.broker.public_id = b["public_id"];
        if (b.contains("timeout_ms")) cfg.broker.timeout_ms = b["timeout_ms"];
    }

    if (j.contains("tools")) {
        auto& t = j["tools"];
        if (t.contains("mcp_base_url")) cfg.tools.mcp_base_url = t["mcp_base_url"];
        if (t.contains("mcp_auth_token")) cfg.tools.mcp_auth_token = t["mcp_auth_token"];
        if (t.contains("webhook_proxy_url")) cfg.tools.webhook_proxy_url = t["webhook_proxy_url"];
        if (t.contains("max_concurrent")) cfg.tools.max_concurrent = t["max_concurrent"];
        if (t.contains("timeout_ms")) cfg.tools.timeout_ms = t["timeout_ms"];
    }

    if (j.contains("logging")) {
        auto& l = j["logging"];
        if (l.contains("level")) cfg.logging.level = l["level"];
        if (l.contains("file")) cfg.logging.file = l["file"];
    }

    if (j.contains("session_log_dir")) cfg.session_log_dir = j["session_log_dir"];
    if (j.contains("max_messages")) cfg.max_messages = j["max_messages"];
}

} // namespace

bool Config::parse(const std::string& text, Config& cfg) {
    json j;
    try {
        j = json::parse(text);
    } catch (const json::exception& e) {
        Logger::warn(std::string("Error parsing config: ") + e.what());
        return false;
    }
    if (!j.is_object()) {
        Logger::warn("Config root is not a JSON object");
        return false;
    }

    Config parsed;
    try {
        load_json(j, parsed);
    } catch (const json::exception& e) {
        Logger::warn(std::string("Config field has wrong type: ") + e.what());
        return false;
    }
    cfg = parsed;
    return true;
}

Config Config::load_from_file(const std::string& path) {
    Config cfg;

    if (!path.empty()) {
        std::ifstream f(path);
        if (!f.is_open()) {
            Logger::warn("Could not open config file " + path + ". Using defaults.");
        } else {
            std::stringstream ss;
            ss << f.rdbuf();
            if (!parse(ss.str(), cfg)) {
                Logger::warn("Config file " + path + " is invalid. Using defaults.");
            }
        }
    }

    cfg.apply_env_overrides();
    return cfg;
}

void Config::apply_env_overrides() {
    if (const char* key = env_or_null("OPENAI_API_KEY")) {
        realtime.api_key = key;
    }
    if (const char* id = env_or_null("RTVOICE_PUBLIC_ID")) {
        broker.public_id = id;
    }
    if (const char* base = env_or_null("RTVOICE_API_BASE")) {
        broker.api_base = base;
    }
    if (const char* level = env_or_null("RTVOICE_LOG_LEVEL")) {
        logging.level = level;
    }
}

} // namespace rtvoice
