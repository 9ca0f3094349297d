#pragma once

#include <string>
#include <cstdint>
#include <vector>

namespace rtvoice {

struct AudioConfig {
    std::string input_device;   ///< Device name substring; empty = system default
    std::string output_device;
    int target_sample_rate = 24000;
    int frame_ms = 20;
    /// Open the input at this rate (0 = device default rate). Audio is resampled to target_sample_rate.
    int input_sample_rate = 0;
    /// Open the output at this rate (0 = try target_sample_rate, then device default).
    int output_sample_rate = 0;
    /// Raw input blocks buffered between the device callback and the audio task
    size_t channel_capacity = 64;
};

struct TurnDetectionConfig {
    std::string type = "server_vad";  ///< "server_vad" | "semantic_vad" | "none" (manual commit)
    float threshold = 0.75f;
    int prefix_padding_ms = 150;
    int silence_duration_ms = 700;
};

struct TranscriptionConfig {
    std::string model = "gpt-4o-transcribe";
    std::string language = "en";
};

struct RealtimeConfig {
    std::string url = "wss://api.openai.com/v1/realtime";
    std::string api_key;  ///< Direct credential; the broker grant overrides it
    std::string model = "gpt-4o-realtime-preview";
    std::string voice = "alloy";
    std::string instructions = "You are a helpful AI voice assistant.";
    float temperature = 0.8f;
    int max_response_output_tokens = 1024;
    TurnDetectionConfig turn_detection;
    TranscriptionConfig transcription;
    bool allow_interruptions = true;
    /// When set, instructions also carry the knowledge-base block and the refusal directive
    bool guardrail_mode = false;
    std::string rag_instructions;
    int commit_threshold_samples = 2400;
    int connect_timeout_ms = 10000;
};

struct ReconnectConfig {
    int max_attempts = 5;
    int base_delay_ms = 1000;
};

struct BrokerConfig {
    std::string api_base;   ///< Empty = no broker; use realtime.api_key directly
    std::string public_id;
    int timeout_ms = 10000;
};

struct ToolsConfig {
    std::string mcp_base_url;
    std::string mcp_auth_token;
    std::string webhook_proxy_url;  ///< Empty = <broker.api_base>/functions/v1/n8n-webhook-proxy
    size_t max_concurrent = 2;
    int timeout_ms = 30000;
};

struct LoggingConfig {
    std::string level = "info";
    std::string file;
};

struct Config {
    AudioConfig audio;
    RealtimeConfig realtime;
    ReconnectConfig reconnect;
    BrokerConfig broker;
    ToolsConfig tools;
    LoggingConfig logging;

    std::string session_log_dir = "sessions";
    size_t max_messages = 30;

    /**
     * @brief Load configuration from a JSON file
     *
     * Missing fields keep their defaults and unknown fields are ignored. A missing
     * or malformed file logs a warning and yields defaults. Environment overrides
     * are applied afterwards (see apply_env_overrides).
     */
    static Config load_from_file(const std::string& path);

    /**
     * @brief Parse configuration from JSON text (no environment overrides)
     * @return false if the text is not valid JSON (cfg is left at defaults)
     */
    static bool parse(const std::string& text, Config& cfg);

    /**
     * @brief Apply OPENAI_API_KEY, RTVOICE_PUBLIC_ID, RTVOICE_API_BASE, RTVOICE_LOG_LEVEL
     */
    void apply_env_overrides();
};

} // namespace rtvoice
