#include "realtime/protocol.h"
#include "utils.h"

namespace rtvoice {
namespace realtime {
namespace protocol {

const char* const kLanguageGuard =
    "Always respond in English unless the user explicitly requests a different language.";

const char* const kGuardrailDirective =
    "If relevant knowledge from the approved knowledge base is unavailable, respond with "
    "\"I do not have enough knowledge to answer that yet.\"";

std::string augment_instructions(const RealtimeConfig& config) {
    std::string out = config.instructions;
    if (config.guardrail_mode) {
        if (!utils::is_empty_or_whitespace(config.rag_instructions)) {
            out += "\n\n" + config.rag_instructions;
        }
        out += "\n\n";
        out += kGuardrailDirective;
    }
    out += "\n\n";
    out += kLanguageGuard;
    return out;
}

json build_turn_detection(const TurnDetectionConfig& config) {
    if (config.type == "none") {
        return nullptr;
    }
    json td = json::object();
    td["type"] = config.type;
    if (config.type == "server_vad") {
        td["threshold"] = config.threshold;
        td["prefix_padding_ms"] = config.prefix_padding_ms;
        td["silence_duration_ms"] = config.silence_duration_ms;
    }
    return td;
}

json build_session_update(const RealtimeConfig& config, const json& tools) {
    json session = json::object();
    session["modalities"] = json::array({"text", "audio"});
    session["instructions"] = augment_instructions(config);
    session["voice"] = config.voice;
    session["input_audio_format"] = "pcm16";
    session["output_audio_format"] = "pcm16";
    session["input_audio_transcription"] = {
        {"model", config.transcription.model},
        {"language", config.transcription.language}
    };
    session["turn_detection"] = build_turn_detection(config.turn_detection);
    session["tools"] = tools.is_array() ? tools : json::array();
    session["tool_choice"] = "auto";
    session["temperature"] = config.temperature;
    session["max_response_output_tokens"] = config.max_response_output_tokens;

    json msg = json::object();
    msg["type"] = "session.update";
    msg["session"] = std::move(session);
    return msg;
}

json build_audio_append(const AudioFrame& frame) {
    json msg = json::object();
    msg["type"] = "input_audio_buffer.append";
    msg["audio"] = utils::base64_encode_pcm16(frame);
    return msg;
}

json build_audio_clear() {
    return json{{"type", "input_audio_buffer.clear"}};
}

json build_audio_commit() {
    return json{{"type", "input_audio_buffer.commit"}};
}

json build_response_create() {
    return json{{"type", "response.create"}};
}

json build_response_cancel() {
    return json{{"type", "response.cancel"}};
}

json build_function_call_output(const std::string& call_id, const json& output) {
    json item = json::object();
    item["type"] = "function_call_output";
    item["call_id"] = call_id;
    item["output"] = output.dump();

    json msg = json::object();
    msg["type"] = "conversation.item.create";
    msg["item"] = std::move(item);
    return msg;
}

json build_system_message(const std::string& text) {
    json content = json::object();
    content["type"] = "input_text";
    content["text"] = text;

    json item = json::object();
    item["type"] = "message";
    item["role"] = "system";
    item["content"] = json::array({content});

    json msg = json::object();
    msg["type"] = "conversation.item.create";
    msg["item"] = std::move(item);
    return msg;
}

std::string build_connect_url(const RealtimeConfig& config) {
    if (config.model.empty()) {
        return config.url;
    }
    char sep = config.url.find('?') == std::string::npos ? '?' : '&';
    return config.url + sep + "model=" + config.model;
}

} // namespace protocol
} // namespace realtime
} // namespace rtvoice
