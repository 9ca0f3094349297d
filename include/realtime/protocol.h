#pragma once

/**
 * @file protocol.h
 * @brief Outbound message construction for the upstream realtime protocol
 */

#include "common.h"
#include "config.h"
#include <string>

namespace rtvoice {
namespace realtime {
namespace protocol {

/// Appended to every instruction set
extern const char* const kLanguageGuard;

/// Appended in guardrail mode, before the language guard
extern const char* const kGuardrailDirective;

/**
 * @brief Instructions with the fixed directives appended
 *
 * Normal: "<instructions>\n\n<language guard>"
 * Guardrail: "<instructions>\n\n[<rag block>\n\n]<refusal directive>\n\n<language guard>"
 */
std::string augment_instructions(const RealtimeConfig& config);

/**
 * @brief turn_detection value; null when type is "none"
 */
json build_turn_detection(const TurnDetectionConfig& config);

json build_session_update(const RealtimeConfig& config, const json& tools);

json build_audio_append(const AudioFrame& frame);
json build_audio_clear();
json build_audio_commit();
json build_response_create();
json build_response_cancel();

/**
 * @brief function_call_output item; output is serialized to a JSON string
 */
json build_function_call_output(const std::string& call_id, const json& output);

/**
 * @brief System message item (text is trimmed by the caller)
 */
json build_system_message(const std::string& text);

/**
 * @brief Endpoint URL with the model query parameter
 */
std::string build_connect_url(const RealtimeConfig& config);

} // namespace protocol
} // namespace realtime
} // namespace rtvoice
