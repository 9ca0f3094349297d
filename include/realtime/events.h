#pragma once

/**
 * @file events.h
 * @brief Normalized event feed emitted by the realtime client
 *
 * Consumers match on the variant (std::visit or std::get_if) instead of
 * subscribing to string event names.
 */

#include "common.h"
#include "errors.h"
#include <functional>
#include <string>
#include <variant>

namespace rtvoice {
namespace realtime {

struct Connected {};

struct Disconnected {
    bool intentional = false;
    std::string reason;
};

struct AgentStateChanged {
    AgentState state = AgentState::Idle;
    AgentState previous = AgentState::Idle;
    std::string reason;
};

/// Decoded PCM16 at the upstream rate
struct AudioDelta {
    std::string item_id;
    AudioBuffer samples;
};

struct AudioDone {
    std::string item_id;
};

/// item_id may be empty when upstream omits it
struct TranscriptDelta {
    Speaker speaker = Speaker::User;
    std::string item_id;
    std::string delta;
};

struct TranscriptDone {
    Speaker speaker = Speaker::User;
    std::string item_id;
    std::string transcript;
};

struct TranscriptReset {
    Speaker speaker = Speaker::User;
};

struct ResponseCreated {
    std::string response_id;
};

struct ResponseDone {
    std::string response_id;
    std::string status;
};

struct Interruption {
    std::string reason;  ///< "barge_in" or the upstream acknowledgment type
};

struct FunctionCall {
    ToolCallRequest request;
};

struct ErrorEvent {
    Error error;
    bool terminal = false;  ///< Requires explicit user action (reconnect exhausted)
};

struct SessionUpdated {
    std::string session_id;
};

struct ConversationItemCreated {
    std::string item_id;
    std::string item_type;
    std::string role;
};

using EngineEvent = std::variant<
    Connected,
    Disconnected,
    AgentStateChanged,
    AudioDelta,
    AudioDone,
    TranscriptDelta,
    TranscriptDone,
    TranscriptReset,
    ResponseCreated,
    ResponseDone,
    Interruption,
    FunctionCall,
    ErrorEvent,
    SessionUpdated,
    ConversationItemCreated>;

using EventHandler = std::function<void(const EngineEvent&)>;

/**
 * @brief Feed name of an event ("connected", "audio.delta", "function_call", ...)
 */
const char* event_name(const EngineEvent& event);

} // namespace realtime
} // namespace rtvoice
