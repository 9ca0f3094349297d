#include "realtime/events.h"

namespace rtvoice {
namespace realtime {

namespace {

struct NameVisitor {
    const char* operator()(const Connected&) const { return "connected"; }
    const char* operator()(const Disconnected&) const { return "disconnected"; }
    const char* operator()(const AgentStateChanged&) const { return "agent_state"; }
    const char* operator()(const AudioDelta&) const { return "audio.delta"; }
    const char* operator()(const AudioDone&) const { return "audio.done"; }
    const char* operator()(const TranscriptDelta&) const { return "transcript.delta"; }
    const char* operator()(const TranscriptDone&) const { return "transcript.done"; }
    const char* operator()(const TranscriptReset&) const { return "transcript.reset"; }
    const char* operator()(const ResponseCreated&) const { return "response.created"; }
    const char* operator()(const ResponseDone&) const { return "response.done"; }
    const char* operator()(const Interruption&) const { return "interruption"; }
    const char* operator()(const FunctionCall&) const { return "function_call"; }
    const char* operator()(const ErrorEvent&) const { return "error"; }
    const char* operator()(const SessionUpdated&) const { return "session_updated"; }
    const char* operator()(const ConversationItemCreated&) const { return "conversation_item_created"; }
};

} // namespace

const char* event_name(const EngineEvent& event) {
    return std::visit(NameVisitor{}, event);
}

} // namespace realtime
} // namespace rtvoice
