#include "common.h"

namespace rtvoice {

const char* to_string(AgentState state) {
    switch (state) {
        case AgentState::Idle: return "idle";
        case AgentState::Listening: return "listening";
        case AgentState::Thinking: return "thinking";
        case AgentState::Speaking: return "speaking";
        case AgentState::Interrupted: return "interrupted";
    }
    return "idle";
}

const char* to_string(Speaker speaker) {
    return speaker == Speaker::User ? "user" : "assistant";
}

} // namespace rtvoice
