#include "state_machine.h"
#include "logger.h"

namespace rtvoice {

class StateMachine::Impl {
public:
    Impl() : state_(AgentState::Idle) {}

    AgentState get_state() const {
        return state_;
    }

    bool transition(AgentState next, const std::string& reason) {
        if (state_ == next && reason.empty()) {
            return false;
        }
        if (state_ != next && !StateMachine::is_expected(state_, next)) {
            LOG_DEBUG(std::string("Unexpected agent state transition ") + to_string(state_) +
                      " -> " + to_string(next));
        }
        state_ = next;
        return true;
    }

    void reset() {
        state_ = AgentState::Idle;
    }

private:
    AgentState state_;
};

StateMachine::StateMachine() : pimpl_(std::make_unique<Impl>()) {}

StateMachine::~StateMachine() = default;

AgentState StateMachine::get_state() const {
    return pimpl_->get_state();
}

bool StateMachine::transition(AgentState next, const std::string& reason) {
    return pimpl_->transition(next, reason);
}

bool StateMachine::is_expected(AgentState from, AgentState to) {
    if (to == AgentState::Idle) {
        return true;
    }
    switch (from) {
        case AgentState::Idle:
            return to == AgentState::Listening || to == AgentState::Thinking;

        case AgentState::Listening:
            return to == AgentState::Thinking;

        case AgentState::Thinking:
            return to == AgentState::Speaking || to == AgentState::Interrupted ||
                   to == AgentState::Listening;

        case AgentState::Speaking:
            return to == AgentState::Interrupted || to == AgentState::Listening;

        case AgentState::Interrupted:
            return to == AgentState::Listening || to == AgentState::Thinking;
    }
    return false;
}

void StateMachine::reset() {
    pimpl_->reset();
}

} // namespace rtvoice
