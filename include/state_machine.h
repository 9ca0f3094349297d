#pragma once

#include "common.h"
#include <memory>
#include <string>

namespace rtvoice {

/**
 * @brief Conversational turn phase tracker
 *
 * Expected transitions:
 * - Idle -> Listening (speech started)
 * - Listening -> Thinking (speech stopped, or response created)
 * - Thinking -> Speaking (first audio chunk of a response)
 * - Speaking | Thinking -> Idle (response done)
 * - Speaking | Thinking -> Interrupted (local cancel or upstream acknowledgment)
 * - Interrupted -> Listening (new speech)
 * - any -> Idle (connection closed)
 *
 * Upstream events are authoritative, so an unexpected transition is applied
 * anyway and only logged. Not thread-safe; the owner serializes access.
 */
class StateMachine {
public:
    StateMachine();
    ~StateMachine();

    StateMachine(const StateMachine&) = delete;
    StateMachine& operator=(const StateMachine&) = delete;

    AgentState get_state() const;

    /**
     * @brief Move to next
     * @param reason Optional cause; a non-empty reason reports even a same-state transition
     * @return true if a state change should be reported
     */
    bool transition(AgentState next, const std::string& reason = "");

    /**
     * @brief Whether from -> to is one of the documented transitions
     */
    static bool is_expected(AgentState from, AgentState to);

    /**
     * @brief Reset to Idle without reporting
     */
    void reset();

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace rtvoice
