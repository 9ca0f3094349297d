#pragma once

#include "common.h"
#include "tool.h"
#include "realtime/transcript_buffer.h"
#include <memory>
#include <string>

namespace rtvoice {

/**
 * @brief Outcome of one tool dispatch
 */
struct ToolExecutionRecord {
    std::string tool_name;
    json input_params = json::object();   // Reconciled arguments
    json output_result;
    int64_t execution_time_ms = 0;
    std::string status;                   // "success" | "error"
    std::string error_message;
    ExecutionType execution_type = ExecutionType::Mcp;
    std::string session_id;
    std::string started_at;               // ISO-8601 UTC
    std::string finished_at;
};

/**
 * @brief Append-only JSON-lines log of one voice session
 *
 * Lines go to <log_dir>/<session_id>/events.jsonl, one object per line with a
 * "kind" of "session_start", "tool_execution", "turn" or "session_end". The
 * engine never reads it back. Safe to call from tool workers and the network
 * thread concurrently.
 */
class SessionLog {
public:
    /**
     * @param log_dir Root directory (~ is expanded); empty disables logging
     */
    explicit SessionLog(const std::string& log_dir);
    ~SessionLog();

    SessionLog(const SessionLog&) = delete;
    SessionLog& operator=(const SessionLog&) = delete;

    // Start new session (finalizes the previous one)
    void start_session(const std::string& session_id);

    void record_tool_execution(const ToolExecutionRecord& record);

    // Finalized conversation turn
    void record_turn(const realtime::ConversationMessage& message);

    void finalize_session();

    std::string get_session_id() const;

    /// Path of the active session's file (empty when none)
    std::string log_path() const;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace rtvoice
