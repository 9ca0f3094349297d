#include "session_log.h"
#include "logger.h"
#include "path_utils.h"
#include "utils.h"
#include <filesystem>
#include <fstream>
#include <mutex>

namespace rtvoice {

namespace {

// Session ids come from upstream; keep them path-safe
std::string safe_component(const std::string& id) {
    std::string out;
    for (unsigned char c : id) {
        out.push_back(std::isalnum(c) || c == '-' || c == '_' ? static_cast<char>(c) : '_');
    }
    return out.empty() ? "session" : out;
}

} // namespace

class SessionLog::Impl {
public:
    explicit Impl(const std::string& log_dir)
        : log_dir_(expand_path(log_dir)), session_started_(false) {}

    void start_session(const std::string& session_id) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (session_started_) {
            write_line_locked(json{{"kind", "session_end"}, {"timestamp", utils::iso_timestamp_now()}});
        }
        session_id_ = session_id;
        session_started_ = false;
        path_.clear();
        if (log_dir_.empty()) return;

        std::string session_path = log_dir_ + "/" + safe_component(session_id);
        std::error_code ec;
        std::filesystem::create_directories(session_path, ec);
        if (ec) {
            Logger::warn("Cannot create session log directory " + session_path + ": " + ec.message());
            return;
        }
        path_ = session_path + "/events.jsonl";
        session_started_ = true;

        json line = json::object();
        line["kind"] = "session_start";
        line["session_id"] = session_id;
        line["timestamp"] = utils::iso_timestamp_now();
        write_line_locked(line);
    }

    void record_tool_execution(const ToolExecutionRecord& record) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!session_started_) return;

        json line = json::object();
        line["kind"] = "tool_execution";
        line["tool_name"] = record.tool_name;
        line["input_params"] = record.input_params;
        line["output_result"] = record.output_result;
        line["execution_time_ms"] = record.execution_time_ms;
        line["status"] = record.status;
        line["error_message"] = record.error_message.empty() ? json() : json(record.error_message);
        line["execution_type"] = to_string(record.execution_type);
        line["session_id"] = record.session_id.empty() ? json() : json(record.session_id);
        line["started_at"] = record.started_at;
        line["finished_at"] = record.finished_at;
        write_line_locked(line);
    }

    void record_turn(const realtime::ConversationMessage& message) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!session_started_) return;

        json line = json::object();
        line["kind"] = "turn";
        line["id"] = message.id;
        line["role"] = to_string(message.role);
        line["content"] = message.content;
        line["created_at"] = message.created_at;
        write_line_locked(line);
    }

    void finalize_session() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!session_started_) return;
        write_line_locked(json{{"kind", "session_end"}, {"timestamp", utils::iso_timestamp_now()}});
        session_started_ = false;
    }

    std::string get_session_id() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return session_id_;
    }

    std::string log_path() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return session_started_ ? path_ : "";
    }

private:
    void write_line_locked(const json& line) {
        if (path_.empty()) return;
        std::ofstream file(path_, std::ios::app);
        if (!file.is_open()) {
            Logger::warn("Cannot write session log " + path_);
            return;
        }
        file << line.dump() << "\n";
    }

    mutable std::mutex mutex_;
    std::string log_dir_;
    std::string session_id_;
    std::string path_;
    bool session_started_;
};

SessionLog::SessionLog(const std::string& log_dir) : pimpl_(std::make_unique<Impl>(log_dir)) {}

SessionLog::~SessionLog() {
    pimpl_->finalize_session();
}

void SessionLog::start_session(const std::string& session_id) {
    pimpl_->start_session(session_id);
}

void SessionLog::record_tool_execution(const ToolExecutionRecord& record) {
    pimpl_->record_tool_execution(record);
}

void SessionLog::record_turn(const realtime::ConversationMessage& message) {
    pimpl_->record_turn(message);
}

void SessionLog::finalize_session() {
    pimpl_->finalize_session();
}

std::string SessionLog::get_session_id() const {
    return pimpl_->get_session_id();
}

std::string SessionLog::log_path() const {
    return pimpl_->log_path();
}

} // namespace rtvoice
