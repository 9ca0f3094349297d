#include "realtime/realtime_client.h"
#include "realtime/protocol.h"
#include "state_machine.h"
#include "logger.h"
#include "utils.h"
#include <algorithm>
#include <map>
#include <mutex>
#include <vector>

namespace rtvoice {
namespace realtime {

namespace {

std::string string_field(const json& obj, const char* key) {
    if (!obj.is_object()) return "";
    auto it = obj.find(key);
    if (it != obj.end() && it->is_string()) {
        return it->get<std::string>();
    }
    return "";
}

const json& object_field(const json& obj, const char* key) {
    static const json empty = json::object();
    if (!obj.is_object()) return empty;
    auto it = obj.find(key);
    if (it != obj.end() && it->is_object()) {
        return *it;
    }
    return empty;
}

// Work collected under the state lock and carried out after releasing it
struct Pending {
    std::shared_ptr<ITransport> transport;
    std::vector<std::string> outbound;
    std::vector<EngineEvent> events;
};

} // namespace

class RealtimeClient::Impl : public std::enable_shared_from_this<RealtimeClient::Impl> {
public:
    Impl(const RealtimeConfig& config, const ReconnectConfig& reconnect,
         TransportFactory factory, DelayScheduler scheduler)
        : config_(config)
        , reconnect_(reconnect)
        , transport_factory_(std::move(factory))
        , scheduler_(std::move(scheduler))
        , tools_(json::array()) {}

    ~Impl() {
        disconnect();
    }

    size_t subscribe(EventHandler handler) {
        std::lock_guard<std::mutex> lock(handlers_mutex_);
        size_t id = next_handler_id_++;
        handlers_[id] = std::move(handler);
        return id;
    }

    void unsubscribe(size_t id) {
        std::lock_guard<std::mutex> lock(handlers_mutex_);
        handlers_.erase(id);
    }

    void set_tools(const json& tools) {
        std::lock_guard<std::mutex> lock(mutex_);
        tools_ = tools.is_array() ? tools : json::array();
    }

    VoidResult connect() {
        std::lock_guard<std::mutex> connect_lock(connect_mutex_);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (open_) {
                return VoidResult();
            }
            intentional_close_ = false;
            ++reconnect_epoch_;
        }
        return open_connection();
    }

    VoidResult reconnect() {
        std::lock_guard<std::mutex> connect_lock(connect_mutex_);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (open_) {
                LOG_DEBUG("reconnect() ignored, connection already open");
                return VoidResult();
            }
            intentional_close_ = false;
            ++reconnect_epoch_;
            session_update_sent_ = false;
            reset_turn_state_locked();
        }
        return open_connection();
    }

    void disconnect() {
        std::shared_ptr<ITransport> old;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            intentional_close_ = true;
            ++reconnect_epoch_;
            ++connection_gen_;
            if (open_) {
                LOG_RT("Disconnecting");
            }
            old = std::move(transport_);
            open_ = false;
            session_update_sent_ = false;
            reconnect_attempts_ = 0;
            reset_turn_state_locked();
            state_.reset();
        }
        if (old) {
            old->close();
        }
        std::lock_guard<std::mutex> lock(handlers_mutex_);
        handlers_.clear();
    }

    void update_session_config(const RealtimeConfig& config) {
        Pending p;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            config_ = config;
            if (open_) {
                queue_session_update_locked(p);
            }
        }
        flush(p);
    }

    void send_audio(const AudioFrame& frame) {
        if (frame.empty()) return;
        Pending p;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!open_) return;
            if (pending_clear_) {
                reset_audio_counters_locked();
                pending_clear_ = false;
                queue_locked(p, protocol::build_audio_clear());
            }
            queue_locked(p, protocol::build_audio_append(frame));
            has_buffered_audio_ = true;
            buffered_samples_ += frame.size();
            has_received_audio_ = true;
        }
        flush(p);
    }

    bool commit_audio() {
        Pending p;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!open_) {
                LOG_WARN("Cannot commit audio, connection not open");
                return false;
            }
            size_t threshold = static_cast<size_t>(std::max(0, config_.commit_threshold_samples));
            if (!has_buffered_audio_ || buffered_samples_ < threshold || !has_received_audio_) {
                LOG_RT("Skipping commit, buffered " + std::to_string(buffered_samples_) +
                       " samples (need " + std::to_string(threshold) + ")");
                return false;
            }
            queue_locked(p, protocol::build_audio_commit());
            reset_audio_counters_locked();
        }
        flush(p);
        return true;
    }

    void clear_audio_buffer() {
        Pending p;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            reset_audio_counters_locked();
            pending_clear_ = false;
            queue_locked(p, protocol::build_audio_clear());
        }
        flush(p);
    }

    void send_function_call_output(const std::string& call_id, const json& output) {
        Pending p;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            queue_locked(p, protocol::build_function_call_output(call_id, output));
            queue_locked(p, protocol::build_response_create());
        }
        LOG_RT("Sending function output for " + call_id);
        flush(p);
    }

    void send_system_message(const std::string& text) {
        std::string trimmed = utils::trim_copy(text);
        if (trimmed.empty()) return;
        Pending p;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            queue_locked(p, protocol::build_system_message(trimmed));
        }
        flush(p);
    }

    void request_response() {
        Pending p;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            queue_locked(p, protocol::build_response_create());
        }
        flush(p);
    }

    bool cancel_response(bool suppress_state) {
        Pending p;
        bool sent;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            sent = cancel_locked(p, suppress_state);
        }
        flush(p);
        return sent;
    }

    bool is_connected() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return open_;
    }

    AgentState agent_state() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return state_.get_state();
    }

    std::string session_id() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return session_id_;
    }

    int reconnect_attempts() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return reconnect_attempts_;
    }

private:
    VoidResult open_connection() {
        std::shared_ptr<ITransport> transport = transport_factory_ ? transport_factory_() : nullptr;
        if (!transport) {
            return Error(ErrorType::ConnectionFailed, "No transport available");
        }

        std::string url;
        std::map<std::string, std::string> headers;
        uint64_t generation;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            generation = ++connection_gen_;
            url = protocol::build_connect_url(config_);
            headers["Authorization"] = "Bearer " + config_.api_key;
            headers["OpenAI-Beta"] = "realtime=v1";
        }

        std::weak_ptr<Impl> weak = shared_from_this();
        TransportHandlers handlers;
        handlers.on_message = [weak, generation](const std::string& text) {
            if (auto self = weak.lock()) {
                self->handle_message(generation, text);
            }
        };
        handlers.on_close = [weak, generation](int code, const std::string& reason) {
            if (auto self = weak.lock()) {
                self->handle_close(generation, code, reason);
            }
        };

        LOG_RT("Connecting to " + url);
        VoidResult result = transport->connect(url, headers, handlers);
        if (!result || !transport->is_open()) {
            std::string detail = result ? "closed during handshake" : result.error().message;
            Error error(ErrorType::ConnectionFailed, "WebSocket connection error: " + detail);
            LOG_ERROR(error.message);
            emit(ErrorEvent{error, false});
            return error;
        }

        Pending p;
        bool abandoned = false;
        bool lost = false;
        int close_code = 0;
        std::string close_reason;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (intentional_close_ || generation != connection_gen_) {
                abandoned = true;
            } else if (early_close_gen_ == generation) {
                // Peer closed between the handshake and here; handled as a drop below
                transport_ = transport;
                open_ = true;
                lost = true;
                close_code = early_close_code_;
                close_reason = early_close_reason_;
            } else {
                transport_ = transport;
                open_ = true;
                reconnect_attempts_ = 0;
                session_update_sent_ = false;
                reset_turn_state_locked();
                p.events.push_back(Connected{});
                queue_session_update_locked(p);
            }
        }
        if (abandoned) {
            transport->close();
            return Error(ErrorType::ConnectionFailed, "Disconnected while connecting");
        }
        if (lost) {
            LOG_WARN("[Realtime] Connection closed right after the handshake");
            handle_close(generation, close_code, close_reason);
            return VoidResult();
        }

        LOG_RT("Connected");
        flush(p);
        return VoidResult();
    }

    void handle_close(uint64_t generation, int code, const std::string& reason) {
        Pending p;
        bool retry = false;
        std::chrono::milliseconds delay(0);
        uint64_t epoch = 0;
        std::shared_ptr<ITransport> dropped;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (generation != connection_gen_) {
                return;
            }
            if (!open_) {
                early_close_gen_ = generation;
                early_close_code_ = code;
                early_close_reason_ = reason;
                return;
            }
            dropped = std::move(transport_);
            open_ = false;
            session_update_sent_ = false;
            reset_turn_state_locked();

            std::string why = reason.empty() ? "code:" + std::to_string(code) : reason;
            LOG_WARN("[Realtime] Connection closed: " + why);
            p.events.push_back(Disconnected{intentional_close_, why});
            set_state_locked(p, AgentState::Idle, "socket-closed");

            if (!intentional_close_) {
                retry = schedule_retry_locked(p, delay, epoch);
            }
        }
        flush(p);
        if (retry) {
            schedule_reconnect(delay, epoch);
        }
    }

    void attempt_reconnect(uint64_t epoch) {
        std::lock_guard<std::mutex> connect_lock(connect_mutex_);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (epoch != reconnect_epoch_ || intentional_close_ || open_) {
                return;
            }
            LOG_RT("Reconnect attempt " + std::to_string(reconnect_attempts_) + "/" +
                   std::to_string(reconnect_.max_attempts));
        }

        VoidResult result = open_connection();
        if (result) {
            return;
        }

        Pending p;
        bool retry = false;
        std::chrono::milliseconds delay(0);
        uint64_t next_epoch = 0;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (epoch != reconnect_epoch_ || intentional_close_) {
                return;
            }
            retry = schedule_retry_locked(p, delay, next_epoch);
        }
        flush(p);
        if (retry) {
            schedule_reconnect(delay, next_epoch);
        }
    }

    // Returns false (and queues a terminal error) once the attempt budget is spent
    bool schedule_retry_locked(Pending& p, std::chrono::milliseconds& delay, uint64_t& epoch) {
        if (reconnect_attempts_ >= reconnect_.max_attempts) {
            Error error(ErrorType::ReconnectExhausted,
                        "Unable to reconnect after " + std::to_string(reconnect_attempts_) + " attempts");
            LOG_ERROR(error.message);
            p.events.push_back(ErrorEvent{error, true});
            return false;
        }
        ++reconnect_attempts_;
        delay = std::chrono::milliseconds(
            static_cast<int64_t>(reconnect_.base_delay_ms) << (reconnect_attempts_ - 1));
        epoch = reconnect_epoch_;
        LOG_RT("Reconnecting in " + std::to_string(delay.count()) + "ms (attempt " +
               std::to_string(reconnect_attempts_) + "/" + std::to_string(reconnect_.max_attempts) + ")");
        return true;
    }

    void schedule_reconnect(std::chrono::milliseconds delay, uint64_t epoch) {
        if (!scheduler_) {
            LOG_WARN("No scheduler, reconnect not scheduled");
            return;
        }
        std::weak_ptr<Impl> weak = shared_from_this();
        scheduler_(delay, [weak, epoch]() {
            if (auto self = weak.lock()) {
                self->attempt_reconnect(epoch);
            }
        });
    }

    void handle_message(uint64_t generation, const std::string& text) {
        json msg = json::parse(text, nullptr, false);
        if (msg.is_discarded()) {
            LOG_WARN(std::string("[Realtime] ") + describe(ErrorType::ProtocolError) +
                     ": failed to parse message");
            return;
        }
        const std::string type = string_field(msg, "type");
        if (type.empty()) {
            LOG_WARN(std::string("[Realtime] ") + describe(ErrorType::ProtocolError) +
                     ": message without type");
            return;
        }

        Pending p;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (generation != connection_gen_) {
                return;
            }
            dispatch_locked(type, msg, p);
        }
        flush(p);
    }

    void dispatch_locked(const std::string& type, const json& msg, Pending& p) {
        if (type == "session.created") {
            session_id_ = string_field(object_field(msg, "session"), "id");
            LOG_RT("Session created: " + session_id_);

        } else if (type == "session.updated") {
            std::string id = string_field(object_field(msg, "session"), "id");
            p.events.push_back(SessionUpdated{id.empty() ? session_id_ : id});

        } else if (type == "input_audio_buffer.speech_started") {
            reset_audio_counters_locked();
            pending_clear_ = true;
            if (state_.get_state() == AgentState::Speaking) {
                if (config_.allow_interruptions) {
                    cancel_locked(p, false);
                    p.events.push_back(Interruption{"barge_in"});
                } else {
                    LOG_RT("Speech detected during response, interruptions disabled");
                }
            }
            p.events.push_back(TranscriptReset{Speaker::User});
            set_state_locked(p, AgentState::Listening);

        } else if (type == "input_audio_buffer.speech_stopped") {
            pending_clear_ = true;
            reset_audio_counters_locked();
            set_state_locked(p, AgentState::Thinking);

        } else if (type == "input_audio_buffer.committed") {
            LOG_DEBUG("Input audio committed");

        } else if (type == "input_audio_buffer.cleared") {
            reset_audio_counters_locked();
            pending_clear_ = false;

        } else if (type == "conversation.item.input_audio_transcription.delta") {
            p.events.push_back(TranscriptDelta{Speaker::User, string_field(msg, "item_id"),
                                               string_field(msg, "delta")});

        } else if (type == "conversation.item.input_audio_transcription.completed") {
            p.events.push_back(TranscriptDone{Speaker::User, string_field(msg, "item_id"),
                                              string_field(msg, "transcript")});

        } else if (type == "conversation.item.input_audio_transcription.failed") {
            LOG_WARN("[Realtime] Input transcription failed");

        } else if (type == "response.created") {
            ++active_responses_;
            set_state_locked(p, AgentState::Thinking);
            p.events.push_back(ResponseCreated{string_field(object_field(msg, "response"), "id")});

        } else if (type == "response.audio.delta" || type == "response.output_audio.delta") {
            set_state_locked(p, AgentState::Speaking);
            p.events.push_back(AudioDelta{string_field(msg, "item_id"),
                                          utils::base64_decode_pcm16(string_field(msg, "delta"))});

        } else if (type == "response.audio.done" || type == "response.output_audio.done") {
            p.events.push_back(AudioDone{string_field(msg, "item_id")});

        } else if (type == "response.audio_transcript.delta" ||
                   type == "response.output_audio_transcript.delta") {
            p.events.push_back(TranscriptDelta{Speaker::Assistant, string_field(msg, "item_id"),
                                               string_field(msg, "delta")});

        } else if (type == "response.audio_transcript.done" ||
                   type == "response.output_audio_transcript.done") {
            p.events.push_back(TranscriptDone{Speaker::Assistant, string_field(msg, "item_id"),
                                              string_field(msg, "transcript")});

        } else if (type == "response.function_call_arguments.done") {
            ToolCallRequest request;
            request.call_id = string_field(msg, "call_id");
            request.name = string_field(msg, "name");
            request.arguments = string_field(msg, "arguments");
            request.session_id = session_id_;
            LOG_RT("Function call: " + request.name + " (" + request.call_id + ")");
            p.events.push_back(FunctionCall{request});

        } else if (type == "response.interrupted" || type == "response.canceled" ||
                   type == "response.cancelled") {
            mark_response_finished_locked();
            set_state_locked(p, AgentState::Interrupted);
            p.events.push_back(Interruption{type});
            has_buffered_audio_ = false;
            buffered_samples_ = 0;

        } else if (type == "response.done") {
            mark_response_finished_locked();
            set_state_locked(p, AgentState::Idle);
            const json& response = object_field(msg, "response");
            p.events.push_back(ResponseDone{string_field(response, "id"),
                                            string_field(response, "status")});

        } else if (type == "conversation.item.created") {
            const json& item = object_field(msg, "item");
            p.events.push_back(ConversationItemCreated{string_field(item, "id"),
                                                       string_field(item, "type"),
                                                       string_field(item, "role")});

        } else if (type == "error") {
            std::string message;
            auto it = msg.find("error");
            if (it != msg.end()) {
                message = string_field(*it, "message");
                if (message.empty()) message = it->dump();
            } else {
                message = msg.dump();
            }
            LOG_ERROR("[Realtime] Upstream error: " + message);
            p.events.push_back(ErrorEvent{Error(ErrorType::UpstreamError, message), false});

        } else if (type == "rate_limits.updated" ||
                   type == "response.text.delta" || type == "response.text.done" ||
                   type == "response.output_text.delta" || type == "response.output_text.done" ||
                   type == "response.output_item.added" || type == "response.output_item.done" ||
                   type == "response.content_part.added" || type == "response.content_part.done" ||
                   type == "response.function_call_arguments.delta") {
            LOG_DEBUG("Ignored message: " + type);

        } else {
            LOG_DEBUG("Unhandled message type: " + type);
        }
    }

    bool cancel_locked(Pending& p, bool suppress_state) {
        if (active_responses_ <= 0) {
            LOG_WARN("[Realtime] Cancel requested with no active response");
            return false;
        }
        if (cancel_pending_) {
            LOG_WARN("[Realtime] Cancel already pending");
            return false;
        }
        reset_audio_counters_locked();
        pending_clear_ = true;
        cancel_pending_ = true;
        queue_locked(p, protocol::build_response_cancel());
        if (!suppress_state) {
            set_state_locked(p, AgentState::Interrupted);
        }
        return true;
    }

    void set_state_locked(Pending& p, AgentState next, const std::string& reason = "") {
        AgentState previous = state_.get_state();
        if (state_.transition(next, reason)) {
            p.events.push_back(AgentStateChanged{next, previous, reason});
        }
    }

    void queue_session_update_locked(Pending& p) {
        if (session_update_sent_) {
            LOG_WARN("[Realtime] Duplicate session.update ignored");
            return;
        }
        queue_locked(p, protocol::build_session_update(config_, tools_));
        session_update_sent_ = true;
    }

    void queue_locked(Pending& p, const json& msg) {
        p.transport = transport_;
        p.outbound.push_back(msg.dump());
    }

    void mark_response_finished_locked() {
        active_responses_ = std::max(0, active_responses_ - 1);
        cancel_pending_ = false;
    }

    void reset_audio_counters_locked() {
        has_buffered_audio_ = false;
        buffered_samples_ = 0;
        has_received_audio_ = false;
    }

    void reset_turn_state_locked() {
        reset_audio_counters_locked();
        pending_clear_ = true;
        active_responses_ = 0;
        cancel_pending_ = false;
    }

    void flush(Pending& p) {
        if (!p.outbound.empty()) {
            if (!p.transport) {
                LOG_WARN("[Realtime] Cannot send message, connection not open");
            } else {
                for (const auto& text : p.outbound) {
                    VoidResult result = p.transport->send(text);
                    if (!result) {
                        LOG_WARN("[Realtime] Send failed: " + result.error().message);
                        break;
                    }
                }
            }
        }
        for (const auto& event : p.events) {
            emit(event);
        }
    }

    void emit(const EngineEvent& event) {
        std::vector<EventHandler> handlers;
        {
            std::lock_guard<std::mutex> lock(handlers_mutex_);
            handlers.reserve(handlers_.size());
            for (const auto& entry : handlers_) {
                handlers.push_back(entry.second);
            }
        }
        for (const auto& handler : handlers) {
            try {
                handler(event);
            } catch (const std::exception& e) {
                LOG_ERROR(std::string("Event handler failed for ") + event_name(event) + ": " + e.what());
            }
        }
    }

    // Protects everything below except the handler map
    mutable std::mutex mutex_;
    RealtimeConfig config_;
    ReconnectConfig reconnect_;
    TransportFactory transport_factory_;
    DelayScheduler scheduler_;
    json tools_;

    std::shared_ptr<ITransport> transport_;
    uint64_t connection_gen_ = 0;
    bool open_ = false;
    // A close that arrived before open_connection() marked the transport open
    uint64_t early_close_gen_ = 0;
    int early_close_code_ = 0;
    std::string early_close_reason_;
    bool intentional_close_ = false;
    bool session_update_sent_ = false;
    std::string session_id_;

    bool pending_clear_ = true;
    bool has_buffered_audio_ = false;
    bool has_received_audio_ = false;
    size_t buffered_samples_ = 0;
    int active_responses_ = 0;
    bool cancel_pending_ = false;

    int reconnect_attempts_ = 0;
    uint64_t reconnect_epoch_ = 0;

    StateMachine state_;

    // Serializes connect / reconnect attempts
    std::mutex connect_mutex_;

    std::mutex handlers_mutex_;
    std::map<size_t, EventHandler> handlers_;
    size_t next_handler_id_ = 1;
};

RealtimeClient::RealtimeClient(const RealtimeConfig& config,
                               const ReconnectConfig& reconnect,
                               TransportFactory transport_factory,
                               DelayScheduler scheduler)
    : pimpl_(std::make_shared<Impl>(config, reconnect, std::move(transport_factory), std::move(scheduler))) {}

RealtimeClient::~RealtimeClient() {
    pimpl_->disconnect();
}

size_t RealtimeClient::subscribe(EventHandler handler) {
    return pimpl_->subscribe(std::move(handler));
}

void RealtimeClient::unsubscribe(size_t id) {
    pimpl_->unsubscribe(id);
}

void RealtimeClient::set_tools(const json& tools) {
    pimpl_->set_tools(tools);
}

VoidResult RealtimeClient::connect() {
    return pimpl_->connect();
}

void RealtimeClient::disconnect() {
    pimpl_->disconnect();
}

VoidResult RealtimeClient::reconnect() {
    return pimpl_->reconnect();
}

void RealtimeClient::update_session_config(const RealtimeConfig& config) {
    pimpl_->update_session_config(config);
}

void RealtimeClient::send_audio(const AudioFrame& frame) {
    pimpl_->send_audio(frame);
}

bool RealtimeClient::commit_audio() {
    return pimpl_->commit_audio();
}

void RealtimeClient::clear_audio_buffer() {
    pimpl_->clear_audio_buffer();
}

void RealtimeClient::send_function_call_output(const std::string& call_id, const json& output) {
    pimpl_->send_function_call_output(call_id, output);
}

void RealtimeClient::send_system_message(const std::string& text) {
    pimpl_->send_system_message(text);
}

void RealtimeClient::request_response() {
    pimpl_->request_response();
}

bool RealtimeClient::cancel_response(bool suppress_state) {
    return pimpl_->cancel_response(suppress_state);
}

bool RealtimeClient::is_connected() const {
    return pimpl_->is_connected();
}

AgentState RealtimeClient::agent_state() const {
    return pimpl_->agent_state();
}

std::string RealtimeClient::session_id() const {
    return pimpl_->session_id();
}

int RealtimeClient::reconnect_attempts() const {
    return pimpl_->reconnect_attempts();
}

} // namespace realtime
} // namespace rtvoice
