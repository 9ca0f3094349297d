#include "voice_session.h"
#include "audio/capture_pipeline.h"
#include "logger.h"
#include "realtime/realtime_client.h"
#include "session_log.h"
#include "tool_executor.h"
#include "tool_mediator.h"
#include "tool_registry.h"
#include "tools/mcp_tool.h"
#include "tools/webhook_tool.h"
#include "utils.h"
#include <map>
#include <mutex>

namespace rtvoice {

using realtime::EngineEvent;
using realtime::RealtimeClient;

namespace {

audio::CaptureOptions capture_options(const AudioConfig& cfg) {
    audio::CaptureOptions options;
    options.input_device = cfg.input_device;
    options.output_device = cfg.output_device;
    options.target_sample_rate = cfg.target_sample_rate;
    options.frame_ms = cfg.frame_ms;
    options.input_sample_rate = cfg.input_sample_rate;
    options.output_sample_rate = cfg.output_sample_rate;
    options.channel_capacity = cfg.channel_capacity;
    return options;
}

} // namespace

class VoiceSession::Impl : public std::enable_shared_from_this<VoiceSession::Impl> {
public:
    Impl(const Config& config, VoiceSessionDeps deps)
        : config_(config)
        , deps_(std::move(deps))
        , client_session_id_(utils::random_id())
        , capture_(deps_.audio_device, capture_options(config.audio))
        , session_log_(config.session_log_dir)
        , executor_(config.tools.max_concurrent > 0 ? config.tools.max_concurrent : 1) {
        if (!config_.broker.api_base.empty()) {
            broker_ = std::make_unique<SessionBroker>(deps_.http, config_.broker.api_base, config_.broker.timeout_ms);
        }

        std::string proxy_url = config_.tools.webhook_proxy_url;
        if (proxy_url.empty()) {
            proxy_url = build_embed_function_url(config_.broker.api_base, "n8n-webhook-proxy");
        }
        std::vector<std::shared_ptr<ToolBackend>> backends;
        backends.push_back(std::make_shared<tools::McpBackend>(
            deps_.http, config_.tools.mcp_base_url, config_.tools.mcp_auth_token, config_.tools.timeout_ms));
        backends.push_back(std::make_shared<tools::WebhookBackend>(
            deps_.http, proxy_url, config_.tools.mcp_auth_token, config_.tools.timeout_ms));

        mediator_ = std::make_shared<ToolMediator>(
            nullptr, std::move(backends),
            [this](const ToolExecutionRecord& record) { session_log_.record_tool_execution(record); });
    }

    ~Impl() {
        stop_session();
        executor_.shutdown();
        executor_.wait_for_completion(config_.tools.timeout_ms);
    }

    VoidResult ensure_session() {
        std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
        return ensure_session_locked();
    }

    VoidResult toggle_recording() {
        std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
        set_error("");

        if (is_recording()) {
            stop_recording_locked();
            return VoidResult();
        }

        auto ready = ensure_session_locked();
        if (!ready) {
            set_error(ready.error().message);
            return ready;
        }

        auto init = capture_.initialize();
        if (!init) {
            std::string message = audio::capture_error_message(init.error());
            Logger::error("[Session] Microphone unavailable: " + message);
            set_error(message);
            release_audio();
            teardown_locked();
            return Error(init.error().type, message);
        }

        std::weak_ptr<RealtimeClient> weak_client = current_client();
        auto started = capture_.start_capture([weak_client](const AudioFrame& frame) {
            if (auto client = weak_client.lock()) {
                client->send_audio(frame);
            }
        });
        if (!started) {
            set_error(started.error().message);
            release_audio();
            teardown_locked();
            return started;
        }

        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            recording_ = true;
        }
        LOG_SESSION("Microphone on");
        return VoidResult();
    }

    void stop_session() {
        std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
        if (!has_active_session_) {
            LOG_DEBUG("stop_session skipped, no active session");
            return;
        }
        LOG_SESSION("Stopping session");
        release_audio();
        teardown_locked();
    }

    void reset_conversation() {
        std::lock_guard<std::mutex> lock(state_mutex_);
        transcripts_.clear();
        messages_.clear();
        last_error_.clear();
        session_id_.clear();
    }

    size_t subscribe(realtime::EventHandler handler) {
        std::lock_guard<std::mutex> lock(handlers_mutex_);
        size_t id = next_handler_id_++;
        handlers_[id] = std::move(handler);
        return id;
    }

    void unsubscribe(size_t id) {
        std::lock_guard<std::mutex> lock(handlers_mutex_);
        handlers_.erase(id);
    }

    std::vector<realtime::ConversationMessage> messages() const {
        std::lock_guard<std::mutex> lock(state_mutex_);
        return messages_;
    }

    std::string live_text(Speaker speaker) const {
        std::lock_guard<std::mutex> lock(state_mutex_);
        return transcripts_.live_text(speaker);
    }

    AgentState agent_state() const {
        std::lock_guard<std::mutex> lock(state_mutex_);
        return agent_state_;
    }

    bool is_connected() const {
        std::lock_guard<std::mutex> lock(state_mutex_);
        return connected_;
    }

    bool is_recording() const {
        std::lock_guard<std::mutex> lock(state_mutex_);
        return recording_;
    }

    std::string last_error() const {
        std::lock_guard<std::mutex> lock(state_mutex_);
        return last_error_;
    }

    std::string session_id() const {
        std::lock_guard<std::mutex> lock(state_mutex_);
        return session_id_;
    }

    AgentProfile agent() const {
        std::lock_guard<std::mutex> lock(state_mutex_);
        return agent_;
    }

    float input_level() const { return capture_.input_level(); }

private:
    VoidResult ensure_session_locked() {
        std::shared_ptr<RealtimeClient> existing = current_client();
        if (existing && existing->is_connected()) {
            LOG_DEBUG("ensure_session noop, existing client");
            return VoidResult();
        }

        RealtimeConfig rt = config_.realtime;
        AgentProfile agent;
        std::string session_id;
        json tools = json::array();

        if (broker_) {
            auto grant = broker_->create_session(config_.broker.public_id, client_session_id_);
            if (!grant) {
                set_error(grant.error().message);
                return grant.error();
            }
            const SessionGrant& g = grant.value();
            rt.api_key = g.token;
            rt.model = g.agent.model;
            rt.voice = g.agent.voice;
            rt.instructions = g.agent.instructions;
            agent = g.agent;
            session_id = g.session_id;
            tools = g.tools;
        } else if (rt.api_key.empty()) {
            Error error(ErrorType::InvalidState, "No session broker configured and no API key set");
            set_error(error.message);
            return error;
        } else {
            agent.model = rt.model;
            agent.voice = sanitize_voice(rt.voice);
            agent.instructions = rt.instructions;
            rt.voice = agent.voice;
        }

        auto registry = ToolRegistry::from_server(tools, ++registry_version_);
        mediator_->set_registry(registry);

        if (existing) {
            existing->disconnect();
        }

        auto client = std::make_shared<RealtimeClient>(rt, config_.reconnect, deps_.transport_factory,
                                                       deps_.scheduler);
        client->set_tools(registry->get_tool_schemas());

        std::weak_ptr<Impl> weak_self = shared_from_this();
        std::weak_ptr<RealtimeClient> weak_client = client;
        client->subscribe([weak_self, weak_client](const EngineEvent& event) {
            if (auto self = weak_self.lock()) {
                self->on_event(event, weak_client);
            }
        });

        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            client_ = client;
            agent_ = agent;
            session_id_ = session_id;
        }

        auto connected = client->connect();
        if (!connected) {
            client->disconnect();
            std::lock_guard<std::mutex> lock(state_mutex_);
            client_.reset();
            connected_ = false;
            last_error_ = connected.error().message;
            return connected;
        }

        has_active_session_ = true;
        session_log_.start_session(session_id.empty() ? "local-" + client_session_id_ : session_id);
        LOG_SESSION("Realtime session ready (model " + rt.model + ", voice " + rt.voice + ", " +
                    std::to_string(registry->size()) + " tools)");
        return VoidResult();
    }

    void stop_recording_locked() {
        capture_.stop_capture();
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            recording_ = false;
        }
        LOG_SESSION("Microphone off");

        if (config_.realtime.turn_detection.type != "none") return;
        auto client = current_client();
        if (client && client->is_connected() && client->commit_audio()) {
            client->request_response();
        }
    }

    // Stop capture and playback and release the device
    void release_audio() {
        capture_.stop_capture();
        capture_.stop_playback();
        auto closed = capture_.close(true);
        if (!closed) {
            Logger::warn("[Session] Audio close failed: " + closed.error().message);
        }
        std::lock_guard<std::mutex> lock(state_mutex_);
        recording_ = false;
    }

    void teardown_locked() {
        std::shared_ptr<RealtimeClient> client;
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            client = std::move(client_);
            client_.reset();
            transcripts_.clear();
            agent_state_ = AgentState::Idle;
            connected_ = false;
            session_id_.clear();
        }
        if (client) {
            client->disconnect();
        }
        if (has_active_session_) {
            session_log_.finalize_session();
        }
        has_active_session_ = false;
    }

    std::shared_ptr<RealtimeClient> current_client() const {
        std::lock_guard<std::mutex> lock(state_mutex_);
        return client_;
    }

    void set_error(const std::string& message) {
        std::lock_guard<std::mutex> lock(state_mutex_);
        last_error_ = message;
    }

    void on_event(const EngineEvent& event, const std::weak_ptr<RealtimeClient>& source) {
        {
            // Events from a replaced client are dropped
            std::lock_guard<std::mutex> lock(state_mutex_);
            if (client_ != source.lock()) return;
        }

        if (std::get_if<realtime::Connected>(&event)) {
            std::lock_guard<std::mutex> lock(state_mutex_);
            connected_ = true;
            agent_state_ = AgentState::Idle;
        } else if (auto* disconnected = std::get_if<realtime::Disconnected>(&event)) {
            Logger::warn("[Session] Realtime disconnected: " + disconnected->reason);
            {
                std::lock_guard<std::mutex> lock(state_mutex_);
                connected_ = false;
                agent_state_ = AgentState::Idle;
            }
            release_audio();
        } else if (auto* changed = std::get_if<realtime::AgentStateChanged>(&event)) {
            {
                std::lock_guard<std::mutex> lock(state_mutex_);
                agent_state_ = changed->state;
            }
            if (changed->state == AgentState::Listening) {
                capture_.stop_playback();
            }
        } else if (auto* audio_delta = std::get_if<realtime::AudioDelta>(&event)) {
            // Completion is not awaited; buffers play in arrival order
            capture_.play_audio_data(audio_delta->samples);
        } else if (std::get_if<realtime::Interruption>(&event)) {
            capture_.stop_playback();
        } else if (auto* delta = std::get_if<realtime::TranscriptDelta>(&event)) {
            std::lock_guard<std::mutex> lock(state_mutex_);
            transcripts_.append(delta->speaker, delta->item_id, delta->delta);
        } else if (auto* done = std::get_if<realtime::TranscriptDone>(&event)) {
            std::optional<realtime::ConversationMessage> message;
            {
                std::lock_guard<std::mutex> lock(state_mutex_);
                message = transcripts_.finalize(done->speaker, done->item_id, done->transcript);
                if (message) {
                    messages_.push_back(*message);
                    size_t limit = config_.max_messages > 0 ? config_.max_messages : MAX_CONVERSATION_MESSAGES;
                    if (messages_.size() > limit) {
                        messages_.erase(messages_.begin(), messages_.end() - static_cast<std::ptrdiff_t>(limit));
                    }
                }
            }
            if (message) {
                session_log_.record_turn(*message);
            }
        } else if (auto* reset = std::get_if<realtime::TranscriptReset>(&event)) {
            std::lock_guard<std::mutex> lock(state_mutex_);
            transcripts_.reset(reset->speaker);
        } else if (std::get_if<realtime::ResponseDone>(&event)) {
            std::lock_guard<std::mutex> lock(state_mutex_);
            transcripts_.reset(Speaker::Assistant);
        } else if (auto* call = std::get_if<realtime::FunctionCall>(&event)) {
            handle_function_call(call->request, source);
        } else if (auto* error = std::get_if<realtime::ErrorEvent>(&event)) {
            Logger::error("[Session] Realtime error: " + error->error.message);
            set_error(error->error.message);
        }

        std::vector<realtime::EventHandler> handlers;
        {
            std::lock_guard<std::mutex> lock(handlers_mutex_);
            for (const auto& entry : handlers_) {
                handlers.push_back(entry.second);
            }
        }
        for (const auto& handler : handlers) {
            handler(event);
        }
    }

    void handle_function_call(ToolCallRequest request, const std::weak_ptr<RealtimeClient>& source) {
        if (request.name.empty()) {
            LOG_WARN("[Session] Function call missing tool name");
            return;
        }
        if (request.call_id.empty()) {
            request.call_id = utils::random_id();
        }
        {
            // Tool backends key their work on the broker session when there is one
            std::lock_guard<std::mutex> lock(state_mutex_);
            if (!session_id_.empty()) {
                request.session_id = session_id_;
            }
        }

        std::shared_ptr<ToolMediator> mediator = mediator_;
        std::weak_ptr<Impl> weak_self = shared_from_this();
        executor_.execute_async(
            request.call_id,
            [mediator, request]() { return mediator->execute(request); },
            [source, weak_self](const ToolExecutionResult& result) {
                auto client = source.lock();
                if (!client || !client->is_connected()) {
                    Logger::warn("[Session] Dropping tool output for " + result.call_id + ", session closed");
                    return;
                }
                if (!result.result.success) {
                    if (auto self = weak_self.lock()) {
                        self->set_error(result.result.error);
                    }
                }
                client->send_function_call_output(result.call_id, result.result.output);
            },
            config_.tools.timeout_ms);
    }

    Config config_;
    VoiceSessionDeps deps_;
    std::string client_session_id_;

    audio::CapturePipeline capture_;
    SessionLog session_log_;
    std::unique_ptr<SessionBroker> broker_;
    std::shared_ptr<ToolMediator> mediator_;
    uint64_t registry_version_ = 0;

    // Serializes ensure/toggle/stop
    std::mutex lifecycle_mutex_;
    bool has_active_session_ = false;

    mutable std::mutex state_mutex_;
    std::shared_ptr<RealtimeClient> client_;
    realtime::TranscriptBuffer transcripts_;
    std::vector<realtime::ConversationMessage> messages_;
    AgentState agent_state_ = AgentState::Idle;
    bool connected_ = false;
    bool recording_ = false;
    std::string last_error_;
    std::string session_id_;
    AgentProfile agent_;

    std::mutex handlers_mutex_;
    std::map<size_t, realtime::EventHandler> handlers_;
    size_t next_handler_id_ = 1;

    // Declared last so its workers are joined before the members they use go away
    ToolExecutor executor_;
};

VoiceSession::VoiceSession(const Config& config, VoiceSessionDeps deps)
    : pimpl_(std::make_shared<Impl>(config, std::move(deps))) {}

VoiceSession::~VoiceSession() = default;

VoidResult VoiceSession::ensure_session() {
    return pimpl_->ensure_session();
}

VoidResult VoiceSession::toggle_recording() {
    return pimpl_->toggle_recording();
}

void VoiceSession::stop_session() {
    pimpl_->stop_session();
}

void VoiceSession::reset_conversation() {
    pimpl_->reset_conversation();
}

size_t VoiceSession::subscribe(realtime::EventHandler handler) {
    return pimpl_->subscribe(std::move(handler));
}

void VoiceSession::unsubscribe(size_t id) {
    pimpl_->unsubscribe(id);
}

std::vector<realtime::ConversationMessage> VoiceSession::messages() const {
    return pimpl_->messages();
}

std::string VoiceSession::live_user_transcript() const {
    return pimpl_->live_text(Speaker::User);
}

std::string VoiceSession::live_assistant_transcript() const {
    return pimpl_->live_text(Speaker::Assistant);
}

AgentState VoiceSession::agent_state() const {
    return pimpl_->agent_state();
}

bool VoiceSession::is_connected() const {
    return pimpl_->is_connected();
}

bool VoiceSession::is_recording() const {
    return pimpl_->is_recording();
}

std::string VoiceSession::last_error() const {
    return pimpl_->last_error();
}

std::string VoiceSession::session_id() const {
    return pimpl_->session_id();
}

AgentProfile VoiceSession::agent() const {
    return pimpl_->agent();
}

float VoiceSession::input_level() const {
    return pimpl_->input_level();
}

} // namespace rtvoice
