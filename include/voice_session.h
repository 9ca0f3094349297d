#pragma once

/**
 * @file voice_session.h
 * @brief UI-facing facade: one voice conversation from mic toggle to teardown
 */

#include "common.h"
#include "config.h"
#include "errors.h"
#include "http_client.h"
#include "session_broker.h"
#include "audio/audio_device.h"
#include "core/timer_queue.h"
#include "realtime/events.h"
#include "realtime/transcript_buffer.h"
#include "realtime/transport.h"
#include <memory>
#include <string>
#include <vector>

namespace rtvoice {

/**
 * @brief External resources the session runs against (replaced by fakes in tests)
 */
struct VoiceSessionDeps {
    std::shared_ptr<audio::IAudioDevice> audio_device;
    std::shared_ptr<HttpClient> http;
    realtime::TransportFactory transport_factory;
    DelayScheduler scheduler;
};

/**
 * @brief Ties the broker, realtime client, capture pipeline and tool mediator together
 *
 * Wiring:
 * - Captured frames go to the realtime client
 * - Audio deltas are queued for playback; listening and interruptions stop it
 * - Function calls run on the tool executor and their output is sent upstream
 * - Finalized transcripts become messages (the last max_messages are kept)
 * - A drop of the connection stops the microphone
 *
 * Events from the realtime client are forwarded to subscribers after the
 * session has applied them, so accessors already reflect the event.
 */
class VoiceSession {
public:
    VoiceSession(const Config& config, VoiceSessionDeps deps);
    ~VoiceSession();

    VoiceSession(const VoiceSession&) = delete;
    VoiceSession& operator=(const VoiceSession&) = delete;

    /**
     * @brief Obtain a grant (or use the direct API key) and connect; no-op while connected
     */
    VoidResult ensure_session();

    /**
     * @brief Microphone on/off
     *
     * Turning on connects first if needed; a microphone error tears the session
     * down and sets an actionable last_error(). Turning off with manual turn
     * detection commits the buffered audio and requests a response.
     */
    VoidResult toggle_recording();

    /**
     * @brief Stop capture and playback, release the device and disconnect
     */
    void stop_session();

    /**
     * @brief Drop messages, live transcripts and the last error
     */
    void reset_conversation();

    size_t subscribe(realtime::EventHandler handler);
    void unsubscribe(size_t id);

    std::vector<realtime::ConversationMessage> messages() const;
    std::string live_user_transcript() const;
    std::string live_assistant_transcript() const;
    AgentState agent_state() const;
    bool is_connected() const;
    bool is_recording() const;
    std::string last_error() const;

    /// Broker session id (empty with a direct API key or when stopped)
    std::string session_id() const;

    AgentProfile agent() const;

    /// RMS level of the latest input block
    float input_level() const;

private:
    class Impl;
    std::shared_ptr<Impl> pimpl_;
};

} // namespace rtvoice
