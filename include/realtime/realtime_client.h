#pragma once

/**
 * @file realtime_client.h
 * @brief Protocol state machine for one upstream realtime connection
 */

#include "common.h"
#include "config.h"
#include "core/timer_queue.h"
#include "errors.h"
#include "realtime/events.h"
#include "realtime/transport.h"
#include <memory>
#include <string>

namespace rtvoice {
namespace realtime {

/**
 * @brief Owns the upstream connection and translates its event vocabulary
 *
 * Responsibilities:
 * - Send one session.update per physical connection
 * - Gate input buffer clear/commit with the pending-clear flag and sample counters
 * - Track active responses so cancels are only sent when a response is live
 * - Reconnect with exponential backoff after an unexpected close
 * - Publish a normalized EngineEvent feed
 *
 * Inbound messages arrive on the transport's I/O thread; public methods may be
 * called from any thread. Events are dispatched outside the internal lock, so
 * handlers may call back into the client.
 */
class RealtimeClient {
public:
    /**
     * @param config Session parameters (api_key is sent as the bearer credential)
     * @param reconnect Backoff policy
     * @param transport_factory Creates one transport per physical connection
     * @param scheduler Runs reconnect attempts after their backoff delay
     */
    RealtimeClient(const RealtimeConfig& config,
                   const ReconnectConfig& reconnect,
                   TransportFactory transport_factory,
                   DelayScheduler scheduler);
    ~RealtimeClient();

    RealtimeClient(const RealtimeClient&) = delete;
    RealtimeClient& operator=(const RealtimeClient&) = delete;

    /**
     * @brief Register an event handler
     * @return Subscription id for unsubscribe()
     */
    size_t subscribe(EventHandler handler);
    void unsubscribe(size_t id);

    /**
     * @brief Tool schema list sent with the next session.update
     */
    void set_tools(const json& tools);

    /**
     * @brief Open the connection and send the session configuration
     *
     * A failure here returns ConnectionFailed and does not enter the
     * reconnection loop. No-op when already connected.
     */
    VoidResult connect();

    /**
     * @brief Close intentionally, reset all bookkeeping and drop every subscription
     *
     * Cancels any pending reconnect. Idempotent.
     */
    void disconnect();

    /**
     * @brief Open a fresh connection after a drop; no-op while connected
     */
    VoidResult reconnect();

    /**
     * @brief Replace the configuration
     *
     * The session message is re-sent only when it has not been sent on the
     * current connection.
     */
    void update_session_config(const RealtimeConfig& config);

    /**
     * @brief Append one captured frame (clears the input buffer first when a clear is pending)
     */
    void send_audio(const AudioFrame& frame);

    /**
     * @brief Commit the input buffer
     * @return false if skipped (too few samples, or nothing received since the last clear)
     */
    bool commit_audio();

    void clear_audio_buffer();

    /**
     * @brief Send a tool result followed by response.create
     */
    void send_function_call_output(const std::string& call_id, const json& output);

    /**
     * @brief Insert a system message; blank text is ignored
     */
    void send_system_message(const std::string& text);

    void request_response();

    /**
     * @brief Ask upstream to cancel the active response
     * @param suppress_state Do not move to Interrupted locally
     * @return false if no response is active or a cancel is already pending
     */
    bool cancel_response(bool suppress_state = false);

    bool is_connected() const;
    AgentState agent_state() const;

    /// Upstream session id from session.created (empty until received)
    std::string session_id() const;

    /// Reconnect attempts since the last successful open
    int reconnect_attempts() const;

private:
    class Impl;
    std::shared_ptr<Impl> pimpl_;
};

} // namespace realtime
} // namespace rtvoice
