/**
 * Protocol state machine against an in-process transport.
 * Asserts:
 * - One session.update per physical connection.
 * - Barge-in cancels once and reports an interruption.
 * - The pending-clear flag sends a single input buffer clear per utterance.
 * - Manual commits below the sample threshold are never sent.
 * - Reconnection backs off, then gives up with a terminal error.
 * - A close that lands during the handshake is treated as a drop.
 * - disconnect() is idempotent and drops subscriptions.
 *
 * Run from build dir: ./test_realtime_client
 */

#include "fakes.h"
#include "logger.h"
#include "realtime/protocol.h"
#include "realtime/realtime_client.h"
#include "state_machine.h"
#include "utils.h"
#include <iostream>
#include <string>
#include <vector>

using namespace rtvoice;
using namespace rtvoice::realtime;
using namespace rtvoice::testing;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

namespace {

struct Harness {
    RealtimeConfig config;
    ReconnectConfig reconnect;
    TransportScript transports;
    ManualScheduler scheduler;
    std::unique_ptr<RealtimeClient> client;
    std::vector<EngineEvent> events;

    Harness() {
        config.api_key = "sk-test";
    }

    void start() {
        client = std::make_unique<RealtimeClient>(config, reconnect, transports.factory(), scheduler.scheduler());
        client->subscribe([this](const EngineEvent& event) { events.push_back(event); });
    }

    std::shared_ptr<FakeTransport> wire() { return transports.last(); }

    template<typename T>
    size_t count() const {
        size_t n = 0;
        for (const auto& e : events) {
            if (std::holds_alternative<T>(e)) ++n;
        }
        return n;
    }

    template<typename T>
    const T* last_of() const {
        for (auto it = events.rbegin(); it != events.rend(); ++it) {
            if (auto* e = std::get_if<T>(&*it)) return e;
        }
        return nullptr;
    }
};

json typed(const char* type) {
    return json{{"type", type}};
}

} // namespace

int main() {
    Logger::initialize(LogLevel::WARN);

    // --- connect: headers, URL and a single session.update ---
    {
        Harness h;
        h.config.voice = "verse";
        h.start();
        h.client->set_tools(json::parse(R"([{"type": "function", "name": "lookup", "parameters": {}}])"));
        ASSERT(h.client->connect().is_ok());
        ASSERT(h.client->is_connected());
        ASSERT(h.count<Connected>() == 1);

        auto wire = h.wire();
        ASSERT(wire->url() == "wss://api.openai.com/v1/realtime?model=gpt-4o-realtime-preview");
        ASSERT(wire->headers().at("Authorization") == "Bearer sk-test");
        ASSERT(wire->headers().at("OpenAI-Beta") == "realtime=v1");
        ASSERT(wire->count_sent("session.update") == 1);

        json update = wire->sent_messages().front();
        ASSERT(update["session"]["voice"] == "verse");
        ASSERT(update["session"]["tools"].size() == 1);
        ASSERT(update["session"]["turn_detection"]["type"] == "server_vad");
        ASSERT(update["session"]["input_audio_format"] == "pcm16");

        // Connecting again is a no-op, and so is re-sending the same configuration
        ASSERT(h.client->connect().is_ok());
        h.client->update_session_config(h.config);
        ASSERT(wire->count_sent("session.update") == 1);
        ASSERT(h.transports.created() == 1);

        // session.created records the upstream id
        wire->deliver(json::parse(R"({"type": "session.created", "session": {"id": "sess_1"}})"));
        ASSERT(h.client->session_id() == "sess_1");
        wire->deliver(json::parse(R"({"type": "session.updated", "session": {}})"));
        ASSERT(h.last_of<SessionUpdated>() && h.last_of<SessionUpdated>()->session_id == "sess_1");
    }

    // --- instructions carry the language directive; guardrail mode adds the knowledge block ---
    {
        RealtimeConfig cfg;
        cfg.instructions = "Be brief.";
        std::string plain = protocol::augment_instructions(cfg);
        ASSERT(utils::starts_with(plain, "Be brief."));
        ASSERT(plain.find(protocol::kLanguageGuard) != std::string::npos);
        ASSERT(plain.find(protocol::kGuardrailDirective) == std::string::npos);

        cfg.guardrail_mode = true;
        cfg.rag_instructions = "Store hours are 9-5.";
        std::string guarded = protocol::augment_instructions(cfg);
        ASSERT(guarded.find("Store hours are 9-5.") != std::string::npos);
        ASSERT(guarded.find(protocol::kGuardrailDirective) != std::string::npos);
        ASSERT(guarded.find("Store hours") < guarded.find(protocol::kGuardrailDirective));

        cfg.turn_detection.type = "none";
        ASSERT(protocol::build_turn_detection(cfg.turn_detection).is_null());
    }

    // --- failed initial connect: error, no retry ---
    {
        Harness h;
        h.transports.set_fail_after_script(true);
        h.start();
        VoidResult r = h.client->connect();
        ASSERT(r.is_error());
        ASSERT(r.is_error() && r.error().type == ErrorType::ConnectionFailed);
        ASSERT(!h.client->is_connected());
        ASSERT(h.count<ErrorEvent>() == 1);
        ASSERT(h.last_of<ErrorEvent>() && !h.last_of<ErrorEvent>()->terminal);
        ASSERT(h.scheduler.pending() == 0);
    }

    // --- state transitions and transcripts ---
    {
        Harness h;
        h.start();
        ASSERT(h.client->connect().is_ok());
        auto wire = h.wire();

        wire->deliver(typed("input_audio_buffer.speech_started"));
        ASSERT(h.client->agent_state() == AgentState::Listening);
        ASSERT(h.count<TranscriptReset>() == 1);

        wire->deliver(typed("input_audio_buffer.speech_stopped"));
        ASSERT(h.client->agent_state() == AgentState::Thinking);

        wire->deliver(json::parse(R"({"type": "conversation.item.input_audio_transcription.delta", "item_id": "u1", "delta": "hel"})"));
        wire->deliver(json::parse(R"({"type": "conversation.item.input_audio_transcription.completed", "item_id": "u1", "transcript": "hello"})"));
        ASSERT(h.last_of<TranscriptDelta>() && h.last_of<TranscriptDelta>()->speaker == Speaker::User);
        ASSERT(h.last_of<TranscriptDone>() && h.last_of<TranscriptDone>()->transcript == "hello");

        wire->deliver(json::parse(R"({"type": "response.created", "response": {"id": "r1"}})"));
        ASSERT(h.last_of<ResponseCreated>() && h.last_of<ResponseCreated>()->response_id == "r1");

        AudioFrame pcm = {100, -100, 200};
        json delta = {{"type", "response.output_audio.delta"}, {"item_id", "a1"},
                      {"delta", utils::base64_encode_pcm16(pcm)}};
        wire->deliver(delta);
        ASSERT(h.client->agent_state() == AgentState::Speaking);
        ASSERT(h.last_of<AudioDelta>() && h.last_of<AudioDelta>()->samples == pcm);

        wire->deliver(json::parse(R"({"type": "response.audio_transcript.delta", "item_id": "a1", "delta": "Hi"})"));
        ASSERT(h.last_of<TranscriptDelta>() && h.last_of<TranscriptDelta>()->speaker == Speaker::Assistant);

        wire->deliver(json::parse(R"({"type": "response.done", "response": {"id": "r1", "status": "completed"}})"));
        ASSERT(h.client->agent_state() == AgentState::Idle);
        ASSERT(h.last_of<ResponseDone>() && h.last_of<ResponseDone>()->status == "completed");

        // No active response left, so a cancel is not sent
        ASSERT(!h.client->cancel_response());
        ASSERT(wire->count_sent("response.cancel") == 0);

        // Malformed and unknown messages are dropped
        size_t before = h.events.size();
        wire->deliver_raw("{not json");
        wire->deliver(json::parse(R"({"no_type": true})"));
        wire->deliver(typed("rate_limits.updated"));
        wire->deliver(typed("something.new"));
        ASSERT(h.events.size() == before);
        ASSERT(h.client->is_connected());

        // Upstream errors are surfaced without closing
        wire->deliver(json::parse(R"({"type": "error", "error": {"message": "bad request"}})"));
        ASSERT(h.last_of<ErrorEvent>() && h.last_of<ErrorEvent>()->error.type == ErrorType::UpstreamError);
        ASSERT(h.last_of<ErrorEvent>() && h.last_of<ErrorEvent>()->error.message == "bad request");
        ASSERT(h.client->is_connected());
    }

    // --- barge-in while speaking ---
    {
        Harness h;
        h.start();
        ASSERT(h.client->connect().is_ok());
        auto wire = h.wire();

        wire->deliver(json::parse(R"({"type": "response.created", "response": {"id": "r1"}})"));
        json delta = {{"type", "response.audio.delta"}, {"delta", utils::base64_encode_pcm16(AudioFrame(10, 5))}};
        wire->deliver(delta);
        ASSERT(h.client->agent_state() == AgentState::Speaking);

        h.events.clear();
        wire->deliver(typed("input_audio_buffer.speech_started"));
        ASSERT(wire->count_sent("response.cancel") == 1);
        ASSERT(h.count<Interruption>() == 1);
        ASSERT(h.last_of<Interruption>() && h.last_of<Interruption>()->reason == "barge_in");

        // The interruption is reported before the state settles on listening
        size_t interruption_at = h.events.size();
        size_t listening_at = h.events.size();
        for (size_t i = 0; i < h.events.size(); ++i) {
            if (std::holds_alternative<Interruption>(h.events[i]) && interruption_at == h.events.size()) {
                interruption_at = i;
            }
            auto* changed = std::get_if<AgentStateChanged>(&h.events[i]);
            if (changed && changed->state == AgentState::Listening) listening_at = i;
        }
        ASSERT(interruption_at < listening_at);
        ASSERT(h.client->agent_state() == AgentState::Listening);

        // A second cancel while one is pending is suppressed
        ASSERT(!h.client->cancel_response());
        ASSERT(wire->count_sent("response.cancel") == 1);

        wire->deliver(typed("response.cancelled"));
        ASSERT(h.client->agent_state() == AgentState::Interrupted);
        ASSERT(h.last_of<Interruption>() && h.last_of<Interruption>()->reason == "response.cancelled");

        // interrupted -> listening on the next speech start
        wire->deliver(typed("input_audio_buffer.speech_started"));
        ASSERT(h.client->agent_state() == AgentState::Listening);
        ASSERT(wire->count_sent("response.cancel") == 1);
    }

    // --- barge-in with interruptions disabled ---
    {
        Harness h;
        h.config.allow_interruptions = false;
        h.start();
        ASSERT(h.client->connect().is_ok());
        auto wire = h.wire();
        wire->deliver(typed("response.created"));
        json delta = {{"type", "response.audio.delta"}, {"delta", utils::base64_encode_pcm16(AudioFrame(10, 5))}};
        wire->deliver(delta);
        wire->deliver(typed("input_audio_buffer.speech_started"));
        ASSERT(wire->count_sent("response.cancel") == 0);
        ASSERT(h.count<Interruption>() == 0);
    }

    // --- pending clear: one clear per utterance ---
    {
        Harness h;
        h.start();
        ASSERT(h.client->connect().is_ok());
        auto wire = h.wire();

        wire->deliver(typed("input_audio_buffer.speech_started"));
        wire->deliver(typed("input_audio_buffer.speech_started"));
        AudioFrame frame(480, 1);
        h.client->send_audio(frame);
        h.client->send_audio(frame);
        h.client->send_audio(frame);
        ASSERT(wire->count_sent("input_audio_buffer.clear") == 1);
        ASSERT(wire->count_sent("input_audio_buffer.append") == 3);

        std::vector<std::string> types = wire->sent_types();
        ASSERT(types.size() == 5);
        ASSERT(types.size() == 5 && types[1] == "input_audio_buffer.clear");
        ASSERT(types.size() == 5 && types[2] == "input_audio_buffer.append");

        // The next utterance clears again
        wire->deliver(typed("input_audio_buffer.speech_stopped"));
        h.client->send_audio(frame);
        ASSERT(wire->count_sent("input_audio_buffer.clear") == 2);
    }

    // --- commit gating ---
    {
        Harness h;
        h.config.turn_detection.type = "none";
        h.start();
        ASSERT(h.client->connect().is_ok());
        auto wire = h.wire();
        ASSERT(wire->sent_messages().front()["session"]["turn_detection"].is_null());

        // Nothing appended
        ASSERT(!h.client->commit_audio());

        // Below the threshold (2400 samples)
        h.client->send_audio(AudioFrame(480, 1));
        h.client->send_audio(AudioFrame(480, 1));
        ASSERT(!h.client->commit_audio());
        ASSERT(wire->count_sent("input_audio_buffer.commit") == 0);

        for (int i = 0; i < 3; ++i) h.client->send_audio(AudioFrame(480, 1));
        ASSERT(h.client->commit_audio());
        ASSERT(wire->count_sent("input_audio_buffer.commit") == 1);

        // Counters reset after a commit
        ASSERT(!h.client->commit_audio());
        ASSERT(wire->count_sent("input_audio_buffer.commit") == 1);

        // An explicit clear also resets them
        for (int i = 0; i < 5; ++i) h.client->send_audio(AudioFrame(480, 1));
        h.client->clear_audio_buffer();
        ASSERT(!h.client->commit_audio());
        ASSERT(wire->count_sent("input_audio_buffer.commit") == 1);
    }

    // --- tool output and system messages ---
    {
        Harness h;
        h.start();
        ASSERT(h.client->connect().is_ok());
        auto wire = h.wire();
        wire->deliver(json::parse(R"({"type": "session.created", "session": {"id": "sess_9"}})"));
        wire->deliver(json::parse(R"({"type": "response.function_call_arguments.done", "call_id": "c1", "name": "lookup", "arguments": "{\"q\":1}"})"));
        const FunctionCall* call = h.last_of<FunctionCall>();
        ASSERT(call != nullptr);
        if (call) {
            ASSERT(call->request.call_id == "c1");
            ASSERT(call->request.name == "lookup");
            ASSERT(call->request.arguments == "{\"q\":1}");
            ASSERT(call->request.session_id == "sess_9");
        }

        h.client->send_function_call_output("c1", json{{"ok", true}});
        std::vector<json> sent = wire->sent_messages();
        ASSERT(sent.size() >= 2);
        json item = sent[sent.size() - 2];
        ASSERT(item["type"] == "conversation.item.create");
        ASSERT(item["item"]["type"] == "function_call_output");
        ASSERT(item["item"]["call_id"] == "c1");
        ASSERT(item["item"]["output"] == "{\"ok\":true}");
        ASSERT(sent.back()["type"] == "response.create");

        size_t before = wire->sent_messages().size();
        h.client->send_system_message("   ");
        ASSERT(wire->sent_messages().size() == before);
        h.client->send_system_message("Keep answers short.");
        json system = wire->sent_messages().back();
        ASSERT(system["item"]["role"] == "system");
        ASSERT(system["item"]["content"][0]["text"] == "Keep answers short.");
    }

    // --- reconnection: backoff, success resets the budget ---
    {
        Harness h;
        h.start();
        ASSERT(h.client->connect().is_ok());
        h.wire()->drop(1006, "");
        ASSERT(!h.client->is_connected());
        ASSERT(h.last_of<Disconnected>() && !h.last_of<Disconnected>()->intentional);
        ASSERT(h.last_of<Disconnected>() && h.last_of<Disconnected>()->reason == "code:1006");
        ASSERT(h.client->agent_state() == AgentState::Idle);
        ASSERT(h.scheduler.pending() == 1);
        ASSERT(h.scheduler.delays().size() == 1 && h.scheduler.delays()[0].count() == 1000);

        ASSERT(h.scheduler.run_next());
        ASSERT(h.client->is_connected());
        ASSERT(h.client->reconnect_attempts() == 0);
        ASSERT(h.count<Connected>() == 2);
        // A fresh connection gets its own session.update
        ASSERT(h.wire()->count_sent("session.update") == 1);
    }

    // --- a close racing the handshake still enters the reconnect loop ---
    {
        Harness h;
        auto racing = std::make_shared<FakeTransport>();
        racing->close_after_handshake();
        h.transports.push(racing);
        h.start();
        ASSERT(h.client->connect().is_ok());
        ASSERT(!h.client->is_connected());
        ASSERT(h.count<Connected>() == 0);
        ASSERT(h.last_of<Disconnected>() && !h.last_of<Disconnected>()->intentional);
        ASSERT(h.last_of<Disconnected>() && h.last_of<Disconnected>()->reason == "closed after handshake");
        ASSERT(h.client->reconnect_attempts() == 1);
        ASSERT(h.scheduler.pending() == 1);

        ASSERT(h.scheduler.run_next());
        ASSERT(h.client->is_connected());
        ASSERT(h.transports.created() == 2);
        ASSERT(h.client->reconnect_attempts() == 0);
        ASSERT(h.count<Connected>() == 1);
    }

    // --- reconnection exhausted after five failures ---
    {
        Harness h;
        h.start();
        ASSERT(h.client->connect().is_ok());
        h.transports.set_fail_after_script(true);
        h.wire()->drop(1006, "network lost");
        ASSERT(h.last_of<Disconnected>() && h.last_of<Disconnected>()->reason == "network lost");

        int fired = 0;
        while (h.scheduler.run_next()) {
            ++fired;
            ASSERT(fired <= 5);
            if (fired > 5) break;
        }
        ASSERT(fired == 5);
        ASSERT(!h.client->is_connected());

        std::vector<std::chrono::milliseconds> delays = h.scheduler.delays();
        ASSERT(delays.size() == 5);
        if (delays.size() == 5) {
            ASSERT(delays[0].count() == 1000);
            ASSERT(delays[1].count() == 2000);
            ASSERT(delays[2].count() == 4000);
            ASSERT(delays[3].count() == 8000);
            ASSERT(delays[4].count() == 16000);
        }

        const ErrorEvent* terminal = h.last_of<ErrorEvent>();
        ASSERT(terminal != nullptr);
        ASSERT(terminal && terminal->terminal);
        ASSERT(terminal && terminal->error.type == ErrorType::ReconnectExhausted);
        size_t terminal_count = 0;
        for (const auto& e : h.events) {
            auto* err = std::get_if<ErrorEvent>(&e);
            if (err && err->terminal) ++terminal_count;
        }
        ASSERT(terminal_count == 1);
    }

    // --- intentional disconnect: no retry, idempotent, subscriptions dropped ---
    {
        Harness h;
        h.start();
        ASSERT(h.client->connect().is_ok());
        auto wire = h.wire();
        h.client->disconnect();
        ASSERT(!h.client->is_connected());
        ASSERT(wire->close_calls() == 1);
        h.client->disconnect();
        h.client->disconnect();
        ASSERT(wire->close_calls() == 1);
        ASSERT(h.scheduler.pending() == 0);

        // Late messages on the old connection are ignored
        size_t before = h.events.size();
        wire->deliver(typed("input_audio_buffer.speech_started"));
        wire->drop(1006, "");
        ASSERT(h.events.size() == before);
        ASSERT(h.scheduler.pending() == 0);

        // Subscriptions were cleared: a new connection produces no events for the old handler
        ASSERT(h.client->connect().is_ok());
        ASSERT(h.events.size() == before);
    }

    // --- disconnect cancels a scheduled retry ---
    {
        Harness h;
        h.start();
        ASSERT(h.client->connect().is_ok());
        h.wire()->drop(1011, "");
        ASSERT(h.scheduler.pending() == 1);
        h.client->disconnect();
        size_t created = h.transports.created();
        ASSERT(h.scheduler.run_next());
        ASSERT(h.transports.created() == created);
        ASSERT(!h.client->is_connected());
    }

    // --- state machine rules ---
    {
        ASSERT(StateMachine::is_expected(AgentState::Idle, AgentState::Listening));
        ASSERT(StateMachine::is_expected(AgentState::Speaking, AgentState::Interrupted));
        ASSERT(StateMachine::is_expected(AgentState::Interrupted, AgentState::Listening));
        ASSERT(!StateMachine::is_expected(AgentState::Idle, AgentState::Speaking));

        StateMachine sm;
        ASSERT(sm.get_state() == AgentState::Idle);
        ASSERT(!sm.transition(AgentState::Idle));
        ASSERT(sm.transition(AgentState::Idle, "socket-closed"));
        ASSERT(sm.transition(AgentState::Listening));
        ASSERT(sm.get_state() == AgentState::Listening);
        sm.reset();
        ASSERT(sm.get_state() == AgentState::Idle);
    }

    Logger::shutdown();

    if (failed > 0) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All realtime client tests passed.\n";
    return 0;
}
