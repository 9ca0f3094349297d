/**
 * End-to-end session wiring with a fake broker, transport and microphone.
 * Asserts:
 * - ensure_session applies the broker grant and connects once.
 * - Transcripts become messages, capped at max_messages.
 * - A function call runs through the mediator and its output goes upstream.
 * - Captured audio reaches the wire; manual turn detection commits on mic-off.
 * - A microphone error tears the session down with an actionable message.
 * - A dropped connection stops the microphone.
 *
 * Run from build dir: ./test_voice_session
 */

#include "fakes.h"
#include "voice_session.h"
#include "logger.h"
#include "utils.h"
#include <atomic>
#include <iostream>
#include <string>
#include <vector>

using namespace rtvoice;
using namespace rtvoice::testing;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

namespace {

const char* kGrant = R"({
    "token": "ek_test",
    "session_id": "vs_1",
    "agent": {"id": "agent-1", "name": "Helper", "model": "gpt-4o-realtime-preview", "voice": "Verse",
              "instructions": "Be nice."},
    "tools": [
        {
            "name": "send_email",
            "execution_type": "mcp",
            "connection_id": "conn-1",
            "parameters": {
                "type": "object",
                "properties": {"recipient_email": {"type": "string"}, "body": {"type": "string"}},
                "required": ["recipient_email", "body"]
            }
        }
    ]
})";

struct Rig {
    Config config;
    std::shared_ptr<FakeAudioDevice> device = std::make_shared<FakeAudioDevice>(48000, 24000);
    std::shared_ptr<FakeHttpClient> http = std::make_shared<FakeHttpClient>();
    TransportScript transports;
    ManualScheduler scheduler;

    Rig() {
        config.broker.api_base = "https://proj.example.com/";
        config.broker.public_id = "pub-123";
        config.tools.mcp_base_url = "https://mcp.example.com";
        config.session_log_dir = "";
        http->set_handler([](const std::string& url, const json&) -> Result<HttpResponse> {
            if (utils::ends_with(url, "/functions/v1/voice-ephemeral-key")) {
                return http_ok(json::parse(kGrant));
            }
            if (utils::ends_with(url, "/api/mcp/execute")) {
                return http_ok(json::parse(R"({"success": true, "data": {"sent": true}})"));
            }
            return http_status(404, json::parse(R"({"error": "not found"})"));
        });
    }

    VoiceSessionDeps deps() {
        VoiceSessionDeps d;
        d.audio_device = device;
        d.http = http;
        d.transport_factory = transports.factory();
        d.scheduler = scheduler.scheduler();
        return d;
    }

    size_t broker_requests() const {
        size_t n = 0;
        for (const auto& r : http->requests()) {
            if (utils::ends_with(r.url, "voice-ephemeral-key")) ++n;
        }
        return n;
    }
};

json transcript_done(const std::string& item, const std::string& text) {
    json msg = json::object();
    msg["type"] = "conversation.item.input_audio_transcription.completed";
    msg["item_id"] = item;
    msg["transcript"] = text;
    return msg;
}

} // namespace

int main() {
    Logger::initialize(LogLevel::WARN);

    // --- grant, connect, transcripts, tool round trip ---
    {
        Rig rig;
        VoiceSession session(rig.config, rig.deps());

        std::vector<std::string> seen;
        std::atomic<size_t> messages_at_done(0);
        session.subscribe([&](const realtime::EngineEvent& event) {
            seen.push_back(realtime::event_name(event));
            if (std::holds_alternative<realtime::TranscriptDone>(event)) {
                messages_at_done = session.messages().size();
            }
        });

        ASSERT(session.ensure_session().is_ok());
        ASSERT(session.is_connected());
        ASSERT(session.session_id() == "vs_1");
        ASSERT(session.agent().name == "Helper");
        ASSERT(session.agent().voice == "verse");
        ASSERT(rig.broker_requests() == 1);

        auto requests = rig.http->requests();
        ASSERT(!requests.empty() && requests[0].url == "https://proj.example.com/functions/v1/voice-ephemeral-key");
        ASSERT(!requests.empty() && requests[0].body["public_id"] == "pub-123");
        ASSERT(!requests.empty() && !requests[0].body.value("client_session_id", "").empty());

        auto wire = rig.transports.last();
        ASSERT(wire != nullptr);
        ASSERT(wire->headers().at("Authorization") == "Bearer ek_test");
        json update = wire->sent_messages().front();
        ASSERT(update["type"] == "session.update");
        ASSERT(update["session"]["voice"] == "verse");
        ASSERT(utils::starts_with(update["session"]["instructions"].get<std::string>(), "Be nice."));
        ASSERT(update["session"]["tools"].size() == 1);
        ASSERT(update["session"]["tools"][0]["name"] == "send_email");

        // Already connected: no second grant or transport
        ASSERT(session.ensure_session().is_ok());
        ASSERT(rig.broker_requests() == 1);
        ASSERT(rig.transports.created() == 1);

        // User turn
        wire->deliver(json::parse(R"({"type": "input_audio_buffer.speech_started"})"));
        ASSERT(session.agent_state() == AgentState::Listening);
        wire->deliver(json::parse(R"({"type": "conversation.item.input_audio_transcription.delta", "item_id": "u1", "delta": "send it"})"));
        ASSERT(session.live_user_transcript() == "send it");
        wire->deliver(transcript_done("u1", "send it please"));
        ASSERT(session.live_user_transcript().empty());
        auto messages = session.messages();
        ASSERT(messages.size() == 1);
        ASSERT(!messages.empty() && messages[0].content == "send it please");
        ASSERT(!messages.empty() && messages[0].role == Speaker::User);
        // Subscribers observe the event after the session applied it
        ASSERT(messages_at_done == 1);

        // Assistant partial text is dropped when the response finishes without a transcript
        wire->deliver(json::parse(R"({"type": "response.created", "response": {"id": "r1"}})"));
        wire->deliver(json::parse(R"({"type": "response.audio_transcript.delta", "item_id": "a1", "delta": "On it"})"));
        ASSERT(session.live_assistant_transcript() == "On it");
        ASSERT(session.agent_state() == AgentState::Thinking);

        // Tool call
        wire->deliver(json::parse(R"({"type": "session.created", "session": {"id": "upstream-1"}})"));
        wire->deliver(json::parse(R"({
            "type": "response.function_call_arguments.done",
            "call_id": "call_42",
            "name": "send_email",
            "arguments": "{\"to\": \"Boss@Corp.com\", \"message\": \"done\"}"
        })"));
        bool replied = wait_until([&] { return wire->count_sent("conversation.item.create") == 1; });
        ASSERT(replied);

        bool found_output = false;
        std::vector<json> sent = wire->sent_messages();
        for (size_t i = 0; i < sent.size(); ++i) {
            if (sent[i]["type"] == "conversation.item.create") {
                found_output = true;
                ASSERT(sent[i]["item"]["call_id"] == "call_42");
                ASSERT(sent[i]["item"]["output"] == "{\"sent\":true}");
                ASSERT(i + 1 < sent.size() && sent[i + 1]["type"] == "response.create");
            }
        }
        ASSERT(found_output);

        bool called_mcp = false;
        for (const auto& r : rig.http->requests()) {
            if (utils::ends_with(r.url, "/api/mcp/execute")) {
                called_mcp = true;
                ASSERT(r.body["tool_name"] == "send_email");
                ASSERT(r.body["parameters"]["recipient_email"] == "boss@corp.com");
                ASSERT(r.body["parameters"]["body"] == "done");
            }
        }
        ASSERT(called_mcp);

        wire->deliver(json::parse(R"({"type": "response.done", "response": {"id": "r1", "status": "completed"}})"));
        ASSERT(session.live_assistant_transcript().empty());
        ASSERT(session.agent_state() == AgentState::Idle);

        // Upstream errors surface as last_error
        wire->deliver(json::parse(R"({"type": "error", "error": {"message": "rate limited"}})"));
        ASSERT(session.last_error() == "rate limited");

        session.reset_conversation();
        ASSERT(session.messages().empty());
        ASSERT(session.last_error().empty());

        bool saw_connected = false;
        for (const auto& name : seen) {
            if (name == "connected") saw_connected = true;
        }
        ASSERT(saw_connected);

        session.stop_session();
        ASSERT(!session.is_connected());
        ASSERT(session.session_id().empty());
        ASSERT(wire->close_calls() == 1);
        session.stop_session();
        ASSERT(wire->close_calls() == 1);
    }

    // --- message cap ---
    {
        Rig rig;
        rig.config.max_messages = 2;
        VoiceSession session(rig.config, rig.deps());
        ASSERT(session.ensure_session().is_ok());
        auto wire = rig.transports.last();
        wire->deliver(transcript_done("u1", "one"));
        wire->deliver(transcript_done("u2", "two"));
        wire->deliver(transcript_done("u3", "three"));
        wire->deliver(transcript_done("u4", "   "));
        auto messages = session.messages();
        ASSERT(messages.size() == 2);
        ASSERT(messages.size() == 2 && messages[0].content == "two");
        ASSERT(messages.size() == 2 && messages[1].content == "three");
    }

    // --- microphone streaming and manual commit ---
    {
        Rig rig;
        rig.config.realtime.turn_detection.type = "none";
        VoiceSession session(rig.config, rig.deps());

        ASSERT(session.toggle_recording().is_ok());
        ASSERT(session.is_recording());
        ASSERT(session.is_connected());
        auto wire = rig.transports.last();
        ASSERT(wire->sent_messages().front()["session"]["turn_detection"].is_null());

        // 12 blocks of 10 ms @ 48 kHz -> 120 ms -> six 20 ms frames at 24 kHz
        std::vector<float> block(480, 0.25f);
        for (int i = 0; i < 12; ++i) {
            rig.device->push_input(block);
        }
        bool streamed = wait_until([&] { return wire->count_sent("input_audio_buffer.append") >= 5; });
        ASSERT(streamed);
        ASSERT(wire->count_sent("input_audio_buffer.clear") == 1);

        ASSERT(session.toggle_recording().is_ok());
        ASSERT(!session.is_recording());
        ASSERT(wire->count_sent("input_audio_buffer.commit") == 1);
        std::vector<std::string> types = wire->sent_types();
        ASSERT(!types.empty() && types.back() == "response.create");
        // The connection stays up after the microphone is off
        ASSERT(session.is_connected());

        // Back on, then the connection drops: the microphone is released
        ASSERT(session.toggle_recording().is_ok());
        ASSERT(session.is_recording());
        wire->drop(1006, "");
        ASSERT(!session.is_connected());
        ASSERT(!session.is_recording());
        ASSERT(!rig.device->input_open());
        ASSERT(rig.scheduler.pending() == 1);
    }

    // --- microphone failure ---
    {
        Rig rig;
        rig.device->fail_input_with(ErrorType::PermissionDenied);
        VoiceSession session(rig.config, rig.deps());
        VoidResult r = session.toggle_recording();
        ASSERT(r.is_error());
        ASSERT(r.is_error() && r.error().type == ErrorType::PermissionDenied);
        ASSERT(session.last_error() == "Microphone permission denied. Please allow microphone access.");
        ASSERT(!session.is_connected());
        ASSERT(!session.is_recording());
        auto wire = rig.transports.last();
        ASSERT(wire && wire->close_calls() == 1);
    }

    // --- broker refusal ---
    {
        Rig rig;
        rig.http->set_handler([](const std::string&, const json&) -> Result<HttpResponse> {
            return http_status(403, json::parse(R"({"error": "Agent is disabled"})"));
        });
        VoiceSession session(rig.config, rig.deps());
        VoidResult r = session.ensure_session();
        ASSERT(r.is_error());
        ASSERT(r.is_error() && r.error().type == ErrorType::ConnectionFailed);
        ASSERT(session.last_error() == "Agent is disabled");
        ASSERT(rig.transports.created() == 0);
    }

    // --- upstream refuses the connection ---
    {
        Rig rig;
        rig.transports.set_fail_after_script(true);
        VoiceSession session(rig.config, rig.deps());
        VoidResult r = session.ensure_session();
        ASSERT(r.is_error() && r.error().type == ErrorType::ConnectionFailed);
        ASSERT(!session.is_connected());
        ASSERT(!session.last_error().empty());
        ASSERT(rig.scheduler.pending() == 0);
    }

    // --- direct API key, no broker ---
    {
        Rig rig;
        rig.config.broker.api_base = "";
        VoiceSession without_key(rig.config, rig.deps());
        VoidResult r = without_key.ensure_session();
        ASSERT(r.is_error() && r.error().type == ErrorType::InvalidState);

        rig.config.realtime.api_key = "sk-direct";
        rig.config.realtime.voice = "robot";
        VoiceSession with_key(rig.config, rig.deps());
        ASSERT(with_key.ensure_session().is_ok());
        ASSERT(with_key.session_id().empty());
        auto wire = rig.transports.last();
        ASSERT(wire->headers().at("Authorization") == "Bearer sk-direct");
        ASSERT(wire->sent_messages().front()["session"]["voice"] == "alloy");
        ASSERT(wire->sent_messages().front()["session"]["tools"].empty());
        ASSERT(rig.http->requests().empty());
    }

    Logger::shutdown();

    if (failed > 0) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All voice session tests passed.\n";
    return 0;
}
