#pragma once

#include <cstdint>
#include <vector>
#include <string>
#include <chrono>
#include <memory>
#include <nlohmann/json.hpp>

namespace rtvoice {

// Ordered JSON keeps object keys in insertion order; argument reconciliation
// and outbound message layout depend on it.
using json = nlohmann::ordered_json;

// Audio types
using Sample = int16_t;
using AudioFrame = std::vector<Sample>;
using AudioBuffer = std::vector<Sample>;
using FloatBuffer = std::vector<float>;

// Timing
using TimePoint = std::chrono::steady_clock::time_point;
using Duration = std::chrono::milliseconds;

inline int64_t ms_since(TimePoint start) {
    auto now = std::chrono::steady_clock::now();
    return std::chrono::duration_cast<Duration>(now - start).count();
}

// Audio format constants (upstream expects 24 kHz mono PCM16)
constexpr int TARGET_SAMPLE_RATE = 24000;
constexpr int FRAME_SIZE_MS = 20;
constexpr int SAMPLES_PER_FRAME = (TARGET_SAMPLE_RATE * FRAME_SIZE_MS) / 1000; // 480 samples @ 24kHz

// A manual commit below this many appended samples (100 ms @ 24kHz) is rejected upstream
constexpr int MIN_COMMIT_SAMPLES = 2400;

// Reconnection defaults
constexpr int DEFAULT_MAX_RECONNECT_ATTEMPTS = 5;
constexpr int DEFAULT_RECONNECT_BASE_DELAY_MS = 1000;

// Finalized conversation turns kept for the UI
constexpr size_t MAX_CONVERSATION_MESSAGES = 30;

/**
 * @brief Conversational turn phase
 */
enum class AgentState {
    Idle,
    Listening,
    Thinking,
    Speaking,
    Interrupted
};

enum class Speaker {
    User,
    Assistant
};

const char* to_string(AgentState state);
const char* to_string(Speaker speaker);

/**
 * @brief Function call requested by the model, alive until its result is sent
 */
struct ToolCallRequest {
    std::string call_id;
    std::string name;
    std::string arguments;   // Raw JSON text as streamed by the model
    std::string session_id;  // Upstream session that issued the call
};

} // namespace rtvoice
