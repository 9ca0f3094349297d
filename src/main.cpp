#include "voice_session.h"
#include "audio/portaudio_device.h"
#include "config.h"
#include "http_client.h"
#include "logger.h"
#include "path_utils.h"
#include "realtime/beast_transport.h"
#include "core/timer_queue.h"
#include <atomic>
#include <csignal>
#include <iostream>
#include <thread>

namespace rtvoice {

static std::atomic<bool> g_stop_requested(false);

void signal_handler(int) {
    g_stop_requested = true;
}

} // namespace rtvoice

int main(int argc, char* argv[]) {
    using namespace rtvoice;

    // Console logging until the config says otherwise
    Logger::initialize(LogLevel::INFO);

    std::string explicit_path;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--list-devices") {
            audio::PortAudioDevice::print_devices();
            Logger::shutdown();
            return 0;
        }
        explicit_path = arg;
    }

    Config config = Config::load_from_file(resolve_config_path(explicit_path));
    Logger::shutdown();
    Logger::initialize(Logger::parse_level(config.logging.level), expand_path(config.logging.file));

    TimerQueue timers;
    VoiceSessionDeps deps;
    deps.audio_device = std::make_shared<audio::PortAudioDevice>();
    deps.http = std::make_shared<CurlHttpClient>();
    deps.transport_factory = realtime::BeastTransport::factory(config.realtime.connect_timeout_ms);
    deps.scheduler = timers.scheduler();

    int exit_code = 0;
    {
        VoiceSession session(config, deps);
        session.subscribe([](const realtime::EngineEvent& event) {
            if (auto* done = std::get_if<realtime::TranscriptDone>(&event)) {
                if (!done->transcript.empty()) {
                    std::cout << (done->speaker == Speaker::User ? "you> " : "agent> ")
                              << done->transcript << std::endl;
                }
            } else if (auto* error = std::get_if<realtime::ErrorEvent>(&event)) {
                if (error->terminal) {
                    std::cerr << "Connection lost: " << error->error.message << std::endl;
                    g_stop_requested = true;
                }
            }
        });

        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        auto started = session.toggle_recording();
        if (!started) {
            std::cerr << "Could not start voice session: " << session.last_error() << std::endl;
            exit_code = 1;
        } else {
            LOG_INFO("Listening (agent: " + session.agent().name + "). Press Ctrl+C to stop.");
            while (!g_stop_requested) {
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
            }
            Logger::info("Shutting down...");
        }

        session.stop_session();
    }

    Logger::shutdown();
    return exit_code;
}
