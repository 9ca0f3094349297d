#pragma once

#include "common.h"
#include "errors.h"
#include "audio/audio_device.h"
#include <functional>
#include <future>
#include <memory>
#include <string>

namespace rtvoice {
namespace audio {

struct CaptureOptions {
    std::string input_device;
    std::string output_device;
    int target_sample_rate = TARGET_SAMPLE_RATE;
    int frame_ms = FRAME_SIZE_MS;
    int input_sample_rate = 0;   ///< 0 = device default
    int output_sample_rate = 0;  ///< 0 = try target_sample_rate first
    size_t channel_capacity = 64;
};

/**
 * @brief Receives fixed-size PCM16 frames at the target rate, in capture order
 *
 * Invoked on the pipeline's audio task, never on the host audio thread.
 */
using FrameSink = std::function<void(const AudioFrame&)>;

/**
 * @brief Microphone capture and sequential playback
 *
 * Capture: the host input callback copies raw blocks into a bounded channel;
 * a dedicated audio task drains it on a fixed tick, resamples to the target
 * rate, quantizes to PCM16 and re-blocks into frames for the sink.
 *
 * Playback: a single consumer plays queued buffers one after another. A
 * buffer starts only after the previous one finished or was cleared.
 *
 * Lifecycle: Uninitialized -> Initializing -> Ready -> Closing -> Uninitialized.
 * The input device is claimed exclusively per process while Ready.
 */
class CapturePipeline {
public:
    CapturePipeline(std::shared_ptr<IAudioDevice> device, const CaptureOptions& options);
    ~CapturePipeline();

    CapturePipeline(const CapturePipeline&) = delete;
    CapturePipeline& operator=(const CapturePipeline&) = delete;

    /**
     * @brief Acquire the input device
     *
     * A concurrent call waits for the in-flight one and returns its result.
     * Fails with ClosingInProgress while close() is running.
     */
    VoidResult initialize();

    /**
     * @brief Begin delivering frames to sink (NotInitialized unless Ready)
     */
    VoidResult start_capture(FrameSink sink);

    /**
     * @brief Detach the sink; the device stays open. Idempotent.
     */
    void stop_capture();

    /**
     * @brief Queue PCM16 audio at the target rate for playback
     * @return Resolves when the buffer finished playing or was discarded
     */
    std::future<void> play_audio_data(const AudioBuffer& samples);

    /**
     * @brief Stop the in-flight buffer and discard the queue
     */
    void stop_playback();

    /**
     * @brief Full teardown, allowing a later initialize()
     * @param force Wait out an in-flight initialize() instead of refusing
     * @return InvalidState if an initialization is in flight and force is false
     */
    VoidResult close(bool force = false);

    bool is_initialized() const;
    bool is_capturing() const;
    bool is_playing() const;
    size_t playback_queue_size() const;

    /**
     * @brief RMS of the most recent input block (0..1)
     */
    float input_level() const;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

/**
 * @brief User-facing message for a capture acquisition error
 */
std::string capture_error_message(const Error& error);

} // namespace audio
} // namespace rtvoice
