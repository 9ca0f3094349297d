#include "audio/capture_pipeline.h"
#include "audio/resampler.h"
#include "logger.h"
#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <set>
#include <thread>

namespace rtvoice {
namespace audio {

namespace {

/// Input devices currently held by a pipeline in this process
std::mutex g_claims_mutex;
std::set<std::string> g_claimed_devices;

bool claim_device(const std::string& id) {
    std::lock_guard<std::mutex> lock(g_claims_mutex);
    return g_claimed_devices.insert(id).second;
}

void release_device(const std::string& id) {
    std::lock_guard<std::mutex> lock(g_claims_mutex);
    g_claimed_devices.erase(id);
}

enum class PipelineState {
    Uninitialized,
    Initializing,
    Ready,
    Closing
};

struct PlaybackItem {
    AudioBuffer samples;
    std::promise<void> done;
};

} // namespace

class CapturePipeline::Impl {
public:
    Impl(std::shared_ptr<IAudioDevice> device, const CaptureOptions& options)
        : device_(std::move(device)),
          options_(options),
          state_(PipelineState::Uninitialized),
          capturing_(false),
          blocker_(static_cast<size_t>(std::max(1, options.target_sample_rate * options.frame_ms / 1000))),
          audio_running_(false),
          dropped_blocks_(0),
          input_level_(0.0f),
          output_open_(false),
          output_rate_(0),
          playback_running_(false),
          playing_(false),
          generation_(0) {}

    ~Impl() {
        VoidResult r = close(true);
        if (!r) {
            Logger::warn("Audio pipeline teardown: " + r.error().message);
        }
    }

    VoidResult initialize() {
        std::unique_lock<std::mutex> lock(state_mutex_);
        if (state_ == PipelineState::Closing) {
            return Error(ErrorType::ClosingInProgress, "Audio pipeline is closing");
        }
        if (state_ == PipelineState::Ready) {
            return VoidResult();
        }
        if (state_ == PipelineState::Initializing) {
            LOG_AUDIO("Initialization already in flight, waiting");
            state_cv_.wait(lock, [this] { return state_ != PipelineState::Initializing; });
            if (state_ == PipelineState::Ready) return VoidResult();
            if (state_ == PipelineState::Closing) {
                return Error(ErrorType::ClosingInProgress, "Audio pipeline is closing");
            }
            return init_result_;
        }

        state_ = PipelineState::Initializing;
        lock.unlock();

        VoidResult result = acquire_input();

        lock.lock();
        state_ = result ? PipelineState::Ready : PipelineState::Uninitialized;
        init_result_ = result;
        state_cv_.notify_all();
        if (!result) {
            Logger::error(std::string("Audio initialization failed (") + describe(result.error().type) +
                          "): " + result.error().message);
        } else {
            Logger::info("Audio pipeline ready");
        }
        return result;
    }

    VoidResult start_capture(FrameSink sink) {
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            if (state_ != PipelineState::Ready) {
                return Error(ErrorType::NotInitialized, "Audio pipeline not initialized");
            }
        }
        std::lock_guard<std::mutex> lock(sink_mutex_);
        sink_ = std::move(sink);
        blocker_.reset();
        if (resampler_) resampler_->reset();
        capturing_ = true;
        LOG_AUDIO("Capture started");
        return VoidResult();
    }

    void stop_capture() {
        std::lock_guard<std::mutex> lock(sink_mutex_);
        if (!capturing_ && !sink_) return;
        capturing_ = false;
        sink_ = nullptr;
        blocker_.reset();
        LOG_AUDIO("Capture stopped");
    }

    std::future<void> play_audio_data(const AudioBuffer& samples) {
        std::promise<void> promise;
        std::future<void> future = promise.get_future();
        if (samples.empty()) {
            promise.set_value();
            return future;
        }
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            if (state_ == PipelineState::Closing) {
                promise.set_value();
                return future;
            }
        }

        VoidResult out = ensure_output();
        if (!out) {
            Logger::warn("Playback unavailable: " + out.error().message);
            promise.set_value();
            return future;
        }

        {
            std::lock_guard<std::mutex> lock(playback_mutex_);
            PlaybackItem item;
            item.samples = convert_for_output(samples);
            item.done = std::move(promise);
            queue_.push_back(std::move(item));
        }
        playback_cv_.notify_one();
        return future;
    }

    void stop_playback() {
        std::deque<PlaybackItem> dropped;
        bool was_playing = false;
        {
            std::lock_guard<std::mutex> lock(playback_mutex_);
            ++generation_;
            dropped.swap(queue_);
            was_playing = playing_;
            if (playback_resampler_) playback_resampler_->reset();
        }
        for (auto& item : dropped) {
            item.done.set_value();
        }
        if (was_playing || !dropped.empty()) {
            LOG_AUDIO("Playback stopped, discarded " + std::to_string(dropped.size()) + " queued buffers");
        }
    }

    VoidResult close(bool force) {
        std::unique_lock<std::mutex> lock(state_mutex_);
        if (state_ == PipelineState::Initializing) {
            if (!force) {
                return Error(ErrorType::InvalidState, "Cannot close audio pipeline while initialization is in progress");
            }
            state_cv_.wait(lock, [this] { return state_ != PipelineState::Initializing; });
        }
        if (state_ == PipelineState::Closing) {
            state_cv_.wait(lock, [this] { return state_ != PipelineState::Closing; });
            return VoidResult();
        }

        bool was_ready = state_ == PipelineState::Ready;
        state_ = PipelineState::Closing;
        lock.unlock();

        stop_capture();
        stop_playback();
        shutdown_output();
        if (was_ready) {
            release_input();
        }

        lock.lock();
        state_ = PipelineState::Uninitialized;
        init_result_ = VoidResult();
        state_cv_.notify_all();
        if (was_ready) {
            Logger::info("Audio pipeline closed");
        }
        return VoidResult();
    }

    bool is_initialized() const {
        std::lock_guard<std::mutex> lock(state_mutex_);
        return state_ == PipelineState::Ready;
    }

    bool is_capturing() const {
        std::lock_guard<std::mutex> lock(sink_mutex_);
        return capturing_;
    }

    bool is_playing() const {
        std::lock_guard<std::mutex> lock(playback_mutex_);
        return playing_ || !queue_.empty();
    }

    size_t playback_queue_size() const {
        std::lock_guard<std::mutex> lock(playback_mutex_);
        return queue_.size();
    }

    float input_level() const {
        return input_level_.load();
    }

private:
    VoidResult acquire_input() {
        auto on_input = [this](const float* samples, size_t count) {
            on_input_block(samples, count);
        };
        VoidResult opened = device_->open_input(options_.input_device, options_.input_sample_rate, on_input);
        if (!opened) {
            return opened;
        }

        std::string id = device_->input_device_id();
        if (!claim_device(id)) {
            device_->close_input();
            return Error(ErrorType::DeviceBusy, "Input device already claimed: " + id);
        }
        claimed_id_ = id;

        {
            std::lock_guard<std::mutex> lock(sink_mutex_);
            resampler_ = std::make_unique<LinearResampler>(device_->input_sample_rate(),
                                                           options_.target_sample_rate);
            blocker_.reset();
        }

        {
            std::lock_guard<std::mutex> lock(channel_mutex_);
            channel_.clear();
            audio_running_ = true;
        }
        audio_thread_ = std::thread(&Impl::audio_loop, this);

        LOG_AUDIO("Capture resampling " + std::to_string(device_->input_sample_rate()) + " -> " +
                  std::to_string(options_.target_sample_rate) + " Hz");
        return VoidResult();
    }

    void release_input() {
        {
            std::lock_guard<std::mutex> lock(channel_mutex_);
            audio_running_ = false;
        }
        channel_cv_.notify_all();
        if (audio_thread_.joinable()) {
            audio_thread_.join();
        }
        device_->close_input();
        if (!claimed_id_.empty()) {
            release_device(claimed_id_);
            claimed_id_.clear();
        }
        {
            std::lock_guard<std::mutex> lock(channel_mutex_);
            channel_.clear();
        }
        input_level_ = 0.0f;
    }

    // Host audio thread: copy out and return
    void on_input_block(const float* samples, size_t count) {
        if (!samples || count == 0) return;
        {
            std::lock_guard<std::mutex> lock(channel_mutex_);
            if (!audio_running_) return;
            if (channel_.size() >= options_.channel_capacity) {
                channel_.pop_front();
                ++dropped_blocks_;
            }
            channel_.emplace_back(samples, samples + count);
        }
        channel_cv_.notify_one();
    }

    void audio_loop() {
        const auto tick = std::chrono::milliseconds(std::max(1, options_.frame_ms));
        size_t reported_drops = 0;

        while (true) {
            std::deque<FloatBuffer> blocks;
            size_t drops = 0;
            {
                std::unique_lock<std::mutex> lock(channel_mutex_);
                channel_cv_.wait_for(lock, tick, [this] { return !audio_running_ || !channel_.empty(); });
                if (!audio_running_) break;
                blocks.swap(channel_);
                drops = dropped_blocks_;
            }

            if (drops != reported_drops) {
                Logger::warn("Audio input channel overflow, dropped " +
                             std::to_string(drops - reported_drops) + " blocks");
                reported_drops = drops;
            }

            for (const auto& block : blocks) {
                process_block(block);
            }
        }
    }

    void process_block(const FloatBuffer& block) {
        input_level_ = rms_level(block.data(), block.size());

        std::lock_guard<std::mutex> lock(sink_mutex_);
        if (!capturing_ || !sink_ || !resampler_) {
            return;
        }

        FloatBuffer resampled;
        resampler_->process(block.data(), block.size(), resampled);
        for (const auto& frame : blocker_.push(float_to_pcm16(resampled))) {
            sink_(frame);
        }
    }

    VoidResult ensure_output() {
        std::lock_guard<std::mutex> lock(output_mutex_);
        if (output_open_) {
            return VoidResult();
        }

        int preferred = options_.output_sample_rate > 0 ? options_.output_sample_rate
                                                        : options_.target_sample_rate;
        VoidResult opened = device_->open_output(options_.output_device, preferred);
        if (!opened) {
            return opened;
        }
        output_rate_ = device_->output_sample_rate();

        {
            std::lock_guard<std::mutex> plock(playback_mutex_);
            playback_resampler_ = std::make_unique<LinearResampler>(options_.target_sample_rate, output_rate_);
        }
        if (output_rate_ != options_.target_sample_rate) {
            LOG_AUDIO("Playback resampling " + std::to_string(options_.target_sample_rate) + " -> " +
                      std::to_string(output_rate_) + " Hz");
        }

        playback_running_ = true;
        playback_thread_ = std::thread(&Impl::playback_loop, this);
        output_open_ = true;
        return VoidResult();
    }

    void shutdown_output() {
        std::lock_guard<std::mutex> lock(output_mutex_);
        if (!output_open_) {
            return;
        }
        {
            std::lock_guard<std::mutex> plock(playback_mutex_);
            playback_running_ = false;
            ++generation_;
        }
        playback_cv_.notify_all();
        if (playback_thread_.joinable()) {
            playback_thread_.join();
        }

        std::deque<PlaybackItem> leftover;
        {
            std::lock_guard<std::mutex> plock(playback_mutex_);
            leftover.swap(queue_);
            playback_resampler_.reset();
        }
        for (auto& item : leftover) {
            item.done.set_value();
        }

        device_->close_output();
        output_open_ = false;
        output_rate_ = 0;
    }

    // Caller holds playback_mutex_
    AudioBuffer convert_for_output(const AudioBuffer& samples) {
        if (!playback_resampler_ || playback_resampler_->is_passthrough()) {
            return samples;
        }
        FloatBuffer in = pcm16_to_float(samples);
        FloatBuffer out;
        playback_resampler_->process(in.data(), in.size(), out);
        return float_to_pcm16(out);
    }

    void playback_loop() {
        while (true) {
            PlaybackItem item;
            uint64_t generation = 0;
            {
                std::unique_lock<std::mutex> lock(playback_mutex_);
                playback_cv_.wait(lock, [this] { return !playback_running_ || !queue_.empty(); });
                if (!playback_running_) break;
                item = std::move(queue_.front());
                queue_.pop_front();
                playing_ = true;
                generation = generation_;
            }

            const size_t chunk = static_cast<size_t>(std::max(1, output_rate_ * options_.frame_ms / 1000));
            bool interrupted = false;
            for (size_t offset = 0; offset < item.samples.size(); offset += chunk) {
                if (generation_.load() != generation || !playback_running_) {
                    interrupted = true;
                    break;
                }
                size_t n = std::min(chunk, item.samples.size() - offset);
                VoidResult written = device_->write_output(item.samples.data() + offset, n);
                if (!written) {
                    Logger::warn("Playback write failed: " + written.error().message);
                    break;
                }
            }
            if (interrupted) {
                device_->abort_output();
            }

            item.done.set_value();
            {
                std::lock_guard<std::mutex> lock(playback_mutex_);
                playing_ = false;
            }
        }
    }

    std::shared_ptr<IAudioDevice> device_;
    CaptureOptions options_;

    // Lifecycle
    mutable std::mutex state_mutex_;
    std::condition_variable state_cv_;
    PipelineState state_;
    VoidResult init_result_;
    std::string claimed_id_;

    // Capture (audio task side)
    mutable std::mutex sink_mutex_;
    FrameSink sink_;
    bool capturing_;
    std::unique_ptr<LinearResampler> resampler_;
    FrameBlocker blocker_;

    // Host callback -> audio task channel
    std::mutex channel_mutex_;
    std::condition_variable channel_cv_;
    std::deque<FloatBuffer> channel_;
    bool audio_running_;
    size_t dropped_blocks_;
    std::thread audio_thread_;
    std::atomic<float> input_level_;

    // Playback
    std::mutex output_mutex_;
    bool output_open_;
    int output_rate_;
    mutable std::mutex playback_mutex_;
    std::condition_variable playback_cv_;
    std::deque<PlaybackItem> queue_;
    std::unique_ptr<LinearResampler> playback_resampler_;
    std::atomic<bool> playback_running_;
    bool playing_;
    std::atomic<uint64_t> generation_;
    std::thread playback_thread_;
};

CapturePipeline::CapturePipeline(std::shared_ptr<IAudioDevice> device, const CaptureOptions& options)
    : pimpl_(std::make_unique<Impl>(std::move(device), options)) {}

CapturePipeline::~CapturePipeline() = default;

VoidResult CapturePipeline::initialize() {
    return pimpl_->initialize();
}

VoidResult CapturePipeline::start_capture(FrameSink sink) {
    return pimpl_->start_capture(std::move(sink));
}

void CapturePipeline::stop_capture() {
    pimpl_->stop_capture();
}

std::future<void> CapturePipeline::play_audio_data(const AudioBuffer& samples) {
    return pimpl_->play_audio_data(samples);
}

void CapturePipeline::stop_playback() {
    pimpl_->stop_playback();
}

VoidResult CapturePipeline::close(bool force) {
    return pimpl_->close(force);
}

bool CapturePipeline::is_initialized() const {
    return pimpl_->is_initialized();
}

bool CapturePipeline::is_capturing() const {
    return pimpl_->is_capturing();
}

bool CapturePipeline::is_playing() const {
    return pimpl_->is_playing();
}

size_t CapturePipeline::playback_queue_size() const {
    return pimpl_->playback_queue_size();
}

float CapturePipeline::input_level() const {
    return pimpl_->input_level();
}

std::string capture_error_message(const Error& error) {
    switch (error.type) {
        case ErrorType::PermissionDenied:
            return "Microphone permission denied. Please allow microphone access.";
        case ErrorType::DeviceUnavailable:
            return "No microphone found. Please connect a microphone.";
        case ErrorType::DeviceBusy:
            return "Microphone is already in use by another application.";
        case ErrorType::UnsupportedConstraints:
            return "Microphone does not support the required audio constraints.";
        default:
            return error.message.empty() ? "Unable to access microphone" : error.message;
    }
}

} // namespace audio
} // namespace rtvoice
