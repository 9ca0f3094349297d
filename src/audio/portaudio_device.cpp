#include "audio/portaudio_device.h"
#include "logger.h"
#include "utils.h"
#include <portaudio.h>
#include <cerrno>
#include <cstdlib>
#include <sstream>

namespace rtvoice {
namespace audio {

namespace {

bool is_permission_host_error() {
    const PaHostErrorInfo* info = Pa_GetLastHostErrorInfo();
    if (!info) return false;
    long code = std::labs(info->errorCode);
    return code == EACCES || code == EPERM;
}

/// Map a PortAudio error onto the capture taxonomy
Error map_pa_error(PaError err, const std::string& context) {
    std::string text = context + ": " + Pa_GetErrorText(err);
    switch (err) {
        case paInvalidDevice:
            return Error(ErrorType::DeviceUnavailable, text);
        case paDeviceUnavailable:
            return Error(ErrorType::DeviceBusy, text);
        case paInvalidSampleRate:
        case paInvalidChannelCount:
        case paSampleFormatNotSupported:
        case paBadIODeviceCombination:
            return Error(ErrorType::UnsupportedConstraints, text);
        case paUnanticipatedHostError:
            if (is_permission_host_error()) {
                return Error(ErrorType::PermissionDenied, text);
            }
            return Error(ErrorType::DeviceBusy, text);
        default:
            return Error(ErrorType::IOError, text);
    }
}

} // namespace

class PortAudioDevice::Impl {
public:
    Impl() : initialized_(false), input_stream_(nullptr), output_stream_(nullptr),
             input_rate_(0), output_rate_(0), input_idx_(paNoDevice) {
        PaError err = Pa_Initialize();
        if (err != paNoError) {
            Logger::error("PortAudio init error: " + std::string(Pa_GetErrorText(err)));
            return;
        }
        initialized_ = true;
    }

    ~Impl() {
        close_input();
        close_output();
        if (initialized_) {
            Pa_Terminate();
        }
    }

    VoidResult open_input(const std::string& device, int sample_rate, InputCallback callback) {
        if (!initialized_) {
            return Error(ErrorType::DeviceUnavailable, "Audio subsystem unavailable");
        }
        if (input_stream_) {
            return Error(ErrorType::DeviceBusy, "Input stream already open");
        }

        int idx = find_device(device, true);
        if (idx < 0) {
            return Error(ErrorType::DeviceUnavailable,
                         device.empty() ? "No input device found" : "Input device not found: " + device);
        }
        const PaDeviceInfo* info = Pa_GetDeviceInfo(idx);
        if (!info || info->maxInputChannels < 1) {
            return Error(ErrorType::DeviceUnavailable, "Device has no input channels: " + device);
        }

        double rate = sample_rate > 0 ? sample_rate : info->defaultSampleRate;

        PaStreamParameters params;
        params.device = idx;
        params.channelCount = 1;
        params.sampleFormat = paFloat32;
        params.suggestedLatency = info->defaultLowInputLatency;
        params.hostApiSpecificStreamInfo = nullptr;

        PaError err = Pa_IsFormatSupported(&params, nullptr, rate);
        if (err != paFormatIsSupported) {
            return map_pa_error(err, "Input format not supported");
        }

        callback_ = std::move(callback);
        err = Pa_OpenStream(&input_stream_, &params, nullptr, rate,
                            paFramesPerBufferUnspecified, paClipOff, input_callback, this);
        if (err != paNoError) {
            input_stream_ = nullptr;
            callback_ = nullptr;
            return map_pa_error(err, "Failed to open input stream");
        }

        err = Pa_StartStream(input_stream_);
        if (err != paNoError) {
            Error mapped = map_pa_error(err, "Failed to start input stream");
            Pa_CloseStream(input_stream_);
            input_stream_ = nullptr;
            callback_ = nullptr;
            return mapped;
        }

        input_rate_ = static_cast<int>(rate);
        input_idx_ = idx;
        std::ostringstream oss;
        oss << "Input device: [" << idx << "] " << info->name << " @ " << input_rate_ << " Hz";
        LOG_AUDIO(oss.str());
        return VoidResult();
    }

    std::string input_device_id() const {
        if (input_idx_ == paNoDevice) return "";
        const PaDeviceInfo* info = Pa_GetDeviceInfo(input_idx_);
        return std::to_string(input_idx_) + ":" + (info ? info->name : "");
    }

    int input_sample_rate() const { return input_rate_; }

    void close_input() {
        if (input_stream_) {
            Pa_StopStream(input_stream_);
            Pa_CloseStream(input_stream_);
            input_stream_ = nullptr;
        }
        callback_ = nullptr;
        input_rate_ = 0;
        input_idx_ = paNoDevice;
    }

    VoidResult open_output(const std::string& device, int preferred_rate) {
        if (!initialized_) {
            return Error(ErrorType::DeviceUnavailable, "Audio subsystem unavailable");
        }
        if (output_stream_) {
            return VoidResult();
        }

        int idx = find_device(device, false);
        if (idx < 0) {
            return Error(ErrorType::DeviceUnavailable,
                         device.empty() ? "No output device found" : "Output device not found: " + device);
        }
        const PaDeviceInfo* info = Pa_GetDeviceInfo(idx);

        PaStreamParameters params;
        params.device = idx;
        params.channelCount = 1;
        params.sampleFormat = paInt16;
        params.suggestedLatency = info->defaultLowOutputLatency;
        params.hostApiSpecificStreamInfo = nullptr;

        // Prefer the requested rate; fall back to the device default and resample upstream of it
        double rate = preferred_rate > 0 ? preferred_rate : info->defaultSampleRate;
        if (Pa_IsFormatSupported(nullptr, &params, rate) != paFormatIsSupported) {
            Logger::warn("Output device does not support " + std::to_string(static_cast<int>(rate)) +
                         " Hz, using device default");
            rate = info->defaultSampleRate;
        }

        PaError err = Pa_OpenStream(&output_stream_, nullptr, &params, rate,
                                    paFramesPerBufferUnspecified, paClipOff, nullptr, nullptr);
        if (err != paNoError) {
            output_stream_ = nullptr;
            return map_pa_error(err, "Failed to open output stream");
        }
        err = Pa_StartStream(output_stream_);
        if (err != paNoError) {
            Error mapped = map_pa_error(err, "Failed to start output stream");
            Pa_CloseStream(output_stream_);
            output_stream_ = nullptr;
            return mapped;
        }

        output_rate_ = static_cast<int>(rate);
        std::ostringstream oss;
        oss << "Output device: [" << idx << "] " << info->name << " @ " << output_rate_ << " Hz";
        LOG_AUDIO(oss.str());
        return VoidResult();
    }

    int output_sample_rate() const { return output_rate_; }

    VoidResult write_output(const Sample* samples, size_t count) {
        if (!output_stream_) {
            return Error(ErrorType::NotInitialized, "Output stream not open");
        }
        if (Pa_IsStreamStopped(output_stream_) == 1) {
            PaError err = Pa_StartStream(output_stream_);
            if (err != paNoError) {
                return map_pa_error(err, "Failed to restart output stream");
            }
        }
        PaError err = Pa_WriteStream(output_stream_, samples, static_cast<unsigned long>(count));
        if (err != paNoError && err != paOutputUnderflowed) {
            return map_pa_error(err, "Output write failed");
        }
        return VoidResult();
    }

    void abort_output() {
        if (output_stream_ && Pa_IsStreamActive(output_stream_) == 1) {
            Pa_AbortStream(output_stream_);
        }
    }

    void close_output() {
        if (output_stream_) {
            Pa_AbortStream(output_stream_);
            Pa_CloseStream(output_stream_);
            output_stream_ = nullptr;
        }
        output_rate_ = 0;
    }

    std::vector<DeviceInfo> list_devices() {
        std::vector<DeviceInfo> devices;
        if (!initialized_) return devices;
        int num_devices = Pa_GetDeviceCount();
        for (int i = 0; i < num_devices; i++) {
            const PaDeviceInfo* info = Pa_GetDeviceInfo(i);
            if (!info) continue;
            DeviceInfo d;
            d.index = i;
            d.name = info->name;
            d.max_input_channels = info->maxInputChannels;
            d.max_output_channels = info->maxOutputChannels;
            d.default_sample_rate = info->defaultSampleRate;
            devices.push_back(d);
        }
        return devices;
    }

    static int input_callback(const void* input, void* /*output*/, unsigned long frame_count,
                              const PaStreamCallbackTimeInfo* /*time_info*/,
                              PaStreamCallbackFlags /*status_flags*/, void* user_data) {
        auto* impl = static_cast<Impl*>(user_data);
        if (input && impl && impl->callback_) {
            impl->callback_(static_cast<const float*>(input), static_cast<size_t>(frame_count));
        }
        return paContinue;
    }

private:
    int find_device(const std::string& name, bool is_input) {
        if (name.empty() || name == "default") {
            int default_idx = is_input ? Pa_GetDefaultInputDevice() : Pa_GetDefaultOutputDevice();
            return default_idx == paNoDevice ? -1 : default_idx;
        }

        int num_devices = Pa_GetDeviceCount();

        // Numeric device index
        char* end = nullptr;
        long parsed = std::strtol(name.c_str(), &end, 10);
        if (end && *end == '\0' && parsed >= 0 && parsed < num_devices) {
            return static_cast<int>(parsed);
        }

        // Case-insensitive name substring
        std::string wanted = utils::to_lower_copy(name);
        for (int i = 0; i < num_devices; i++) {
            const PaDeviceInfo* info = Pa_GetDeviceInfo(i);
            if (!info) continue;
            int channels = is_input ? info->maxInputChannels : info->maxOutputChannels;
            if (channels < 1) continue;
            if (utils::to_lower_copy(info->name).find(wanted) != std::string::npos) {
                return i;
            }
        }
        return -1;
    }

    bool initialized_;
    PaStream* input_stream_;
    PaStream* output_stream_;
    int input_rate_;
    int output_rate_;
    PaDeviceIndex input_idx_;
    InputCallback callback_;
};

PortAudioDevice::PortAudioDevice() : pimpl_(std::make_unique<Impl>()) {}

PortAudioDevice::~PortAudioDevice() = default;

VoidResult PortAudioDevice::open_input(const std::string& device, int sample_rate,
                                       InputCallback callback) {
    return pimpl_->open_input(device, sample_rate, std::move(callback));
}

std::string PortAudioDevice::input_device_id() const {
    return pimpl_->input_device_id();
}

int PortAudioDevice::input_sample_rate() const {
    return pimpl_->input_sample_rate();
}

void PortAudioDevice::close_input() {
    pimpl_->close_input();
}

VoidResult PortAudioDevice::open_output(const std::string& device, int preferred_rate) {
    return pimpl_->open_output(device, preferred_rate);
}

int PortAudioDevice::output_sample_rate() const {
    return pimpl_->output_sample_rate();
}

VoidResult PortAudioDevice::write_output(const Sample* samples, size_t count) {
    return pimpl_->write_output(samples, count);
}

void PortAudioDevice::abort_output() {
    pimpl_->abort_output();
}

void PortAudioDevice::close_output() {
    pimpl_->close_output();
}

std::vector<DeviceInfo> PortAudioDevice::list_devices() {
    return pimpl_->list_devices();
}

void PortAudioDevice::print_devices() {
    PortAudioDevice device;
    auto devices = device.list_devices();
    Logger::info("Available audio devices:");
    for (const auto& d : devices) {
        std::ostringstream oss;
        oss << "  [" << d.index << "] " << d.name;
        if (d.max_input_channels > 0) oss << " (IN:" << d.max_input_channels << ")";
        if (d.max_output_channels > 0) oss << " (OUT:" << d.max_output_channels << ")";
        if (d.max_input_channels == 0 && d.max_output_channels == 0) oss << " (no I/O)";
        oss << " " << static_cast<int>(d.default_sample_rate) << " Hz";
        Logger::info(oss.str());
    }
}

} // namespace audio
} // namespace rtvoice
