#pragma once

#include "audio/audio_device.h"
#include <memory>

namespace rtvoice {
namespace audio {

/**
 * @brief PortAudio implementation of IAudioDevice
 *
 * Input is opened as float32 mono with a callback; output as int16 mono with
 * blocking Pa_WriteStream. Pa_Initialize/Pa_Terminate are reference counted by
 * PortAudio itself, so several instances may coexist.
 */
class PortAudioDevice : public IAudioDevice {
public:
    PortAudioDevice();
    ~PortAudioDevice() override;

    PortAudioDevice(const PortAudioDevice&) = delete;
    PortAudioDevice& operator=(const PortAudioDevice&) = delete;

    VoidResult open_input(const std::string& device, int sample_rate,
                          InputCallback callback) override;
    std::string input_device_id() const override;
    int input_sample_rate() const override;
    void close_input() override;

    VoidResult open_output(const std::string& device, int preferred_rate) override;
    int output_sample_rate() const override;
    VoidResult write_output(const Sample* samples, size_t count) override;
    void abort_output() override;
    void close_output() override;

    std::vector<DeviceInfo> list_devices() override;

    /**
     * @brief Print all devices through the logger
     */
    static void print_devices();

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace audio
} // namespace rtvoice
