#pragma once

/**
 * @file audio_device.h
 * @brief Audio device interface
 *
 * Abstracts the host audio API so the capture pipeline can run against
 * PortAudio in production and an in-process fake in tests.
 */

#include "common.h"
#include "errors.h"
#include <functional>
#include <string>
#include <vector>

namespace rtvoice {
namespace audio {

/**
 * @brief Host device description
 */
struct DeviceInfo {
    int index = -1;
    std::string name;
    int max_input_channels = 0;
    int max_output_channels = 0;
    double default_sample_rate = 0.0;
};

/**
 * @brief Called from the host audio thread with one block of mono float samples
 *
 * Must not block: implementations only copy the block out.
 */
using InputCallback = std::function<void(const float* samples, size_t count)>;

/**
 * @brief Abstract audio device
 *
 * One input stream (callback driven) and one output stream (blocking writes).
 * Errors are reported with the capture taxonomy: DeviceUnavailable,
 * PermissionDenied, DeviceBusy, UnsupportedConstraints.
 */
class IAudioDevice {
public:
    virtual ~IAudioDevice() = default;

    /**
     * @brief Open and start the input stream
     * @param device Device name substring or numeric index; empty = default
     * @param sample_rate Requested rate (0 = device default)
     * @param callback Receives mono float blocks
     */
    virtual VoidResult open_input(const std::string& device, int sample_rate,
                                  InputCallback callback) = 0;

    /**
     * @brief Stable identifier of the opened input device (for exclusive claims)
     */
    virtual std::string input_device_id() const = 0;

    virtual int input_sample_rate() const = 0;

    virtual void close_input() = 0;

    /**
     * @brief Open the output stream
     * @param preferred_rate Try this rate first, then the device default
     */
    virtual VoidResult open_output(const std::string& device, int preferred_rate) = 0;

    virtual int output_sample_rate() const = 0;

    /**
     * @brief Blocking write of mono PCM16 samples
     */
    virtual VoidResult write_output(const Sample* samples, size_t count) = 0;

    /**
     * @brief Drop whatever the host is still holding for output
     */
    virtual void abort_output() = 0;

    virtual void close_output() = 0;

    virtual std::vector<DeviceInfo> list_devices() = 0;
};

} // namespace audio
} // namespace rtvoice
