#pragma once

/**
 * @file resampler.h
 * @brief Streaming linear-interpolation resampler and PCM16 conversion
 *
 * The resampler carries its fractional read position and the last source
 * sample across calls, so feeding a signal in arbitrary chunks produces the
 * same output as feeding it in one block.
 */

#include "common.h"
#include <vector>

namespace rtvoice {
namespace audio {

/**
 * @brief Linear resampler from source_rate to target_rate (mono float)
 *
 * For a block of L samples and ratio r = source/target the block yields
 * floor((L + phase) / r) output samples. Output i of the block sits at source
 * position i*r + (r - 1 - phase), which is never earlier than the carried
 * sample at index -1 and never needs a sample beyond the end of the block.
 */
class LinearResampler {
public:
    LinearResampler(int source_rate, int target_rate);

    /**
     * @brief Resample one block, appending to out
     * @return Number of samples appended
     */
    size_t process(const float* input, size_t count, FloatBuffer& out);

    FloatBuffer process(const FloatBuffer& input);

    /**
     * @brief Forget carried state (next block starts at source position 0)
     */
    void reset();

    double ratio() const { return ratio_; }
    int source_rate() const { return source_rate_; }
    int target_rate() const { return target_rate_; }
    bool is_passthrough() const { return source_rate_ == target_rate_; }

private:
    int source_rate_;
    int target_rate_;
    double ratio_;
    double phase_;
    float last_sample_;
};

/**
 * @brief Collects samples into fixed-size frames
 *
 * Leftover samples stay pending until the next push; reset() discards them.
 */
class FrameBlocker {
public:
    explicit FrameBlocker(size_t frame_size);

    /**
     * @brief Append samples and return every completed frame, in order
     */
    std::vector<AudioFrame> push(const AudioFrame& samples);

    size_t pending() const { return pending_.size(); }
    size_t frame_size() const { return frame_size_; }
    void reset() { pending_.clear(); }

private:
    size_t frame_size_;
    AudioFrame pending_;
};

/**
 * @brief Clamp to [-1, 1] and quantize (negative * 32768, positive * 32767)
 */
Sample float_to_pcm16(float value);
AudioFrame float_to_pcm16(const FloatBuffer& samples);

/**
 * @brief Inverse of float_to_pcm16 (negative / 32768, positive / 32767)
 */
float pcm16_to_float(Sample value);
FloatBuffer pcm16_to_float(const AudioBuffer& samples);

/**
 * @brief Root-mean-square of a float block (0 for an empty block)
 */
float rms_level(const float* samples, size_t count);

} // namespace audio
} // namespace rtvoice
