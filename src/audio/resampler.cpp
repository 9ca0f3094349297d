#include "audio/resampler.h"
#include <algorithm>
#include <cmath>

namespace rtvoice {
namespace audio {

LinearResampler::LinearResampler(int source_rate, int target_rate)
    : source_rate_(source_rate > 0 ? source_rate : target_rate),
      target_rate_(target_rate),
      ratio_(static_cast<double>(source_rate_) / static_cast<double>(target_rate)),
      phase_(0.0),
      last_sample_(0.0f) {
    reset();
}

void LinearResampler::reset() {
    // First output of a fresh stream lands exactly on source sample 0
    phase_ = ratio_ - 1.0;
    last_sample_ = 0.0f;
}

size_t LinearResampler::process(const float* input, size_t count, FloatBuffer& out) {
    if (count == 0 || input == nullptr) {
        return 0;
    }

    if (is_passthrough()) {
        out.insert(out.end(), input, input + count);
        last_sample_ = input[count - 1];
        return count;
    }

    const double length = static_cast<double>(count);
    // Tolerance keeps an exact boundary from flipping between chunked and contiguous input
    const size_t produced = static_cast<size_t>(std::floor((length + phase_) / ratio_ + 1e-9));
    const double offset = ratio_ - 1.0 - phase_;

    out.reserve(out.size() + produced);
    for (size_t i = 0; i < produced; ++i) {
        double t = static_cast<double>(i) * ratio_ + offset;
        double base = std::floor(t);
        long idx = static_cast<long>(base);
        double frac = t - base;

        float a = idx < 0 ? last_sample_ : input[std::min<size_t>(static_cast<size_t>(idx), count - 1)];
        if (frac == 0.0) {
            out.push_back(a);
            continue;
        }
        size_t next = static_cast<size_t>(idx + 1);
        float b = input[std::min(next, count - 1)];
        out.push_back(static_cast<float>(a + (b - a) * frac));
    }

    phase_ = (length + phase_) - static_cast<double>(produced) * ratio_;
    last_sample_ = input[count - 1];
    return produced;
}

FloatBuffer LinearResampler::process(const FloatBuffer& input) {
    FloatBuffer out;
    process(input.data(), input.size(), out);
    return out;
}

FrameBlocker::FrameBlocker(size_t frame_size)
    : frame_size_(frame_size > 0 ? frame_size : 1) {
    pending_.reserve(frame_size_ * 2);
}

std::vector<AudioFrame> FrameBlocker::push(const AudioFrame& samples) {
    std::vector<AudioFrame> frames;
    pending_.insert(pending_.end(), samples.begin(), samples.end());

    size_t offset = 0;
    while (pending_.size() - offset >= frame_size_) {
        frames.emplace_back(pending_.begin() + offset, pending_.begin() + offset + frame_size_);
        offset += frame_size_;
    }
    if (offset > 0) {
        pending_.erase(pending_.begin(), pending_.begin() + offset);
    }
    return frames;
}

Sample float_to_pcm16(float value) {
    if (std::isnan(value)) {
        return 0;
    }
    float s = std::max(-1.0f, std::min(1.0f, value));
    double scaled = s < 0.0f ? static_cast<double>(s) * 32768.0 : static_cast<double>(s) * 32767.0;
    return static_cast<Sample>(std::lround(scaled));
}

AudioFrame float_to_pcm16(const FloatBuffer& samples) {
    AudioFrame out;
    out.reserve(samples.size());
    for (float s : samples) {
        out.push_back(float_to_pcm16(s));
    }
    return out;
}

float pcm16_to_float(Sample value) {
    return value < 0 ? static_cast<float>(value) / 32768.0f : static_cast<float>(value) / 32767.0f;
}

FloatBuffer pcm16_to_float(const AudioBuffer& samples) {
    FloatBuffer out;
    out.reserve(samples.size());
    for (Sample s : samples) {
        out.push_back(pcm16_to_float(s));
    }
    return out;
}

float rms_level(const float* samples, size_t count) {
    if (samples == nullptr || count == 0) {
        return 0.0f;
    }
    double sum = 0.0;
    for (size_t i = 0; i < count; ++i) {
        sum += static_cast<double>(samples[i]) * samples[i];
    }
    return static_cast<float>(std::sqrt(sum / static_cast<double>(count)));
}

} // namespace audio
} // namespace rtvoice
