#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

// One contiguous block of captured PCM with its window amplitude.
struct AudioBlock {
    std::vector<int16_t> samples;
    float rms = 0.0f;
};

// Finished recording. Moved out of AudioCapture on stop and never mutated
// after that.
struct AudioBuffer {
    uint32_t sample_rate = 16000;
    uint16_t channels = 1;
    std::vector<AudioBlock> blocks;

    size_t sample_count() const {
        size_t n = 0;
        for (auto& b : blocks) n += b.samples.size();
        return n;
    }

    size_t frame_count() const { return channels ? sample_count() / channels : 0; }

    double duration_s() const {
        if (sample_rate == 0) return 0.0;
        return static_cast<double>(frame_count()) / sample_rate;
    }

    bool empty() const { return sample_count() == 0; }

    std::vector<int16_t> flatten() const {
        std::vector<int16_t> out;
        out.reserve(sample_count());
        for (auto& b : blocks) out.insert(out.end(), b.samples.begin(), b.samples.end());
        return out;
    }
};

namespace level {

// Gain applied so that speech from a distant microphone is still visible.
constexpr float kDisplayGain = 12.0f;

inline float rms(std::span<const int16_t> samples) {
    if (samples.empty()) return 0.0f;
    double sum = 0.0;
    for (int16_t s : samples) {
        double v = s;
        sum += v * v;
    }
    return static_cast<float>(std::sqrt(sum / static_cast<double>(samples.size())));
}

// RMS normalised to 0.0-1.0 for waveform display.
inline float normalized(float raw_rms) {
    return std::min(1.0f, raw_rms / 32768.0f * kDisplayGain);
}

} // namespace level
