#pragma once

#include <cstddef>
#include <vector>

namespace audio {

/**
 * @brief Mono floating-point capture, samples in [-1, 1]
 */
struct AudioBuffer {
    std::vector<float> samples;
    int sample_rate = 16000;
    int channels = 1;

    size_t frame_count() const { return channels > 0 ? samples.size() / channels : 0; }
    double duration_seconds() const {
        return sample_rate > 0 ? static_cast<double>(frame_count()) / sample_rate : 0.0;
    }
};

} // namespace audio
