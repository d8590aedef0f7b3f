#pragma once

#include "audio/audio_buffer.hpp"
#include <string>

namespace audio {

/**
 * @brief What to capture: rate, length and channel layout of one utterance
 */
struct RecordingSpec {
    int sample_rate = 16000;
    double duration_s = 3.0;
    int channels = 1;

    size_t sample_count() const;
};

/**
 * @brief Captures one fixed-length utterance
 *
 * Returns exactly spec.sample_count() samples or throws
 * speaker::VoiceprintError(DeviceError).
 */
class ISampleRecorder {
public:
    virtual ~ISampleRecorder() = default;
    virtual AudioBuffer record(const RecordingSpec& spec) = 0;
};

/**
 * @brief Recorder on top of an IAudioInputDevice
 *
 * Opens the device for the duration of one capture only, collects callback
 * samples until the requested length is reached, downmixes to mono and
 * resamples to the requested rate when the device runs at another one.
 */
class SampleRecorder : public ISampleRecorder {
public:
    struct Config {
        std::string device_id;          // see AudioInputFactory::create_device
        int grace_ms = 2000;            // extra wait beyond the capture duration
        bool synthetic_realtime = true;
        bool verbose = false;
    };

    explicit SampleRecorder(const Config& config);

    AudioBuffer record(const RecordingSpec& spec) override;

private:
    Config config_;
};

// Linear-interpolation resampler for mono float audio.
std::vector<float> resample_linear(const std::vector<float>& in, int in_hz, int out_hz);

} // namespace audio
