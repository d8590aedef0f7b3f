#pragma once

#include "audio/audio_input_device.hpp"
#include <atomic>
#include <memory>
#include <thread>
#include <vector>

namespace audio {

/**
 * @brief Synthetic audio device that reads a WAV file and simulates microphone input
 *
 * - Decodes the whole file up front (mono, native sample rate)
 * - Delivers ~20ms chunks from a worker thread, paced in real time unless
 *   synthetic_realtime is false
 * - Reports a fatal error at end of file unless looping
 * - Used for headless enrollment and tests
 */
class AudioInputDevice_Synthetic : public IAudioInputDevice {
public:
    AudioInputDevice_Synthetic();
    ~AudioInputDevice_Synthetic() override;

    bool initialize(
        const AudioInputConfig& config,
        AudioCallback audio_callback,
        ErrorCallback error_callback
    ) override;

    bool start() override;
    void stop() override;
    bool is_capturing() const override { return is_capturing_.load(); }
    AudioDeviceInfo get_device_info() const override;
    AudioInputConfig get_actual_config() const override { return actual_config_; }

private:
    void capture_thread_func();

    AudioInputConfig config_;
    AudioInputConfig actual_config_;
    AudioCallback audio_callback_;
    ErrorCallback error_callback_;

    std::vector<float> samples_;
    int sample_rate_ = 0;
    size_t cursor_ = 0;

    std::unique_ptr<std::thread> capture_thread_;
    std::atomic<bool> is_capturing_{false};
    std::atomic<bool> should_stop_{false};
};

} // namespace audio
