#pragma once

#include "audio/audio_input_device.hpp"
#include <atomic>

typedef void PaStream;
struct PaStreamCallbackTimeInfo;

namespace audio {

/**
 * @brief Microphone input through PortAudio (ALSA / PulseAudio / CoreAudio / WASAPI)
 *
 * Samples are requested as paFloat32 and delivered on PortAudio's callback
 * thread. If the device rejects the requested rate, the stream is opened at
 * the device's default rate and get_actual_config() reports it.
 */
class AudioInputDevice_PortAudio : public IAudioInputDevice {
public:
    AudioInputDevice_PortAudio();
    ~AudioInputDevice_PortAudio() override;

    AudioInputDevice_PortAudio(const AudioInputDevice_PortAudio&) = delete;
    AudioInputDevice_PortAudio& operator=(const AudioInputDevice_PortAudio&) = delete;

    bool initialize(
        const AudioInputConfig& config,
        AudioCallback audio_callback,
        ErrorCallback error_callback
    ) override;

    bool start() override;
    void stop() override;
    bool is_capturing() const override { return is_capturing_.load(); }
    AudioDeviceInfo get_device_info() const override { return device_info_; }
    AudioInputConfig get_actual_config() const override { return actual_config_; }

    static std::vector<AudioDeviceInfo> enumerate_portaudio_devices();

private:
    static int stream_callback(const void* input, void* output, unsigned long frame_count,
                               const PaStreamCallbackTimeInfo* time_info, unsigned long status_flags,
                               void* user_data);
    void report_error(const std::string& message, bool is_fatal);
    void close_stream();

    AudioInputConfig config_;
    AudioInputConfig actual_config_;
    AudioCallback audio_callback_;
    ErrorCallback error_callback_;
    AudioDeviceInfo device_info_;

    PaStream* stream_ = nullptr;
    bool pa_initialized_ = false;
    std::atomic<bool> is_capturing_{false};
};

} // namespace audio
