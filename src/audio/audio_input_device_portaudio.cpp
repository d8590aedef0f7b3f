#include "audio/audio_input_device_portaudio.hpp"
#include <portaudio.h>
#include <algorithm>
#include <string>

namespace audio {

namespace {

// Pa_Initialize / Pa_Terminate are reference counted by PortAudio
class PortAudioSession {
public:
    PortAudioSession() : err_(Pa_Initialize()) {}
    ~PortAudioSession() { if (err_ == paNoError) Pa_Terminate(); }
    bool ok() const { return err_ == paNoError; }
    const char* error_text() const { return Pa_GetErrorText(err_); }
private:
    PaError err_;
};

AudioDeviceInfo describe(PaDeviceIndex index, PaDeviceIndex default_index) {
    const PaDeviceInfo* info = Pa_GetDeviceInfo(index);
    AudioDeviceInfo dev;
    dev.id = "portaudio:" + std::to_string(index);
    if (info) {
        dev.name = info->name ? info->name : "";
        const PaHostApiInfo* host = Pa_GetHostApiInfo(info->hostApi);
        dev.driver = (host && host->name) ? host->name : "PortAudio";
        dev.default_sample_rate = static_cast<int>(info->defaultSampleRate);
        dev.max_channels = info->maxInputChannels;
    }
    dev.is_default = (index == default_index);
    return dev;
}

} // namespace

AudioInputDevice_PortAudio::AudioInputDevice_PortAudio() = default;

AudioInputDevice_PortAudio::~AudioInputDevice_PortAudio() {
    stop();
    close_stream();
    if (pa_initialized_) {
        Pa_Terminate();
    }
}

std::vector<AudioDeviceInfo> AudioInputDevice_PortAudio::enumerate_portaudio_devices() {
    std::vector<AudioDeviceInfo> devices;
    PortAudioSession session;
    if (!session.ok()) {
        return devices;
    }

    const PaDeviceIndex default_index = Pa_GetDefaultInputDevice();
    const PaDeviceIndex count = Pa_GetDeviceCount();
    for (PaDeviceIndex i = 0; i < count; ++i) {
        const PaDeviceInfo* info = Pa_GetDeviceInfo(i);
        if (info && info->maxInputChannels > 0) {
            devices.push_back(describe(i, default_index));
        }
    }
    return devices;
}

void AudioInputDevice_PortAudio::report_error(const std::string& message, bool is_fatal) {
    if (error_callback_) {
        error_callback_(message, is_fatal);
    }
}

bool AudioInputDevice_PortAudio::initialize(
    const AudioInputConfig& config,
    AudioCallback audio_callback,
    ErrorCallback error_callback
) {
    config_ = config;
    actual_config_ = config;
    audio_callback_ = audio_callback;
    error_callback_ = error_callback;

    if (!pa_initialized_) {
        PaError err = Pa_Initialize();
        if (err != paNoError) {
            report_error(std::string("PortAudio initialization failed: ") + Pa_GetErrorText(err), true);
            return false;
        }
        pa_initialized_ = true;
    }

    PaDeviceIndex index = paNoDevice;
    if (config.device_id.empty() || config.device_id == "default") {
        index = Pa_GetDefaultInputDevice();
    } else if (config.device_id.compare(0, 10, "portaudio:") == 0) {
        try {
            index = static_cast<PaDeviceIndex>(std::stoi(config.device_id.substr(10)));
        } catch (const std::exception&) {
            index = paNoDevice;
        }
    }
    if (index == paNoDevice || index < 0 || index >= Pa_GetDeviceCount()) {
        report_error("No such input device: " + (config.device_id.empty() ? "default" : config.device_id), true);
        return false;
    }

    const PaDeviceInfo* info = Pa_GetDeviceInfo(index);
    if (!info || info->maxInputChannels < 1) {
        report_error("Device has no input channels: " + config.device_id, true);
        return false;
    }
    device_info_ = describe(index, Pa_GetDefaultInputDevice());

    PaStreamParameters params{};
    params.device = index;
    params.channelCount = std::max(1, std::min(config.channels, info->maxInputChannels));
    params.sampleFormat = paFloat32;
    params.suggestedLatency = info->defaultLowInputLatency;
    params.hostApiSpecificStreamInfo = nullptr;

    double rate = config.sample_rate;
    if (Pa_IsFormatSupported(&params, nullptr, rate) != paFormatIsSupported) {
        rate = info->defaultSampleRate;
    }
    actual_config_.sample_rate = static_cast<int>(rate);
    actual_config_.channels = params.channelCount;
    actual_config_.device_id = device_info_.id;

    const unsigned long frames_per_buffer = static_cast<unsigned long>(
        std::max(1, actual_config_.sample_rate * std::max(1, config.buffer_size_ms) / 1000));

    close_stream();
    PaError err = Pa_OpenStream(
        &stream_,
        &params,
        nullptr,
        rate,
        frames_per_buffer,
        paClipOff,
        &AudioInputDevice_PortAudio::stream_callback,
        this
    );
    if (err != paNoError) {
        stream_ = nullptr;
        report_error(std::string("Failed to open input stream: ") + Pa_GetErrorText(err), true);
        return false;
    }
    return true;
}

int AudioInputDevice_PortAudio::stream_callback(const void* input, void* /*output*/,
                                                unsigned long frame_count,
                                                const PaStreamCallbackTimeInfo* /*time_info*/,
                                                unsigned long status_flags, void* user_data) {
    auto* self = static_cast<AudioInputDevice_PortAudio*>(user_data);
    if (status_flags & paInputOverflow) {
        self->report_error("Input overflow, samples dropped", false);
    }
    if (input && self->audio_callback_) {
        self->audio_callback_(
            static_cast<const float*>(input),
            static_cast<size_t>(frame_count) * self->actual_config_.channels,
            self->actual_config_.sample_rate,
            self->actual_config_.channels
        );
    }
    return paContinue;
}

bool AudioInputDevice_PortAudio::start() {
    if (is_capturing_.load()) {
        return true;  // Already capturing
    }
    if (!stream_) {
        report_error("Device not initialized", true);
        return false;
    }
    PaError err = Pa_StartStream(stream_);
    if (err != paNoError) {
        report_error(std::string("Failed to start input stream: ") + Pa_GetErrorText(err), true);
        return false;
    }
    is_capturing_.store(true);
    return true;
}

void AudioInputDevice_PortAudio::stop() {
    if (!is_capturing_.load()) {
        return;
    }
    // Blocks until the last callback has returned
    Pa_StopStream(stream_);
    is_capturing_.store(false);
}

void AudioInputDevice_PortAudio::close_stream() {
    if (stream_) {
        Pa_CloseStream(stream_);
        stream_ = nullptr;
    }
}

} // namespace audio
