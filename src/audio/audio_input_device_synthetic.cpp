#include "audio/audio_input_device_synthetic.hpp"
#include "audio/wav_io.hpp"
#include <algorithm>
#include <chrono>
#include <thread>

namespace audio {

AudioInputDevice_Synthetic::AudioInputDevice_Synthetic() = default;

AudioInputDevice_Synthetic::~AudioInputDevice_Synthetic() {
    stop();
}

bool AudioInputDevice_Synthetic::initialize(
    const AudioInputConfig& config,
    AudioCallback audio_callback,
    ErrorCallback error_callback
) {
    config_ = config;
    audio_callback_ = audio_callback;
    error_callback_ = error_callback;

    std::string path = config.synthetic_file_path;
    if (path.empty()) {
        path = AudioInputFactory::synthetic_path(config.device_id);
    }
    if (path.empty()) {
        if (error_callback_) {
            error_callback_("Synthetic device requires a WAV file path", true);
        }
        return false;
    }

    if (!read_wav_mono(path, samples_, sample_rate_) || samples_.empty()) {
        if (error_callback_) {
            error_callback_("Failed to load WAV file: " + path, true);
        }
        return false;
    }

    cursor_ = 0;
    actual_config_ = config;
    actual_config_.synthetic_file_path = path;
    actual_config_.sample_rate = sample_rate_;
    actual_config_.channels = 1;
    return true;
}

bool AudioInputDevice_Synthetic::start() {
    if (is_capturing_.load()) {
        return true;  // Already capturing
    }
    if (samples_.empty()) {
        return false;
    }

    should_stop_.store(false);
    is_capturing_.store(true);

    capture_thread_ = std::make_unique<std::thread>(
        &AudioInputDevice_Synthetic::capture_thread_func, this
    );

    return true;
}

void AudioInputDevice_Synthetic::stop() {
    should_stop_.store(true);

    if (capture_thread_ && capture_thread_->joinable()) {
        capture_thread_->join();
    }
    capture_thread_.reset();
    is_capturing_.store(false);
}

void AudioInputDevice_Synthetic::capture_thread_func() {
    const size_t frames_per_chunk = std::max<size_t>(
        1, static_cast<size_t>(sample_rate_) * std::max(1, config_.buffer_size_ms) / 1000);
    auto next_callback_time = std::chrono::steady_clock::now();

    while (!should_stop_.load()) {
        if (cursor_ >= samples_.size()) {
            if (config_.synthetic_loop) {
                cursor_ = 0;
                continue;
            }
            if (error_callback_) {
                error_callback_("End of synthetic input: " + actual_config_.synthetic_file_path, true);
            }
            break;
        }

        const size_t n = std::min(frames_per_chunk, samples_.size() - cursor_);
        if (audio_callback_) {
            audio_callback_(samples_.data() + cursor_, n, sample_rate_, 1);
        }
        cursor_ += n;

        if (config_.synthetic_realtime) {
            const double chunk_duration_s = static_cast<double>(n) / sample_rate_;
            next_callback_time += std::chrono::duration_cast<std::chrono::steady_clock::duration>(
                std::chrono::duration<double>(chunk_duration_s));
            std::this_thread::sleep_until(next_callback_time);
        }
    }

    is_capturing_.store(false);
}

AudioDeviceInfo AudioInputDevice_Synthetic::get_device_info() const {
    AudioDeviceInfo info;
    info.id = "synthetic:" + actual_config_.synthetic_file_path;
    info.name = "Synthetic Device (File: " + actual_config_.synthetic_file_path + ")";
    info.driver = "Synthetic";
    info.default_sample_rate = sample_rate_;
    info.max_channels = 1;
    info.is_default = false;
    return info;
}

} // namespace audio
