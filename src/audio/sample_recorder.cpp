#include "audio/sample_recorder.hpp"
#include "audio/audio_input_device.hpp"
#include "core/logging.hpp"
#include "speaker/embedding.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <condition_variable>
#include <memory>
#include <mutex>

namespace audio {

namespace {

speaker::VoiceprintError device_error(const std::string& what) {
    return speaker::VoiceprintError(speaker::ErrorKind::DeviceError, what);
}

// Shared between the device callback thread and record()
struct CaptureState {
    std::mutex mutex;
    std::condition_variable cv;
    std::vector<float> mono;
    size_t target = 0;
    bool done = false;
    bool failed = false;
    std::string error;
};

} // namespace

size_t RecordingSpec::sample_count() const {
    return static_cast<size_t>(std::llround(static_cast<double>(sample_rate) * duration_s));
}

std::vector<float> resample_linear(const std::vector<float>& in, int in_hz, int out_hz) {
    if (in_hz == out_hz || in_hz <= 0 || out_hz <= 0 || in.empty()) {
        return in;
    }
    const double ratio = static_cast<double>(out_hz) / static_cast<double>(in_hz);
    const size_t out_len = static_cast<size_t>(std::llround(in.size() * ratio));
    std::vector<float> out(out_len);
    for (size_t i = 0; i < out_len; ++i) {
        const double src_pos = i / ratio;
        const size_t i0 = std::min(static_cast<size_t>(src_pos), in.size() - 1);
        const size_t i1 = std::min(i0 + 1, in.size() - 1);
        const double frac = src_pos - static_cast<double>(i0);
        out[i] = static_cast<float>((1.0 - frac) * in[i0] + frac * in[i1]);
    }
    return out;
}

SampleRecorder::SampleRecorder(const Config& config) : config_(config) {}

AudioBuffer SampleRecorder::record(const RecordingSpec& spec) {
    if (spec.channels != 1) {
        throw device_error("only mono capture is supported, requested " +
                           std::to_string(spec.channels) + " channels");
    }
    if (spec.sample_rate <= 0 || spec.duration_s <= 0.0) {
        throw device_error("invalid recording spec");
    }
    const size_t wanted = spec.sample_count();

    // Declared before the device so it outlives every callback
    auto state = std::make_shared<CaptureState>();

    std::unique_ptr<IAudioInputDevice> device = AudioInputFactory::create_device(config_.device_id);
    if (!device) {
        throw device_error("unknown input device: " + config_.device_id);
    }

    AudioInputConfig input;
    input.device_id = config_.device_id;
    input.sample_rate = spec.sample_rate;
    input.channels = spec.channels;
    input.synthetic_file_path = AudioInputFactory::synthetic_path(config_.device_id);
    input.synthetic_realtime = config_.synthetic_realtime;

    auto on_audio = [state](const float* samples, size_t count, int /*rate*/, int channels) {
        std::lock_guard<std::mutex> lock(state->mutex);
        if (state->done || state->failed || channels <= 0) return;
        const size_t frames = count / static_cast<size_t>(channels);
        for (size_t f = 0; f < frames && state->mono.size() < state->target; ++f) {
            float sum = 0.0f;
            for (int c = 0; c < channels; ++c) sum += samples[f * channels + c];
            state->mono.push_back(sum / static_cast<float>(channels));
        }
        if (state->mono.size() >= state->target) {
            state->done = true;
            state->cv.notify_all();
        }
    };
    auto on_error = [state](const std::string& message, bool is_fatal) {
        if (!is_fatal) {
            core::log_warn("[Recorder] " + message);
            return;
        }
        std::lock_guard<std::mutex> lock(state->mutex);
        if (state->done || state->failed) return;
        state->failed = true;
        state->error = message;
        state->cv.notify_all();
    };

    if (!device->initialize(input, on_audio, on_error)) {
        std::lock_guard<std::mutex> lock(state->mutex);
        throw device_error("cannot open input device" +
                           (state->error.empty() ? std::string() : ": " + state->error));
    }

    const AudioInputConfig actual = device->get_actual_config();
    {
        std::lock_guard<std::mutex> lock(state->mutex);
        state->target = static_cast<size_t>(std::llround(static_cast<double>(actual.sample_rate) * spec.duration_s));
        state->mono.reserve(state->target);
    }
    if (config_.verbose) {
        core::log_debug("[Recorder] capturing " + std::to_string(spec.duration_s) + "s from " +
                        device->get_device_info().name + " at " + std::to_string(actual.sample_rate) + " Hz");
    }

    if (!device->start()) {
        std::lock_guard<std::mutex> lock(state->mutex);
        throw device_error("cannot start capture" +
                           (state->error.empty() ? std::string() : ": " + state->error));
    }

    bool completed;
    {
        std::unique_lock<std::mutex> lock(state->mutex);
        const auto timeout = std::chrono::milliseconds(
            static_cast<int64_t>(spec.duration_s * 1000.0) + config_.grace_ms);
        completed = state->cv.wait_for(lock, timeout, [&] { return state->done || state->failed; });
    }
    device->stop();

    std::vector<float> mono;
    {
        std::lock_guard<std::mutex> lock(state->mutex);
        if (state->failed) {
            throw device_error("capture failed: " + state->error);
        }
        if (!completed || !state->done) {
            throw device_error("capture timed out after " + std::to_string(state->mono.size()) + " of " +
                               std::to_string(state->target) + " samples");
        }
        mono.swap(state->mono);
    }

    AudioBuffer buffer;
    buffer.sample_rate = spec.sample_rate;
    buffer.channels = 1;
    buffer.samples = resample_linear(mono, actual.sample_rate, spec.sample_rate);
    // Rounding in the resampler may leave the length one sample off
    buffer.samples.resize(wanted, buffer.samples.empty() ? 0.0f : buffer.samples.back());
    return buffer;
}

} // namespace audio
