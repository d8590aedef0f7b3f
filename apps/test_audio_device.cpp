// Records one clip through SampleRecorder and writes it to WAV.
// Usage: test_audio_device [device_id] [seconds] [out.wav]
#include "audio/audio_input_device.hpp"
#include "audio/sample_recorder.hpp"
#include "audio/wav_io.hpp"
#include "speaker/embedding.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <string>

int main(int argc, char** argv) {
    std::cout << "=== Audio Device Test ===\n\n";

    std::cout << "Available devices:\n";
    auto devices = audio::AudioInputFactory::enumerate_devices();
    for (size_t i = 0; i < devices.size(); ++i) {
        std::cout << "  [" << i << "] " << devices[i].name
                  << " (" << devices[i].driver << ")";
        if (devices[i].is_default) {
            std::cout << " [DEFAULT]";
        }
        std::cout << "\n";
        std::cout << "      ID: " << devices[i].id << "\n";
    }
    std::cout << "\n";

    const std::string device_id = argc >= 2 ? argv[1] : "default";
    double seconds = 3.0;
    if (argc >= 3) {
        try {
            seconds = std::stod(argv[2]);
        } catch (const std::logic_error&) {
            std::cerr << "Invalid duration: " << argv[2] << "\n";
            return 1;
        }
    }
    const std::string out_path = argc >= 4 ? argv[3] : "device_test.wav";

    if (!audio::AudioInputFactory::is_device_available(device_id)) {
        std::cerr << "Device not available: " << device_id << "\n";
        return 1;
    }

    audio::SampleRecorder::Config cfg;
    cfg.device_id = device_id;
    cfg.verbose = true;
    audio::SampleRecorder recorder(cfg);

    audio::RecordingSpec spec;
    spec.duration_s = seconds;

    std::cout << "Recording " << seconds << "s from " << device_id << "...\n";
    const auto start_time = std::chrono::steady_clock::now();
    audio::AudioBuffer clip;
    try {
        clip = recorder.record(spec);
    } catch (const speaker::VoiceprintError& e) {
        std::cerr << "Capture failed: " << e.what() << "\n";
        return 1;
    }
    const double wall_clock_s = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - start_time).count();

    float peak = 0.0f;
    double energy = 0.0;
    for (float s : clip.samples) {
        peak = std::max(peak, std::fabs(s));
        energy += static_cast<double>(s) * s;
    }
    const double rms = clip.samples.empty() ? 0.0 : std::sqrt(energy / clip.samples.size());

    std::cout << "\n=== Test Complete ===\n";
    std::cout << std::fixed << std::setprecision(2);
    std::cout << "Audio duration: " << clip.duration_seconds() << "s\n";
    std::cout << "Wall-clock time: " << wall_clock_s << "s\n";
    std::cout << std::setprecision(4);
    std::cout << "Peak: " << peak << "  RMS: " << rms << "\n";
    if (peak < 1e-4f) {
        std::cout << "\nWARNING: captured silence, check the input device and its gain\n";
    }

    if (!audio::write_wav_pcm16(out_path, clip)) {
        std::cerr << "Failed to write " << out_path << "\n";
        return 1;
    }
    std::cout << "Saved " << out_path << "\n";
    return 0;
}
