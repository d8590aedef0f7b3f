#include "audio/wav_io.hpp"
#include <algorithm>
#include <cstdint>
#include <cstdio>
#include <utility>
#include <vector>

#define DR_WAV_IMPLEMENTATION
#include <dr_wav.h>

namespace audio {

bool read_wav_mono(const std::string& path, std::vector<float>& mono, int& sample_rate) {
    drwav wav;
    if (!drwav_init_file(&wav, path.c_str(), nullptr)) {
        return false;
    }

    const drwav_uint64 n = wav.totalPCMFrameCount;
    const unsigned channels = wav.channels;
    if (channels == 0 || wav.sampleRate == 0) {
        drwav_uninit(&wav);
        return false;
    }

    std::vector<float> interleaved(static_cast<size_t>(n) * channels);
    const drwav_uint64 read = drwav_read_pcm_frames_f32(&wav, n, interleaved.data());
    sample_rate = static_cast<int>(wav.sampleRate);
    drwav_uninit(&wav);

    mono.resize(static_cast<size_t>(read));
    if (channels == 1) {
        std::copy(interleaved.begin(), interleaved.begin() + static_cast<std::ptrdiff_t>(read), mono.begin());
    } else {
        for (drwav_uint64 i = 0; i < read; ++i) {
            float sum = 0.0f;
            for (unsigned c = 0; c < channels; ++c) {
                sum += interleaved[i * channels + c];
            }
            mono[i] = sum / static_cast<float>(channels);
        }
    }
    return true;
}

bool read_wav_mono(const std::string& path, AudioBuffer& buffer) {
    AudioBuffer out;
    if (!read_wav_mono(path, out.samples, out.sample_rate)) {
        return false;
    }
    out.channels = 1;
    buffer = std::move(out);
    return true;
}

bool write_wav_pcm16(const std::string& path, const AudioBuffer& buffer) {
    if (buffer.channels != 1 || buffer.sample_rate <= 0) {
        return false;
    }

    drwav_data_format format;
    format.container = drwav_container_riff;
    format.format = DR_WAVE_FORMAT_PCM;
    format.channels = 1;
    format.sampleRate = static_cast<drwav_uint32>(buffer.sample_rate);
    format.bitsPerSample = 16;

    std::vector<drwav_int16> pcm16(buffer.samples.size());
    if (!pcm16.empty()) {
        drwav_f32_to_s16(pcm16.data(), buffer.samples.data(), buffer.samples.size());
    }

    drwav wav;
    if (!drwav_init_file_write(&wav, path.c_str(), &format, nullptr)) {
        return false;
    }
    const drwav_uint64 written = drwav_write_pcm_frames(&wav, pcm16.size(), pcm16.data());
    drwav_uninit(&wav);

    if (written != pcm16.size()) {
        std::remove(path.c_str());
        return false;
    }
    return true;
}

} // namespace audio
