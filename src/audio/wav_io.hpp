#pragma once
#include "audio/audio_buffer.hpp"
#include <string>
#include <vector>

namespace audio {

// Read a WAV file (PCM 8/16/24/32, float, A-law, mu-law) and downmix to mono
// float. Returns false when the file is missing or not a readable WAV.
bool read_wav_mono(const std::string& path, std::vector<float>& mono, int& sample_rate);

// Convenience wrapper that fills an AudioBuffer (channels = 1).
bool read_wav_mono(const std::string& path, AudioBuffer& buffer);

// Write a mono buffer as 16-bit PCM WAV. Returns false on I/O failure.
bool write_wav_pcm16(const std::string& path, const AudioBuffer& buffer);

} // namespace audio
