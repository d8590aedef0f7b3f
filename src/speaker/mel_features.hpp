#pragma once

#include <complex>
#include <vector>

namespace speaker {

/**
 * Log-mel filterbank (Fbank) front end for the speaker embedding model.
 *
 * Frames of frame_length samples every hop_length samples are DC-removed,
 * pre-emphasised, Hann-windowed, zero-padded to n_fft and mapped onto n_mels
 * triangular filters. Output is natural-log energy, row-major
 * [n_frames x n_mels], the layout ECAPA-TDNN / WeSpeaker ONNX exports take.
 */
class MelFeatureExtractor {
public:
    struct Config {
        int sample_rate = 16000;
        int frame_length = 400;    // 25ms at 16kHz
        int hop_length = 160;      // 10ms at 16kHz
        int n_fft = 512;           // power of two >= frame_length
        int n_mels = 80;
        float fmin = 20.0f;
        float fmax = 0.0f;         // 0 = Nyquist
        float preemphasis = 0.97f;
        bool remove_dc = true;
        float energy_floor = 1e-10f;
    };

    explicit MelFeatureExtractor();
    explicit MelFeatureExtractor(const Config& config);
    ~MelFeatureExtractor();

    // Empty result when the input is shorter than one frame.
    std::vector<float> extract_features(const float* samples, int n_samples) const;

    int get_num_frames(int n_samples) const;
    int n_mels() const { return m_config.n_mels; }

    // Subtract the per-bin mean over all frames (utterance-level CMN).
    static void mean_normalize(std::vector<float>& features, int n_mels);

private:
    Config m_config;
    std::vector<float> m_window;               // [frame_length]
    std::vector<float> m_mel_filters;          // [n_mels x (n_fft/2 + 1)]
    std::vector<std::complex<float>> m_twiddles;
    std::vector<size_t> m_bitrev;

    void init_window();
    void init_mel_filters();
    void init_fft();
    void fft_inplace(std::vector<std::complex<float>>& x) const;

    static float hz_to_mel(float hz);
    static float mel_to_hz(float mel);
};

} // namespace speaker
