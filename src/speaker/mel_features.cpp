#include "speaker/mel_features.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace speaker {

float MelFeatureExtractor::hz_to_mel(float hz) {
    return 1127.0f * std::log(1.0f + hz / 700.0f);
}

float MelFeatureExtractor::mel_to_hz(float mel) {
    return 700.0f * (std::exp(mel / 1127.0f) - 1.0f);
}

MelFeatureExtractor::MelFeatureExtractor() : MelFeatureExtractor(Config{}) {}

MelFeatureExtractor::MelFeatureExtractor(const Config& config) : m_config(config) {
    if (m_config.n_fft <= 0 || (m_config.n_fft & (m_config.n_fft - 1)) != 0) {
        throw std::invalid_argument("n_fft must be a power of two");
    }
    if (m_config.frame_length <= 0 || m_config.frame_length > m_config.n_fft) {
        throw std::invalid_argument("frame_length must be in (0, n_fft]");
    }
    if (m_config.hop_length <= 0 || m_config.n_mels <= 0 || m_config.sample_rate <= 0) {
        throw std::invalid_argument("hop_length, n_mels and sample_rate must be positive");
    }
    if (m_config.fmax <= 0.0f) {
        m_config.fmax = m_config.sample_rate / 2.0f;
    }
    init_window();
    init_mel_filters();
    init_fft();
}

MelFeatureExtractor::~MelFeatureExtractor() = default;

void MelFeatureExtractor::init_window() {
    const int n = m_config.frame_length;
    m_window.resize(n);
    for (int i = 0; i < n; ++i) {
        m_window[i] = 0.5f * (1.0f - std::cos(2.0f * static_cast<float>(M_PI) * i / (n - 1)));
    }
}

void MelFeatureExtractor::init_mel_filters() {
    const int n_bins = m_config.n_fft / 2 + 1;
    const float bin_hz = static_cast<float>(m_config.sample_rate) / m_config.n_fft;
    m_mel_filters.assign(static_cast<size_t>(m_config.n_mels) * n_bins, 0.0f);

    const float mel_lo = hz_to_mel(m_config.fmin);
    const float mel_hi = hz_to_mel(m_config.fmax);
    const float mel_step = (mel_hi - mel_lo) / (m_config.n_mels + 1);

    // Triangles are built on the mel axis, so every filter has unit peak
    for (int m = 0; m < m_config.n_mels; ++m) {
        const float left = mel_lo + m * mel_step;
        const float center = left + mel_step;
        const float right = center + mel_step;
        for (int k = 0; k < n_bins; ++k) {
            const float mel = hz_to_mel(k * bin_hz);
            float w = 0.0f;
            if (mel > left && mel <= center) {
                w = (mel - left) / (center - left);
            } else if (mel > center && mel < right) {
                w = (right - mel) / (right - center);
            }
            m_mel_filters[static_cast<size_t>(m) * n_bins + k] = w;
        }
    }
}

void MelFeatureExtractor::init_fft() {
    const size_t n = static_cast<size_t>(m_config.n_fft);
    m_twiddles.resize(n / 2);
    for (size_t k = 0; k < n / 2; ++k) {
        const double theta = -2.0 * M_PI * static_cast<double>(k) / static_cast<double>(n);
        m_twiddles[k] = std::complex<float>(static_cast<float>(std::cos(theta)),
                                            static_cast<float>(std::sin(theta)));
    }

    m_bitrev.resize(n);
    size_t bits = 0;
    while ((static_cast<size_t>(1) << bits) < n) ++bits;
    for (size_t i = 0; i < n; ++i) {
        size_t r = 0;
        for (size_t b = 0; b < bits; ++b) {
            if (i & (static_cast<size_t>(1) << b)) r |= static_cast<size_t>(1) << (bits - 1 - b);
        }
        m_bitrev[i] = r;
    }
}

// Iterative radix-2 Cooley-Tukey, decimation in time
void MelFeatureExtractor::fft_inplace(std::vector<std::complex<float>>& x) const {
    const size_t n = x.size();
    for (size_t i = 0; i < n; ++i) {
        if (m_bitrev[i] > i) std::swap(x[i], x[m_bitrev[i]]);
    }
    for (size_t len = 2; len <= n; len <<= 1) {
        const size_t half = len / 2;
        const size_t stride = n / len;
        for (size_t start = 0; start < n; start += len) {
            for (size_t j = 0; j < half; ++j) {
                const std::complex<float> t = m_twiddles[j * stride] * x[start + j + half];
                const std::complex<float> u = x[start + j];
                x[start + j] = u + t;
                x[start + j + half] = u - t;
            }
        }
    }
}

int MelFeatureExtractor::get_num_frames(int n_samples) const {
    if (n_samples < m_config.frame_length) {
        return 0;
    }
    return 1 + (n_samples - m_config.frame_length) / m_config.hop_length;
}

std::vector<float> MelFeatureExtractor::extract_features(const float* samples, int n_samples) const {
    const int n_frames = get_num_frames(n_samples);
    if (!samples || n_frames <= 0) {
        return {};
    }

    const int n_bins = m_config.n_fft / 2 + 1;
    const int frame_len = m_config.frame_length;
    std::vector<float> features(static_cast<size_t>(n_frames) * m_config.n_mels);
    std::vector<float> frame(frame_len);
    std::vector<std::complex<float>> spectrum(m_config.n_fft);
    std::vector<float> power(n_bins);

    for (int f = 0; f < n_frames; ++f) {
        const float* src = samples + static_cast<size_t>(f) * m_config.hop_length;
        std::copy(src, src + frame_len, frame.begin());

        if (m_config.remove_dc) {
            float mean = 0.0f;
            for (float v : frame) mean += v;
            mean /= frame_len;
            for (float& v : frame) v -= mean;
        }
        if (m_config.preemphasis > 0.0f) {
            for (int i = frame_len - 1; i > 0; --i) {
                frame[i] -= m_config.preemphasis * frame[i - 1];
            }
            frame[0] -= m_config.preemphasis * frame[0];
        }

        std::fill(spectrum.begin(), spectrum.end(), std::complex<float>(0.0f, 0.0f));
        for (int i = 0; i < frame_len; ++i) {
            spectrum[i] = std::complex<float>(frame[i] * m_window[i], 0.0f);
        }
        fft_inplace(spectrum);
        for (int k = 0; k < n_bins; ++k) {
            power[k] = std::norm(spectrum[k]);
        }

        float* out = features.data() + static_cast<size_t>(f) * m_config.n_mels;
        for (int m = 0; m < m_config.n_mels; ++m) {
            const float* filt = m_mel_filters.data() + static_cast<size_t>(m) * n_bins;
            float energy = 0.0f;
            for (int k = 0; k < n_bins; ++k) {
                energy += power[k] * filt[k];
            }
            out[m] = std::log(std::max(energy, m_config.energy_floor));
        }
    }

    return features;
}

void MelFeatureExtractor::mean_normalize(std::vector<float>& features, int n_mels) {
    if (n_mels <= 0 || features.empty()) return;
    const size_t n_frames = features.size() / n_mels;
    if (n_frames == 0) return;

    std::vector<double> mean(n_mels, 0.0);
    for (size_t f = 0; f < n_frames; ++f) {
        for (int m = 0; m < n_mels; ++m) mean[m] += features[f * n_mels + m];
    }
    for (int m = 0; m < n_mels; ++m) mean[m] /= static_cast<double>(n_frames);
    for (size_t f = 0; f < n_frames; ++f) {
        for (int m = 0; m < n_mels; ++m) {
            features[f * n_mels + m] -= static_cast<float>(mean[m]);
        }
    }
}

} // namespace speaker
