#include <cassert>
#include <cmath>
#include <stdexcept>
#include <vector>
#include "speaker/mel_features.hpp"

int main() {
    speaker::MelFeatureExtractor mel;
    assert(mel.n_mels() == 80);
    assert(mel.get_num_frames(399) == 0);
    assert(mel.get_num_frames(400) == 1);
    assert(mel.get_num_frames(16000) == 98);

    // Too short for one frame
    std::vector<float> tiny(100, 0.1f);
    assert(mel.extract_features(tiny.data(), static_cast<int>(tiny.size())).empty());

    // 1 kHz tone: the strongest filter sits in the lower half of the bank
    const double kPi = 3.14159265358979323846;
    std::vector<float> tone(16000);
    for (size_t i = 0; i < tone.size(); ++i) {
        tone[i] = 0.5f * static_cast<float>(std::sin(2.0 * kPi * 1000.0 * i / 16000.0));
    }
    auto feats = mel.extract_features(tone.data(), static_cast<int>(tone.size()));
    assert(feats.size() == 98u * 80u);
    for (float v : feats) assert(std::isfinite(v));

    const float* row = &feats[50 * 80];
    int best = 0;
    for (int m = 1; m < 80; ++m) {
        if (row[m] > row[best]) best = m;
    }
    assert(best > 10 && best < 50);

    // Silence is floored, not -inf
    std::vector<float> silence(4000, 0.0f);
    auto quiet = mel.extract_features(silence.data(), static_cast<int>(silence.size()));
    assert(!quiet.empty());
    for (float v : quiet) assert(std::isfinite(v));

    // CMN leaves every bin with zero mean
    speaker::MelFeatureExtractor::mean_normalize(feats, 80);
    for (int m = 0; m < 80; ++m) {
        double sum = 0.0;
        for (int t = 0; t < 98; ++t) sum += feats[t * 80 + m];
        assert(std::fabs(sum / 98.0) < 1e-3);
    }

    // Bad configuration
    speaker::MelFeatureExtractor::Config bad;
    bad.n_fft = 500;
    bool threw = false;
    try {
        speaker::MelFeatureExtractor broken(bad);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
    return 0;
}
