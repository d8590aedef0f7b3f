// End-to-end enrollment against WAV playback: real recorder, real Fbank
// front end (mean log-mel per utterance stands in for the neural model),
// profile store and listener patching.
#include <cassert>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include "audio/sample_recorder.hpp"
#include "audio/wav_io.hpp"
#include "core/enrollment_controller.hpp"
#include "speaker/embedding_extractor.hpp"
#include "speaker/mel_features.hpp"
#include "speaker/profile_store.hpp"

namespace fs = std::filesystem;

namespace {

class MeanFbankExtractor : public speaker::IEmbeddingExtractor {
public:
    speaker::Embedding extract(const audio::AudioBuffer& buffer) override {
        auto feats = m_mel.extract_features(buffer.samples.data(), static_cast<int>(buffer.samples.size()));
        const int n_mels = m_mel.n_mels();
        if (feats.empty()) {
            throw speaker::VoiceprintError(speaker::ErrorKind::ExtractorError, "utterance too short");
        }
        const size_t frames = feats.size() / n_mels;
        speaker::Embedding emb(n_mels, 0.0f);
        for (size_t t = 0; t < frames; ++t) {
            for (int m = 0; m < n_mels; ++m) emb[m] += feats[t * n_mels + m];
        }
        // Offset so the log energies are positive and the vector has a direction
        for (auto& v : emb) v = v / frames + 30.0f;
        return emb;
    }
    int embedding_dim() const override { return m_mel.n_mels(); }

private:
    speaker::MelFeatureExtractor m_mel;
};

class SilentPrompter : public core::IPrompter {
public:
    void show_phrase(size_t, size_t, const std::string&) override {}
    void show_test_prompt(const std::string&) override {}
    void wait_for_ready(const std::string&) override {}
    void before_capture() override {}
    void clip_saved(const std::string&) override {}
};

audio::AudioBuffer voice_like(double f0, double seconds) {
    const double kPi = 3.14159265358979323846;
    audio::AudioBuffer buf;
    const size_t n = static_cast<size_t>(buf.sample_rate * seconds);
    buf.samples.resize(n);
    for (size_t i = 0; i < n; ++i) {
        const double t = static_cast<double>(i) / buf.sample_rate;
        double s = 0.0;
        for (int h = 1; h <= 8; ++h) s += std::sin(2.0 * kPi * f0 * h * t) / h;
        buf.samples[i] = static_cast<float>(0.2 * s);
    }
    return buf;
}

}

int main() {
    const fs::path dir = fs::absolute(fs::temp_directory_path() / "voiceprint_enroll_smoke");
    fs::remove_all(dir);
    fs::create_directories(dir);

    const std::string wav = (dir / "speaker.wav").string();
    assert(audio::write_wav_pcm16(wav, voice_like(140.0, 2.0)));
    {
        std::ofstream out(dir / "listen.py");
        out << "import numpy as np\nreference = np.load(\"old.npy\")\n";
    }

    core::EnrollConfig cfg;
    cfg.profile_name = "smoke";
    cfg.profile_dir = (dir / "profiles").string();
    cfg.clip_dir = (dir / "clips").string();
    cfg.target_path = (dir / "listen.py").string();
    cfg.phrases = {"first", "second", "third"};
    cfg.duration_s = 1.0;

    audio::SampleRecorder::Config rec_cfg;
    rec_cfg.device_id = "synthetic:" + wav;
    rec_cfg.synthetic_realtime = false;
    audio::SampleRecorder recorder(rec_cfg);
    MeanFbankExtractor extractor;
    SilentPrompter prompter;

    core::EnrollmentController controller(cfg, recorder, extractor, prompter);
    core::EnrollmentReport report = controller.run();

    // Same audio every time: the test utterance matches its own voiceprint
    assert(report.dimension == 80);
    assert(report.tested);
    assert(report.verification.score > 0.99f);
    assert(report.verification.decision == speaker::Decision::Match);

    speaker::ProfileStore store;
    assert(store.load(report.artifact_path).size() == 80);
    assert(fs::exists(dir / "clips" / "voice_03.wav"));

    audio::AudioBuffer clip;
    assert(audio::read_wav_mono((dir / "clips" / "test_clip.wav").string(), clip));
    assert(clip.samples.size() == 16000);

    assert(report.patch.status == core::PatchResult::Status::Patched);
    std::ifstream in(dir / "listen.py");
    const std::string patched((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    assert(patched.find(report.artifact_path) != std::string::npos);
    assert(patched.find("old.npy") == std::string::npos);

    fs::remove_all(dir);
    return 0;
}
