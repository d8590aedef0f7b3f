// Verify one utterance (live or WAV) against a stored voiceprint
#include <iomanip>
#include <iostream>
#include <string>

#include "audio/sample_recorder.hpp"
#include "audio/wav_io.hpp"
#include "core/config.hpp"
#include "core/logging.hpp"
#include "speaker/onnx_embedder.hpp"
#include "speaker/profile_store.hpp"
#include "speaker/verifier.hpp"

namespace {
enum ExitCode { kMatch = 0, kNoMatch = 1, kBadArgs = 2, kFailure = 3 };
}

int main(int argc, char** argv) {
    core::VerifyConfig cfg;
    std::string error;
    bool show_help = false;
    if (!core::parse_verify_args(argc, argv, cfg, error, show_help)) {
        std::cerr << error << "\n\n" << core::verify_usage(argv[0]);
        return kBadArgs;
    }
    if (show_help) {
        std::cout << core::verify_usage(argv[0]);
        return kMatch;
    }
    core::set_verbose(cfg.verbose);

    try {
        speaker::ProfileStore store;
        const speaker::VoicePrint reference = store.load(cfg.profile_path);
        core::log_info("Loaded " + std::to_string(reference.size()) + "-dim voiceprint from " + cfg.profile_path);

        audio::AudioBuffer utterance;
        if (!cfg.wav_path.empty()) {
            if (!audio::read_wav_mono(cfg.wav_path, utterance)) {
                throw speaker::VoiceprintError(speaker::ErrorKind::FileNotFound, "cannot read WAV " + cfg.wav_path);
            }
            if (utterance.sample_rate != cfg.sample_rate) {
                utterance.samples = audio::resample_linear(utterance.samples, utterance.sample_rate, cfg.sample_rate);
                utterance.sample_rate = cfg.sample_rate;
            }
        } else {
            audio::SampleRecorder::Config rec_config;
            rec_config.device_id = cfg.device_id;
            rec_config.verbose = cfg.verbose;
            audio::SampleRecorder recorder(rec_config);

            audio::RecordingSpec spec;
            spec.sample_rate = cfg.sample_rate;
            spec.duration_s = cfg.duration_s;
            std::cout << "Speak now!" << std::endl;
            utterance = recorder.record(spec);
        }

        // Trimmed or padded to the enrollment duration inside the embedder
        speaker::OnnxSpeakerEmbedder::Config emb_config;
        emb_config.model_path = cfg.model_path;
        emb_config.sample_rate = cfg.sample_rate;
        emb_config.target_length_samples = cfg.utterance_samples();
        emb_config.verbose = cfg.verbose;
        speaker::OnnxSpeakerEmbedder embedder(emb_config);

        const speaker::Embedding probe = embedder.extract(utterance);
        const speaker::VerificationResult result = speaker::verify(probe, reference, cfg.threshold);

        std::cout << "Voice match score: " << std::fixed << std::setprecision(3) << result.score
                  << " -> " << speaker::to_string(result.decision) << "\n";
        return result.decision == speaker::Decision::Match ? kMatch : kNoMatch;
    } catch (const speaker::VoiceprintError& e) {
        core::log_error(std::string(speaker::to_string(e.kind())) + ": " + e.what());
        return kFailure;
    } catch (const std::exception& e) {
        core::log_error(e.what());
        return kFailure;
    }
}
