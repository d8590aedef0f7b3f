#pragma once

#include "speaker/embedding_extractor.hpp"
#include <memory>
#include <string>
#include <vector>

// Forward declarations to avoid including onnxruntime headers here
namespace Ort {
    struct Env;
    struct Session;
    struct SessionOptions;
    struct MemoryInfo;
}

namespace speaker {

class MelFeatureExtractor;

/**
 * ONNX-based neural speaker embedding extractor.
 * Runs Fbank-input models such as ECAPA-TDNN or WeSpeaker ResNet exports:
 * input [1, frames, n_mels], output [1, dim].
 */
class OnnxSpeakerEmbedder : public IEmbeddingExtractor {
public:
    struct Config {
        std::string model_path = "models/speaker_embedding.onnx";
        int sample_rate = 16000;
        int target_length_samples = 48000;  // 3 seconds of audio
        int n_mels = 80;
        bool mean_normalize = true;         // utterance-level CMN on the Fbank
        bool normalize_output = false;      // L2-normalize embeddings
        int intra_op_threads = 4;
        bool verbose = false;
    };

    // Throws VoiceprintError(ExtractorError) if the model cannot be loaded.
    explicit OnnxSpeakerEmbedder(const Config& config);
    ~OnnxSpeakerEmbedder() override;

    // Disable copy/move (ONNX session is non-copyable)
    OnnxSpeakerEmbedder(const OnnxSpeakerEmbedder&) = delete;
    OnnxSpeakerEmbedder& operator=(const OnnxSpeakerEmbedder&) = delete;

    /**
     * Extract a speaker embedding from one utterance.
     * The buffer must be mono at the configured sample rate; it is padded or
     * trimmed to target_length_samples.
     */
    Embedding extract(const audio::AudioBuffer& buffer) override;

    int embedding_dim() const override { return m_embedding_dim; }

private:
    Config m_config;

    std::unique_ptr<Ort::Env> m_env;
    std::unique_ptr<Ort::SessionOptions> m_session_options;
    std::unique_ptr<Ort::Session> m_session;
    std::unique_ptr<Ort::MemoryInfo> m_memory_info;
    std::unique_ptr<MelFeatureExtractor> m_mel_extractor;

    std::vector<std::string> m_input_name_strings;
    std::vector<std::string> m_output_name_strings;
    std::vector<const char*> m_input_names;
    std::vector<const char*> m_output_names;
    int m_embedding_dim = 0;

    std::vector<float> preprocess_audio(const audio::AudioBuffer& buffer) const;
    static void normalize_embedding(std::vector<float>& emb);
};

} // namespace speaker
