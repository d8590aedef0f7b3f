#include "speaker/onnx_embedder.hpp"
#include "speaker/mel_features.hpp"
#include <onnxruntime_cxx_api.h>
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <string>

#ifdef _WIN32
#define NOMINMAX  // Prevent Windows.h from defining min/max macros
#include <windows.h>
#endif

namespace speaker {

namespace {
VoiceprintError extractor_error(const std::string& what) {
    return VoiceprintError(ErrorKind::ExtractorError, what);
}
}

OnnxSpeakerEmbedder::OnnxSpeakerEmbedder(const Config& config)
    : m_config(config)
{
    if (m_config.verbose) {
        fprintf(stderr, "[OnnxEmbedder] Initializing with model: %s\n", m_config.model_path.c_str());
    }

    try {
        m_env = std::make_unique<Ort::Env>(ORT_LOGGING_LEVEL_WARNING, "SpeakerEmbedding");

        m_session_options = std::make_unique<Ort::SessionOptions>();
        m_session_options->SetIntraOpNumThreads(m_config.intra_op_threads);
        m_session_options->SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_ALL);

#ifdef _WIN32
        // Windows: convert UTF-8 to wide string
        std::wstring wide_path;
        wide_path.resize(m_config.model_path.size() + 1);
        int len = MultiByteToWideChar(CP_UTF8, 0, m_config.model_path.c_str(),
                                       static_cast<int>(m_config.model_path.size()),
                                       &wide_path[0], static_cast<int>(wide_path.size()));
        wide_path.resize(len);
        m_session = std::make_unique<Ort::Session>(*m_env, wide_path.c_str(), *m_session_options);
#else
        m_session = std::make_unique<Ort::Session>(*m_env, m_config.model_path.c_str(), *m_session_options);
#endif

        Ort::AllocatorWithDefaultOptions allocator;
        if (m_session->GetInputCount() < 1 || m_session->GetOutputCount() < 1) {
            throw extractor_error("model " + m_config.model_path + " has no input or no output");
        }

        Ort::AllocatedStringPtr input_name_ptr = m_session->GetInputNameAllocated(0, allocator);
        m_input_name_strings.emplace_back(input_name_ptr.get());
        Ort::AllocatedStringPtr output_name_ptr = m_session->GetOutputNameAllocated(0, allocator);
        m_output_name_strings.emplace_back(output_name_ptr.get());
        for (const auto& s : m_input_name_strings) m_input_names.push_back(s.c_str());
        for (const auto& s : m_output_name_strings) m_output_names.push_back(s.c_str());

        // (batch, embedding_dim); a dynamic dim stays 0 until the first run
        Ort::TypeInfo type_info = m_session->GetOutputTypeInfo(0);
        auto shape = type_info.GetTensorTypeAndShapeInfo().GetShape();
        if (!shape.empty() && shape.back() > 0) {
            m_embedding_dim = static_cast<int>(shape.back());
        }

        if (m_config.verbose) {
            fprintf(stderr, "[OnnxEmbedder] Input: %s, output: %s, embedding_dim: %d\n",
                    m_input_name_strings[0].c_str(), m_output_name_strings[0].c_str(), m_embedding_dim);
        }

        m_memory_info = std::make_unique<Ort::MemoryInfo>(
            Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault)
        );
    } catch (const Ort::Exception& e) {
        fprintf(stderr, "[OnnxEmbedder] ONNX Runtime error: %s\n", e.what());
        throw extractor_error(std::string("failed to load speaker model ") + m_config.model_path + ": " + e.what());
    }

    MelFeatureExtractor::Config mel_config;
    mel_config.sample_rate = m_config.sample_rate;
    mel_config.n_mels = m_config.n_mels;
    m_mel_extractor = std::make_unique<MelFeatureExtractor>(mel_config);
}

OnnxSpeakerEmbedder::~OnnxSpeakerEmbedder() = default;

std::vector<float> OnnxSpeakerEmbedder::preprocess_audio(const audio::AudioBuffer& buffer) const {
    // Zero-padded when shorter, first N samples when longer
    std::vector<float> audio_float(m_config.target_length_samples, 0.0f);
    const size_t copy_samples = std::min(buffer.samples.size(),
                                         static_cast<size_t>(m_config.target_length_samples));
    std::copy(buffer.samples.begin(), buffer.samples.begin() + copy_samples, audio_float.begin());
    return audio_float;
}

void OnnxSpeakerEmbedder::normalize_embedding(std::vector<float>& emb) {
    double norm = 0.0;
    for (float val : emb) {
        norm += static_cast<double>(val) * val;
    }
    norm = std::sqrt(norm);

    if (norm > 1e-8) {
        for (float& val : emb) {
            val /= static_cast<float>(norm);
        }
    }
}

Embedding OnnxSpeakerEmbedder::extract(const audio::AudioBuffer& buffer) {
    if (buffer.samples.empty()) {
        throw extractor_error("empty audio buffer");
    }
    if (buffer.channels != 1) {
        throw extractor_error("expected mono audio, got " + std::to_string(buffer.channels) + " channels");
    }
    if (buffer.sample_rate != m_config.sample_rate) {
        throw extractor_error("expected " + std::to_string(m_config.sample_rate) + " Hz audio, got " +
                              std::to_string(buffer.sample_rate) + " Hz");
    }

    std::vector<float> audio_float = preprocess_audio(buffer);
    std::vector<float> fbank = m_mel_extractor->extract_features(
        audio_float.data(), static_cast<int>(audio_float.size()));
    const int n_frames = m_mel_extractor->get_num_frames(static_cast<int>(audio_float.size()));
    if (fbank.empty() || n_frames <= 0) {
        throw extractor_error("audio too short for feature extraction");
    }
    if (m_config.mean_normalize) {
        MelFeatureExtractor::mean_normalize(fbank, m_config.n_mels);
    }

    Embedding embedding;
    try {
        // [batch=1, time_frames, n_mels]
        std::vector<int64_t> input_shape = {1, static_cast<int64_t>(n_frames),
                                            static_cast<int64_t>(m_config.n_mels)};
        Ort::Value input_tensor = Ort::Value::CreateTensor<float>(
            *m_memory_info,
            fbank.data(),
            fbank.size(),
            input_shape.data(),
            input_shape.size()
        );

        auto output_tensors = m_session->Run(
            Ort::RunOptions{nullptr},
            m_input_names.data(),
            &input_tensor,
            1,
            m_output_names.data(),
            1
        );

        if (output_tensors.empty() || !output_tensors[0].IsTensor()) {
            throw extractor_error("model produced no output tensor");
        }
        const float* output_data = output_tensors[0].GetTensorData<float>();
        const size_t output_dim = output_tensors[0].GetTensorTypeAndShapeInfo().GetElementCount();
        embedding.assign(output_data, output_data + output_dim);
    } catch (const Ort::Exception& e) {
        fprintf(stderr, "[OnnxEmbedder] Inference error: %s\n", e.what());
        throw extractor_error(std::string("inference failed: ") + e.what());
    }

    if (embedding.empty()) {
        throw extractor_error("model produced an empty embedding");
    }
    if (m_embedding_dim == 0) {
        m_embedding_dim = static_cast<int>(embedding.size());
    } else if (static_cast<int>(embedding.size()) != m_embedding_dim) {
        throw extractor_error("model produced " + std::to_string(embedding.size()) +
                              " values, expected " + std::to_string(m_embedding_dim));
    }
    for (float v : embedding) {
        if (!std::isfinite(v)) {
            throw extractor_error("model produced a non-finite embedding");
        }
    }

    if (m_config.normalize_output) {
        normalize_embedding(embedding);
    }

    if (m_config.verbose) {
        fprintf(stderr, "[OnnxEmbedder] %d frames -> %zu-dim embedding\n", n_frames, embedding.size());
    }
    return embedding;
}

} // namespace speaker
