#pragma once

#include "audio/audio_buffer.hpp"
#include "speaker/embedding.hpp"

namespace speaker {

/**
 * Turns one fixed-duration mono utterance into a speaker embedding.
 * Implementations return vectors of the same dimensionality on every call
 * and throw VoiceprintError(ExtractorError) instead of returning a
 * placeholder vector.
 */
class IEmbeddingExtractor {
public:
    virtual ~IEmbeddingExtractor() = default;

    virtual Embedding extract(const audio::AudioBuffer& buffer) = 0;

    // 0 while unknown (dynamic model output before the first inference)
    virtual int embedding_dim() const = 0;
};

} // namespace speaker
