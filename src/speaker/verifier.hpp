#pragma once

#include "speaker/embedding.hpp"

namespace speaker {

constexpr float kDefaultMatchThreshold = 0.55f;

enum class Decision {
    NoMatch,
    Match
};

const char* to_string(Decision decision);

struct VerificationResult {
    float score = 0.0f;           // cosine similarity in [-1, 1]
    Decision decision = Decision::NoMatch;
};

// Cosine similarity between a probe embedding and a reference voiceprint.
// Throws DimensionMismatch when sizes differ and DegenerateVector when either
// vector is empty or has a zero norm.
float score(const Embedding& probe, const VoicePrint& reference);

// Match only when the score strictly exceeds the threshold.
Decision decide(float score, float threshold = kDefaultMatchThreshold);

VerificationResult verify(const Embedding& probe, const VoicePrint& reference,
                          float threshold = kDefaultMatchThreshold);

} // namespace speaker
