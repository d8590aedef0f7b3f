#include "speaker/verifier.hpp"
#include <algorithm>
#include <cmath>
#include <string>

namespace speaker {

const char* to_string(Decision decision) {
    return decision == Decision::Match ? "MATCH" : "NO_MATCH";
}

float score(const Embedding& probe, const VoicePrint& reference) {
    if (probe.size() != reference.size()) {
        throw VoiceprintError(ErrorKind::DimensionMismatch,
            "probe has " + std::to_string(probe.size()) + " components, reference has " +
            std::to_string(reference.size()));
    }

    double dot = 0.0, np = 0.0, nr = 0.0;
    for (size_t i = 0; i < probe.size(); ++i) {
        dot += static_cast<double>(probe[i]) * reference[i];
        np += static_cast<double>(probe[i]) * probe[i];
        nr += static_cast<double>(reference[i]) * reference[i];
    }

    if (np == 0.0) {
        throw VoiceprintError(ErrorKind::DegenerateVector, "probe embedding has zero norm");
    }
    if (nr == 0.0) {
        throw VoiceprintError(ErrorKind::DegenerateVector, "reference voiceprint has zero norm");
    }

    const double cosine = dot / (std::sqrt(np) * std::sqrt(nr));
    return static_cast<float>(std::clamp(cosine, -1.0, 1.0));
}

Decision decide(float score, float threshold) {
    return score > threshold ? Decision::Match : Decision::NoMatch;
}

VerificationResult verify(const Embedding& probe, const VoicePrint& reference, float threshold) {
    VerificationResult result;
    result.score = score(probe, reference);
    result.decision = decide(result.score, threshold);
    return result;
}

} // namespace speaker
