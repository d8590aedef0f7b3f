#include "speaker/aggregator.hpp"
#include <string>

namespace speaker {

VoicePrint aggregate(const std::vector<Embedding>& embeddings) {
    if (embeddings.empty()) {
        throw VoiceprintError(ErrorKind::EmptyInput, "cannot aggregate an empty set of embeddings");
    }

    const size_t dim = embeddings.front().size();
    if (dim == 0) {
        throw VoiceprintError(ErrorKind::EmptyInput, "embedding 1 has no components");
    }

    // Accumulate in double so that long enrollments do not drift
    std::vector<double> sum(dim, 0.0);
    for (size_t n = 0; n < embeddings.size(); ++n) {
        const Embedding& emb = embeddings[n];
        if (emb.size() != dim) {
            throw VoiceprintError(ErrorKind::DimensionMismatch,
                "embedding " + std::to_string(n + 1) + " has " + std::to_string(emb.size()) +
                " components, expected " + std::to_string(dim));
        }
        for (size_t i = 0; i < dim; ++i) {
            sum[i] += emb[i];
        }
    }

    const double count = static_cast<double>(embeddings.size());
    VoicePrint mean(dim);
    for (size_t i = 0; i < dim; ++i) {
        mean[i] = static_cast<float>(sum[i] / count);
    }
    return mean;
}

} // namespace speaker
