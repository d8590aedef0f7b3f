#pragma once

#include "speaker/embedding.hpp"
#include <vector>

namespace speaker {

// Mean-pool per-phrase embeddings into one reference voiceprint.
// Every embedding must have the dimensionality of the first one.
// Throws VoiceprintError(EmptyInput) for an empty sequence or a zero-length
// first element, VoiceprintError(DimensionMismatch) on ragged input.
VoicePrint aggregate(const std::vector<Embedding>& embeddings);

} // namespace speaker
