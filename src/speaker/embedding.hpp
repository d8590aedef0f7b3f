#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace speaker {

// Fixed-length speaker embedding as produced by an extractor.
using Embedding = std::vector<float>;

// Enrolled reference: the component-wise mean of several embeddings.
using VoicePrint = Embedding;

enum class ErrorKind {
    EmptyInput,
    DimensionMismatch,
    DegenerateVector,
    CorruptProfile,
    DeviceError,
    ExtractorError,
    FileNotFound,
    FileWriteError
};

const char* to_string(ErrorKind kind);

/**
 * Error raised by every stage of the enrollment / verification pipeline.
 * None of these are recoverable within a run.
 */
class VoiceprintError : public std::runtime_error {
public:
    VoiceprintError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), m_kind(kind) {}

    ErrorKind kind() const { return m_kind; }

private:
    ErrorKind m_kind;
};

} // namespace speaker
