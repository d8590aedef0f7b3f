#include "speaker/embedding.hpp"

namespace speaker {

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::EmptyInput:        return "EmptyInput";
        case ErrorKind::DimensionMismatch: return "DimensionMismatch";
        case ErrorKind::DegenerateVector:  return "DegenerateVector";
        case ErrorKind::CorruptProfile:    return "CorruptProfile";
        case ErrorKind::DeviceError:       return "DeviceError";
        case ErrorKind::ExtractorError:    return "ExtractorError";
        case ErrorKind::FileNotFound:      return "FileNotFound";
        case ErrorKind::FileWriteError:    return "FileWriteError";
    }
    return "Unknown";
}

} // namespace speaker
