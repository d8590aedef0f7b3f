#pragma once

#include "speaker/embedding.hpp"
#include <iosfwd>
#include <string>

namespace speaker {

/**
 * Persists enrolled voiceprints, one NumPy .npy file per profile.
 *
 * Layout (npy format 1.0):
 *   "\x93NUMPY" 0x01 0x00 <uint16 LE header length>
 *   "{'descr': '<f4', 'fortran_order': False, 'shape': (D,), }" padded with
 *   spaces and a trailing '\n' so the preamble is a multiple of 64 bytes,
 *   then D little-endian float32 values.
 *
 * Saving goes through a temporary sibling file and a rename, so a profile on
 * disk is either the previous one or the complete new one.
 */
class ProfileStore {
public:
    struct Config {
        std::string directory = ".";
        std::string default_name = "my_voiceprint";
        std::string extension = ".npy";
    };

    ProfileStore();
    explicit ProfileStore(const Config& config);

    // Trim whitespace, fall back to the default name when nothing is left, and
    // replace path separators / control characters with '_'.
    std::string sanitize_name(const std::string& name) const;

    // Storage key (file name) and full path for a human-chosen profile name.
    std::string key_for(const std::string& name) const;
    std::string path_for(const std::string& name) const;
    bool exists(const std::string& name) const;

    // Writes the profile and returns the artifact path. Last write wins.
    // Throws EmptyInput for an empty voiceprint, DegenerateVector for an
    // all-zero one, FileWriteError on I/O failure.
    std::string save(const std::string& name, const VoicePrint& voiceprint) const;

    // Throws FileNotFound if the artifact is missing, CorruptProfile if it
    // cannot be parsed as a non-empty numeric vector of at most 2^20 values.
    VoicePrint load(const std::string& artifact_path) const;

    const Config& config() const { return m_config; }

    static void write_npy(std::ostream& out, const VoicePrint& voiceprint);
    static VoicePrint read_npy(std::istream& in, const std::string& origin);

private:
    Config m_config;
};

} // namespace speaker
