#pragma once
#include <cstddef>
#include <string>
#include <vector>

namespace core {

/**
 * @brief Outcome of a patch attempt; none of these abort the program
 */
struct PatchResult {
    enum class Status {
        Patched,        ///< lines_changed marker lines rewritten
        NotFound,       ///< target file absent, nothing created
        NoMarkerFound,  ///< target present but untouched
        WriteFailed     ///< rewrite attempted and failed; set by callers that catch the error
    };

    Status status = Status::NotFound;
    size_t lines_changed = 0;

    static PatchResult patched(size_t count) { return PatchResult{Status::Patched, count}; }
    static PatchResult not_found() { return PatchResult{Status::NotFound, 0}; }
    static PatchResult no_marker_found() { return PatchResult{Status::NoMarkerFound, 0}; }
    static PatchResult write_failed() { return PatchResult{Status::WriteFailed, 0}; }
};

const char* to_string(PatchResult::Status status);

/**
 * @brief Points an externally owned script at a new profile artifact
 *
 * Line-oriented: every line containing the marker is replaced by the
 * rendered template ("{key}" substituted, original indentation and line
 * ending kept). All other lines are copied byte-for-byte. The new content is
 * written to a sibling temp file and renamed over the target.
 */
class ConfigPatcher {
public:
    struct Config {
        std::string marker = "np.load(";
        std::string replacement_template = "reference = np.load(\"{key}\")";
        bool keep_indent = true;
    };

    ConfigPatcher();
    explicit ConfigPatcher(const Config& config);

    // Throws speaker::VoiceprintError(FileWriteError) when the rewrite fails.
    PatchResult patch_reference(const std::string& target_path, const std::string& artifact_key) const;

    // Splits keeping each line's terminator ("\n", "\r\n" or none).
    static std::vector<std::string> split_lines(const std::string& content);

    std::string render_line(const std::string& original_line, const std::string& artifact_key) const;

private:
    Config config_;
};

}
