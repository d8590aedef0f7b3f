#pragma once
#include <string>
#include <vector>

namespace core {

// Everything the enrollment flow needs, passed explicitly to the controller.
struct EnrollConfig {
    // Profile
    std::string profile_name;                       // empty = ask / fall back
    std::string default_profile_name = "my_voiceprint";
    std::string profile_dir = ".";

    // Capture
    std::string device_id;                          // "" = default microphone
    int sample_rate = 16000;
    double duration_s = 3.0;
    int channels = 1;
    bool save_clips = true;
    std::string clip_dir = ".";
    bool beep = true;

    // Model
    std::string model_path = "models/speaker_embedding.onnx";
    bool normalize_embeddings = false;

    // Enrollment phrases; their count is the number of samples taken
    std::vector<std::string> phrases;
    std::string test_phrase = "Unhidra CLI";

    // Verification
    float threshold = 0.55f;
    bool run_test = true;

    // Listener script patching
    bool patch_target = true;
    std::string target_path = "~/unhidra_listen.py";
    std::string marker = "np.load(";
    std::string replacement_template = "reference = np.load(\"{key}\")";

    bool verbose = false;

    EnrollConfig();

    // Fixed utterance length fed to the embedder: sample_rate * duration_s.
    int utterance_samples() const;
};

// voiceprint_verify settings. The probe is cut or padded to the same fixed
// duration enrollment used, whatever the length of a --wav input.
struct VerifyConfig {
    std::string profile_path;
    std::string model_path = "models/speaker_embedding.onnx";
    std::string device_id;
    std::string wav_path;                           // empty = record live
    int sample_rate = 16000;
    double duration_s = 3.0;
    float threshold = 0.55f;
    bool verbose = false;

    int utterance_samples() const;
};

const std::vector<std::string>& default_phrases();

// One phrase per non-empty line. Throws speaker::VoiceprintError(FileNotFound).
std::vector<std::string> load_phrases(const std::string& path);

// "~" or "~/..." -> $HOME based path; other paths unchanged.
std::string expand_user_path(const std::string& path);

// Parses voiceprint_enroll flags into cfg. Returns false and sets error on a
// bad or unknown flag; sets show_help for -h/--help.
bool parse_enroll_args(int argc, char** argv, EnrollConfig& cfg, std::string& error, bool& show_help);

std::string enroll_usage(const char* argv0);

// Same contract as parse_enroll_args; --profile is required.
bool parse_verify_args(int argc, char** argv, VerifyConfig& cfg, std::string& error, bool& show_help);

std::string verify_usage(const char* argv0);
}
