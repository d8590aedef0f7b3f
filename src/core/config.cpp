#include "core/config.hpp"
#include "speaker/embedding.hpp"

#include <cmath>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

namespace core {

const std::vector<std::string>& default_phrases() {
    static const std::vector<std::string> phrases = {
        "Okay, let's get to it. Unhidra CLI, open it up. Time to get some work done.",
        "Unhidra CLI. That's the command. Recognize my voice. Only me.",
        "Come on, Unhidra CLI, don't make me say it again. Just open already.",
        "Unhidra CLI... run quietly this time. No alerts. Just background mode.",
        "Unhidra CLI now, don't wait, just launch the terminal instantly.",
        "Every time I say 'Unhidra CLI,' it should respond. This is my machine. My voice. My trigger.",
        "Unhidra CLI. No delays. Terminal, front and center."
    };
    return phrases;
}

EnrollConfig::EnrollConfig() : phrases(default_phrases()) {}

namespace {
int samples_for(int sample_rate, double duration_s) {
    return static_cast<int>(std::lround(sample_rate * duration_s));
}
}

int EnrollConfig::utterance_samples() const {
    return samples_for(sample_rate, duration_s);
}

int VerifyConfig::utterance_samples() const {
    return samples_for(sample_rate, duration_s);
}

std::vector<std::string> load_phrases(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw speaker::VoiceprintError(speaker::ErrorKind::FileNotFound, "cannot read phrase file " + path);
    }
    std::vector<std::string> phrases;
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.find_first_not_of(" \t") == std::string::npos) continue;
        phrases.push_back(line);
    }
    return phrases;
}

std::string expand_user_path(const std::string& path) {
    if (path.empty() || path[0] != '~') return path;
    if (path.size() > 1 && path[1] != '/') return path;  // ~user is not supported
    const char* home = std::getenv("HOME");
    if (!home || !*home) return path;
    return std::string(home) + path.substr(1);
}

std::string enroll_usage(const char* argv0) {
    return std::string("Usage: ") + argv0 + " [options]\n"
        "  --name NAME          profile name (asked interactively when omitted)\n"
        "  --profile-dir DIR    where <name>.npy is written (default .)\n"
        "  --model PATH         speaker embedding ONNX model\n"
        "  --device ID          default | portaudio:<index> | synthetic:<file.wav>\n"
        "  --sample-rate HZ     capture rate (default 16000)\n"
        "  --duration S         seconds per phrase (default 3)\n"
        "  --phrases FILE       one enrollment phrase per line\n"
        "  --threshold T        match threshold (default 0.55)\n"
        "  --clip-dir DIR       where voice_NN.wav / test_clip.wav go (default .)\n"
        "  --no-clips           do not keep captured clips\n"
        "  --target PATH        listener script to patch (default ~/unhidra_listen.py)\n"
        "  --no-patch           leave the listener script alone\n"
        "  --skip-test          skip the verification test after enrollment\n"
        "  --normalize          L2-normalize embeddings\n"
        "  --no-beep            silent countdown\n"
        "  -v, --verbose        debug logging\n";
}

bool parse_enroll_args(int argc, char** argv, EnrollConfig& cfg, std::string& error, bool& show_help) {
    show_help = false;
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        auto need_value = [&](std::string& out) {
            if (i + 1 >= argc) {
                error = "missing value for " + a;
                return false;
            }
            out = argv[++i];
            return true;
        };
        std::string v;

        if (a == "-h" || a == "--help") { show_help = true; continue; }
        if (a == "-v" || a == "--verbose") { cfg.verbose = true; continue; }
        if (a == "--no-clips") { cfg.save_clips = false; continue; }
        if (a == "--no-patch") { cfg.patch_target = false; continue; }
        if (a == "--skip-test") { cfg.run_test = false; continue; }
        if (a == "--normalize") { cfg.normalize_embeddings = true; continue; }
        if (a == "--no-beep") { cfg.beep = false; continue; }

        if (a == "--name") { if (!need_value(cfg.profile_name)) return false; continue; }
        if (a == "--profile-dir") { if (!need_value(cfg.profile_dir)) return false; continue; }
        if (a == "--model") { if (!need_value(cfg.model_path)) return false; continue; }
        if (a == "--device") { if (!need_value(cfg.device_id)) return false; continue; }
        if (a == "--clip-dir") { if (!need_value(cfg.clip_dir)) return false; continue; }
        if (a == "--target") { if (!need_value(cfg.target_path)) return false; continue; }

        if (a == "--phrases") {
            if (!need_value(v)) return false;
            try {
                cfg.phrases = load_phrases(v);
            } catch (const speaker::VoiceprintError& e) {
                error = e.what();
                return false;
            }
            if (cfg.phrases.empty()) {
                error = "phrase file " + v + " has no phrases";
                return false;
            }
            continue;
        }

        try {
            if (a == "--sample-rate") {
                if (!need_value(v)) return false;
                cfg.sample_rate = std::stoi(v);
                if (cfg.sample_rate <= 0) { error = "--sample-rate must be positive"; return false; }
                continue;
            }
            if (a == "--duration") {
                if (!need_value(v)) return false;
                cfg.duration_s = std::stod(v);
                if (cfg.duration_s <= 0.0) { error = "--duration must be positive"; return false; }
                continue;
            }
            if (a == "--threshold") {
                if (!need_value(v)) return false;
                cfg.threshold = std::stof(v);
                if (cfg.threshold < -1.0f || cfg.threshold > 1.0f) {
                    error = "--threshold must be within [-1, 1]";
                    return false;
                }
                continue;
            }
        } catch (const std::logic_error&) {
            error = "invalid number for " + a + ": " + v;
            return false;
        }

        error = "unknown option " + a;
        return false;
    }
    return true;
}
std::string verify_usage(const char* argv0) {
    return std::string("Usage: ") + argv0 + " --profile FILE.npy [options]\n"
        "  --model PATH        speaker embedding ONNX model\n"
        "  --device ID         default | portaudio:<index> | synthetic:<file.wav>\n"
        "  --wav FILE          score a WAV file instead of recording\n"
        "  --duration S        utterance length in seconds (default 3)\n"
        "  --threshold T       match threshold (default 0.55)\n"
        "  -v, --verbose       debug logging\n";
}

bool parse_verify_args(int argc, char** argv, VerifyConfig& cfg, std::string& error, bool& show_help) {
    show_help = false;
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        auto need_value = [&](std::string& out) {
            if (i + 1 >= argc) {
                error = "missing value for " + a;
                return false;
            }
            out = argv[++i];
            return true;
        };
        std::string v;

        if (a == "-h" || a == "--help") { show_help = true; continue; }
        if (a == "-v" || a == "--verbose") { cfg.verbose = true; continue; }
        if (a == "--profile") { if (!need_value(cfg.profile_path)) return false; continue; }
        if (a == "--model") { if (!need_value(cfg.model_path)) return false; continue; }
        if (a == "--device") { if (!need_value(cfg.device_id)) return false; continue; }
        if (a == "--wav") { if (!need_value(cfg.wav_path)) return false; continue; }

        try {
            if (a == "--duration") {
                if (!need_value(v)) return false;
                cfg.duration_s = std::stod(v);
                if (cfg.duration_s <= 0.0) { error = "--duration must be positive"; return false; }
                continue;
            }
            if (a == "--threshold") {
                if (!need_value(v)) return false;
                cfg.threshold = std::stof(v);
                if (cfg.threshold < -1.0f || cfg.threshold > 1.0f) {
                    error = "--threshold must be within [-1, 1]";
                    return false;
                }
                continue;
            }
        } catch (const std::logic_error&) {
            error = "invalid number for " + a + ": " + v;
            return false;
        }

        error = "unknown option " + a;
        return false;
    }
    if (!show_help && cfg.profile_path.empty()) {
        error = "--profile is required";
        return false;
    }
    return true;
}
}
