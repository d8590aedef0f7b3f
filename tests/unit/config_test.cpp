#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>
#include "core/config.hpp"

namespace fs = std::filesystem;

static bool parse(std::vector<std::string> args, core::EnrollConfig& cfg, std::string& error, bool& help) {
    std::vector<char*> argv;
    static std::string prog = "voiceprint_enroll";
    argv.push_back(&prog[0]);
    for (auto& a : args) argv.push_back(&a[0]);
    return core::parse_enroll_args(static_cast<int>(argv.size()), argv.data(), cfg, error, help);
}

int main() {
    // Defaults
    core::EnrollConfig cfg;
    assert(cfg.phrases.size() == 7);
    assert(cfg.phrases == core::default_phrases());
    assert(cfg.threshold == 0.55f);
    assert(cfg.sample_rate == 16000);
    assert(cfg.duration_s == 3.0);
    assert(cfg.marker == "np.load(");
    assert(cfg.default_profile_name == "my_voiceprint");

    std::string error;
    bool help = false;

    // Flags
    assert(parse({"--name", "bronson", "--duration", "2.5", "--threshold", "0.7",
                  "--no-patch", "--skip-test", "--device", "synthetic:a.wav", "-v"}, cfg, error, help));
    assert(!help);
    assert(cfg.profile_name == "bronson");
    assert(cfg.duration_s == 2.5);
    assert(cfg.threshold == 0.7f);
    assert(!cfg.patch_target && !cfg.run_test && cfg.verbose);
    assert(cfg.device_id == "synthetic:a.wav");

    core::EnrollConfig h;
    assert(parse({"--help"}, h, error, help) && help);

    // Bad input
    core::EnrollConfig bad;
    assert(!parse({"--bogus"}, bad, error, help));
    assert(error.find("--bogus") != std::string::npos);
    assert(!parse({"--duration"}, bad, error, help));
    assert(!parse({"--duration", "abc"}, bad, error, help));
    assert(!parse({"--duration", "-1"}, bad, error, help));
    assert(!parse({"--threshold", "2"}, bad, error, help));
    assert(!parse({"--phrases", "/nonexistent/phrases.txt"}, bad, error, help));

    assert(core::EnrollConfig().utterance_samples() == 48000);

    // Verify flags; the probe length follows --duration, not the input
    {
        std::vector<std::string> args = {"--profile", "p.npy", "--wav", "long.wav", "--duration", "2"};
        std::vector<char*> argv;
        static std::string prog = "voiceprint_verify";
        argv.push_back(&prog[0]);
        for (auto& a : args) argv.push_back(&a[0]);
        core::VerifyConfig vc;
        assert(vc.utterance_samples() == 48000);
        assert(core::parse_verify_args(static_cast<int>(argv.size()), argv.data(), vc, error, help));
        assert(vc.profile_path == "p.npy" && vc.wav_path == "long.wav");
        assert(vc.utterance_samples() == 32000);

        core::VerifyConfig missing;
        std::vector<char*> bare{&prog[0]};
        assert(!core::parse_verify_args(1, bare.data(), missing, error, help));
        assert(error.find("--profile") != std::string::npos);
    }

    // Phrase file: blank lines skipped
    const fs::path dir = fs::temp_directory_path() / "voiceprint_config_test";
    fs::create_directories(dir);
    const fs::path phrases = dir / "phrases.txt";
    {
        std::ofstream out(phrases);
        out << "first line\n\n   \r\nsecond line\r\n";
    }
    auto loaded = core::load_phrases(phrases.string());
    assert(loaded.size() == 2);
    assert(loaded[0] == "first line" && loaded[1] == "second line");

    core::EnrollConfig with_file;
    assert(parse({"--phrases", phrases.string()}, with_file, error, help));
    assert(with_file.phrases == loaded);

    // Home expansion
    const char* home = std::getenv("HOME");
    if (home && *home) {
        assert(core::expand_user_path("~/x.py") == std::string(home) + "/x.py");
        assert(core::expand_user_path("~") == std::string(home));
    }
    assert(core::expand_user_path("/abs/x.py") == "/abs/x.py");
    assert(core::expand_user_path("~other/x.py") == "~other/x.py");

    fs::remove_all(dir);
    return 0;
}
