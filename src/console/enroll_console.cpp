// Interactive voice enrollment: N phrases -> voiceprint -> test -> patch listener
#include <iomanip>
#include <iostream>
#include <string>

#include "audio/sample_recorder.hpp"
#include "console/console_prompter.hpp"
#include "core/config.hpp"
#include "core/enrollment_controller.hpp"
#include "core/logging.hpp"
#include "speaker/onnx_embedder.hpp"
#include "speaker/profile_store.hpp"

int main(int argc, char** argv) {
    core::EnrollConfig cfg;
    std::string error;
    bool show_help = false;
    if (!core::parse_enroll_args(argc, argv, cfg, error, show_help)) {
        std::cerr << error << "\n\n" << core::enroll_usage(argv[0]);
        return 2;
    }
    if (show_help) {
        std::cout << core::enroll_usage(argv[0]);
        return 0;
    }
    core::set_verbose(cfg.verbose);

    console::ConsolePrompter prompter(std::cin, std::cout, cfg.beep);
    console::print_banner(std::cout);

    if (cfg.profile_name.empty()) {
        cfg.profile_name = prompter.ask("Enter a name for this voice profile (e.g. 'bronson'): ");
    }
    speaker::ProfileStore::Config store_config;
    store_config.directory = cfg.profile_dir;
    store_config.default_name = cfg.default_profile_name;
    const speaker::ProfileStore store(store_config);
    const std::string artifact_path = store.path_for(cfg.profile_name);
    if (store.exists(cfg.profile_name)) {
        core::log_warn("Profile " + artifact_path + " exists and will be replaced");
    }

    std::cout << "\n" << console::color::CYAN << "You'll speak " << cfg.phrases.size()
              << " training phrases. Each will be recorded and analyzed."
              << console::color::RESET << "\n\n";

    core::EnrollState reached = core::EnrollState::AwaitingPhrase;

    try {
        speaker::OnnxSpeakerEmbedder::Config emb_config;
        emb_config.model_path = cfg.model_path;
        emb_config.sample_rate = cfg.sample_rate;
        emb_config.target_length_samples = cfg.utterance_samples();
        emb_config.normalize_output = cfg.normalize_embeddings;
        emb_config.verbose = cfg.verbose;
        speaker::OnnxSpeakerEmbedder embedder(emb_config);

        audio::SampleRecorder::Config rec_config;
        rec_config.device_id = cfg.device_id;
        rec_config.verbose = cfg.verbose;
        audio::SampleRecorder recorder(rec_config);

        core::EnrollmentController controller(cfg, recorder, embedder, prompter);
        controller.set_state_callback([&reached](core::EnrollState state, size_t) { reached = state; });
        core::EnrollmentReport report = controller.run();

        if (report.tested) {
            std::cout << "\n" << console::color::CYAN << "Voice match score: " << console::color::BOLD
                      << std::fixed << std::setprecision(3) << report.verification.score
                      << console::color::RESET << "\n";
            if (report.verification.decision == speaker::Decision::Match) {
                std::cout << console::color::GREEN << "Voice match confirmed."
                          << console::color::RESET << "\n";
            } else {
                std::cout << console::color::RED
                          << "Voice mismatch. Consider re-training or adjusting sensitivity."
                          << console::color::RESET << "\n";
            }
        }

        std::cout << "\n" << console::color::BOLD << "Enrollment complete." << console::color::RESET << "\n\n";
        return 0;
    } catch (const speaker::VoiceprintError& e) {
        core::log_error(std::string(speaker::to_string(e.kind())) + ": " + e.what());
        if (core::profile_saved(reached)) {
            core::log_error("Enrollment stopped during " + std::string(core::to_string(reached)) +
                            "; the profile was already saved as " + artifact_path);
        } else {
            core::log_error("Enrollment aborted, no profile was produced");
        }
        return 1;
    } catch (const std::exception& e) {
        core::log_error(e.what());
        return 1;
    }
}
