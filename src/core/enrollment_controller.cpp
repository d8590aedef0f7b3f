#include "core/enrollment_controller.hpp"
#include "core/logging.hpp"
#include "audio/sample_recorder.hpp"
#include "audio/wav_io.hpp"
#include "speaker/aggregator.hpp"
#include "speaker/embedding_extractor.hpp"
#include "speaker/profile_store.hpp"

#include <cmath>
#include <cstdio>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace core {

namespace {

// Prefix a pipeline error with the step it came from, keeping its kind.
[[noreturn]] void rethrow_with_context(const std::string& step, const std::exception& e,
                                       speaker::ErrorKind fallback) {
    if (auto* ve = dynamic_cast<const speaker::VoiceprintError*>(&e)) {
        throw speaker::VoiceprintError(ve->kind(), step + ": " + ve->what());
    }
    throw speaker::VoiceprintError(fallback, step + ": " + e.what());
}

std::string phrase_step(size_t index, size_t total) {
    return "phrase " + std::to_string(index) + "/" + std::to_string(total);
}

}

bool profile_saved(EnrollState reached) {
    return reached > EnrollState::Saving;
}

const char* to_string(EnrollState state) {
    switch (state) {
        case EnrollState::AwaitingPhrase: return "AwaitingPhrase";
        case EnrollState::Recording:      return "Recording";
        case EnrollState::Extracting:     return "Extracting";
        case EnrollState::Aggregating:    return "Aggregating";
        case EnrollState::Saving:         return "Saving";
        case EnrollState::TestRecording:  return "TestRecording";
        case EnrollState::TestExtracting: return "TestExtracting";
        case EnrollState::Scoring:        return "Scoring";
        case EnrollState::Deciding:       return "Deciding";
        case EnrollState::Patching:       return "Patching";
        case EnrollState::Done:           return "Done";
    }
    return "Unknown";
}

EnrollmentController::EnrollmentController(const EnrollConfig& config,
                                           audio::ISampleRecorder& recorder,
                                           speaker::IEmbeddingExtractor& extractor,
                                           IPrompter& prompter)
    : config_(config), recorder_(recorder), extractor_(extractor), prompter_(prompter) {}

void EnrollmentController::enter(EnrollState state, size_t phrase_index) {
    state_ = state;
    log_debug(std::string("[Enroll] -> ") + to_string(state) +
              (phrase_index ? " (" + std::to_string(phrase_index) + ")" : std::string()));
    if (on_state_) {
        on_state_(state, phrase_index);
    }
}

std::string EnrollmentController::clip_path(const std::string& file_name) const {
    return (fs::path(config_.clip_dir) / file_name).string();
}

EnrollmentReport EnrollmentController::run() {
    const size_t total = config_.phrases.size();
    if (total == 0) {
        throw speaker::VoiceprintError(speaker::ErrorKind::EmptyInput, "no enrollment phrases configured");
    }

    audio::RecordingSpec spec;
    spec.sample_rate = config_.sample_rate;
    spec.duration_s = config_.duration_s;
    spec.channels = config_.channels;

    if (config_.save_clips && !config_.clip_dir.empty()) {
        std::error_code ec;
        fs::create_directories(config_.clip_dir, ec);
        if (ec) {
            throw speaker::VoiceprintError(speaker::ErrorKind::FileWriteError,
                "cannot create clip directory " + config_.clip_dir + ": " + ec.message());
        }
    }

    std::vector<speaker::Embedding> embeddings;
    embeddings.reserve(total);

    for (size_t i = 1; i <= total; ++i) {
        const std::string step = phrase_step(i, total);

        enter(EnrollState::AwaitingPhrase, i);
        prompter_.show_phrase(i, total, config_.phrases[i - 1]);
        prompter_.wait_for_ready("Press Enter to begin...");
        prompter_.before_capture();

        enter(EnrollState::Recording, i);
        audio::AudioBuffer buffer;
        try {
            buffer = recorder_.record(spec);
        } catch (const std::exception& e) {
            rethrow_with_context(step + ": recording failed", e, speaker::ErrorKind::DeviceError);
        }

        if (config_.save_clips) {
            char name[32];
            std::snprintf(name, sizeof(name), "voice_%02zu.wav", i);
            const std::string path = clip_path(name);
            if (!audio::write_wav_pcm16(path, buffer)) {
                throw speaker::VoiceprintError(speaker::ErrorKind::FileWriteError,
                    step + ": cannot write " + path);
            }
            prompter_.clip_saved(path);
        }

        enter(EnrollState::Extracting, i);
        try {
            embeddings.push_back(extractor_.extract(buffer));
        } catch (const std::exception& e) {
            rethrow_with_context(step + ": extraction failed", e, speaker::ErrorKind::ExtractorError);
        }
    }

    EnrollmentReport report;
    report.phrase_count = total;

    enter(EnrollState::Aggregating);
    const speaker::VoicePrint voiceprint = speaker::aggregate(embeddings);
    report.dimension = voiceprint.size();
    double norm_sq = 0.0;
    for (float v : voiceprint) norm_sq += static_cast<double>(v) * v;
    if (norm_sq == 0.0) {
        throw speaker::VoiceprintError(speaker::ErrorKind::DegenerateVector,
            "aggregated voiceprint has zero norm, nothing was saved");
    }

    enter(EnrollState::Saving);
    speaker::ProfileStore::Config store_config;
    store_config.directory = config_.profile_dir;
    store_config.default_name = config_.default_profile_name;
    speaker::ProfileStore store(store_config);
    report.profile_key = store.key_for(config_.profile_name);
    report.artifact_path = store.save(config_.profile_name, voiceprint);
    log_info("Voice profile saved as " + report.artifact_path);

    if (config_.run_test) {
        enter(EnrollState::TestRecording);
        prompter_.show_test_prompt(config_.test_phrase);
        prompter_.wait_for_ready("Press Enter when ready...");
        prompter_.before_capture();

        audio::AudioBuffer probe_audio;
        try {
            probe_audio = recorder_.record(spec);
        } catch (const std::exception& e) {
            rethrow_with_context("test step: recording failed", e, speaker::ErrorKind::DeviceError);
        }
        if (config_.save_clips) {
            const std::string path = clip_path("test_clip.wav");
            if (!audio::write_wav_pcm16(path, probe_audio)) {
                throw speaker::VoiceprintError(speaker::ErrorKind::FileWriteError,
                    "test step: cannot write " + path);
            }
            prompter_.clip_saved(path);
        }

        enter(EnrollState::TestExtracting);
        speaker::Embedding probe;
        try {
            probe = extractor_.extract(probe_audio);
        } catch (const std::exception& e) {
            rethrow_with_context("test step: extraction failed", e, speaker::ErrorKind::ExtractorError);
        }

        enter(EnrollState::Scoring);
        try {
            report.verification.score = speaker::score(probe, voiceprint);
        } catch (const std::exception& e) {
            rethrow_with_context("test step: scoring failed", e, speaker::ErrorKind::DegenerateVector);
        }

        enter(EnrollState::Deciding);
        report.verification.decision = speaker::decide(report.verification.score, config_.threshold);
        report.tested = true;

        std::ostringstream msg;
        msg << "Voice match score: " << std::fixed << std::setprecision(3) << report.verification.score
            << " (" << speaker::to_string(report.verification.decision) << " at threshold "
            << std::setprecision(2) << config_.threshold << ")";
        log_info(msg.str());
    }

    if (config_.patch_target) {
        enter(EnrollState::Patching);
        report.patch_attempted = true;

        ConfigPatcher::Config patch_config;
        patch_config.marker = config_.marker;
        patch_config.replacement_template = config_.replacement_template;
        ConfigPatcher patcher(patch_config);

        const std::string target = expand_user_path(config_.target_path);
        std::error_code ec;
        std::string artifact = fs::absolute(report.artifact_path, ec).lexically_normal().string();
        if (ec) artifact = report.artifact_path;

        try {
            report.patch = patcher.patch_reference(target, artifact);
        } catch (const std::exception& e) {
            report.patch = PatchResult::write_failed();
            report.patch_error = e.what();
        }

        if (!report.patch_error.empty()) {
            log_warn("Could not patch " + target + ": " + report.patch_error);
        } else if (report.patch.status == PatchResult::Status::Patched) {
            log_info("Auto-patched " + target + " to use " + artifact);
        } else if (report.patch.status == PatchResult::Status::NotFound) {
            log_warn("Could not locate " + target + " to auto-patch");
        } else {
            log_warn("No profile load line (" + config_.marker + ") found in " + target);
        }
    }

    enter(EnrollState::Done);
    return report;
}

}
