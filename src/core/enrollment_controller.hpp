#pragma once

#include "core/config.hpp"
#include "core/config_patcher.hpp"
#include "speaker/verifier.hpp"

#include <functional>
#include <string>

namespace audio { class ISampleRecorder; }
namespace speaker { class IEmbeddingExtractor; }

namespace core {

/**
 * @brief Steps of one enrollment run, in order. There are no backward
 * transitions; the first three repeat once per phrase.
 */
enum class EnrollState {
    AwaitingPhrase,
    Recording,
    Extracting,
    Aggregating,
    Saving,
    TestRecording,
    TestExtracting,
    Scoring,
    Deciding,
    Patching,
    Done
};

const char* to_string(EnrollState state);

// True once the flow has moved past Saving, i.e. the profile is on disk.
bool profile_saved(EnrollState reached);

/**
 * @brief User interaction points of the flow (console, or a stub in tests)
 */
class IPrompter {
public:
    virtual ~IPrompter() = default;

    virtual void show_phrase(size_t index, size_t total, const std::string& phrase) = 0;
    virtual void show_test_prompt(const std::string& phrase) = 0;

    // Blocks until the speaker is ready.
    virtual void wait_for_ready(const std::string& message) = 0;

    // Countdown / beep right before the microphone opens.
    virtual void before_capture() = 0;

    virtual void clip_saved(const std::string& path) = 0;
};

struct EnrollmentReport {
    std::string profile_key;       ///< sanitized profile name + extension
    std::string artifact_path;
    size_t phrase_count = 0;
    size_t dimension = 0;

    bool tested = false;
    speaker::VerificationResult verification;

    bool patch_attempted = false;
    PatchResult patch;
    std::string patch_error;       ///< non-empty when the rewrite itself failed
};

/**
 * @brief Runs record -> extract for every phrase, aggregates, saves the
 * profile, scores a test utterance and patches the listener script.
 *
 * Enrollment is all-or-nothing: any recorder or extractor failure aborts
 * the run with a VoiceprintError naming the phrase, before anything is
 * written to the profile directory.
 */
class EnrollmentController {
public:
    using StateCallback = std::function<void(EnrollState state, size_t phrase_index)>;

    EnrollmentController(const EnrollConfig& config,
                         audio::ISampleRecorder& recorder,
                         speaker::IEmbeddingExtractor& extractor,
                         IPrompter& prompter);

    void set_state_callback(StateCallback cb) { on_state_ = std::move(cb); }

    EnrollmentReport run();

    EnrollState state() const { return state_; }

private:
    void enter(EnrollState state, size_t phrase_index = 0);
    std::string clip_path(const std::string& file_name) const;

    EnrollConfig config_;
    audio::ISampleRecorder& recorder_;
    speaker::IEmbeddingExtractor& extractor_;
    IPrompter& prompter_;
    StateCallback on_state_;
    EnrollState state_ = EnrollState::AwaitingPhrase;
};

}
