#include <cassert>
#include <cmath>
#include <string>
#include "speaker/verifier.hpp"

using speaker::Decision;
using speaker::ErrorKind;
using speaker::VoiceprintError;

static ErrorKind score_error(const speaker::Embedding& p, const speaker::VoicePrint& r) {
    try {
        speaker::score(p, r);
    } catch (const VoiceprintError& e) {
        return e.kind();
    }
    assert(false && "score should have thrown");
    return ErrorKind::EmptyInput;
}

int main() {
    // Identical and scaled vectors score 1
    assert(std::fabs(speaker::score({1.0f, 2.0f, 3.0f}, {1.0f, 2.0f, 3.0f}) - 1.0f) < 1e-6f);
    assert(std::fabs(speaker::score({1.0f, 2.0f, 3.0f}, {10.0f, 20.0f, 30.0f}) - 1.0f) < 1e-6f);

    // Orthogonal and opposite
    assert(std::fabs(speaker::score({1.0f, 0.0f}, {0.0f, 1.0f})) < 1e-6f);
    assert(std::fabs(speaker::score({1.0f, 0.0f}, {-1.0f, 0.0f}) + 1.0f) < 1e-6f);

    // Symmetric
    speaker::Embedding p{0.3f, -0.7f, 0.2f};
    speaker::Embedding r{0.1f, 0.4f, 0.9f};
    assert(speaker::score(p, r) == speaker::score(r, p));

    // Always within [-1, 1]
    float s = speaker::score({1e-20f, 1e-20f}, {1e-20f, 1e-20f});
    assert(s <= 1.0f && s >= -1.0f);

    // Strictly greater than the threshold
    assert(speaker::decide(0.56f) == Decision::Match);
    assert(speaker::decide(0.55f) == Decision::NoMatch);
    assert(speaker::decide(0.2f) == Decision::NoMatch);
    assert(speaker::decide(0.5f, 0.4f) == Decision::Match);
    assert(speaker::kDefaultMatchThreshold == 0.55f);

    // Reference [0.5, 0.5] from enrolling [1, 0] and [0, 1]
    const speaker::VoicePrint mean{0.5f, 0.5f};
    auto same = speaker::verify({0.5f, 0.5f}, mean);
    assert(std::fabs(same.score - 1.0f) < 1e-6f);
    assert(same.decision == Decision::Match);
    auto opposite = speaker::verify({-0.5f, -0.5f}, mean);
    assert(std::fabs(opposite.score + 1.0f) < 1e-6f);
    assert(opposite.decision == Decision::NoMatch);

    auto res = speaker::verify({1.0f, 0.0f}, {1.0f, 0.0f});
    assert(res.decision == Decision::Match);
    res = speaker::verify({1.0f, 0.0f}, {0.0f, 1.0f});
    assert(res.decision == Decision::NoMatch);
    assert(std::string(speaker::to_string(Decision::Match)) == "MATCH");
    assert(std::string(speaker::to_string(Decision::NoMatch)) == "NO_MATCH");

    // Errors
    assert(score_error({1.0f, 2.0f}, {1.0f, 2.0f, 3.0f}) == ErrorKind::DimensionMismatch);
    assert(score_error({0.0f, 0.0f}, {1.0f, 2.0f}) == ErrorKind::DegenerateVector);
    assert(score_error({1.0f, 2.0f}, {0.0f, 0.0f}) == ErrorKind::DegenerateVector);
    assert(score_error({}, {}) == ErrorKind::DegenerateVector);
    return 0;
}
