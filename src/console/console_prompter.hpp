#pragma once

#include "core/enrollment_controller.hpp"
#include <iosfwd>

namespace console {

// Color codes for terminal output
namespace color {
    extern const char* RESET;
    extern const char* BOLD;
    extern const char* RED;
    extern const char* GREEN;
    extern const char* CYAN;
}

void print_banner(std::ostream& out);

/**
 * Terminal prompts for the enrollment flow: phrase cards, "press Enter",
 * a 3-2-1 countdown and a bell before each capture.
 */
class ConsolePrompter : public core::IPrompter {
public:
    ConsolePrompter(std::istream& in, std::ostream& out, bool beep);

    void show_phrase(size_t index, size_t total, const std::string& phrase) override;
    void show_test_prompt(const std::string& phrase) override;
    void wait_for_ready(const std::string& message) override;
    void before_capture() override;
    void clip_saved(const std::string& path) override;

    // Reads one trimmed line after printing the question.
    std::string ask(const std::string& question);

private:
    std::istream& in_;
    std::ostream& out_;
    bool beep_;
};

} // namespace console
