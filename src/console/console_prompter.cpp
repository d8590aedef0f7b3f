#include "console/console_prompter.hpp"
#include <chrono>
#include <iostream>
#include <string>
#include <thread>

namespace console {

namespace color {
    const char* RESET = "\033[0m";
    const char* BOLD = "\033[1m";
    const char* RED = "\033[91m";
    const char* GREEN = "\033[92m";
    const char* CYAN = "\033[96m";
}

void print_banner(std::ostream& out) {
    out << color::CYAN << color::BOLD
        << "╔══════════════════════════════════════════════════╗\n"
        << "║                 VOICEPRINT ENROLL                ║\n"
        << "╚══════════════════════════════════════════════════╝\n"
        << color::RESET << "\n";
}

ConsolePrompter::ConsolePrompter(std::istream& in, std::ostream& out, bool beep)
    : in_(in), out_(out), beep_(beep) {}

void ConsolePrompter::show_phrase(size_t index, size_t total, const std::string& phrase) {
    out_ << color::CYAN << "Line " << index << "/" << total << ":" << color::RESET << "\n"
         << color::BOLD << "\"" << phrase << "\"" << color::RESET << "\n";
}

void ConsolePrompter::show_test_prompt(const std::string& phrase) {
    out_ << "\n" << color::CYAN << "Let's test it. Say: '" << phrase << "'" << color::RESET << "\n";
}

void ConsolePrompter::wait_for_ready(const std::string& message) {
    out_ << color::CYAN << "   " << message << color::RESET << std::flush;
    std::string ignored;
    std::getline(in_, ignored);
}

void ConsolePrompter::before_capture() {
    out_ << "   Recording in:" << std::flush;
    for (int c = 3; c >= 1; --c) {
        out_ << " " << c << "..." << std::flush;
        std::this_thread::sleep_for(std::chrono::milliseconds(700));
    }
    out_ << "\n";
    if (beep_) {
        out_ << '\a';
    }
    out_ << "   Speak now!" << std::endl;
}

void ConsolePrompter::clip_saved(const std::string& path) {
    out_ << "   " << color::GREEN << "Saved: " << path << color::RESET << "\n\n";
}

std::string ConsolePrompter::ask(const std::string& question) {
    out_ << color::CYAN << question << color::RESET << std::flush;
    std::string line;
    std::getline(in_, line);
    const size_t b = line.find_first_not_of(" \t\r");
    if (b == std::string::npos) return "";
    const size_t e = line.find_last_not_of(" \t\r");
    return line.substr(b, e - b + 1);
}

} // namespace console
