#include "core/logging.hpp"
#include <atomic>
#include <iostream>

namespace core {

namespace {
std::atomic<bool> g_verbose{false};
}

void set_verbose(bool on) { g_verbose.store(on); }
bool is_verbose() { return g_verbose.load(); }

void log_debug(const std::string& msg) {
    if (g_verbose.load()) std::cerr << "[DEBUG] " << msg << std::endl;
}
void log_info(const std::string& msg) { std::cout << "[INFO] " << msg << std::endl; }
void log_warn(const std::string& msg) { std::cerr << "[WARN] " << msg << std::endl; }
void log_error(const std::string& msg) { std::cerr << "[ERROR] " << msg << std::endl; }
}
