#include "core/config_patcher.hpp"
#include "core/logging.hpp"
#include "speaker/embedding.hpp"

#include <filesystem>
#include <fstream>
#include <iterator>
#include <system_error>

namespace fs = std::filesystem;

namespace core {

namespace {

speaker::VoiceprintError write_error(const std::string& what) {
    return speaker::VoiceprintError(speaker::ErrorKind::FileWriteError, what);
}

// Quote-safe inside a double-quoted Python string literal
std::string escape_for_literal(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        if (c == '\\' || c == '"') out.push_back('\\');
        out.push_back(c);
    }
    return out;
}

}

const char* to_string(PatchResult::Status status) {
    switch (status) {
        case PatchResult::Status::Patched:       return "Patched";
        case PatchResult::Status::NotFound:      return "NotFound";
        case PatchResult::Status::NoMarkerFound: return "NoMarkerFound";
        case PatchResult::Status::WriteFailed:   return "WriteFailed";
    }
    return "Unknown";
}

ConfigPatcher::ConfigPatcher() : ConfigPatcher(Config{}) {}

ConfigPatcher::ConfigPatcher(const Config& config) : config_(config) {}

std::vector<std::string> ConfigPatcher::split_lines(const std::string& content) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (start < content.size()) {
        size_t nl = content.find('\n', start);
        if (nl == std::string::npos) {
            lines.push_back(content.substr(start));
            break;
        }
        lines.push_back(content.substr(start, nl - start + 1));
        start = nl + 1;
    }
    return lines;
}

std::string ConfigPatcher::render_line(const std::string& original_line, const std::string& artifact_key) const {
    std::string ending;
    std::string body = original_line;
    if (body.size() >= 2 && body.compare(body.size() - 2, 2, "\r\n") == 0) {
        ending = "\r\n";
        body.resize(body.size() - 2);
    } else if (!body.empty() && body.back() == '\n') {
        ending = "\n";
        body.pop_back();
    }

    std::string indent;
    if (config_.keep_indent) {
        size_t n = body.find_first_not_of(" \t");
        indent = body.substr(0, n == std::string::npos ? body.size() : n);
    }

    std::string rendered = config_.replacement_template;
    const std::string placeholder = "{key}";
    const std::string key = escape_for_literal(artifact_key);
    for (size_t pos = rendered.find(placeholder); pos != std::string::npos;
         pos = rendered.find(placeholder, pos + key.size())) {
        rendered.replace(pos, placeholder.size(), key);
    }
    return indent + rendered + ending;
}

PatchResult ConfigPatcher::patch_reference(const std::string& target_path, const std::string& artifact_key) const {
    std::error_code ec;
    if (!fs::is_regular_file(target_path, ec)) {
        return PatchResult::not_found();
    }

    std::string content;
    {
        std::ifstream in(target_path, std::ios::binary);
        if (!in) {
            return PatchResult::not_found();
        }
        content.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
        if (in.bad()) {
            throw speaker::VoiceprintError(speaker::ErrorKind::FileNotFound, "cannot read " + target_path);
        }
    }

    std::vector<std::string> lines = split_lines(content);
    size_t changed = 0;
    for (auto& line : lines) {
        if (!config_.marker.empty() && line.find(config_.marker) != std::string::npos) {
            line = render_line(line, artifact_key);
            ++changed;
        }
    }
    if (changed == 0) {
        return PatchResult::no_marker_found();
    }

    // Write through symlinks: the temp file goes next to the real file
    fs::path target = fs::canonical(target_path, ec);
    if (ec) {
        target = target_path;
        ec.clear();
    }
    const fs::path tmp = target.string() + ".patch-tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw write_error("cannot create " + tmp.string());
        }
        for (const auto& line : lines) {
            out.write(line.data(), static_cast<std::streamsize>(line.size()));
        }
        out.flush();
        if (!out) {
            out.close();
            fs::remove(tmp, ec);
            throw write_error("failed writing " + tmp.string());
        }
    }

    const fs::perms perms = fs::status(target, ec).permissions();
    if (!ec) {
        fs::permissions(tmp, perms, ec);
    }

    fs::rename(tmp, target, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        throw write_error("cannot replace " + target_path + ": " + ec.message());
    }

    log_debug("[ConfigPatcher] rewrote " + std::to_string(changed) + " line(s) in " + target_path);
    return PatchResult::patched(changed);
}

}
