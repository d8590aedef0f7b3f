#include "speaker/profile_store.hpp"
#include "core/logging.hpp"

#include <cctype>
#include <cmath>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace speaker {

namespace {

const char kNpyMagic[] = "\x93NUMPY";
constexpr size_t kNpyMagicLen = 6;
constexpr size_t kNpyAlignment = 64;
constexpr size_t kMaxDimension = size_t(1) << 20;

VoiceprintError corrupt(const std::string& origin, const std::string& what) {
    return VoiceprintError(ErrorKind::CorruptProfile, "corrupt profile " + origin + ": " + what);
}

std::string trim(const std::string& s) {
    size_t b = 0, e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

// Value of a key in the npy header dict, e.g. 'descr' -> "'<f4'".
bool header_value(const std::string& header, const std::string& key, std::string& value) {
    const std::string quoted = "'" + key + "'";
    size_t pos = header.find(quoted);
    if (pos == std::string::npos) return false;
    pos = header.find(':', pos + quoted.size());
    if (pos == std::string::npos) return false;
    ++pos;
    while (pos < header.size() && header[pos] == ' ') ++pos;
    if (pos >= header.size()) return false;

    size_t end;
    if (header[pos] == '(') {
        end = header.find(')', pos);
        if (end == std::string::npos) return false;
        ++end;
    } else if (header[pos] == '\'') {
        end = header.find('\'', pos + 1);
        if (end == std::string::npos) return false;
        ++end;
    } else {
        end = header.find_first_of(",}", pos);
        if (end == std::string::npos) return false;
    }
    value = trim(header.substr(pos, end - pos));
    return true;
}

std::vector<size_t> parse_shape(const std::string& tuple, const std::string& origin) {
    if (tuple.size() < 2 || tuple.front() != '(' || tuple.back() != ')') {
        throw corrupt(origin, "malformed shape " + tuple);
    }
    std::vector<size_t> dims;
    std::stringstream ss(tuple.substr(1, tuple.size() - 2));
    std::string item;
    while (std::getline(ss, item, ',')) {
        item = trim(item);
        if (item.empty()) continue;
        for (char c : item) {
            if (!std::isdigit(static_cast<unsigned char>(c))) {
                throw corrupt(origin, "malformed shape " + tuple);
            }
        }
        try {
            dims.push_back(static_cast<size_t>(std::stoull(item)));
        } catch (const std::exception&) {
            throw corrupt(origin, "malformed shape " + tuple);
        }
    }
    return dims;
}

uint32_t read_le32(const unsigned char* p) {
    return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) | (static_cast<uint32_t>(p[3]) << 24);
}

uint64_t read_le64(const unsigned char* p) {
    return static_cast<uint64_t>(read_le32(p)) | (static_cast<uint64_t>(read_le32(p + 4)) << 32);
}

} // namespace

ProfileStore::ProfileStore() : ProfileStore(Config{}) {}

ProfileStore::ProfileStore(const Config& config) : m_config(config) {}

std::string ProfileStore::sanitize_name(const std::string& name) const {
    std::string clean = trim(name);
    if (clean.empty()) {
        clean = m_config.default_name;
    }
    for (char& c : clean) {
        const unsigned char uc = static_cast<unsigned char>(c);
        if (c == '/' || c == '\\' || std::iscntrl(uc)) {
            c = '_';
        }
    }
    // "." and ".." would escape the profile directory
    if (clean == "." || clean == "..") {
        clean = m_config.default_name;
    }
    return clean;
}

std::string ProfileStore::key_for(const std::string& name) const {
    return sanitize_name(name) + m_config.extension;
}

std::string ProfileStore::path_for(const std::string& name) const {
    return (fs::path(m_config.directory) / key_for(name)).string();
}

bool ProfileStore::exists(const std::string& name) const {
    std::error_code ec;
    return fs::is_regular_file(path_for(name), ec);
}

void ProfileStore::write_npy(std::ostream& out, const VoicePrint& voiceprint) {
    std::string header = "{'descr': '<f4', 'fortran_order': False, 'shape': (" +
                         std::to_string(voiceprint.size()) + ",), }";
    // magic + version (2) + header length (2) + header + '\n'
    const size_t unpadded = kNpyMagicLen + 2 + 2 + header.size() + 1;
    const size_t padding = (kNpyAlignment - unpadded % kNpyAlignment) % kNpyAlignment;
    header.append(padding, ' ');
    header.push_back('\n');

    out.write(kNpyMagic, kNpyMagicLen);
    const unsigned char version[2] = {1, 0};
    out.write(reinterpret_cast<const char*>(version), 2);
    const unsigned char hlen[2] = {
        static_cast<unsigned char>(header.size() & 0xff),
        static_cast<unsigned char>((header.size() >> 8) & 0xff)
    };
    out.write(reinterpret_cast<const char*>(hlen), 2);
    out.write(header.data(), static_cast<std::streamsize>(header.size()));

    for (float v : voiceprint) {
        uint32_t bits;
        std::memcpy(&bits, &v, sizeof(bits));
        const unsigned char bytes[4] = {
            static_cast<unsigned char>(bits & 0xff),
            static_cast<unsigned char>((bits >> 8) & 0xff),
            static_cast<unsigned char>((bits >> 16) & 0xff),
            static_cast<unsigned char>((bits >> 24) & 0xff)
        };
        out.write(reinterpret_cast<const char*>(bytes), 4);
    }
}

VoicePrint ProfileStore::read_npy(std::istream& in, const std::string& origin) {
    char magic[kNpyMagicLen];
    if (!in.read(magic, kNpyMagicLen) || std::memcmp(magic, kNpyMagic, kNpyMagicLen) != 0) {
        throw corrupt(origin, "missing npy magic");
    }

    unsigned char version[2];
    if (!in.read(reinterpret_cast<char*>(version), 2)) {
        throw corrupt(origin, "truncated header");
    }

    size_t header_len = 0;
    if (version[0] == 1) {
        unsigned char hlen[2];
        if (!in.read(reinterpret_cast<char*>(hlen), 2)) throw corrupt(origin, "truncated header");
        header_len = static_cast<size_t>(hlen[0]) | (static_cast<size_t>(hlen[1]) << 8);
    } else if (version[0] == 2) {
        unsigned char hlen[4];
        if (!in.read(reinterpret_cast<char*>(hlen), 4)) throw corrupt(origin, "truncated header");
        header_len = read_le32(hlen);
    } else {
        throw corrupt(origin, "unsupported npy version " + std::to_string(version[0]));
    }

    std::string header(header_len, '\0');
    if (header_len == 0 || !in.read(&header[0], static_cast<std::streamsize>(header_len))) {
        throw corrupt(origin, "truncated header");
    }

    std::string descr, fortran, shape;
    if (!header_value(header, "descr", descr) ||
        !header_value(header, "fortran_order", fortran) ||
        !header_value(header, "shape", shape)) {
        throw corrupt(origin, "incomplete header");
    }

    size_t item_size;
    if (descr == "'<f4'") {
        item_size = 4;
    } else if (descr == "'<f8'") {
        item_size = 8;
    } else {
        throw corrupt(origin, "unsupported dtype " + descr);
    }
    if (fortran != "False") {
        throw corrupt(origin, "fortran_order arrays are not supported");
    }

    std::vector<size_t> dims = parse_shape(shape, origin);
    size_t count = 0;
    if (dims.size() == 1) {
        count = dims[0];
    } else if (dims.size() == 2 && dims[0] == 1) {
        count = dims[1];
    } else {
        throw corrupt(origin, "expected a vector, got shape " + shape);
    }
    if (count == 0) {
        throw corrupt(origin, "voiceprint has zero length");
    }

    // The declared shape must fit in what is actually left of the stream
    if (count > kMaxDimension) {
        throw corrupt(origin, "shape " + shape + " is too large");
    }
    const std::streampos data_begin = in.tellg();
    if (data_begin != std::streampos(-1)) {
        in.seekg(0, std::ios::end);
        const std::streampos data_end = in.tellg();
        in.seekg(data_begin);
        if (data_end == std::streampos(-1) || !in) {
            throw corrupt(origin, "cannot determine data size");
        }
        const auto available = static_cast<unsigned long long>(data_end - data_begin);
        if (static_cast<unsigned long long>(count) > available / item_size) {
            throw corrupt(origin, "truncated data, expected " + std::to_string(count) + " values");
        }
    }

    std::vector<unsigned char> raw(count * item_size);
    if (!in.read(reinterpret_cast<char*>(raw.data()), static_cast<std::streamsize>(raw.size()))) {
        throw corrupt(origin, "truncated data, expected " + std::to_string(count) + " values");
    }

    VoicePrint voiceprint(count);
    for (size_t i = 0; i < count; ++i) {
        const unsigned char* p = raw.data() + i * item_size;
        double value;
        if (item_size == 4) {
            const uint32_t bits = read_le32(p);
            float f;
            std::memcpy(&f, &bits, sizeof(f));
            value = f;
        } else {
            const uint64_t bits = read_le64(p);
            std::memcpy(&value, &bits, sizeof(value));
        }
        if (!std::isfinite(value)) {
            throw corrupt(origin, "non-finite value at index " + std::to_string(i));
        }
        voiceprint[i] = static_cast<float>(value);
    }
    return voiceprint;
}

std::string ProfileStore::save(const std::string& name, const VoicePrint& voiceprint) const {
    if (voiceprint.empty()) {
        throw VoiceprintError(ErrorKind::EmptyInput, "refusing to save an empty voiceprint");
    }
    bool all_zero = true;
    for (float v : voiceprint) {
        if (v != 0.0f) {
            all_zero = false;
            break;
        }
    }
    if (all_zero) {
        throw VoiceprintError(ErrorKind::DegenerateVector, "refusing to save an all-zero voiceprint");
    }

    const fs::path target = path_for(name);
    const fs::path tmp = target.string() + ".tmp";

    std::error_code ec;
    if (!m_config.directory.empty()) {
        fs::create_directories(m_config.directory, ec);
        if (ec) {
            throw VoiceprintError(ErrorKind::FileWriteError,
                "cannot create profile directory " + m_config.directory + ": " + ec.message());
        }
    }

    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw VoiceprintError(ErrorKind::FileWriteError, "cannot open " + tmp.string() + " for writing");
        }
        write_npy(out, voiceprint);
        out.flush();
        if (!out) {
            out.close();
            fs::remove(tmp, ec);
            throw VoiceprintError(ErrorKind::FileWriteError, "failed writing " + tmp.string());
        }
    }

    fs::rename(tmp, target, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        throw VoiceprintError(ErrorKind::FileWriteError,
            "cannot replace " + target.string() + ": " + ec.message());
    }

    core::log_debug("[ProfileStore] wrote " + std::to_string(voiceprint.size()) +
                    "-dim voiceprint to " + target.string());
    return target.string();
}

VoicePrint ProfileStore::load(const std::string& artifact_path) const {
    std::error_code ec;
    if (!fs::is_regular_file(artifact_path, ec)) {
        throw VoiceprintError(ErrorKind::FileNotFound, "profile not found: " + artifact_path);
    }
    std::ifstream in(artifact_path, std::ios::binary);
    if (!in) {
        throw VoiceprintError(ErrorKind::FileNotFound, "cannot open profile " + artifact_path);
    }
    VoicePrint voiceprint = read_npy(in, artifact_path);
    core::log_debug("[ProfileStore] loaded " + std::to_string(voiceprint.size()) +
                    "-dim voiceprint from " + artifact_path);
    return voiceprint;
}

} // namespace speaker
