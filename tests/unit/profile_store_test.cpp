#include <cassert>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include "speaker/profile_store.hpp"

namespace fs = std::filesystem;
using speaker::ErrorKind;
using speaker::ProfileStore;
using speaker::VoiceprintError;

static ErrorKind load_error(const ProfileStore& store, const std::string& path) {
    try {
        store.load(path);
    } catch (const VoiceprintError& e) {
        return e.kind();
    }
    assert(false && "load should have thrown");
    return ErrorKind::EmptyInput;
}

static void write_file(const fs::path& p, const std::string& bytes) {
    std::ofstream out(p, std::ios::binary);
    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
}

int main() {
    const fs::path dir = fs::temp_directory_path() / "voiceprint_profile_store_test";
    fs::remove_all(dir);

    ProfileStore::Config cfg;
    cfg.directory = (dir / "profiles").string();
    ProfileStore store(cfg);

    // Naming
    assert(store.key_for("bronson") == "bronson.npy");
    assert(store.key_for("  alice  ") == "alice.npy");
    assert(store.key_for("") == "my_voiceprint.npy");
    assert(store.key_for("   ") == "my_voiceprint.npy");
    assert(store.key_for("..") == "my_voiceprint.npy");
    assert(store.key_for("../evil") == ".._evil.npy");
    assert(store.key_for("a\\b") == "a_b.npy");

    // Save creates the directory and the file; load restores it exactly
    speaker::VoicePrint vp{0.5f, -1.25f, 3.0f, 1e-7f};
    assert(!store.exists("bronson"));
    std::string path = store.save("bronson", vp);
    assert(path == store.path_for("bronson"));
    assert(store.exists("bronson"));
    assert(!fs::exists(path + ".tmp"));
    assert(store.load(path) == vp);

    // npy header is 64-byte aligned and float32 little-endian
    {
        std::ifstream in(path, std::ios::binary);
        std::string bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        assert(bytes.compare(0, 6, "\x93NUMPY") == 0);
        assert(bytes[6] == 1 && bytes[7] == 0);
        assert(bytes.find("'descr': '<f4'") != std::string::npos);
        assert(bytes.find("'shape': (4,)") != std::string::npos);
        assert((bytes.size() - vp.size() * 4) % 64 == 0);
    }

    // Last write wins
    speaker::VoicePrint vp2{1.0f, 2.0f};
    store.save("bronson", vp2);
    assert(store.load(path) == vp2);

    // In-memory round trip through the stream helpers
    {
        std::stringstream ss;
        ProfileStore::write_npy(ss, vp);
        assert(ProfileStore::read_npy(ss, "memory") == vp);
    }

    // Saving nothing is refused
    bool threw = false;
    try {
        store.save("empty", speaker::VoicePrint{});
    } catch (const VoiceprintError& e) {
        threw = e.kind() == ErrorKind::EmptyInput;
    }
    assert(threw);
    assert(!store.exists("empty"));

    // Load failures
    assert(load_error(store, (dir / "missing.npy").string()) == ErrorKind::FileNotFound);

    write_file(dir / "garbage.npy", "this is not numpy");
    assert(load_error(store, (dir / "garbage.npy").string()) == ErrorKind::CorruptProfile);

    // Truncated payload
    {
        std::stringstream ss;
        ProfileStore::write_npy(ss, vp);
        std::string bytes = ss.str();
        write_file(dir / "short.npy", bytes.substr(0, bytes.size() - 3));
        assert(load_error(store, (dir / "short.npy").string()) == ErrorKind::CorruptProfile);
    }

    // Non-finite values are rejected
    {
        speaker::VoicePrint bad{1.0f, 2.0f};
        std::stringstream ss;
        ProfileStore::write_npy(ss, bad);
        std::string bytes = ss.str();
        const uint32_t nan_bits = 0x7fc00000u;
        std::memcpy(&bytes[bytes.size() - 4], &nan_bits, 4);
        write_file(dir / "nan.npy", bytes);
        assert(load_error(store, (dir / "nan.npy").string()) == ErrorKind::CorruptProfile);
    }

    // Header declares far more values than the file holds
    {
        std::string header = "{'descr': '<f4', 'fortran_order': False, 'shape': (4611686018427387904,), }";
        header.append(64 - (10 + header.size() + 1) % 64, ' ');
        header.push_back('\n');
        std::string bytes = std::string("\x93NUMPY") + '\x01' + '\x00';
        bytes.push_back(static_cast<char>(header.size() & 0xff));
        bytes.push_back(static_cast<char>((header.size() >> 8) & 0xff));
        bytes += header;
        bytes.append(16, '\0');
        write_file(dir / "huge.npy", bytes);
        assert(load_error(store, (dir / "huge.npy").string()) == ErrorKind::CorruptProfile);

        std::stringstream ss(bytes);
        bool corrupt = false;
        try {
            ProfileStore::read_npy(ss, "memory");
        } catch (const VoiceprintError& e) {
            corrupt = e.kind() == ErrorKind::CorruptProfile;
        }
        assert(corrupt);

        // Plausible count, still more than the 4 values present
        std::stringstream small;
        ProfileStore::write_npy(small, speaker::VoicePrint(4, 1.0f));
        std::string four = small.str();
        const size_t at = four.find("(4,)");
        four.replace(at, 4, "(9,)");
        write_file(dir / "overdeclared.npy", four);
        assert(load_error(store, (dir / "overdeclared.npy").string()) == ErrorKind::CorruptProfile);
    }

    // An all-zero voiceprint is never written
    threw = false;
    try {
        store.save("zero", speaker::VoicePrint{0.0f, 0.0f, 0.0f});
    } catch (const VoiceprintError& e) {
        threw = e.kind() == ErrorKind::DegenerateVector;
    }
    assert(threw);
    assert(!store.exists("zero"));
    assert(!fs::exists(store.path_for("zero") + ".tmp"));

    fs::remove_all(dir);
    return 0;
}
