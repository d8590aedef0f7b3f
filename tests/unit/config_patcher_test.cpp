#include <cassert>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include "core/config_patcher.hpp"
#include "speaker/embedding.hpp"

namespace fs = std::filesystem;
using core::ConfigPatcher;
using core::PatchResult;

static void write_file(const fs::path& p, const std::string& s) {
    std::ofstream out(p, std::ios::binary);
    out << s;
}

static std::string read_file(const fs::path& p) {
    std::ifstream in(p, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

int main() {
    const fs::path dir = fs::temp_directory_path() / "voiceprint_config_patcher_test";
    fs::remove_all(dir);
    fs::create_directories(dir);

    ConfigPatcher patcher;

    // Missing target: nothing is created
    const fs::path missing = dir / "missing.py";
    PatchResult r = patcher.patch_reference(missing.string(), "/p/bronson.npy");
    assert(r.status == PatchResult::Status::NotFound);
    assert(!fs::exists(missing));

    // No marker: file left byte-identical
    const fs::path plain = dir / "plain.py";
    const std::string plain_text = "import numpy as np\nprint('hi')\n";
    write_file(plain, plain_text);
    r = patcher.patch_reference(plain.string(), "/p/bronson.npy");
    assert(r.status == PatchResult::Status::NoMarkerFound);
    assert(read_file(plain) == plain_text);

    // Marker lines replaced, indentation and the rest kept
    const fs::path listener = dir / "listen.py";
    write_file(listener,
        "import numpy as np\n"
        "reference = np.load(\"old.npy\")\n"
        "def reload():\n"
        "    ref = np.load('other.npy')  # refresh\n"
        "print(reference)");
    fs::permissions(listener, fs::perms::owner_all, fs::perm_options::replace);
    r = patcher.patch_reference(listener.string(), "/p/bronson.npy");
    assert(r.status == PatchResult::Status::Patched);
    assert(r.lines_changed == 2);
    assert(read_file(listener) ==
        "import numpy as np\n"
        "reference = np.load(\"/p/bronson.npy\")\n"
        "def reload():\n"
        "    reference = np.load(\"/p/bronson.npy\")\n"
        "print(reference)");
    assert((fs::status(listener).permissions() & fs::perms::owner_exec) != fs::perms::none);
    assert(!fs::exists(listener.string() + ".patch-tmp"));

    // Running again on the patched file changes nothing more
    const std::string once = read_file(listener);
    r = patcher.patch_reference(listener.string(), "/p/bronson.npy");
    assert(r.status == PatchResult::Status::Patched);
    assert(read_file(listener) == once);

    // CRLF endings are kept per line
    const fs::path crlf = dir / "crlf.py";
    write_file(crlf, "a = 1\r\nref = np.load(x)\r\nb = 2\r\n");
    r = patcher.patch_reference(crlf.string(), "k.npy");
    assert(r.lines_changed == 1);
    assert(read_file(crlf) == "a = 1\r\nreference = np.load(\"k.npy\")\r\nb = 2\r\n");

    // Quotes and backslashes in the key are escaped
    assert(patcher.render_line("x = np.load(y)\n", "C:\\a\"b.npy") ==
           "reference = np.load(\"C:\\\\a\\\"b.npy\")\n");

    // Custom marker and template
    ConfigPatcher::Config cfg;
    cfg.marker = "PROFILE=";
    cfg.replacement_template = "PROFILE={key}";
    cfg.keep_indent = false;
    ConfigPatcher custom(cfg);
    assert(custom.render_line("  PROFILE=old\n", "new.npy") == "PROFILE=new.npy\n");

    // A symlinked script is patched through the link; the link survives
    const fs::path real = dir / "real_listen.py";
    const fs::path link = dir / "linked_listen.py";
    write_file(real, "reference = np.load(\"old.npy\")\n");
    fs::create_symlink(real, link);
    r = patcher.patch_reference(link.string(), "/p/new.npy");
    assert(r.status == PatchResult::Status::Patched);
    assert(fs::is_symlink(link));
    assert(read_file(real) == "reference = np.load(\"/p/new.npy\")\n");
    assert(read_file(link) == read_file(real));

    // Temp file cannot be created: FileWriteError, target untouched
    const fs::path blocked = dir / "blocked.py";
    const std::string blocked_text = "reference = np.load(\"old.npy\")\n";
    write_file(blocked, blocked_text);
    fs::create_directory(fs::canonical(blocked).string() + ".patch-tmp");
    bool write_failed = false;
    try {
        patcher.patch_reference(blocked.string(), "/p/new.npy");
    } catch (const speaker::VoiceprintError& e) {
        write_failed = e.kind() == speaker::ErrorKind::FileWriteError;
    }
    assert(write_failed);
    assert(read_file(blocked) == blocked_text);
    assert(std::string(core::to_string(PatchResult::Status::WriteFailed)) == "WriteFailed");

    // Line splitting keeps terminators
    auto lines = ConfigPatcher::split_lines("a\nb\r\nc");
    assert(lines.size() == 3);
    assert(lines[0] == "a\n" && lines[1] == "b\r\n" && lines[2] == "c");
    assert(ConfigPatcher::split_lines("").empty());

    fs::remove_all(dir);
    return 0;
}
