#include <cassert>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include <unistd.h>

#include <nlohmann/json.hpp>

#include "application/Persistent.hpp"
#include "domain/Binding.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/Umask.hpp"
#include "infrastructure/codecs/Codecs.hpp"
#include "test/TestEnvironment.hpp"

using namespace stowage::domain;
using namespace stowage::infrastructure::codecs;
using stowage::application::Persistent;
using stowage::test::ScratchHome;
using stowage::test::throws;
namespace fs = std::filesystem;

namespace sample {

struct State {
    int number = 0;
    bool operator==(const State& other) const { return number == other.number; }
};

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(State, number)

struct Journal {
    std::vector<std::string> lines;
};

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(Journal, lines)

struct Signature {
    static constexpr Header kHeader = {0, 1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11,
                                       12, 13, 14, 15, 16, 17, 18, 19, 20, 21, 22, 23};
    static constexpr std::uint8_t kVersion = 2;
    static constexpr const char* kExtension = "state";
};

} // namespace sample

using sample::Journal;
using sample::State;

PersistError::Kind kindOf(const std::function<void()>& fn) {
    try {
        fn();
    } catch (const PersistError& e) {
        return e.kind();
    }
    assert(false && "Expected a PersistError");
    return PersistError::Kind::Io;
}

std::string readFile(const fs::path& path) {
    std::ifstream ifs(path, std::ios::binary);
    std::stringstream buffer;
    buffer << ifs.rdbuf();
    return buffer.str();
}

void testEndToEnd(const ScratchHome& home) {
    std::cout << "[Test] Config/MyProject/state.json end to end..." << std::endl;
    Persistent<State, JsonCodec> handle(Binding(DirectoryKind::Config, "MyProject", "", "state"));

    Metadata saved = handle.save(State{7});
    const fs::path expected = home.config() / "myproject" / "state.json";
    assert(saved.path() == expected);
    assert(fs::exists(expected));
    assert(saved.size() == fs::file_size(expected));
    assert(nlohmann::json::parse(readFile(expected)) == nlohmann::json({{"number", 7}}));
    assert(stowage::test::tempFilesFor(expected) == 0);

    assert(handle.load() == State{7});

    std::ostringstream os;
    os << saved;
    assert(os.str() == std::to_string(saved.size()) + " bytes @ " + expected.string());

    // Saving the same value twice leaves identical content.
    const std::string first = readFile(expected);
    Metadata again = handle.save(State{7});
    assert(again == saved);
    assert(readFile(expected) == first);
}

void testNotFoundAndCorrupt(const ScratchHome& home) {
    std::cout << "[Test] Missing and corrupt files..." << std::endl;
    Persistent<State, TomlCodec> handle(Binding(DirectoryKind::Data, "proj", "nested/dir", "absent"));
    assert(kindOf([&] { handle.load(); }) == PersistError::Kind::NotFound);
    assert(kindOf([&] { handle.loadMapped(); }) == PersistError::Kind::NotFound);
    assert(kindOf([&] { handle.fileSize(); }) == PersistError::Kind::NotFound);
    assert(!handle.exists());

    fs::create_directories(handle.basePath());
    std::ofstream(handle.absolutePath()) << "number = = 7";
    assert(kindOf([&] { handle.load(); }) == PersistError::Kind::Decode);

    // A file behind an unreadable directory is an Io error, not a crash or NotFound.
    if (geteuid() != 0) {
        const fs::path locked = home.root() / "locked";
        Persistent<State, JsonCodec> hidden(Binding::custom(locked, "proj", "", "hidden"));
        hidden.save(State{1});
        fs::permissions(locked, fs::perms::none);
        PersistError::Kind mappedKind = kindOf([&] { hidden.loadMapped(); });
        PersistError::Kind loadKind = kindOf([&] { hidden.load(); });
        fs::permissions(locked, fs::perms::owner_all);
        assert(mappedKind == PersistError::Kind::Io);
        assert(loadKind == PersistError::Kind::Io);
        assert(hidden.loadMapped() == State{1});
    }

    Persistent<std::vector<int>, TomlCodec> notATable(Binding(DirectoryKind::Data, "proj", "", "list"));
    assert(kindOf([&] { notATable.save({1, 2, 3}); }) == PersistError::Kind::Encode);
    assert(!notATable.exists());
}

void testCompression() {
    std::cout << "[Test] Compressed files..." << std::endl;
    Journal journal;
    for (int i = 0; i < 500; ++i) {
        journal.lines.push_back("the same line of text, again and again");
    }

    Persistent<Journal, JsonCodec> plain(Binding(DirectoryKind::Cache, "proj", "logs", "journal"));
    Binding zipped(DirectoryKind::Cache, "proj", "logs", "journal-gz");
    zipped.compressed = true;
    Persistent<Journal, JsonCodec> compressed(zipped);

    Metadata plainMeta = plain.save(journal);
    Metadata zippedMeta = compressed.save(journal);
    // Compression never changes the extension.
    assert(zippedMeta.path().extension() == ".json");
    assert(zippedMeta.size() < plainMeta.size());
    assert(compressed.load().lines == journal.lines);

    // On disk the file starts with the gzip magic number.
    Bytes magic = compressed.fileBytes(0, 2);
    assert(magic.size() == 2 && magic[0] == 0x1f && magic[1] == 0x8b);

    assert(compressed.readToString() == plain.readToString());

    // Uncompressed bytes under a compressed binding are a decode failure.
    std::ofstream(compressed.absolutePath(), std::ios::trunc) << "{\"lines\": []}";
    assert(kindOf([&] { compressed.load(); }) == PersistError::Kind::Decode);
}

void testMemoryMapped() {
    std::cout << "[Test] Memory-mapped reads..." << std::endl;
    Binding binding(DirectoryKind::Data, "proj", "", "big");
    binding.mmapThreshold = 64;
    Persistent<Journal, MessagePackCodec> handle(binding);

    Journal large;
    large.lines.assign(20, "0123456789");
    assert(handle.save(large).size() >= 64);
    assert(handle.load().lines == large.lines);
    assert(handle.loadMapped().lines == large.lines);

    Journal small;
    small.lines = {"x"};
    assert(handle.save(small).size() < 64);
    assert(handle.load().lines == small.lines);
    assert(handle.loadMapped().lines == small.lines);
}

void testByteAccess() {
    std::cout << "[Test] Byte access..." << std::endl;
    Persistent<std::string, PlainCodec> handle(Binding(DirectoryKind::Data, "proj", "", "note"));
    handle.save("hello world");
    assert(handle.fileName() == "note.txt");
    assert(handle.readToString() == "hello world");

    Bytes hello = handle.fileBytes(0, 5);
    assert(std::string(hello.begin(), hello.end()) == "hello");
    Bytes single = handle.fileBytes(4, 4);
    assert(single.size() == 1 && single[0] == 'o');
    assert(kindOf([&] { handle.fileBytes(5, 2); }) == PersistError::Kind::Io);
    assert(kindOf([&] { handle.fileBytes(0, 100); }) == PersistError::Kind::Io);

    assert(handle.toBytes("abc") == Bytes({'a', 'b', 'c'}));
    assert(handle.fromBytes(Bytes({'x', 'y'})) == "xy");
}

void testRemoval() {
    std::cout << "[Test] Removal..." << std::endl;
    Persistent<std::string, PlainCodec> a(Binding(DirectoryKind::State, "removal", "one/two", "a"));
    Persistent<std::string, PlainCodec> b(Binding(DirectoryKind::State, "removal", "one", "b"));
    Persistent<std::string, PlainCodec> top(Binding(DirectoryKind::State, "removal", "", "top"));

    a.save("aaaa");
    b.save("bb");
    top.save("t");

    auto existing = a.exists();
    assert(existing && existing->size() == 4);
    assert(a.subDirSize().size() == 6);
    assert(a.subDirParentPath() == a.projectDirPath() / "one");
    assert(top.projectDirSize().size() == 7);

    Metadata removed = a.remove();
    assert(removed.size() == 4);
    assert(!a.exists());
    assert(a.remove() == Metadata::zero(a.absolutePath()));

    Metadata atomicRemoved = b.removeAtomic();
    assert(atomicRemoved.size() == 2);
    assert(!b.exists());
    assert(stowage::test::tempFilesFor(b.absolutePath()) == 0);

    // Leftover temporary files from interrupted saves.
    const std::string topPath = top.absolutePath().string();
    std::ofstream(topPath + ".4242.0.tmp") << "partial";
    std::ofstream(topPath + ".4242.1.tmp") << "xy";
    std::ofstream(topPath + ".backup.tmp") << "kept";
    assert(stowage::test::tempFilesFor(top.absolutePath()) == 2);
    Metadata cleaned = top.removeTmp();
    assert(cleaned.size() == 9);
    assert(cleaned.path() == top.basePath());
    assert(stowage::test::tempFilesFor(top.absolutePath()) == 0);
    assert(fs::exists(topPath + ".backup.tmp"));
    assert(top.removeTmp().size() == 0);
    fs::remove(topPath + ".backup.tmp");

    a.save("aaaa");
    Metadata subdirs = a.removeSubDirectories();
    assert(subdirs.path() == a.projectDirPath() / "one");
    assert(subdirs.size() == 4);
    assert(!fs::exists(a.projectDirPath() / "one"));
    assert(top.exists());

    Metadata project = top.removeProject();
    assert(project.size() == 1);
    assert(!fs::exists(top.projectDirPath()));
    assert(top.removeProject().size() == 0);
    assert(kindOf([&] { top.projectDirSize(); }) == PersistError::Kind::NotFound);

    fs::path dir = a.mkdir();
    assert(fs::is_directory(dir));
    assert(dir == a.basePath());
}

void testEmptyMarker() {
    std::cout << "[Test] Marker files..." << std::endl;
    Persistent<State, EmptyCodec> marker(Binding(DirectoryKind::Cache, "proj", "", "ready"));
    Metadata saved = marker.save(State{3});
    assert(saved.size() == 0);
    assert(saved.path().filename() == "ready");
    assert(marker.load() == State{});
}

void testHeaderedFile() {
    std::cout << "[Test] Versioned files..." << std::endl;
    using StateFormat = HeaderedCodec<YamlCodec, sample::Signature>;
    Persistent<State, StateFormat> handle(Binding(DirectoryKind::Data, "proj", "", "versioned"));
    handle.save(State{11});
    assert(handle.fileName() == "versioned.state");
    assert(handle.fileVersion() == 2);
    assert(handle.fileHeaderToString().find("[0, 1, 2, 3,") == 0);
    assert(handle.load() == State{11});

    Binding zipped(DirectoryKind::Data, "proj", "", "versioned-gz");
    zipped.compressed = true;
    Persistent<State, StateFormat> compressed(zipped);
    compressed.save(State{12});
    assert(compressed.fileVersion() == 2);
    assert(compressed.load() == State{12});
}

void testUmask() {
    std::cout << "[Test] Umask..." << std::endl;
    mode_t previous = stowage::infrastructure::SetUmask(0077);
    Persistent<State, JsonCodec> handle(Binding(DirectoryKind::Data, "umask", "", "private"));
    handle.save(State{1});
    auto perms = fs::status(handle.absolutePath()).permissions();
    assert((perms & (fs::perms::group_all | fs::perms::others_all)) == fs::perms::none);
    assert(stowage::infrastructure::SetUmask(previous) == 0077);
}

int main() {
    std::cout << "[Test] Starting Persistent Test..." << std::endl;
    ScratchHome home("persistent");

    testEndToEnd(home);
    testNotFoundAndCorrupt(home);
    testCompression();
    testMemoryMapped();
    testByteAccess();
    testRemoval();
    testEmptyMarker();
    testHeaderedFile();
    testUmask();

    std::cout << "[PASS] Persistent Test Passed!" << std::endl;
    return 0;
}
