#include <atomic>
#include <cassert>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <system_error>
#include <thread>

#include <nlohmann/json.hpp>

#include "application/Persistent.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/AtomicFileWriter.hpp"
#include "infrastructure/codecs/BinaryCodec.hpp"
#include "infrastructure/codecs/JsonCodec.hpp"
#include "test/TestEnvironment.hpp"

using namespace stowage::domain;
using stowage::application::Persistent;
using stowage::infrastructure::AtomicFileWriter;
using stowage::infrastructure::codecs::BinaryCodec;
using stowage::infrastructure::codecs::JsonCodec;
using stowage::test::ScratchHome;
using stowage::test::tempFilesFor;
namespace fs = std::filesystem;

namespace {

struct Profile {
    std::string name;
    int level = 0;
};

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(Profile, name, level)

// Simulates a crash between writing the temporary file and renaming it.
class FailingRenameWriter : public AtomicFileWriter {
public:
    bool sawTemp = false;

protected:
    void commit(const fs::path& tempPath, const fs::path&) override {
        sawTemp = fs::exists(tempPath);
        throw fs::filesystem_error("simulated rename failure", tempPath,
                                   std::make_error_code(std::errc::io_error));
    }
};

// Fails half way through writing the temporary file.
class FailingWriteWriter : public AtomicFileWriter {
protected:
    void writeTemp(const fs::path& tempPath, const std::uint8_t* data, std::size_t size) override {
        std::ofstream ofs(tempPath, std::ios::binary);
        ofs.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(size / 2));
        throw PersistError(PersistError::Kind::Io, "simulated disk full", tempPath);
    }
};

std::string readFile(const fs::path& path) {
    std::ifstream ifs(path, std::ios::binary);
    std::stringstream buffer;
    buffer << ifs.rdbuf();
    return buffer.str();
}

// Two writers race on one file while a reader loads it. Every load must see
// one of the two payloads in full, and every save must succeed.
void testConcurrentSaves() {
    std::cout << "[Test] Concurrent saves and loads never expose a torn file..." << std::endl;
    const std::size_t payloadSize = 4 * 1024 * 1024;
    const std::string payloadA(payloadSize, 'A');
    const std::string payloadB(payloadSize, 'B');
    const int savesPerWriter = 40;

    Binding binding(DirectoryKind::Cache, "atomic", "race", "blob");
    Persistent<std::string, BinaryCodec> seed(binding);
    seed.save(payloadA);

    std::atomic<int> writersLeft{2};
    std::atomic<int> saveErrors{0};
    std::atomic<int> reads{0};
    std::atomic<int> torn{0};

    auto writer = [&](const std::string& payload) {
        Persistent<std::string, BinaryCodec> handle(binding);
        for (int i = 0; i < savesPerWriter; ++i) {
            try {
                handle.save(payload);
            } catch (const PersistError& e) {
                std::cerr << "[AtomicWriteTest] save failed: " << e.what() << std::endl;
                saveErrors++;
            }
        }
        writersLeft--;
    };

    std::thread reader([&] {
        Persistent<std::string, BinaryCodec> handle(binding);
        while (writersLeft.load() > 0) {
            const std::string seen = handle.load();
            reads++;
            if (seen != payloadA && seen != payloadB) torn++;
        }
    });
    std::thread writerA(writer, std::cref(payloadA));
    std::thread writerB(writer, std::cref(payloadB));

    writerA.join();
    writerB.join();
    reader.join();

    std::cout << "[Test] reads=" << reads.load() << " torn=" << torn.load()
              << " saveErrors=" << saveErrors.load() << std::endl;
    assert(torn.load() == 0);
    assert(saveErrors.load() == 0);

    const std::string last = seed.load();
    assert(last == payloadA || last == payloadB);
    assert(tempFilesFor(seed.absolutePath()) == 0);
}

} // namespace

int main() {
    std::cout << "[Test] Starting Atomic Write Test..." << std::endl;
    ScratchHome home("atomic_write");

    Binding binding(DirectoryKind::Data, "atomic", "profiles", "main");
    Persistent<Profile, JsonCodec> healthy(binding);
    healthy.save({"before", 1});
    const fs::path target = healthy.absolutePath();
    const std::string original = readFile(target);
    assert(tempFilesFor(target) == 0);

    // Each write gets its own temporary name.
    const fs::path first = AtomicFileWriter::UniqueTempPathFor(target);
    const fs::path second = AtomicFileWriter::UniqueTempPathFor(target);
    assert(first != second);
    assert(first.parent_path() == target.parent_path());
    assert(AtomicFileWriter::IsTempPathFor(target, first));
    assert(AtomicFileWriter::IsTempPathFor(target, second));
    assert(!AtomicFileWriter::IsTempPathFor(target, target));
    assert(!AtomicFileWriter::IsTempPathFor(target, fs::path(target.string() + ".tmp")));
    assert(!AtomicFileWriter::IsTempPathFor(target, fs::path(target.string() + ".old.1.tmp")));

    std::cout << "[Test] Failure before rename keeps the previous file..." << std::endl;
    auto failingRename = std::make_shared<FailingRenameWriter>();
    Persistent<Profile, JsonCodec> crashing(binding, failingRename);
    try {
        crashing.save({"after", 2});
        assert(false && "save() must report the failed rename");
    } catch (const PersistError& e) {
        assert(e.kind() == PersistError::Kind::Io);
        assert(e.path() == target);
    }
    assert(failingRename->sawTemp);
    assert(readFile(target) == original);
    assert(tempFilesFor(target) == 0);
    assert(healthy.load().name == "before");

    std::cout << "[Test] Failure while writing keeps the previous file..." << std::endl;
    Persistent<Profile, JsonCodec> partial(binding, std::make_shared<FailingWriteWriter>());
    try {
        partial.save({"partial", 3});
        assert(false && "save() must report the failed write");
    } catch (const PersistError& e) {
        assert(e.kind() == PersistError::Kind::Io);
    }
    assert(readFile(target) == original);
    assert(tempFilesFor(target) == 0);

    std::cout << "[Test] A stale temporary file does not block saving..." << std::endl;
    const fs::path stale = fs::path(target.string() + ".1.0.tmp");
    std::ofstream(stale) << "garbage from an interrupted run";
    healthy.save({"after", 2});
    assert(healthy.load().name == "after");
    assert(readFile(stale) == "garbage from an interrupted run");
    assert(healthy.removeTmp().size() == std::string("garbage from an interrupted run").size());
    assert(!fs::exists(stale));

    std::cout << "[Test] Writing into a missing directory is an Io error..." << std::endl;
    AtomicFileWriter writer;
    try {
        writer.writeText(home.root() / "no" / "such" / "dir" / "file.txt", "x");
        assert(false && "write() must fail without a parent directory");
    } catch (const PersistError& e) {
        assert(e.kind() == PersistError::Kind::Io);
    }

    testConcurrentSaves();

    std::cout << "[PASS] Atomic Write Test Passed!" << std::endl;
    return 0;
}
