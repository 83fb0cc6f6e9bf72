/**
 * @file AtomicFileWriter.cpp
 * @brief Implementation of AtomicFileWriter.
 */

#include "infrastructure/AtomicFileWriter.hpp"
#include "infrastructure/Log.hpp"
#include "domain/Errors.hpp"

#include <atomic>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <system_error>

#include <fcntl.h>
#include <unistd.h>

namespace stowage::infrastructure {

namespace fs = std::filesystem;
using domain::PersistError;

namespace {

constexpr const char* kTempSuffix = ".tmp";

std::atomic<std::uint64_t> g_tempCounter{0};

bool isDigits(const std::string& value) {
    if (value.empty()) return false;
    for (char c : value) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

PersistError ioError(const std::string& what, const fs::path& path, int err) {
    return PersistError(PersistError::Kind::Io, what + " " + path.string() + ": " + std::strerror(err), path);
}

} // namespace

fs::path AtomicFileWriter::UniqueTempPathFor(const fs::path& target) {
    fs::path tempPath = target;
    tempPath += "." + std::to_string(::getpid()) + "." + std::to_string(g_tempCounter.fetch_add(1)) + kTempSuffix;
    return tempPath;
}

bool AtomicFileWriter::IsTempPathFor(const fs::path& target, const fs::path& candidate) {
    if (candidate.parent_path() != target.parent_path()) return false;

    const std::string prefix = target.filename().string() + ".";
    const std::string name = candidate.filename().string();
    const std::string suffix = kTempSuffix;
    if (name.size() <= prefix.size() + suffix.size()) return false;
    if (name.compare(0, prefix.size(), prefix) != 0) return false;
    if (name.compare(name.size() - suffix.size(), suffix.size(), suffix) != 0) return false;

    // Middle part is "<pid>.<n>".
    const std::string middle = name.substr(prefix.size(), name.size() - prefix.size() - suffix.size());
    const auto dot = middle.find('.');
    if (dot == std::string::npos) return false;
    return isDigits(middle.substr(0, dot)) && isDigits(middle.substr(dot + 1));
}

std::uint64_t AtomicFileWriter::write(const fs::path& target, const domain::Bytes& bytes) {
    return writeRaw(target, bytes.data(), bytes.size());
}

std::uint64_t AtomicFileWriter::writeText(const fs::path& target, const std::string& content) {
    return writeRaw(target, reinterpret_cast<const std::uint8_t*>(content.data()), content.size());
}

std::uint64_t AtomicFileWriter::writeRaw(const fs::path& target, const std::uint8_t* data, std::size_t size) {
    const fs::path tempPath = UniqueTempPathFor(target);

    // 1. Write to Temp
    try {
        writeTemp(tempPath, data, size);
    } catch (const PersistError&) {
        discardTemp(tempPath);
        throw;
    } catch (const fs::filesystem_error& e) {
        discardTemp(tempPath);
        throw PersistError(PersistError::Kind::Io, std::string("Write failed: ") + e.what(), target);
    }

    // 2. Atomic Rename
    try {
        commit(tempPath, target);
    } catch (const PersistError&) {
        discardTemp(tempPath);
        throw;
    } catch (const fs::filesystem_error& e) {
        discardTemp(tempPath);
        throw PersistError(PersistError::Kind::Io, std::string("Rename failed: ") + e.what(), target);
    }

    Log::Debug("AtomicFileWriter", "Wrote " + std::to_string(size) + " bytes to " + target.string());
    return size;
}

void AtomicFileWriter::writeTemp(const fs::path& tempPath, const std::uint8_t* data, std::size_t size) {
    int fd = ::open(tempPath.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0666);
    if (fd < 0) {
        throw ioError("Failed to create temp file", tempPath, errno);
    }

    std::size_t written = 0;
    while (written < size) {
        ssize_t n = ::write(fd, data + written, size - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            int err = errno;
            ::close(fd);
            throw ioError("Write failed during output to", tempPath, err);
        }
        written += static_cast<std::size_t>(n);
    }

    if (::fsync(fd) != 0) {
        int err = errno;
        ::close(fd);
        throw ioError("fsync failed for", tempPath, err);
    }
    if (::close(fd) != 0) {
        throw ioError("Failed to close temp file", tempPath, errno);
    }
}

void AtomicFileWriter::commit(const fs::path& tempPath, const fs::path& target) {
    fs::rename(tempPath, target);
}

void AtomicFileWriter::discardTemp(const fs::path& tempPath) {
    std::error_code ec;
    fs::remove(tempPath, ec);
    if (ec) {
        Log::Warn("AtomicFileWriter", "Could not remove temp file " + tempPath.string() + ": " + ec.message());
    }
}

} // namespace stowage::infrastructure
