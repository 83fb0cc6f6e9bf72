/**
 * @file FileReader.cpp
 * @brief Implementation of FileReader.
 */

#include "infrastructure/FileReader.hpp"
#include "domain/Errors.hpp"

#include <fstream>
#include <iterator>
#include <system_error>

namespace stowage::infrastructure {

namespace fs = std::filesystem;
using domain::Bytes;
using domain::PersistError;

namespace {

void requireExists(const fs::path& path) {
    std::error_code ec;
    bool exists = fs::exists(path, ec);
    if (ec) {
        throw PersistError(PersistError::Kind::Io, "Error checking " + path.string() + ": " + ec.message(), path);
    }
    if (!exists) {
        throw PersistError(PersistError::Kind::NotFound, path.string() + " does not exist", path);
    }
}

std::size_t rangeLength(const fs::path& path, std::size_t start, std::size_t end) {
    if (start > end) {
        throw PersistError(PersistError::Kind::Io, "fileBytes(): start > end", path);
    }
    return start == end ? 1 : end - start;
}

} // namespace

Bytes FileReader::ReadAll(const fs::path& path) {
    requireExists(path);

    std::ifstream ifs(path, std::ios::binary);
    if (!ifs.is_open()) {
        throw PersistError(PersistError::Kind::Io, "Error opening file for reading: " + path.string(), path);
    }

    std::error_code ec;
    auto size = fs::file_size(path, ec);
    Bytes bytes;
    if (!ec) {
        bytes.reserve(static_cast<std::size_t>(size));
    }
    bytes.assign(std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>());
    if (ifs.bad()) {
        throw PersistError(PersistError::Kind::Io, "Error reading " + path.string(), path);
    }
    return bytes;
}

Bytes FileReader::ReadRange(const fs::path& path, std::size_t start, std::size_t end) {
    std::size_t length = rangeLength(path, start, end);
    requireExists(path);

    std::ifstream ifs(path, std::ios::binary);
    if (!ifs.is_open()) {
        throw PersistError(PersistError::Kind::Io, "Error opening file for reading: " + path.string(), path);
    }

    Bytes bytes(length);
    ifs.seekg(static_cast<std::streamoff>(start));
    ifs.read(reinterpret_cast<char*>(bytes.data()), static_cast<std::streamsize>(length));
    if (!ifs || static_cast<std::size_t>(ifs.gcount()) != length) {
        throw PersistError(PersistError::Kind::Io,
                           "fileBytes(): could not read " + std::to_string(length) + " bytes at offset " +
                               std::to_string(start) + " of " + path.string(),
                           path);
    }
    return bytes;
}

std::uint64_t FileReader::FileSize(const fs::path& path) {
    requireExists(path);
    std::error_code ec;
    auto size = fs::file_size(path, ec);
    if (ec) {
        throw PersistError(PersistError::Kind::Io, "Error reading size of " + path.string() + ": " + ec.message(), path);
    }
    return size;
}

std::uint64_t FileReader::DirectorySize(const fs::path& directory) {
    requireExists(directory);

    std::uint64_t total = 0;
    std::error_code ec;
    for (fs::recursive_directory_iterator it(directory, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code entryError;
        if (it->is_regular_file(entryError)) {
            auto size = it->file_size(entryError);
            if (!entryError) total += size;
        }
    }
    if (ec) {
        throw PersistError(PersistError::Kind::Io, "Error walking " + directory.string() + ": " + ec.message(), directory);
    }
    return total;
}

} // namespace stowage::infrastructure
