/**
 * @file Persistent.hpp
 * @brief Typed handle that saves and loads one value to its bound file.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include "domain/Binding.hpp"
#include "domain/Bytes.hpp"
#include "domain/Errors.hpp"
#include "domain/Metadata.hpp"
#include "infrastructure/AtomicFileWriter.hpp"
#include "infrastructure/FileReader.hpp"
#include "infrastructure/GzipTransform.hpp"
#include "infrastructure/Log.hpp"
#include "infrastructure/MappedFile.hpp"
#include "infrastructure/PathResolver.hpp"
#include "infrastructure/codecs/HeaderedCodec.hpp"

namespace stowage::application {

/**
 * @class Persistent
 * @brief Binds a value type to a file location and a file format.
 *
 * `Codec` is one of the types in infrastructure/codecs (or any type with the
 * same static `kExtension`, `encode<T>` and `decode<T>` members). The file
 * lives at `<base(kind)>/<project>/<sub dirs>/<stem>.<Codec::kExtension>`.
 *
 * Every operation is synchronous. save() goes through AtomicFileWriter, so
 * the target is either the previous content or the new one, never a mix.
 *
 * Errors:
 *   - domain::PathResolutionError when the location cannot be determined.
 *   - domain::PersistError with Kind NotFound, Io, Encode or Decode.
 */
template <typename T, typename Codec>
class Persistent {
public:
    using Value = T;
    using Format = Codec;

    explicit Persistent(domain::Binding binding,
                        std::shared_ptr<infrastructure::AtomicFileWriter> writer = nullptr)
        : m_binding(std::move(binding)), m_writer(std::move(writer)) {
        m_binding.validate();
        if (!m_writer) {
            m_writer = std::make_shared<infrastructure::AtomicFileWriter>();
        }
    }

    const domain::Binding& binding() const { return m_binding; }

    static std::string extension() { return Codec::kExtension; }

    // --- Codec pass-through ---

    /** @brief Encoded bytes of `value`, before compression. */
    domain::Bytes toBytes(const T& value) const {
        try {
            return Codec::template encode<T>(value);
        } catch (const domain::EncodeError& e) {
            throw domain::PersistError(domain::PersistError::Kind::Encode, e.what(), absolutePath());
        }
    }

    /** @brief Decodes bytes as produced by toBytes(). */
    T fromBytes(const domain::Bytes& bytes) const {
        return decodeBytes(bytes.data(), bytes.size());
    }

    // --- Save / load ---

    /**
     * @brief Encodes `value` and atomically replaces the bound file.
     * @return Bytes written (after compression) and the file path.
     */
    domain::Metadata save(const T& value) const {
        domain::Bytes bytes = toBytes(value);
        if (m_binding.compressed) {
            try {
                bytes = infrastructure::GzipTransform::Compress(bytes);
            } catch (const domain::EncodeError& e) {
                throw domain::PersistError(domain::PersistError::Kind::Encode, e.what(), absolutePath());
            }
        }

        const std::filesystem::path path = infrastructure::PathResolver::ResolveForSave(m_binding, extension());
        const std::uint64_t written = m_writer->write(path, bytes);

        domain::Metadata metadata(written, path);
        if (infrastructure::Log::Enabled(infrastructure::LogLevel::Debug)) {
            infrastructure::Log::Debug("Persistent", "Saved " + std::to_string(written) + " bytes to " + path.string());
        }
        return metadata;
    }

    /**
     * @brief Reads, decompresses and decodes the bound file.
     *
     * Files at least `binding().mmapThreshold` bytes large (when non-zero)
     * are read through a memory mapping.
     */
    T load() const {
        const std::filesystem::path path = absolutePath();
        const std::uint64_t size = infrastructure::FileReader::FileSize(path);
        if (m_binding.mmapThreshold > 0 && size >= m_binding.mmapThreshold) {
            return loadMappedFrom(path);
        }

        const domain::Bytes raw = infrastructure::FileReader::ReadAll(path);
        logLoad(path, raw.size());
        return decodeStored(raw.data(), raw.size(), path);
    }

    /** @brief load() forcing a memory-mapped read. */
    T loadMapped() const {
        const std::filesystem::path path = absolutePath();
        // Reports a missing or unreachable file as NotFound or Io.
        infrastructure::FileReader::FileSize(path);
        return loadMappedFrom(path);
    }

    /** @brief The file's bytes after decompression, without decoding. */
    domain::Bytes readToBytes() const {
        const std::filesystem::path path = absolutePath();
        domain::Bytes raw = infrastructure::FileReader::ReadAll(path);
        if (!m_binding.compressed) {
            return raw;
        }
        return inflate(raw.data(), raw.size(), path);
    }

    /** @brief The file's content after decompression, as text. */
    std::string readToString() const {
        const domain::Bytes bytes = readToBytes();
        return std::string(bytes.begin(), bytes.end());
    }

    /**
     * @brief Raw on-disk bytes [start, end). `start == end` reads one byte.
     * @throws domain::PersistError (Io) when start > end or the range passes the end of file.
     */
    domain::Bytes fileBytes(std::size_t start, std::size_t end) const {
        return infrastructure::FileReader::ReadRange(absolutePath(), start, end);
    }

    // --- File queries ---

    std::optional<domain::Metadata> exists() const {
        const std::filesystem::path path = absolutePath();
        std::error_code ec;
        if (!std::filesystem::is_regular_file(path, ec)) {
            return std::nullopt;
        }
        return domain::Metadata(infrastructure::FileReader::FileSize(path), path);
    }

    domain::Metadata fileSize() const {
        const std::filesystem::path path = absolutePath();
        return domain::Metadata(infrastructure::FileReader::FileSize(path), path);
    }

    domain::Metadata subDirSize() const {
        const std::filesystem::path dir = subDirParentPath();
        return domain::Metadata(infrastructure::FileReader::DirectorySize(dir), dir);
    }

    domain::Metadata projectDirSize() const {
        const std::filesystem::path dir = projectDirPath();
        return domain::Metadata(infrastructure::FileReader::DirectorySize(dir), dir);
    }

    // --- Removal ---

    /** @brief Deletes the bound file. Removing a missing file succeeds with size 0. */
    domain::Metadata remove() const {
        const std::filesystem::path path = absolutePath();
        const auto existing = exists();
        if (!existing) {
            return domain::Metadata::zero(path);
        }
        removeFile(path);
        return *existing;
    }

    /** @brief Renames the bound file to its temporary name, then deletes it. */
    domain::Metadata removeAtomic() const {
        const std::filesystem::path path = absolutePath();
        const auto existing = exists();
        if (!existing) {
            return domain::Metadata::zero(path);
        }
        const std::filesystem::path tmp = infrastructure::AtomicFileWriter::UniqueTempPathFor(path);
        std::error_code ec;
        std::filesystem::rename(path, tmp, ec);
        if (ec) {
            throw domain::PersistError(domain::PersistError::Kind::Io,
                                       "Failed to rename " + path.string() + ": " + ec.message(), path);
        }
        removeFile(tmp);
        return *existing;
    }

    /**
     * @brief Deletes temporary files left behind by interrupted saves.
     *
     * Must not run while a save to the same file is in progress; that
     * save's temporary file would be removed and its rename would fail.
     * @return Total bytes removed and the directory holding the file.
     */
    domain::Metadata removeTmp() const {
        const std::filesystem::path path = absolutePath();
        const std::filesystem::path dir = path.parent_path();
        std::error_code ec;
        if (!std::filesystem::is_directory(dir, ec)) {
            return domain::Metadata::zero(dir);
        }

        std::vector<std::filesystem::path> leftovers;
        for (std::filesystem::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
            std::error_code entryError;
            if (infrastructure::AtomicFileWriter::IsTempPathFor(path, it->path()) && it->is_regular_file(entryError)) {
                leftovers.push_back(it->path());
            }
        }
        if (ec) {
            throw domain::PersistError(domain::PersistError::Kind::Io,
                                       "Error listing " + dir.string() + ": " + ec.message(), dir);
        }

        std::uint64_t total = 0;
        for (const auto& leftover : leftovers) {
            total += infrastructure::FileReader::FileSize(leftover);
            removeFile(leftover);
        }
        return domain::Metadata(total, dir);
    }

    /**
     * @brief Recursively deletes the first sub-directory, or the project
     * directory when the binding has none.
     */
    domain::Metadata removeSubDirectories() const {
        return removeTree(subDirParentPath());
    }

    /** @brief Recursively deletes the whole project directory. */
    domain::Metadata removeProject() const {
        return removeTree(projectDirPath());
    }

    // --- Paths ---

    /** @brief Creates the directories leading up to the file and returns the file's parent. */
    std::filesystem::path mkdir() const {
        const std::filesystem::path dir = basePath();
        infrastructure::PathResolver::EnsureDirectory(dir);
        return dir;
    }

    std::filesystem::path absolutePath() const {
        return infrastructure::PathResolver::Resolve(m_binding, extension());
    }

    std::filesystem::path basePath() const {
        return infrastructure::PathResolver::BaseDirectory(m_binding);
    }

    std::filesystem::path projectDirPath() const {
        return infrastructure::PathResolver::ProjectDirectory(m_binding);
    }

    std::filesystem::path subDirParentPath() const {
        return infrastructure::PathResolver::SubDirParent(m_binding);
    }

    std::string fileName() const {
        return infrastructure::PathResolver::FileName(m_binding, extension());
    }

    // --- Headered formats ---

    /** @brief Version byte of the stored file. Only for HeaderedCodec formats. */
    std::uint8_t fileVersion() const {
        const domain::Bytes prefix = storedPrefix(Codec::kPrefixLength);
        try {
            return Codec::VersionOf(prefix.data(), prefix.size());
        } catch (const domain::DecodeError& e) {
            throw domain::PersistError(domain::PersistError::Kind::Decode, e.what(), absolutePath());
        }
    }

    /** @brief The stored 24-byte header, e.g. "[1, 2, 3, ...]". Only for HeaderedCodec formats. */
    std::string fileHeaderToString() const {
        const domain::Bytes prefix = storedPrefix(infrastructure::codecs::kHeaderLength);
        if (prefix.size() < infrastructure::codecs::kHeaderLength) {
            throw domain::PersistError(domain::PersistError::Kind::Decode,
                                       "File is shorter than its header: " + std::to_string(prefix.size()) + " bytes",
                                       absolutePath());
        }
        return infrastructure::codecs::HeaderToString(prefix.data(), infrastructure::codecs::kHeaderLength);
    }

private:
    T decodeBytes(const std::uint8_t* data, std::size_t size) const {
        try {
            return Codec::template decode<T>(data, size);
        } catch (const domain::DecodeError& e) {
            throw domain::PersistError(domain::PersistError::Kind::Decode, e.what(), absolutePath());
        }
    }

    T decodeStored(const std::uint8_t* data, std::size_t size, const std::filesystem::path& path) const {
        if (!m_binding.compressed) {
            return decodeBytes(data, size);
        }
        const domain::Bytes plain = inflate(data, size, path);
        return decodeBytes(plain.data(), plain.size());
    }

    T loadMappedFrom(const std::filesystem::path& path) const {
        infrastructure::MappedFile mapping(path);
        logLoad(path, mapping.size());
        return decodeStored(mapping.data(), mapping.size(), path);
    }

    static domain::Bytes inflate(const std::uint8_t* data, std::size_t size, const std::filesystem::path& path) {
        try {
            return infrastructure::GzipTransform::Decompress(data, size);
        } catch (const domain::DecodeError& e) {
            throw domain::PersistError(domain::PersistError::Kind::Decode, e.what(), path);
        }
    }

    /// Leading bytes of the stored (decompressed) content; fewer when the file is shorter.
    domain::Bytes storedPrefix(std::size_t length) const {
        domain::Bytes bytes = readToBytes();
        if (bytes.size() > length) {
            bytes.resize(length);
        }
        return bytes;
    }

    static void removeFile(const std::filesystem::path& path) {
        std::error_code ec;
        std::filesystem::remove(path, ec);
        if (ec) {
            throw domain::PersistError(domain::PersistError::Kind::Io,
                                       "Failed to remove " + path.string() + ": " + ec.message(), path);
        }
    }

    static domain::Metadata removeTree(const std::filesystem::path& dir) {
        std::error_code ec;
        if (!std::filesystem::exists(dir, ec)) {
            return domain::Metadata::zero(dir);
        }
        const std::uint64_t size = infrastructure::FileReader::DirectorySize(dir);
        std::filesystem::remove_all(dir, ec);
        if (ec) {
            throw domain::PersistError(domain::PersistError::Kind::Io,
                                       "Failed to remove " + dir.string() + ": " + ec.message(), dir);
        }
        return domain::Metadata(size, dir);
    }

    static void logLoad(const std::filesystem::path& path, std::size_t size) {
        if (infrastructure::Log::Enabled(infrastructure::LogLevel::Debug)) {
            infrastructure::Log::Debug("Persistent", "Loaded " + std::to_string(size) + " bytes from " + path.string());
        }
    }

    domain::Binding m_binding;
    std::shared_ptr<infrastructure::AtomicFileWriter> m_writer;
};

} // namespace stowage::application
