/**
 * @file AtomicFileWriter.hpp
 * @brief Synchronous atomic file writes (temp file, then rename).
 */

#pragma once
#include <cstdint>
#include <filesystem>
#include <string>

#include "domain/Bytes.hpp"

namespace stowage::infrastructure {

/**
 * @class AtomicFileWriter
 * @brief Writes a byte sequence next to the target as `<target>.<pid>.<n>.tmp`
 * and renames it over the target.
 *
 * A reader never observes a half-written target: on failure the previous
 * target is left untouched and the temporary file is removed.
 * Every write gets its own temporary file, so concurrent writers to the same
 * target never share one. They are not otherwise coordinated; the last
 * rename wins.
 */
class AtomicFileWriter {
public:
    virtual ~AtomicFileWriter() = default;

    /**
     * @brief Atomically replaces `target` with `bytes`.
     * @param target Absolute path of the final file. Its directory must exist.
     * @return Number of bytes written.
     * @throws domain::PersistError (Kind::Io) if any step fails.
     */
    std::uint64_t write(const std::filesystem::path& target, const domain::Bytes& bytes);

    /** @brief Same as write() for text content. */
    std::uint64_t writeText(const std::filesystem::path& target, const std::string& content);

    /** @brief A fresh temporary sibling of `target`: "<target>.<pid>.<n>.tmp". */
    static std::filesystem::path UniqueTempPathFor(const std::filesystem::path& target);

    /** @brief True if `candidate` is named like a temporary sibling of `target`. */
    static bool IsTempPathFor(const std::filesystem::path& target, const std::filesystem::path& candidate);

protected:
    /** @brief Creates the temporary file exclusively, writes it and syncs it to disk. */
    virtual void writeTemp(const std::filesystem::path& tempPath, const std::uint8_t* data, std::size_t size);

    /** @brief Moves the finished temporary file over the target. */
    virtual void commit(const std::filesystem::path& tempPath, const std::filesystem::path& target);

private:
    std::uint64_t writeRaw(const std::filesystem::path& target, const std::uint8_t* data, std::size_t size);
    void discardTemp(const std::filesystem::path& tempPath);
};

} // namespace stowage::infrastructure
