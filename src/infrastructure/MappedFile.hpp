/**
 * @file MappedFile.hpp
 * @brief Read-only memory mapping of a whole file (POSIX mmap).
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>

namespace stowage::infrastructure {

/**
 * @class MappedFile
 * @brief Maps a file read-only for the lifetime of the object.
 *
 * The mapping reflects the file as it is on disk; callers must not keep
 * data() past the object's lifetime. A zero-length file is valid and maps
 * nothing.
 */
class MappedFile {
public:
    /** @throws domain::PersistError (NotFound or Io). */
    explicit MappedFile(const std::filesystem::path& path);
    ~MappedFile();

    MappedFile(const MappedFile&) = delete;
    MappedFile& operator=(const MappedFile&) = delete;
    MappedFile(MappedFile&& other) noexcept;
    MappedFile& operator=(MappedFile&& other) noexcept;

    const std::uint8_t* data() const { return m_data; }
    std::size_t size() const { return m_size; }

private:
    void release();

    const std::uint8_t* m_data = nullptr;
    std::size_t m_size = 0;
};

} // namespace stowage::infrastructure
