/**
 * @file FileReader.hpp
 * @brief Whole-file and ranged reads reporting failures as PersistError.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

#include "domain/Bytes.hpp"

namespace stowage::infrastructure {

class FileReader {
public:
    /** @brief Reads the whole file. NotFound when it does not exist, Io otherwise. */
    static domain::Bytes ReadAll(const std::filesystem::path& path);

    /**
     * @brief Reads bytes [start, end) of the file; start == end reads one byte.
     * @throws domain::PersistError (Io) when start > end or the range runs past the end of file.
     */
    static domain::Bytes ReadRange(const std::filesystem::path& path, std::size_t start, std::size_t end);

    /** @brief Size of a regular file. NotFound when it does not exist. */
    static std::uint64_t FileSize(const std::filesystem::path& path);

    /** @brief Total size of the regular files below a directory. NotFound when it does not exist. */
    static std::uint64_t DirectorySize(const std::filesystem::path& directory);
};

} // namespace stowage::infrastructure
