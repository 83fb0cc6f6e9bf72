/**
 * @file Metadata.hpp
 * @brief Size and location of a file or directory touched by an operation.
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <ostream>
#include <utility>

namespace stowage::domain {

/**
 * @class Metadata
 * @brief Bytes saved/removed and the path they belong to.
 */
class Metadata {
public:
    Metadata(std::uint64_t size, std::filesystem::path path) : m_size(size), m_path(std::move(path)) {}

    /** @brief A zero-byte record, used when nothing existed to remove. */
    static Metadata zero(std::filesystem::path path) { return Metadata(0, std::move(path)); }

    std::uint64_t size() const { return m_size; }
    const std::filesystem::path& path() const { return m_path; }

    bool operator==(const Metadata& other) const {
        return m_size == other.m_size && m_path == other.m_path;
    }
    bool operator!=(const Metadata& other) const { return !(*this == other); }

private:
    std::uint64_t m_size;
    std::filesystem::path m_path;
};

inline std::ostream& operator<<(std::ostream& os, const Metadata& metadata) {
    return os << metadata.size() << " bytes @ " << metadata.path().string();
}

} // namespace stowage::domain
