/**
 * @file Errors.hpp
 * @brief Exception taxonomy for path resolution, codecs and file persistence.
 */

#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>

namespace stowage::domain {

/** @brief The OS base directory could not be determined or a Binding is invalid. */
class PathResolutionError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/** @brief A format library failed to encode a value. Carries the library's message. */
class EncodeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/** @brief A format library failed to decode a byte sequence. Carries the library's message. */
class DecodeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @class PersistError
 * @brief Failure of a save/load style operation on a bound file.
 */
class PersistError : public std::runtime_error {
public:
    enum class Kind {
        Io,       ///< Filesystem failure while reading or writing.
        NotFound, ///< The bound file does not exist.
        Encode,   ///< The codec rejected the value.
        Decode    ///< The codec (or decompression) rejected the file contents.
    };

    PersistError(Kind kind, const std::string& message, std::filesystem::path path = {})
        : std::runtime_error(message), m_kind(kind), m_path(std::move(path)) {}

    Kind kind() const noexcept { return m_kind; }
    const std::filesystem::path& path() const noexcept { return m_path; }

private:
    Kind m_kind;
    std::filesystem::path m_path;
};

inline const char* toString(PersistError::Kind kind) {
    switch (kind) {
        case PersistError::Kind::Io: return "Io";
        case PersistError::Kind::NotFound: return "NotFound";
        case PersistError::Kind::Encode: return "Encode";
        case PersistError::Kind::Decode: return "Decode";
    }
    return "Io";
}

} // namespace stowage::domain
