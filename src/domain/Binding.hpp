/**
 * @file Binding.hpp
 * @brief Value Object describing where a data type is stored on disk.
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

#include "domain/DirectoryKind.hpp"

namespace stowage::domain {

/**
 * @class Binding
 * @brief Directory kind, project, sub-directories and file stem of one bound file.
 *
 * The format (and with it the extension) is supplied by the codec of the
 * handle the Binding is given to.
 *
 * Invariant: project and stem are non-empty and free of path separators and
 * shell-hostile symbols. See validate().
 */
class Binding {
public:
    DirectoryKind directory = DirectoryKind::Data;
    std::string project;             ///< Top-level project folder, e.g. "MyProject".
    std::string subDirectories;      ///< "/"-delimited, "" for none, e.g. "some/dirs".
    std::string stem;                ///< File name without extension, e.g. "state".
    std::filesystem::path customRoot; ///< Base directory when directory == DirectoryKind::Custom.
    bool compressed = false;         ///< Gzip the encoded bytes on disk.
    std::uint64_t mmapThreshold = 0; ///< Memory-map reads of files at least this large (0 = never).

    Binding() = default;

    Binding(DirectoryKind dir, std::string proj, std::string sub, std::string fileStem)
        : directory(dir), project(std::move(proj)), subDirectories(std::move(sub)), stem(std::move(fileStem)) {
        validate();
    }

    /** @brief A Binding rooted at an arbitrary absolute directory. */
    static Binding custom(std::filesystem::path root, std::string proj, std::string sub, std::string fileStem) {
        Binding b;
        b.directory = DirectoryKind::Custom;
        b.customRoot = std::move(root);
        b.project = std::move(proj);
        b.subDirectories = std::move(sub);
        b.stem = std::move(fileStem);
        b.validate();
        return b;
    }

    /**
     * @brief Checks every naming rule.
     * @throws PathResolutionError describing the first violated rule.
     */
    void validate() const;

    bool isValid() const;

    /**
     * @brief The sub-directory segments in order.
     *
     * Empty and "." segments are dropped, so "", "." and "a/./b/" give
     * {}, {} and {"a", "b"}.
     */
    std::vector<std::string> subDirectorySegments() const;

    bool operator==(const Binding& other) const {
        return directory == other.directory &&
               project == other.project &&
               subDirectories == other.subDirectories &&
               stem == other.stem &&
               customRoot == other.customRoot &&
               compressed == other.compressed &&
               mmapThreshold == other.mmapThreshold;
    }
    bool operator!=(const Binding& other) const { return !(*this == other); }
};

} // namespace stowage::domain
