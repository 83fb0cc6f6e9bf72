/**
 * @file PathResolver.hpp
 * @brief Maps a Binding plus a format extension to absolute file paths.
 */

#pragma once

#include <filesystem>
#include <string>

#include "domain/Binding.hpp"

namespace stowage::infrastructure {

/**
 * @class PathResolver
 * @brief Builds `<base(kind)>/<project>/<sub dirs>/<stem>.<ext>`.
 *
 * All functions are pure except ResolveForSave(), which also creates the
 * directories leading up to the file. Failures are reported as
 * domain::PathResolutionError.
 */
class PathResolver {
public:
    /**
     * @brief Resolves a file path from loose arguments.
     * @param kind OS directory category. Custom is not accepted here; use a Binding.
     * @param project Project folder name, sanitized per OS.
     * @param subDirectories "/"-delimited sub-directories, "" for none.
     * @param stem File name without extension.
     * @param extension Format extension without the dot, "" for none.
     */
    static std::filesystem::path Resolve(domain::DirectoryKind kind,
                                         const std::string& project,
                                         const std::string& subDirectories,
                                         const std::string& stem,
                                         const std::string& extension);

    /** @brief Absolute path of the bound file. */
    static std::filesystem::path Resolve(const domain::Binding& binding, const std::string& extension);

    /** @brief Same as Resolve() but ensures the parent directories exist. */
    static std::filesystem::path ResolveForSave(const domain::Binding& binding, const std::string& extension);

    /** @brief `<base(kind)>/<project>`. */
    static std::filesystem::path ProjectDirectory(const domain::Binding& binding);

    /** @brief The directory holding the file: project directory plus every sub-directory. */
    static std::filesystem::path BaseDirectory(const domain::Binding& binding);

    /** @brief Project directory plus only the first sub-directory (if any). */
    static std::filesystem::path SubDirParent(const domain::Binding& binding);

    /** @brief "stem.ext", or just "stem" for an empty extension. */
    static std::string FileName(const domain::Binding& binding, const std::string& extension);

    /** @brief Creates `directory` and its parents, tolerating ones that already exist. */
    static void EnsureDirectory(const std::filesystem::path& directory);
};

} // namespace stowage::infrastructure
