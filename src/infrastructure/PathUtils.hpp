// PathUtils Header
#pragma once
#include <string>
#include <filesystem>

#include "domain/DirectoryKind.hpp"

namespace stowage::infrastructure {

/**
 * @class PathUtils
 * @brief OS base directories following XDG on Linux and the Library layout on macOS.
 *
 * Every getter throws domain::PathResolutionError when the directory cannot
 * be determined.
 */
class PathUtils {
public:
    static std::filesystem::path GetHomeDir();
    static std::filesystem::path GetDataHome();
    static std::filesystem::path GetConfigHome();
    static std::filesystem::path GetCacheHome();
    static std::filesystem::path GetStateHome();
    static std::filesystem::path GetPreferenceHome();
    static std::filesystem::path GetDownloadDir();

    /** @brief Base directory for a kind. Custom kinds have no OS base and are rejected. */
    static std::filesystem::path GetBaseDir(domain::DirectoryKind kind);

    /** @brief The project folder name as laid out on this OS ("My Project" -> "myproject" on Linux). */
    static std::string ProjectSegment(const std::string& project);
};

} // namespace stowage::infrastructure
