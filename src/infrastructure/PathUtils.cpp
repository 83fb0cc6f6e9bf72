#include "infrastructure/PathUtils.hpp"
#include "domain/Errors.hpp"

#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <optional>

#include <pwd.h>
#include <sys/types.h>
#include <unistd.h>

namespace stowage::infrastructure {

namespace fs = std::filesystem;
using domain::DirectoryKind;
using domain::PathResolutionError;

fs::path PathUtils::GetHomeDir() {
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return fs::path(home);
    }
    struct passwd* pwd = getpwuid(getuid());
    if (pwd && pwd->pw_dir && *pwd->pw_dir) {
        return fs::path(pwd->pw_dir);
    }
    throw PathResolutionError("User directories could not be found");
}

#if defined(__APPLE__)

fs::path PathUtils::GetDataHome() {
    return GetHomeDir() / "Library" / "Application Support";
}

fs::path PathUtils::GetConfigHome() {
    return GetHomeDir() / "Library" / "Application Support";
}

fs::path PathUtils::GetCacheHome() {
    return GetHomeDir() / "Library" / "Caches";
}

fs::path PathUtils::GetStateHome() {
    throw PathResolutionError("The State directory has no convention on macOS");
}

fs::path PathUtils::GetPreferenceHome() {
    return GetHomeDir() / "Library" / "Preferences";
}

fs::path PathUtils::GetDownloadDir() {
    return GetHomeDir() / "Downloads";
}

#else // Linux (and other Unix-like)

namespace {

// XDG variables only count when set to an absolute path.
std::optional<fs::path> xdgDir(const char* variable) {
    const char* value = std::getenv(variable);
    if (value && *value) {
        fs::path candidate(value);
        if (candidate.is_absolute()) {
            return candidate;
        }
    }
    return std::nullopt;
}

} // namespace

fs::path PathUtils::GetDataHome() {
    if (auto path = xdgDir("XDG_DATA_HOME")) return *path;
    return GetHomeDir() / ".local" / "share";
}

fs::path PathUtils::GetConfigHome() {
    if (auto path = xdgDir("XDG_CONFIG_HOME")) return *path;
    return GetHomeDir() / ".config";
}

fs::path PathUtils::GetCacheHome() {
    if (auto path = xdgDir("XDG_CACHE_HOME")) return *path;
    return GetHomeDir() / ".cache";
}

fs::path PathUtils::GetStateHome() {
    if (auto path = xdgDir("XDG_STATE_HOME")) return *path;
    return GetHomeDir() / ".local" / "state";
}

fs::path PathUtils::GetPreferenceHome() {
    return GetConfigHome();
}

fs::path PathUtils::GetDownloadDir() {
    if (auto path = xdgDir("XDG_DOWNLOAD_DIR")) return *path;
    return GetHomeDir() / "Downloads";
}

#endif

fs::path PathUtils::GetBaseDir(DirectoryKind kind) {
    switch (kind) {
        case DirectoryKind::Project:
        case DirectoryKind::Cache:
            return GetCacheHome();
        case DirectoryKind::Config:
            return GetConfigHome();
        case DirectoryKind::Data:
        case DirectoryKind::DataLocal:
            return GetDataHome();
        case DirectoryKind::Preference:
            return GetPreferenceHome();
        case DirectoryKind::State:
            return GetStateHome();
        case DirectoryKind::Download:
            return GetDownloadDir();
        case DirectoryKind::Custom:
            break;
    }
    throw PathResolutionError("Custom directories have no OS base directory");
}

std::string PathUtils::ProjectSegment(const std::string& project) {
    std::string segment;
    segment.reserve(project.size());
    for (char c : project) {
        unsigned char uc = static_cast<unsigned char>(c);
#if defined(__APPLE__)
        segment += std::isspace(uc) ? '-' : c;
#else
        if (std::isspace(uc)) continue;
        segment += static_cast<char>(std::tolower(uc));
#endif
    }
    if (segment.empty()) {
        throw PathResolutionError("Project name \"" + project + "\" yields an empty directory name");
    }
    return segment;
}

} // namespace stowage::infrastructure
