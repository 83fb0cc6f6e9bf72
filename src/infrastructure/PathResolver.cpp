/**
 * @file PathResolver.cpp
 * @brief Implementation of PathResolver.
 */

#include "infrastructure/PathResolver.hpp"
#include "infrastructure/PathUtils.hpp"
#include "domain/Errors.hpp"

#include <system_error>

namespace stowage::infrastructure {

namespace fs = std::filesystem;
using domain::Binding;
using domain::DirectoryKind;
using domain::PathResolutionError;

fs::path PathResolver::Resolve(DirectoryKind kind,
                               const std::string& project,
                               const std::string& subDirectories,
                               const std::string& stem,
                               const std::string& extension) {
    if (kind == DirectoryKind::Custom) {
        throw PathResolutionError("Custom directories need a Binding with a custom root");
    }
    Binding binding(kind, project, subDirectories, stem);
    return Resolve(binding, extension);
}

fs::path PathResolver::Resolve(const Binding& binding, const std::string& extension) {
    fs::path path = BaseDirectory(binding) / FileName(binding, extension);
    if (!path.is_absolute()) {
        throw PathResolutionError("Aborting: dangerous PATH detected: " + path.string());
    }
    return path;
}

fs::path PathResolver::ResolveForSave(const Binding& binding, const std::string& extension) {
    fs::path path = Resolve(binding, extension);
    EnsureDirectory(path.parent_path());
    return path;
}

fs::path PathResolver::ProjectDirectory(const Binding& binding) {
    binding.validate();

    fs::path base;
    if (binding.directory == DirectoryKind::Custom) {
        base = binding.customRoot;
    } else {
        base = PathUtils::GetBaseDir(binding.directory);
    }
    return base / PathUtils::ProjectSegment(binding.project);
}

fs::path PathResolver::BaseDirectory(const Binding& binding) {
    fs::path base = ProjectDirectory(binding);
    for (const auto& segment : binding.subDirectorySegments()) {
        base /= segment;
    }
    return base;
}

fs::path PathResolver::SubDirParent(const Binding& binding) {
    fs::path base = ProjectDirectory(binding);
    const auto segments = binding.subDirectorySegments();
    if (!segments.empty()) {
        base /= segments.front();
    }
    return base;
}

std::string PathResolver::FileName(const Binding& binding, const std::string& extension) {
    if (extension.empty()) {
        return binding.stem;
    }
    return binding.stem + "." + extension;
}

void PathResolver::EnsureDirectory(const fs::path& directory) {
    std::error_code ec;
    fs::create_directories(directory, ec);
    if (ec) {
        // A concurrent creator may have won the race.
        std::error_code statEc;
        if (fs::is_directory(directory, statEc)) return;
        throw domain::PersistError(domain::PersistError::Kind::Io,
                                   "Error creating directory " + directory.string() + ": " + ec.message(),
                                   directory);
    }
}

} // namespace stowage::infrastructure
