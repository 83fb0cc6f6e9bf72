/**
 * @file Binding.cpp
 * @brief Naming rules for Binding.
 */

#include "domain/Binding.hpp"
#include "domain/Errors.hpp"

namespace stowage::domain {

namespace {

constexpr std::size_t kMaxNameLength = 255;
constexpr std::size_t kMaxCombinedLength = 4000;
constexpr std::size_t kMaxSubDirectoryDepth = 10;
constexpr const char* kInvalidSymbols = "<>:\"'|?*^$&()";

std::vector<std::string> splitOnSlash(const std::string& value) {
    std::vector<std::string> parts;
    std::string current;
    for (char c : value) {
        if (c == '/') {
            parts.push_back(current);
            current.clear();
        } else {
            current += c;
        }
    }
    parts.push_back(current);
    return parts;
}

bool startsOrEndsWith(const std::string& value, char c) {
    return !value.empty() && (value.front() == c || value.back() == c);
}

void checkEdges(const std::string& label, const std::string& value) {
    for (char c : {' ', '/', '\\'}) {
        if (startsOrEndsWith(value, c)) {
            throw PathResolutionError(label + " must not start or end with '" + std::string(1, c) + "': \"" + value + "\"");
        }
    }
}

void checkSymbols(const std::string& label, const std::string& value) {
    for (const char* s = kInvalidSymbols; *s; ++s) {
        if (value.find(*s) != std::string::npos) {
            throw PathResolutionError(label + " must not contain '" + std::string(1, *s) + "': \"" + value + "\"");
        }
    }
}

} // namespace

void Binding::validate() const {
    if (project.empty()) {
        throw PathResolutionError("Binding: project directory must not be empty.");
    }
    if (stem.empty()) {
        throw PathResolutionError("Binding: file name must not be empty.");
    }
    if (project.size() >= kMaxNameLength) {
        throw PathResolutionError("Binding: project directory must be less than 255 bytes long.");
    }
    if (stem.size() >= kMaxNameLength) {
        throw PathResolutionError("Binding: file name must be less than 255 bytes long.");
    }
    if (project.size() + subDirectories.size() + stem.size() >= kMaxCombinedLength) {
        throw PathResolutionError("Binding: directories combined must be less than 4000 bytes long.");
    }

    for (char c : {'/', '\\'}) {
        if (project.find(c) != std::string::npos) {
            throw PathResolutionError("Binding: project directory must not contain '" + std::string(1, c) + "'.");
        }
        if (stem.find(c) != std::string::npos) {
            throw PathResolutionError("Binding: file name must not contain '" + std::string(1, c) + "'.");
        }
    }

    for (const char* dots : {".", ".."}) {
        if (project == dots || stem == dots) {
            throw PathResolutionError("Binding: project directory and file name must not be '" + std::string(dots) + "'.");
        }
    }

    checkSymbols("Binding: project directory", project);
    checkSymbols("Binding: sub directories", subDirectories);
    checkSymbols("Binding: file name", stem);

    checkEdges("Binding: project directory", project);
    checkEdges("Binding: sub directories", subDirectories);
    checkEdges("Binding: file name", stem);

    if (!subDirectories.empty()) {
        const auto segments = splitOnSlash(subDirectories);
        if (segments.size() >= kMaxSubDirectoryDepth) {
            throw PathResolutionError("Binding: sub directories are limited to 10-depth.");
        }
        for (const auto& segment : segments) {
            if (segment.size() > kMaxNameLength) {
                throw PathResolutionError("Binding: one of the sub directories is longer than 255 bytes.");
            }
            if (segment == "..") {
                throw PathResolutionError("Binding: sub directories must not contain '..'.");
            }
            checkEdges("Binding: sub directory", segment);
        }
    }

    if (directory == DirectoryKind::Custom) {
        if (customRoot.empty()) {
            throw PathResolutionError("Binding: custom directory requires a root path.");
        }
        if (!customRoot.is_absolute()) {
            throw PathResolutionError("Binding: custom root must be absolute: " + customRoot.string());
        }
    }
}

bool Binding::isValid() const {
    try {
        validate();
        return true;
    } catch (const PathResolutionError&) {
        return false;
    }
}

std::vector<std::string> Binding::subDirectorySegments() const {
    std::vector<std::string> segments;
    for (auto& segment : splitOnSlash(subDirectories)) {
        if (segment.empty() || segment == ".") continue;
        segments.push_back(std::move(segment));
    }
    return segments;
}

} // namespace stowage::domain
