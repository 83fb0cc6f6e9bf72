/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/AtomicFileWriter.hpp"
#include "infrastructure/FileReader.hpp"
#include "infrastructure/Log.hpp"
#include "infrastructure/PathResolver.hpp"
#include "domain/Errors.hpp"

#include <cstddef>
#include <string>
#include <system_error>

namespace stowage::infrastructure {

namespace fs = std::filesystem;
using nlohmann::json;
using domain::Binding;
using domain::DecodeError;
using domain::DirectoryKind;
using domain::PathResolutionError;
using domain::PersistError;

namespace {

constexpr const char* kBindingsKey = "bindings";

json readSettings(const fs::path& settingsFile) {
    const domain::Bytes bytes = FileReader::ReadAll(settingsFile);
    try {
        return json::parse(bytes.begin(), bytes.end());
    } catch (const json::parse_error& e) {
        throw PersistError(PersistError::Kind::Decode,
                           "Error reading " + settingsFile.string() + ": " + e.what(), settingsFile);
    }
}

template <typename Value>
void readKey(const json& object, const char* key, Value& out) {
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return;
    }
    try {
        out = it->get<Value>();
    } catch (const json::type_error& e) {
        throw DecodeError(std::string("Binding key '") + key + "': " + e.what());
    }
}

// Sizes must be non-negative integers; get<size_t>() would wrap -1 silently.
void readSize(const json& object, const char* key, std::size_t& out) {
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return;
    }
    if (!it->is_number_unsigned() && !(it->is_number_integer() && it->get<json::number_integer_t>() >= 0)) {
        throw DecodeError(std::string("Binding key '") + key + "' must be a non-negative integer, got " + it->dump());
    }
    out = it->get<std::size_t>();
}

} // namespace

json ConfigLoader::BindingToJson(const Binding& binding) {
    json j;
    j["directory"] = domain::toString(binding.directory);
    j["project"] = binding.project;
    j["subDirectories"] = binding.subDirectories;
    j["stem"] = binding.stem;
    if (binding.directory == DirectoryKind::Custom) {
        j["customRoot"] = binding.customRoot.string();
    }
    j["compressed"] = binding.compressed;
    j["mmapThreshold"] = binding.mmapThreshold;
    return j;
}

Binding ConfigLoader::BindingFromJson(const json& j) {
    if (!j.is_object()) {
        throw DecodeError(std::string("Binding must be a JSON object, got ") + j.type_name());
    }

    Binding binding;
    std::string directory = domain::toString(binding.directory);
    std::string customRoot;
    readKey(j, "directory", directory);
    readKey(j, "project", binding.project);
    readKey(j, "subDirectories", binding.subDirectories);
    readKey(j, "stem", binding.stem);
    readKey(j, "customRoot", customRoot);
    readKey(j, "compressed", binding.compressed);
    readSize(j, "mmapThreshold", binding.mmapThreshold);

    auto kind = domain::directoryKindFromString(directory);
    if (!kind) {
        throw PathResolutionError("Unknown directory kind: " + directory);
    }
    binding.directory = *kind;
    binding.customRoot = customRoot;

    binding.validate();
    return binding;
}

std::optional<Binding> ConfigLoader::LoadBinding(const fs::path& settingsFile, const std::string& name) {
    std::error_code ec;
    if (!fs::exists(settingsFile, ec)) {
        Log::Debug("ConfigLoader", "No settings file at " + settingsFile.string());
        return std::nullopt;
    }

    const json settings = readSettings(settingsFile);
    auto bindings = settings.find(kBindingsKey);
    if (bindings == settings.end() || !bindings->is_object()) {
        return std::nullopt;
    }
    auto entry = bindings->find(name);
    if (entry == bindings->end()) {
        return std::nullopt;
    }
    return BindingFromJson(*entry);
}

void ConfigLoader::SaveBinding(const fs::path& settingsFile, const std::string& name, const Binding& binding) {
    binding.validate();

    json settings = json::object();
    std::error_code ec;
    if (fs::exists(settingsFile, ec)) {
        settings = readSettings(settingsFile);
        if (!settings.is_object()) {
            throw PersistError(PersistError::Kind::Decode,
                               "Settings file is not a JSON object: " + settingsFile.string(), settingsFile);
        }
    }

    settings[kBindingsKey][name] = BindingToJson(binding);

    if (settingsFile.has_parent_path()) {
        PathResolver::EnsureDirectory(settingsFile.parent_path());
    }
    AtomicFileWriter writer;
    writer.writeText(settingsFile, settings.dump(4));
    Log::Info("ConfigLoader", "Saved binding '" + name + "' to " + settingsFile.string());
}

} // namespace stowage::infrastructure
