/**
 * @file ConfigLoader.hpp
 * @brief Static utility for reading/writing named Bindings in a JSON settings file.
 *
 * Layout of the settings document:
 * @code
 * {
 *     "bindings": {
 *         "state": { "directory": "Config", "project": "MyProject", "subDirectories": "", "stem": "state" }
 *     }
 * }
 * @endcode
 * Keys outside "bindings" belong to the caller and are preserved on save.
 */

#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "domain/Binding.hpp"

namespace stowage::infrastructure {

class ConfigLoader {
public:
    /** @brief JSON object with the keys directory, project, subDirectories, stem, customRoot, compressed, mmapThreshold. */
    static nlohmann::json BindingToJson(const domain::Binding& binding);

    /**
     * @brief Builds and validates a Binding from its JSON form.
     * Missing optional keys keep their defaults.
     * @throws domain::DecodeError when a key has the wrong JSON type.
     * @throws domain::PathResolutionError when a value breaks a naming rule.
     */
    static domain::Binding BindingFromJson(const nlohmann::json& json);

    /**
     * @brief Reads the binding stored under `name`.
     * @return std::nullopt if the file or the entry does not exist.
     * @throws domain::PersistError (Decode) when the file is not valid JSON.
     */
    static std::optional<domain::Binding> LoadBinding(const std::filesystem::path& settingsFile, const std::string& name);

    /**
     * @brief Stores `binding` under `name`, preserving every other key, and
     * writes the file atomically. Parent directories are created.
     */
    static void SaveBinding(const std::filesystem::path& settingsFile, const std::string& name, const domain::Binding& binding);
};

} // namespace stowage::infrastructure
