/**
 * @file DirectoryKind.hpp
 * @brief OS-convention directory categories a file can be bound to.
 */

#pragma once

#include <optional>
#include <string>

namespace stowage::domain {

/**
 * @enum DirectoryKind
 * @brief Which OS base directory a bound file lives under.
 *
 * | Kind       | Linux                                      | macOS                           |
 * |------------|--------------------------------------------|---------------------------------|
 * | Project    | `$XDG_CACHE_HOME` or `~/.cache`            | `~/Library/Caches`              |
 * | Cache      | `$XDG_CACHE_HOME` or `~/.cache`            | `~/Library/Caches`              |
 * | Config     | `$XDG_CONFIG_HOME` or `~/.config`          | `~/Library/Application Support` |
 * | Data       | `$XDG_DATA_HOME` or `~/.local/share`       | `~/Library/Application Support` |
 * | DataLocal  | `$XDG_DATA_HOME` or `~/.local/share`       | `~/Library/Application Support` |
 * | Preference | `$XDG_CONFIG_HOME` or `~/.config`          | `~/Library/Preferences`         |
 * | State      | `$XDG_STATE_HOME` or `~/.local/state`      | (unsupported)                   |
 * | Download   | `$XDG_DOWNLOAD_DIR` or `~/Downloads`       | `~/Downloads`                   |
 * | Custom     | `Binding::customRoot`                      | `Binding::customRoot`           |
 */
enum class DirectoryKind {
    Project,
    Cache,
    Config,
    Data,
    DataLocal,
    Preference,
    State,
    Download,
    Custom
};

inline std::string toString(DirectoryKind kind) {
    switch (kind) {
        case DirectoryKind::Project: return "Project";
        case DirectoryKind::Cache: return "Cache";
        case DirectoryKind::Config: return "Config";
        case DirectoryKind::Data: return "Data";
        case DirectoryKind::DataLocal: return "DataLocal";
        case DirectoryKind::Preference: return "Preference";
        case DirectoryKind::State: return "State";
        case DirectoryKind::Download: return "Download";
        case DirectoryKind::Custom: return "Custom";
    }
    return "Data";
}

inline std::optional<DirectoryKind> directoryKindFromString(const std::string& name) {
    if (name == "Project") return DirectoryKind::Project;
    if (name == "Cache") return DirectoryKind::Cache;
    if (name == "Config") return DirectoryKind::Config;
    if (name == "Data") return DirectoryKind::Data;
    if (name == "DataLocal") return DirectoryKind::DataLocal;
    if (name == "Preference") return DirectoryKind::Preference;
    if (name == "State") return DirectoryKind::State;
    if (name == "Download") return DirectoryKind::Download;
    if (name == "Custom") return DirectoryKind::Custom;
    return std::nullopt;
}

} // namespace stowage::domain
