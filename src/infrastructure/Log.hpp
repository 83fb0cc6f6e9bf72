/**
 * @file Log.hpp
 * @brief Tagged diagnostic output on std::cerr.
 */

#pragma once

#include <optional>
#include <string>

namespace stowage::infrastructure {

enum class LogLevel {
    Off = 0,
    Error = 1,
    Warn = 2,
    Info = 3,
    Debug = 4
};

std::optional<LogLevel> logLevelFromString(const std::string& name);

/**
 * @class Log
 * @brief Writes "[Component] message" lines to std::cerr.
 *
 * The level defaults to Warn and can be overridden with SetLevel() or the
 * STOWAGE_LOG environment variable (off, error, warn, info, debug), which is
 * read the first time the level is needed.
 */
class Log {
public:
    static void SetLevel(LogLevel level);
    static LogLevel Level();
    static bool Enabled(LogLevel level);

    static void Error(const std::string& component, const std::string& message);
    static void Warn(const std::string& component, const std::string& message);
    static void Info(const std::string& component, const std::string& message);
    static void Debug(const std::string& component, const std::string& message);

private:
    static void write(LogLevel level, const std::string& component, const std::string& message);
};

} // namespace stowage::infrastructure
