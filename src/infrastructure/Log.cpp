/**
 * @file Log.cpp
 * @brief Implementation of Log.
 */

#include "infrastructure/Log.hpp"

#include <atomic>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <mutex>

namespace stowage::infrastructure {

namespace {

constexpr int kUnset = -1;

std::atomic<int> g_level{kUnset};
std::mutex g_outputMutex;

LogLevel levelFromEnvironment() {
    const char* value = std::getenv("STOWAGE_LOG");
    if (value && *value) {
        if (auto level = logLevelFromString(value)) {
            return *level;
        }
        std::cerr << "[Log] Unknown STOWAGE_LOG value '" << value << "', using 'warn'." << std::endl;
    }
    return LogLevel::Warn;
}

const char* label(LogLevel level) {
    switch (level) {
        case LogLevel::Error: return "error";
        case LogLevel::Warn: return "warn";
        case LogLevel::Info: return "info";
        case LogLevel::Debug: return "debug";
        case LogLevel::Off: break;
    }
    return "";
}

} // namespace

std::optional<LogLevel> logLevelFromString(const std::string& name) {
    std::string lower;
    for (char c : name) {
        lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    if (lower == "off") return LogLevel::Off;
    if (lower == "error") return LogLevel::Error;
    if (lower == "warn" || lower == "warning") return LogLevel::Warn;
    if (lower == "info") return LogLevel::Info;
    if (lower == "debug") return LogLevel::Debug;
    return std::nullopt;
}

void Log::SetLevel(LogLevel level) {
    g_level.store(static_cast<int>(level));
}

LogLevel Log::Level() {
    int current = g_level.load();
    if (current == kUnset) {
        int resolved = static_cast<int>(levelFromEnvironment());
        g_level.compare_exchange_strong(current, resolved);
        current = g_level.load();
    }
    return static_cast<LogLevel>(current);
}

bool Log::Enabled(LogLevel level) {
    return level != LogLevel::Off && static_cast<int>(level) <= static_cast<int>(Level());
}

void Log::Error(const std::string& component, const std::string& message) {
    write(LogLevel::Error, component, message);
}

void Log::Warn(const std::string& component, const std::string& message) {
    write(LogLevel::Warn, component, message);
}

void Log::Info(const std::string& component, const std::string& message) {
    write(LogLevel::Info, component, message);
}

void Log::Debug(const std::string& component, const std::string& message) {
    write(LogLevel::Debug, component, message);
}

void Log::write(LogLevel level, const std::string& component, const std::string& message) {
    if (!Enabled(level)) return;
    std::lock_guard<std::mutex> lock(g_outputMutex);
    std::cerr << "[" << component << "] " << label(level) << ": " << message << std::endl;
}

} // namespace stowage::infrastructure
