#include <cassert>
#include <iostream>
#include <sstream>

#include "infrastructure/Log.hpp"

using namespace stowage::infrastructure;

int main() {
    std::cout << "[Test] Starting Log Test..." << std::endl;

    assert(logLevelFromString("off") == LogLevel::Off);
    assert(logLevelFromString("DEBUG") == LogLevel::Debug);
    assert(logLevelFromString("Warning") == LogLevel::Warn);
    assert(!logLevelFromString("verbose"));

    // Capture std::cerr.
    std::ostringstream captured;
    std::streambuf* previous = std::cerr.rdbuf(captured.rdbuf());

    Log::SetLevel(LogLevel::Warn);
    assert(Log::Enabled(LogLevel::Error));
    assert(!Log::Enabled(LogLevel::Info));
    Log::Info("Quiet", "not shown");
    Log::Warn("Loud", "disk almost full");

    Log::SetLevel(LogLevel::Off);
    assert(!Log::Enabled(LogLevel::Error));
    Log::Error("Silenced", "not shown either");

    std::cerr.rdbuf(previous);

    const std::string output = captured.str();
    assert(output.find("[Loud]") != std::string::npos);
    assert(output.find("disk almost full") != std::string::npos);
    assert(output.find("not shown") == std::string::npos);

    std::cout << "[PASS] Log Test Passed!" << std::endl;
    return 0;
}
