#include "bootscan/utils/logging.hpp"
#include <algorithm>
#include <atomic>
#include <cctype>
#include <iostream>
#include <mutex>
#include <stdexcept>

namespace bootscan {
namespace utils {

namespace {

std::atomic<int> g_level{static_cast<int>(LogLevel::Info)};
std::mutex g_sinkMutex;

} // namespace

void setLogLevel(LogLevel level) {
    g_level.store(static_cast<int>(level), std::memory_order_relaxed);
}

LogLevel getLogLevel() {
    return static_cast<LogLevel>(g_level.load(std::memory_order_relaxed));
}

bool isLogEnabled(LogLevel level) {
    return level != LogLevel::Off &&
           static_cast<int>(level) >= g_level.load(std::memory_order_relaxed);
}

void logMessage(LogLevel level, const std::string& message) {
    std::lock_guard<std::mutex> lock(g_sinkMutex);
    std::clog << "[bootscan] [" << toString(level) << "] " << message << std::endl;
}

const char* toString(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO";
        case LogLevel::Warn: return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Critical: return "CRITICAL";
        case LogLevel::Off: return "OFF";
    }
    return "UNKNOWN";
}

LogLevel parseLogLevel(const std::string& name) {
    std::string lowered(name);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "debug") return LogLevel::Debug;
    if (lowered == "info") return LogLevel::Info;
    if (lowered == "warn" || lowered == "warning") return LogLevel::Warn;
    if (lowered == "error") return LogLevel::Error;
    if (lowered == "critical") return LogLevel::Critical;
    if (lowered == "off") return LogLevel::Off;
    throw std::invalid_argument("Unknown log level: " + name);
}

} // namespace utils
} // namespace bootscan
