#include "console.hpp"
#include <atomic>
#include <iostream>
#include <mutex>

static std::mutex consoleMutex;
static std::atomic<int> currentLevel(static_cast<int>(LogLevel::Info));

static void logAt(LogLevel level, const char* prefix, const std::string& message) {
    if (static_cast<int>(level) < currentLevel.load()) return;
    std::lock_guard<std::mutex> lock(consoleMutex);
    std::cerr << prefix << " " << message << "\n";
}

void setLogLevel(LogLevel level) {
    currentLevel.store(static_cast<int>(level));
}

LogLevel logLevel() {
    return static_cast<LogLevel>(currentLevel.load());
}

void logDebug(const std::string& message) { logAt(LogLevel::Debug, "[debug]", message); }
void logInfo(const std::string& message) { logAt(LogLevel::Info, "[info]", message); }
void logWarn(const std::string& message) { logAt(LogLevel::Warn, "[warn]", message); }
void logError(const std::string& message) { logAt(LogLevel::Error, "[error]", message); }

void writeLine(std::ostream& os, const std::string& line) {
    std::lock_guard<std::mutex> lock(consoleMutex);
    os << line << std::endl;
}
