#ifndef CONSOLE_HPP
#define CONSOLE_HPP

#include <ostream>
#include <string>

/**
 * @enum LogLevel
 * @brief Severity of a diagnostic line written to stderr.
 */
enum class LogLevel {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3
};

void setLogLevel(LogLevel level);
LogLevel logLevel();

void logDebug(const std::string& message);
void logInfo(const std::string& message);
void logWarn(const std::string& message);
void logError(const std::string& message);

/**
 * @brief Writes one complete line to the given stream under the console mutex.
 *
 * Result lines from concurrent units go through here so they never interleave
 * with each other or with diagnostics.
 */
void writeLine(std::ostream& os, const std::string& line);

#endif // CONSOLE_HPP
